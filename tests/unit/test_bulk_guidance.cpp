#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "corpus/corpus_loader.hpp"
#include "engine/guidance_store.hpp"
#include "pipeline/bulk_guidance.hpp"
#include "test_support.hpp"

using namespace tg;
using namespace tg::test_support;

class BulkGuidanceTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeEmbedder> embedder;
    std::unique_ptr<GuidanceStore> store;
    EngineConfig config;

    void SetUp() override {
        embedder = std::make_shared<FakeEmbedder>();
        add_corpus_rules(*embedder);

        config.bulk_concurrency = 4;
        store = std::make_unique<GuidanceStore>(config, embedder);
        store->set_corpus(CorpusLoader().load_string(kTestCorpus));
        store->build_index(true);
        embedder->reset_counts();
    }

    // Distinct terms that each need an embedding and match at 0.90
    static std::vector<std::string> fresh_terms(size_t n) {
        std::vector<std::string> terms;
        for (size_t i = 0; i < n; ++i) {
            terms.push_back("金丹境" + std::to_string(i));
        }
        return terms;
    }
};

// ==========================================
// Budget Tests
// ==========================================

TEST_F(BulkGuidanceTest, ApiCallCapIsRespected) {
    const size_t cap = 3;
    auto report = store->query_bulk(fresh_terms(cap + 5), "", cap, 0.65);

    EXPECT_EQ(report.total_terms, cap + 5);
    EXPECT_LE(report.api_calls_made, cap);
    EXPECT_EQ(report.not_found, 5u);
    EXPECT_EQ(report.rate_limited, 5u);
    EXPECT_EQ(report.vector_hits, cap);
    EXPECT_EQ(report.results.size(), cap + 5);
    EXPECT_LE(embedder->embed_calls(), cap);
}

TEST_F(BulkGuidanceTest, DirectHitsDoNotSpendBudget) {
    auto report = store->query_bulk({"金丹期", "筑基", "剑气"}, "", 0, 0.65);

    EXPECT_EQ(report.direct_hits, 3u);
    EXPECT_EQ(report.not_found, 0u);
    EXPECT_EQ(report.api_calls_made, 0u);
    EXPECT_EQ(embedder->embed_calls(), 0u);
}

TEST_F(BulkGuidanceTest, RateLimitedReportIsComplete) {
    auto report = store->query_bulk({"金丹期", "金丹境", "金丹大道"}, "", 0, 0.65);

    ASSERT_EQ(report.results.size(), 3u);
    EXPECT_EQ(report.results[0].lookup_path, LookupPath::Direct);
    EXPECT_TRUE(report.results[1].rate_limited);
    EXPECT_TRUE(report.results[2].rate_limited);
    EXPECT_EQ(report.not_found, 2u);
}

// ==========================================
// Session Cache Tests
// ==========================================

TEST_F(BulkGuidanceTest, RepeatedTermEmbedsOnce) {
    auto report = store->query_bulk({"金丹境", "金丹境"}, "", 10, 0.65);

    EXPECT_EQ(embedder->embed_calls(), 1u);
    EXPECT_EQ(report.api_calls_made, 1u);
    EXPECT_EQ(report.cache_hits, 1u);
    ASSERT_EQ(report.results.size(), 2u);
    EXPECT_DOUBLE_EQ(report.results[0].final_score, report.results[1].final_score);
    ASSERT_TRUE(report.results[1].matched_pattern.has_value());
    EXPECT_EQ(report.results[0].matched_pattern->id, report.results[1].matched_pattern->id);
}

TEST_F(BulkGuidanceTest, NormalizedDuplicatesShareOneLookup) {
    auto report = store->query_bulk({"He crossed the street", "  he CROSSED the street "}, "", 10, 0.65);

    EXPECT_EQ(embedder->embed_calls(), 1u);
    EXPECT_EQ(report.cache_hits, 1u);
    EXPECT_EQ(report.results[1].query_term, "  he CROSSED the street ");
}

TEST_F(BulkGuidanceTest, SessionCacheCarriesAcrossBatches) {
    auto session = store->create_session();

    auto first = session->bulk_guidance({"金丹境"}, "", 5, 0.65);
    EXPECT_EQ(first.api_calls_made, 1u);

    auto second = session->bulk_guidance({"金丹境"}, "", 5, 0.65);
    EXPECT_EQ(second.api_calls_made, 0u);
    EXPECT_EQ(second.cache_hits, 1u);
    EXPECT_EQ(second.vector_hits, 1u);
    EXPECT_EQ(embedder->embed_calls(), 1u);
}

TEST_F(BulkGuidanceTest, CacheHitsDoNotCountAgainstCap) {
    auto session = store->create_session();
    session->bulk_guidance({"金丹境"}, "", 5, 0.65);

    auto report = session->bulk_guidance({"金丹境", "金丹大道"}, "", 1, 0.65);
    EXPECT_EQ(report.not_found, 0u);
    EXPECT_EQ(report.api_calls_made, 1u);
}

TEST_F(BulkGuidanceTest, RateLimitedTermsAreRetriedLater) {
    auto session = store->create_session();

    auto starved = session->bulk_guidance({"金丹境"}, "", 0, 0.65);
    EXPECT_EQ(starved.not_found, 1u);

    auto retried = session->bulk_guidance({"金丹境"}, "", 1, 0.65);
    EXPECT_EQ(retried.not_found, 0u);
    EXPECT_EQ(retried.vector_hits, 1u);
    EXPECT_EQ(retried.cache_hits, 0u);
}

TEST_F(BulkGuidanceTest, GenreIsPartOfCacheKey) {
    auto session = store->create_session();
    session->bulk_guidance({"金丹境"}, "", 5, 0.65);
    auto report = session->bulk_guidance({"金丹境"}, "xianxia", 5, 0.65);

    EXPECT_EQ(report.cache_hits, 0u);
    EXPECT_EQ(report.api_calls_made, 1u);
}

TEST_F(BulkGuidanceTest, ContextIsPartOfCacheKey) {
    auto session = store->create_session();

    auto far = session->bulk_guidance({"他"}, "", 10, 0.65, "crossed the street");
    ASSERT_EQ(far.results.size(), 1u);
    EXPECT_EQ(far.results[0].confidence_tier, ConfidenceTier::Inject);

    auto near = session->bulk_guidance({"他"}, "", 10, 0.65, "entered the room");
    ASSERT_EQ(near.results.size(), 1u);
    EXPECT_EQ(near.cache_hits, 0u);
    EXPECT_EQ(near.api_calls_made, 1u);
    EXPECT_GT(near.results[0].negative_penalty, 0.0);
    EXPECT_NE(near.results[0].confidence_tier, ConfidenceTier::Inject);

    auto fresh = store->create_session()->bulk_guidance({"他"}, "", 10, 0.65, "entered the room");
    EXPECT_DOUBLE_EQ(near.results[0].final_score, fresh.results[0].final_score);
    EXPECT_EQ(near.results[0].confidence_tier, fresh.results[0].confidence_tier);

    // Same context again is served from the session
    auto repeat = session->bulk_guidance({"他"}, "", 10, 0.65, "  Entered the ROOM ");
    EXPECT_EQ(repeat.cache_hits, 1u);
    EXPECT_EQ(repeat.api_calls_made, 0u);
}

TEST_F(BulkGuidanceTest, SessionCacheIsBounded) {
    BulkGuidanceOrchestrator session(store->engine(), 2, 3);
    session.bulk_guidance(fresh_terms(10), "", 20, 0.65);
    EXPECT_LE(session.cache_size(), 3u);
}

// ==========================================
// Concurrency Tests
// ==========================================

TEST_F(BulkGuidanceTest, ConcurrentWorkersRecordBorderlineMatches) {
    std::vector<std::string> terms;
    for (size_t i = 0; i < 200; ++i) {
        terms.push_back("金丹大道" + std::to_string(i));
    }
    size_t logged_before = store->uncertain_log()->size();

    BulkGuidanceOrchestrator session(store->engine(), 8, 1000);
    auto report = session.bulk_guidance(terms, "", terms.size(), 0.80);

    EXPECT_EQ(report.vector_hits, terms.size());
    EXPECT_EQ(report.api_calls_made, terms.size());
    EXPECT_EQ(report.medium_confidence.size(), terms.size());
    EXPECT_TRUE(report.high_confidence.empty());
    for (const auto& result : report.results) {
        EXPECT_EQ(result.confidence_tier, ConfidenceTier::Log);
    }

    auto entries = store->uncertain_log()->entries();
    EXPECT_EQ(entries.size(), logged_before + terms.size());
    for (const auto& entry : entries) {
        ASSERT_EQ(entry.timestamp.size(), 20u);
        EXPECT_EQ(entry.timestamp.back(), 'Z');
    }
}

// ==========================================
// Report Tests
// ==========================================

TEST_F(BulkGuidanceTest, ResultsKeepInputOrder) {
    std::vector<std::string> terms = {
        "天气", "金丹期", "金丹境", "哼", "筑基元婴", "金丹大道", "剑气", "金丹境"
    };
    auto report = store->query_bulk(terms, "", 20, 0.65);

    ASSERT_EQ(report.results.size(), terms.size());
    for (size_t i = 0; i < terms.size(); ++i) {
        EXPECT_EQ(report.results[i].query_term, terms[i]);
    }
    EXPECT_EQ(report.results[1].lookup_path, LookupPath::Direct);
    EXPECT_EQ(report.results[4].lookup_path, LookupPath::Aggregated);
}

TEST_F(BulkGuidanceTest, CountersAddUp) {
    auto report = store->query_bulk(
        {"金丹期", "金丹境", "筑基元婴", "天气", "He entered the room"}, "", 20, 0.65);

    EXPECT_EQ(report.direct_hits, 1u);
    EXPECT_EQ(report.vector_hits, 1u);
    EXPECT_EQ(report.aggregated_hits, 1u);
    EXPECT_EQ(report.not_found, 2u);
    EXPECT_EQ(report.neg_penalties_applied, 1u);
    EXPECT_EQ(report.cache_hits, 0u);
}

TEST_F(BulkGuidanceTest, ConfidenceViewsSplitOnMinConfidence) {
    auto report = store->query_bulk({"金丹大道", "天气", "金丹期", "金丹期"}, "", 20, 0.80);

    ASSERT_EQ(report.high_confidence.size(), 1u);
    EXPECT_EQ(report.high_confidence[0].query_term, "金丹期");
    ASSERT_EQ(report.medium_confidence.size(), 1u);
    EXPECT_EQ(report.medium_confidence[0].query_term, "金丹大道");
}

TEST_F(BulkGuidanceTest, ReportExportsLookupStats) {
    auto report = store->query_bulk({"金丹期", "金丹境"}, "", 20, 0.65);
    auto j = report.to_json();

    EXPECT_EQ(j["lookup_stats"]["direct_hits"], 1);
    EXPECT_EQ(j["lookup_stats"]["vector_hits"], 1);
    EXPECT_EQ(j["lookup_stats"]["api_calls_made"], 1);
    EXPECT_EQ(j["results"].size(), 2u);
}

TEST_F(BulkGuidanceTest, EmptyBatch) {
    auto report = store->query_bulk({}, "", 20, 0.65);
    EXPECT_EQ(report.total_terms, 0u);
    EXPECT_TRUE(report.results.empty());
    EXPECT_EQ(report.api_calls_made, 0u);
}

// ==========================================
// Failure Tests
// ==========================================

TEST_F(BulkGuidanceTest, EmbeddingSpaceMismatchPropagates) {
    auto other = std::make_shared<FakeEmbedder>("fake/other-model");
    auto engine = std::make_shared<DisambiguationEngine>(
        std::make_shared<GuidanceIndex>(store->engine()->index()), other, config);
    BulkGuidanceOrchestrator session(engine, 4);

    EXPECT_THROW(session.bulk_guidance(fresh_terms(6), "", 20, 0.65), EmbeddingSpaceMismatch);
}

TEST_F(BulkGuidanceTest, EmbeddingFailureCountsAsNotFound) {
    auto report = store->query_bulk({"断网", "金丹境"}, "", 20, 0.65);

    EXPECT_EQ(report.not_found, 1u);
    EXPECT_EQ(report.vector_hits, 1u);
    EXPECT_TRUE(report.results[0].embedding_failed);
}
