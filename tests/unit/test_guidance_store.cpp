#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "corpus/corpus_loader.hpp"
#include "engine/guidance_store.hpp"
#include "test_support.hpp"
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <thread>

using namespace tg;
using namespace tg::test_support;

namespace fs = std::filesystem;

class GuidanceStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeEmbedder> embedder;
    std::unique_ptr<GuidanceStore> store;
    std::string index_path;

    void SetUp() override {
        embedder = std::make_shared<FakeEmbedder>();
        add_corpus_rules(*embedder);

        store = std::make_unique<GuidanceStore>(EngineConfig(), embedder);
        store->set_corpus(CorpusLoader().load_string(kTestCorpus));

        index_path = (fs::temp_directory_path() /
            ("termguide_store_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
             "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json")).string();
    }

    void TearDown() override {
        std::remove(index_path.c_str());
    }
};

// ==========================================
// Build Tests
// ==========================================

TEST_F(GuidanceStoreTest, BuildIndexesEveryPattern) {
    IndexStats stats = store->build_index(true);

    EXPECT_EQ(stats.total_indexed, 6u);
    EXPECT_EQ(stats.patterns_per_category["cultivation_realms"], 3u);
    EXPECT_EQ(stats.anchors_per_category["action_emphasis"], 1u);
    EXPECT_EQ(stats.dimension, kDim);
    EXPECT_EQ(stats.embedding_model_id, "fake/test-model");
    EXPECT_EQ(stats.collisions, 0u);
    EXPECT_FALSE(stats.created_utc.empty());
}

TEST_F(GuidanceStoreTest, RebuildIsIdempotent) {
    store->build_index(true);
    auto first = store->engine();

    store->build_index(true);
    auto second = store->engine();

    EXPECT_NE(first.get(), second.get());
    EXPECT_EQ(first->index().direct.keys(), second->index().direct.keys());
    EXPECT_EQ(first->index().collection->count(), second->index().collection->count());
    EXPECT_EQ(first->index().anchors.size(), second->index().anchors.size());
}

TEST_F(GuidanceStoreTest, BuildWithoutForceKeepsLiveIndex) {
    store->build_index(true);
    embedder->reset_counts();
    auto before = store->engine();

    IndexStats stats = store->build_index(false);

    EXPECT_EQ(embedder->batch_calls(), 0u);
    EXPECT_EQ(store->engine().get(), before.get());
    EXPECT_EQ(stats.total_indexed, 6u);
}

TEST_F(GuidanceStoreTest, BuildWithoutCorpusThrows) {
    GuidanceStore empty(EngineConfig(), embedder);
    EXPECT_FALSE(empty.has_corpus());
    EXPECT_THROW(empty.build_index(true), CorpusError);
    EXPECT_THROW(empty.build_index(false), CorpusError);
}

TEST_F(GuidanceStoreTest, BuildBatchesEmbeddings) {
    EngineConfig config;
    config.upsert_batch_size = 4;
    GuidanceStore batched(config, embedder);
    batched.set_corpus(CorpusLoader().load_string(kTestCorpus));
    embedder->reset_counts();

    batched.build_index(true);

    // 6 patterns in batches of 4, then 1 anchor batch
    EXPECT_EQ(embedder->batch_calls(), 3u);
}

TEST_F(GuidanceStoreTest, ProgressIsReported) {
    std::vector<std::string> stages;
    int last_current = 0;
    int last_total = 0;
    store->set_progress_callback([&](const std::string& stage, int current, int total, const std::string&) {
        if (stages.empty() || stages.back() != stage) stages.push_back(stage);
        last_current = current;
        last_total = total;
    });

    store->build_index(true);

    ASSERT_EQ(stages.size(), 2u);
    EXPECT_EQ(stages[0], "embed_patterns");
    EXPECT_EQ(stages[1], "embed_anchors");
    EXPECT_EQ(last_current, last_total);
}

TEST_F(GuidanceStoreTest, FailedBuildLeavesLiveIndexUntouched) {
    store->build_index(true);
    auto before = store->engine();

    auto broken = std::make_shared<FakeEmbedder>();
    broken->fail_on("Trúc Cơ");
    GuidanceStore failing(EngineConfig(), broken);
    failing.set_corpus(CorpusLoader().load_string(kTestCorpus));

    EXPECT_THROW(failing.build_index(true), EmbeddingError);
    EXPECT_TRUE(failing.engine()->index().empty());
    EXPECT_EQ(store->engine().get(), before.get());
}

TEST_F(GuidanceStoreTest, LaterDuplicateWins) {
    const char* corpus = R"JSON({
      "pattern_categories": {
        "cultivation_realms": {
          "patterns": [
            {"term": "金丹期", "primary_rendering": "Kim Đan"},
            {"term": "金丹期", "primary_rendering": "Kết Đan"}
          ]
        },
        "titles_honorifics": {
          "patterns": [
            {"term": "金丹期", "primary_rendering": "kỳ Kim Đan"}
          ]
        }
      }
    })JSON";
    store->set_corpus(CorpusLoader().load_string(corpus));

    IndexStats stats = store->build_index(true);
    const GuidanceIndex& index = store->engine()->index();

    EXPECT_EQ(stats.collisions, 1u);
    EXPECT_EQ(stats.total_indexed, 2u);
    ASSERT_EQ(index.direct.get_all("金丹期").size(), 2u);
    EXPECT_EQ(index.direct.get("金丹期")->primary_rendering, "Kết Đan");
}

// ==========================================
// Snapshot Tests
// ==========================================

TEST_F(GuidanceStoreTest, OldSnapshotStaysUsable) {
    store->build_index(true);
    auto old_engine = store->engine();

    store->clear();

    GuidanceResult from_old = old_engine->query_one("金丹期");
    EXPECT_EQ(from_old.lookup_path, LookupPath::Direct);

    GuidanceResult from_new = store->query_one("金丹期");
    EXPECT_FALSE(from_new.found());
    EXPECT_EQ(from_new.lookup_path, LookupPath::None);
}

TEST_F(GuidanceStoreTest, QueriesDuringRebuildSeeACompleteIndex) {
    store->build_index(true);

    std::atomic<bool> done{false};
    std::atomic<size_t> misses{0};
    std::thread reader([&]() {
        while (!done.load()) {
            if (store->query_one("筑基").lookup_path != LookupPath::Direct) {
                misses++;
            }
        }
    });

    for (int i = 0; i < 5; ++i) {
        store->build_index(true);
    }
    done = true;
    reader.join();

    EXPECT_EQ(misses.load(), 0u);
}

TEST_F(GuidanceStoreTest, ClearEmptiesIndexAndLog) {
    store->build_index(true);
    store->query_one("金丹大道");
    EXPECT_EQ(store->uncertain_log()->size(), 1u);

    store->clear();

    EXPECT_EQ(store->get_stats().collection_count, 0u);
    EXPECT_EQ(store->uncertain_log()->size(), 0u);
    EXPECT_TRUE(store->engine()->index().empty());
}

// ==========================================
// Persistence Tests
// ==========================================

TEST_F(GuidanceStoreTest, SaveAndLoadRoundTrip) {
    store->build_index(true);
    store->save_index(index_path);

    GuidanceStore restored(EngineConfig(), embedder);
    restored.load_index(index_path);

    const GuidanceIndex& index = restored.engine()->index();
    EXPECT_EQ(index.collection->count(), 6u);
    EXPECT_EQ(index.anchors.size(), 1u);
    EXPECT_EQ(index.embedding_model_id(), "fake/test-model");
    EXPECT_EQ(index.direct.keys(), store->engine()->index().direct.keys());

    GuidanceResult vector_hit = restored.query_one("金丹境");
    EXPECT_EQ(vector_hit.confidence_tier, ConfidenceTier::Inject);
    ASSERT_TRUE(vector_hit.matched_pattern.has_value());
    EXPECT_EQ(vector_hit.matched_pattern->primary_rendering, "Kim Đan");

    GuidanceResult penalized = restored.query_one("He entered the room");
    EXPECT_NEAR(penalized.negative_penalty, 0.25, 1e-9);
}

TEST_F(GuidanceStoreTest, LoadRejectsOtherEmbeddingModel) {
    store->build_index(true);
    store->save_index(index_path);

    auto other = std::make_shared<FakeEmbedder>("fake/other-model");
    GuidanceStore restored(EngineConfig(), other);

    EXPECT_THROW(restored.load_index(index_path), EmbeddingSpaceMismatch);
    EXPECT_TRUE(restored.engine()->index().empty());
}

TEST_F(GuidanceStoreTest, LoadMissingFileThrows) {
    EXPECT_THROW(store->load_index(index_path + ".missing"), std::runtime_error);
}

// ==========================================
// Admin Tests
// ==========================================

TEST_F(GuidanceStoreTest, StatsDescribeLiveIndex) {
    store->build_index(true);
    GuidanceStats stats = store->get_stats();

    EXPECT_EQ(stats.collection_count, 6u);
    EXPECT_EQ(stats.categories.size(), 4u);
    EXPECT_DOUBLE_EQ(stats.thresholds.inject, 0.80);
    EXPECT_DOUBLE_EQ(stats.thresholds.log, 0.65);
    EXPECT_DOUBLE_EQ(stats.negative_anchor.penalty, 0.25);
    EXPECT_EQ(stats.embedding_model_id, "fake/test-model");

    auto j = stats.to_json();
    EXPECT_EQ(j["collection_count"], 6);
    EXPECT_EQ(j["index"]["total_indexed"], 6);
}

TEST_F(GuidanceStoreTest, ValidateIndexReportsFailures) {
    store->build_index(true);

    ValidationReport report = store->validate_index({
        {"金丹期", "Kim Đan", "", ""},
        {"金丹境", "Kim Đan", "", ""},
        {"天气", "trời", "", ""}
    });

    EXPECT_EQ(report.passed, 2u);
    EXPECT_EQ(report.failed, 1u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_NE(report.failures[0].find("天气"), std::string::npos);
}

TEST_F(GuidanceStoreTest, InvalidConfigIsRejected) {
    EngineConfig config;
    config.thresholds.log = 0.9;
    EXPECT_THROW({ GuidanceStore rejected(config, embedder); }, ConfigError);
}

TEST_F(GuidanceStoreTest, FormatForPromptUsesBulkResults) {
    store->build_index(true);
    auto report = store->query_bulk({"金丹期", "金丹大道"}, "", 10, 0.65);

    std::string block = store->format_for_prompt(report.results, false);
    EXPECT_NE(block.find("**金丹期** → `Kim Đan`"), std::string::npos);
    EXPECT_EQ(block.find("金丹大道"), std::string::npos);

    std::string with_suggestions = store->format_for_prompt(report.results, true);
    EXPECT_NE(with_suggestions.find("金丹大道"), std::string::npos);
}
