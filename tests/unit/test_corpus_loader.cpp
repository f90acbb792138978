#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "corpus/corpus_loader.hpp"
#include "test_support.hpp"
#include <algorithm>

using namespace tg;

namespace {

bool has_issue(const Corpus& corpus, const std::string& reason) {
    return std::any_of(corpus.report.issues.begin(), corpus.report.issues.end(),
        [&](const LoadIssue& issue) { return issue.reason.find(reason) != std::string::npos; });
}

} // namespace

class CorpusLoaderTest : public ::testing::Test {
protected:
    CorpusLoader loader;
};

// ==========================================
// Valid Corpora
// ==========================================

TEST_F(CorpusLoaderTest, LoadsCategoriesPatternsAndAnchors) {
    Corpus corpus = loader.load_string(test_support::kTestCorpus);

    EXPECT_EQ(corpus.version, "1.0");
    EXPECT_EQ(corpus.categories.size(), 4u);
    EXPECT_EQ(corpus.patterns.size(), 6u);
    ASSERT_EQ(corpus.anchors.size(), 1u);
    EXPECT_EQ(corpus.anchors[0].category, "action_emphasis");
    EXPECT_TRUE(corpus.anchors[0].embedding.empty());
    EXPECT_TRUE(corpus.report.issues.empty());

    EXPECT_EQ(corpus.report.patterns_loaded, 6u);
    EXPECT_EQ(corpus.report.anchors_loaded, 1u);
}

TEST_F(CorpusLoaderTest, PatternFieldsAreTyped) {
    Corpus corpus = loader.load_string(test_support::kTestCorpus);
    auto it = std::find_if(corpus.patterns.begin(), corpus.patterns.end(),
        [](const Pattern& pattern) { return pattern.term == "金丹期"; });
    ASSERT_NE(it, corpus.patterns.end());
    const Pattern& p = *it;

    EXPECT_EQ(p.term, "金丹期");
    EXPECT_EQ(p.primary_rendering, "Kim Đan");
    EXPECT_EQ(p.category, "cultivation_realms");
    EXPECT_EQ(p.category_id, *corpus.categories.find("cultivation_realms"));
    ASSERT_EQ(p.alternate_renderings.size(), 1u);
    EXPECT_EQ(p.alternate_renderings[0], "Kết Đan");
    EXPECT_EQ(p.discouraged_renderings.count("kim đan kỳ"), 1u);
    EXPECT_EQ(p.context_tags.count("xianxia"), 1u);
    EXPECT_EQ(p.corpus_frequency, 120u);
    EXPECT_EQ(p.id, "cultivation_realms/金丹期");
    EXPECT_EQ(p.embedding_text(), "金丹期 - Kim Đan (cultivation realms)");
}

TEST_F(CorpusLoaderTest, AcceptsLegacyFieldNames) {
    Corpus corpus = loader.load_string(test_support::kTestCorpus);
    const Pattern& p = corpus.patterns.back();

    EXPECT_EQ(p.term, "哼");
    EXPECT_EQ(p.primary_rendering, "Hừ");
    EXPECT_EQ(p.discouraged_renderings.count("Hứ"), 1u);
}

TEST_F(CorpusLoaderTest, AdvancedPatternsAndTopLevelAnchors) {
    Corpus corpus = loader.load_string(R"JSON({
      "pattern_categories": {
        "action_emphasis": {"patterns": [{"term": "lunged", "primary_rendering": "lao tới"}]}
      },
      "advanced_patterns": {
        "description": "extra categories",
        "response_particles": {
          "patterns": [{"term": "嗯", "primary_rendering": "Ừm", "id": "particle-001"}],
          "negative_vectors": {"texts": ["嗯嗯嗯 he nodded twice"]}
        }
      },
      "negative_anchors": [
        {"category": "action_emphasis", "text": "She opened the window"}
      ]
    })JSON");

    EXPECT_EQ(corpus.categories.size(), 2u);
    ASSERT_EQ(corpus.patterns.size(), 2u);
    EXPECT_EQ(corpus.patterns[1].id, "particle-001");
    ASSERT_EQ(corpus.anchors.size(), 2u);
    EXPECT_EQ(corpus.anchors[0].category, "response_particles");
    EXPECT_EQ(corpus.anchors[1].source_text, "She opened the window");
}

// ==========================================
// Skipped Entries
// ==========================================

TEST_F(CorpusLoaderTest, SkipsUnusableEntries) {
    Corpus corpus = loader.load_string(R"JSON({
      "pattern_categories": {
        "cultivation_realms": {
          "patterns": [
            {"term": "金丹期", "primary_rendering": "Kim Đan"},
            {"primary_rendering": "no term"},
            {"term": "元婴", "primary_rendering": ""},
            {"term": "筑基", "primary_rendering": "Trúc Cơ", "alternate_renderings": 5},
            {"term": "化神", "primary_rendering": "Hóa Thần", "corpus_frequency": -3},
            "not an object"
          ]
        }
      }
    })JSON");

    ASSERT_EQ(corpus.patterns.size(), 1u);
    EXPECT_EQ(corpus.patterns[0].term, "金丹期");
    EXPECT_EQ(corpus.report.issues.size(), 5u);
    EXPECT_TRUE(has_issue(corpus, "missing term"));
    EXPECT_TRUE(has_issue(corpus, "missing rendering"));
    EXPECT_TRUE(has_issue(corpus, "malformed"));
    EXPECT_TRUE(has_issue(corpus, "corpus_frequency"));
    EXPECT_TRUE(has_issue(corpus, "not an object"));
}

TEST_F(CorpusLoaderTest, SkipsAnchorsForUnknownCategory) {
    Corpus corpus = loader.load_string(R"JSON({
      "pattern_categories": {
        "action_emphasis": {"patterns": [{"term": "lunged", "primary_rendering": "lao tới"}]}
      },
      "negative_anchors": [
        {"category": "no_such_category", "text": "anything"},
        {"text": "no category"},
        {"category": "action_emphasis", "text": ""}
      ]
    })JSON");

    EXPECT_TRUE(corpus.anchors.empty());
    EXPECT_EQ(corpus.report.issues.size(), 3u);
    EXPECT_TRUE(has_issue(corpus, "unknown category"));
    EXPECT_TRUE(has_issue(corpus, "without a category"));
    EXPECT_TRUE(has_issue(corpus, "without text"));
}

TEST_F(CorpusLoaderTest, SkipsEmptyAnchorText) {
    Corpus corpus = loader.load_string(R"JSON({
      "pattern_categories": {
        "action_emphasis": {
          "patterns": [],
          "negative_anchors": ["", "He sat down"]
        }
      }
    })JSON");

    ASSERT_EQ(corpus.anchors.size(), 1u);
    EXPECT_TRUE(has_issue(corpus, "empty negative anchor text"));
}

// ==========================================
// Structural Errors
// ==========================================

TEST_F(CorpusLoaderTest, RejectsMalformedJson) {
    EXPECT_THROW(loader.load_string("{\"pattern_categories\": "), CorpusError);
}

TEST_F(CorpusLoaderTest, RejectsMissingCategories) {
    EXPECT_THROW(loader.load_string(R"({"version": "1.0"})"), CorpusError);
    EXPECT_THROW(loader.load_string(R"([1, 2, 3])"), CorpusError);
    EXPECT_THROW(loader.load_string(R"({"pattern_categories": []})"), CorpusError);
}

TEST_F(CorpusLoaderTest, RejectsWrongBlockTypes) {
    EXPECT_THROW(loader.load_string(R"({"pattern_categories": {"a": 3}})"), CorpusError);
    EXPECT_THROW(loader.load_string(R"({"pattern_categories": {"a": {"patterns": {}}}})"), CorpusError);
    EXPECT_THROW(loader.load_string(R"({"pattern_categories": {}, "negative_anchors": {}})"), CorpusError);
    EXPECT_THROW(loader.load_string(
        R"({"pattern_categories": {"a": {"negative_anchors": "text"}}})"), CorpusError);
}

TEST_F(CorpusLoaderTest, MissingFileThrows) {
    EXPECT_THROW(loader.load_file("/nonexistent/termguide/corpus.json"), CorpusError);
}

TEST_F(CorpusLoaderTest, ReportExportsIssues) {
    Corpus corpus = loader.load_string(R"JSON({
      "pattern_categories": {"a": {"patterns": [{"term": "x"}]}}
    })JSON");

    auto j = corpus.report.to_json();
    EXPECT_EQ(j["patterns_loaded"], 0);
    ASSERT_EQ(j["issues"].size(), 1u);
    EXPECT_EQ(j["issues"][0]["category"], "a");
    EXPECT_EQ(j["issues"][0]["entry_index"], 0);
}
