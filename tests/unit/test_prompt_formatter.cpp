#include <gtest/gtest.h>
#include "render/prompt_formatter.hpp"

using namespace tg;

namespace {

GuidanceResult make_result(const std::string& term, const std::string& rendering,
                           double score, ConfidenceTier tier,
                           std::set<std::string> avoid = {}) {
    Pattern pattern;
    pattern.id = "test/" + term;
    pattern.term = term;
    pattern.category = "test";
    pattern.primary_rendering = rendering;
    pattern.discouraged_renderings = std::move(avoid);

    GuidanceResult result;
    result.query_term = term;
    result.raw_similarity = score;
    result.final_score = score;
    result.confidence_tier = tier;
    result.matched_pattern = std::move(pattern);
    result.lookup_path = LookupPath::Vector;
    return result;
}

} // namespace

class PromptFormatterTest : public ::testing::Test {
protected:
    PromptInjectionFormatter formatter;
};

TEST_F(PromptFormatterTest, EmptyWhenNothingQualifies) {
    GuidanceResult miss;
    miss.query_term = "天气";

    EXPECT_EQ(formatter.format({}, true), "");
    EXPECT_EQ(formatter.format({miss}, true), "");
    EXPECT_EQ(formatter.format({make_result("金丹大道", "Kim Đan", 0.72, ConfidenceTier::Log)}, false), "");
}

TEST_F(PromptFormatterTest, RequiredBlockLayout) {
    std::string block = formatter.format(
        {make_result("金丹期", "Kim Đan", 1.0, ConfidenceTier::Inject, {"kim đan kỳ"})}, false);

    EXPECT_EQ(block,
        "## Terminology Guidance\n"
        "### Required terminology\n"
        "- **金丹期** → `Kim Đan` (NOT: kim đan kỳ)\n");
}

TEST_F(PromptFormatterTest, SuggestionsCarryScore) {
    std::string block = formatter.format({
        make_result("金丹期", "Kim Đan", 1.0, ConfidenceTier::Inject),
        make_result("金丹大道", "Kim Đan đại đạo", 0.72, ConfidenceTier::Log)
    }, true);

    EXPECT_EQ(block,
        "## Terminology Guidance\n"
        "### Required terminology\n"
        "- **金丹期** → `Kim Đan`\n"
        "### Suggestions (verify in context)\n"
        "- 金丹大道 → `Kim Đan đại đạo` (0.72)\n");
}

TEST_F(PromptFormatterTest, IgnoreNeverShown) {
    auto ignored = make_result("剑意", "kiếm ý", 0.40, ConfidenceTier::Ignore);
    EXPECT_EQ(formatter.format({ignored}, true), "");
}

TEST_F(PromptFormatterTest, OrderedByScoreThenTerm) {
    std::string block = formatter.format({
        make_result("b", "B", 0.85, ConfidenceTier::Inject),
        make_result("c", "C", 0.95, ConfidenceTier::Inject),
        make_result("a", "A", 0.85, ConfidenceTier::Inject)
    }, false);

    size_t c = block.find("**c**");
    size_t a = block.find("**a**");
    size_t b = block.find("**b**");
    ASSERT_NE(c, std::string::npos);
    EXPECT_LT(c, a);
    EXPECT_LT(a, b);
}

TEST_F(PromptFormatterTest, RepeatedTermAppearsOnce) {
    std::string block = formatter.format({
        make_result("金丹期", "Kim Đan", 1.0, ConfidenceTier::Inject),
        make_result(" 金丹期 ", "Kim Đan", 1.0, ConfidenceTier::Inject)
    }, false);

    size_t first = block.find("Kim Đan");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(block.find("Kim Đan", first + 1), std::string::npos);
}

TEST_F(PromptFormatterTest, RepeatedTermKeepsBestScore) {
    std::string block = formatter.format({
        make_result("金丹大道", "Kim Đan đạo", 0.70, ConfidenceTier::Log),
        make_result("金丹大道", "Kim Đan đại đạo", 0.90, ConfidenceTier::Inject)
    }, true);

    EXPECT_NE(block.find("- **金丹大道** → `Kim Đan đại đạo`"), std::string::npos);
    EXPECT_EQ(block.find("`Kim Đan đạo`"), std::string::npos);
    EXPECT_EQ(block.find("### Suggestions"), std::string::npos);
}

TEST_F(PromptFormatterTest, CustomTitle) {
    PromptInjectionFormatter titled("Glossary");
    std::string block = titled.format({make_result("哼", "Hừ", 1.0, ConfidenceTier::Inject)}, false);
    EXPECT_EQ(block.rfind("## Glossary\n", 0), 0u);
}

TEST_F(PromptFormatterTest, FormatLineListsEveryDiscouragedRendering) {
    auto result = make_result("金丹期", "Kim Đan", 0.70, ConfidenceTier::Log, {"kim đan kỳ", "Hoàng Đan"});
    EXPECT_EQ(PromptInjectionFormatter::format_line(result),
              "- 金丹期 → `Kim Đan` (NOT: Hoàng Đan, kim đan kỳ) (0.70)");
}
