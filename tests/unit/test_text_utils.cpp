#include <gtest/gtest.h>
#include "core/text_utils.hpp"
#include "engine/confidence.hpp"

using namespace tg;

// ==========================================
// Normalization Tests
// ==========================================

TEST(TextUtilsTest, NormalizeTrimsAndCollapses) {
    EXPECT_EQ(normalize_term("  金丹期  "), "金丹期");
    EXPECT_EQ(normalize_term("Suddenly \t\n LUNGED"), "suddenly lunged");
    EXPECT_EQ(normalize_term("金丹\xE3\x80\x80期"), "金丹 期");
    EXPECT_EQ(normalize_term("   "), "");
    EXPECT_EQ(normalize_term(""), "");
}

TEST(TextUtilsTest, NormalizeKeepsNonAsciiCase) {
    EXPECT_EQ(normalize_term("Kim Đan"), "kim Đan");
}

TEST(TextUtilsTest, Utf8Units) {
    auto units = utf8_units("金a丹");
    ASSERT_EQ(units.size(), 3u);
    EXPECT_EQ(units[0], "金");
    EXPECT_EQ(units[1], "a");
    EXPECT_EQ(units[2], "丹");

    EXPECT_EQ(utf8_length("筑基元婴"), 4u);
    EXPECT_EQ(utf8_length("\xE9\x87"), 2u);
}

TEST(TextUtilsTest, CosineSimilarity) {
    EXPECT_NEAR(cosine_similarity({1.0f, 0.0f}, {1.0f, 0.0f}), 1.0, 1e-9);
    EXPECT_NEAR(cosine_similarity({1.0f, 0.0f}, {0.0f, 2.0f}), 0.0, 1e-9);
    EXPECT_NEAR(cosine_similarity({3.0f, 4.0f}, {6.0f, 8.0f}), 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(cosine_similarity({1.0f}, {1.0f, 0.0f}), 0.0);
    EXPECT_DOUBLE_EQ(cosine_similarity({0.0f, 0.0f}, {1.0f, 0.0f}), 0.0);
}

TEST(TextUtilsTest, Join) {
    EXPECT_EQ(join({"Trúc Cơ", "Nguyên Anh"}, " "), "Trúc Cơ Nguyên Anh");
    EXPECT_EQ(join({}, ", "), "");
}

TEST(TextUtilsTest, TimestampIsIso8601) {
    std::string ts = utc_timestamp();
    ASSERT_EQ(ts.size(), 20u);
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');
}

// ==========================================
// Confidence Tests
// ==========================================

TEST(ConfidenceTest, LowerBoundsAreInclusive) {
    ConfidenceThresholds thresholds;

    EXPECT_EQ(classify(1.0, thresholds), ConfidenceTier::Inject);
    EXPECT_EQ(classify(0.80, thresholds), ConfidenceTier::Inject);
    EXPECT_EQ(classify(0.7999, thresholds), ConfidenceTier::Log);
    EXPECT_EQ(classify(0.65, thresholds), ConfidenceTier::Log);
    EXPECT_EQ(classify(0.6499, thresholds), ConfidenceTier::Ignore);
    EXPECT_EQ(classify(0.0, thresholds), ConfidenceTier::Ignore);
}

TEST(ConfidenceTest, CustomThresholds) {
    ConfidenceThresholds thresholds{0.9, 0.5};
    EXPECT_EQ(classify(0.85, thresholds), ConfidenceTier::Log);
    EXPECT_EQ(classify(0.5, thresholds), ConfidenceTier::Log);
    EXPECT_EQ(classify(0.49, thresholds), ConfidenceTier::Ignore);
}

TEST(ConfidenceTest, ThresholdValidation) {
    std::string error;
    EXPECT_TRUE(ConfidenceThresholds{}.validate(error));
    EXPECT_TRUE((ConfidenceThresholds{0.7, 0.7}.validate(error)));
    EXPECT_FALSE((ConfidenceThresholds{0.6, 0.7}.validate(error)));
    EXPECT_FALSE((ConfidenceThresholds{1.2, 0.7}.validate(error)));
    EXPECT_FALSE((ConfidenceThresholds{0.8, -0.1}.validate(error)));
}

TEST(ConfidenceTest, TierNames) {
    EXPECT_EQ(to_string(ConfidenceTier::Inject), "INJECT");
    EXPECT_EQ(to_string(ConfidenceTier::Log), "LOG");
    EXPECT_EQ(to_string(ConfidenceTier::Ignore), "IGNORE");
    EXPECT_EQ(to_string(LookupPath::Aggregated), "AGGREGATED");
}
