// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "analysis/StructuralDetectors.hpp"

#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace {

using Sequencer::Analysis::StructuralDetectors;

TEST(StructuralDetectorsTest, ParseIntegerIsStrict) {
    EXPECT_EQ(StructuralDetectors::parseInteger("42"), 42);
    EXPECT_EQ(StructuralDetectors::parseInteger("-5"), -5);
    EXPECT_FALSE(StructuralDetectors::parseInteger("12a").has_value());
    EXPECT_FALSE(StructuralDetectors::parseInteger("").has_value());
    EXPECT_FALSE(StructuralDetectors::parseInteger(" 7").has_value());
}

TEST(StructuralDetectorsTest, CounterTokensAreSequential) {
    auto result = StructuralDetectors::detectSequential({"1", "2", "3", "4", "5"});
    EXPECT_TRUE(result.isSequential);
    EXPECT_EQ(result.count, 4u);

    const int score = StructuralDetectors::predictabilityScore(result.isSequential, false, 0.0, 0);
    EXPECT_GE(score, 40);
}

TEST(StructuralDetectorsTest, SequentialNeedsMajorityOfPairs) {
    auto result = StructuralDetectors::detectSequential({"1", "2", "9", "4", "7"});
    EXPECT_EQ(result.count, 1u);
    EXPECT_FALSE(result.isSequential);

    EXPECT_FALSE(StructuralDetectors::detectSequential({"1"}).isSequential);
    EXPECT_FALSE(StructuralDetectors::detectSequential({"a1", "a2", "a3"}).isSequential);
}

TEST(StructuralDetectorsTest, TimestampDetection) {
    EXPECT_TRUE(StructuralDetectors::detectTimestamps({"1700000000", "1700000001", "abc"}));

    // 9 számjegy, illetve 2100 utáni érték
    EXPECT_FALSE(StructuralDetectors::detectTimestamps({"946684800"}));
    EXPECT_FALSE(StructuralDetectors::detectTimestamps({"4102444801"}));
    EXPECT_FALSE(StructuralDetectors::detectTimestamps({"1700000000", "x", "y", "z"}));
    EXPECT_FALSE(StructuralDetectors::detectTimestamps({}));
}

TEST(StructuralDetectorsTest, CommonPrefixAndSuffix) {
    auto affixes = StructuralDetectors::commonPrefixSuffix({"sess_abc_end", "sess_xyz_end"});
    EXPECT_EQ(affixes.prefix, "sess_");
    EXPECT_EQ(affixes.suffix, "_end");

    auto none = StructuralDetectors::commonPrefixSuffix({"abc", "xyz"});
    EXPECT_TRUE(none.prefix.empty());
    EXPECT_TRUE(none.suffix.empty());
}

TEST(StructuralDetectorsTest, HammingDistance) {
    EXPECT_EQ(StructuralDetectors::hammingDistance("abc", "abd"), 1u);
    EXPECT_EQ(StructuralDetectors::hammingDistance("abc", "abc"), 0u);
    EXPECT_EQ(StructuralDetectors::hammingDistance("abc", "abcd"), 4u);
}

TEST(StructuralDetectorsTest, CollisionsOnSmallSample) {
    auto result = StructuralDetectors::analyzeCollisions({"aaaa", "aaaa", "aaab", "zzzz"});
    EXPECT_EQ(result.exactDuplicates, 1u);
    EXPECT_EQ(result.comparisons, 6u);
    EXPECT_EQ(result.nearDuplicates, 2u);
    EXPECT_NEAR(result.averageHammingDistance, 14.0 / 6.0, 1e-12);
}

TEST(StructuralDetectorsTest, CollisionSamplingIsBounded) {
    std::vector<std::string> tokens;
    for (int i = 0; i < 2500; ++i) tokens.push_back("token-" + std::to_string(i));

    auto result = StructuralDetectors::analyzeCollisions(tokens);
    // Lépésköz 3: 834 mintavételezett token
    EXPECT_EQ(result.comparisons, 834u * 833u / 2u);
    EXPECT_EQ(result.exactDuplicates, 0u);
}

TEST(StructuralDetectorsTest, CharacterAnalysis) {
    auto chars = StructuralDetectors::analyzeCharacters({"ab12", "ff"});
    EXPECT_EQ(chars.charset, "12abf");
    EXPECT_EQ(chars.alphabetic, 4u);
    EXPECT_EQ(chars.numeric, 2u);
    EXPECT_EQ(chars.special, 0u);
    EXPECT_TRUE(chars.hexadecimal);
    EXPECT_TRUE(chars.base64);

    auto mixed = StructuralDetectors::analyzeCharacters({"a-b"});
    EXPECT_EQ(mixed.special, 1u);
    EXPECT_FALSE(mixed.hexadecimal);
    EXPECT_FALSE(mixed.base64);
}

TEST(StructuralDetectorsTest, PredictabilityScoreWeights) {
    EXPECT_EQ(StructuralDetectors::predictabilityScore(false, false, 0.0, 0), 0);
    EXPECT_EQ(StructuralDetectors::predictabilityScore(true, true, 50.0, 8), 100);
    EXPECT_EQ(StructuralDetectors::predictabilityScore(false, true, 0.0, 3), 30);
}

} // namespace
