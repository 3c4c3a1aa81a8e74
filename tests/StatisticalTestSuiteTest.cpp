// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "analysis/StatisticalTestSuite.hpp"
#include "core/Scheduler.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace {

using namespace Sequencer::Analysis;
using Sequencer::Core::BitSequence;

// A π bináris kifejtésének első 100 bitje (SP 800-22 mintapélda)
const std::string kPiBits =
    "1100100100001111110110101010001000100001011010001100001000110100"
    "110001001100011001100010100010111000";

BitSequence fromString(const std::string& s) {
    BitSequence bits;
    for (char c : s) bits.push_back(c == '1' ? 1 : 0);
    return bits;
}

BitSequence alternating(size_t n) {
    BitSequence bits;
    for (size_t i = 0; i < n; ++i) bits.push_back(static_cast<uint8_t>(i % 2));
    return bits;
}

TEST(StatisticalTestSuiteTest, MonobitReferenceValue) {
    auto r = StatisticalTestSuite::frequencyMonobit(fromString(kPiBits));
    EXPECT_TRUE(r.applicable);
    EXPECT_NEAR(r.pValue, 0.109599, 1e-5);
}

TEST(StatisticalTestSuiteTest, MonobitOnConstantBits) {
    auto r = StatisticalTestSuite::frequencyMonobit(BitSequence(1000, 0));
    EXPECT_TRUE(r.applicable);
    EXPECT_LT(r.pValue, 1e-10);
}

TEST(StatisticalTestSuiteTest, MonobitNeedsHundredBits) {
    auto r = StatisticalTestSuite::frequencyMonobit(BitSequence(99, 0));
    EXPECT_FALSE(r.applicable);
}

TEST(StatisticalTestSuiteTest, BlockFrequencyReferenceValue) {
    auto r = StatisticalTestSuite::blockFrequency(fromString(kPiBits), 10);
    EXPECT_TRUE(r.applicable);
    EXPECT_NEAR(r.pValue, 0.706438, 1e-5);

    EXPECT_FALSE(StatisticalTestSuite::blockFrequency(BitSequence(255, 0), 256).applicable);
}

TEST(StatisticalTestSuiteTest, RunsUsesNormalApproximation) {
    auto r = StatisticalTestSuite::runs(fromString(kPiBits));
    EXPECT_TRUE(r.applicable);
    EXPECT_NEAR(r.pValue, 0.638006, 1e-5);

    auto strict = StatisticalTestSuite::runs(alternating(1000));
    EXPECT_TRUE(strict.applicable);
    EXPECT_LT(strict.pValue, 1e-10);
}

TEST(StatisticalTestSuiteTest, RunsSkipsBiasedSequences) {
    BitSequence biased(1000, 1);
    for (size_t i = 0; i < 100; ++i) biased[i * 10] = 0;
    EXPECT_FALSE(StatisticalTestSuite::runs(biased).applicable);
}

TEST(StatisticalTestSuiteTest, SerialDetectsPeriodicPatterns) {
    auto r = StatisticalTestSuite::serial(alternating(1000), 2);
    EXPECT_TRUE(r.applicable);
    EXPECT_LT(r.p1, 0.01);
    // Kiegyensúlyozott 0/1 arány: az egybites szint nem tér el
    EXPECT_NEAR(r.p2, 1.0, 1e-12);

    EXPECT_FALSE(StatisticalTestSuite::serial(alternating(999), 2).applicable);
}

TEST(StatisticalTestSuiteTest, SerialSecondStatisticTracksBitBias) {
    // 560 egyes, majd 440 nulla: ψ²₁ = 14.4, ψ²₀ = 0
    BitSequence biased(1000, 0);
    for (size_t i = 0; i < 560; ++i) biased[i] = 1;

    auto r = StatisticalTestSuite::serial(biased, 2);
    EXPECT_TRUE(r.applicable);
    EXPECT_NEAR(r.p2, 1.4780231e-4, 1e-9);
    EXPECT_LT(r.p1, 1e-10);
}

TEST(StatisticalTestSuiteTest, ApproximateEntropyGating) {
    EXPECT_FALSE(StatisticalTestSuite::approximateEntropy(BitSequence(9999, 0), 2).applicable);

    auto r = StatisticalTestSuite::approximateEntropy(BitSequence(10000, 0), 2);
    EXPECT_TRUE(r.applicable);
    EXPECT_LT(r.pValue, 1e-10);
}

TEST(StatisticalTestSuiteTest, CumulativeSums) {
    auto balanced = StatisticalTestSuite::cumulativeSums(alternating(1000));
    EXPECT_TRUE(balanced.applicable);
    EXPECT_GT(balanced.pValue, 0.99);

    auto drifting = StatisticalTestSuite::cumulativeSums(BitSequence(1000, 1));
    EXPECT_TRUE(drifting.applicable);
    EXPECT_LT(drifting.pValue, 1e-10);

    EXPECT_FALSE(StatisticalTestSuite::cumulativeSums(BitSequence(999, 1)).applicable);
}

TEST(StatisticalTestSuiteTest, AggregationWithoutApplicableResults) {
    std::vector<TestResult> results = {{TEST_SERIAL, 1.0, false}, {TEST_SERIAL, 1.0, false}};
    auto agg = StatisticalTestSuite::aggregate(TEST_SERIAL, results, 0.01);

    EXPECT_EQ(agg.applicableCount, 0u);
    EXPECT_DOUBLE_EQ(agg.passRate, 1.0);
    EXPECT_DOUBLE_EQ(agg.medianP, 1.0);
    ASSERT_EQ(agg.pValues.size(), 2u);
    EXPECT_FALSE(agg.pValues[0].has_value());
}

TEST(StatisticalTestSuiteTest, AggregationCountsPassesAndMedian) {
    std::vector<TestResult> results = {
        {TEST_RUNS, 0.5, true},
        {TEST_RUNS, 0.001, true},
        {TEST_RUNS, 0.2, true},
        {TEST_RUNS, 1.0, false},
    };
    auto agg = StatisticalTestSuite::aggregate(TEST_RUNS, results, 0.01);

    EXPECT_EQ(agg.applicableCount, 3u);
    EXPECT_EQ(agg.passCount, 2u);
    EXPECT_NEAR(agg.passRate, 2.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(agg.medianP, 0.2);
    EXPECT_FALSE(agg.pValues[3].has_value());
}

TEST(StatisticalTestSuiteTest, MedianUsesUpperMiddle) {
    EXPECT_DOUBLE_EQ(StatisticalTestSuite::medianOf({0.4, 0.1, 0.3, 0.2}), 0.3);
    EXPECT_DOUBLE_EQ(StatisticalTestSuite::medianOf({}), 1.0);
}

TEST(StatisticalTestSuiteTest, Verdicts) {
    EXPECT_EQ(StatisticalTestSuite::verdictFor(0.99, 0.4), "Looks Random");
    EXPECT_EQ(StatisticalTestSuite::verdictFor(0.85, 0.02), "Mostly Random");
    EXPECT_EQ(StatisticalTestSuite::verdictFor(0.5, 0.5), "Shows Patterns");
}

TEST(StatisticalTestSuiteTest, RegistryKeepsOrderAndRejectsUnknownNames) {
    StatisticalTestSuite suite;
    const std::vector<std::string> expected = {
        TEST_MONOBIT, TEST_RUNS, TEST_BLOCK_FREQUENCY,
        TEST_SERIAL, TEST_APPROXIMATE_ENTROPY, TEST_CUMULATIVE_SUMS
    };
    EXPECT_EQ(suite.testNames(), expected);

    EXPECT_THROW(suite.getTest("Spectral DFT"), std::runtime_error);
    EXPECT_NO_THROW(suite.getTest(TEST_MONOBIT));
}

TEST(StatisticalTestSuiteTest, ShortTokensAreInapplicableEverywhere) {
    StatisticalTestSuite suite;
    auto report = suite.runBattery({"abc", "def"});

    EXPECT_EQ(report.basis, "raw_string");
    EXPECT_DOUBLE_EQ(report.alpha, 0.01);
    ASSERT_EQ(report.tests.size(), 6u);
    for (const auto& test : report.tests) {
        EXPECT_EQ(test.applicableCount, 0u) << test.name;
        EXPECT_DOUBLE_EQ(test.passRate, 1.0);
    }
    EXPECT_DOUBLE_EQ(report.aggregatePassRate, 1.0);
    EXPECT_DOUBLE_EQ(report.overallMedianP, 1.0);
    EXPECT_EQ(report.verdict, "Looks Random");
}

TEST(StatisticalTestSuiteTest, ParallelBatteryMatchesSequential) {
    std::vector<std::string> tokens;
    for (int i = 0; i < 24; ++i) {
        tokens.push_back(std::string(16 + i, static_cast<char>('a' + (i % 26))) + std::to_string(i * 7919));
    }

    StatisticalTestSuite suite;
    Sequencer::Core::Scheduler scheduler;
    auto sequential = suite.runBattery(tokens);
    auto parallel = suite.runBattery(tokens, scheduler);

    ASSERT_EQ(sequential.tests.size(), parallel.tests.size());
    for (size_t t = 0; t < sequential.tests.size(); ++t) {
        EXPECT_EQ(sequential.tests[t].pValues, parallel.tests[t].pValues) << sequential.tests[t].name;
        EXPECT_EQ(sequential.tests[t].passCount, parallel.tests[t].passCount);
    }
    EXPECT_DOUBLE_EQ(sequential.aggregatePassRate, parallel.aggregatePassRate);
    EXPECT_EQ(sequential.verdict, parallel.verdict);
}

} // namespace
