// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "analysis/SpecialFunctions.hpp"

#include <cmath>

#include "gtest/gtest.h"

namespace {

namespace sf = Sequencer::Analysis::Special;

TEST(SpecialFunctionsTest, LnGammaMatchesFactorials) {
    EXPECT_NEAR(sf::lnGamma(1.0), 0.0, 1e-10);
    EXPECT_NEAR(sf::lnGamma(2.0), 0.0, 1e-10);
    EXPECT_NEAR(sf::lnGamma(5.0), std::log(24.0), 1e-10);
    EXPECT_NEAR(sf::lnGamma(0.5), 0.5 * std::log(std::acos(-1.0)), 1e-10);
    // Reflexiós ág
    EXPECT_NEAR(sf::lnGamma(0.25), std::lgamma(0.25), 1e-9);
}

TEST(SpecialFunctionsTest, UpperGammaWithUnitShapeIsExponential) {
    for (double x : {0.1, 0.5, 1.0, 3.0, 10.0, 25.0}) {
        EXPECT_NEAR(sf::gammaincUpperRegularized(1.0, x), std::exp(-x), 1e-10) << "x=" << x;
    }
    EXPECT_NEAR(sf::gammaincUpperRegularized(1.0, 1.0), 0.3678794412, 1e-9);
}

TEST(SpecialFunctionsTest, UpperGammaEdgeCases) {
    EXPECT_DOUBLE_EQ(sf::gammaincUpperRegularized(2.0, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(sf::gammaincUpperRegularized(2.0, -1.0), 1.0);
    EXPECT_DOUBLE_EQ(sf::gammaincUpperRegularized(0.0, 1.0), 1.0);

    const double tail = sf::gammaincUpperRegularized(4.0, 500.0);
    EXPECT_GE(tail, 0.0);
    EXPECT_LE(tail, 1e-12);
}

TEST(SpecialFunctionsTest, ErfcReferenceValues) {
    EXPECT_NEAR(sf::erfc(0.0), 1.0, 1e-9);
    EXPECT_NEAR(sf::erfc(1.0), 0.1572992070502851, 1e-9);
    EXPECT_NEAR(sf::erfc(-1.0), 1.8427007929497149, 1e-9);
    EXPECT_NEAR(sf::erfc(3.0), std::erfc(3.0), 1e-12);
}

TEST(SpecialFunctionsTest, ErfcIsMonotonicallyDecreasing) {
    double previous = sf::erfc(0.0);
    for (double x = 0.05; x <= 5.0; x += 0.05) {
        const double current = sf::erfc(x);
        EXPECT_LE(current, previous) << "x=" << x;
        previous = current;
    }
}

TEST(SpecialFunctionsTest, NormalCdf) {
    EXPECT_NEAR(sf::normalCDF(0.0), 0.5, 1e-12);
    EXPECT_NEAR(sf::normalCDF(1.96), 0.9750021048517795, 1e-9);
    EXPECT_NEAR(sf::normalCDF(-1.96) + sf::normalCDF(1.96), 1.0, 1e-12);
}

TEST(SpecialFunctionsTest, ChiSquareCriticalValue) {
    // χ²(1) 95%-os kritikus értéke
    EXPECT_NEAR(sf::chiSquareUpperTail(3.841458820694124, 1.0), 0.05, 1e-9);
    EXPECT_DOUBLE_EQ(sf::chiSquareUpperTail(0.0, 4.0), 1.0);
}

} // namespace
