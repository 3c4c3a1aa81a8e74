// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#ifndef ANALYSIS_RESULT_HPP
#define ANALYSIS_RESULT_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "analysis/EntropyEstimators.hpp"
#include "analysis/StatisticalTestSuite.hpp"
#include "analysis/StructuralDetectors.hpp"

namespace Sequencer::Analysis {

    enum class SecurityRating {
        CRITICAL,
        WARNING,
        GOOD,
        EXCELLENT
    };

    const char* toString(SecurityRating rating);

    /**
     * @brief Elemzési mód.
     * securityAnalysis=false: gyors út (összegzés, minták, duplikátum alapú minősítés),
     * dekódolás, entrópia becslés és tesztakkumulátor nélkül.
     */
    struct AnalysisOptions {
        bool securityAnalysis = true;
        bool parallelBattery = false;
    };

    struct SummaryStats {
        size_t totalSamples = 0;
        size_t uniqueValues = 0;
        size_t duplicateCount = 0;
        double duplicatePercentage = 0.0;
        double entropy = 0.0;
        double averageLength = 0.0;
        size_t minLength = 0;
        size_t maxLength = 0;
    };

    struct PatternReport {
        bool sequential = false;
        size_t sequentialCount = 0;
        bool hasTimestamps = false;
        std::string commonPrefix;
        std::string commonSuffix;
        int predictabilityScore = 0;
    };

    struct EntropyReport {
        double shannonEntropyPerBit = 0.0;
        double minEntropyPerBit = 0.0;
        double minEntropyWholeToken = 0.0;
        // Pozíciónkénti összeg bitenként normálva (összeg / átlagos bitszám)
        double perPositionMinEntropy = 0.0;
        double perPositionTotalEntropy = 0.0;
        // false: eltérő dekódolt hosszak, a pozíciónkénti összeg csak tájékoztató
        bool fixedLength = true;
        double effectiveSecurityBits = 0.0;
        // Gyors módban nincs mérés: a p-értékek és az LZ arány semleges 1.0
        double chiSquaredPValue = 1.0;
        double serialCorrelation = 0.0;
        double runsTestPValue = 1.0;
        double lzCompressionRatio = 1.0;
        double estimatedEntropyRate = 0.0;
        // 100 bitnél rövidebb összesített bitfolyamra az LZ78 becslés nem értelmezett
        bool lzApplicable = false;
        bool lzStructureDetected = false;
        std::vector<PositionEntropy> perPositionData;
        std::vector<RawPositionEntropy> perPositionRawData;
        std::map<std::string, size_t> encodingHistogram;
    };

    struct SecurityVerdict {
        SecurityRating overallRating = SecurityRating::CRITICAL;
        std::vector<std::string> issues;
        std::vector<std::string> warnings;
        std::vector<std::string> strengths;
        double effectiveBits = 0.0;
        int recommendedMinimum = 128;
    };

    struct AnalysisResult {
        SummaryStats summary;
        PatternReport patterns;
        CharacterAnalysis characterAnalysis;
        BitCounts bitAnalysis;
        EntropyReport entropyAnalysis;
        CollisionResult collisionAnalysis;
        SecurityVerdict security;
        std::optional<BatteryReport> statisticalTests;
    };

} // namespace Sequencer::Analysis

#endif // ANALYSIS_RESULT_HPP
