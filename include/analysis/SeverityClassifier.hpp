// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#ifndef SEVERITY_CLASSIFIER_HPP
#define SEVERITY_CLASSIFIER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "analysis/AnalysisResult.hpp"

namespace Sequencer::Analysis {

    /**
     * @brief A szabálymotor bemenete: minden mérőszám, amiből a verdikt készül.
     */
    struct ClassifierInput {
        double effectiveSecurityBits = 0.0;
        double minEntropyPerBit = 0.0;
        double shannonCharEntropy = 0.0;
        uint64_t totalBits = 0;
        double chiSquaredPValue = 1.0;
        double serialCorrelation = 0.0;
        double runsTestPValue = 1.0;
        double lzCompressionRatio = 1.0;
        size_t nearDuplicates = 0;
        size_t sampleCount = 0;
        double duplicatePercentage = 0.0;
        bool sequential = false;
        bool timestamps = false;
        int predictabilityScore = 0;
        // Pl. részleges kérés-hibák; a minősítés előtt a warnings listához fűzve
        std::vector<std::string> extraWarnings;
    };

    class SeverityClassifier {
    public:
        /**
         * @brief Teljes szabálykiértékelés (issues / warnings / strengths) és minősítés.
         * Sorrend: CRITICAL, WARNING, EXCELLENT, különben GOOD.
         */
        static SecurityVerdict classify(const ClassifierInput& input);

        // |r| > 0.5 vagy χ² / runs p < 0.001, elegendő bit esetén
        static bool severeFailure(const ClassifierInput& input);

        static SecurityRating rate(double effectiveBits, bool severe, size_t warningCount, size_t strengthCount);

        // Gyors mód: csak duplikátumok és minták alapján
        static SecurityRating quickRating(double duplicatePercentage, bool sequential, bool timestamps, int predictabilityScore);
    };

} // namespace Sequencer::Analysis

#endif // SEVERITY_CLASSIFIER_HPP
