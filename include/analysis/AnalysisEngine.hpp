// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework
// Top-level analysis entry point

#ifndef ANALYSIS_ENGINE_HPP
#define ANALYSIS_ENGINE_HPP

#include <vector>

#include "analysis/AnalysisResult.hpp"
#include "analysis/StatisticalTestSuite.hpp"
#include "core/TokenCapture.hpp"

namespace Sequencer::Core {
    class Scheduler;
}

namespace Sequencer::Analysis {

    /**
     * @brief Elemző motor.
     * Tiszta, determinisztikus számítás a capture lista egy pillanatképén;
     * a bemenetet nem módosítja, és semmilyen bemenetre nem dob kivételt.
     * Scheduler megadása esetén a tesztakkumulátor tokenenkénti futása párhuzamosítható.
     */
    class AnalysisEngine {
    public:
        AnalysisEngine();
        explicit AnalysisEngine(const Core::Scheduler& schedulerRef);

        AnalysisResult analyze(const std::vector<Core::TokenCapture>& captures,
                               const AnalysisOptions& options = AnalysisOptions{}) const;

        /**
         * @brief Érvényes token nélküli riport.
         * issues[0]: "PARAMETER_NOT_FOUND:", "REQUEST_FAILED:" vagy "ERROR:" taggel kezdődik.
         */
        static AnalysisResult degradedReport(const std::vector<Core::TokenCapture>& captures);

    private:
        StatisticalTestSuite suite;
        const Core::Scheduler* scheduler = nullptr;

        void runSecurityAnalysis(const std::vector<std::string>& tokens,
                                 const AnalysisOptions& options,
                                 AnalysisResult& result) const;
    };

} // namespace Sequencer::Analysis

#endif // ANALYSIS_ENGINE_HPP
