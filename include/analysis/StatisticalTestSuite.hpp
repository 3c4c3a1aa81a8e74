// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework
// NIST SP 800-22 subset, per-token run + aggregation

#ifndef STATISTICAL_TEST_SUITE_HPP
#define STATISTICAL_TEST_SUITE_HPP

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/ByteDecoder.hpp"

namespace Sequencer::Core {
    class Scheduler;
}

namespace Sequencer::Analysis {

    inline const std::string TEST_MONOBIT = "Frequency (Monobit)";
    inline const std::string TEST_RUNS = "Runs";
    inline const std::string TEST_BLOCK_FREQUENCY = "Block Frequency (M=256)";
    inline const std::string TEST_SERIAL = "Serial (m=2)";
    inline const std::string TEST_APPROXIMATE_ENTROPY = "Approximate Entropy (m=2)";
    inline const std::string TEST_CUMULATIVE_SUMS = "Cumulative Sums (for/back)";

    /**
     * @brief Egy teszt eredménye egy tokenen.
     * applicable=false: az előfeltétel nem teljesült, az aggregálásból kimarad.
     */
    struct TestResult {
        std::string name;
        double pValue = 1.0;
        bool applicable = false;
    };

    struct SerialResult {
        double p1 = 1.0;
        double p2 = 1.0;
        bool applicable = false;
    };

    struct AggregatedTest {
        std::string name;
        size_t applicableCount = 0;
        size_t passCount = 0;
        double passRate = 1.0;
        double medianP = 1.0;
        // Tokenenként; üres ha a teszt nem alkalmazható az adott tokenre
        std::vector<std::optional<double>> pValues;
    };

    struct BatteryReport {
        std::string basis = "raw_string";
        double alpha = 0.0;
        std::vector<AggregatedTest> tests;
        double aggregatePassRate = 1.0;
        double overallMedianP = 1.0;
        std::string verdict;
    };

    /**
     * @brief SP 800-22 tesztakkumulátor.
     * A tesztek név szerint regisztráltak; a per-token futtatás
     * szekvenciálisan vagy a Scheduler analysis workerein történhet,
     * az aggregálás csak az összes eredmény begyűjtése után fut.
     */
    class StatisticalTestSuite {
    public:
        using TestFn = std::function<TestResult(const Core::BitSequence&)>;

        StatisticalTestSuite();

        // --- Individual tests ---
        static TestResult frequencyMonobit(const Core::BitSequence& bits);
        static TestResult runs(const Core::BitSequence& bits);
        static TestResult blockFrequency(const Core::BitSequence& bits, size_t blockSize);
        static SerialResult serial(const Core::BitSequence& bits, unsigned m);
        static TestResult approximateEntropy(const Core::BitSequence& bits, unsigned m);
        static TestResult cumulativeSums(const Core::BitSequence& bits);

        // --- Registry ---
        void registerTest(const std::string& name, TestFn fn);
        const TestFn& getTest(const std::string& name) const;
        std::vector<std::string> testNames() const;

        // Minden regisztrált teszt egy bitsorozaton, regisztrációs sorrendben
        std::vector<TestResult> runAll(const Core::BitSequence& bits) const;

        // --- Battery ---
        BatteryReport runBattery(const std::vector<std::string>& tokens) const;
        BatteryReport runBattery(const std::vector<std::string>& tokens, const Core::Scheduler& scheduler) const;

        // --- Aggregation ---
        static AggregatedTest aggregate(const std::string& name, const std::vector<TestResult>& results, double alpha);
        static double medianOf(std::vector<double> values);
        static std::string verdictFor(double aggregatePassRate, double overallMedianP);

    private:
        std::vector<std::pair<std::string, TestFn>> tests;

        BatteryReport summarize(const std::vector<std::vector<TestResult>>& perToken) const;
    };

} // namespace Sequencer::Analysis

#endif // STATISTICAL_TEST_SUITE_HPP
