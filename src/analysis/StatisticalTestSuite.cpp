// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "analysis/StatisticalTestSuite.hpp"
#include "analysis/SpecialFunctions.hpp"
#include "core/Scheduler.hpp"
#include "utils/AnalysisThresholds.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <stdexcept>

namespace Sequencer::Analysis {

    using namespace SequencerThresholds;

    namespace {

        double clampUnit(double v) {
            return std::min(1.0, std::max(0.0, v));
        }

        // Átfedő, ciklikusan körbeforduló m-bites minták darabszáma (n minta)
        std::vector<size_t> cyclicPatternCounts(const Core::BitSequence& bits, unsigned m) {
            const size_t n = bits.size();
            std::vector<size_t> counts(size_t{1} << m, 0);
            for (size_t i = 0; i < n; ++i) {
                size_t pattern = 0;
                for (unsigned j = 0; j < m; ++j) {
                    pattern = (pattern << 1) | bits[(i + j) % n];
                }
                counts[pattern]++;
            }
            return counts;
        }

        // ψ²_m = (2^m / n) Σ c² - n;  ψ²_0 = 0
        double psiSquared(const Core::BitSequence& bits, unsigned m) {
            if (m == 0) return 0.0;
            const double n = static_cast<double>(bits.size());
            double sum = 0.0;
            for (size_t c : cyclicPatternCounts(bits, m)) {
                sum += static_cast<double>(c) * static_cast<double>(c);
            }
            return (std::ldexp(1.0, static_cast<int>(m)) / n) * sum - n;
        }

        // Φ(m) = Σ π·ln π a ciklikus m-bites mintákon
        double apenPhi(const Core::BitSequence& bits, unsigned m) {
            const double n = static_cast<double>(bits.size());
            double sum = 0.0;
            for (size_t c : cyclicPatternCounts(bits, m)) {
                if (c == 0) continue;
                const double p = static_cast<double>(c) / n;
                sum += p * std::log(p);
            }
            return sum;
        }

        double maxPartialSum(const Core::BitSequence& bits, bool reverse) {
            long long s = 0;
            long long z = 0;
            const size_t n = bits.size();
            for (size_t i = 0; i < n; ++i) {
                const uint8_t bit = reverse ? bits[n - 1 - i] : bits[i];
                s += bit ? 1 : -1;
                z = std::max(z, s < 0 ? -s : s);
            }
            return static_cast<double>(z);
        }

        double cusumPValue(double z, double n) {
            if (z == 0.0) return 1.0;
            const double sqrtN = std::sqrt(n);

            double sum1 = 0.0;
            const long long start1 = static_cast<long long>(std::floor((-n / z + 1.0) / 4.0));
            const long long end1 = static_cast<long long>(std::floor((n / z - 1.0) / 4.0));
            for (long long k = start1; k <= end1; ++k) {
                sum1 += Special::normalCDF(((4.0 * k + 1.0) * z) / sqrtN)
                      - Special::normalCDF(((4.0 * k - 1.0) * z) / sqrtN);
            }

            double sum2 = 0.0;
            const long long start2 = static_cast<long long>(std::floor((-n / z - 3.0) / 4.0));
            const long long end2 = end1;
            for (long long k = start2; k <= end2; ++k) {
                sum2 += Special::normalCDF(((4.0 * k + 3.0) * z) / sqrtN)
                      - Special::normalCDF(((4.0 * k + 1.0) * z) / sqrtN);
            }

            return clampUnit(1.0 - sum1 + sum2);
        }

    } // namespace

    StatisticalTestSuite::StatisticalTestSuite() {
        registerTest(TEST_MONOBIT, &StatisticalTestSuite::frequencyMonobit);
        registerTest(TEST_RUNS, &StatisticalTestSuite::runs);
        registerTest(TEST_BLOCK_FREQUENCY, [](const Core::BitSequence& bits) {
            return blockFrequency(bits, BLOCK_FREQUENCY_M);
        });
        registerTest(TEST_SERIAL, [](const Core::BitSequence& bits) {
            SerialResult r = serial(bits, SERIAL_M);
            return TestResult{TEST_SERIAL, std::min(r.p1, r.p2), r.applicable};
        });
        registerTest(TEST_APPROXIMATE_ENTROPY, [](const Core::BitSequence& bits) {
            return approximateEntropy(bits, APEN_M);
        });
        registerTest(TEST_CUMULATIVE_SUMS, &StatisticalTestSuite::cumulativeSums);
    }

    // --- Individual tests ---

    TestResult StatisticalTestSuite::frequencyMonobit(const Core::BitSequence& bits) {
        const size_t n = bits.size();
        if (n < MONOBIT_MIN_BITS) return TestResult{TEST_MONOBIT, 1.0, false};

        long long s = 0;
        for (uint8_t bit : bits) s += bit ? 1 : -1;
        const double sObs = std::fabs(static_cast<double>(s)) / std::sqrt(static_cast<double>(n));
        return TestResult{TEST_MONOBIT, clampUnit(Special::erfc(sObs / std::sqrt(2.0))), true};
    }

    TestResult StatisticalTestSuite::runs(const Core::BitSequence& bits) {
        const size_t len = bits.size();
        if (len < RUNS_MIN_BITS) return TestResult{TEST_RUNS, 1.0, false};

        const double n = static_cast<double>(len);
        const double n1 = static_cast<double>(std::count(bits.begin(), bits.end(), uint8_t{1}));
        const double n0 = n - n1;

        // Torzított bitsorozatra a teszt nem értelmezett
        const double pi = n1 / n;
        if (std::fabs(pi - 0.5) >= 2.0 / std::sqrt(n)) {
            return TestResult{TEST_RUNS, 1.0, false};
        }

        size_t runCount = 1;
        for (size_t i = 1; i < len; ++i) {
            if (bits[i] != bits[i - 1]) runCount++;
        }

        const double expectedRuns = (2.0 * n0 * n1) / n + 1.0;
        const double variance = (2.0 * n0 * n1 * (2.0 * n0 * n1 - n)) / (n * n * (n - 1.0));
        if (!(variance > 0.0)) return TestResult{TEST_RUNS, 1.0, false};

        const double z = (static_cast<double>(runCount) - expectedRuns) / std::sqrt(variance);
        const double p = 2.0 * (1.0 - Special::normalCDF(std::fabs(z)));
        return TestResult{TEST_RUNS, clampUnit(p), true};
    }

    TestResult StatisticalTestSuite::blockFrequency(const Core::BitSequence& bits, size_t blockSize) {
        if (blockSize == 0) return TestResult{TEST_BLOCK_FREQUENCY, 1.0, false};
        const size_t blocks = bits.size() / blockSize;
        if (blocks < 1) return TestResult{TEST_BLOCK_FREQUENCY, 1.0, false};

        const double M = static_cast<double>(blockSize);
        double chi2 = 0.0;
        for (size_t i = 0; i < blocks; ++i) {
            size_t ones = 0;
            for (size_t j = 0; j < blockSize; ++j) ones += bits[i * blockSize + j];
            const double pi = static_cast<double>(ones) / M;
            chi2 += 4.0 * M * (pi - 0.5) * (pi - 0.5);
        }
        const double p = Special::chiSquareUpperTail(chi2, static_cast<double>(blocks));
        return TestResult{TEST_BLOCK_FREQUENCY, clampUnit(p), true};
    }

    SerialResult StatisticalTestSuite::serial(const Core::BitSequence& bits, unsigned m) {
        if (bits.size() < SERIAL_MIN_BITS || m < 2) return SerialResult{1.0, 1.0, false};

        const double psiM = psiSquared(bits, m);
        const double psiM1 = psiSquared(bits, m - 1);
        const double psiM2 = psiSquared(bits, m - 2);

        const double delta1 = psiM - psiM1;
        // Második statisztika: az (m-1)-bites szint eltérése az (m-2)-bites alapszinttől
        const double delta2 = psiM1 - psiM2;

        // delta1 ~ χ²(2^(m-1)), delta2 ~ χ²(2^(m-2))
        const double p1 = Special::chiSquareUpperTail(delta1, std::ldexp(1.0, static_cast<int>(m) - 1));
        const double p2 = Special::chiSquareUpperTail(delta2, std::ldexp(1.0, static_cast<int>(m) - 2));
        return SerialResult{clampUnit(p1), clampUnit(p2), true};
    }

    TestResult StatisticalTestSuite::approximateEntropy(const Core::BitSequence& bits, unsigned m) {
        if (bits.size() < APEN_MIN_BITS || m < 1) return TestResult{TEST_APPROXIMATE_ENTROPY, 1.0, false};

        const double n = static_cast<double>(bits.size());
        const double apEn = apenPhi(bits, m) - apenPhi(bits, m + 1);
        const double chi2 = 2.0 * n * (std::log(2.0) - apEn);
        const double p = Special::gammaincUpperRegularized(std::ldexp(1.0, static_cast<int>(m) - 1), chi2 / 2.0);
        return TestResult{TEST_APPROXIMATE_ENTROPY, clampUnit(p), true};
    }

    TestResult StatisticalTestSuite::cumulativeSums(const Core::BitSequence& bits) {
        if (bits.size() < CUSUM_MIN_BITS) return TestResult{TEST_CUMULATIVE_SUMS, 1.0, false};

        const double n = static_cast<double>(bits.size());
        const double pForward = cusumPValue(maxPartialSum(bits, false), n);
        const double pBackward = cusumPValue(maxPartialSum(bits, true), n);
        return TestResult{TEST_CUMULATIVE_SUMS, std::min(pForward, pBackward), true};
    }

    // --- Registry ---

    void StatisticalTestSuite::registerTest(const std::string& name, TestFn fn) {
        for (auto& entry : tests) {
            if (entry.first == name) {
                entry.second = std::move(fn);
                return;
            }
        }
        tests.emplace_back(name, std::move(fn));
    }

    const StatisticalTestSuite::TestFn& StatisticalTestSuite::getTest(const std::string& name) const {
        for (const auto& entry : tests) {
            if (entry.first == name) return entry.second;
        }
        throw std::runtime_error("No statistical test registered under name: " + name);
    }

    std::vector<std::string> StatisticalTestSuite::testNames() const {
        std::vector<std::string> names;
        names.reserve(tests.size());
        for (const auto& entry : tests) names.push_back(entry.first);
        return names;
    }

    std::vector<TestResult> StatisticalTestSuite::runAll(const Core::BitSequence& bits) const {
        std::vector<TestResult> results;
        results.reserve(tests.size());
        for (const auto& [name, fn] : tests) {
            TestResult r = fn(bits);
            r.name = name;
            results.push_back(std::move(r));
        }
        return results;
    }

    // --- Battery ---

    BatteryReport StatisticalTestSuite::runBattery(const std::vector<std::string>& tokens) const {
        std::vector<std::vector<TestResult>> perToken;
        perToken.reserve(tokens.size());
        for (const auto& token : tokens) {
            perToken.push_back(runAll(Core::ByteDecoder::rawCharacterBits(token)));
        }
        return summarize(perToken);
    }

    BatteryReport StatisticalTestSuite::runBattery(const std::vector<std::string>& tokens,
                                                   const Core::Scheduler& scheduler) const {
        using IndexedResult = std::pair<size_t, std::vector<TestResult>>;

        std::vector<std::vector<TestResult>> perToken(tokens.size());
        std::vector<bool> filled(tokens.size(), false);

        std::vector<size_t> indices(tokens.size());
        std::iota(indices.begin(), indices.end(), size_t{0});

        auto analysis = scheduler.getAnalysisScheduler();
        auto worker = rxcpp::observe_on_one_worker(analysis);

        rxcpp::observable<>::iterate(indices)
            .flat_map([this, &tokens, worker](size_t index) {
                return rxcpp::observable<>::just(index)
                    .subscribe_on(worker)
                    .map([this, &tokens](size_t i) {
                        return IndexedResult{i, runAll(Core::ByteDecoder::rawCharacterBits(tokens[i]))};
                    });
            }, rxcpp::serialize_one_worker(analysis))
            .as_blocking()
            .subscribe(
                [&perToken, &filled](IndexedResult result) {
                    perToken[result.first] = std::move(result.second);
                    filled[result.first] = true;
                },
                [](std::exception_ptr ep) {
                    // A hiányzó indexeket alább szekvenciálisan pótoljuk
                    try {
                        if (ep) std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        std::cerr << "[StatisticalTestSuite] Parallel battery fault, falling back: "
                                  << e.what() << std::endl;
                    }
                });

        for (size_t i = 0; i < tokens.size(); ++i) {
            if (!filled[i]) {
                perToken[i] = runAll(Core::ByteDecoder::rawCharacterBits(tokens[i]));
            }
        }
        return summarize(perToken);
    }

    // --- Aggregation ---

    double StatisticalTestSuite::medianOf(std::vector<double> values) {
        if (values.empty()) return 1.0;
        std::sort(values.begin(), values.end());
        return values[values.size() / 2];
    }

    AggregatedTest StatisticalTestSuite::aggregate(const std::string& name,
                                                   const std::vector<TestResult>& results,
                                                   double alpha) {
        AggregatedTest agg;
        agg.name = name;
        agg.pValues.reserve(results.size());

        std::vector<double> applicable;
        for (const auto& r : results) {
            if (r.applicable) {
                applicable.push_back(r.pValue);
                agg.pValues.emplace_back(r.pValue);
                if (r.pValue >= alpha) agg.passCount++;
            } else {
                agg.pValues.emplace_back(std::nullopt);
            }
        }

        agg.applicableCount = applicable.size();
        if (applicable.empty()) {
            // Nincs bizonyíték hibára: passRate = 1, medianP = 1
            agg.passRate = 1.0;
            agg.medianP = 1.0;
            return agg;
        }

        agg.passRate = static_cast<double>(agg.passCount) / static_cast<double>(agg.applicableCount);
        agg.medianP = medianOf(std::move(applicable));
        return agg;
    }

    std::string StatisticalTestSuite::verdictFor(double aggregatePassRate, double overallMedianP) {
        if (aggregatePassRate >= LOOKS_RANDOM_PASS_RATE && overallMedianP >= LOOKS_RANDOM_MEDIAN_P) {
            return "Looks Random";
        }
        if (aggregatePassRate >= MOSTLY_RANDOM_PASS_RATE && overallMedianP >= MOSTLY_RANDOM_MEDIAN_P) {
            return "Mostly Random";
        }
        return "Shows Patterns";
    }

    BatteryReport StatisticalTestSuite::summarize(const std::vector<std::vector<TestResult>>& perToken) const {
        BatteryReport report;
        report.alpha = BATTERY_ALPHA;

        size_t totalApplicable = 0;
        size_t totalPassed = 0;
        std::vector<double> medians;

        for (size_t t = 0; t < tests.size(); ++t) {
            std::vector<TestResult> column;
            column.reserve(perToken.size());
            for (const auto& row : perToken) {
                column.push_back(row[t]);
            }

            AggregatedTest agg = aggregate(tests[t].first, column, BATTERY_ALPHA);
            totalApplicable += agg.applicableCount;
            totalPassed += agg.passCount;
            if (agg.applicableCount > 0) medians.push_back(agg.medianP);
            report.tests.push_back(std::move(agg));
        }

        report.aggregatePassRate = totalApplicable > 0
            ? static_cast<double>(totalPassed) / static_cast<double>(totalApplicable)
            : 1.0;
        report.overallMedianP = medianOf(std::move(medians));
        report.verdict = verdictFor(report.aggregatePassRate, report.overallMedianP);
        return report;
    }

} // namespace Sequencer::Analysis
