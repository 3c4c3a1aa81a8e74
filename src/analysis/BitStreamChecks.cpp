// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "analysis/BitStreamChecks.hpp"
#include "analysis/SpecialFunctions.hpp"
#include "analysis/StatisticalTestSuite.hpp"
#include "utils/AnalysisThresholds.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace Sequencer::Analysis {

    namespace {

        // LZ78 trie csomópont; inDict: a csúcsig tartó bitsorozat szótárelem
        struct LzNode {
            std::array<int, 2> child{-1, -1};
            bool inDict = false;
        };

        int childOf(std::vector<LzNode>& nodes, int node, uint8_t bit) {
            if (nodes[node].child[bit] < 0) {
                nodes.emplace_back();
                nodes[node].child[bit] = static_cast<int>(nodes.size() - 1);
            }
            return nodes[node].child[bit];
        }

    } // namespace

    double BitStreamChecks::chiSquaredPValue(const Core::BitSequence& bits) {
        if (bits.size() < SequencerThresholds::POOLED_MIN_BITS) return 1.0;

        const double n = static_cast<double>(bits.size());
        const double ones = static_cast<double>(std::count(bits.begin(), bits.end(), uint8_t{1}));
        const double zeros = n - ones;
        const double expected = n / 2.0;

        const double chiSq = ((zeros - expected) * (zeros - expected) +
                              (ones - expected) * (ones - expected)) / expected;
        return std::min(1.0, std::max(0.0, Special::chiSquareUpperTail(chiSq, 1.0)));
    }

    double BitStreamChecks::serialCorrelation(const Core::BitSequence& bits) {
        if (bits.size() < 2) return 0.0;

        const size_t n = bits.size() - 1;
        double sum1 = 0.0, sum2 = 0.0, sum12 = 0.0;
        for (size_t i = 0; i < n; ++i) {
            sum1 += bits[i];
            sum2 += bits[i + 1];
            sum12 += static_cast<double>(bits[i] * bits[i + 1]);
        }

        const double mean1 = sum1 / n;
        const double mean2 = sum2 / n;
        const double covariance = (sum12 / n) - (mean1 * mean2);

        double var1 = 0.0, var2 = 0.0;
        for (size_t i = 0; i < n; ++i) {
            var1 += (bits[i] - mean1) * (bits[i] - mean1);
            var2 += (bits[i + 1] - mean2) * (bits[i + 1] - mean2);
        }
        var1 /= n;
        var2 /= n;

        const double stdDev = std::sqrt(var1 * var2);
        return stdDev > 0.0 ? covariance / stdDev : 0.0;
    }

    LzEstimate BitStreamChecks::lzEntropyEstimate(const Core::BitSequence& bits) {
        if (bits.size() < SequencerThresholds::POOLED_MIN_BITS) return LzEstimate{0.0, false};

        std::vector<LzNode> nodes(1);
        size_t dictionarySize = 1;
        double compressedLength = 0.0;
        int current = 0;

        for (uint8_t bit : bits) {
            const int next = childOf(nodes, current, bit);
            if (nodes[next].inDict) {
                current = next;
                continue;
            }
            nodes[next].inDict = true;
            dictionarySize++;
            compressedLength += std::ceil(std::log2(static_cast<double>(dictionarySize)));
            current = childOf(nodes, 0, bit);
        }

        return LzEstimate{compressedLength / static_cast<double>(bits.size()), true};
    }

    double BitStreamChecks::weightedSerialCorrelation(const std::vector<Core::ByteSequence>& byteTokens) {
        double weightedAbs = 0.0;
        double totalBits = 0.0;
        for (const auto& bytes : byteTokens) {
            auto bits = Core::ByteDecoder::decodedBits(bytes);
            if (bits.size() < 2) continue;
            weightedAbs += std::fabs(serialCorrelation(bits)) * bits.size();
            totalBits += bits.size();
        }
        return totalBits > 0.0 ? weightedAbs / totalBits : 0.0;
    }

    PooledChecks BitStreamChecks::evaluate(const std::vector<Core::ByteSequence>& byteTokens,
                                           double shannonEntropyPerBit) {
        PooledChecks checks;

        std::vector<double> chiPs;
        std::vector<double> runsPs;
        Core::BitSequence allBits;
        for (const auto& bytes : byteTokens) {
            auto bits = Core::ByteDecoder::decodedBits(bytes);
            allBits.insert(allBits.end(), bits.begin(), bits.end());
            if (bits.size() < SequencerThresholds::POOLED_MIN_BITS) continue;

            chiPs.push_back(chiSquaredPValue(bits));
            TestResult runs = StatisticalTestSuite::runs(bits);
            if (runs.applicable) runsPs.push_back(runs.pValue);
        }

        checks.chiSquaredPValue = StatisticalTestSuite::medianOf(std::move(chiPs));
        checks.runsTestPValue = StatisticalTestSuite::medianOf(std::move(runsPs));
        checks.serialCorrelation = weightedSerialCorrelation(byteTokens);

        LzEstimate lz = lzEntropyEstimate(allBits);
        checks.estimatedEntropyRate = lz.entropyRate;
        checks.lzApplicable = lz.applicable;
        checks.lzCompressionRatio = shannonEntropyPerBit > 1e-9 ? lz.entropyRate / shannonEntropyPerBit : 1.0;
        return checks;
    }

} // namespace Sequencer::Analysis
