// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "analysis/EntropyEstimators.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>

namespace Sequencer::Analysis {

    namespace {

        template <typename Key>
        std::pair<Key, size_t> mostFrequent(const std::map<Key, size_t>& frequencies) {
            Key best{};
            size_t maxCount = 0;
            for (auto const& [val, count] : frequencies) {
                if (count > maxCount) {
                    maxCount = count;
                    best = val;
                }
            }
            return {best, maxCount};
        }

        std::string hexByte(uint8_t value) {
            char buf[3];
            std::snprintf(buf, sizeof(buf), "%02x", value);
            return std::string(buf);
        }

    } // namespace

    double EntropyEstimators::shannonCharEntropy(const std::vector<std::string>& tokens) {
        std::map<unsigned char, size_t> frequencies;
        size_t totalChars = 0;
        for (const auto& token : tokens) {
            for (unsigned char c : token) {
                frequencies[c]++;
                totalChars++;
            }
        }
        if (totalChars == 0) {
            return 0.0;
        }

        double entropy = 0.0;
        for (auto const& [val, count] : frequencies) {
            double p = static_cast<double>(count) / totalChars;
            entropy -= p * std::log2(p);
        }
        return entropy;
    }

    double EntropyEstimators::shannonBitEntropy(uint64_t onesCount, uint64_t totalBits) {
        if (totalBits == 0) return 0.0;
        const double p1 = static_cast<double>(onesCount) / totalBits;
        const double p0 = 1.0 - p1;
        if (p0 <= 0.0 || p1 <= 0.0) return 0.0;
        return -(p0 * std::log2(p0) + p1 * std::log2(p1));
    }

    double EntropyEstimators::minEntropyWholeToken(const std::vector<std::string>& tokens) {
        if (tokens.empty()) return 0.0;

        std::map<std::string, size_t> frequencies;
        for (const auto& token : tokens) {
            frequencies[token]++;
        }
        const size_t maxCount = mostFrequent(frequencies).second;
        return -std::log2(static_cast<double>(maxCount) / tokens.size());
    }

    double EntropyEstimators::minEntropyPerBit(uint64_t onesCount, uint64_t totalBits) {
        if (totalBits == 0) return 0.0;
        const double p1 = static_cast<double>(onesCount) / totalBits;
        const double pMax = std::max(p1, 1.0 - p1);
        return pMax > 0.0 ? -std::log2(pMax) : 0.0;
    }

    BitCounts EntropyEstimators::countBits(const std::vector<Core::ByteSequence>& byteTokens) {
        BitCounts counts;
        for (const auto& bytes : byteTokens) {
            for (uint8_t b : bytes) {
                for (int i = 0; i < 8; ++i) {
                    if ((b >> i) & 1) counts.onesCount++;
                    else counts.zerosCount++;
                }
            }
        }
        counts.totalBits = counts.onesCount + counts.zerosCount;
        counts.bitEntropy = shannonBitEntropy(counts.onesCount, counts.totalBits);
        return counts;
    }

    PerPositionResult EntropyEstimators::perPositionMinEntropy(const std::vector<Core::ByteSequence>& byteTokens) {
        PerPositionResult result;
        size_t maxLen = 0;
        for (const auto& bytes : byteTokens) {
            maxLen = std::max(maxLen, bytes.size());
        }

        for (size_t pos = 0; pos < maxLen; ++pos) {
            std::map<uint8_t, size_t> frequencies;
            size_t contributors = 0;
            for (const auto& bytes : byteTokens) {
                if (pos >= bytes.size()) continue;
                contributors++;
                frequencies[bytes[pos]]++;
            }
            if (contributors == 0) continue;

            auto [value, maxCount] = mostFrequent(frequencies);
            const double maxProb = static_cast<double>(maxCount) / contributors;

            PositionEntropy entry;
            entry.position = pos;
            entry.entropy = -std::log2(maxProb);
            entry.mostCommon = hexByte(value);
            entry.frequency = maxProb;
            entry.coverage = static_cast<double>(contributors) / byteTokens.size();

            result.totalEntropy += entry.entropy;
            result.positions.push_back(std::move(entry));
        }
        return result;
    }

    std::vector<RawPositionEntropy> EntropyEstimators::perPositionRawEntropy(const std::vector<std::string>& tokens) {
        std::vector<RawPositionEntropy> results;
        size_t maxLen = 0;
        for (const auto& token : tokens) {
            maxLen = std::max(maxLen, token.size());
        }

        for (size_t pos = 0; pos < maxLen; ++pos) {
            std::map<char, size_t> frequencies;
            size_t contributors = 0;
            for (const auto& token : tokens) {
                if (pos >= token.size()) continue;
                contributors++;
                frequencies[token[pos]]++;
            }
            if (contributors == 0) continue;

            auto [ch, maxCount] = mostFrequent(frequencies);
            const double maxProb = static_cast<double>(maxCount) / contributors;
            const double entropy = -std::log2(maxProb);

            const size_t alphabetSize = std::max<size_t>(1, frequencies.size());
            const double maxAchievable = std::log2(static_cast<double>(std::min(contributors, alphabetSize)));

            RawPositionEntropy entry;
            entry.position = pos;
            entry.entropy = entropy;
            entry.normalizedEntropy = maxAchievable > 0.0
                ? std::min(1.0, std::max(0.0, entropy / maxAchievable))
                : 0.0;
            entry.mostCommonChar = std::string(1, ch);
            entry.frequency = maxProb;
            entry.coverage = static_cast<double>(contributors) / tokens.size();
            results.push_back(std::move(entry));
        }
        return results;
    }

} // namespace Sequencer::Analysis
