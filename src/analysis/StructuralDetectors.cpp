// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "analysis/StructuralDetectors.hpp"
#include "utils/AnalysisThresholds.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <set>
#include <unordered_set>

namespace Sequencer::Analysis {

    using namespace SequencerThresholds;

    std::optional<int64_t> StructuralDetectors::parseInteger(const std::string& token) {
        if (token.empty()) return std::nullopt;

        int64_t value = 0;
        const char* first = token.data();
        const char* last = token.data() + token.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            return std::nullopt;
        }
        return value;
    }

    SequentialResult StructuralDetectors::detectSequential(const std::vector<std::string>& tokens) {
        SequentialResult result;
        if (tokens.size() < 2) return result;

        for (size_t i = 1; i < tokens.size(); ++i) {
            auto prev = parseInteger(tokens[i - 1]);
            auto curr = parseInteger(tokens[i]);
            if (prev && curr && *prev < INT64_MAX && *curr == *prev + 1) {
                result.count++;
            }
        }

        const double pairs = static_cast<double>(tokens.size() - 1);
        result.isSequential = static_cast<double>(result.count) > pairs * SEQUENTIAL_FRACTION;
        return result;
    }

    bool StructuralDetectors::detectTimestamps(const std::vector<std::string>& tokens) {
        if (tokens.empty()) return false;

        size_t timestampCount = 0;
        for (const auto& token : tokens) {
            if (token.size() < TIMESTAMP_MIN_DIGITS || token.size() > TIMESTAMP_MAX_DIGITS) continue;
            bool allDigits = std::all_of(token.begin(), token.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; });
            if (!allDigits) continue;

            auto value = parseInteger(token);
            if (value && *value >= TIMESTAMP_MIN && *value <= TIMESTAMP_MAX) {
                timestampCount++;
            }
        }
        return static_cast<double>(timestampCount) > static_cast<double>(tokens.size()) * TIMESTAMP_FRACTION;
    }

    PrefixSuffix StructuralDetectors::commonPrefixSuffix(const std::vector<std::string>& tokens) {
        PrefixSuffix result;
        if (tokens.empty()) return result;

        size_t prefixLen = tokens.front().size();
        size_t suffixLen = tokens.front().size();
        const std::string& first = tokens.front();

        for (const auto& token : tokens) {
            size_t i = 0;
            while (i < prefixLen && i < token.size() && first[i] == token[i]) i++;
            prefixLen = i;

            size_t j = 0;
            while (j < suffixLen && j < token.size() &&
                   first[first.size() - 1 - j] == token[token.size() - 1 - j]) j++;
            suffixLen = j;
        }

        result.prefix = first.substr(0, prefixLen);
        result.suffix = first.substr(first.size() - suffixLen);
        return result;
    }

    size_t StructuralDetectors::hammingDistance(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return std::max(a.size(), b.size());

        size_t distance = 0;
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) distance++;
        }
        return distance;
    }

    CollisionResult StructuralDetectors::analyzeCollisions(const std::vector<std::string>& tokens) {
        CollisionResult result;
        if (tokens.size() < 2) return result;

        std::unordered_set<std::string> seen;
        for (const auto& token : tokens) {
            if (!seen.insert(token).second) {
                result.exactDuplicates++;
            }
        }

        const size_t n = tokens.size();
        const size_t step = (n + COLLISION_SAMPLE_TARGET - 1) / COLLISION_SAMPLE_TARGET;
        double totalDistance = 0.0;

        for (size_t i = 0; i < n; i += step) {
            for (size_t j = i + step; j < n; j += step) {
                const size_t dist = hammingDistance(tokens[i], tokens[j]);
                totalDistance += static_cast<double>(dist);
                result.comparisons++;
                if (dist > 0 && dist <= NEAR_DUPLICATE_MAX_DIST) {
                    result.nearDuplicates++;
                }
            }
        }

        result.averageHammingDistance = result.comparisons > 0
            ? totalDistance / static_cast<double>(result.comparisons)
            : 0.0;
        return result;
    }

    CharacterAnalysis StructuralDetectors::analyzeCharacters(const std::vector<std::string>& tokens) {
        CharacterAnalysis result;
        std::set<unsigned char> charSet;

        for (const auto& token : tokens) {
            for (unsigned char c : token) {
                charSet.insert(c);
                if (std::isalpha(c)) result.alphabetic++;
                else if (std::isdigit(c)) result.numeric++;
                else result.special++;
            }
        }

        for (unsigned char c : charSet) {
            result.charset += static_cast<char>(c);
        }

        if (!result.charset.empty()) {
            result.hexadecimal = std::all_of(result.charset.begin(), result.charset.end(),
                                             [](unsigned char c) { return std::isxdigit(c) != 0; });
            result.base64 = std::all_of(result.charset.begin(), result.charset.end(),
                                        [](unsigned char c) {
                                            return std::isalnum(c) || c == '+' || c == '/' || c == '=';
                                        });
        }
        return result;
    }

    int StructuralDetectors::predictabilityScore(bool sequential, bool timestamps,
                                                 double duplicatePercentage, size_t prefixLength) {
        int score = 0;
        if (sequential) score += SCORE_SEQUENTIAL;
        if (timestamps) score += SCORE_TIMESTAMP;
        if (duplicatePercentage > DUPLICATE_ISSUE_PCT) score += SCORE_DUPLICATES;
        if (prefixLength > COMMON_PREFIX_MIN_LEN) score += SCORE_COMMON_PREFIX;
        return score;
    }

} // namespace Sequencer::Analysis
