// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "analysis/SeverityClassifier.hpp"
#include "utils/AnalysisThresholds.hpp"
#include "utils/StringUtils.hpp"

#include <cmath>

namespace Sequencer::Analysis {

    using namespace SequencerThresholds;
    using SequencerUtils::formatFixed;

    const char* toString(SecurityRating rating) {
        switch (rating) {
            case SecurityRating::CRITICAL:  return "CRITICAL";
            case SecurityRating::WARNING:   return "WARNING";
            case SecurityRating::GOOD:      return "GOOD";
            case SecurityRating::EXCELLENT: return "EXCELLENT";
        }
        return "CRITICAL";
    }

    bool SeverityClassifier::severeFailure(const ClassifierInput& input) {
        if (input.totalBits < POOLED_MIN_BITS) return false;
        return std::fabs(input.serialCorrelation) > SERIAL_CORR_ISSUE ||
               input.chiSquaredPValue < SEVERE_FAILURE_P ||
               input.runsTestPValue < SEVERE_FAILURE_P;
    }

    SecurityRating SeverityClassifier::rate(double effectiveBits, bool severe,
                                            size_t warningCount, size_t strengthCount) {
        if (effectiveBits < CRITICAL_BITS || (effectiveBits < VULNERABLE_BITS && severe)) {
            return SecurityRating::CRITICAL;
        }
        if (warningCount > 0 || effectiveBits < RECOMMENDED_MIN_BITS || severe) {
            return SecurityRating::WARNING;
        }
        if (strengthCount >= EXCELLENT_MIN_STRENGTHS) {
            return SecurityRating::EXCELLENT;
        }
        return SecurityRating::GOOD;
    }

    SecurityRating SeverityClassifier::quickRating(double duplicatePercentage, bool sequential,
                                                   bool timestamps, int predictabilityScore) {
        if (duplicatePercentage > DUPLICATE_ISSUE_PCT || sequential || timestamps) {
            return SecurityRating::CRITICAL;
        }
        if (duplicatePercentage > DUPLICATE_WARNING_PCT || predictabilityScore > PREDICTABILITY_WARNING) {
            return SecurityRating::WARNING;
        }
        return SecurityRating::GOOD;
    }

    SecurityVerdict SeverityClassifier::classify(const ClassifierInput& input) {
        SecurityVerdict verdict;
        verdict.effectiveBits = input.effectiveSecurityBits;
        verdict.recommendedMinimum = RECOMMENDED_MIN_BITS;

        auto& issues = verdict.issues;
        auto& warnings = verdict.warnings;
        auto& strengths = verdict.strengths;

        // --- Effective bits ---
        const std::string bits = formatFixed(input.effectiveSecurityBits, 1);
        if (input.effectiveSecurityBits < CRITICAL_BITS) {
            issues.push_back("CRITICAL: Effective security is only " + bits +
                             " bits (minimum 128 bits recommended). Tokens are easily guessable.");
        } else if (input.effectiveSecurityBits < VULNERABLE_BITS) {
            issues.push_back("Effective security is " + bits +
                             " bits. Vulnerable to brute-force attacks (128+ bits recommended).");
        } else if (input.effectiveSecurityBits < RECOMMENDED_MIN_BITS) {
            warnings.push_back("Effective security is " + bits +
                               " bits. Below recommended 128 bits for session tokens.");
        } else {
            strengths.push_back("Strong effective security: " + bits + " bits (exceeds 128-bit minimum).");
        }

        // --- Min-entropy ---
        const std::string minEnt = formatFixed(input.minEntropyPerBit, 3);
        if (input.minEntropyPerBit < MIN_ENTROPY_ISSUE) {
            issues.push_back("Very low min-entropy per bit (" + minEnt + "). Tokens have predictable patterns.");
        } else if (input.minEntropyPerBit < MIN_ENTROPY_WARNING) {
            warnings.push_back("Low min-entropy per bit (" + minEnt + "). Some predictability present.");
        } else if (input.minEntropyPerBit > MIN_ENTROPY_STRENGTH) {
            strengths.push_back("Excellent min-entropy per bit (" + minEnt + ").");
        }

        // --- Shannon (karakter) ---
        const std::string shannon = formatFixed(input.shannonCharEntropy, 2);
        if (input.shannonCharEntropy < SHANNON_WARNING) {
            warnings.push_back("Low Shannon entropy (" + shannon + "). May indicate limited character set.");
        } else if (input.shannonCharEntropy >= SHANNON_STRENGTH) {
            strengths.push_back("Good Shannon entropy (" + shannon + ").");
        }

        const bool sufficientBits = input.totalBits >= POOLED_MIN_BITS;

        // --- Chi-squared ---
        const std::string chiP = formatFixed(input.chiSquaredPValue, 4);
        if (sufficientBits && input.chiSquaredPValue < AUX_FAILURE_ALPHA) {
            issues.push_back("Chi-squared test failed (p=" + chiP + "). Bit distribution is non-uniform.");
        } else if (sufficientBits && input.chiSquaredPValue < AUX_WARNING_ALPHA) {
            warnings.push_back("Chi-squared test marginal (p=" + chiP + "). Slight non-uniformity detected.");
        } else {
            strengths.push_back("Chi-squared test passed (p=" + chiP + "). Uniform bit distribution.");
        }

        // --- Serial correlation ---
        const double absCorr = std::fabs(input.serialCorrelation);
        const std::string corr = formatFixed(input.serialCorrelation, 3);
        if (absCorr > SERIAL_CORR_ISSUE) {
            issues.push_back("High serial correlation (" + corr + "). Consecutive bits are dependent.");
        } else if (absCorr > SERIAL_CORR_WARNING) {
            warnings.push_back("Moderate serial correlation (" + corr + "). Some bit dependencies present.");
        } else {
            strengths.push_back("Low serial correlation (" + corr + "). Bits are independent.");
        }

        // --- Runs ---
        const std::string runsP = formatFixed(input.runsTestPValue, 4);
        if (sufficientBits && input.runsTestPValue < AUX_FAILURE_ALPHA) {
            issues.push_back("Runs test failed (p=" + runsP + "). Non-random run patterns detected.");
        } else if (sufficientBits && input.runsTestPValue < AUX_WARNING_ALPHA) {
            warnings.push_back("Runs test marginal (p=" + runsP + "). Possible run pattern issues.");
        } else {
            strengths.push_back("Runs test passed (p=" + runsP + "). Random run distribution.");
        }

        // --- LZ78 ---
        const std::string lz = formatFixed(input.lzCompressionRatio, 2);
        if (sufficientBits && input.lzCompressionRatio > LZ_ISSUE_RATIO) {
            issues.push_back("High LZ compression ratio (" + lz + "). Structure detected in data.");
        } else if (sufficientBits && input.lzCompressionRatio > LZ_WARNING_RATIO) {
            warnings.push_back("Elevated LZ compression ratio (" + lz + "). Some structure present.");
        } else {
            strengths.push_back("Good LZ compression ratio (" + lz + "). Minimal structure.");
        }

        // --- Collisions ---
        if (static_cast<double>(input.nearDuplicates) > static_cast<double>(input.sampleCount) * NEAR_DUPLICATE_FRACTION) {
            warnings.push_back(std::to_string(input.nearDuplicates) +
                               " near-duplicate tokens found (Hamming distance <= 2).");
        } else if (input.nearDuplicates == 0) {
            strengths.push_back("No near-duplicate tokens (Hamming distance > 2).");
        }

        const std::string dup = formatFixed(input.duplicatePercentage, 1);
        if (input.duplicatePercentage > DUPLICATE_ISSUE_PCT) {
            issues.push_back(dup + "% exact duplicate tokens. Poor randomness.");
        } else if (input.duplicatePercentage > DUPLICATE_WARNING_PCT) {
            warnings.push_back(dup + "% exact duplicate tokens.");
        } else if (input.duplicatePercentage < DUPLICATE_STRENGTH_PCT) {
            strengths.push_back("Very few exact duplicates (" + dup + "%).");
        }

        // --- Patterns ---
        if (input.sequential) issues.push_back("Sequential pattern detected. Tokens are predictable.");
        else strengths.push_back("No sequential patterns detected.");

        if (input.timestamps) issues.push_back("Timestamp-based tokens detected. Highly predictable.");

        const std::string score = std::to_string(input.predictabilityScore) + "/100";
        if (input.predictabilityScore > PREDICTABILITY_ISSUE) {
            issues.push_back("High predictability score (" + score + ").");
        } else if (input.predictabilityScore > PREDICTABILITY_WARNING) {
            warnings.push_back("Moderate predictability score (" + score + ").");
        } else {
            strengths.push_back("Low predictability score (" + score + ").");
        }

        warnings.insert(warnings.end(), input.extraWarnings.begin(), input.extraWarnings.end());

        verdict.overallRating = rate(input.effectiveSecurityBits, severeFailure(input),
                                     warnings.size(), strengths.size());
        return verdict;
    }

} // namespace Sequencer::Analysis
