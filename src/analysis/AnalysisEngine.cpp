// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "analysis/AnalysisEngine.hpp"
#include "analysis/BitStreamChecks.hpp"
#include "analysis/SeverityClassifier.hpp"
#include "core/ByteDecoder.hpp"
#include "core/Scheduler.hpp"
#include "utils/AnalysisThresholds.hpp"
#include "utils/StringUtils.hpp"

#include <algorithm>
#include <numeric>
#include <unordered_map>

namespace Sequencer::Analysis {

    using namespace SequencerThresholds;
    using Core::CaptureStatus;
    using Core::TokenCapture;

    namespace {

        bool isFailure(const TokenCapture& capture) {
            return capture.status == CaptureStatus::RequestFailed ||
                   capture.status == CaptureStatus::ParseError;
        }

        SummaryStats summarize(const std::vector<std::string>& tokens) {
            SummaryStats summary;
            summary.totalSamples = tokens.size();

            std::unordered_map<std::string, size_t> counts;
            for (const auto& token : tokens) counts[token]++;

            summary.uniqueValues = counts.size();
            summary.duplicateCount = tokens.size() - counts.size();

            // Az ismétlődő értékű minták aránya
            size_t repeated = 0;
            for (const auto& [value, count] : counts) {
                if (count > 1) repeated += count;
            }
            summary.duplicatePercentage = 100.0 * static_cast<double>(repeated) / static_cast<double>(tokens.size());

            summary.entropy = EntropyEstimators::shannonCharEntropy(tokens);

            size_t totalLength = 0;
            summary.minLength = tokens.front().size();
            summary.maxLength = tokens.front().size();
            for (const auto& token : tokens) {
                totalLength += token.size();
                summary.minLength = std::min(summary.minLength, token.size());
                summary.maxLength = std::max(summary.maxLength, token.size());
            }
            summary.averageLength = static_cast<double>(totalLength) / static_cast<double>(tokens.size());
            return summary;
        }

    } // namespace

    AnalysisEngine::AnalysisEngine() = default;

    AnalysisEngine::AnalysisEngine(const Core::Scheduler& schedulerRef)
        : scheduler(&schedulerRef) {
    }

    AnalysisResult AnalysisEngine::degradedReport(const std::vector<TokenCapture>& captures) {
        const size_t notFound = std::count_if(captures.begin(), captures.end(),
            [](const TokenCapture& c) { return c.status == CaptureStatus::NotFound; });
        const size_t failed = std::count_if(captures.begin(), captures.end(), isFailure);

        std::string tag = TAG_NO_DATA;
        std::string message = "No valid tokens could be extracted from responses.";

        if (notFound == captures.size()) {
            tag = TAG_PARAMETER_NOT_FOUND;
            message = "Parameter not found in any of the " + std::to_string(captures.size()) +
                      " responses. Please verify the parameter name is correct.";
        } else if (failed > 0) {
            tag = TAG_REQUEST_FAILED;
            message = "All " + std::to_string(failed) +
                      " requests failed. Check network connectivity, request configuration, host/port or TLS settings.";
        }

        AnalysisResult result;
        result.summary.totalSamples = captures.size();
        result.security.overallRating = SecurityRating::CRITICAL;
        result.security.issues.push_back(tag + ":" + message);
        result.security.effectiveBits = 0.0;
        result.security.recommendedMinimum = RECOMMENDED_MIN_BITS;
        result.entropyAnalysis.chiSquaredPValue = 0.0;
        result.entropyAnalysis.runsTestPValue = 0.0;
        result.entropyAnalysis.lzCompressionRatio = 0.0;
        return result;
    }

    AnalysisResult AnalysisEngine::analyze(const std::vector<TokenCapture>& captures,
                                           const AnalysisOptions& options) const {
        std::vector<std::string> tokens;
        tokens.reserve(captures.size());
        for (const auto& capture : captures) {
            if (capture.isValidToken()) tokens.push_back(capture.token);
        }

        if (tokens.empty()) {
            return degradedReport(captures);
        }

        std::vector<std::string> partialFailures;
        const size_t failed = std::count_if(captures.begin(), captures.end(), isFailure);
        if (failed > 0) {
            const double successRate = 100.0 * static_cast<double>(tokens.size()) / static_cast<double>(captures.size());
            partialFailures.push_back(std::to_string(failed) + " of " + std::to_string(captures.size()) +
                                      " requests failed (" + SequencerUtils::formatFixed(successRate, 1) +
                                      "% success rate). Results may not be statistically reliable.");
        }

        AnalysisResult result;
        result.summary = summarize(tokens);

        // --- Patterns ---
        SequentialResult sequential = StructuralDetectors::detectSequential(tokens);
        PrefixSuffix affixes = StructuralDetectors::commonPrefixSuffix(tokens);
        result.patterns.sequential = sequential.isSequential;
        result.patterns.sequentialCount = sequential.count;
        result.patterns.hasTimestamps = StructuralDetectors::detectTimestamps(tokens);
        result.patterns.commonPrefix = affixes.prefix;
        result.patterns.commonSuffix = affixes.suffix;
        result.patterns.predictabilityScore = StructuralDetectors::predictabilityScore(
            sequential.isSequential, result.patterns.hasTimestamps,
            result.summary.duplicatePercentage, affixes.prefix.size());

        result.characterAnalysis = StructuralDetectors::analyzeCharacters(tokens);

        if (!options.securityAnalysis) {
            result.security.recommendedMinimum = RECOMMENDED_MIN_BITS;
            result.security.warnings = partialFailures;
            result.security.overallRating = SeverityClassifier::quickRating(
                result.summary.duplicatePercentage, result.patterns.sequential,
                result.patterns.hasTimestamps, result.patterns.predictabilityScore);
            return result;
        }

        runSecurityAnalysis(tokens, options, result);

        ClassifierInput input;
        input.effectiveSecurityBits = result.entropyAnalysis.effectiveSecurityBits;
        input.minEntropyPerBit = result.entropyAnalysis.minEntropyPerBit;
        input.shannonCharEntropy = result.summary.entropy;
        input.totalBits = result.bitAnalysis.totalBits;
        input.chiSquaredPValue = result.entropyAnalysis.chiSquaredPValue;
        input.serialCorrelation = result.entropyAnalysis.serialCorrelation;
        input.runsTestPValue = result.entropyAnalysis.runsTestPValue;
        input.lzCompressionRatio = result.entropyAnalysis.lzCompressionRatio;
        input.nearDuplicates = result.collisionAnalysis.nearDuplicates;
        input.sampleCount = tokens.size();
        input.duplicatePercentage = result.summary.duplicatePercentage;
        input.sequential = result.patterns.sequential;
        input.timestamps = result.patterns.hasTimestamps;
        input.predictabilityScore = result.patterns.predictabilityScore;
        input.extraWarnings = std::move(partialFailures);

        result.security = SeverityClassifier::classify(input);
        return result;
    }

    void AnalysisEngine::runSecurityAnalysis(const std::vector<std::string>& tokens,
                                             const AnalysisOptions& options,
                                             AnalysisResult& result) const {
        auto& entropy = result.entropyAnalysis;

        // --- Decoding ---
        std::vector<Core::ByteSequence> byteTokens;
        byteTokens.reserve(tokens.size());
        for (const auto& token : tokens) {
            Core::DecodedToken decoded = Core::ByteDecoder::decode(token);
            entropy.encodingHistogram[Core::toString(decoded.encoding)]++;
            byteTokens.push_back(std::move(decoded.bytes));
        }

        result.bitAnalysis = EntropyEstimators::countBits(byteTokens);
        const uint64_t totalBits = result.bitAnalysis.totalBits;
        const double avgBitsPerToken = static_cast<double>(totalBits) / static_cast<double>(tokens.size());

        // --- Entropy estimators ---
        entropy.shannonEntropyPerBit = EntropyEstimators::shannonBitEntropy(result.bitAnalysis.onesCount, totalBits);
        entropy.minEntropyPerBit = EntropyEstimators::minEntropyPerBit(result.bitAnalysis.onesCount, totalBits);
        entropy.minEntropyWholeToken = EntropyEstimators::minEntropyWholeToken(tokens);

        PerPositionResult perPosition = EntropyEstimators::perPositionMinEntropy(byteTokens);
        entropy.perPositionTotalEntropy = perPosition.totalEntropy;
        entropy.perPositionMinEntropy = avgBitsPerToken > 0.0 ? perPosition.totalEntropy / avgBitsPerToken : 0.0;
        entropy.perPositionData = std::move(perPosition.positions);
        entropy.perPositionRawData = EntropyEstimators::perPositionRawEntropy(tokens);

        const size_t firstLength = byteTokens.front().size();
        entropy.fixedLength = std::all_of(byteTokens.begin(), byteTokens.end(),
            [firstLength](const Core::ByteSequence& b) { return b.size() == firstLength; });

        // --- Effective security bits: a becslők minimuma ---
        std::vector<double> estimators;
        estimators.push_back(entropy.minEntropyPerBit * avgBitsPerToken);
        if (entropy.fixedLength) estimators.push_back(entropy.perPositionTotalEntropy);
        if (result.summary.duplicateCount > 0) estimators.push_back(entropy.minEntropyWholeToken);
        entropy.effectiveSecurityBits = *std::min_element(estimators.begin(), estimators.end());

        // --- Pooled checks ---
        PooledChecks pooled = BitStreamChecks::evaluate(byteTokens, entropy.shannonEntropyPerBit);
        entropy.chiSquaredPValue = pooled.chiSquaredPValue;
        entropy.serialCorrelation = pooled.serialCorrelation;
        entropy.runsTestPValue = pooled.runsTestPValue;
        entropy.lzCompressionRatio = pooled.lzCompressionRatio;
        entropy.estimatedEntropyRate = pooled.estimatedEntropyRate;
        entropy.lzApplicable = pooled.lzApplicable;
        entropy.lzStructureDetected = pooled.lzApplicable && pooled.lzCompressionRatio > LZ_STRUCTURE_RATIO;

        result.collisionAnalysis = StructuralDetectors::analyzeCollisions(tokens);

        // --- SP 800-22 battery (nyers karakter bitek) ---
        if (options.parallelBattery && scheduler != nullptr) {
            result.statisticalTests = suite.runBattery(tokens, *scheduler);
        } else {
            result.statisticalTests = suite.runBattery(tokens);
        }
    }

} // namespace Sequencer::Analysis
