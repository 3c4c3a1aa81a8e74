// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "core/TokenCapture.hpp"
#include "utils/AnalysisThresholds.hpp"
#include "utils/StringUtils.hpp"

namespace Sequencer::Core {

    bool TokenCapture::isValidToken() const {
        return status == CaptureStatus::Found && !token.empty();
    }

    std::string TokenCapture::displayToken() const {
        switch (status) {
            case CaptureStatus::Found:
                return token;
            case CaptureStatus::NotFound:
                return SequencerThresholds::NOT_FOUND_SENTINEL;
            case CaptureStatus::RequestFailed:
                return SequencerThresholds::REQUEST_FAILED_PREFIX;
            case CaptureStatus::ParseError:
                return SequencerThresholds::PARSE_ERROR_PREFIX + ": " + failureDetail;
        }
        return token;
    }

    TokenCapture makeFoundCapture(const std::string& token, const std::string& source) {
        TokenCapture capture;
        capture.status = CaptureStatus::Found;
        capture.token = token;
        capture.extractedFrom = source;
        return capture;
    }

    TokenCapture classifyLegacyToken(const std::string& raw) {
        TokenCapture capture;
        capture.token = raw;

        if (raw == SequencerThresholds::NOT_FOUND_SENTINEL) {
            capture.status = CaptureStatus::NotFound;
            capture.token.clear();
            capture.extractedFrom = SequencerThresholds::NOT_FOUND_SENTINEL;
            return capture;
        }

        if (SequencerUtils::startsWith(raw, SequencerThresholds::REQUEST_FAILED_PREFIX)) {
            capture.status = CaptureStatus::RequestFailed;
            capture.token.clear();
            std::string rest = raw.substr(SequencerThresholds::REQUEST_FAILED_PREFIX.size());
            if (!rest.empty() && rest.front() == ':') rest.erase(0, 1);
            capture.failureDetail = SequencerUtils::trim(rest);
            capture.extractedFrom = "Error: " + capture.failureDetail;
            return capture;
        }

        if (SequencerUtils::startsWith(raw, SequencerThresholds::PARSE_ERROR_PREFIX)) {
            capture.status = CaptureStatus::ParseError;
            capture.token.clear();
            std::string rest = raw.substr(SequencerThresholds::PARSE_ERROR_PREFIX.size());
            if (!rest.empty() && rest.front() == ':') rest.erase(0, 1);
            capture.failureDetail = SequencerUtils::trim(rest);
            capture.extractedFrom = "Error: " + capture.failureDetail;
            return capture;
        }

        capture.status = CaptureStatus::Found;
        capture.extractedFrom = "Token file";
        return capture;
    }

    const char* toString(CaptureStatus status) {
        switch (status) {
            case CaptureStatus::Found:         return "FOUND";
            case CaptureStatus::NotFound:      return "NOT_FOUND";
            case CaptureStatus::RequestFailed: return "REQUEST_FAILED";
            case CaptureStatus::ParseError:    return "PARSE_ERROR";
        }
        return "UNKNOWN";
    }

} // namespace Sequencer::Core
