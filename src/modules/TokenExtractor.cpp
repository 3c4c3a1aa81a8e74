// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "modules/TokenExtractor.hpp"
#include "utils/AnalysisThresholds.hpp"
#include "utils/StringUtils.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <regex>

namespace Sequencer::Modules {

    using json = nlohmann::json;

    namespace {

        std::optional<std::string> firstGroup(const std::string& text, const std::string& pattern) {
            const std::regex re(pattern, std::regex::ECMAScript | std::regex::icase);
            std::smatch match;
            if (std::regex_search(text, match, re) && match.size() > 1 && match[1].matched &&
                match[1].length() > 0) {
                return match[1].str();
            }
            return std::nullopt;
        }

        // JavaScript-szerű igazság-érték: null, false, 0 és "" hamis
        bool truthy(const json& value) {
            if (value.is_null()) return false;
            if (value.is_boolean()) return value.get<bool>();
            if (value.is_number_integer()) return value.get<long long>() != 0;
            if (value.is_number_unsigned()) return value.get<unsigned long long>() != 0;
            if (value.is_number_float()) {
                const double d = value.get<double>();
                return d == d && d != 0.0;
            }
            if (value.is_string()) return !value.get_ref<const std::string&>().empty();
            return true;
        }

        std::string jsonText(const json& value) {
            if (value.is_string()) return value.get<std::string>();
            return value.dump();
        }

        std::optional<ExtractionFound> fromJson(const std::string& body, const std::string& parameterName) {
            json data = json::parse(body, nullptr, false);
            if (data.is_discarded() || !data.is_object()) return std::nullopt;

            auto it = data.find(parameterName);
            if (it != data.end() && truthy(*it)) {
                return ExtractionFound{jsonText(*it), "JSON response"};
            }

            for (auto& [key, nested] : data.items()) {
                if (!nested.is_object()) continue;
                auto inner = nested.find(parameterName);
                if (inner != nested.end() && truthy(*inner)) {
                    return ExtractionFound{jsonText(*inner), "JSON response (" + key + "." + parameterName + ")"};
                }
            }
            return std::nullopt;
        }

        int hexValue(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

    } // namespace

    std::string TokenExtractor::escapeRegex(const std::string& literal) {
        static const std::string special = "\\^$.|?*+()[]{}";
        std::string out;
        out.reserve(literal.size() * 2);
        for (char c : literal) {
            if (special.find(c) != std::string::npos) out += '\\';
            out += c;
        }
        return out;
    }

    std::string TokenExtractor::percentDecode(const std::string& value) {
        std::string out;
        out.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            if (value[i] == '%' && i + 2 < value.size()) {
                const int hi = hexValue(value[i + 1]);
                const int lo = hexValue(value[i + 2]);
                if (hi >= 0 && lo >= 0) {
                    out += static_cast<char>((hi << 4) | lo);
                    i += 2;
                    continue;
                }
            }
            out += value[i];
        }
        return out;
    }

    ExtractionResult TokenExtractor::extract(const std::string& body,
                                             const Core::HeaderList& headers,
                                             const std::string& parameterName) {
        if (parameterName.empty()) return ExtractionNotFound{};

        const std::string param = escapeRegex(parameterName);
        const std::string lowerParam = SequencerUtils::toLower(parameterName);

        // --- Headers ---
        for (const auto& [name, value] : headers) {
            if (SequencerUtils::toLower(name) != "set-cookie") continue;
            if (auto cookie = firstGroup(value, param + "=([^;\\s]+)")) {
                return ExtractionFound{percentDecode(*cookie), "Set-Cookie header"};
            }
        }
        for (const auto& [name, value] : headers) {
            if (SequencerUtils::toLower(name).find(lowerParam) != std::string::npos && !value.empty()) {
                return ExtractionFound{value, name + " header"};
            }
        }

        // --- Body ---
        if (auto found = fromJson(body, parameterName)) {
            return *found;
        }

        // Idézőjellel kezdődő érték HTML attribútum, azt a későbbi minták kezelik
        if (auto v = firstGroup(body, param + "=([^&\\n\\r\"'][^&\\n\\r]*)")) {
            return ExtractionFound{percentDecode(*v), "URL-encoded response"};
        }
        if (auto v = firstGroup(body, "<input[^>]*name=[\"']" + param + "[\"'][^>]*value=[\"']([^\"']+)[\"']")) {
            return ExtractionFound{*v, "HTML input field"};
        }
        if (auto v = firstGroup(body, "<meta[^>]*name=[\"']" + param + "[\"'][^>]*content=[\"']([^\"']+)[\"']")) {
            return ExtractionFound{*v, "HTML meta tag"};
        }
        if (auto v = firstGroup(body, "data-" + param + "=[\"']([^\"']+)[\"']")) {
            return ExtractionFound{*v, "HTML data attribute"};
        }
        if (auto v = firstGroup(body, "(?:var|let|const)\\s+" + param + "\\s*=\\s*[\"']([^\"']+)[\"']")) {
            return ExtractionFound{*v, "JavaScript variable"};
        }

        return ExtractionNotFound{};
    }

    RawHttpResponse TokenExtractor::parseRawResponse(const std::string& raw) {
        RawHttpResponse response;

        size_t headerEnd = raw.find("\r\n\r\n");
        size_t bodyStart = std::string::npos;
        if (headerEnd != std::string::npos) {
            bodyStart = headerEnd + 4;
        } else {
            headerEnd = raw.find("\n\n");
            if (headerEnd != std::string::npos) bodyStart = headerEnd + 2;
        }

        const std::string head = raw.substr(0, headerEnd);
        if (bodyStart != std::string::npos) {
            response.body = raw.substr(bodyStart);
        }

        bool first = true;
        for (auto line : SequencerUtils::split(head, '\n')) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (first) {
                response.statusLine = line;
                first = false;
                continue;
            }
            const size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            response.headers.emplace_back(SequencerUtils::trim(line.substr(0, colon)),
                                          SequencerUtils::trim(line.substr(colon + 1)));
        }
        return response;
    }

    Core::TokenCapture TokenExtractor::toCapture(const ExtractionResult& result,
                                                 const std::string& requestSent,
                                                 const std::string& responseReceived,
                                                 const Core::HeaderList& headers) {
        Core::TokenCapture capture;
        if (const auto* found = std::get_if<ExtractionFound>(&result)) {
            capture.status = Core::CaptureStatus::Found;
            capture.token = found->value;
            capture.extractedFrom = found->source;
        } else {
            capture.status = Core::CaptureStatus::NotFound;
            capture.extractedFrom = SequencerThresholds::NOT_FOUND_SENTINEL;
        }
        capture.requestSent = requestSent;
        capture.responseReceived = responseReceived.substr(0, SequencerThresholds::RESPONSE_PREVIEW_CHARS);
        capture.responseHeaders = headers;
        return capture;
    }

} // namespace Sequencer::Modules
