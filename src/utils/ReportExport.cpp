// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "utils/ReportExport.hpp"
#include "utils/StringUtils.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace SequencerUtils {

    using json = nlohmann::json;
    namespace An = Sequencer::Analysis;

    std::string escapeCsv(const std::string& value) {
        return "\"" + replaceAll(value, "\"", "\"\"") + "\"";
    }

    std::string exportCsv(const std::vector<Sequencer::Core::TokenCapture>& captures) {
        if (captures.empty()) return "";

        const std::vector<std::string> headers = {
            "Index", "Token", "Length", "Extracted From", "Request Sent", "Response Received"
        };

        std::ostringstream csv;
        for (size_t i = 0; i < headers.size(); ++i) {
            if (i > 0) csv << ',';
            csv << escapeCsv(headers[i]);
        }

        for (size_t index = 0; index < captures.size(); ++index) {
            const auto& capture = captures[index];
            const std::string token = capture.displayToken();
            csv << '\n'
                << escapeCsv(std::to_string(index + 1)) << ','
                << escapeCsv(token) << ','
                << escapeCsv(std::to_string(token.size())) << ','
                << escapeCsv(capture.extractedFrom) << ','
                << escapeCsv(capture.requestSent) << ','
                << escapeCsv(capture.responseReceived);
        }
        return csv.str();
    }

    json captureToJson(const Sequencer::Core::TokenCapture& capture) {
        json headers = json::array();
        for (const auto& [name, value] : capture.responseHeaders) {
            headers.push_back(json::array({name, value}));
        }
        return {
            {"token", capture.displayToken()},
            {"status", Sequencer::Core::toString(capture.status)},
            {"extractedFrom", capture.extractedFrom},
            {"requestSent", capture.requestSent},
            {"responseReceived", capture.responseReceived},
            {"responseHeaders", std::move(headers)}
        };
    }

    json analysisToJson(const An::AnalysisResult& result) {
        json root;

        const auto& s = result.summary;
        root["summary"] = {
            {"totalSamples", s.totalSamples},
            {"uniqueValues", s.uniqueValues},
            {"duplicateCount", s.duplicateCount},
            {"duplicatePercentage", s.duplicatePercentage},
            {"entropy", s.entropy},
            {"averageLength", s.averageLength},
            {"minLength", s.minLength},
            {"maxLength", s.maxLength}
        };

        const auto& p = result.patterns;
        root["patterns"] = {
            {"sequential", p.sequential},
            {"sequentialCount", p.sequentialCount},
            {"hasTimestamps", p.hasTimestamps},
            {"commonPrefix", p.commonPrefix},
            {"commonSuffix", p.commonSuffix},
            {"predictabilityScore", p.predictabilityScore}
        };

        const auto& c = result.characterAnalysis;
        root["characterAnalysis"] = {
            {"charset", c.charset},
            {"alphabetic", c.alphabetic},
            {"numeric", c.numeric},
            {"special", c.special},
            {"hexadecimal", c.hexadecimal},
            {"base64", c.base64}
        };

        const auto& b = result.bitAnalysis;
        root["bitAnalysis"] = {
            {"totalBits", b.totalBits},
            {"onesCount", b.onesCount},
            {"zerosCount", b.zerosCount},
            {"bitEntropy", b.bitEntropy}
        };

        const auto& e = result.entropyAnalysis;
        json positions = json::array();
        for (const auto& pos : e.perPositionData) {
            positions.push_back({
                {"position", pos.position},
                {"entropy", pos.entropy},
                {"mostCommonChar", pos.mostCommon},
                {"frequency", pos.frequency},
                {"coverage", pos.coverage}
            });
        }
        json rawPositions = json::array();
        for (const auto& pos : e.perPositionRawData) {
            rawPositions.push_back({
                {"position", pos.position},
                {"entropy", pos.entropy},
                {"normalizedEntropy", pos.normalizedEntropy},
                {"mostCommonChar", pos.mostCommonChar},
                {"frequency", pos.frequency},
                {"coverage", pos.coverage}
            });
        }
        json encodings = json::object();
        for (const auto& [name, count] : e.encodingHistogram) {
            encodings[name] = count;
        }
        root["entropyAnalysis"] = {
            {"shannonEntropyPerBit", e.shannonEntropyPerBit},
            {"minEntropyPerBit", e.minEntropyPerBit},
            {"minEntropyWholeToken", e.minEntropyWholeToken},
            {"perPositionMinEntropy", e.perPositionMinEntropy},
            {"perPositionTotalEntropy", e.perPositionTotalEntropy},
            {"fixedLength", e.fixedLength},
            {"effectiveSecurityBits", e.effectiveSecurityBits},
            {"chiSquaredPValue", e.chiSquaredPValue},
            {"serialCorrelation", e.serialCorrelation},
            {"runsTestPValue", e.runsTestPValue},
            {"lzCompressionRatio", e.lzCompressionRatio},
            {"estimatedEntropyRate", e.estimatedEntropyRate},
            {"lzApplicable", e.lzApplicable},
            {"lzStructureDetected", e.lzStructureDetected},
            {"perPositionData", std::move(positions)},
            {"perPositionRawData", std::move(rawPositions)},
            {"encodings", std::move(encodings)}
        };

        const auto& col = result.collisionAnalysis;
        root["collisionAnalysis"] = {
            {"exactDuplicates", col.exactDuplicates},
            {"nearDuplicates", col.nearDuplicates},
            {"averageHammingDistance", col.averageHammingDistance}
        };

        const auto& sec = result.security;
        root["security"] = {
            {"overallRating", An::toString(sec.overallRating)},
            {"issues", sec.issues},
            {"warnings", sec.warnings},
            {"strengths", sec.strengths},
            {"effectiveBits", sec.effectiveBits},
            {"recommendedMinimum", sec.recommendedMinimum}
        };

        if (result.statisticalTests) {
            const auto& battery = *result.statisticalTests;
            json tests = json::array();
            for (const auto& t : battery.tests) {
                json pValues = json::array();
                for (const auto& pv : t.pValues) {
                    if (pv) pValues.push_back(*pv);
                    else pValues.push_back(nullptr);
                }
                tests.push_back({
                    {"name", t.name},
                    {"applicableCount", t.applicableCount},
                    {"passCount", t.passCount},
                    {"passRate", t.passRate},
                    {"medianP", t.medianP},
                    {"pValues", std::move(pValues)}
                });
            }
            root["statisticalTests"] = {
                {"basis", battery.basis},
                {"alpha", battery.alpha},
                {"tests", std::move(tests)},
                {"aggregatePassRate", battery.aggregatePassRate},
                {"overallMedianP", battery.overallMedianP},
                {"verdict", battery.verdict}
            };
        }

        return root;
    }

    std::string exportJson(const std::vector<Sequencer::Core::TokenCapture>& captures,
                           const An::AnalysisResult& analysis,
                           const std::string& timestamp) {
        json captureList = json::array();
        for (const auto& capture : captures) {
            captureList.push_back(captureToJson(capture));
        }

        json root;
        root["timestamp"] = timestamp;
        root["tokenCaptures"] = std::move(captureList);
        root["analysis"] = analysisToJson(analysis);
        return root.dump(2, ' ', false, json::error_handler_t::replace);
    }

    std::string isoTimestampUtc() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::tm utc{};
        gmtime_r(&seconds, &utc);

        std::ostringstream out;
        out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return out.str();
    }

    bool writeReportFile(const std::string& path, const std::string& content) {
        std::ofstream file(path, std::ios::trunc | std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "[ReportExport] Cannot open for writing: " << path << std::endl;
            return false;
        }
        file << content;
        file.close();
        if (file.fail()) {
            std::cerr << "[ReportExport] Write failed: " << path << std::endl;
            return false;
        }
        return true;
    }
}
