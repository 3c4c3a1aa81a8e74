// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "modules/CaptureFileModule.hpp"
#include "modules/TokenExtractor.hpp"
#include "utils/StringUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace Sequencer::Modules {

using Sequencer::Core::CaptureStatus;
using Sequencer::Core::LogLevel;
using Sequencer::Core::TokenCapture;

CaptureFileModule::CaptureFileModule(Sequencer::Core::CaptureBus& busRef)
    : bus(busRef) {
}

std::string CaptureFileModule::getName() const {
    return "CaptureFileModule";
}

void CaptureFileModule::publish(const TokenCapture& capture) {
    bus.publish(capture);
    published++;
}

bool CaptureFileModule::loadTokenFile(const std::string& path, bool literalTokens) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[CaptureFileModule] Cannot open token file: " << path << std::endl;
        return false;
    }

    size_t lines = 0;
    std::string line;
    while (std::getline(file, line)) {
        const std::string token = SequencerUtils::trim(line);
        if (token.empty()) continue;

        TokenCapture capture = literalTokens
            ? Sequencer::Core::makeFoundCapture(token, "Token file")
            : Sequencer::Core::classifyLegacyToken(token);
        publish(capture);
        lines++;
    }

    if (bus.getLogLevel() == LogLevel::DEBUG) {
        std::cout << "[CaptureFileModule] " << lines << " captures loaded from " << path << std::endl;
    }
    return true;
}

bool CaptureFileModule::loadResponseDirectory(const std::string& directory, const std::string& parameterName) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        std::cerr << "[CaptureFileModule] Not a directory: " << directory << std::endl;
        return false;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.is_regular_file()) files.push_back(entry.path());
    }
    if (ec) {
        std::cerr << "[CaptureFileModule] Directory scan failed: " << ec.message() << std::endl;
        return false;
    }
    std::sort(files.begin(), files.end());

    for (const auto& path : files) {
        std::ifstream file(path, std::ios::binary);
        std::ostringstream buffer;
        if (file.is_open()) buffer << file.rdbuf();
        const std::string raw = buffer.str();

        if (!file.is_open() || raw.empty()) {
            TokenCapture failed;
            failed.status = CaptureStatus::RequestFailed;
            failed.failureDetail = file.is_open() ? "Empty response: " + path.filename().string()
                                                  : "Cannot read " + path.filename().string();
            failed.extractedFrom = "Error: " + failed.failureDetail;
            publish(failed);
            continue;
        }

        RawHttpResponse response = TokenExtractor::parseRawResponse(raw);
        ExtractionResult result = TokenExtractor::extract(response.body, response.headers, parameterName);
        TokenCapture capture = TokenExtractor::toCapture(result, std::string(), raw, response.headers);
        publish(capture);
    }

    if (bus.getLogLevel() == LogLevel::DEBUG) {
        std::cout << "[CaptureFileModule] " << files.size() << " responses scanned in " << directory << std::endl;
    }
    return true;
}

}
