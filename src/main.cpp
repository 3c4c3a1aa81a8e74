// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include <iostream>
#include <string>
#include <vector>

#include "analysis/AnalysisEngine.hpp"
#include "core/CaptureBus.hpp"
#include "core/Scheduler.hpp"
#include "core/TokenSession.hpp"
#include "modules/CaptureFileModule.hpp"
#include "utils/ReportExport.hpp"
#include "utils/StringUtils.hpp"

using namespace Sequencer;

namespace {

struct CliOptions {
    std::string tokenFile;
    std::string responseDir;
    std::string parameterName;
    std::string jsonOut;
    std::string csvOut;
    bool literalTokens = false;
    bool quick = false;
    bool parallel = false;
    Core::LogLevel logLevel = Core::LogLevel::SECURITY_ONLY;
};

void printUsage() {
    std::cout << "Usage: rnd-sequencer (--tokens FILE [--literal-tokens] | --responses DIR --param NAME)\n"
              << "                     [--quick] [--parallel] [--json FILE] [--csv FILE]\n"
              << "                     [--verbose | --silent]" << std::endl;
}

bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "[CLI] Missing value for " << arg << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--tokens")              { if (!next(opts.tokenFile)) return false; }
        else if (arg == "--responses")      { if (!next(opts.responseDir)) return false; }
        else if (arg == "--param")          { if (!next(opts.parameterName)) return false; }
        else if (arg == "--json")           { if (!next(opts.jsonOut)) return false; }
        else if (arg == "--csv")            { if (!next(opts.csvOut)) return false; }
        else if (arg == "--literal-tokens") opts.literalTokens = true;
        else if (arg == "--quick")          opts.quick = true;
        else if (arg == "--parallel")       opts.parallel = true;
        else if (arg == "--verbose")        opts.logLevel = Core::LogLevel::DEBUG;
        else if (arg == "--silent")         opts.logLevel = Core::LogLevel::SILENT;
        else {
            std::cerr << "[CLI] Unknown option: " << arg << std::endl;
            return false;
        }
    }

    if (opts.tokenFile.empty() == opts.responseDir.empty()) {
        std::cerr << "[CLI] Exactly one of --tokens or --responses is required." << std::endl;
        return false;
    }
    if (!opts.responseDir.empty() && opts.parameterName.empty()) {
        std::cerr << "[CLI] --responses requires --param NAME." << std::endl;
        return false;
    }
    return true;
}

void printList(const char* title, const std::vector<std::string>& items) {
    if (items.empty()) return;
    std::cout << "\n" << title << ":" << std::endl;
    for (const auto& item : items) {
        std::cout << "  - " << item << std::endl;
    }
}

void printReport(const Analysis::AnalysisResult& r) {
    using SequencerUtils::formatFixed;

    std::cout << "\n--- RND-SEQUENCER REPORT ---" << std::endl;
    std::cout << "Overall rating     : " << Analysis::toString(r.security.overallRating) << std::endl;
    std::cout << "Samples            : " << r.summary.totalSamples
              << " (" << r.summary.uniqueValues << " unique, "
              << formatFixed(r.summary.duplicatePercentage, 1) << "% duplicated)" << std::endl;
    std::cout << "Length             : " << r.summary.minLength << "-" << r.summary.maxLength
              << " (avg " << formatFixed(r.summary.averageLength, 1) << ")" << std::endl;
    std::cout << "Shannon (char)     : " << formatFixed(r.summary.entropy, 3) << " bits/char" << std::endl;
    std::cout << "Effective security : " << formatFixed(r.security.effectiveBits, 1)
              << " bits (recommended " << r.security.recommendedMinimum << ")" << std::endl;
    std::cout << "Predictability     : " << r.patterns.predictabilityScore << "/100" << std::endl;

    if (r.statisticalTests) {
        std::cout << "\nSP 800-22 (" << r.statisticalTests->basis << ", alpha="
                  << r.statisticalTests->alpha << "): " << r.statisticalTests->verdict << std::endl;
        for (const auto& t : r.statisticalTests->tests) {
            std::cout << "  " << t.name << ": " << t.passCount << "/" << t.applicableCount
                      << " pass, median p=" << formatFixed(t.medianP, 4) << std::endl;
        }
    }

    printList("Issues", r.security.issues);
    printList("Warnings", r.security.warnings);
    printList("Strengths", r.security.strengths);
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 2;
    }

    if (opts.logLevel != Core::LogLevel::SILENT) {
        std::cout << "--- RND-SEQUENCER TOKEN RANDOMNESS ENGINE ---" << std::endl;
    }

    Core::TokenSession session;
    Core::CaptureBus bus(session, opts.logLevel);
    Core::Scheduler scheduler;
    scheduler.start(bus);

    Modules::CaptureFileModule collector(bus);
    const bool loaded = opts.tokenFile.empty()
        ? collector.loadResponseDirectory(opts.responseDir, opts.parameterName)
        : collector.loadTokenFile(opts.tokenFile, opts.literalTokens);
    bus.complete();

    if (!loaded) {
        scheduler.stop();
        return 1;
    }

    const std::vector<Core::TokenCapture> captures = session.snapshot();

    Analysis::AnalysisOptions options;
    options.securityAnalysis = !opts.quick;
    options.parallelBattery = opts.parallel;

    Analysis::AnalysisEngine engine(scheduler);
    const Analysis::AnalysisResult result = engine.analyze(captures, options);

    if (opts.logLevel != Core::LogLevel::SILENT) {
        const auto telemetry = bus.getTelemetrySnapshot();
        std::cout << "[Telemetry] captures=" << telemetry.total
                  << " found=" << telemetry.found
                  << " not_found=" << telemetry.not_found
                  << " failed=" << (telemetry.request_failed + telemetry.parse_errors)
                  << " dropped=" << telemetry.dropped << std::endl;
        printReport(result);
    }

    int exitCode = 0;

    if (!opts.csvOut.empty()) {
        if (!SequencerUtils::writeReportFile(opts.csvOut, SequencerUtils::exportCsv(captures))) {
            exitCode = 1;
        }
    }

    if (!opts.jsonOut.empty()) {
        // A JSON export mindig a teljes elemzést tartalmazza
        Analysis::AnalysisResult full = result;
        if (!options.securityAnalysis) {
            Analysis::AnalysisOptions fullOptions = options;
            fullOptions.securityAnalysis = true;
            full = engine.analyze(captures, fullOptions);
        }
        const std::string document = SequencerUtils::exportJson(captures, full, SequencerUtils::isoTimestampUtc());
        if (!SequencerUtils::writeReportFile(opts.jsonOut, document)) {
            exitCode = 1;
        }
    }

    scheduler.stop();
    return exitCode;
}
