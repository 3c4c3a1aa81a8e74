// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#ifndef REPORT_EXPORT_HPP
#define REPORT_EXPORT_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "analysis/AnalysisResult.hpp"
#include "core/TokenCapture.hpp"

namespace SequencerUtils {

    // RFC4180 stílus: idézőjelbe zárva, belső idézőjel duplázva
    std::string escapeCsv(const std::string& value);

    /**
     * @brief CSV export: Index,Token,Length,Extracted From,Request Sent,Response Received
     * Üres capture listára üres string.
     */
    std::string exportCsv(const std::vector<Sequencer::Core::TokenCapture>& captures);

    nlohmann::json captureToJson(const Sequencer::Core::TokenCapture& capture);
    nlohmann::json analysisToJson(const Sequencer::Analysis::AnalysisResult& result);

    /**
     * @brief JSON export: { timestamp, tokenCaptures, analysis }, 2 szóközös behúzással.
     * Érvénytelen UTF-8 byte-ok cserélődnek, a dump nem dob.
     */
    std::string exportJson(const std::vector<Sequencer::Core::TokenCapture>& captures,
                           const Sequencer::Analysis::AnalysisResult& analysis,
                           const std::string& timestamp);

    // ISO-8601 UTC, ezredmásodperccel (2026-01-01T00:00:00.000Z)
    std::string isoTimestampUtc();

    // Riport fájl írása; hiba esetén [ReportExport] log és false
    bool writeReportFile(const std::string& path, const std::string& content);
}

#endif
