// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#ifndef ANALYSIS_THRESHOLDS_HPP
#define ANALYSIS_THRESHOLDS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace SequencerThresholds {

    // --- Legacy collector sentinel szövegek ---
    inline const std::string NOT_FOUND_SENTINEL    = "Not found";
    inline const std::string REQUEST_FAILED_PREFIX = "Request failed";
    inline const std::string PARSE_ERROR_PREFIX    = "Parse Error";

    // Degraded report tagek (issues[0] eleje, a fogyasztók erre ágaznak el)
    inline const std::string TAG_PARAMETER_NOT_FOUND = "PARAMETER_NOT_FOUND";
    inline const std::string TAG_REQUEST_FAILED      = "REQUEST_FAILED";
    inline const std::string TAG_NO_DATA             = "ERROR";

    // --- SP 800-22 battery (nyers karakter bitfolyam, tokenenként) ---
    constexpr double      BATTERY_ALPHA      = 0.01;
    constexpr std::size_t MONOBIT_MIN_BITS   = 100;
    constexpr std::size_t RUNS_MIN_BITS      = 100;
    constexpr std::size_t BLOCK_FREQUENCY_M  = 256;
    constexpr std::size_t SERIAL_MIN_BITS    = 1000;
    constexpr int         SERIAL_M           = 2;
    constexpr std::size_t APEN_MIN_BITS      = 10000;
    constexpr int         APEN_M             = 2;
    constexpr std::size_t CUSUM_MIN_BITS     = 1000;

    // Battery verdict ("Looks Random" / "Mostly Random" / "Shows Patterns")
    constexpr double LOOKS_RANDOM_PASS_RATE  = 0.95;
    constexpr double LOOKS_RANDOM_MEDIAN_P   = 0.05;
    constexpr double MOSTLY_RANDOM_PASS_RATE = 0.80;
    constexpr double MOSTLY_RANDOM_MEDIAN_P  = 0.01;

    // --- Pooled bit checks (dekódolt bájtok) ---
    constexpr std::size_t POOLED_MIN_BITS      = 100;
    constexpr double      AUX_WARNING_ALPHA    = 0.05;
    constexpr double      AUX_FAILURE_ALPHA    = 0.01;
    constexpr double      SEVERE_FAILURE_P     = 0.001;
    constexpr double      SERIAL_CORR_WARNING  = 0.2;
    constexpr double      SERIAL_CORR_ISSUE    = 0.5;
    constexpr double      LZ_STRUCTURE_RATIO   = 1.05;
    constexpr double      LZ_WARNING_RATIO     = 1.10;
    constexpr double      LZ_ISSUE_RATIO       = 1.5;

    // --- Effective security bits ---
    constexpr int    RECOMMENDED_MIN_BITS = 128;
    constexpr double CRITICAL_BITS        = 64.0;
    constexpr double VULNERABLE_BITS      = 80.0;

    constexpr double MIN_ENTROPY_ISSUE    = 0.5;
    constexpr double MIN_ENTROPY_WARNING  = 0.8;
    constexpr double MIN_ENTROPY_STRENGTH = 0.95;

    constexpr double SHANNON_WARNING  = 3.0;
    constexpr double SHANNON_STRENGTH = 4.5;

    // --- Collisions / duplicates ---
    constexpr std::size_t COLLISION_SAMPLE_TARGET = 1000;
    constexpr std::size_t NEAR_DUPLICATE_MAX_DIST = 2;
    constexpr double      NEAR_DUPLICATE_FRACTION = 0.01;
    constexpr double      DUPLICATE_ISSUE_PCT     = 10.0;
    constexpr double      DUPLICATE_WARNING_PCT   = 5.0;
    constexpr double      DUPLICATE_STRENGTH_PCT  = 2.0;

    // --- Pattern detectors ---
    constexpr double        SEQUENTIAL_FRACTION = 0.5;
    constexpr double        TIMESTAMP_FRACTION  = 0.3;
    constexpr std::size_t   TIMESTAMP_MIN_DIGITS = 10;
    constexpr std::size_t   TIMESTAMP_MAX_DIGITS = 13;
    constexpr std::int64_t  TIMESTAMP_MIN = 946684800;   // 2000-01-01
    constexpr std::int64_t  TIMESTAMP_MAX = 4102444800;  // 2100-01-01

    // Predictability score súlyok (0-100)
    constexpr int         SCORE_SEQUENTIAL       = 40;
    constexpr int         SCORE_TIMESTAMP        = 30;
    constexpr int         SCORE_DUPLICATES       = 20;
    constexpr int         SCORE_COMMON_PREFIX    = 10;
    constexpr std::size_t COMMON_PREFIX_MIN_LEN  = 3;
    constexpr int         PREDICTABILITY_ISSUE   = 50;
    constexpr int         PREDICTABILITY_WARNING = 20;

    constexpr std::size_t EXCELLENT_MIN_STRENGTHS = 3;

    // --- Export ---
    constexpr std::size_t RESPONSE_PREVIEW_CHARS = 2000;
}

#endif // ANALYSIS_THRESHOLDS_HPP
