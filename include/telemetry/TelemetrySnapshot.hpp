// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#pragma once

#include <cstdint>
#include "telemetry/TelemetryTypes.hpp"

namespace Sequencer::Core {

struct TelemetrySnapshot {
    // --- Capture Metrics ---
    uint64_t total;
    uint64_t found;
    uint64_t not_found;
    uint64_t request_failed;
    uint64_t parse_errors;
    uint64_t dropped;

    // --- Bus State ---
    BusState state;
    uint64_t window_ms;

    // Found / (total - dropped), 0 ha nincs adat
    double success_rate;
};

} // namespace Sequencer::Core
