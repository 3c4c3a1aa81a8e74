// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "telemetry/TelemetryTypes.hpp"
#include "telemetry/TelemetrySnapshot.hpp"
#include "core/TokenCapture.hpp"

namespace Sequencer::Core {

struct CaptureTelemetry {
    // Capture counters
    std::atomic<uint64_t> total_captures{0};
    std::atomic<uint64_t> found_captures{0};
    std::atomic<uint64_t> not_found_captures{0};
    std::atomic<uint64_t> failed_captures{0};
    std::atomic<uint64_t> parse_error_captures{0};
    std::atomic<uint64_t> dropped_captures{0};

    // Bus state
    std::atomic<BusState> state{BusState::UP};

    // Time window
    std::chrono::steady_clock::time_point window_start;

    void record(CaptureStatus status);

    CaptureTelemetry();
    [[nodiscard]] TelemetrySnapshot snapshot() const;
    void reset_window();
};

} // namespace Sequencer::Core
