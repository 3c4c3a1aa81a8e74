// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "telemetry/CaptureTelemetry.hpp"

namespace Sequencer::Core {

CaptureTelemetry::CaptureTelemetry()
    : window_start(std::chrono::steady_clock::now())
{
}

void CaptureTelemetry::reset_window() {
    window_start = std::chrono::steady_clock::now();
}

void CaptureTelemetry::record(CaptureStatus status) {
    total_captures++;
    switch (status) {
        case CaptureStatus::Found:         found_captures++;       break;
        case CaptureStatus::NotFound:      not_found_captures++;   break;
        case CaptureStatus::RequestFailed: failed_captures++;      break;
        case CaptureStatus::ParseError:    parse_error_captures++; break;
    }
}

TelemetrySnapshot CaptureTelemetry::snapshot() const {
    TelemetrySnapshot snap{};

    snap.total          = total_captures.load();
    snap.found          = found_captures.load();
    snap.not_found      = not_found_captures.load();
    snap.request_failed = failed_captures.load();
    snap.parse_errors   = parse_error_captures.load();
    snap.dropped        = dropped_captures.load();

    snap.state = state.load();

    snap.window_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - window_start
        ).count();

    uint64_t delivered = snap.total - snap.dropped;
    snap.success_rate = (delivered > 0)
        ? static_cast<double>(snap.found) / static_cast<double>(delivered)
        : 0.0;

    return snap;
}

} // namespace Sequencer::Core
