// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "core/CaptureBus.hpp"
#include "core/Scheduler.hpp"
#include <iostream>

namespace Sequencer::Core {

    CaptureBus::CaptureBus(TokenSession& sessionRef, LogLevel level)
        : session(sessionRef), logLevel(level) {
        telemetry.reset_window();
    }

    void CaptureBus::publish(const TokenCapture& capture) {
        if (telemetry.state.load() != BusState::UP || !capture_bus.has_observers()) {
            // Nincs élő pipeline: a capture elveszne, csak számoljuk
            telemetry.total_captures++;
            telemetry.dropped_captures++;
            if (logLevel != LogLevel::SILENT) {
                std::cerr << "[CaptureBus] Capture dropped (pipeline not running)." << std::endl;
            }
            return;
        }
        capture_bus.get_subscriber().on_next(capture);
    }

    void CaptureBus::complete() {
        BusState expected = BusState::UP;
        if (telemetry.state.compare_exchange_strong(expected, BusState::COMPLETED)) {
            capture_bus.get_subscriber().on_completed();
        }
    }

    void CaptureBus::startReactive(rxcpp::composite_subscription& lifetime, const Scheduler& scheduler) {
        capture_bus.get_observable()
            .observe_on(rxcpp::observe_on_one_worker(scheduler.getCaptureScheduler()))
            .subscribe(
                lifetime,
                [this](const TokenCapture& capture) {
                    session.append(capture);
                    telemetry.record(capture.status);

                    if (logLevel == LogLevel::DEBUG) {
                        std::cout << "[CaptureBus] " << toString(capture.status)
                                  << " <- " << capture.extractedFrom << std::endl;
                    } else if (logLevel == LogLevel::SECURITY_ONLY &&
                               capture.status == CaptureStatus::RequestFailed) {
                        std::cerr << "[CaptureBus] Request failed: " << capture.failureDetail << std::endl;
                    }
                },
                [this](std::exception_ptr ep) {
                    telemetry.state = BusState::FAULTED;
                    try {
                        if (ep) std::rethrow_exception(ep);
                    } catch (const std::exception& e) {
                        std::cerr << "[CaptureBus] Pipeline fault: " << e.what() << std::endl;
                    }
                });

        if (logLevel == LogLevel::DEBUG) {
            std::cout << "[CaptureBus] Capture pipeline aktív." << std::endl;
        }
    }

    rxcpp::observable<TokenCapture> CaptureBus::captures() const {
        return capture_bus.get_observable();
    }

    TelemetrySnapshot CaptureBus::getTelemetrySnapshot() const {
        return telemetry.snapshot();
    }

} // namespace Sequencer::Core
