// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#ifndef CAPTURE_BUS_HPP
#define CAPTURE_BUS_HPP

#include <string>
#include "rxcpp/rx.hpp"

#include "core/TokenCapture.hpp"
#include "core/TokenSession.hpp"
#include "telemetry/CaptureTelemetry.hpp"

namespace Sequencer::Core {

    // Forward declaration a Schedulerhez
    class Scheduler;

    /**
     * @brief Capture ingestion bus.
     * A collectorok ide publikálnak; a pipeline a session-be írja a capture-t
     * és frissíti a telemetriát. Élő fogyasztók a captures() observable-re iratkozhatnak.
     */
    class CaptureBus {
    private:
        rxcpp::subjects::subject<TokenCapture> capture_bus;

        TokenSession& session;
        CaptureTelemetry telemetry;
        LogLevel logLevel;

    public:
        explicit CaptureBus(TokenSession& sessionRef, LogLevel level = LogLevel::SECURITY_ONLY);

        // --- Public API (Publishing) ---
        void publish(const TokenCapture& capture);

        // Gyűjtés vége: a subject lezárul, az állapot COMPLETED
        void complete();

        // --- Lifecycle Management ---

        // A Scheduler hívja meg, hogy felépítse a reaktív láncot
        void startReactive(rxcpp::composite_subscription& lifetime, const Scheduler& scheduler);

        rxcpp::observable<TokenCapture> captures() const;

        // --- Diagnostics ---
        [[nodiscard]] TelemetrySnapshot getTelemetrySnapshot() const;
        LogLevel getLogLevel() const { return logLevel; }
    };
}

#endif
