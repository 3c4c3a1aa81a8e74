// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework
// Scheduler: capture ingestion & analysis fan-out workers

#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <atomic>
#include "rxcpp/rx.hpp"

namespace Sequencer::Core {

    class CaptureBus; // Forward declaration

    /**
     * @brief Két ütemező: a capture bus sorosan, a hívó szálán dolgozik,
     * az elemzés per-token munkái event loop workereken futnak.
     */
    class Scheduler {
    private:
        // --- State ---
        std::atomic<bool> running{false};

        // A fő subscription, ami életben tartja a capture pipeline-t.
        rxcpp::composite_subscription lifetime;

        // --- RxCpp Schedulers ---

        // 1. Capture: determinisztikus, a publish hívó szálán (trampoline)
        rxcpp::schedulers::scheduler capture_scheduler;

        // 2. Analysis: párhuzamos worker szálak a tesztakkumulátorhoz
        rxcpp::schedulers::scheduler analysis_scheduler;

    public:
        Scheduler();
        ~Scheduler();

        void start(CaptureBus& bus);
        void stop();

        bool isRunning() const { return running; }

        // --- Accessors ---
        rxcpp::schedulers::scheduler getCaptureScheduler() const {
            return capture_scheduler;
        }

        rxcpp::schedulers::scheduler getAnalysisScheduler() const {
            return analysis_scheduler;
        }
    };
}

#endif // SCHEDULER_HPP
