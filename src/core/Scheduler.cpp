// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "core/Scheduler.hpp"
#include "core/CaptureBus.hpp"
#include <iostream>

namespace Sequencer::Core {
    Scheduler::Scheduler()
        : capture_scheduler(rxcpp::schedulers::make_current_thread()),
          analysis_scheduler(rxcpp::schedulers::make_event_loop())
    {
    }

    Scheduler::~Scheduler() {
        stop();
    }

    void Scheduler::start(CaptureBus& bus) {
        if (running) return;
        running = true;

        lifetime = rxcpp::composite_subscription();
        bus.startReactive(lifetime, *this);

        if (bus.getLogLevel() == LogLevel::DEBUG) {
            std::cout << "[Scheduler] Capture pipeline active." << std::endl;
        }
    }

    void Scheduler::stop() {
        if (!running) return;

        if (lifetime.is_subscribed()) {
            lifetime.unsubscribe();
        }

        running = false;
    }
}
