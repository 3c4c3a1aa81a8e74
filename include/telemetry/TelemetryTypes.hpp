// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#pragma once

namespace Sequencer::Core {

    // Capture bus állapotai
    enum class BusState {
        UP,
        COMPLETED,
        FAULTED
    };

    /**
     * @brief Log-szintek a konzol zaj kezeléséhez.
     */
    enum class LogLevel {
        SILENT,
        SECURITY_ONLY,
        DEBUG
    };

} // namespace Sequencer::Core
