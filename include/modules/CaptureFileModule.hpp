// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#ifndef CAPTURE_FILE_MODULE_HPP
#define CAPTURE_FILE_MODULE_HPP

#include "core/CaptureBus.hpp"
#include <string>

namespace Sequencer::Modules {

    /**
     * @brief Offline collector: token fájlból vagy nyers HTTP válasz dumpokból tölt be.
     * Minden capture a buszon keresztül jut a session-be.
     */
    class CaptureFileModule {
    public:
        // Dependency Injection: Kötelező a Bus megadása
        explicit CaptureFileModule(Sequencer::Core::CaptureBus& busRef);

        std::string getName() const;

        /**
         * @brief Soronként egy token. Üres sorok kimaradnak.
         * literalTokens=false: a legacy sentinel sorok státusszá alakulnak.
         */
        bool loadTokenFile(const std::string& path, bool literalTokens);

        /**
         * @brief Könyvtár minden reguláris fájlja egy válasz; név szerinti sorrendben.
         */
        bool loadResponseDirectory(const std::string& directory, const std::string& parameterName);

        size_t publishedCount() const { return published; }

    private:
        Sequencer::Core::CaptureBus& bus;
        size_t published = 0;

        void publish(const Sequencer::Core::TokenCapture& capture);
    };

}

#endif
