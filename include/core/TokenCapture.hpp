// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#ifndef TOKEN_CAPTURE_HPP
#define TOKEN_CAPTURE_HPP

#include <string>
#include <utility>
#include <vector>

namespace Sequencer::Core {

    /**
     * @brief Egy begyűjtés kimenetele.
     * A hiba-állapot explicit, így egy "Not found" értékű valódi token is elemezhető marad.
     */
    enum class CaptureStatus {
        Found,
        NotFound,
        RequestFailed,
        ParseError
    };

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    /**
     * @brief Egy HTTP válaszból kinyert token és a kontextusa.
     */
    struct TokenCapture {
        CaptureStatus status = CaptureStatus::Found;
        std::string token;
        std::string requestSent;
        std::string responseReceived;
        std::string extractedFrom;
        std::string failureDetail;
        HeaderList responseHeaders;

        // Found és nem üres
        bool isValidToken() const;

        // Export / megjelenítés: hibánál a legacy sentinel szöveg
        std::string displayToken() const;
    };

    TokenCapture makeFoundCapture(const std::string& token, const std::string& source);

    /**
     * @brief Legacy formátum (sentinel szövegek) visszaolvasása státusszá.
     * Csak fájl-határon használjuk; a belső útvonal a CaptureStatus-t viszi tovább.
     */
    TokenCapture classifyLegacyToken(const std::string& raw);

    const char* toString(CaptureStatus status);

} // namespace Sequencer::Core

#endif // TOKEN_CAPTURE_HPP
