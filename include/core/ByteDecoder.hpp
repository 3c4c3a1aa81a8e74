// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework
// Token encoding inference & bit-source extraction

#ifndef BYTE_DECODER_HPP
#define BYTE_DECODER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Sequencer::Core {

    using ByteSequence = std::vector<uint8_t>;

    // Egy elem = egy bit (0/1), MSB-first sorrendben
    using BitSequence = std::vector<uint8_t>;

    /**
     * @brief A token feltételezett byte-kódolása.
     */
    enum class TokenEncoding {
        HEX,
        BASE64,
        BASE64URL,
        RAW
    };

    struct DecodedToken {
        ByteSequence bytes;
        TokenEncoding encoding = TokenEncoding::RAW;
    };

    /**
     * @brief Kódolás-felismerő szonda.
     * Sorrend: pontokkal tagolt base64 szegmensek, hex, base64/base64url, végül nyers byte-ok.
     * A dekódolás sosem bukik el: a RAW fallback mindig sikeres.
     */
    class ByteDecoder {
    public:
        static DecodedToken decode(const std::string& token);

        /**
         * @brief Hex dekódolás (whitespace eltávolítása után, páros hossz).
         */
        static std::optional<ByteSequence> tryDecodeHex(const std::string& token);

        /**
         * @brief Base64 / base64url próbálkozás több variánssal.
         * A "-" és "_" karakterek "+" és "/" karakterre cserélődnek, a padding pótlódik.
         */
        static std::optional<DecodedToken> tryDecodeBase64Like(const std::string& token);

        /**
         * @brief Engedékeny base64 dekódoló.
         * Whitespace-t eldob, 4-gyel osztható hossznál legfeljebb két záró '='-t levág,
         * az ábécén kívüli karakter vagy 4k+1 hossz hibát jelent.
         */
        static std::optional<ByteSequence> decodeBase64(const std::string& input);

        // --- Bit sources ---

        // Dekódolt byte-ok bitjei (entrópia becslők, pooled ellenőrzések)
        static BitSequence decodedBits(const ByteSequence& bytes);

        // Nyomtatható token karakterenként 8 bit (SP 800-22 teszt-akkumulátor)
        static BitSequence rawCharacterBits(const std::string& token);

    private:
        static bool isHexDigit(unsigned char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }
    };

    const char* toString(TokenEncoding encoding);

} // namespace Sequencer::Core

#endif // BYTE_DECODER_HPP
