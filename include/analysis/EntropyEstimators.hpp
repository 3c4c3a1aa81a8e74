// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework
// Shannon & min-entropy estimators

#ifndef ENTROPY_ESTIMATORS_HPP
#define ENTROPY_ESTIMATORS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "core/ByteDecoder.hpp"

namespace Sequencer::Analysis {

    /**
     * @brief Egy byte-pozíció min-entrópiája a dekódolt tokeneken.
     * mostCommon: a leggyakoribb byte két jegyű hex alakban.
     */
    struct PositionEntropy {
        size_t position = 0;
        double entropy = 0.0;
        std::string mostCommon;
        double frequency = 0.0;
        double coverage = 0.0;
    };

    // Nyers karakter-pozíció (dekódolás nélkül), normalizált entrópiával
    struct RawPositionEntropy {
        size_t position = 0;
        double entropy = 0.0;
        double normalizedEntropy = 0.0;
        std::string mostCommonChar;
        double frequency = 0.0;
        double coverage = 0.0;
    };

    struct PerPositionResult {
        double totalEntropy = 0.0;
        std::vector<PositionEntropy> positions;
    };

    struct BitCounts {
        uint64_t totalBits = 0;
        uint64_t onesCount = 0;
        uint64_t zerosCount = 0;
        double bitEntropy = 0.0;
    };

    class EntropyEstimators {
    public:
        /**
         * @brief Karakter-szintű Shannon-entrópia az összes token összes karakterén (bit/karakter).
         */
        static double shannonCharEntropy(const std::vector<std::string>& tokens);

        // -(p0·log2 p0 + p1·log2 p1); 0 ha bármelyik valószínűség 0
        static double shannonBitEntropy(uint64_t onesCount, uint64_t totalBits);

        /**
         * @brief Teljes-token min-entrópia: -log2(leggyakoribb token darabszáma / minta mérete).
         * Duplikátumok nélkül csak log2(n), ezért a hívó dönti el, beszámítja-e.
         */
        static double minEntropyWholeToken(const std::vector<std::string>& tokens);

        // Bit-torzítás: -log2(max(p0, p1))
        static double minEntropyPerBit(uint64_t onesCount, uint64_t totalBits);

        static BitCounts countBits(const std::vector<Core::ByteSequence>& byteTokens);

        /**
         * @brief Pozíciónkénti min-entrópia byte-okon.
         * Eltérő hosszú tokenek csak a meglévő pozícióikon számítanak (coverage).
         * Az összeg csak fix hosszú tokeneknél teljes entrópia-becslés.
         */
        static PerPositionResult perPositionMinEntropy(const std::vector<Core::ByteSequence>& byteTokens);

        static std::vector<RawPositionEntropy> perPositionRawEntropy(const std::vector<std::string>& tokens);
    };

} // namespace Sequencer::Analysis

#endif // ENTROPY_ESTIMATORS_HPP
