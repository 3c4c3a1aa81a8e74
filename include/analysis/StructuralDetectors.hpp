// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework
// Pattern & collision detectors on the printable token surface

#ifndef STRUCTURAL_DETECTORS_HPP
#define STRUCTURAL_DETECTORS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Sequencer::Analysis {

    struct SequentialResult {
        bool isSequential = false;
        size_t count = 0;
    };

    struct PrefixSuffix {
        std::string prefix;
        std::string suffix;
    };

    struct CollisionResult {
        size_t exactDuplicates = 0;
        size_t nearDuplicates = 0;
        double averageHammingDistance = 0.0;
        size_t comparisons = 0;
    };

    struct CharacterAnalysis {
        std::string charset;
        size_t alphabetic = 0;
        size_t numeric = 0;
        size_t special = 0;
        bool hexadecimal = false;
        bool base64 = false;
    };

    class StructuralDetectors {
    public:
        // Szigorú egész szám értelmezés: a teljes szöveg számjegy (opcionális előjellel)
        static std::optional<int64_t> parseInteger(const std::string& token);

        /**
         * @brief Szomszédos párok, ahol curr == prev + 1.
         * Szekvenciális, ha a párok több mint fele ilyen.
         */
        static SequentialResult detectSequential(const std::vector<std::string>& tokens);

        // 10-13 számjegyű Unix időbélyeg 2000 és 2100 között; a tokenek > 30%-ánál jelez
        static bool detectTimestamps(const std::vector<std::string>& tokens);

        static PrefixSuffix commonPrefixSuffix(const std::vector<std::string>& tokens);

        // Eltérő hosszú szövegek távolsága a hosszabb hossza
        static size_t hammingDistance(const std::string& a, const std::string& b);

        /**
         * @brief Pontos duplikátumok (halmaz), közeli duplikátumok és átlagos Hamming-távolság.
         * Nagy mintánál szisztematikus mintavétel (lépésköz = ⌈n/1000⌉), így
         * O(n²) helyett korlátos számú összehasonlítás; a becslés emiatt zajos.
         */
        static CollisionResult analyzeCollisions(const std::vector<std::string>& tokens);

        static CharacterAnalysis analyzeCharacters(const std::vector<std::string>& tokens);

        static int predictabilityScore(bool sequential, bool timestamps, double duplicatePercentage, size_t prefixLength);
    };

} // namespace Sequencer::Analysis

#endif // STRUCTURAL_DETECTORS_HPP
