// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#ifndef BIT_STREAM_CHECKS_HPP
#define BIT_STREAM_CHECKS_HPP

#include <vector>

#include "core/ByteDecoder.hpp"

namespace Sequencer::Analysis {

    struct LzEstimate {
        double entropyRate = 0.0;
        bool applicable = false;
    };

    /**
     * @brief A dekódolt byte-okon futó kiegészítő bit-ellenőrzések eredménye.
     * Tokenenként számolva, majd mediánnal / súlyozott átlaggal összevonva.
     */
    struct PooledChecks {
        double chiSquaredPValue = 1.0;
        double serialCorrelation = 0.0;
        double runsTestPValue = 1.0;
        double lzCompressionRatio = 1.0;
        double estimatedEntropyRate = 0.0;
        bool lzApplicable = false;
    };

    class BitStreamChecks {
    public:
        // 0/1 arány χ² (df=1); 100 bit alatt 1.0
        static double chiSquaredPValue(const Core::BitSequence& bits);

        // Szomszédos bitek korrelációs együtthatója; konstans sorozatra 0
        static double serialCorrelation(const Core::BitSequence& bits);

        /**
         * @brief LZ78 entrópia-ráta becslés: Σ⌈log2(szótárméret)⌉ / bitszám.
         * 100 bit alatt nem értékelhető.
         */
        static LzEstimate lzEntropyEstimate(const Core::BitSequence& bits);

        // Tokenenkénti |r| a bitszámmal súlyozva
        static double weightedSerialCorrelation(const std::vector<Core::ByteSequence>& byteTokens);

        static PooledChecks evaluate(const std::vector<Core::ByteSequence>& byteTokens, double shannonEntropyPerBit);
    };

} // namespace Sequencer::Analysis

#endif // BIT_STREAM_CHECKS_HPP
