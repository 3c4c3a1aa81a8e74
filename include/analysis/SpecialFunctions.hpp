// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework
// Special functions for p-value mapping

#ifndef SPECIAL_FUNCTIONS_HPP
#define SPECIAL_FUNCTIONS_HPP

namespace Sequencer::Analysis::Special {

    // Iterációs korlátok a sor- és lánctört-kifejtéshez
    constexpr int GAMMA_MAX_ITERATIONS = 1000;
    constexpr double GAMMA_EPSILON = 1e-12;

    /**
     * @brief ln Γ(z), Lanczos közelítés (g=7, 8 együttható).
     * z < 0.5 esetén a reflexiós képlettel.
     */
    double lnGamma(double z);

    /**
     * @brief Regularizált felső nem teljes gamma függvény, Q(s, x).
     * x < s+1: sorfejtés (P), Q = 1 - P; egyébként lánctört.
     * Az eredmény [0, 1]-re vágva; x <= 0 esetén 1.
     */
    double gammaincUpperRegularized(double s, double x);

    /**
     * @brief Komplementer hibafüggvény.
     * erfc(x) = Q(1/2, x^2) x >= 0-ra, negatív x-re 2 - erfc(-x).
     */
    double erfc(double x);

    /**
     * @brief Standard normális eloszlásfüggvény, Φ(z) = erfc(-z/√2) / 2.
     */
    double normalCDF(double z);

    // χ² felső farok p-érték: Q(df/2, χ²/2)
    double chiSquareUpperTail(double chi2, double df);

} // namespace Sequencer::Analysis::Special

#endif // SPECIAL_FUNCTIONS_HPP
