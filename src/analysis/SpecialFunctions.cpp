// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#include "analysis/SpecialFunctions.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace Sequencer::Analysis::Special {

    namespace {

        constexpr double PI = 3.14159265358979323846;
        constexpr double FPMIN = 1e-300;

        constexpr std::array<double, 8> LANCZOS = {
            676.5203681218851,
            -1259.1392167224028,
            771.32342877765313,
            -176.61502916214059,
            12.507343278686905,
            -0.13857109526572012,
            9.9843695780195716e-6,
            1.5056327351493116e-7
        };

        double clampUnit(double v) {
            return std::min(1.0, std::max(0.0, v));
        }

        // P(s, x) sorfejtéssel, x < s+1 tartományban
        double lowerSeries(double s, double x, double lnGammaS) {
            double ap = s;
            double sum = 1.0 / s;
            double del = sum;
            for (int n = 1; n < GAMMA_MAX_ITERATIONS; ++n) {
                ap += 1.0;
                del *= x / ap;
                sum += del;
                if (std::fabs(del) < std::fabs(sum) * GAMMA_EPSILON) break;
            }
            return sum * std::exp(s * std::log(x) - x - lnGammaS);
        }

        // Q(s, x) lánctört, módosított Lentz-módszer
        double upperContinuedFraction(double s, double x, double lnGammaS) {
            double b = x + 1.0 - s;
            double c = 1.0 / FPMIN;
            double d = 1.0 / b;
            double h = d;
            for (int i = 1; i < GAMMA_MAX_ITERATIONS; ++i) {
                double an = -i * (i - s);
                b += 2.0;
                d = an * d + b;
                if (std::fabs(d) < FPMIN) d = FPMIN;
                c = b + an / c;
                if (std::fabs(c) < FPMIN) c = FPMIN;
                d = 1.0 / d;
                double del = d * c;
                h *= del;
                if (std::fabs(del - 1.0) < GAMMA_EPSILON) break;
            }
            return std::exp(s * std::log(x) - x - lnGammaS) * h;
        }

    } // namespace

    double lnGamma(double z) {
        if (z < 0.5) {
            // Reflexió: Γ(z)Γ(1-z) = π / sin(πz)
            return std::log(PI) - std::log(std::fabs(std::sin(PI * z))) - lnGamma(1.0 - z);
        }
        z -= 1.0;
        double x = 0.99999999999980993;
        for (size_t i = 0; i < LANCZOS.size(); ++i) {
            x += LANCZOS[i] / (z + static_cast<double>(i) + 1.0);
        }
        const double t = z + static_cast<double>(LANCZOS.size()) - 0.5;
        return 0.5 * std::log(2.0 * PI) + (z + 0.5) * std::log(t) - t + std::log(x);
    }

    double gammaincUpperRegularized(double s, double x) {
        if (x <= 0.0 || s <= 0.0) return 1.0;

        const double lnGammaS = lnGamma(s);
        if (x < s + 1.0) {
            return clampUnit(1.0 - clampUnit(lowerSeries(s, x, lnGammaS)));
        }
        return clampUnit(upperContinuedFraction(s, x, lnGammaS));
    }

    double erfc(double x) {
        if (x < 0.0) {
            return 2.0 - erfc(-x);
        }
        return gammaincUpperRegularized(0.5, x * x);
    }

    double normalCDF(double z) {
        return 0.5 * erfc(-z / std::sqrt(2.0));
    }

    double chiSquareUpperTail(double chi2, double df) {
        return gammaincUpperRegularized(df / 2.0, chi2 / 2.0);
    }

} // namespace Sequencer::Analysis::Special
