#pragma once
#include <cmath>
#include <random>

constexpr double kTwoPi = 6.283185307179586;

// Draws built straight from the 32-bit engine output. std::*_distribution
// algorithms differ between standard libraries, these do not.

/// Uniform in (0, 1).
inline double uniform01(std::mt19937& rng) {
    return ((double)rng() + 0.5) / 4294967296.0;
}

/// Uniform integer in [0, n).
inline int uniform_index(std::mt19937& rng, int n) {
    int i = (int)(uniform01(rng) * n);
    return i < n ? i : n - 1;
}

/// Standard normal (Box-Muller, one value per call).
inline double standard_normal(std::mt19937& rng) {
    double u1 = uniform01(rng);
    double u2 = uniform01(rng);
    return std::sqrt(-2.0 * std::log(u1)) * std::cos(kTwoPi * u2);
}
