/// @file src/brownian/gaussian.cpp
/// @brief One-sided Brownian projections and precision-weighted fusion.

#include "bri/gaussian.hpp"

#include <cmath>

namespace bri::brownian {

// ─── projectFrom ──────────────────────────────────────────────────────────────

NormalDistribution
projectFrom(const Observation& known, double t, double sigma, double drift) noexcept {
    const double dt = t - known.key;
    return NormalDistribution{
        .mean   = known.value + drift * dt,
        .stddev = sigma * std::sqrt(std::abs(dt)),
    };
}

// ─── fuse ─────────────────────────────────────────────────────────────────────

NormalDistribution
fuse(const NormalDistribution& a, const NormalDistribution& b) noexcept {
    // Variance, not stddev, decides the degenerate cases: a tiny stddev can
    // square to zero and would otherwise yield an infinite precision.
    const double var_a = a.variance();
    const double var_b = b.variance();

    if (var_a == 0.0 && var_b == 0.0) {
        return NormalDistribution{.mean = 0.5 * (a.mean + b.mean), .stddev = 0.0};
    }
    if (var_a == 0.0) {
        return NormalDistribution{.mean = a.mean, .stddev = 0.0};
    }
    if (var_b == 0.0) {
        return NormalDistribution{.mean = b.mean, .stddev = 0.0};
    }

    const double precision_a = 1.0 / var_a;
    const double precision_b = 1.0 / var_b;
    const double precision   = precision_a + precision_b;

    return NormalDistribution{
        .mean   = (precision_a * a.mean + precision_b * b.mean) / precision,
        .stddev = std::sqrt(1.0 / precision),
    };
}

} // namespace bri::brownian
