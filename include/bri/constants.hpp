#pragma once

#include <cstdint>

/// @file include/bri/constants.hpp
/// @brief Defaults and numerical tolerances for the BRI library.

namespace bri::constants {

// ─── Process Defaults ─────────────────────────────────────────────────────────

/// Time of the seed observation when none is given.
static constexpr double DEFAULT_START_TIME = 0.0;

/// Value of the seed observation when none is given.
static constexpr double DEFAULT_START_VALUE = 0.0;

/// Drift rate μ when none is given (driftless Brownian motion).
static constexpr double DEFAULT_DRIFT = 0.0;

/// Seed of the NormalSampler a process creates when no sampler is injected.
static constexpr std::uint64_t DEFAULT_SAMPLER_SEED = 5489u;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Eigenvalues of a joint covariance below this magnitude are treated as 0
/// when forming its square root (round-off on singular bridge blocks).
static constexpr double COVARIANCE_EIGEN_FLOOR = 1e-12;

} // namespace bri::constants
