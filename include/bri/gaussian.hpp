#pragma once

/// @file include/bri/gaussian.hpp
/// @brief Closed-form Gaussian beliefs for Brownian motion with drift.
///
/// # Module: Gaussian Beliefs
///
/// ## Increments
/// For Brownian motion with diffusion σ and drift μ, the value at time t
/// given a known observation (t₀, v₀) is
///
///   X(t) ~ N(v₀ + μ·(t − t₀),  σ²·|t − t₀|)
///
/// The same formula is used in both directions: a known future point implies
/// a distribution over the past.
///
/// ## Fusion
/// Two independent Gaussian estimates of the same unknown combine by
/// precision weighting:
///
///   pₐ = 1/σₐ²,  p_b = 1/σ_b²
///   mean     = (pₐ·μₐ + p_b·μ_b) / (pₐ + p_b)
///   variance = 1 / (pₐ + p_b)
///
/// Fusing the forward projection from the left neighbor with the backward
/// projection from the right neighbor gives the Brownian-bridge conditional.
///
/// ## Edge Cases
/// - One input is a point mass: the result is that point mass
/// - Both inputs are point masses: the result is a point mass at their midpoint
/// - σ = 0: every projection is a point mass

#include "bri/types.hpp"

namespace bri::brownian {

/// One-sided projection of the process value at `t` from a known observation.
[[nodiscard]] NormalDistribution
projectFrom(const Observation& known, double t, double sigma, double drift) noexcept;

/// Precision-weighted fusion of two independent beliefs about one quantity.
[[nodiscard]] NormalDistribution
fuse(const NormalDistribution& a, const NormalDistribution& b) noexcept;

} // namespace bri::brownian
