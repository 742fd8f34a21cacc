#pragma once

/// @file include/bri/sampler.hpp
/// @brief Gaussian sampling capability used by the Brownian process.
///
/// `GaussianSampler` is the seam through which all randomness enters BRI.
/// The library ships `NormalSampler` (Mersenne Twister); tests and callers
/// may inject their own implementation.

#include "bri/constants.hpp"
#include "bri/types.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <random>

namespace bri::brownian {

/// Draws one value from N(mean, stddev²).
class GaussianSampler {
public:
    virtual ~GaussianSampler() = default;

    /// Draw from N(mean, stddev²). stddev == 0 must return `mean` exactly.
    [[nodiscard]] virtual double draw(double mean, double stddev) = 0;
};

/// Seedable sampler on std::mt19937_64.
class NormalSampler final : public GaussianSampler {
public:
    explicit NormalSampler(std::uint64_t seed = constants::DEFAULT_SAMPLER_SEED);

    /// # Throws
    /// InvalidParameterError if stddev is negative or not finite.
    [[nodiscard]] double draw(double mean, double stddev) override;

    /// Restart the stream from `seed`.
    void reseed(std::uint64_t seed);

private:
    std::mt19937_64                  engine_;
    std::normal_distribution<double> standard_{0.0, 1.0};
};

/// Draw one joint sample from `joint`.
///
/// Uses an eigen-decomposition of the covariance, so singular (positive
/// semi-definite) matrices such as those containing exact observations are
/// handled. Eigenvalues within COVARIANCE_EIGEN_FLOOR of zero are treated
/// as zero.
///
/// # Throws
/// InvalidParameterError if the covariance is not square of the mean's size,
/// or has a materially negative eigenvalue.
[[nodiscard]] Eigen::VectorXd drawJoint(const JointNormal& joint, GaussianSampler& sampler);

} // namespace bri::brownian
