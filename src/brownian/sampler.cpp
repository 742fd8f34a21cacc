/// @file src/brownian/sampler.cpp
/// @brief NormalSampler and joint sampling through Eigen.

#include "bri/sampler.hpp"
#include "bri/errors.hpp"

#include <fmt/format.h>

#include <cmath>

namespace bri::brownian {

// ─── NormalSampler ────────────────────────────────────────────────────────────

NormalSampler::NormalSampler(std::uint64_t seed)
    : engine_(seed) {}

double NormalSampler::draw(double mean, double stddev) {
    if (!std::isfinite(stddev) || stddev < 0.0) {
        throw InvalidParameterError(
            fmt::format("NormalSampler::draw: stddev must be finite and >= 0, got {}", stddev));
    }
    if (stddev == 0.0) {
        return mean;
    }
    return mean + stddev * standard_(engine_);
}

void NormalSampler::reseed(std::uint64_t seed) {
    engine_.seed(seed);
    standard_.reset();
}

// ─── drawJoint ────────────────────────────────────────────────────────────────

Eigen::VectorXd drawJoint(const JointNormal& joint, GaussianSampler& sampler) {
    const Eigen::Index n = joint.mean.size();
    if (joint.covariance.rows() != n || joint.covariance.cols() != n) {
        throw InvalidParameterError(fmt::format(
            "drawJoint: covariance is {}x{}, expected {}x{}",
            joint.covariance.rows(), joint.covariance.cols(), n, n));
    }
    if (n == 0) {
        return Eigen::VectorXd{};
    }

    // Σ = V Λ Vᵀ, so x = μ + V Λ^{1/2} z with z ~ N(0, I).
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(joint.covariance);
    if (solver.info() != Eigen::Success) {
        throw InvalidParameterError("drawJoint: eigen-decomposition of covariance failed");
    }

    Eigen::VectorXd root(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double lambda = solver.eigenvalues()(i);
        if (lambda < -constants::COVARIANCE_EIGEN_FLOOR) {
            throw InvalidParameterError(fmt::format(
                "drawJoint: covariance is not positive semi-definite (eigenvalue {})", lambda));
        }
        root(i) = lambda <= constants::COVARIANCE_EIGEN_FLOOR ? 0.0 : std::sqrt(lambda);
    }

    Eigen::VectorXd z(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        z(i) = sampler.draw(0.0, 1.0);
    }

    return joint.mean + solver.eigenvectors() * root.cwiseProduct(z);
}

} // namespace bri::brownian
