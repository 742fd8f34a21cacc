#pragma once

/// @file include/bri/types.hpp
/// @brief Shared value types for the Brownian interpolation (BRI) library.
///
/// Every module includes this file. It defines the observation record, the
/// transient neighbor pair returned by ordered queries, and the Gaussian
/// descriptors produced by the Brownian process.

#include <Eigen/Dense>

#include <cmath>
#include <optional>
#include <vector>

namespace bri {

// ─── Observation ──────────────────────────────────────────────────────────────

/// A single observed point: a key (time or x-coordinate) and its value.
struct Observation {
    double key;    ///< Time or x-coordinate (unique per store)
    double value;  ///< Observed value at `key`

    friend bool operator==(const Observation&, const Observation&) = default;
};

/// The nearest observations bracketing a query key.
///
/// `left` is the observation with the largest key ≤ query, `right` the one
/// with the smallest key ≥ query. Either may be absent. On an exact hit both
/// hold the same observation.
struct NeighborPair {
    std::optional<Observation> left;
    std::optional<Observation> right;
};

// ─── Gaussian descriptors ─────────────────────────────────────────────────────

/// A univariate normal distribution N(mean, stddev²).
/// stddev == 0 denotes a point mass at `mean`.
struct NormalDistribution {
    double mean;
    double stddev;

    [[nodiscard]] double variance() const noexcept { return stddev * stddev; }
    [[nodiscard]] bool isPointMass() const noexcept { return stddev == 0.0; }
};

/// Joint normal distribution of the process at several query times.
///
/// Row/column i of `covariance` and entry i of `mean` refer to `times[i]`,
/// in the order the times were supplied.
struct JointNormal {
    std::vector<double> times;
    Eigen::VectorXd     mean;
    Eigen::MatrixXd     covariance;
};

} // namespace bri
