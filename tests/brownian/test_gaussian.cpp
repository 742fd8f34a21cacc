/// @file tests/brownian/test_gaussian.cpp
/// @brief Tests for one-sided projections and precision-weighted fusion.
///
/// Test categories:
///   - Forward and backward projection mean/stddev
///   - Uncertainty grows as sqrt(|Δt|) and is zero at the reference time
///   - Fusion: closed form, symmetry, confidence always increases
///   - Degenerate (point-mass) inputs

#include <gtest/gtest.h>
#include "bri/gaussian.hpp"

#include <cmath>

using namespace bri;
using namespace bri::brownian;

// ─── projectFrom ──────────────────────────────────────────────────────────────

TEST(ProjectFrom, ForwardProjection) {
    const auto d = projectFrom(Observation{1.0, 5.0}, 5.0, 2.0, 0.5);
    EXPECT_DOUBLE_EQ(d.mean, 5.0 + 0.5 * 4.0);
    EXPECT_DOUBLE_EQ(d.stddev, 2.0 * std::sqrt(4.0));
}

TEST(ProjectFrom, BackwardProjection_DriftSubtracts) {
    // Known future point at t=10; query t=6 → mean = 3 + μ·(6 − 10).
    const auto d = projectFrom(Observation{10.0, 3.0}, 6.0, 1.5, 0.25);
    EXPECT_DOUBLE_EQ(d.mean, 3.0 + 0.25 * -4.0);
    EXPECT_DOUBLE_EQ(d.stddev, 1.5 * 2.0);
}

TEST(ProjectFrom, ZeroAtReferenceTime) {
    const auto d = projectFrom(Observation{2.0, 9.0}, 2.0, 3.0, 1.0);
    EXPECT_DOUBLE_EQ(d.mean, 9.0);
    EXPECT_DOUBLE_EQ(d.stddev, 0.0);
    EXPECT_TRUE(d.isPointMass());
}

TEST(ProjectFrom, StddevGrowsAsSqrtOfDistance) {
    const Observation ref{0.0, 0.0};
    const double sigma = 0.7;
    for (double dt : {0.25, 1.0, 4.0, 16.0, 100.0}) {
        EXPECT_NEAR(projectFrom(ref,  dt, sigma, 0.0).stddev, sigma * std::sqrt(dt), 1e-12);
        EXPECT_NEAR(projectFrom(ref, -dt, sigma, 0.0).stddev, sigma * std::sqrt(dt), 1e-12);
    }
    EXPECT_LT(projectFrom(ref, 1.0, sigma, 0.0).stddev,
              projectFrom(ref, 2.0, sigma, 0.0).stddev);
}

TEST(ProjectFrom, ZeroSigma_PointMassOnDriftLine) {
    const auto d = projectFrom(Observation{0.0, 1.0}, 3.0, 0.0, 2.0);
    EXPECT_DOUBLE_EQ(d.mean, 7.0);
    EXPECT_TRUE(d.isPointMass());
}

// ─── fuse ─────────────────────────────────────────────────────────────────────

TEST(Fuse, ClosedForm) {
    const NormalDistribution a{.mean = 1.0, .stddev = 1.0};   // precision 1
    const NormalDistribution b{.mean = 4.0, .stddev = 0.5};   // precision 4
    const auto f = fuse(a, b);
    EXPECT_NEAR(f.mean, (1.0 * 1.0 + 4.0 * 4.0) / 5.0, 1e-12);
    EXPECT_NEAR(f.variance(), 1.0 / 5.0, 1e-12);
}

TEST(Fuse, EqualVariance_ArithmeticMean) {
    const NormalDistribution a{.mean = -2.0, .stddev = 3.0};
    const NormalDistribution b{.mean = 6.0,  .stddev = 3.0};
    const auto f = fuse(a, b);
    EXPECT_NEAR(f.mean, 2.0, 1e-12);
    EXPECT_NEAR(f.variance(), 4.5, 1e-12);
}

TEST(Fuse, VarianceStrictlyShrinks) {
    const NormalDistribution a{.mean = 0.0, .stddev = 0.3};
    const NormalDistribution b{.mean = 1.0, .stddev = 2.0};
    const auto f = fuse(a, b);
    EXPECT_LT(f.variance(), a.variance());
    EXPECT_LT(f.variance(), b.variance());
    // Equivalent product form.
    EXPECT_NEAR(f.variance(),
                a.variance() * b.variance() / (a.variance() + b.variance()), 1e-12);
}

TEST(Fuse, Commutative) {
    const NormalDistribution a{.mean = 0.4, .stddev = 0.9};
    const NormalDistribution b{.mean = -3.0, .stddev = 0.2};
    const auto ab = fuse(a, b);
    const auto ba = fuse(b, a);
    EXPECT_NEAR(ab.mean, ba.mean, 1e-12);
    EXPECT_NEAR(ab.stddev, ba.stddev, 1e-12);
}

TEST(Fuse, PointMassWins) {
    const NormalDistribution known{.mean = 5.0, .stddev = 0.0};
    const NormalDistribution vague{.mean = 0.0, .stddev = 10.0};
    const auto f1 = fuse(known, vague);
    const auto f2 = fuse(vague, known);
    EXPECT_DOUBLE_EQ(f1.mean, 5.0);
    EXPECT_TRUE(f1.isPointMass());
    EXPECT_DOUBLE_EQ(f2.mean, 5.0);
    EXPECT_TRUE(f2.isPointMass());
}

TEST(Fuse, TwoPointMasses_Midpoint) {
    const auto f = fuse(NormalDistribution{.mean = 2.0, .stddev = 0.0},
                        NormalDistribution{.mean = 4.0, .stddev = 0.0});
    EXPECT_DOUBLE_EQ(f.mean, 3.0);
    EXPECT_TRUE(f.isPointMass());
}

TEST(Fuse, TinyStddev_NoNaN) {
    // 1e-200² underflows to 0; must behave as a point mass, not produce NaN.
    const auto f = fuse(NormalDistribution{.mean = 1.0, .stddev = 1e-200},
                        NormalDistribution{.mean = 9.0, .stddev = 1.0});
    EXPECT_TRUE(std::isfinite(f.mean));
    EXPECT_DOUBLE_EQ(f.mean, 1.0);
}
