/// @file src/brownian/brownian_process.cpp
/// @brief BrownianProcess: conditional distributions, sampling and joint law.

#include "bri/brownian_process.hpp"
#include "bri/errors.hpp"
#include "bri/gaussian.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <numeric>
#include <utility>

namespace bri::brownian {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

/// Which observations a query time is conditioned on.
enum class AnchorKind { Exact, Forward, Backward, Bridge };

struct Anchor {
    AnchorKind kind;
    double     left;   ///< Left anchor time (Forward, Bridge)
    double     right;  ///< Right anchor time (Backward, Bridge)
};

[[nodiscard]] Anchor classify(const NeighborPair& pair, double t) noexcept {
    if ((pair.left && pair.left->key == t) || (pair.right && pair.right->key == t)) {
        return Anchor{AnchorKind::Exact, t, t};
    }
    if (pair.left && pair.right) {
        return Anchor{AnchorKind::Bridge, pair.left->key, pair.right->key};
    }
    if (pair.left) {
        return Anchor{AnchorKind::Forward, pair.left->key, pair.left->key};
    }
    return Anchor{AnchorKind::Backward, pair.right->key, pair.right->key};
}

/// Covariance of X(s) and X(u) for two distinct queries sharing `a`'s anchors.
/// Queries in different segments are conditionally independent (Markov).
[[nodiscard]] double crossCovariance(const Anchor& a, const Anchor& b,
                                     double s, double u, double sigma) noexcept {
    if (a.kind != b.kind || a.kind == AnchorKind::Exact) {
        return 0.0;
    }
    if (a.left != b.left || a.right != b.right) {
        return 0.0;
    }
    const double lo = std::min(s, u);
    const double hi = std::max(s, u);
    const double var_rate = sigma * sigma;

    switch (a.kind) {
        case AnchorKind::Forward:
            return var_rate * (lo - a.left);
        case AnchorKind::Backward:
            return var_rate * (a.right - hi);
        case AnchorKind::Bridge:
            return var_rate * (lo - a.left) * (a.right - hi) / (a.right - a.left);
        case AnchorKind::Exact:
            break;
    }
    return 0.0;
}

} // anonymous namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

BrownianProcess::BrownianProcess(ProcessConfig                    config,
                                 std::shared_ptr<BrownianHistory> history,
                                 std::shared_ptr<GaussianSampler> sampler)
    : config_(std::move(config)),
      history_(history ? std::move(history) : std::make_shared<BrownianHistory>()),
      sampler_(sampler ? std::move(sampler) : std::make_shared<NormalSampler>())
{
    validateConfig(config_);

    if (!history_->store().contains(config_.start_time)) {
        history_->insertData(config_.start_time, config_.start_value);
    }

    if (config_.verbose) {
        fmt::print(stderr, "[bri] process sigma={} drift={} seed=({}, {}) history={}\n",
                   config_.sigma, config_.drift, config_.start_time,
                   config_.start_value, history_->size());
    }
}

// ─── Validation ───────────────────────────────────────────────────────────────

void BrownianProcess::validateConfig(const ProcessConfig& config) {
    if (!std::isfinite(config.sigma) || config.sigma < 0.0) {
        throw InvalidParameterError(fmt::format(
            "BrownianProcess: sigma must be finite and >= 0, got {}", config.sigma));
    }
    if (!std::isfinite(config.drift)) {
        throw InvalidParameterError(fmt::format(
            "BrownianProcess: drift must be finite, got {}", config.drift));
    }
    if (!std::isfinite(config.start_time) || !std::isfinite(config.start_value)) {
        throw InvalidParameterError(fmt::format(
            "BrownianProcess: seed point must be finite, got ({}, {})",
            config.start_time, config.start_value));
    }
}

void BrownianProcess::requireFinite(double t, const char* where) {
    if (!std::isfinite(t)) {
        throw InvalidParameterError(fmt::format(
            "BrownianProcess::{}: query time must be finite, got {}", where, t));
    }
}

// ─── bracket ──────────────────────────────────────────────────────────────────

NeighborPair BrownianProcess::bracket(double t) const {
    auto pair = history_->getMartingaleRelevantPoints(t);
    if (!pair.left && !pair.right) {
        throw HistoryCorruptionError(fmt::format(
            "BrownianProcess: no observation brackets t={}; the history lost its seed point", t));
    }
    return pair;
}

// ─── getPossibleValueDistr ────────────────────────────────────────────────────

NormalDistribution
BrownianProcess::distrFrom(const NeighborPair& pair, double t) const noexcept {
    // Exact hit: the value is known.
    if (pair.left && pair.left->key == t) {
        return NormalDistribution{.mean = pair.left->value, .stddev = 0.0};
    }
    if (pair.right && pair.right->key == t) {
        return NormalDistribution{.mean = pair.right->value, .stddev = 0.0};
    }

    if (pair.left && !pair.right) {
        return projectFrom(*pair.left, t, config_.sigma, config_.drift);
    }
    if (pair.right && !pair.left) {
        return projectFrom(*pair.right, t, config_.sigma, config_.drift);
    }

    // Bridge: both one-sided projections, fused.
    const auto from_left  = projectFrom(*pair.left,  t, config_.sigma, config_.drift);
    const auto from_right = projectFrom(*pair.right, t, config_.sigma, config_.drift);
    return fuse(from_left, from_right);
}

NormalDistribution BrownianProcess::getPossibleValueDistr(double t) const {
    requireFinite(t, "getPossibleValueDistr");
    return distrFrom(bracket(t), t);
}

// ─── getValue ─────────────────────────────────────────────────────────────────

double BrownianProcess::getValue(double t, bool storeInHistory) {
    const auto distr = getPossibleValueDistr(t);
    const double sample = distr.isPointMass()
        ? distr.mean
        : sampler_->draw(distr.mean, distr.stddev);

    if (config_.verbose) {
        fmt::print(stderr, "[bri] t={} mean={} stddev={} sample={}{}\n",
                   t, distr.mean, distr.stddev, sample,
                   storeInHistory ? "" : " (not stored)");
    }

    if (storeInHistory) {
        history_->insertData(t, sample);
    }
    return sample;
}

// ─── getValues ────────────────────────────────────────────────────────────────

std::vector<double> BrownianProcess::getValues(std::span<const double> times) {
    for (double t : times) {
        requireFinite(t, "getValues");
    }

    std::vector<std::size_t> order(times.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return times[a] < times[b]; });

    std::vector<double> samples(times.size());
    for (std::size_t idx : order) {
        samples[idx] = getValue(times[idx], true);
    }
    return samples;
}

// ─── getJointValueDistr ───────────────────────────────────────────────────────

JointNormal BrownianProcess::getJointValueDistr(std::span<const double> times) const {
    for (double t : times) {
        requireFinite(t, "getJointValueDistr");
    }

    const auto n = static_cast<Eigen::Index>(times.size());
    JointNormal joint{
        .times      = std::vector<double>(times.begin(), times.end()),
        .mean       = Eigen::VectorXd::Zero(n),
        .covariance = Eigen::MatrixXd::Zero(n, n),
    };

    std::vector<Anchor> anchors;
    anchors.reserve(times.size());

    for (Eigen::Index i = 0; i < n; ++i) {
        const double t    = times[static_cast<std::size_t>(i)];
        const auto   pair = bracket(t);
        const auto   marg = distrFrom(pair, t);
        joint.mean(i)          = marg.mean;
        joint.covariance(i, i) = marg.variance();
        anchors.push_back(classify(pair, t));
    }

    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = i + 1; j < n; ++j) {
            const auto si = static_cast<std::size_t>(i);
            const auto sj = static_cast<std::size_t>(j);
            const double cov = (times[si] == times[sj])
                ? joint.covariance(i, i)
                : crossCovariance(anchors[si], anchors[sj], times[si], times[sj], config_.sigma);
            joint.covariance(i, j) = cov;
            joint.covariance(j, i) = cov;
        }
    }

    return joint;
}

} // namespace bri::brownian
