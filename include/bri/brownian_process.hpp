#pragma once

/// @file include/bri/brownian_process.hpp
/// @brief BrownianProcess: Brownian motion with drift observed at discrete times.
///
/// # Module: Brownian Process
///
/// ## Responsibility
/// Given every observation made so far, derive the conditional distribution
/// of the process value at any query time, sample it, and (optionally) record
/// the sample so that later queries are conditioned on it.
///
/// ## Query Classification
/// For a query time t with martingale-relevant points (L, R):
///   - neither L nor R      → HistoryCorruptionError (seed point lost)
///   - L.time == t or R.time == t → point mass at the observed value
///   - only L               → N(L.val + μ(t − L.t), σ²(t − L.t))
///   - only R               → N(R.val + μ(t − R.t), σ²(R.t − t))
///   - L and R              → precision-weighted fusion of both projections
///                            (the Brownian-bridge conditional)
///
/// ## Side Effects
/// `getValue` and `getValues` insert their samples into the history by
/// default, so the order of queries changes results. `getPossibleValueDistr`
/// and `getJointValueDistr` never mutate anything.
///
/// ## Batch Policy
/// `getValues` samples in ascending time order whatever the input order, each
/// sample becoming visible to the later ones. The result is one draw of the
/// joint law returned by `getJointValueDistr`.
///
/// ## Guarantees
/// - The history always holds at least the seed point
/// - σ and μ are fixed after construction
/// - Not thread-safe: a shared history must be serialised by the caller

#include "bri/brownian_history.hpp"
#include "bri/constants.hpp"
#include "bri/sampler.hpp"
#include "bri/types.hpp"

#include <memory>
#include <span>
#include <vector>

namespace bri::brownian {

// ─── ProcessConfig ────────────────────────────────────────────────────────────

/// Construction parameters of a BrownianProcess.
struct ProcessConfig {
    /// Diffusion coefficient σ. Must be finite and ≥ 0.
    double sigma = 1.0;

    /// Time of the seed observation inserted into the history.
    double start_time = constants::DEFAULT_START_TIME;

    /// Value of the seed observation inserted into the history.
    double start_value = constants::DEFAULT_START_VALUE;

    /// Drift rate μ per unit time.
    double drift = constants::DEFAULT_DRIFT;

    /// If true, emit one diagnostic line per sample to stderr.
    bool verbose = false;
};

// ─── BrownianProcess ──────────────────────────────────────────────────────────

class BrownianProcess {
public:
    /// Construct a process and seed its history with (start_time, start_value).
    ///
    /// # Arguments
    /// * `config`: σ, μ and the seed point
    /// * `history`: shared history to condition on; a fresh one if null.
    ///               The seed is not inserted when the history already holds
    ///               an observation at start_time.
    /// * `sampler`: source of Gaussian draws; a NormalSampler if null
    ///
    /// # Throws
    /// InvalidParameterError if σ is negative or any parameter is not finite.
    explicit BrownianProcess(ProcessConfig                    config,
                             std::shared_ptr<BrownianHistory> history = nullptr,
                             std::shared_ptr<GaussianSampler> sampler = nullptr);

    [[nodiscard]] double sigma() const noexcept { return config_.sigma; }
    [[nodiscard]] double drift() const noexcept { return config_.drift; }
    [[nodiscard]] const ProcessConfig& config() const noexcept { return config_; }

    /// The history all queries condition on.
    [[nodiscard]] BrownianHistory& getHistory() noexcept { return *history_; }
    [[nodiscard]] const BrownianHistory& getHistory() const noexcept { return *history_; }

    /// Shared handle to the history, for wiring another process onto it.
    [[nodiscard]] std::shared_ptr<BrownianHistory> sharedHistory() const noexcept {
        return history_;
    }

    [[nodiscard]] GaussianSampler& sampler() noexcept { return *sampler_; }

    /// Conditional distribution of the process value at `t`. No side effects.
    ///
    /// # Throws
    /// - InvalidParameterError  if `t` is not finite
    /// - HistoryCorruptionError if the history holds no observation at all
    [[nodiscard]] NormalDistribution getPossibleValueDistr(double t) const;

    /// Draw one value at `t` and, if `storeInHistory`, record it.
    ///
    /// Point-mass distributions return the observed value without drawing.
    double getValue(double t, bool storeInHistory = true);

    /// One sample per entry of `times`, returned in input order.
    ///
    /// Times are processed in ascending order and every sample is recorded,
    /// so later times in the batch are conditioned on earlier ones. All times
    /// are validated before any sample is drawn.
    std::vector<double> getValues(std::span<const double> times);

    /// Joint distribution at `times` conditioned on the current history only.
    /// No side effects. Duplicate times yield identical rows.
    [[nodiscard]] JointNormal getJointValueDistr(std::span<const double> times) const;

private:
    /// Martingale-relevant points of `t`; throws if both are absent.
    [[nodiscard]] NeighborPair bracket(double t) const;

    /// Distribution of `t` given its already-computed bracket.
    [[nodiscard]] NormalDistribution distrFrom(const NeighborPair& pair, double t) const noexcept;

    static void validateConfig(const ProcessConfig& config);
    static void requireFinite(double t, const char* where);

    ProcessConfig                    config_;
    std::shared_ptr<BrownianHistory> history_;
    std::shared_ptr<GaussianSampler> sampler_;
};

} // namespace bri::brownian
