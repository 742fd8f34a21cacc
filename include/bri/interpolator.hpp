#pragma once

/// @file include/bri/interpolator.hpp
/// @brief Streaming interpolators: deterministic values from streamed points.
///
/// # Module: Streaming Interpolators
///
/// ## Responsibility
/// Accept (x, value) points in any order and, at any moment, return a value
/// for an arbitrary query x derived from its bracketing observations.
///
/// ## Shared Rules (all variants)
///   - empty store             → nullopt
///   - exact hit on x          → the stored value
///   - only one neighbor       → that neighbor's value (no extrapolation)
///   - two distinct neighbors  → variant-specific `between()`
///
/// ## Variants
///   Linear:          (|x−R.x|·L.val + |x−L.x|·R.val) / (|x−R.x| + |x−L.x|)
///   NearestNeighbor: value of the strictly closer neighbor; ties go RIGHT
///
/// ## Complexity
/// insert and query are O(log n) (see ObservationStore).

#include "bri/observation_store.hpp"
#include "bri/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bri::interp {

// ─── InterpolationKind ────────────────────────────────────────────────────────

enum class InterpolationKind {
    Linear,
    NearestNeighbor,
};

/// "linear" or "nearest".
[[nodiscard]] std::string to_string(InterpolationKind kind);

/// Inverse of to_string; nullopt for any other name.
[[nodiscard]] std::optional<InterpolationKind>
parseInterpolationKind(std::string_view name) noexcept;

// ─── StreamingInterpolator ────────────────────────────────────────────────────

/// Interpolator over an ObservationStore.
///
/// Each instance owns a fresh store unless one is injected at construction,
/// in which case every interpolator built on it sees the same points.
class StreamingInterpolator {
public:
    explicit StreamingInterpolator(std::shared_ptr<store::ObservationStore> store = nullptr);
    virtual ~StreamingInterpolator() = default;

    StreamingInterpolator(const StreamingInterpolator&)            = delete;
    StreamingInterpolator& operator=(const StreamingInterpolator&) = delete;

    /// Register a data point. Throws InvalidParameterError for non-finite x.
    void insert(double x, double val);

    /// Interpolated value at `x`, or nullopt if no point has been inserted.
    [[nodiscard]] std::optional<double> getInterpolatedVal(double x) const noexcept;

    /// getInterpolatedVal applied to every entry of `xs`, in order.
    [[nodiscard]] std::vector<std::optional<double>>
    getInterpolatedVals(std::span<const double> xs) const;

    [[nodiscard]] virtual InterpolationKind kind() const noexcept = 0;

    [[nodiscard]] std::size_t size() const noexcept { return store_->size(); }
    [[nodiscard]] const store::ObservationStore& store() const noexcept { return *store_; }

protected:
    /// Value at `x` strictly between two distinct neighbors (left.key < x < right.key).
    [[nodiscard]] virtual double
    between(const Observation& left, const Observation& right, double x) const noexcept = 0;

private:
    std::shared_ptr<store::ObservationStore> store_;
};

// ─── Variants ─────────────────────────────────────────────────────────────────

/// Inverse-distance weighting of the two bracketing points.
class LinearInterpolator final : public StreamingInterpolator {
public:
    using StreamingInterpolator::StreamingInterpolator;

    [[nodiscard]] InterpolationKind kind() const noexcept override {
        return InterpolationKind::Linear;
    }

protected:
    [[nodiscard]] double
    between(const Observation& left, const Observation& right, double x) const noexcept override;
};

/// Value of the closer bracketing point; equidistant queries take the right one.
class NearestNeighborInterpolator final : public StreamingInterpolator {
public:
    using StreamingInterpolator::StreamingInterpolator;

    [[nodiscard]] InterpolationKind kind() const noexcept override {
        return InterpolationKind::NearestNeighbor;
    }

protected:
    [[nodiscard]] double
    between(const Observation& left, const Observation& right, double x) const noexcept override;
};

/// Build an interpolator of the given kind, optionally over a shared store.
[[nodiscard]] std::unique_ptr<StreamingInterpolator>
makeInterpolator(InterpolationKind kind,
                 std::shared_ptr<store::ObservationStore> store = nullptr);

} // namespace bri::interp
