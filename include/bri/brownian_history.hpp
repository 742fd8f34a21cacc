#pragma once

/// @file include/bri/brownian_history.hpp
/// @brief BrownianHistory: the known (time, value) points of a Brownian process.
///
/// Wraps an ObservationStore and exposes the martingale-relevant points of a
/// query time: the nearest observation at or before it and the nearest at or
/// after it. An exact hit returns the same observation on both sides; callers
/// treat that as a zero-variance case.

#include "bri/observation_store.hpp"
#include "bri/types.hpp"

#include <cstddef>

namespace bri::brownian {

class BrownianHistory {
public:
    BrownianHistory() = default;

    /// Insert (or overwrite) the observation at time `t`.
    /// Throws InvalidParameterError if `t` is not finite.
    void insertData(double t, double val);

    /// (floor(t), ceiling(t)) of the underlying store; each may be absent.
    [[nodiscard]] NeighborPair getMartingaleRelevantPoints(double t) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return store_.size(); }
    [[nodiscard]] bool isEmpty() const noexcept { return store_.isEmpty(); }

    /// Read-only access to the ordered observations.
    [[nodiscard]] const store::ObservationStore& store() const noexcept { return store_; }

private:
    store::ObservationStore store_;
};

} // namespace bri::brownian
