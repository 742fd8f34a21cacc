#pragma once

/// @file include/bri/observation_store.hpp
/// @brief ObservationStore: ordered key → value map with neighbor queries.
///
/// # Module: Observation Store
///
/// ## Responsibility
/// Hold a set of observations keyed by time (or x-coordinate) in strictly
/// increasing key order, and answer the ordered neighbor queries every
/// interpolation algorithm in BRI is built on.
///
/// ## Contract
///   floor(k)   = observation with the largest key ≤ k, or none
///   ceiling(k) = observation with the smallest key ≥ k, or none
///
/// When k is a stored key, floor(k) == ceiling(k) == (k, value).
///
/// ## Complexity
/// Backed by a red-black tree (`std::map`): insert, floor, ceiling, find and
/// contains are O(log n); minKey/maxKey are O(1).
///
/// ## Edge Cases
/// - Empty store: floor/ceiling return none; minKey/maxKey throw EmptyStoreError
/// - Re-inserting an existing key replaces its value
/// - NaN query keys match nothing (floor/ceiling return none)
/// - Non-finite keys are rejected on insert (InvalidParameterError)
///
/// ## NOT Responsible For
/// - Deletion (a store never shrinks)
/// - Synchronisation: single writer, callers serialise concurrent access

#include "bri/types.hpp"

#include <cstddef>
#include <map>
#include <optional>

namespace bri::store {

/// Ordered observation map supporting O(log n) neighbor queries.
class ObservationStore {
public:
    using container_type = std::map<double, double>;
    using const_iterator = container_type::const_iterator;

    /// Construct an empty store.
    ObservationStore() = default;

    /// Construct a store holding a single seed observation.
    ObservationStore(double key, double value);

    /// Add or replace the observation at `key`.
    ///
    /// # Throws
    /// InvalidParameterError if `key` is NaN or infinite.
    void insert(double key, double value);

    /// Observation with the largest stored key ≤ `key`, or nullopt.
    [[nodiscard]] std::optional<Observation> floor(double key) const noexcept;

    /// Observation with the smallest stored key ≥ `key`, or nullopt.
    [[nodiscard]] std::optional<Observation> ceiling(double key) const noexcept;

    /// Value stored at exactly `key`, or nullopt.
    [[nodiscard]] std::optional<double> find(double key) const noexcept;

    [[nodiscard]] bool contains(double key) const noexcept;
    [[nodiscard]] bool isEmpty() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    /// Smallest stored key. Throws EmptyStoreError on an empty store.
    [[nodiscard]] double minKey() const;

    /// Largest stored key. Throws EmptyStoreError on an empty store.
    [[nodiscard]] double maxKey() const;

    /// Iteration in strictly increasing key order.
    [[nodiscard]] const_iterator begin() const noexcept { return data_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return data_.end(); }

private:
    container_type data_;
};

} // namespace bri::store
