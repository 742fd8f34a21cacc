/// @file src/store/observation_store.cpp
/// @brief ObservationStore: ordered neighbor queries over std::map.

#include "bri/observation_store.hpp"
#include "bri/errors.hpp"

#include <fmt/format.h>

#include <cmath>

namespace bri::store {

// ─── Constructor ──────────────────────────────────────────────────────────────

ObservationStore::ObservationStore(double key, double value) {
    insert(key, value);
}

// ─── insert ───────────────────────────────────────────────────────────────────

void ObservationStore::insert(double key, double value) {
    // NaN would break the strict weak ordering of the tree.
    if (!std::isfinite(key)) {
        throw InvalidParameterError(
            fmt::format("ObservationStore::insert: key must be finite, got {}", key));
    }
    data_.insert_or_assign(key, value);
}

// ─── floor / ceiling ──────────────────────────────────────────────────────────

std::optional<Observation> ObservationStore::floor(double key) const noexcept {
    if (std::isnan(key)) {
        return std::nullopt;
    }
    // First element with stored key > key; its predecessor is the floor.
    auto it = data_.upper_bound(key);
    if (it == data_.begin()) {
        return std::nullopt;
    }
    --it;
    return Observation{it->first, it->second};
}

std::optional<Observation> ObservationStore::ceiling(double key) const noexcept {
    if (std::isnan(key)) {
        return std::nullopt;
    }
    const auto it = data_.lower_bound(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return Observation{it->first, it->second};
}

// ─── find / contains ──────────────────────────────────────────────────────────

std::optional<double> ObservationStore::find(double key) const noexcept {
    if (std::isnan(key)) {
        return std::nullopt;
    }
    const auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ObservationStore::contains(double key) const noexcept {
    return find(key).has_value();
}

// ─── size / isEmpty ───────────────────────────────────────────────────────────

bool ObservationStore::isEmpty() const noexcept {
    return data_.empty();
}

std::size_t ObservationStore::size() const noexcept {
    return data_.size();
}

// ─── minKey / maxKey ──────────────────────────────────────────────────────────

double ObservationStore::minKey() const {
    if (data_.empty()) {
        throw EmptyStoreError("ObservationStore::minKey called on an empty store");
    }
    return data_.begin()->first;
}

double ObservationStore::maxKey() const {
    if (data_.empty()) {
        throw EmptyStoreError("ObservationStore::maxKey called on an empty store");
    }
    return data_.rbegin()->first;
}

} // namespace bri::store
