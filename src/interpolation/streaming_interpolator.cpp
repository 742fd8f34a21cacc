/// @file src/interpolation/streaming_interpolator.cpp
/// @brief Shared query rules of all streaming interpolators, and the factory.

#include "bri/interpolator.hpp"

#include <utility>

namespace bri::interp {

// ─── InterpolationKind ────────────────────────────────────────────────────────

std::string to_string(InterpolationKind kind) {
    switch (kind) {
        case InterpolationKind::Linear:          return "linear";
        case InterpolationKind::NearestNeighbor: return "nearest";
    }
    return "unknown";
}

std::optional<InterpolationKind>
parseInterpolationKind(std::string_view name) noexcept {
    if (name == "linear") {
        return InterpolationKind::Linear;
    }
    if (name == "nearest") {
        return InterpolationKind::NearestNeighbor;
    }
    return std::nullopt;
}

// ─── StreamingInterpolator ────────────────────────────────────────────────────

StreamingInterpolator::StreamingInterpolator(std::shared_ptr<store::ObservationStore> store)
    : store_(store ? std::move(store) : std::make_shared<store::ObservationStore>())
{}

void StreamingInterpolator::insert(double x, double val) {
    store_->insert(x, val);
}

std::optional<double> StreamingInterpolator::getInterpolatedVal(double x) const noexcept {
    if (store_->isEmpty()) {
        return std::nullopt;
    }

    const auto left  = store_->floor(x);
    const auto right = store_->ceiling(x);

    if (left && left->key == x) {
        return left->value;
    }
    if (right && right->key == x) {
        return right->value;
    }

    // On an edge: no extrapolation.
    if (!left && !right) {
        return std::nullopt;  // NaN query
    }
    if (!left) {
        return right->value;
    }
    if (!right) {
        return left->value;
    }

    return between(*left, *right, x);
}

std::vector<std::optional<double>>
StreamingInterpolator::getInterpolatedVals(std::span<const double> xs) const {
    std::vector<std::optional<double>> out;
    out.reserve(xs.size());
    for (double x : xs) {
        out.push_back(getInterpolatedVal(x));
    }
    return out;
}

// ─── makeInterpolator ─────────────────────────────────────────────────────────

std::unique_ptr<StreamingInterpolator>
makeInterpolator(InterpolationKind kind, std::shared_ptr<store::ObservationStore> store) {
    switch (kind) {
        case InterpolationKind::Linear:
            return std::make_unique<LinearInterpolator>(std::move(store));
        case InterpolationKind::NearestNeighbor:
            return std::make_unique<NearestNeighborInterpolator>(std::move(store));
    }
    return nullptr;
}

} // namespace bri::interp
