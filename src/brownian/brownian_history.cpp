/// @file src/brownian/brownian_history.cpp
/// @brief BrownianHistory: neighbor lookup for the Brownian process.

#include "bri/brownian_history.hpp"

namespace bri::brownian {

void BrownianHistory::insertData(double t, double val) {
    store_.insert(t, val);
}

NeighborPair BrownianHistory::getMartingaleRelevantPoints(double t) const noexcept {
    return NeighborPair{
        .left  = store_.floor(t),
        .right = store_.ceiling(t),
    };
}

} // namespace bri::brownian
