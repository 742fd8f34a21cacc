/// @file src/interpolation/nearest_neighbor_interpolator.cpp
/// @brief NearestNeighborInterpolator: closer neighbor wins, ties go right.

#include "bri/interpolator.hpp"

#include <cmath>

namespace bri::interp {

double NearestNeighborInterpolator::between(const Observation& left,
                                            const Observation& right,
                                            double x) const noexcept {
    if (std::abs(x - left.key) < std::abs(x - right.key)) {
        return left.value;
    }
    return right.value;
}

} // namespace bri::interp
