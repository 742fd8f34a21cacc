/// @file src/interpolation/linear_interpolator.cpp
/// @brief LinearInterpolator: inverse-distance weighting of two neighbors.

#include "bri/interpolator.hpp"

#include <cmath>

namespace bri::interp {

double LinearInterpolator::between(const Observation& left,
                                   const Observation& right,
                                   double x) const noexcept {
    // Each neighbor is weighted by the distance to the *other* one, so the
    // closer point dominates and the formula reduces to an exact hit as
    // either distance goes to zero.
    const double to_left  = std::abs(x - left.key);
    const double to_right = std::abs(x - right.key);
    return (to_right * left.value + to_left * right.value) / (to_right + to_left);
}

} // namespace bri::interp
