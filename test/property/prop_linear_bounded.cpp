/**
 * @file  prop_linear_bounded.cpp
 * @brief Property: interpolated values never leave the bracketing values.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_linear_bounded
 *
 * For any stream of points and any query x:
 *   • Linear:  min(L.val, R.val) ≤ f(x) ≤ max(L.val, R.val)
 *   • Nearest: f(x) ∈ {L.val, R.val}
 *   • Insert order does not change the result
 */

#include <rapidcheck.h>

#include "bri/interpolator.hpp"

#include <algorithm>
#include <vector>

using namespace bri::interp;

int main() {
    bool ok = true;

    ok &= rc::check(
        "linear_bounded: linear value lies between its neighbors",
        [](const std::vector<int>& raw, int raw_query) {
            RC_PRE(!raw.empty());
            LinearInterpolator ip;
            for (int k : raw) {
                ip.insert(static_cast<double>(k % 300), static_cast<double>(k % 97));
            }
            const double x = static_cast<double>(raw_query % 400) * 0.75;

            const auto v = ip.getInterpolatedVal(x);
            RC_ASSERT(v.has_value());

            const auto l = ip.store().floor(x);
            const auto r = ip.store().ceiling(x);
            const double lo = std::min(l ? l->value : r->value, r ? r->value : l->value);
            const double hi = std::max(l ? l->value : r->value, r ? r->value : l->value);
            RC_ASSERT(*v >= lo - 1e-9);
            RC_ASSERT(*v <= hi + 1e-9);
        }
    );

    ok &= rc::check(
        "linear_bounded: nearest value is one of its neighbors",
        [](const std::vector<int>& raw, int raw_query) {
            RC_PRE(!raw.empty());
            NearestNeighborInterpolator ip;
            for (int k : raw) {
                ip.insert(static_cast<double>(k % 300), static_cast<double>(k));
            }
            const double x = static_cast<double>(raw_query % 400) * 0.75;

            const auto v = ip.getInterpolatedVal(x);
            RC_ASSERT(v.has_value());
            const auto l = ip.store().floor(x);
            const auto r = ip.store().ceiling(x);
            RC_ASSERT((l && *v == l->value) || (r && *v == r->value));
        }
    );

    ok &= rc::check(
        "linear_bounded: result independent of insert order",
        [](std::vector<int> raw, int raw_query) {
            RC_PRE(!raw.empty());
            // Distinct keys only: with duplicates the last write wins by design.
            std::sort(raw.begin(), raw.end());
            raw.erase(std::unique(raw.begin(), raw.end()), raw.end());

            LinearInterpolator forward;
            LinearInterpolator backward;
            for (int k : raw) {
                forward.insert(static_cast<double>(k), static_cast<double>(k) * 0.5);
            }
            for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
                backward.insert(static_cast<double>(*it), static_cast<double>(*it) * 0.5);
            }
            const double x = static_cast<double>(raw_query) * 0.3;
            RC_ASSERT(*forward.getInterpolatedVal(x) == *backward.getInterpolatedVal(x));
        }
    );

    return ok ? 0 : 1;
}
