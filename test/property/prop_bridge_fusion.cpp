/**
 * @file  prop_bridge_fusion.cpp
 * @brief Property: Brownian-bridge fusion is symmetric and always sharpens.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_bridge_fusion
 *
 * Mathematical basis:
 *   Forward N(m_L, σ²(t−L)), backward N(m_R, σ²(R−t)), fused by precision:
 *     var = σ²(t−L)(R−t)/(R−L)  <  min(σ²(t−L), σ²(R−t))
 *   At the midpoint the two precisions are equal, so the fused mean is the
 *   arithmetic mean of the one-sided means.
 *   The bridge mean is the straight line between the two observations, for
 *   any drift μ.
 *
 * Failure modes this test guards against:
 *   • Swapped precisions (weighting the farther neighbor more)
 *   • Using stddev instead of variance in the weights
 *   • Drift leaking into the bridge mean
 */

#include <rapidcheck.h>

#include "bri/brownian_process.hpp"
#include "bri/gaussian.hpp"

#include <cmath>

using namespace bri;
using namespace bri::brownian;

namespace {

/// Map an arbitrary int to a value in [lo, hi] on a fine grid.
double scaled(int raw, double lo, double hi) {
    const double u = static_cast<double>(raw % 10007 < 0 ? -(raw % 10007) : raw % 10007) / 10006.0;
    return lo + (hi - lo) * u;
}

} // namespace

int main() {
    bool ok = true;

    // ── Property 1: midpoint fusion mean == arithmetic mean ──────────────────
    ok &= rc::check(
        "bridge_fusion: equal distance => fused mean is the average",
        [](int raw_sigma, int raw_half, int raw_l, int raw_r, int raw_mu) {
            const double sigma = scaled(raw_sigma, 0.01, 5.0);
            const double half  = scaled(raw_half, 0.01, 50.0);
            const double mu    = scaled(raw_mu, -3.0, 3.0);
            const Observation left{0.0, scaled(raw_l, -100.0, 100.0)};
            const Observation right{2.0 * half, scaled(raw_r, -100.0, 100.0)};

            const auto a = projectFrom(left,  half, sigma, mu);
            const auto b = projectFrom(right, half, sigma, mu);
            const auto f = fuse(a, b);

            RC_ASSERT(std::abs(f.mean - 0.5 * (a.mean + b.mean)) < 1e-9);
            RC_ASSERT(f.variance() < a.variance());
            RC_ASSERT(f.variance() < b.variance());
        }
    );

    // ── Property 2: fused variance is the bridge variance ────────────────────
    ok &= rc::check(
        "bridge_fusion: var == sigma^2 (t-L)(R-t)/(R-L)",
        [](int raw_sigma, int raw_len, int raw_frac) {
            const double sigma = scaled(raw_sigma, 0.01, 5.0);
            const double len   = scaled(raw_len, 0.1, 100.0);
            const double t     = len * scaled(raw_frac, 0.01, 0.99);

            BrownianProcess p(ProcessConfig{.sigma = sigma});
            p.getHistory().insertData(len, 1.0);
            const auto d = p.getPossibleValueDistr(t);

            const double expected = sigma * sigma * t * (len - t) / len;
            RC_ASSERT(std::abs(d.variance() - expected) <= 1e-9 * (1.0 + expected));
        }
    );

    // ── Property 3: the bridge mean ignores drift ────────────────────────────
    ok &= rc::check(
        "bridge_fusion: bridge mean is linear interpolation for any drift",
        [](int raw_mu, int raw_v, int raw_frac) {
            const double mu = scaled(raw_mu, -10.0, 10.0);
            const double v  = scaled(raw_v, -50.0, 50.0);
            const double t  = 10.0 * scaled(raw_frac, 0.01, 0.99);

            BrownianProcess p(ProcessConfig{.sigma = 1.0, .drift = mu});
            p.getHistory().insertData(10.0, v);
            const auto d = p.getPossibleValueDistr(t);

            RC_ASSERT(std::abs(d.mean - v * t / 10.0) < 1e-8);
        }
    );

    return ok ? 0 : 1;
}
