/**
 * @file  fuzz_interpolator.cpp
 * @brief libFuzzer target for ObservationStore and the streaming interpolators
 *
 * Build:
 *   cmake -DBRI_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_interpolator
 *
 * Run for 60 seconds:
 *   ./fuzz_interpolator -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB for any key/value bytes including NaN, ±Inf, ±0.0,
 *      subnormals. Non-finite keys are rejected with InvalidParameterError.
 *   2. The store iterates in strictly increasing key order.
 *   3. floor(q).key ≤ q ≤ ceiling(q).key whenever present.
 *   4. Interpolated values lie within the bracketing values when finite.
 *
 * Fuzzer strategy:
 *   Input bytes → consecutive (key, value) double pairs, then each key is
 *   also used as a query.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "bri/errors.hpp"
#include "bri/interpolator.hpp"

using namespace bri;
using namespace bri::interp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    LinearInterpolator          linear;
    NearestNeighborInterpolator nearest;
    std::vector<double>         queries;

    // ── Feed (key, value) pairs ──────────────────────────────────────────────
    const size_t pair_bytes = 2 * sizeof(double);
    for (size_t off = 0; off + pair_bytes <= size; off += pair_bytes) {
        double key{};
        double value{};
        __builtin_memcpy(&key,   data + off,                  sizeof(double));
        __builtin_memcpy(&value, data + off + sizeof(double), sizeof(double));
        queries.push_back(key);

        try {
            linear.insert(key, value);
            nearest.insert(key, value);
            assert(std::isfinite(key));
        } catch (const InvalidParameterError&) {
            assert(!std::isfinite(key));
        }
    }

    // ── Store ordering ───────────────────────────────────────────────────────
    const auto& store = linear.store();
    bool   first = true;
    double prev  = 0.0;
    for (const auto& [k, v] : store) {
        assert(first || prev < k);
        prev  = k;
        first = false;
    }

    // ── Queries ──────────────────────────────────────────────────────────────
    for (double q : queries) {
        const auto f = store.floor(q);
        const auto c = store.ceiling(q);
        if (f) assert(f->key <= q);
        if (c) assert(c->key >= q);

        const auto lv = linear.getInterpolatedVal(q);
        const auto nv = nearest.getInterpolatedVal(q);
        assert(lv.has_value() == nv.has_value());

        if (lv && f && c && std::isfinite(f->value) && std::isfinite(c->value)
                && std::isfinite(*lv)) {
            const double lo = std::fmin(f->value, c->value);
            const double hi = std::fmax(f->value, c->value);
            const double slack = 1e-9 * (1.0 + std::fabs(lo) + std::fabs(hi));
            assert(*lv >= lo - slack && *lv <= hi + slack);
        }
    }

    return 0;
}
