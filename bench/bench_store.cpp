/**
 * @file  bench/bench_store.cpp
 * @brief Google Benchmark suite for ordered-store and interpolation throughput.
 *
 * Benchmarks
 * ----------
 *   BM_Store_Insert          streaming inserts in shuffled order
 *   BM_Store_FloorCeiling    neighbor queries on a populated store
 *   BM_Linear_Query          LinearInterpolator::getInterpolatedVal
 *   BM_Process_GetValue      sample + record on a growing history
 *
 * Build (CMake):
 *   cmake -DBRI_BENCH=ON ..
 *   cmake --build build --target bench_store
 *   ./build/bench_store --benchmark_format=json
 *
 * Throughput units: items/second. Per-item time should grow as O(log n).
 */

#include "benchmark/benchmark.h"

#include "bri/brownian_process.hpp"
#include "bri/interpolator.hpp"
#include "bri/observation_store.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <numeric>
#include <random>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N distinct keys 0..N−1 in a fixed pseudo-random order.
static std::vector<double> make_keys(std::size_t n) {
    std::vector<double> k(n);
    std::iota(k.begin(), k.end(), 0.0);
    std::mt19937_64 rng(42);
    std::shuffle(k.begin(), k.end(), rng);
    return k;
}

// ── Store benchmarks ───────────────────────────────────────────────────────────

static void BM_Store_Insert(benchmark::State& state) {
    const auto n    = static_cast<std::size_t>(state.range(0));
    const auto keys = make_keys(n);
    for (auto _ : state) {
        bri::store::ObservationStore s;
        for (double k : keys) {
            s.insert(k, k);
        }
        benchmark::DoNotOptimize(s.size());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Store_Insert)->RangeMultiplier(8)->Range(64, 262144)->Unit(benchmark::kMicrosecond);

static void BM_Store_FloorCeiling(benchmark::State& state) {
    const auto n    = static_cast<std::size_t>(state.range(0));
    const auto keys = make_keys(n);
    bri::store::ObservationStore s;
    for (double k : keys) {
        s.insert(k, k);
    }
    std::size_t i = 0;
    for (auto _ : state) {
        const double q = keys[i++ % n] + 0.5;
        benchmark::DoNotOptimize(s.floor(q));
        benchmark::DoNotOptimize(s.ceiling(q));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Store_FloorCeiling)->RangeMultiplier(8)->Range(64, 262144);

// ── Interpolation benchmarks ───────────────────────────────────────────────────

static void BM_Linear_Query(benchmark::State& state) {
    const auto n    = static_cast<std::size_t>(state.range(0));
    const auto keys = make_keys(n);
    bri::interp::LinearInterpolator ip;
    for (double k : keys) {
        ip.insert(k, k * 2.0);
    }
    std::size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(ip.getInterpolatedVal(keys[i++ % n] + 0.25));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Linear_Query)->RangeMultiplier(8)->Range(64, 262144);

// ── Process benchmarks ─────────────────────────────────────────────────────────

static void BM_Process_GetValue(benchmark::State& state) {
    const auto n    = static_cast<std::size_t>(state.range(0));
    const auto keys = make_keys(n);
    for (auto _ : state) {
        bri::brownian::BrownianProcess p(bri::brownian::ProcessConfig{.sigma = 1.0});
        for (double k : keys) {
            benchmark::DoNotOptimize(p.getValue(k + 0.5));
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Process_GetValue)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
