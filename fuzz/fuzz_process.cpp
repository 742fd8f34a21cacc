/**
 * @file  fuzz_process.cpp
 * @brief libFuzzer target for BrownianProcess queries and sampling
 *
 * Build:
 *   cmake -DBRI_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_process
 *
 * Safety invariants verified on every input:
 *   1. Invalid parameters and non-finite times raise InvalidParameterError,
 *      never anything else.
 *   2. A valid process never raises HistoryCorruptionError.
 *   3. Every returned stddev is ≥ 0 (or NaN only when inputs overflow).
 *   4. After getValue(t), getPossibleValueDistr(t) is a point mass.
 *
 * Fuzzer strategy:
 *   First 3 doubles → (sigma, drift, start_value); remaining doubles → times.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "bri/brownian_process.hpp"
#include "bri/errors.hpp"

using namespace bri;
using namespace bri::brownian;

namespace {

double read_double(const uint8_t* data, size_t index) {
    double v{};
    __builtin_memcpy(&v, data + index * sizeof(double), sizeof(double));
    return v;
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const size_t n = size / sizeof(double);
    if (n < 3) {
        return 0;
    }

    ProcessConfig cfg{
        .sigma       = read_double(data, 0),
        .start_value = read_double(data, 2),
        .drift       = read_double(data, 1),
    };

    std::unique_ptr<BrownianProcess> process;
    try {
        process = std::make_unique<BrownianProcess>(cfg, nullptr,
                                                    std::make_shared<NormalSampler>(1));
    } catch (const InvalidParameterError&) {
        assert(!(std::isfinite(cfg.sigma) && cfg.sigma >= 0.0 &&
                 std::isfinite(cfg.drift) && std::isfinite(cfg.start_value)));
        return 0;
    }

    for (size_t i = 3; i < n; ++i) {
        const double t = read_double(data, i);
        try {
            const auto d = process->getPossibleValueDistr(t);
            assert(std::isnan(d.stddev) || d.stddev >= 0.0);
            if (!std::isfinite(d.mean) || !std::isfinite(d.stddev)) {
                continue;  // overflow from extreme times; sampler would reject
            }
            (void)process->getValue(t);
            assert(process->getPossibleValueDistr(t).isPointMass());
        } catch (const InvalidParameterError&) {
            assert(!std::isfinite(t));
        }
    }

    return 0;
}
