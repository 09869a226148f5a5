/**
 * @file  fuzz_engine.cpp
 * @brief libFuzzer target for the ManifoldEngine → ManifoldInterpreter path
 *
 * Build:
 *   cmake -DCMF_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_engine
 *
 * Run for 60 seconds:
 *   ./fuzz_engine -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. analyze() either throws a ManifoldError or returns a snapshot that:
 *      a. is self-consistent (all arrays length N, singularities in range)
 *      b. has at least one attractor
 *      c. has finite curvature, tension and flow when every price lies
 *         in [1e-3, 1e9] (outside that band intermediate sums may overflow)
 *   3. interpret() on that snapshot yields confidence ∈ [0, 1], and
 *      ∈ (0, 1] under the same scaling condition as 2c.
 *
 * Fuzzer strategy:
 *   Input bytes → raw IEEE 754 doubles (prices), so NaN, ±Inf, ±0.0,
 *   subnormals and huge magnitudes all reach validation. The first byte
 *   picks the sensitivity so the threshold path is fuzzed as well.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cassert>
#include <cmath>
#include <vector>

#include "cmf/errors.hpp"
#include "cmf/interpreter.hpp"
#include "cmf/metrics.hpp"

using namespace cmf;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 1) {
        return 0;
    }

    EngineConfig config;
    config.sensitivity = 0.25 + static_cast<double>(data[0]) / 32.0;  // (0, 8.2]
    ++data;
    --size;

    std::vector<double> prices(size / sizeof(double));
    for (std::size_t i = 0; i < prices.size(); ++i) {
        std::memcpy(&prices[i], data + i * sizeof(double), sizeof(double));
    }

    const ManifoldEngine engine(config);
    ManifoldMetrics metrics;
    try {
        metrics = engine.analyze(prices);
    } catch (const ManifoldError&) {
        // Rejected input (too short, non-finite) is a valid outcome.
        return 0;
    }

    // Invariant 2a
    assert(metrics.is_consistent());
    assert(metrics.size() == prices.size());

    // Invariant 2b
    assert(!metrics.attractors.empty());

    // Invariant 2c
    const bool well_scaled = std::all_of(prices.begin(), prices.end(),
                                         [](double p) { return p >= 1e-3 && p <= 1e9; });
    if (well_scaled) {
        for (std::size_t i = 0; i < metrics.size(); ++i) {
            assert(std::isfinite(metrics.curvature[i]));
            assert(std::isfinite(metrics.tension[i]));
            assert(std::isfinite(metrics.flow[i]));
        }
    }

    // Invariant 3
    const ManifoldInterpreter interp;
    const auto reading = interp.interpret(metrics);
    assert(reading.confidence >= 0.0);
    assert(reading.confidence <= 1.0);
    if (well_scaled) {
        assert(reading.confidence > 0.0);
    }

    return 0;
}
