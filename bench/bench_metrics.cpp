/**
 * @file  bench/bench_metrics.cpp
 * @brief Google Benchmark suite for the metrics engine and interpreter.
 *
 * Benchmarks
 * ----------
 *   BM_Curvature          - z-score, double gradient, Gaussian smoothing
 *   BM_LocalEntropy       - rolling histogram entropy (dominant cost)
 *   BM_Tension            - momentum × distance from long average
 *   BM_Attractors         - price histogram + peak search
 *   BM_Analyze            - full snapshot
 *   BM_AnalyzeMultiscale  - four timescales, one worker per scale
 *   BM_Interpret          - phase cascade, readings, narrative
 *
 * Build (CMake):
 *   cmake -DCMF_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_metrics
 *   ./build/bench_metrics --benchmark_format=json
 *
 * Throughput units: items/second (price samples processed).
 */

#include "benchmark/benchmark.h"

#include "cmf/interpreter.hpp"
#include "cmf/metrics.hpp"
#include "cmf/multiscale.hpp"

#include <cmath>
#include <cstddef>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N samples of a drifting, double-frequency wave around 100.
static std::vector<double> make_prices(std::size_t n) {
    std::vector<double> p(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i);
        p[i] = 100.0 + 8.0 * std::sin(x / 9.0) + 2.0 * std::sin(x / 2.3) + 0.01 * x;
    }
    return p;
}

static void set_throughput(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

// ── Individual metrics ─────────────────────────────────────────────────────────

static void BM_Curvature(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto prices = make_prices(n);
    const cmf::ManifoldEngine engine;
    for (auto _ : state) {
        auto c = engine.calculate_curvature(prices);
        benchmark::DoNotOptimize(c.data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Curvature)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_LocalEntropy(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto prices = make_prices(n);
    const cmf::ManifoldEngine engine;
    for (auto _ : state) {
        auto e = engine.calculate_local_entropy(prices);
        benchmark::DoNotOptimize(e.data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_LocalEntropy)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Tension(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto prices = make_prices(n);
    const cmf::ManifoldEngine engine;
    for (auto _ : state) {
        auto t = engine.calculate_tension(prices);
        benchmark::DoNotOptimize(t.data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Tension)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Attractors(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto prices = make_prices(n);
    const cmf::ManifoldEngine engine;
    for (auto _ : state) {
        auto a = engine.find_attractors(prices);
        benchmark::DoNotOptimize(a.data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Attractors)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Full pipeline ──────────────────────────────────────────────────────────────

static void BM_Analyze(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto prices = make_prices(n);
    const cmf::ManifoldEngine engine;
    for (auto _ : state) {
        auto m = engine.analyze(prices);
        benchmark::DoNotOptimize(m.curvature.data());
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Analyze)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_AnalyzeMultiscale(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto prices = make_prices(n);
    const cmf::MultiScaleAnalyzer analyzer;
    for (auto _ : state) {
        auto r = analyzer.analyze_multiscale(prices);
        benchmark::DoNotOptimize(r);
    }
    set_throughput(state, n);
}
BENCHMARK(BM_AnalyzeMultiscale)->RangeMultiplier(4)->Range(1024, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Interpret(benchmark::State& state) {
    const auto prices = make_prices(1000);
    const cmf::ManifoldEngine engine;
    const auto metrics = engine.analyze(prices);
    const cmf::ManifoldInterpreter interp;
    for (auto _ : state) {
        auto r = interp.interpret(metrics);
        benchmark::DoNotOptimize(r.confidence);
    }
}
BENCHMARK(BM_Interpret);

BENCHMARK_MAIN();
