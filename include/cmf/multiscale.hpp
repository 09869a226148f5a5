#pragma once

/// @file include/cmf/multiscale.hpp
/// @brief Multi-Scale Coordinator: one metrics snapshot per timescale.
///
/// # Module: Multi-Scale Coordinator
///
/// ## Responsibility
/// Resample a full-resolution series to each requested timescale and run the
/// Metrics Engine once per scale.
///
/// ## Resampling
/// Fixed-stride decimation starting at sample 0:
///
///   | Timescale | Stride |
///   |-----------|--------|
///   | monthly   | 20     |
///   | weekly    | 5      |
///   | daily     | 1      |
///   | intraday  | 1      |
///
/// This subsamples rather than aggregating OHLC ranges per period. It is an
/// approximation kept on purpose; true period aggregation is out of scope.
///
/// ## Guarantees
/// - Scales are analysed as independent `std::async` tasks and joined before
///   the result is assembled; no shared mutable state
/// - An exception in one scale (a `ManifoldError` or any other
///   `std::exception`) is recorded in `failures` and never aborts the others

#include "cmf/metrics.hpp"
#include "cmf/types.hpp"

#include <future>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace cmf {

// ─── MultiScaleResult ─────────────────────────────────────────────────────────

/// Per-scale outcome of `MultiScaleAnalyzer::analyze_multiscale`.
struct MultiScaleResult {
    std::map<Timescale, ManifoldMetrics> scales;    ///< Successful analyses
    std::map<Timescale, std::string>     failures;  ///< Error message per failed scale

    /// True if `t` was analysed successfully.
    [[nodiscard]] bool contains(Timescale t) const noexcept {
        return scales.find(t) != scales.end();
    }
};

// ─── MultiScaleAnalyzer ───────────────────────────────────────────────────────

/// Fans a series out across timescales.
class MultiScaleAnalyzer {
public:
    /// # Throws
    /// `InvalidConfigurationError` from the underlying engine.
    explicit MultiScaleAnalyzer(EngineConfig config = EngineConfig{});

    /// Analyse `prices` at each timescale in `scales` (all four if empty).
    ///
    /// `timestamps` and `volume` may be empty; if present they are decimated
    /// with the prices. Duplicate scales are analysed once.
    [[nodiscard]] MultiScaleResult
    analyze_multiscale(std::span<const double> prices,
                       std::span<const double> timestamps = {},
                       std::span<const Timescale> scales = {},
                       std::span<const double> volume = {}) const;

    /// Decimation stride for a timescale.
    [[nodiscard]] static std::size_t stride(Timescale t) noexcept;

    /// Every `stride`-th sample of `x`, starting at index 0.
    [[nodiscard]] static std::vector<double>
    decimate(std::span<const double> x, std::size_t stride) noexcept;

    /// Join one scale's task into `result`: the snapshot on success, the
    /// exception message in `failures` otherwise.
    static void record(Timescale t, std::future<ManifoldMetrics>& task, MultiScaleResult& result);

    [[nodiscard]] const ManifoldEngine& engine() const noexcept { return engine_; }

private:
    ManifoldEngine engine_;
};

}  // namespace cmf
