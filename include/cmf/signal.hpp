#pragma once

/// @file include/cmf/signal.hpp
/// @brief Discrete signal-processing primitives used by the Metrics Engine.
///
/// # Module: Signal Primitives
///
/// ## Responsibility
/// Provide the handful of array operations the engine is built from, with
/// the exact boundary conventions of their NumPy / SciPy counterparts so that
/// metrics reproduce reference numbers:
///
///   - `gradient`         ≙ numpy.gradient (edge order 1)
///   - `gaussian_filter`  ≙ scipy.ndimage.gaussian_filter1d (mode "reflect")
///   - `histogram`        ≙ numpy.histogram (equal-width bins)
///   - `find_peaks`       ≙ scipy.signal.find_peaks (height, distance, prominence)
///
/// ## Guarantees
/// - All functions are `noexcept` and never return NaN/Inf for finite input
/// - Output length of `gradient` / `gaussian_filter` equals input length
/// - Stateless and thread-safe

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace cmf::signal {

// ─── Moments ──────────────────────────────────────────────────────────────────

/// Arithmetic mean. Returns 0.0 for an empty input.
[[nodiscard]] double mean(std::span<const double> x) noexcept;

/// Population standard deviation (ddof = 0). Returns 0.0 for an empty input.
[[nodiscard]] double stddev(std::span<const double> x) noexcept;

/// Mean of successive differences, (x[n-1] − x[0]) / (n − 1).
/// Returns 0.0 if fewer than two samples are given.
[[nodiscard]] double mean_diff(std::span<const double> x) noexcept;

/// The trailing `count` samples of `x` (all of `x` if shorter).
[[nodiscard]] std::span<const double>
tail(std::span<const double> x, std::size_t count) noexcept;

// ─── Differentiation / Smoothing ──────────────────────────────────────────────

/// Discrete gradient: central differences in the interior, one-sided first
/// differences at both ends. Inputs shorter than two samples yield zeros.
[[nodiscard]] std::vector<double> gradient(std::span<const double> x) noexcept;

/// 1-D Gaussian filter.
///
/// Kernel radius is `int(truncate · sigma + 0.5)`; weights are normalised to
/// sum to one. Samples beyond either end are taken from the half-sample
/// symmetric extension (d c b a | a b c d | d c b a), repeated as often as
/// the radius requires. `sigma <= 0` returns the input unchanged.
[[nodiscard]] std::vector<double>
gaussian_filter(std::span<const double> x,
                double sigma,
                double truncate = 4.0) noexcept;

// ─── Histogram ────────────────────────────────────────────────────────────────

/// Equal-width histogram.
struct Histogram {
    std::vector<double> heights;  ///< Counts, or densities if requested
    std::vector<double> edges;    ///< bins + 1 monotonically increasing edges

    /// Centre of bucket `i`. Precondition: i < heights.size().
    [[nodiscard]] double center(std::size_t i) const noexcept;

    /// Bucket index for `value`, or `nullopt` if it lies outside [edges.front(),
    /// edges.back()]. The last bucket is closed on the right.
    [[nodiscard]] std::optional<std::size_t> bucket_of(double value) const noexcept;
};

/// Build a `bins`-bucket histogram over [min(x), max(x)].
///
/// A zero-width range is widened to [v − 0.5, v + 0.5]. With `density`, each
/// height is `count / (total · bucket_width)` so the histogram integrates to
/// one. An empty input or `bins == 0` yields an empty histogram.
[[nodiscard]] Histogram histogram(std::span<const double> x,
                                  std::size_t bins,
                                  bool density = false) noexcept;

// ─── Peak Detection ───────────────────────────────────────────────────────────

/// Filters applied by `find_peaks`, in the order height → distance → prominence.
struct PeakCriteria {
    std::optional<double> min_height;      ///< Keep peaks with x[p] >= min_height
    std::optional<double> min_prominence;  ///< Keep peaks with prominence >= value
    std::size_t           min_distance = 1;///< Minimum index separation (>= 1)
};

/// Indices of strict local maxima.
///
/// End points are never peaks. A flat plateau is reported once, at its
/// middle sample (rounded down).
[[nodiscard]] std::vector<std::size_t>
local_maxima(std::span<const double> x) noexcept;

/// Topographic prominence of each peak: its height above the higher of the
/// two lowest points reached before climbing to a strictly higher sample on
/// either side (or the array end).
[[nodiscard]] std::vector<double>
peak_prominences(std::span<const double> x,
                 std::span<const std::size_t> peaks) noexcept;

/// Detect peaks satisfying `criteria`.
///
/// Distance filtering keeps the highest peaks first and discards any lower
/// peak closer than `min_distance` samples to an already kept one.
///
/// # Returns
/// Ascending peak indices.
[[nodiscard]] std::vector<std::size_t>
find_peaks(std::span<const double> x, const PeakCriteria& criteria) noexcept;

}  // namespace cmf::signal
