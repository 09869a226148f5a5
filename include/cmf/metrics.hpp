#pragma once

/// @file include/cmf/metrics.hpp
/// @brief Metrics Engine: geometric / statistical shape of a price series.
///
/// # Module: Metrics Engine
///
/// ## Responsibility
/// Treat a price series as a one-dimensional manifold and measure its shape:
///
///   - curvature      - smoothed second derivative of the z-scored price
///   - entropy        - Shannon entropy of the return distribution
///                      (whole series, and a rolling local window)
///   - tension        - accumulated momentum × distance from equilibrium
///   - singularities  - joint curvature/tension extremes
///   - attractors     - high-visitation price levels
///   - flow           - smoothed Ricci-flow relaxation rate
///
/// ## Usage
/// ```cpp
/// cmf::ManifoldEngine engine;
/// auto metrics = engine.analyze(prices, {}, cmf::Timescale::Daily, volume);
/// fmt::print("entropy = {:.3f}\n", metrics.entropy);
/// ```
///
/// ## Guarantees
/// - `analyze` validates its input and throws a `ManifoldError` subclass on
///   bad shape; every other method is `noexcept`
/// - Zero-variance input never produces NaN/Inf (all denominators + 1e-8)
/// - The engine holds only read-only configuration: a `const ManifoldEngine`
///   may be shared across threads
/// - Caller arrays are never modified

#include "cmf/constants.hpp"
#include "cmf/types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace cmf {

// ─── ManifoldMetrics ──────────────────────────────────────────────────────────

/// Snapshot produced by one `ManifoldEngine::analyze` call.
///
/// Every per-sample array has the same length as `prices`. Treat a snapshot
/// as an immutable value once it has been returned.
struct ManifoldMetrics {
    std::vector<double>      timestamps;     ///< Input timestamps, or 0..N-1
    std::vector<double>      prices;         ///< Copy of the input prices
    std::vector<double>      curvature;      ///< Smoothed second derivative
    double                   entropy = 0.0;  ///< Global return entropy
    std::vector<double>      local_entropy;  ///< Rolling return entropy
    std::vector<std::size_t> singularities;  ///< Ascending indices in [0, N)
    std::vector<Attractor>   attractors;     ///< Strongest first; never empty
    std::vector<double>      flow;           ///< Ricci-flow estimate
    std::vector<double>      tension;        ///< Z-scored tension
    Timescale                timescale = Timescale::Daily;

    /// Number of samples N.
    [[nodiscard]] std::size_t size() const noexcept { return prices.size(); }

    /// True if every per-sample array has length N and all singularity
    /// indices are ascending and in range.
    [[nodiscard]] bool is_consistent() const noexcept;
};

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Tunables for the Metrics Engine. Defaults come from `constants.hpp`.
struct EngineConfig {
    /// Multiplier applied to the singularity threshold only. Must be finite
    /// and in (0, MAX_SENSITIVITY].
    double sensitivity = constants::DEFAULT_SENSITIVITY;

    std::size_t curvature_smooth_window   = constants::CURVATURE_SMOOTH_WINDOW;
    std::size_t global_entropy_bins       = constants::GLOBAL_ENTROPY_BINS;
    std::size_t local_entropy_window      = constants::LOCAL_ENTROPY_WINDOW;
    double      singularity_threshold     = constants::SINGULARITY_THRESHOLD;
    std::size_t singularity_separation    = constants::SINGULARITY_MIN_SEPARATION;
    std::size_t max_attractors            = constants::MAX_ATTRACTORS;
    std::size_t attractor_bins            = constants::ATTRACTOR_BINS;
    double      flow_dt                   = constants::FLOW_DT;
};

// ─── ManifoldEngine ───────────────────────────────────────────────────────────

/// Computes `ManifoldMetrics` from a price series.
///
/// Optional inputs (`timestamps`, `volume`) are passed as spans; an empty
/// span means "absent".
class ManifoldEngine {
public:
    /// Construct with optional configuration.
    ///
    /// # Throws
    /// `InvalidConfigurationError` if sensitivity is non-finite or outside
    /// (0, MAX_SENSITIVITY], or any window / bin count is zero.
    explicit ManifoldEngine(EngineConfig config = EngineConfig{});

    /// Run every metric and assemble one snapshot.
    ///
    /// # Arguments
    /// * `prices`     - at least two finite samples
    /// * `timestamps` - empty, or non-decreasing finite values of equal length
    /// * `timescale`  - tag recorded in the snapshot
    /// * `volume`     - empty, or non-negative finite values of equal length
    ///
    /// # Throws
    /// - `InsufficientDataError` if `prices.size() < 2`
    /// - `InvalidInputError` on length mismatch, non-finite samples, negative
    ///   volume or decreasing timestamps
    [[nodiscard]] ManifoldMetrics
    analyze(std::span<const double> prices,
            std::span<const double> timestamps = {},
            Timescale timescale = Timescale::Daily,
            std::span<const double> volume = {}) const;

    /// Curvature: z-score prices, differentiate twice, Gaussian-smooth with
    /// σ = smooth_window / 3 (skipped when smooth_window <= 1).
    [[nodiscard]] std::vector<double>
    calculate_curvature(std::span<const double> prices,
                        std::size_t smooth_window = constants::CURVATURE_SMOOTH_WINDOW) const noexcept;

    /// Shannon entropy (bits) of the density histogram of simple returns.
    /// Returns 0.0 for fewer than two prices.
    [[nodiscard]] double
    calculate_global_entropy(std::span<const double> prices,
                             std::size_t bins = constants::GLOBAL_ENTROPY_BINS) const noexcept;

    /// Rolling entropy over the trailing `window` prices (excluding the
    /// current one) with min(10, window / 2) buckets. The first `window`
    /// samples repeat the first computed value; if N <= window the result is
    /// all zeros.
    [[nodiscard]] std::vector<double>
    calculate_local_entropy(std::span<const double> prices,
                            std::size_t window = constants::LOCAL_ENTROPY_WINDOW) const noexcept;

    /// Tension: |cumulative return| × relative distance from the long
    /// Gaussian average, optionally volume-weighted, then z-scored.
    /// Pass an empty `volume` for the unweighted form; a `volume` whose length
    /// differs from `prices` is ignored.
    [[nodiscard]] std::vector<double>
    calculate_tension(std::span<const double> prices,
                      std::span<const double> volume = {}) const noexcept;

    /// Indices where |curvature|·|tension| (each scaled by its own standard
    /// deviation) peaks at or above `threshold × sensitivity`, at least
    /// `config().singularity_separation` samples apart.
    [[nodiscard]] std::vector<std::size_t>
    detect_singularities(std::span<const double> curvature,
                         std::span<const double> tension,
                         double threshold = constants::SINGULARITY_THRESHOLD) const noexcept;

    /// High-density price levels, strongest first.
    ///
    /// Falls back to `{prices.back(), 1.0}` if no histogram peak qualifies.
    /// Returns an empty list only for empty `prices`.
    [[nodiscard]] std::vector<Attractor>
    find_attractors(std::span<const double> prices,
                    std::span<const double> volume = {},
                    std::size_t num_attractors = constants::MAX_ATTRACTORS) const noexcept;

    /// Ricci-flow estimate: Gaussian(σ=3) of gradient(−dt · c · (1 + t)).
    [[nodiscard]] std::vector<double>
    calculate_ricci_flow(std::span<const double> curvature,
                         std::span<const double> tension,
                         double dt = constants::FLOW_DT) const noexcept;

    /// Read-only configuration.
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    /// Entropy of the simple returns of `prices` using `bins` density buckets.
    [[nodiscard]] static double
    return_entropy(std::span<const double> prices, std::size_t bins) noexcept;

    /// Throw `InvalidInputError` / `InsufficientDataError` on malformed input.
    static void validate(std::span<const double> prices,
                         std::span<const double> timestamps,
                         std::span<const double> volume);

    EngineConfig config_;
};

}  // namespace cmf
