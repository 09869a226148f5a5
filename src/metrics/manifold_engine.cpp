/// @file src/metrics/manifold_engine.cpp
/// @brief Metrics Engine: curvature, entropy, tension, singularities,
///        attractors and Ricci-flow estimate.

#include "cmf/metrics.hpp"
#include "cmf/errors.hpp"
#include "cmf/signal.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>

namespace cmf {

namespace {

using constants::DENOM_EPSILON;
using constants::LOG_EPSILON;

ConstSeriesMap as_array(std::span<const double> x) noexcept {
    return ConstSeriesMap(x.data(), static_cast<Eigen::Index>(x.size()));
}

std::vector<double> to_vector(const SeriesArray& a) {
    return std::vector<double>(a.data(), a.data() + a.size());
}

bool all_finite(std::span<const double> x) noexcept {
    return std::all_of(x.begin(), x.end(), [](double v) { return std::isfinite(v); });
}

}  // anonymous namespace

// ─── ManifoldMetrics::is_consistent ──────────────────────────────────────────

bool ManifoldMetrics::is_consistent() const noexcept {
    const std::size_t n = prices.size();
    if (timestamps.size() != n || curvature.size() != n ||
        local_entropy.size() != n || flow.size() != n || tension.size() != n) {
        return false;
    }
    for (std::size_t k = 0; k < singularities.size(); ++k) {
        if (singularities[k] >= n) return false;
        if (k > 0 && singularities[k] <= singularities[k - 1]) return false;
    }
    return true;
}

// ─── Constructor ──────────────────────────────────────────────────────────────

ManifoldEngine::ManifoldEngine(EngineConfig config)
    : config_(config)
{
    if (!std::isfinite(config_.sensitivity) ||
        config_.sensitivity <= 0.0 ||
        config_.sensitivity > constants::MAX_SENSITIVITY) {
        throw InvalidConfigurationError(fmt::format(
            "sensitivity must be in (0, {}], got {}",
            constants::MAX_SENSITIVITY, config_.sensitivity));
    }
    if (config_.curvature_smooth_window == 0 ||
        config_.global_entropy_bins == 0 ||
        config_.local_entropy_window < 2 ||
        config_.singularity_separation == 0 ||
        config_.max_attractors == 0 ||
        config_.attractor_bins == 0) {
        throw InvalidConfigurationError("window and bin counts must be positive");
    }
    if (!std::isfinite(config_.singularity_threshold) || !std::isfinite(config_.flow_dt)) {
        throw InvalidConfigurationError("singularity threshold and flow dt must be finite");
    }
}

// ─── ManifoldEngine::validate ─────────────────────────────────────────────────

void ManifoldEngine::validate(std::span<const double> prices,
                              std::span<const double> timestamps,
                              std::span<const double> volume) {
    if (prices.size() < constants::MIN_SERIES_LENGTH) {
        throw InsufficientDataError(fmt::format(
            "analysis requires at least {} prices, got {}",
            constants::MIN_SERIES_LENGTH, prices.size()));
    }
    if (!timestamps.empty() && timestamps.size() != prices.size()) {
        throw InvalidInputError(fmt::format(
            "timestamps length {} does not match prices length {}",
            timestamps.size(), prices.size()));
    }
    if (!volume.empty() && volume.size() != prices.size()) {
        throw InvalidInputError(fmt::format(
            "volume length {} does not match prices length {}",
            volume.size(), prices.size()));
    }
    if (!all_finite(prices) || !all_finite(timestamps) || !all_finite(volume)) {
        throw InvalidInputError("input series contain non-finite values");
    }
    if (std::any_of(volume.begin(), volume.end(), [](double v) { return v < 0.0; })) {
        throw InvalidInputError("volume must be non-negative");
    }
    if (std::adjacent_find(timestamps.begin(), timestamps.end(), std::greater<>()) !=
        timestamps.end()) {
        throw InvalidInputError("timestamps must be non-decreasing");
    }
}

// ─── ManifoldEngine::analyze ──────────────────────────────────────────────────

ManifoldMetrics ManifoldEngine::analyze(std::span<const double> prices,
                                        std::span<const double> timestamps,
                                        Timescale timescale,
                                        std::span<const double> volume) const {
    validate(prices, timestamps, volume);

    ManifoldMetrics m;
    m.timescale = timescale;
    m.prices.assign(prices.begin(), prices.end());
    if (timestamps.empty()) {
        m.timestamps.resize(prices.size());
        std::iota(m.timestamps.begin(), m.timestamps.end(), 0.0);
    } else {
        m.timestamps.assign(timestamps.begin(), timestamps.end());
    }

    m.curvature     = calculate_curvature(prices, config_.curvature_smooth_window);
    m.entropy       = calculate_global_entropy(prices, config_.global_entropy_bins);
    m.local_entropy = calculate_local_entropy(prices, config_.local_entropy_window);
    m.tension       = calculate_tension(prices, volume);

    m.singularities = detect_singularities(m.curvature, m.tension, config_.singularity_threshold);
    m.attractors    = find_attractors(prices, volume, config_.max_attractors);

    m.flow = calculate_ricci_flow(m.curvature, m.tension, config_.flow_dt);
    return m;
}

// ─── ManifoldEngine::calculate_curvature ─────────────────────────────────────

std::vector<double>
ManifoldEngine::calculate_curvature(std::span<const double> prices,
                                    std::size_t smooth_window) const noexcept {
    if (prices.empty()) {
        return {};
    }

    const auto p = as_array(prices);
    const double mu    = signal::mean(prices);
    const double sigma = signal::stddev(prices);
    const SeriesArray normalized = (p - mu) / (sigma + DENOM_EPSILON);

    const auto velocity  = signal::gradient(to_vector(normalized));
    auto curvature       = signal::gradient(velocity);

    if (smooth_window > 1) {
        curvature = signal::gaussian_filter(curvature,
                                            static_cast<double>(smooth_window) / 3.0,
                                            constants::GAUSSIAN_TRUNCATE);
    }
    return curvature;
}

// ─── ManifoldEngine::return_entropy ──────────────────────────────────────────

double ManifoldEngine::return_entropy(std::span<const double> prices,
                                      std::size_t bins) noexcept {
    if (prices.size() < 2 || bins == 0) {
        return 0.0;
    }

    const auto n = static_cast<Eigen::Index>(prices.size());
    const auto p = as_array(prices);
    const SeriesArray returns =
        (p.tail(n - 1) - p.head(n - 1)) / (p.head(n - 1) + DENOM_EPSILON);

    const auto hist = signal::histogram(to_vector(returns), bins, /*density=*/true);

    double entropy = 0.0;
    for (double h : hist.heights) {
        if (h > 0.0) {
            entropy -= h * std::log2(h + LOG_EPSILON);
        }
    }
    return entropy;
}

// ─── ManifoldEngine::calculate_global_entropy ────────────────────────────────

double ManifoldEngine::calculate_global_entropy(std::span<const double> prices,
                                                std::size_t bins) const noexcept {
    return return_entropy(prices, bins);
}

// ─── ManifoldEngine::calculate_local_entropy ─────────────────────────────────

std::vector<double>
ManifoldEngine::calculate_local_entropy(std::span<const double> prices,
                                        std::size_t window) const noexcept {
    const std::size_t n = prices.size();
    std::vector<double> out(n, 0.0);
    if (window < 2 || n <= window) {
        // Not enough history for even one window: degrade to zeros.
        return out;
    }

    const std::size_t bins = std::min(constants::LOCAL_ENTROPY_MAX_BINS, window / 2);
    for (std::size_t i = window; i < n; ++i) {
        out[i] = return_entropy(prices.subspan(i - window, window), bins);
    }

    // Backfill the warm-up region without look-ahead beyond the first window.
    std::fill(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(window), out[window]);
    return out;
}

// ─── ManifoldEngine::calculate_tension ───────────────────────────────────────

std::vector<double>
ManifoldEngine::calculate_tension(std::span<const double> prices,
                                  std::span<const double> volume) const noexcept {
    const std::size_t n = prices.size();
    if (n == 0) {
        return {};
    }

    const auto p = as_array(prices);

    // Per-step return relative to the current price; the first step is 0.
    SeriesArray returns = SeriesArray::Zero(static_cast<Eigen::Index>(n));
    for (std::size_t i = 1; i < n; ++i) {
        returns(static_cast<Eigen::Index>(i)) =
            (prices[i] - prices[i - 1]) / (prices[i] + DENOM_EPSILON);
    }

    SeriesArray momentum(static_cast<Eigen::Index>(n));
    std::partial_sum(returns.data(), returns.data() + n, momentum.data());

    const auto long_avg_vec = signal::gaussian_filter(prices, constants::TENSION_LONG_SIGMA,
                                                      constants::GAUSSIAN_TRUNCATE);
    const auto long_avg = as_array(long_avg_vec);
    const SeriesArray distance = (p - long_avg).abs() / (long_avg + DENOM_EPSILON);

    SeriesArray tension = momentum.abs() * distance;

    if (volume.size() == n) {
        const auto v = as_array(volume);
        tension *= v / (v.mean() + DENOM_EPSILON);
    }

    const double mu    = tension.mean();
    const double sigma = std::sqrt((tension - mu).square().mean());
    const SeriesArray zscored = (tension - mu) / (sigma + DENOM_EPSILON);
    return to_vector(zscored);
}

// ─── ManifoldEngine::detect_singularities ────────────────────────────────────

std::vector<std::size_t>
ManifoldEngine::detect_singularities(std::span<const double> curvature,
                                     std::span<const double> tension,
                                     double threshold) const noexcept {
    const std::size_t n = std::min(curvature.size(), tension.size());
    if (n == 0) {
        return {};
    }
    curvature = curvature.first(n);
    tension   = tension.first(n);

    const auto c = as_array(curvature);
    const auto t = as_array(tension);
    const SeriesArray score =
        (c.abs() / (signal::stddev(curvature) + DENOM_EPSILON)) *
        (t.abs() / (signal::stddev(tension)   + DENOM_EPSILON));

    signal::PeakCriteria criteria;
    criteria.min_height   = threshold * config_.sensitivity;
    criteria.min_distance = config_.singularity_separation;
    return signal::find_peaks(to_vector(score), criteria);
}

// ─── ManifoldEngine::find_attractors ─────────────────────────────────────────

std::vector<Attractor>
ManifoldEngine::find_attractors(std::span<const double> prices,
                                std::span<const double> volume,
                                std::size_t num_attractors) const noexcept {
    if (prices.empty()) {
        return {};
    }

    auto hist = signal::histogram(prices, config_.attractor_bins);

    if (volume.size() == prices.size()) {
        std::fill(hist.heights.begin(), hist.heights.end(), 0.0);
        for (std::size_t i = 0; i < prices.size(); ++i) {
            if (const auto idx = hist.bucket_of(prices[i])) {
                hist.heights[*idx] += volume[i];
            }
        }
    }

    signal::PeakCriteria criteria;
    criteria.min_prominence = signal::stddev(hist.heights) * constants::ATTRACTOR_PROMINENCE_FRACTION;
    criteria.min_distance   = constants::ATTRACTOR_MIN_SEPARATION;
    const auto peaks = signal::find_peaks(hist.heights, criteria);

    if (peaks.empty() || num_attractors == 0) {
        return {Attractor{prices.back(), 1.0}};
    }

    double strongest = 0.0;
    for (std::size_t idx : peaks) {
        strongest = std::max(strongest, hist.heights[idx]);
    }

    std::vector<Attractor> attractors;
    attractors.reserve(peaks.size());
    for (std::size_t idx : peaks) {
        attractors.push_back(Attractor{hist.center(idx), hist.heights[idx] / strongest});
    }

    // Ascending stable sort then reverse: among equal strengths the
    // higher-priced bucket comes first.
    std::stable_sort(attractors.begin(), attractors.end(),
                     [](const Attractor& a, const Attractor& b) { return a.strength < b.strength; });
    std::reverse(attractors.begin(), attractors.end());
    if (attractors.size() > num_attractors) {
        attractors.resize(num_attractors);
    }
    return attractors;
}

// ─── ManifoldEngine::calculate_ricci_flow ────────────────────────────────────

std::vector<double>
ManifoldEngine::calculate_ricci_flow(std::span<const double> curvature,
                                     std::span<const double> tension,
                                     double dt) const noexcept {
    const std::size_t n = std::min(curvature.size(), tension.size());
    if (n == 0) {
        return {};
    }

    const auto c = as_array(curvature.first(n));
    const auto t = as_array(tension.first(n));
    const SeriesArray flow = -dt * c * (1.0 + t);

    const auto flow_gradient = signal::gradient(to_vector(flow));
    return signal::gaussian_filter(flow_gradient, constants::FLOW_SMOOTH_SIGMA,
                                   constants::GAUSSIAN_TRUNCATE);
}

}  // namespace cmf
