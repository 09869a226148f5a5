/// @file src/readout/quality.cpp
/// @brief Model quality grade and horizon-scaled price projection.

#include "cmf/readout.hpp"
#include "cmf/signal.hpp"

#include <algorithm>
#include <cmath>

namespace cmf {

namespace {

constexpr std::size_t CLARITY_ATTRACTORS   = 3;
constexpr double      CLARITY_SCALE        = 1000.0;
constexpr int         CLARITY_DEFAULT      = 50;
constexpr double      WEIGHT_CONSISTENCY   = 0.4;
constexpr double      WEIGHT_CLARITY       = 0.3;
constexpr double      WEIGHT_SAMPLE        = 0.3;

constexpr double      VOLATILITY_SCALE     = 10.0;
constexpr double      TENSION_RANGE_FACTOR = 0.2;
constexpr double      BIAS_TENSION         = 0.5;
constexpr std::size_t MAX_TARGETS          = 5;

int clamp_score(double v) noexcept {
    if (!std::isfinite(v)) {
        return 0;
    }
    return static_cast<int>(std::clamp(v, 0.0, 100.0));
}

char grade_of(int overall) noexcept {
    if (overall >= 80) return 'A';
    if (overall >= 60) return 'B';
    if (overall >= 40) return 'C';
    return 'D';
}

}  // anonymous namespace

// ─── horizon_multiplier ───────────────────────────────────────────────────────

double horizon_multiplier(Horizon h) noexcept {
    switch (h) {
        case Horizon::Micro:  return 0.5;
        case Horizon::Short:  return 1.0;
        case Horizon::Medium: return 2.0;
        case Horizon::Long:   return 4.0;
        case Horizon::Macro:  return 8.0;
    }
    return 1.0;
}

// ─── model_quality ────────────────────────────────────────────────────────────

ModelQuality model_quality(const ManifoldMetrics& metrics) noexcept {
    ModelQuality q;

    const double curvature_std =
        signal::stddev(signal::tail(metrics.curvature, constants::QUALITY_WINDOW));
    const double tension_std =
        signal::stddev(signal::tail(metrics.tension, constants::QUALITY_WINDOW));
    q.consistency = clamp_score(100.0 / (1.0 + curvature_std + tension_std));

    if (metrics.attractors.size() >= 2) {
        const std::size_t k = std::min(CLARITY_ATTRACTORS, metrics.attractors.size());
        const auto [lo, hi] = std::minmax_element(
            metrics.attractors.begin(), metrics.attractors.begin() + static_cast<std::ptrdiff_t>(k),
            [](const Attractor& a, const Attractor& b) { return a.price < b.price; });
        const double avg_price  = signal::mean(metrics.prices);
        const double separation = avg_price > 0.0 ? (hi->price - lo->price) / avg_price : 0.0;
        q.signal_clarity = std::min(100, clamp_score(separation * CLARITY_SCALE));
    } else {
        q.signal_clarity = CLARITY_DEFAULT;
    }

    q.sample_sufficiency = static_cast<int>(std::min<std::size_t>(100, metrics.prices.size() / 2));

    q.overall = static_cast<int>(WEIGHT_CONSISTENCY * q.consistency +
                                 WEIGHT_CLARITY * q.signal_clarity +
                                 WEIGHT_SAMPLE * q.sample_sufficiency);
    q.grade = grade_of(q.overall);
    return q;
}

// ─── project ──────────────────────────────────────────────────────────────────

PriceProjection project(const ManifoldMetrics& metrics,
                        double current_price,
                        Horizon horizon) noexcept {
    PriceProjection out;
    out.current_price = current_price;
    out.horizon       = horizon;

    const double entropy = metrics.local_entropy.empty() ? 0.0 : metrics.local_entropy.back();
    const double tension = metrics.tension.empty() ? 0.0 : metrics.tension.back();

    // Local entropy is differential and can go negative; that reads as no spread.
    const double volatility = std::max(0.0, entropy) / VOLATILITY_SCALE;
    out.range_pct = volatility * horizon_multiplier(horizon) *
                    (1.0 + std::abs(tension) * TENSION_RANGE_FACTOR) * 100.0;
    out.low  = current_price * (1.0 - out.range_pct / 100.0);
    out.high = current_price * (1.0 + out.range_pct / 100.0);

    std::vector<Attractor> ranked = metrics.attractors;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Attractor& a, const Attractor& b) { return a.strength > b.strength; });
    if (ranked.size() > MAX_TARGETS) {
        ranked.resize(MAX_TARGETS);
    }

    const double base = std::max(std::abs(current_price), constants::DENOM_EPSILON);
    out.targets.reserve(ranked.size());
    for (const Attractor& a : ranked) {
        out.targets.push_back(ProjectionTarget{
            .price        = a.price,
            .strength     = a.strength,
            .distance_pct = (a.price - current_price) / base * 100.0,
            .above        = a.price > current_price,
        });
    }

    if (tension > BIAS_TENSION) {
        out.bias = Bias::Bullish;
        out.bias_confidence = std::min(100, static_cast<int>(tension * 50.0));
    } else if (tension < -BIAS_TENSION) {
        out.bias = Bias::Bearish;
        out.bias_confidence = std::min(100, static_cast<int>(-tension * 50.0));
    } else {
        out.bias = Bias::Neutral;
        out.bias_confidence = static_cast<int>(50.0 - std::abs(tension) * 30.0);
    }
    return out;
}

}  // namespace cmf
