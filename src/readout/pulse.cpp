/// @file src/readout/pulse.cpp
/// @brief Pulse readout, detail listings, fractal summary, and readout wire tags.

#include "cmf/readout.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>
#include <vector>

namespace cmf {

namespace {

constexpr double PULSE_HIGH_ENTROPY   = 5.0;
constexpr double PULSE_MEDIUM_ENTROPY = 3.0;
constexpr double PULSE_HIGH_TENSION   = 1.5;
constexpr double PULSE_MEDIUM_TENSION = 0.5;

template <typename Enum, std::size_t N>
std::optional<Enum> parse_tag(std::string_view tag, const std::array<Enum, N>& values) noexcept {
    for (Enum v : values) {
        if (tag == to_string(v)) {
            return v;
        }
    }
    return std::nullopt;
}

Level entropy_level(double e) noexcept {
    if (e > PULSE_HIGH_ENTROPY)   return Level::High;
    if (e > PULSE_MEDIUM_ENTROPY) return Level::Medium;
    return Level::Low;
}

Level tension_level(double t) noexcept {
    const double a = std::abs(t);
    if (a > PULSE_HIGH_TENSION)   return Level::High;
    if (a > PULSE_MEDIUM_TENSION) return Level::Medium;
    return Level::Low;
}

PulseState classify(double entropy, double tension) noexcept {
    const double t = std::abs(tension);
    if (t > PULSE_HIGH_TENSION) {
        return entropy > PULSE_HIGH_ENTROPY ? PulseState::HighTension : PulseState::Compressed;
    }
    if (entropy > PULSE_HIGH_ENTROPY) {
        return PulseState::Chaotic;
    }
    if (t < PULSE_MEDIUM_TENSION && entropy < PULSE_MEDIUM_ENTROPY) {
        return PulseState::Stable;
    }
    return PulseState::Transitional;
}

}  // anonymous namespace

// ─── Wire tags ────────────────────────────────────────────────────────────────

const char* to_string(Level l) noexcept {
    switch (l) {
        case Level::Low:    return "low";
        case Level::Medium: return "medium";
        case Level::High:   return "high";
    }
    return "low";
}

const char* to_string(PulseState s) noexcept {
    switch (s) {
        case PulseState::HighTension:  return "high_tension";
        case PulseState::Compressed:   return "compressed";
        case PulseState::Chaotic:      return "chaotic";
        case PulseState::Stable:       return "stable";
        case PulseState::Transitional: return "transitional";
    }
    return "transitional";
}

const char* to_string(Horizon h) noexcept {
    switch (h) {
        case Horizon::Micro:  return "micro";
        case Horizon::Short:  return "short";
        case Horizon::Medium: return "medium";
        case Horizon::Long:   return "long";
        case Horizon::Macro:  return "macro";
    }
    return "medium";
}

const char* to_string(Bias b) noexcept {
    switch (b) {
        case Bias::Bullish: return "bullish";
        case Bias::Bearish: return "bearish";
        case Bias::Neutral: return "neutral";
    }
    return "neutral";
}

std::optional<Level> try_parse_level(std::string_view tag) noexcept {
    return parse_tag(tag, std::array{Level::Low, Level::Medium, Level::High});
}

std::optional<PulseState> try_parse_pulse_state(std::string_view tag) noexcept {
    return parse_tag(tag, std::array{PulseState::HighTension, PulseState::Compressed,
                                     PulseState::Chaotic, PulseState::Stable,
                                     PulseState::Transitional});
}

std::optional<Horizon> try_parse_horizon(std::string_view tag) noexcept {
    return parse_tag(tag, std::array{Horizon::Micro, Horizon::Short, Horizon::Medium,
                                     Horizon::Long, Horizon::Macro});
}

std::optional<Bias> try_parse_bias(std::string_view tag) noexcept {
    return parse_tag(tag, std::array{Bias::Bullish, Bias::Bearish, Bias::Neutral});
}

// ─── pulse ────────────────────────────────────────────────────────────────────

PulseReading pulse(const ManifoldMetrics& metrics, std::optional<double> current_price) noexcept {
    PulseReading out;

    const double last_price = metrics.prices.empty() ? 0.0 : metrics.prices.back();
    out.current_price = current_price.value_or(last_price);
    out.entropy = metrics.local_entropy.empty() ? 0.0 : metrics.local_entropy.back();
    out.tension = metrics.tension.empty() ? 0.0 : metrics.tension.back();
    out.entropy_level = entropy_level(out.entropy);
    out.tension_level = tension_level(out.tension);
    out.state = classify(out.entropy, out.tension);

    if (!metrics.attractors.empty()) {
        const double p = out.current_price;
        const auto nearest = std::min_element(
            metrics.attractors.begin(), metrics.attractors.end(),
            [p](const Attractor& a, const Attractor& b) {
                return std::abs(a.price - p) < std::abs(b.price - p);
            });
        const double distance = std::abs(nearest->price - p);
        out.nearest_attractor = AttractorDistance{
            .price        = nearest->price,
            .distance     = distance,
            .distance_pct = distance / std::max(std::abs(p), constants::DENOM_EPSILON) * 100.0,
        };
    }

    // Singularity indices refer to samples; "recent" is the last 20% of them.
    const auto n = static_cast<double>(metrics.prices.size());
    const auto cutoff = static_cast<std::size_t>(n * (1.0 - constants::RECENT_FRACTION));
    out.recent_singularities = static_cast<std::size_t>(
        std::count_if(metrics.singularities.begin(), metrics.singularities.end(),
                      [cutoff](std::size_t i) { return i >= cutoff; }));
    return out;
}

// ─── Detail listings ──────────────────────────────────────────────────────────

std::vector<SingularityEvent> singularity_events(const ManifoldMetrics& metrics) noexcept {
    const std::size_t n = std::min({metrics.timestamps.size(), metrics.prices.size(),
                                    metrics.curvature.size(), metrics.tension.size(),
                                    metrics.local_entropy.size()});
    std::vector<SingularityEvent> out;
    out.reserve(metrics.singularities.size());
    for (std::size_t i : metrics.singularities) {
        if (i >= n) {
            continue;
        }
        out.push_back(SingularityEvent{
            .index     = i,
            .timestamp = metrics.timestamps[i],
            .price     = metrics.prices[i],
            .curvature = metrics.curvature[i],
            .tension   = metrics.tension[i],
            .entropy   = metrics.local_entropy[i],
        });
    }
    return out;
}

std::vector<AttractorLevel> attractor_levels(const ManifoldMetrics& metrics,
                                             double current_price) noexcept {
    const double base = std::max(std::abs(current_price), constants::DENOM_EPSILON);
    std::vector<AttractorLevel> out;
    out.reserve(metrics.attractors.size());
    for (const Attractor& a : metrics.attractors) {
        out.push_back(AttractorLevel{
            .price        = a.price,
            .strength     = a.strength,
            .distance_pct = (a.price - current_price) / base * 100.0,
        });
    }
    return out;
}

// ─── fractal_summary ──────────────────────────────────────────────────────────

FractalSummary
fractal_summary(const std::map<Timescale, Interpretation>& interpretations) noexcept {
    FractalSummary out;
    if (interpretations.empty()) {
        return out;
    }

    // (phase, count) in first-seen order; max_element keeps the earliest on ties.
    std::vector<std::pair<Phase, int>> counts;
    for (const auto& entry : interpretations) {
        const Phase phase = entry.second.phase;
        auto it = std::find_if(counts.begin(), counts.end(),
                               [phase](const auto& c) { return c.first == phase; });
        if (it == counts.end()) {
            counts.emplace_back(phase, 1);
        } else {
            ++it->second;
        }
    }

    const auto best = std::max_element(
        counts.begin(), counts.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });

    out.dominant_phase = best->first;
    out.consistency = static_cast<int>(
        static_cast<double>(best->second) / static_cast<double>(interpretations.size()) * 100.0);
    return out;
}

}  // namespace cmf
