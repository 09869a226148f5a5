/// @file src/interpreter/phase_interpreter.cpp
/// @brief ManifoldInterpreter: phase, readings, attractor pull, confidence.

#include "cmf/interpreter.hpp"
#include "cmf/phrase_bank.hpp"
#include "cmf/signal.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace cmf {

namespace {

// Conductor breakpoints.
constexpr double CONDUCTOR_ACTIVE_TENSION = 1.0;
constexpr double CONDUCTOR_FLAT_TREND     = 0.1;
constexpr double CONDUCTOR_REST_TENSION   = 0.5;
constexpr double CONDUCTOR_REST_ENTROPY   = 4.0;

// Singer breakpoints.
constexpr double SINGER_CRACK_CURVATURE      = 2.0;
constexpr double SINGER_STRAIN_TENSION       = 1.0;
constexpr double SINGER_HARMONIOUS_CURVATURE = 0.5;
constexpr double SINGER_HARMONIOUS_TENSION   = 0.7;
constexpr double SINGER_HARMONIOUS_ENTROPY   = 5.0;
constexpr double SINGER_RESONANT_TENSION     = 0.5;
constexpr double SINGER_RESONANT_ENTROPY     = 4.0;

double latest(const std::vector<double>& x) noexcept {
    return x.empty() ? 0.0 : x.back();
}

/// 1 / (1 + σ) of a window; 0 if σ is not finite.
double consistency(std::span<const double> window) noexcept {
    const double s = signal::stddev(window);
    if (!std::isfinite(s)) {
        return 0.0;
    }
    return 1.0 / (1.0 + s);
}

}  // anonymous namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

ManifoldInterpreter::ManifoldInterpreter(InterpreterConfig config) noexcept
    : config_(config)
{}

// ─── interpret ────────────────────────────────────────────────────────────────

Interpretation ManifoldInterpreter::interpret(const ManifoldMetrics& metrics) const noexcept {
    Interpretation out;

    const double curvature = latest(metrics.curvature);
    const double entropy   = latest(metrics.local_entropy);
    const double tension   = latest(metrics.tension);
    const double flow      = latest(metrics.flow);
    const double price     = latest(metrics.prices);

    const PhaseInputs inputs{
        .curvature         = curvature,
        .tension           = tension,
        .entropy           = entropy,
        .flow              = flow,
        .singularity_count = metrics.singularities.size(),
    };
    out.phase = diagnose_phase(inputs, config_.phase);

    out.conductor = conductor_reading(metrics);
    out.singer    = singer_reading(curvature, tension, entropy);

    const double curvature_trend =
        signal::mean_diff(signal::tail(metrics.curvature, config_.curvature_trend_window));
    out.curvature_state     = phrases::describe_curvature(curvature, curvature_trend);
    out.tension_description = phrases::describe_tension(tension);
    out.entropy_state       = phrases::describe_entropy(entropy);

    auto pull = attractor_pull(price, metrics.attractors);
    out.nearest_attractor = std::move(pull.nearest);
    out.pull_strength     = pull.pull_strength;

    out.wave_position = phrases::wave_position(out.phase);
    out.narrative = phrases::compose_narrative(out.phase, out.conductor, out.singer,
                                               out.curvature_state,
                                               out.tension_description,
                                               out.entropy_state);
    out.warning = warning(out.phase, tension, metrics.singularities.size());

    out.confidence = confidence(metrics.curvature, metrics.tension);

    out.curvature_value = curvature;
    out.entropy_value   = entropy;
    out.tension_value   = tension;
    return out;
}

// ─── conductor_reading ────────────────────────────────────────────────────────

ConductorReading
ManifoldInterpreter::conductor_reading(const ManifoldMetrics& metrics) const noexcept {
    const double tension_trend =
        signal::mean_diff(signal::tail(metrics.tension, config_.trend_window));
    const double curvature_trend =
        signal::mean_diff(signal::tail(metrics.curvature, config_.trend_window));

    const double tension = std::abs(latest(metrics.tension));
    const double entropy = latest(metrics.local_entropy);

    if (tension_trend > 0.0 && curvature_trend > 0.0) {
        return ConductorReading::Crescendo;
    }
    if (tension_trend < 0.0 && tension > CONDUCTOR_ACTIVE_TENSION) {
        return ConductorReading::Decrescendo;
    }
    if (tension > CONDUCTOR_ACTIVE_TENSION && std::abs(tension_trend) < CONDUCTOR_FLAT_TREND) {
        return ConductorReading::SustainedTension;
    }
    if (tension < CONDUCTOR_REST_TENSION && entropy < CONDUCTOR_REST_ENTROPY) {
        return ConductorReading::RestPhase;
    }
    return ConductorReading::Transitional;
}

// ─── singer_reading ───────────────────────────────────────────────────────────

SingerReading ManifoldInterpreter::singer_reading(double curvature,
                                                  double tension,
                                                  double entropy) const noexcept {
    const double c = std::abs(curvature);
    const double t = std::abs(tension);

    if (t > config_.high_tension_threshold || c > SINGER_CRACK_CURVATURE) {
        return SingerReading::TensionCrackling;
    }
    if (t > SINGER_STRAIN_TENSION && entropy > config_.high_entropy_threshold) {
        return SingerReading::DissonantStrain;
    }
    if (c < SINGER_HARMONIOUS_CURVATURE && t < SINGER_HARMONIOUS_TENSION &&
        entropy < SINGER_HARMONIOUS_ENTROPY) {
        return SingerReading::HarmoniousFlow;
    }
    if (t < SINGER_RESONANT_TENSION && entropy < SINGER_RESONANT_ENTROPY) {
        return SingerReading::ResonantStable;
    }
    return SingerReading::HarmoniousFlow;
}

// ─── confidence ───────────────────────────────────────────────────────────────

double ManifoldInterpreter::confidence(std::span<const double> curvature,
                                       std::span<const double> tension) const noexcept {
    const double c = consistency(signal::tail(curvature, config_.confidence_window));
    const double t = consistency(signal::tail(tension, config_.confidence_window));
    return (c + t) / 2.0;
}

// ─── attractor_pull ───────────────────────────────────────────────────────────

AttractorPull ManifoldInterpreter::attractor_pull(double price,
                                                  std::span<const Attractor> attractors) const noexcept {
    AttractorPull pull;
    if (attractors.empty()) {
        return pull;
    }

    const auto nearest = std::min_element(
        attractors.begin(), attractors.end(),
        [price](const Attractor& a, const Attractor& b) {
            return std::abs(a.price - price) < std::abs(b.price - price);
        });

    const double distance_pct =
        std::abs(nearest->price - price) /
        std::max(std::abs(price), constants::DENOM_EPSILON) * 100.0;

    std::string description;
    if (distance_pct < config_.converging_distance_pct) {
        description = fmt::format("converging on basin at {}",
                                  phrases::format_price(nearest->price));
    } else {
        description = fmt::format("{} attractor at {} ({:.1f}% away)",
                                  price > nearest->price ? "above" : "below",
                                  phrases::format_price(nearest->price),
                                  distance_pct);
    }

    pull.nearest       = NearestAttractor{nearest->price, std::move(description)};
    pull.pull_strength = nearest->strength / (1.0 + distance_pct);
    pull.distance_pct  = distance_pct;
    return pull;
}

// ─── warning ──────────────────────────────────────────────────────────────────

std::optional<std::string>
ManifoldInterpreter::warning(Phase phase,
                             double tension,
                             std::size_t singularity_count) const noexcept {
    if (phase == Phase::SingularityForming) {
        return "SINGULARITY FORMING: The manifold cannot sustain this curvature. "
               "Expect sharp Ricci flow (correction) as tension redistributes.";
    }
    if (std::abs(tension) > config_.high_tension_threshold) {
        return "HIGH TENSION: The structure is stretched. "
               "Watch for singularity formation or sudden release.";
    }
    if (singularity_count > config_.singularity_warning_count) {
        return "MULTIPLE SINGULARITIES: The manifold has experienced repeated extreme events. "
               "Structure may be unstable.";
    }
    return std::nullopt;
}

}  // namespace cmf
