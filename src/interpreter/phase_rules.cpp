/// @file src/interpreter/phase_rules.cpp
/// @brief Ordered phase cascade and wire tags of the categorical readings.

#include "cmf/interpreter.hpp"

#include <array>
#include <cmath>

namespace cmf {

// ─── Wire tags ────────────────────────────────────────────────────────────────

const char* to_string(Phase p) noexcept {
    switch (p) {
        case Phase::ImpulseLegSharpening: return "impulse_leg_sharpening";
        case Phase::SingularityForming:   return "singularity_forming";
        case Phase::RicciFlowSmoothing:   return "ricci_flow_smoothing";
        case Phase::AttractorConvergence: return "attractor_convergence";
        case Phase::StableEquilibrium:    return "stable_equilibrium";
        case Phase::CompressionBuilding:  return "compression_building";
    }
    return "attractor_convergence";
}

const char* to_string(ConductorReading r) noexcept {
    switch (r) {
        case ConductorReading::Crescendo:        return "crescendo";
        case ConductorReading::Decrescendo:      return "decrescendo";
        case ConductorReading::SustainedTension: return "sustained_tension";
        case ConductorReading::RestPhase:        return "rest_phase";
        case ConductorReading::Transitional:     return "transitional";
    }
    return "transitional";
}

const char* to_string(SingerReading r) noexcept {
    switch (r) {
        case SingerReading::ResonantStable:   return "resonant_stable";
        case SingerReading::TensionCrackling: return "tension_crackling";
        case SingerReading::HarmoniousFlow:   return "harmonious_flow";
        case SingerReading::DissonantStrain:  return "dissonant_strain";
    }
    return "harmonious_flow";
}

namespace {

template <typename Enum, std::size_t N>
std::optional<Enum> parse_tag(std::string_view tag, const std::array<Enum, N>& values) noexcept {
    for (Enum v : values) {
        if (tag == to_string(v)) {
            return v;
        }
    }
    return std::nullopt;
}

constexpr std::array<Phase, 6> ALL_PHASES = {
    Phase::ImpulseLegSharpening, Phase::SingularityForming, Phase::RicciFlowSmoothing,
    Phase::AttractorConvergence, Phase::StableEquilibrium,  Phase::CompressionBuilding,
};

constexpr std::array<ConductorReading, 5> ALL_CONDUCTOR = {
    ConductorReading::Crescendo, ConductorReading::Decrescendo,
    ConductorReading::SustainedTension, ConductorReading::RestPhase,
    ConductorReading::Transitional,
};

constexpr std::array<SingerReading, 4> ALL_SINGER = {
    SingerReading::ResonantStable, SingerReading::TensionCrackling,
    SingerReading::HarmoniousFlow, SingerReading::DissonantStrain,
};

// ─── Cascade rows ─────────────────────────────────────────────────────────────

bool singularity_forming(const PhaseInputs& in, const PhaseThresholds& th) {
    return std::abs(in.curvature) > th.singularity_curvature &&
           std::abs(in.tension)   > th.singularity_tension;
}

bool ricci_flow_smoothing(const PhaseInputs& in, const PhaseThresholds& th) {
    return std::abs(in.flow)    > th.flow_magnitude &&
           std::abs(in.tension) > th.flow_tension;
}

bool impulse_leg_sharpening(const PhaseInputs& in, const PhaseThresholds& th) {
    return std::abs(in.curvature) > th.impulse_curvature &&
           std::abs(in.tension)   > th.impulse_tension &&
           std::abs(in.flow)      < th.impulse_max_flow;
}

bool compression_building(const PhaseInputs& in, const PhaseThresholds& th) {
    return std::abs(in.tension)   > th.compression_tension &&
           std::abs(in.curvature) < th.compression_max_curv;
}

bool stable_equilibrium(const PhaseInputs& in, const PhaseThresholds& th) {
    return std::abs(in.curvature) < th.stable_max_curvature &&
           std::abs(in.tension)   < th.stable_max_tension &&
           in.entropy             < th.stable_max_entropy;
}

constexpr std::array<PhaseRule, 5> PHASE_RULES = {{
    {Phase::SingularityForming,
     "|c| > singularity_curvature and |t| > singularity_tension",
     &singularity_forming},
    {Phase::RicciFlowSmoothing,
     "|f| > flow_magnitude and |t| > flow_tension",
     &ricci_flow_smoothing},
    {Phase::ImpulseLegSharpening,
     "|c| > impulse_curvature and |t| > impulse_tension and |f| < impulse_max_flow",
     &impulse_leg_sharpening},
    {Phase::CompressionBuilding,
     "|t| > compression_tension and |c| < compression_max_curv",
     &compression_building},
    {Phase::StableEquilibrium,
     "|c| < stable_max_curvature and |t| < stable_max_tension and e < stable_max_entropy",
     &stable_equilibrium},
}};

}  // anonymous namespace

std::optional<Phase> try_parse_phase(std::string_view tag) noexcept {
    return parse_tag(tag, ALL_PHASES);
}

std::optional<ConductorReading> try_parse_conductor(std::string_view tag) noexcept {
    return parse_tag(tag, ALL_CONDUCTOR);
}

std::optional<SingerReading> try_parse_singer(std::string_view tag) noexcept {
    return parse_tag(tag, ALL_SINGER);
}

// ─── phase_rules / diagnose_phase ─────────────────────────────────────────────

std::span<const PhaseRule> phase_rules() noexcept {
    return PHASE_RULES;
}

Phase diagnose_phase(const PhaseInputs& inputs, const PhaseThresholds& thresholds) noexcept {
    for (const PhaseRule& rule : PHASE_RULES) {
        if (rule.matches(inputs, thresholds)) {
            return rule.phase;
        }
    }
    return Phase::AttractorConvergence;
}

}  // namespace cmf
