/// @file src/interpreter/phrase_bank.cpp
/// @brief Banded phrase lookups and narrative templates.

#include "cmf/phrase_bank.hpp"

#include <fmt/format.h>

#include <cmath>

namespace cmf::phrases {

// ─── describe_curvature ───────────────────────────────────────────────────────

std::string describe_curvature(double curvature, double trend) {
    if (!std::isfinite(curvature)) {
        return DEFAULT_PHRASE;
    }
    const double c = std::abs(curvature);
    if (c > 1.5) {
        return "tight - singularity imminent";
    }
    if (c > 0.8) {
        return trend > 0.0
            ? "sharpening - psychological heat accumulating"
            : "loosening - tension releasing";
    }
    if (c > 0.3) {
        return "moderate - normal flow";
    }
    return "gentle - calm surface";
}

// ─── describe_tension ─────────────────────────────────────────────────────────

std::string describe_tension(double tension) {
    if (!std::isfinite(tension)) {
        return DEFAULT_PHRASE;
    }
    const double t = std::abs(tension);
    if (t > 2.0) return "extreme - structure cannot hold";
    if (t > 1.5) return "critical - collapse imminent";
    if (t > 1.0) return "high - pressure building";
    if (t > 0.5) return "accumulating - directional pressure";
    return "minimal - relaxed state";
}

// ─── describe_entropy ─────────────────────────────────────────────────────────

std::string describe_entropy(double entropy) {
    if (!std::isfinite(entropy)) {
        return DEFAULT_PHRASE;
    }
    if (entropy > 7.0) return "chaotic - panic/euphoria";
    if (entropy > 6.0) return "frothy - unstable belief";
    if (entropy > 4.0) return "elevated - active movement";
    if (entropy > 2.0) return "calm - stable belief";
    return "crystalline - locked structure";
}

// ─── wave_position ────────────────────────────────────────────────────────────

std::string wave_position(Phase phase) {
    switch (phase) {
        case Phase::ImpulseLegSharpening:
            return "Impulse wave (1, 3, or 5) - curvature sharpening";
        case Phase::RicciFlowSmoothing:
            return "Corrective wave (2, 4, or A-B-C) - Ricci flow smoothing";
        case Phase::SingularityForming:
            return "Wave peak - singularity forming";
        case Phase::StableEquilibrium:
            return "Wave 4 consolidation or end of correction";
        case Phase::AttractorConvergence:
        case Phase::CompressionBuilding:
            break;
    }
    return "Transitional - between wave structures";
}

// ─── compose_narrative ────────────────────────────────────────────────────────

std::string compose_narrative(Phase phase,
                              ConductorReading conductor,
                              SingerReading singer,
                              const std::string& curvature_state,
                              const std::string& tension_description,
                              const std::string& entropy_state) {
    switch (phase) {
        case Phase::ImpulseLegSharpening:
            return fmt::format(
                "The manifold is in an impulse leg. Curvature is {}, with tension {}. "
                "The Conductor senses a {}, while the Singer feels the note is {}. "
                "Psychological heat is accumulating as the surface sharpens.",
                curvature_state, tension_description, to_string(conductor), to_string(singer));
        case Phase::SingularityForming:
            return fmt::format(
                "A singularity is forming. The manifold has reached {} tension with {} curvature. "
                "The structure cannot hold this shape - a collapse and Ricci flow smoothing "
                "are imminent. The Singer feels the note {}.",
                tension_description, curvature_state, to_string(singer));
        case Phase::RicciFlowSmoothing:
            return fmt::format(
                "The manifold is undergoing Ricci flow - a smoothing process where tension "
                "redistributes across the surface. Entropy is {} as the structure 'burns off' "
                "excess psychological heat. The Conductor reads this as {}.",
                entropy_state, to_string(conductor));
        case Phase::AttractorConvergence:
            return fmt::format(
                "The manifold is converging toward a natural attractor. Curvature is {} with {} "
                "tension. The surface is settling into a gravitational basin, seeking equilibrium.",
                curvature_state, tension_description);
        case Phase::StableEquilibrium:
            return fmt::format(
                "The manifold rests in stable equilibrium. Entropy is {}, tension is {}, and "
                "curvature is {}. The Singer feels {}. This is a rest phase between movements.",
                entropy_state, tension_description, curvature_state, to_string(singer));
        case Phase::CompressionBuilding:
            return fmt::format(
                "Compression is building. The manifold shows {} tension without high curvature - "
                "directional pressure is accumulating before the next sharp movement. "
                "The Conductor senses {}.",
                tension_description, to_string(conductor));
    }
    return "The manifold is in transition between states.";
}

// ─── Display text ─────────────────────────────────────────────────────────────

std::string phase_title(Phase phase) {
    switch (phase) {
        case Phase::ImpulseLegSharpening: return "Impulse Phase";
        case Phase::SingularityForming:   return "Singularity Alert";
        case Phase::RicciFlowSmoothing:   return "Correction Phase";
        case Phase::AttractorConvergence: return "Convergence Phase";
        case Phase::StableEquilibrium:    return "Equilibrium Phase";
        case Phase::CompressionBuilding:  return "Compression Building";
    }
    return "Transitional";
}

std::string phase_detail(Phase phase) {
    switch (phase) {
        case Phase::ImpulseLegSharpening:
            return "The manifold is sharpening - curvature intensifying as directional conviction "
                   "builds. Like a singer approaching a crescendo, the geometry is tightening.";
        case Phase::SingularityForming:
            return "Critical tension detected. The manifold cannot sustain this shape - expect "
                   "Ricci flow (corrective redistribution) as the geometry cools.";
        case Phase::RicciFlowSmoothing:
            return "Ricci flow in progress - the manifold is smoothing, redistributing tension. "
                   "Psychological heat dissipating as the surface relaxes.";
        case Phase::AttractorConvergence:
            return "The manifold is settling toward a natural attractor basin. Like water finding "
                   "its level, price seeks geometric equilibrium.";
        case Phase::StableEquilibrium:
            return "Stable manifold state. Low tension, calm entropy. The singer holds the note "
                   "naturally - sustainable geometry.";
        case Phase::CompressionBuilding:
            return "Directional pressure accumulating without release. The manifold stores "
                   "tension - watch for sharp curvature when it breaks.";
    }
    return "The manifold is reorganizing its geometric structure.";
}

std::string conductor_view(ConductorReading reading) {
    switch (reading) {
        case ConductorReading::Crescendo:
            return "Building toward climax - orchestral intensity rising";
        case ConductorReading::Decrescendo:
            return "Releasing from climax - energy dissipating";
        case ConductorReading::SustainedTension:
            return "Holding at intensity - dramatic pause";
        case ConductorReading::RestPhase:
            return "Rest between movements - calm interlude";
        case ConductorReading::Transitional:
            return "Moving between states - composition evolving";
    }
    return "Observing the composition";
}

std::string singer_view(SingerReading reading) {
    switch (reading) {
        case SingerReading::ResonantStable:   return "Note holds naturally - sustainable pitch";
        case SingerReading::TensionCrackling: return "Voice straining - about to break";
        case SingerReading::HarmoniousFlow:   return "Smooth melodic flow - natural movement";
        case SingerReading::DissonantStrain:  return "Forced, unsustainable - resolve imminent";
    }
    return "Feeling the internal geometry";
}

InterpretationText interpretation_text(const Interpretation& interpretation) {
    return InterpretationText{
        .phase_title    = phase_title(interpretation.phase),
        .phase_detail   = phase_detail(interpretation.phase),
        .conductor_view = conductor_view(interpretation.conductor),
        .singer_view    = singer_view(interpretation.singer),
        .curvature      = interpretation.curvature_state,
        .tension        = interpretation.tension_description,
        .entropy        = interpretation.entropy_state,
        .wave_context   = interpretation.wave_position.value_or("Transitional structure"),
        .narrative      = interpretation.narrative,
        .warning        = interpretation.warning,
    };
}

// ─── format_price ─────────────────────────────────────────────────────────────

std::string format_price(double price) {
    if (!std::isfinite(price)) {
        return fmt::format("${}", price);
    }

    const std::string fixed = fmt::format("{:.2f}", std::abs(price));
    const std::size_t dot   = fixed.find('.');
    const std::string whole = fixed.substr(0, dot);

    std::string grouped;
    grouped.reserve(whole.size() + whole.size() / 3);
    for (std::size_t i = 0; i < whole.size(); ++i) {
        if (i > 0 && (whole.size() - i) % 3 == 0) {
            grouped.push_back(',');
        }
        grouped.push_back(whole[i]);
    }

    return fmt::format("{}${}{}", price < 0.0 ? "-" : "", grouped, fixed.substr(dot));
}

}  // namespace cmf::phrases
