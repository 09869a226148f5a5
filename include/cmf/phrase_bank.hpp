#pragma once

/// @file include/cmf/phrase_bank.hpp
/// @brief Banded descriptive phrases used by the Phase Interpreter.
///
/// Every function is total: each has an explicit default arm, and a
/// non-finite input returns `DEFAULT_PHRASE`.

#include "cmf/interpreter.hpp"

#include <optional>
#include <string>

namespace cmf::phrases {

/// Returned when no band applies.
inline constexpr const char* DEFAULT_PHRASE = "transitional";

/// Curvature band; `trend` is the mean successive difference of the
/// trailing curvature window and only splits the 0.8 < |c| <= 1.5 band.
[[nodiscard]] std::string describe_curvature(double curvature, double trend);

/// Tension band on |t| with breakpoints 2.0 / 1.5 / 1.0 / 0.5.
[[nodiscard]] std::string describe_tension(double tension);

/// Entropy band with breakpoints 7.0 / 6.0 / 4.0 / 2.0.
[[nodiscard]] std::string describe_entropy(double entropy);

/// Elliott-wave style position implied by a phase.
[[nodiscard]] std::string wave_position(Phase phase);

/// Narrative paragraph for a phase, woven from the other readings.
[[nodiscard]] std::string compose_narrative(Phase phase,
                                            ConductorReading conductor,
                                            SingerReading singer,
                                            const std::string& curvature_state,
                                            const std::string& tension_description,
                                            const std::string& entropy_state);

/// Short heading for a phase, e.g. "Singularity Alert".
[[nodiscard]] std::string phase_title(Phase phase);

/// One or two sentences explaining a phase.
[[nodiscard]] std::string phase_detail(Phase phase);

[[nodiscard]] std::string conductor_view(ConductorReading reading);
[[nodiscard]] std::string singer_view(SingerReading reading);

/// Display-ready text for one interpretation.
struct InterpretationText {
    std::string phase_title;
    std::string phase_detail;
    std::string conductor_view;
    std::string singer_view;
    std::string curvature;
    std::string tension;
    std::string entropy;
    std::string wave_context;  ///< Wave position, or "Transitional structure"
    std::string narrative;
    std::optional<std::string> warning;
};

[[nodiscard]] InterpretationText interpretation_text(const Interpretation& interpretation);

/// Dollar price with thousands separators and two decimals, e.g. "$1,234.50".
[[nodiscard]] std::string format_price(double price);

}  // namespace cmf::phrases
