#pragma once

/// @file include/cmf/interpreter.hpp
/// @brief Phase Interpreter: categorical diagnosis of a metrics snapshot.
///
/// # Module: Phase Interpreter
///
/// ## Responsibility
/// Read the latest state of a `ManifoldMetrics` snapshot and produce:
///
///   - a phase label from an ordered rule table (first match wins)
///   - a macro "conductor" and a micro "singer" reading
///   - banded descriptions of curvature, tension and entropy
///   - the nearest attractor and its pull
///   - a confidence score, a narrative, and an optional warning
///
/// ## Phase Cascade
///
///   | # | Condition (|c|, |t|, e, |f|)              | Phase                |
///   |---|--------------------------------------------|----------------------|
///   | 1 | |c| > 2.0 and |t| > 1.5                    | SingularityForming   |
///   | 2 | |f| > 0.5 and |t| > 0.5                    | RicciFlowSmoothing   |
///   | 3 | |c| > 0.5 and |t| > 0.7 and |f| < 0.3      | ImpulseLegSharpening |
///   | 4 | |t| > 1.0 and |c| < 0.5                    | CompressionBuilding  |
///   | 5 | |c| < 0.3 and |t| < 0.5 and e < 4.0        | StableEquilibrium    |
///   | 6 | otherwise                                  | AttractorConvergence |
///
/// ## Guarantees
/// - `interpret` never throws; any snapshot, including one with empty
///   arrays, yields a best-effort `Interpretation`
/// - Depends only on the `ManifoldMetrics` value type, not on the engine
/// - Stateless apart from read-only configuration; thread-safe

#include "cmf/constants.hpp"
#include "cmf/metrics.hpp"
#include "cmf/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace cmf {

// ─── Categorical Readings ─────────────────────────────────────────────────────

/// Current phase of the manifold's evolution.
enum class Phase {
    ImpulseLegSharpening,  ///< Curvature tightening with building tension
    SingularityForming,    ///< Peak tension before collapse
    RicciFlowSmoothing,    ///< Correction redistributing tension
    AttractorConvergence,  ///< Settling into a basin (default)
    StableEquilibrium,     ///< Low tension, low entropy
    CompressionBuilding,   ///< Tension accumulating without curvature
};

/// Macro reading of the whole composition.
enum class ConductorReading {
    Crescendo,
    Decrescendo,
    SustainedTension,
    RestPhase,
    Transitional,
};

/// Micro reading of the current phrase.
enum class SingerReading {
    ResonantStable,
    TensionCrackling,
    HarmoniousFlow,
    DissonantStrain,
};

[[nodiscard]] const char* to_string(Phase p) noexcept;
[[nodiscard]] const char* to_string(ConductorReading r) noexcept;
[[nodiscard]] const char* to_string(SingerReading r) noexcept;

[[nodiscard]] std::optional<Phase>            try_parse_phase(std::string_view tag) noexcept;
[[nodiscard]] std::optional<ConductorReading> try_parse_conductor(std::string_view tag) noexcept;
[[nodiscard]] std::optional<SingerReading>    try_parse_singer(std::string_view tag) noexcept;

// ─── Phase Rule Table ─────────────────────────────────────────────────────────

/// Instantaneous values the phase cascade reads. Signed; rules take
/// magnitudes of curvature, tension and flow.
struct PhaseInputs {
    double      curvature = 0.0;
    double      tension   = 0.0;
    double      entropy   = 0.0;
    double      flow      = 0.0;
    std::size_t singularity_count = 0;
};

/// Tunable breakpoints of the phase cascade.
struct PhaseThresholds {
    double singularity_curvature = constants::PHASE_SINGULARITY_CURVATURE;
    double singularity_tension   = constants::PHASE_SINGULARITY_TENSION;
    double flow_magnitude        = constants::PHASE_FLOW_MAGNITUDE;
    double flow_tension          = constants::PHASE_FLOW_TENSION;
    double impulse_curvature     = constants::PHASE_IMPULSE_CURVATURE;
    double impulse_tension       = constants::PHASE_IMPULSE_TENSION;
    double impulse_max_flow      = constants::PHASE_IMPULSE_MAX_FLOW;
    double compression_tension   = constants::PHASE_COMPRESSION_TENSION;
    double compression_max_curv  = constants::PHASE_COMPRESSION_MAX_CURV;
    double stable_max_curvature  = constants::PHASE_STABLE_MAX_CURVATURE;
    double stable_max_tension    = constants::PHASE_STABLE_MAX_TENSION;
    double stable_max_entropy    = constants::PHASE_STABLE_MAX_ENTROPY;
};

/// One guarded row of the cascade.
struct PhaseRule {
    Phase       phase;
    const char* condition;  ///< Human-readable guard, for audit output
    bool (*matches)(const PhaseInputs&, const PhaseThresholds&);
};

/// The ordered cascade, rows 1–5. Row 6 (AttractorConvergence) is the
/// fallback applied by `diagnose_phase` when no row matches.
[[nodiscard]] std::span<const PhaseRule> phase_rules() noexcept;

/// Walk `phase_rules()` top to bottom and return the first matching phase.
[[nodiscard]] Phase diagnose_phase(const PhaseInputs& inputs,
                                   const PhaseThresholds& thresholds = PhaseThresholds{}) noexcept;

// ─── Interpretation ───────────────────────────────────────────────────────────

/// Nearest attractor and its description.
struct NearestAttractor {
    double      price = 0.0;
    std::string description;
};

/// Result of `ManifoldInterpreter::interpret`.
struct Interpretation {
    Phase            phase      = Phase::AttractorConvergence;
    double           confidence = 1.0;  ///< In (0, 1]
    ConductorReading conductor  = ConductorReading::Transitional;
    SingerReading    singer     = SingerReading::HarmoniousFlow;

    std::string curvature_state;
    std::string tension_description;
    std::string entropy_state;

    std::optional<std::string>      wave_position;
    std::optional<NearestAttractor> nearest_attractor;
    double                          pull_strength = 0.0;

    std::string                narrative;
    std::optional<std::string> warning;

    double curvature_value = 0.0;
    double entropy_value   = 0.0;
    double tension_value   = 0.0;
};

/// Interpreter tunables.
struct InterpreterConfig {
    PhaseThresholds phase{};
    double      high_tension_threshold    = constants::HIGH_TENSION_THRESHOLD;
    double      high_entropy_threshold    = constants::HIGH_ENTROPY_THRESHOLD;
    std::size_t singularity_warning_count = constants::SINGULARITY_WARNING_COUNT;
    std::size_t trend_window              = constants::TREND_WINDOW;
    std::size_t curvature_trend_window    = constants::CURVATURE_TREND_WINDOW;
    std::size_t confidence_window         = constants::CONFIDENCE_WINDOW;
    double      converging_distance_pct   = constants::CONVERGING_DISTANCE_PCT;
};

/// Nearest attractor plus its distance-weighted pull.
struct AttractorPull {
    std::optional<NearestAttractor> nearest;
    double                          pull_strength = 0.0;
    double                          distance_pct  = 0.0;
};

// ─── ManifoldInterpreter ──────────────────────────────────────────────────────

/// Turns a metrics snapshot into an `Interpretation`.
class ManifoldInterpreter {
public:
    explicit ManifoldInterpreter(InterpreterConfig config = InterpreterConfig{}) noexcept;

    /// Full interpretation of the latest sample of `metrics`.
    [[nodiscard]] Interpretation interpret(const ManifoldMetrics& metrics) const noexcept;

    /// Macro reading from the trailing trend of tension and curvature.
    [[nodiscard]] ConductorReading
    conductor_reading(const ManifoldMetrics& metrics) const noexcept;

    /// Micro reading from instantaneous curvature, tension and entropy.
    [[nodiscard]] SingerReading
    singer_reading(double curvature, double tension, double entropy) const noexcept;

    /// Mean of 1/(1+σ) over the trailing curvature and tension windows.
    /// In (0, 1] for finite input.
    [[nodiscard]] double confidence(std::span<const double> curvature,
                                    std::span<const double> tension) const noexcept;

    /// Nearest attractor to `price` by absolute distance.
    /// `pull_strength = strength / (1 + distance_pct)`.
    [[nodiscard]] AttractorPull
    attractor_pull(double price, std::span<const Attractor> attractors) const noexcept;

    /// Side-channel warning, first match: singularity phase, high tension,
    /// repeated singularities.
    [[nodiscard]] std::optional<std::string>
    warning(Phase phase, double tension, std::size_t singularity_count) const noexcept;

    [[nodiscard]] const InterpreterConfig& config() const noexcept { return config_; }

private:
    InterpreterConfig config_;
};

}  // namespace cmf
