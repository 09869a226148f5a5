#pragma once

/// @file include/cmf/readout.hpp
/// @brief Compact readouts derived from a metrics snapshot.
///
/// # Module: Readout
///
/// ## Responsibility
/// Summaries built on top of `ManifoldMetrics` and `Interpretation` for
/// polling clients and reports:
///
///   - `pulse`           latest levels, nearest attractor, recent singularities
///   - `singularity_events` / `attractor_levels`  per-event and per-level detail
///   - `model_quality`   consistency / clarity / sample-size grade
///   - `project`         horizon-scaled price band and attractor targets
///   - `fractal_summary` phase agreement across timescales
///
/// ## Guarantees
/// - All functions are `noexcept` and accept empty snapshots
/// - Every percentage divides by a magnitude floored at `DENOM_EPSILON`

#include "cmf/interpreter.hpp"
#include "cmf/metrics.hpp"
#include "cmf/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace cmf {

// ─── Tags ─────────────────────────────────────────────────────────────────────

enum class Level { Low, Medium, High };

/// Coarse manifold state reported by `pulse`.
enum class PulseState {
    HighTension,   ///< |t| > 1.5 with e > 5
    Compressed,    ///< |t| > 1.5 with e <= 5
    Chaotic,       ///< e > 5
    Stable,        ///< |t| < 0.5 and e < 3
    Transitional,
};

/// Projection horizon; scales the projected range.
enum class Horizon { Micro, Short, Medium, Long, Macro };

enum class Bias { Bullish, Bearish, Neutral };

[[nodiscard]] const char* to_string(Level l) noexcept;
[[nodiscard]] const char* to_string(PulseState s) noexcept;
[[nodiscard]] const char* to_string(Horizon h) noexcept;
[[nodiscard]] const char* to_string(Bias b) noexcept;

[[nodiscard]] std::optional<Level>      try_parse_level(std::string_view tag) noexcept;
[[nodiscard]] std::optional<PulseState> try_parse_pulse_state(std::string_view tag) noexcept;
[[nodiscard]] std::optional<Horizon>    try_parse_horizon(std::string_view tag) noexcept;
[[nodiscard]] std::optional<Bias>       try_parse_bias(std::string_view tag) noexcept;

/// Range multiplier: 0.5 / 1 / 2 / 4 / 8 from Micro to Macro.
[[nodiscard]] double horizon_multiplier(Horizon h) noexcept;

// ─── Pulse ────────────────────────────────────────────────────────────────────

struct AttractorDistance {
    double price        = 0.0;
    double distance     = 0.0;  ///< Absolute price distance
    double distance_pct = 0.0;
};

struct PulseReading {
    double      current_price = 0.0;
    double      entropy       = 0.0;
    Level       entropy_level = Level::Low;
    double      tension       = 0.0;
    Level       tension_level = Level::Low;
    std::optional<AttractorDistance> nearest_attractor;
    std::size_t recent_singularities = 0;  ///< Singularities in the last 20% of samples
    PulseState  state = PulseState::Transitional;
};

/// Lightweight summary of the latest state. `current_price` defaults to
/// the last price of the snapshot.
[[nodiscard]] PulseReading pulse(const ManifoldMetrics& metrics,
                                 std::optional<double> current_price = std::nullopt) noexcept;

// ─── Detail Listings ──────────────────────────────────────────────────────────

/// Snapshot values at one singularity index.
struct SingularityEvent {
    std::size_t index     = 0;
    double      timestamp = 0.0;
    double      price     = 0.0;
    double      curvature = 0.0;
    double      tension   = 0.0;
    double      entropy   = 0.0;  ///< Local entropy at the index
};

/// One record per singularity, in index order. Indices past the end of any
/// per-sample array are skipped.
[[nodiscard]] std::vector<SingularityEvent>
singularity_events(const ManifoldMetrics& metrics) noexcept;

struct AttractorLevel {
    double price        = 0.0;
    double strength     = 0.0;
    double distance_pct = 0.0;  ///< Signed; positive when the level is above
};

/// Every attractor of the snapshot in its stored order (strongest first),
/// with the signed distance from `current_price`.
[[nodiscard]] std::vector<AttractorLevel>
attractor_levels(const ManifoldMetrics& metrics, double current_price) noexcept;

// ─── Model Quality ────────────────────────────────────────────────────────────

struct ModelQuality {
    int  overall            = 0;
    int  consistency        = 0;
    int  signal_clarity     = 0;
    int  sample_sufficiency = 0;
    char grade              = 'D';
};

/// Scores in [0, 100]; grade A >= 80, B >= 60, C >= 40, else D.
[[nodiscard]] ModelQuality model_quality(const ManifoldMetrics& metrics) noexcept;

// ─── Projection ───────────────────────────────────────────────────────────────

struct ProjectionTarget {
    double price        = 0.0;
    double strength     = 0.0;
    double distance_pct = 0.0;  ///< Signed; positive when the target is above
    bool   above        = false;
};

struct PriceProjection {
    double  current_price = 0.0;
    Horizon horizon       = Horizon::Medium;
    double  low           = 0.0;
    double  high          = 0.0;
    double  range_pct     = 0.0;
    std::vector<ProjectionTarget> targets;  ///< Strongest first, at most 5
    Bias    bias            = Bias::Neutral;
    int     bias_confidence = 0;
};

/// Price band from latest local entropy and tension, scaled by horizon.
/// Non-positive entropy gives a zero-width band, so `low <= high` always
/// holds for a non-negative price.
[[nodiscard]] PriceProjection project(const ManifoldMetrics& metrics,
                                      double current_price,
                                      Horizon horizon) noexcept;

// ─── Fractal Summary ──────────────────────────────────────────────────────────

struct FractalSummary {
    int                  consistency = 0;  ///< % of scales sharing the dominant phase
    std::optional<Phase> dominant_phase;
};

/// Phase agreement across timescales. Ties go to the phase seen first in
/// timescale order.
[[nodiscard]] FractalSummary
fractal_summary(const std::map<Timescale, Interpretation>& interpretations) noexcept;

}  // namespace cmf
