#pragma once

#include <cstddef>

/// @file include/cmf/constants.hpp
/// @brief Numerical guards and tunable thresholds for the Conductor's
///        Manifold (CMF) library.
///
/// Every threshold used by the engine and the interpreter is named here and
/// copied into the corresponding config struct as its default. None of the
/// interpreter thresholds has an analytical derivation; they are calibration
/// points and should be tuned through the config structs, not edited here.

namespace cmf::constants {

// ─── Numerical Guards ─────────────────────────────────────────────────────────

/// Additive guard applied to every variance / mean / price denominator.
static constexpr double DENOM_EPSILON = 1e-8;

/// Additive guard inside log2 for entropy terms.
static constexpr double LOG_EPSILON = 1e-8;

/// Minimum number of samples accepted by ManifoldEngine::analyze.
static constexpr std::size_t MIN_SERIES_LENGTH = 2;

// ─── Metrics Engine Defaults ──────────────────────────────────────────────────

/// Default singularity-threshold multiplier.
static constexpr double DEFAULT_SENSITIVITY = 1.0;

/// Upper bound for a valid sensitivity value.
static constexpr double MAX_SENSITIVITY = 100.0;

/// Curvature smoothing window; Gaussian σ = window / 3.
static constexpr std::size_t CURVATURE_SMOOTH_WINDOW = 5;

/// Histogram buckets for global return entropy.
static constexpr std::size_t GLOBAL_ENTROPY_BINS = 50;

/// Rolling window for local entropy.
static constexpr std::size_t LOCAL_ENTROPY_WINDOW = 20;

/// Cap on local-entropy histogram buckets (actual = min(cap, window / 2)).
static constexpr std::size_t LOCAL_ENTROPY_MAX_BINS = 10;

/// Gaussian σ of the long equilibrium average used by tension.
static constexpr double TENSION_LONG_SIGMA = 20.0;

/// Composite curvature×tension score a singularity must reach (× sensitivity).
static constexpr double SINGULARITY_THRESHOLD = 2.0;

/// Minimum index separation between two singularities.
static constexpr std::size_t SINGULARITY_MIN_SEPARATION = 10;

/// Price histogram buckets for attractor detection.
static constexpr std::size_t ATTRACTOR_BINS = 50;

/// Attractor peak prominence as a fraction of std(bucket heights).
static constexpr double ATTRACTOR_PROMINENCE_FRACTION = 0.5;

/// Minimum bucket separation between two attractors.
static constexpr std::size_t ATTRACTOR_MIN_SEPARATION = 3;

/// Maximum number of attractors reported.
static constexpr std::size_t MAX_ATTRACTORS = 5;

/// Time step of the Ricci-flow estimate.
static constexpr double FLOW_DT = 0.1;

/// Gaussian σ applied to the flow gradient.
static constexpr double FLOW_SMOOTH_SIGMA = 3.0;

/// Gaussian kernel truncation, in standard deviations.
static constexpr double GAUSSIAN_TRUNCATE = 4.0;

// ─── Multi-Scale Decimation ───────────────────────────────────────────────────

static constexpr std::size_t MONTHLY_STRIDE  = 20;
static constexpr std::size_t WEEKLY_STRIDE   = 5;
static constexpr std::size_t DAILY_STRIDE    = 1;
static constexpr std::size_t INTRADAY_STRIDE = 1;

// ─── Phase Cascade ────────────────────────────────────────────────────────────

static constexpr double PHASE_SINGULARITY_CURVATURE = 2.0;
static constexpr double PHASE_SINGULARITY_TENSION   = 1.5;
static constexpr double PHASE_FLOW_MAGNITUDE        = 0.5;
static constexpr double PHASE_FLOW_TENSION          = 0.5;
static constexpr double PHASE_IMPULSE_CURVATURE     = 0.5;
static constexpr double PHASE_IMPULSE_TENSION       = 0.7;
static constexpr double PHASE_IMPULSE_MAX_FLOW      = 0.3;
static constexpr double PHASE_COMPRESSION_TENSION   = 1.0;
static constexpr double PHASE_COMPRESSION_MAX_CURV  = 0.5;
static constexpr double PHASE_STABLE_MAX_CURVATURE  = 0.3;
static constexpr double PHASE_STABLE_MAX_TENSION    = 0.5;
static constexpr double PHASE_STABLE_MAX_ENTROPY    = 4.0;

// ─── Interpreter ──────────────────────────────────────────────────────────────

/// Tension magnitude above which a high-tension warning is raised.
static constexpr double HIGH_TENSION_THRESHOLD = 1.5;

/// Local entropy above which the market reads as "frothy".
static constexpr double HIGH_ENTROPY_THRESHOLD = 6.0;

/// Singularity count above which a structural-instability warning is raised.
static constexpr std::size_t SINGULARITY_WARNING_COUNT = 2;

/// Trailing samples used for the conductor trend statistics.
static constexpr std::size_t TREND_WINDOW = 20;

/// Trailing samples used for the curvature description trend.
static constexpr std::size_t CURVATURE_TREND_WINDOW = 10;

/// Trailing samples used for the confidence score.
static constexpr std::size_t CONFIDENCE_WINDOW = 10;

/// Attractor distance (percent) below which price is "converging".
static constexpr double CONVERGING_DISTANCE_PCT = 1.0;

// ─── Readout ──────────────────────────────────────────────────────────────────

/// Fraction of the series treated as "recent" for singularity counts.
static constexpr double RECENT_FRACTION = 0.2;

/// Trailing samples used by the model-quality consistency score.
static constexpr std::size_t QUALITY_WINDOW = 20;

} // namespace cmf::constants
