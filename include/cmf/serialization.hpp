#pragma once

/// @file include/cmf/serialization.hpp
/// @brief JSON mapping of the CMF value objects (nlohmann/json).
///
/// Arrays map to JSON number arrays, enums to their lowercase wire tags,
/// and absent optionals to `null`. `ManifoldMetrics` uses the established
/// wire keys: `timestamp`, `prices`, `curvature`, `entropy`,
/// `local_entropy`, `singularities`, `attractors`, `ricci_flow`, `tension`,
/// `timescale`.
///
/// The `*_from_json` readers return `std::nullopt` on a missing key, a
/// wrong JSON type, an unknown tag, or (for metrics) arrays whose lengths
/// disagree. They never throw.

#include "cmf/interpreter.hpp"
#include "cmf/metrics.hpp"
#include "cmf/multiscale.hpp"
#include "cmf/phrase_bank.hpp"
#include "cmf/readout.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace cmf {

[[nodiscard]] nlohmann::json to_json(const ManifoldMetrics& metrics);
[[nodiscard]] nlohmann::json to_json(const Interpretation& interpretation);
[[nodiscard]] nlohmann::json to_json(const PulseReading& pulse);
[[nodiscard]] nlohmann::json to_json(const ModelQuality& quality);
[[nodiscard]] nlohmann::json to_json(const PriceProjection& projection);
[[nodiscard]] nlohmann::json to_json(const FractalSummary& summary);
[[nodiscard]] nlohmann::json to_json(const SingularityEvent& event);
[[nodiscard]] nlohmann::json to_json(const AttractorLevel& level);
[[nodiscard]] nlohmann::json to_json(const phrases::InterpretationText& text);

/// `{"scales": {"daily": {...}, ...}, "failures": {"monthly": "...", ...}}`.
[[nodiscard]] nlohmann::json to_json(const MultiScaleResult& result);

[[nodiscard]] std::optional<ManifoldMetrics> metrics_from_json(const nlohmann::json& j) noexcept;
[[nodiscard]] std::optional<Interpretation>  interpretation_from_json(const nlohmann::json& j) noexcept;
[[nodiscard]] std::optional<PulseReading>    pulse_from_json(const nlohmann::json& j) noexcept;
[[nodiscard]] std::optional<ModelQuality>    quality_from_json(const nlohmann::json& j) noexcept;
[[nodiscard]] std::optional<PriceProjection> projection_from_json(const nlohmann::json& j) noexcept;

}  // namespace cmf
