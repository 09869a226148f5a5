#pragma once

/// @file include/cmf/types.hpp
/// @brief Shared value types for the Conductor's Manifold (CMF) library.

#include <Eigen/Dense>

#include <array>
#include <optional>
#include <string_view>

namespace cmf {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Owning dynamic array used for elementwise series arithmetic.
using SeriesArray = Eigen::ArrayXd;

/// Read-only view of a caller-owned contiguous series.
using ConstSeriesMap = Eigen::Map<const Eigen::ArrayXd>;

// ─── Timescale ────────────────────────────────────────────────────────────────

/// Temporal resolution a metrics snapshot was computed at.
enum class Timescale {
    Monthly,
    Weekly,
    Daily,
    Intraday,
};

/// All timescales, coarsest first.
inline constexpr std::array<Timescale, 4> ALL_TIMESCALES = {
    Timescale::Monthly,
    Timescale::Weekly,
    Timescale::Daily,
    Timescale::Intraday,
};

/// Lower-case wire tag ("monthly", "weekly", "daily", "intraday").
[[nodiscard]] const char* to_string(Timescale t) noexcept;

/// Parse a wire tag. Returns `nullopt` for an unknown tag.
[[nodiscard]] std::optional<Timescale> try_parse_timescale(std::string_view tag) noexcept;

/// Parse a wire tag.
///
/// # Throws
/// `InvalidConfigurationError` for an unknown tag.
[[nodiscard]] Timescale parse_timescale(std::string_view tag);

// ─── Attractor ────────────────────────────────────────────────────────────────

/// A price level with high visitation density.
struct Attractor {
    double price;     ///< Bucket-centre price level
    double strength;  ///< Peak height normalised by the strongest peak, in [0, 1]
};

} // namespace cmf
