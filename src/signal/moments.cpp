/// @file src/signal/moments.cpp
/// @brief Mean / standard deviation / trend helpers for the signal module.

#include "cmf/signal.hpp"
#include "cmf/types.hpp"

#include <cmath>

namespace cmf::signal {

// ─── mean ─────────────────────────────────────────────────────────────────────

double mean(std::span<const double> x) noexcept {
    if (x.empty()) {
        return 0.0;
    }
    const ConstSeriesMap a(x.data(), static_cast<Eigen::Index>(x.size()));
    return a.mean();
}

// ─── stddev ───────────────────────────────────────────────────────────────────

double stddev(std::span<const double> x) noexcept {
    if (x.empty()) {
        return 0.0;
    }
    const ConstSeriesMap a(x.data(), static_cast<Eigen::Index>(x.size()));
    const double m = a.mean();
    // Population (ddof = 0) deviation.
    return std::sqrt((a - m).square().mean());
}

// ─── mean_diff ────────────────────────────────────────────────────────────────

double mean_diff(std::span<const double> x) noexcept {
    if (x.size() < 2) {
        return 0.0;
    }
    const auto n = static_cast<Eigen::Index>(x.size());
    const ConstSeriesMap a(x.data(), n);
    return (a.tail(n - 1) - a.head(n - 1)).mean();
}

// ─── tail ─────────────────────────────────────────────────────────────────────

std::span<const double> tail(std::span<const double> x, std::size_t count) noexcept {
    if (count >= x.size()) {
        return x;
    }
    return x.subspan(x.size() - count);
}

}  // namespace cmf::signal
