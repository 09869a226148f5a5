/// @file src/signal/histogram.cpp
/// @brief Equal-width histogram with numpy.histogram bin assignment.

#include "cmf/signal.hpp"

#include <algorithm>
#include <cmath>

namespace cmf::signal {

// ─── Histogram::center ────────────────────────────────────────────────────────

double Histogram::center(std::size_t i) const noexcept {
    return (edges[i] + edges[i + 1]) / 2.0;
}

// ─── Histogram::bucket_of ─────────────────────────────────────────────────────

std::optional<std::size_t> Histogram::bucket_of(double value) const noexcept {
    const std::size_t bins = heights.size();
    if (bins == 0 || !std::isfinite(value)) {
        return std::nullopt;
    }
    const double first = edges.front();
    const double last  = edges.back();
    if (value < first || value > last) {
        return std::nullopt;
    }

    const double norm = static_cast<double>(bins) / (last - first);
    const double pos  = (value - first) * norm;
    // A range that overflowed to inf yields a NaN position.
    std::size_t idx = bins - 1;
    if (std::isfinite(pos) && pos < static_cast<double>(bins - 1)) {
        idx = static_cast<std::size_t>(pos);
    }

    // Linear-scale rounding can land one bucket off; settle against the edges.
    if (value < edges[idx] && idx > 0) {
        --idx;
    } else if (idx + 1 < bins && value >= edges[idx + 1]) {
        ++idx;
    }
    return idx;
}

// ─── histogram ────────────────────────────────────────────────────────────────

Histogram histogram(std::span<const double> x, std::size_t bins, bool density) noexcept {
    Histogram h;
    if (x.empty() || bins == 0) {
        return h;
    }

    const auto [lo_it, hi_it] = std::minmax_element(x.begin(), x.end());
    double first = *lo_it;
    double last  = *hi_it;
    if (first == last) {
        first -= 0.5;
        last  += 0.5;
    }

    h.edges.resize(bins + 1);
    const double step = (last - first) / static_cast<double>(bins);
    h.edges[0] = first;
    for (std::size_t k = 1; k < bins; ++k) {
        h.edges[k] = first + static_cast<double>(k) * step;
    }
    h.edges[bins] = last;

    h.heights.assign(bins, 0.0);
    for (double v : x) {
        if (const auto idx = h.bucket_of(v)) {
            h.heights[*idx] += 1.0;
        }
    }

    if (density) {
        const double total = static_cast<double>(x.size());
        for (std::size_t k = 0; k < bins; ++k) {
            const double width = h.edges[k + 1] - h.edges[k];
            h.heights[k] = h.heights[k] / (total * width);
        }
    }
    return h;
}

}  // namespace cmf::signal
