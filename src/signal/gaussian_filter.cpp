/// @file src/signal/gaussian_filter.cpp
/// @brief Discrete gradient and 1-D Gaussian smoothing.

#include "cmf/signal.hpp"

#include <cmath>
#include <cstdint>

namespace cmf::signal {

namespace {

/// Map an out-of-range index onto the half-sample symmetric extension of an
/// array of length n (d c b a | a b c d | d c b a). Precondition: n > 0.
std::size_t reflect_index(std::int64_t j, std::int64_t n) noexcept {
    const std::int64_t period = 2 * n;
    std::int64_t m = j % period;
    if (m < 0) {
        m += period;
    }
    if (m >= n) {
        m = period - 1 - m;
    }
    return static_cast<std::size_t>(m);
}

}  // anonymous namespace

// ─── gradient ─────────────────────────────────────────────────────────────────

std::vector<double> gradient(std::span<const double> x) noexcept {
    const std::size_t n = x.size();
    std::vector<double> out(n, 0.0);
    if (n < 2) {
        return out;
    }

    out.front() = x[1] - x[0];
    out.back()  = x[n - 1] - x[n - 2];
    for (std::size_t i = 1; i + 1 < n; ++i) {
        out[i] = (x[i + 1] - x[i - 1]) / 2.0;
    }
    return out;
}

// ─── gaussian_filter ──────────────────────────────────────────────────────────

std::vector<double> gaussian_filter(std::span<const double> x,
                                    double sigma,
                                    double truncate) noexcept {
    std::vector<double> out(x.begin(), x.end());
    if (x.empty() || !(sigma > 0.0) || !std::isfinite(sigma)) {
        return out;
    }

    const auto radius = static_cast<std::int64_t>(truncate * sigma + 0.5);

    // Normalised symmetric kernel, index 0 ↔ offset −radius.
    std::vector<double> kernel(static_cast<std::size_t>(2 * radius + 1));
    double sum = 0.0;
    for (std::int64_t k = -radius; k <= radius; ++k) {
        const double w = std::exp(-0.5 * static_cast<double>(k * k) / (sigma * sigma));
        kernel[static_cast<std::size_t>(k + radius)] = w;
        sum += w;
    }
    for (double& w : kernel) {
        w /= sum;
    }

    const auto n = static_cast<std::int64_t>(x.size());
    for (std::int64_t i = 0; i < n; ++i) {
        double acc = 0.0;
        for (std::int64_t k = -radius; k <= radius; ++k) {
            const std::int64_t j = i + k;
            const double v = (j >= 0 && j < n)
                ? x[static_cast<std::size_t>(j)]
                : x[reflect_index(j, n)];
            acc += kernel[static_cast<std::size_t>(k + radius)] * v;
        }
        out[static_cast<std::size_t>(i)] = acc;
    }
    return out;
}

}  // namespace cmf::signal
