/// @file src/signal/peak_finder.cpp
/// @brief Local-maximum detection with height / distance / prominence filters.
///
/// Filter order follows scipy.signal.find_peaks: height first, then minimum
/// distance (higher peaks claim their neighbourhood first), then prominence.

#include "cmf/signal.hpp"

#include <algorithm>
#include <numeric>

namespace cmf::signal {

namespace {

/// Keep only the peaks whose value under `pred` is true.
template <typename Pred>
std::vector<std::size_t> keep_if(const std::vector<std::size_t>& peaks, Pred pred) {
    std::vector<std::size_t> out;
    out.reserve(peaks.size());
    for (std::size_t k = 0; k < peaks.size(); ++k) {
        if (pred(k)) {
            out.push_back(peaks[k]);
        }
    }
    return out;
}

}  // anonymous namespace

// ─── local_maxima ─────────────────────────────────────────────────────────────

std::vector<std::size_t> local_maxima(std::span<const double> x) noexcept {
    std::vector<std::size_t> peaks;
    if (x.size() < 3) {
        return peaks;
    }

    const std::size_t i_max = x.size() - 1;
    std::size_t i = 1;
    while (i < i_max) {
        if (x[i - 1] < x[i]) {
            std::size_t ahead = i + 1;
            while (ahead < i_max && x[ahead] == x[i]) {
                ++ahead;
            }
            if (x[ahead] < x[i]) {
                const std::size_t left  = i;
                const std::size_t right = ahead - 1;
                peaks.push_back((left + right) / 2);
                i = ahead;
            }
        }
        ++i;
    }
    return peaks;
}

// ─── peak_prominences ─────────────────────────────────────────────────────────

std::vector<double> peak_prominences(std::span<const double> x,
                                     std::span<const std::size_t> peaks) noexcept {
    std::vector<double> out;
    out.reserve(peaks.size());

    for (std::size_t peak : peaks) {
        const double top = x[peak];

        double left_min = top;
        for (std::size_t i = peak + 1; i-- > 0;) {
            if (x[i] > top) break;
            left_min = std::min(left_min, x[i]);
        }

        double right_min = top;
        for (std::size_t i = peak; i < x.size(); ++i) {
            if (x[i] > top) break;
            right_min = std::min(right_min, x[i]);
        }

        out.push_back(top - std::max(left_min, right_min));
    }
    return out;
}

// ─── find_peaks ───────────────────────────────────────────────────────────────

std::vector<std::size_t> find_peaks(std::span<const double> x,
                                    const PeakCriteria& criteria) noexcept {
    std::vector<std::size_t> peaks = local_maxima(x);

    if (criteria.min_height) {
        const double h = *criteria.min_height;
        peaks = keep_if(peaks, [&](std::size_t k) { return x[peaks[k]] >= h; });
    }

    if (criteria.min_distance > 1 && peaks.size() > 1) {
        const std::size_t n = peaks.size();
        std::vector<std::size_t> order(n);
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            return x[peaks[a]] < x[peaks[b]];
        });

        std::vector<bool> keep(n, true);
        for (std::size_t r = n; r-- > 0;) {
            const std::size_t j = order[r];
            if (!keep[j]) continue;
            for (std::size_t k = j; k-- > 0 && peaks[j] - peaks[k] < criteria.min_distance;) {
                keep[k] = false;
            }
            for (std::size_t k = j + 1; k < n && peaks[k] - peaks[j] < criteria.min_distance; ++k) {
                keep[k] = false;
            }
        }
        peaks = keep_if(peaks, [&](std::size_t k) { return keep[k]; });
    }

    if (criteria.min_prominence) {
        const double p = *criteria.min_prominence;
        const auto prom = peak_prominences(x, peaks);
        peaks = keep_if(peaks, [&](std::size_t k) { return prom[k] >= p; });
    }

    return peaks;
}

}  // namespace cmf::signal
