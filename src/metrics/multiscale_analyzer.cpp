/// @file src/metrics/multiscale_analyzer.cpp
/// @brief Multi-Scale Coordinator: async fan-out of the Metrics Engine.

#include "cmf/multiscale.hpp"
#include "cmf/constants.hpp"
#include "cmf/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <future>
#include <utility>

namespace cmf {

// ─── Constructor ──────────────────────────────────────────────────────────────

MultiScaleAnalyzer::MultiScaleAnalyzer(EngineConfig config)
    : engine_(config)
{}

// ─── stride ───────────────────────────────────────────────────────────────────

std::size_t MultiScaleAnalyzer::stride(Timescale t) noexcept {
    switch (t) {
        case Timescale::Monthly:  return constants::MONTHLY_STRIDE;
        case Timescale::Weekly:   return constants::WEEKLY_STRIDE;
        case Timescale::Daily:    return constants::DAILY_STRIDE;
        case Timescale::Intraday: return constants::INTRADAY_STRIDE;
    }
    return 1;
}

// ─── decimate ─────────────────────────────────────────────────────────────────

std::vector<double> MultiScaleAnalyzer::decimate(std::span<const double> x,
                                                 std::size_t stride) noexcept {
    if (stride <= 1) {
        return std::vector<double>(x.begin(), x.end());
    }
    std::vector<double> out;
    out.reserve(x.size() / stride + 1);
    for (std::size_t i = 0; i < x.size(); i += stride) {
        out.push_back(x[i]);
    }
    return out;
}

// ─── analyze_multiscale ───────────────────────────────────────────────────────

MultiScaleResult
MultiScaleAnalyzer::analyze_multiscale(std::span<const double> prices,
                                       std::span<const double> timestamps,
                                       std::span<const Timescale> scales,
                                       std::span<const double> volume) const {
    std::vector<Timescale> requested;
    if (scales.empty()) {
        requested.assign(ALL_TIMESCALES.begin(), ALL_TIMESCALES.end());
    } else {
        for (Timescale t : scales) {
            if (std::find(requested.begin(), requested.end(), t) == requested.end()) {
                requested.push_back(t);
            }
        }
    }

    // Each task owns its decimated copies; the engine is only read.
    std::vector<std::pair<Timescale, std::future<ManifoldMetrics>>> tasks;
    tasks.reserve(requested.size());
    for (Timescale t : requested) {
        tasks.emplace_back(t, std::async(std::launch::async, [this, t, prices, timestamps, volume] {
            const std::size_t s = stride(t);
            const auto p  = decimate(prices, s);
            const auto ts = decimate(timestamps, s);
            const auto v  = decimate(volume, s);
            return engine_.analyze(p, ts, t, v);
        }));
    }

    MultiScaleResult result;
    for (auto& [t, task] : tasks) {
        record(t, task, result);
    }
    return result;
}

// ─── record ───────────────────────────────────────────────────────────────────

void MultiScaleAnalyzer::record(Timescale t,
                                std::future<ManifoldMetrics>& task,
                                MultiScaleResult& result) {
    try {
        result.scales.emplace(t, task.get());
    } catch (const ManifoldError& e) {
        result.failures.emplace(t, e.what());
    } catch (const std::exception& e) {
        result.failures.emplace(t, fmt::format("{} analysis failed: {}", to_string(t), e.what()));
    }
}

}  // namespace cmf
