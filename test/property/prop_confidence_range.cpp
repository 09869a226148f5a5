/**
 * @file  prop_confidence_range.cpp
 * @brief Property: interpretation confidence lies in (0, 1] for any finite
 *        snapshot, and `interpret()` accepts arbitrary (even ragged) input.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_confidence_range
 *
 * Mathematical basis:
 *   confidence = ½ · (1 / (1 + σ_c) + 1 / (1 + σ_t)),   σ ≥ 0
 *
 *   Each term lies in (0, 1], so their mean does too; a flat window (σ = 0)
 *   gives exactly 1.
 */

#include <rapidcheck.h>

#include <cmath>
#include <cstdlib>
#include <map>
#include <vector>

#include "cmf/interpreter.hpp"
#include "cmf/readout.hpp"

using namespace cmf;

namespace {

/// Finite doubles in [-1000, 1000] with three decimal places.
std::vector<double> finite_series(std::size_t n) {
    const auto raw = *rc::gen::container<std::vector<int>>(n, rc::gen::inRange(-1000000, 1000001));
    std::vector<double> out;
    out.reserve(raw.size());
    for (int v : raw) {
        out.push_back(static_cast<double>(v) / 1000.0);
    }
    return out;
}

}  // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: confidence ∈ (0, 1] ─────────────────────────────────────
    ok = rc::check(
        "confidence_range: confidence is in (0, 1]",
        []() {
            const auto nc = *rc::gen::inRange<std::size_t>(0, 60);
            const auto nt = *rc::gen::inRange<std::size_t>(0, 60);
            const auto curvature = finite_series(nc);
            const auto tension   = finite_series(nt);

            const ManifoldInterpreter interp;
            const double c = interp.confidence(curvature, tension);
            RC_ASSERT(std::isfinite(c));
            RC_ASSERT(c > 0.0);
            RC_ASSERT(c <= 1.0);
        }
    ) && ok;

    // ── Property 2: interpret() is total ────────────────────────────────────
    ok = rc::check(
        "confidence_range: interpret accepts ragged snapshots",
        []() {
            ManifoldMetrics m;
            m.prices        = finite_series(*rc::gen::inRange<std::size_t>(0, 40));
            m.curvature     = finite_series(*rc::gen::inRange<std::size_t>(0, 40));
            m.tension       = finite_series(*rc::gen::inRange<std::size_t>(0, 40));
            m.local_entropy = finite_series(*rc::gen::inRange<std::size_t>(0, 40));
            m.flow          = finite_series(*rc::gen::inRange<std::size_t>(0, 40));
            const auto levels = finite_series(*rc::gen::inRange<std::size_t>(0, 6));
            for (double level : levels) {
                m.attractors.push_back(Attractor{level, 0.5});
            }
            m.singularities.resize(*rc::gen::inRange<std::size_t>(0, 5));

            const ManifoldInterpreter interp;
            const auto r = interp.interpret(m);
            RC_ASSERT(r.confidence > 0.0);
            RC_ASSERT(r.confidence <= 1.0);
            RC_ASSERT(!r.narrative.empty());
            RC_ASSERT(r.nearest_attractor.has_value() == !m.attractors.empty());
            RC_ASSERT(r.pull_strength >= 0.0);

            const auto q = model_quality(m);
            RC_ASSERT(q.overall >= 0 && q.overall <= 100);
        }
    ) && ok;

    // ── Property 3: fractal consistency ∈ [0, 100] ──────────────────────────
    ok = rc::check(
        "confidence_range: fractal consistency is a percentage",
        []() {
            std::map<Timescale, Interpretation> readings;
            for (Timescale t : ALL_TIMESCALES) {
                if (*rc::gen::arbitrary<bool>()) {
                    Interpretation i;
                    i.phase = *rc::gen::element(Phase::ImpulseLegSharpening,
                                                Phase::SingularityForming,
                                                Phase::RicciFlowSmoothing,
                                                Phase::AttractorConvergence,
                                                Phase::StableEquilibrium,
                                                Phase::CompressionBuilding);
                    readings.emplace(t, i);
                }
            }

            const auto s = fractal_summary(readings);
            RC_ASSERT(s.dominant_phase.has_value() == !readings.empty());
            RC_ASSERT(s.consistency >= 0 && s.consistency <= 100);
            if (!readings.empty()) {
                RC_ASSERT(s.consistency >= 100 / static_cast<int>(readings.size()));
            }
        }
    ) && ok;

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
