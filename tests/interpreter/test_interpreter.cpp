/// @file tests/interpreter/test_interpreter.cpp
/// @brief Unit tests for ManifoldInterpreter.
///
/// Test categories:
///   - Empty snapshot never throws and falls back to defaults
///   - Phase, warning and readings on hand-built snapshots
///   - Conductor trend rules
///   - Singer rules
///   - Confidence range and monotonicity
///   - Attractor pull descriptions

#include <gtest/gtest.h>
#include "cmf/interpreter.hpp"

#include <string>
#include <vector>

using namespace cmf;

namespace {

/// Snapshot of `n` samples whose arrays are constant at the given values.
ManifoldMetrics flat_snapshot(std::size_t n, double c, double t, double e, double f,
                              double price = 100.0) {
    ManifoldMetrics m;
    m.prices.assign(n, price);
    m.timestamps.assign(n, 0.0);
    m.curvature.assign(n, c);
    m.tension.assign(n, t);
    m.local_entropy.assign(n, e);
    m.flow.assign(n, f);
    m.attractors = {Attractor{price, 1.0}};
    return m;
}

std::vector<double> ramp(std::size_t n, double from, double to) {
    std::vector<double> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = from + (to - from) * static_cast<double>(i) / static_cast<double>(n - 1);
    }
    return out;
}

}  // anonymous namespace

// ─── interpret ───────────────────────────────────────────────────────────────

TEST(Interpret, EmptySnapshotUsesDefaults) {
    const ManifoldInterpreter interp;
    const ManifoldMetrics empty;
    const auto r = interp.interpret(empty);

    // Every latest value reads as 0.0, which sits inside the stable band.
    EXPECT_EQ(r.phase, Phase::StableEquilibrium);
    EXPECT_EQ(r.conductor, ConductorReading::RestPhase);
    EXPECT_EQ(r.singer, SingerReading::HarmoniousFlow);
    EXPECT_DOUBLE_EQ(r.confidence, 1.0);
    EXPECT_EQ(r.entropy_state, "crystalline - locked structure");
    EXPECT_FALSE(r.nearest_attractor.has_value());
    EXPECT_DOUBLE_EQ(r.pull_strength, 0.0);
    EXPECT_FALSE(r.warning.has_value());
    EXPECT_EQ(r.curvature_state, "gentle - calm surface");
    EXPECT_EQ(r.tension_description, "minimal - relaxed state");
    EXPECT_FALSE(r.narrative.empty());
}

TEST(Interpret, SingularitySnapshot) {
    const ManifoldInterpreter interp;
    const auto m = flat_snapshot(30, 2.5, 2.0, 3.0, 0.0);
    const auto r = interp.interpret(m);

    EXPECT_EQ(r.phase, Phase::SingularityForming);
    ASSERT_TRUE(r.warning.has_value());
    EXPECT_EQ(r.warning->rfind("SINGULARITY FORMING", 0), 0u);
    EXPECT_EQ(r.singer, SingerReading::TensionCrackling);
    EXPECT_EQ(r.wave_position, "Wave peak - singularity forming");
    EXPECT_DOUBLE_EQ(r.curvature_value, 2.5);
    EXPECT_DOUBLE_EQ(r.tension_value, 2.0);
    EXPECT_DOUBLE_EQ(r.entropy_value, 3.0);
}

TEST(Interpret, StableSnapshot) {
    const ManifoldInterpreter interp;
    const auto m = flat_snapshot(30, 0.1, 0.2, 3.0, 0.0);
    const auto r = interp.interpret(m);

    EXPECT_EQ(r.phase, Phase::StableEquilibrium);
    EXPECT_EQ(r.conductor, ConductorReading::RestPhase);
    EXPECT_EQ(r.singer, SingerReading::HarmoniousFlow);
    EXPECT_FALSE(r.warning.has_value());
    EXPECT_DOUBLE_EQ(r.confidence, 1.0);  // zero deviation in both windows
    ASSERT_TRUE(r.nearest_attractor.has_value());
    EXPECT_EQ(r.nearest_attractor->description, "converging on basin at $100.00");
}

TEST(Interpret, UsesCustomThresholds) {
    InterpreterConfig cfg;
    cfg.phase.stable_max_entropy = 2.0;
    const ManifoldInterpreter interp(cfg);
    const auto r = interp.interpret(flat_snapshot(30, 0.1, 0.2, 3.0, 0.0));
    EXPECT_EQ(r.phase, Phase::AttractorConvergence);
}

// ─── warning ─────────────────────────────────────────────────────────────────

TEST(Warning, FirstMatchWins) {
    const ManifoldInterpreter interp;
    EXPECT_EQ(interp.warning(Phase::SingularityForming, 0.0, 5)->rfind("SINGULARITY FORMING", 0), 0u);
    EXPECT_EQ(interp.warning(Phase::CompressionBuilding, -1.6, 5)->rfind("HIGH TENSION", 0), 0u);
    EXPECT_EQ(interp.warning(Phase::StableEquilibrium, 0.0, 3)->rfind("MULTIPLE SINGULARITIES", 0), 0u);
    EXPECT_FALSE(interp.warning(Phase::StableEquilibrium, 1.5, 2).has_value());
}

// ─── conductor_reading ───────────────────────────────────────────────────────

TEST(Conductor, RisingTensionAndCurvatureIsCrescendo) {
    const ManifoldInterpreter interp;
    auto m = flat_snapshot(40, 0.0, 0.0, 3.0, 0.0);
    m.tension   = ramp(40, 0.0, 1.0);
    m.curvature = ramp(40, -0.5, 0.5);
    EXPECT_EQ(interp.conductor_reading(m), ConductorReading::Crescendo);
}

TEST(Conductor, FallingFromHighTensionIsDecrescendo) {
    const ManifoldInterpreter interp;
    auto m = flat_snapshot(40, 0.0, 0.0, 3.0, 0.0);
    m.tension = ramp(40, 3.0, 1.5);
    EXPECT_EQ(interp.conductor_reading(m), ConductorReading::Decrescendo);
}

TEST(Conductor, FlatHighTensionIsSustained) {
    const ManifoldInterpreter interp;
    auto m = flat_snapshot(40, 0.0, 1.2, 3.0, 0.0);
    m.curvature = ramp(40, 0.5, -0.5);
    EXPECT_EQ(interp.conductor_reading(m), ConductorReading::SustainedTension);
}

TEST(Conductor, QuietIsRest) {
    const ManifoldInterpreter interp;
    EXPECT_EQ(interp.conductor_reading(flat_snapshot(40, 0.0, 0.1, 3.0, 0.0)),
              ConductorReading::RestPhase);
}

TEST(Conductor, OtherwiseTransitional) {
    const ManifoldInterpreter interp;
    EXPECT_EQ(interp.conductor_reading(flat_snapshot(40, 0.0, 0.7, 3.0, 0.0)),
              ConductorReading::Transitional);
}

// ─── singer_reading ──────────────────────────────────────────────────────────

TEST(Singer, Table) {
    const ManifoldInterpreter interp;
    EXPECT_EQ(interp.singer_reading(0.0, 1.6, 0.0), SingerReading::TensionCrackling);
    EXPECT_EQ(interp.singer_reading(2.1, 0.0, 0.0), SingerReading::TensionCrackling);
    EXPECT_EQ(interp.singer_reading(0.0, 1.2, 6.5), SingerReading::DissonantStrain);
    EXPECT_EQ(interp.singer_reading(0.2, 0.3, 4.5), SingerReading::HarmoniousFlow);
    EXPECT_EQ(interp.singer_reading(1.0, 0.3, 3.0), SingerReading::ResonantStable);
    EXPECT_EQ(interp.singer_reading(1.0, 0.9, 5.0), SingerReading::HarmoniousFlow);
}

// ─── confidence ──────────────────────────────────────────────────────────────

TEST(Confidence, FlatWindowsGiveOne) {
    const ManifoldInterpreter interp;
    const std::vector<double> flat(20, 0.7);
    EXPECT_DOUBLE_EQ(interp.confidence(flat, flat), 1.0);
    EXPECT_DOUBLE_EQ(interp.confidence({}, {}), 1.0);
}

TEST(Confidence, DecreasesWithCurvatureDeviation) {
    const ManifoldInterpreter interp;
    const std::vector<double> tension(20, 0.5);
    double previous = 1.1;
    for (double spread : {0.0, 0.5, 1.0, 2.0, 5.0}) {
        const auto curvature = ramp(20, -spread, spread);
        const double c = interp.confidence(curvature, tension);
        EXPECT_GT(c, 0.0);
        EXPECT_LE(c, 1.0);
        EXPECT_LT(c, previous);
        previous = c;
    }
}

TEST(Confidence, OnlyTrailingWindowCounts) {
    const ManifoldInterpreter interp;
    std::vector<double> curvature(30, 0.0);
    for (std::size_t i = 0; i < 20; ++i) curvature[i] = (i % 2 == 0) ? 10.0 : -10.0;
    const std::vector<double> tension(30, 0.0);
    EXPECT_DOUBLE_EQ(interp.confidence(curvature, tension), 1.0);
}

// ─── attractor_pull ──────────────────────────────────────────────────────────

TEST(AttractorPull, NoAttractors) {
    const ManifoldInterpreter interp;
    const auto pull = interp.attractor_pull(100.0, {});
    EXPECT_FALSE(pull.nearest.has_value());
    EXPECT_DOUBLE_EQ(pull.pull_strength, 0.0);
}

TEST(AttractorPull, ConvergingWithinOnePercent) {
    const ManifoldInterpreter interp;
    const std::vector<Attractor> attractors{{120.0, 1.0}, {100.5, 0.8}};
    const auto pull = interp.attractor_pull(100.0, attractors);
    ASSERT_TRUE(pull.nearest.has_value());
    EXPECT_DOUBLE_EQ(pull.nearest->price, 100.5);
    EXPECT_EQ(pull.nearest->description, "converging on basin at $100.50");
    EXPECT_NEAR(pull.distance_pct, 0.5, 1e-12);
    EXPECT_NEAR(pull.pull_strength, 0.8 / 1.5, 1e-12);
}

TEST(AttractorPull, AboveAndBelow) {
    const ManifoldInterpreter interp;
    const std::vector<Attractor> below{{100.0, 1.0}};
    const auto above_pull = interp.attractor_pull(110.0, below);
    EXPECT_EQ(above_pull.nearest->description, "above attractor at $100.00 (9.1% away)");

    const std::vector<Attractor> overhead{{1500.0, 1.0}};
    const auto below_pull = interp.attractor_pull(1000.0, overhead);
    EXPECT_EQ(below_pull.nearest->description, "below attractor at $1,500.00 (50.0% away)");
    EXPECT_NEAR(below_pull.pull_strength, 1.0 / 51.0, 1e-12);
}
