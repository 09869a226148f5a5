/// @file tests/readout/test_quality.cpp
/// @brief Model quality grading and price projection.

#include <gtest/gtest.h>
#include "cmf/readout.hpp"

#include <vector>

using namespace cmf;

namespace {

ManifoldMetrics flat(std::size_t n, std::vector<Attractor> attractors) {
    ManifoldMetrics m;
    m.prices.assign(n, 100.0);
    m.timestamps.assign(n, 0.0);
    m.curvature.assign(n, 0.0);
    m.local_entropy.assign(n, 0.0);
    m.tension.assign(n, 0.0);
    m.flow.assign(n, 0.0);
    m.attractors = std::move(attractors);
    return m;
}

ManifoldMetrics latest(double entropy, double tension, std::vector<Attractor> attractors = {}) {
    auto m = flat(10, std::move(attractors));
    m.local_entropy.back() = entropy;
    m.tension.back() = tension;
    return m;
}

}  // anonymous namespace

// ─── model_quality ───────────────────────────────────────────────────────────

TEST(ModelQuality, EmptySnapshot) {
    const ManifoldMetrics empty;
    const auto q = model_quality(empty);
    EXPECT_EQ(q.consistency, 100);
    EXPECT_EQ(q.signal_clarity, 50);
    EXPECT_EQ(q.sample_sufficiency, 0);
    EXPECT_EQ(q.overall, 55);
    EXPECT_EQ(q.grade, 'C');
}

TEST(ModelQuality, WideSeparationGradesA) {
    const auto q = model_quality(flat(400, {{50.0, 1.0}, {150.0, 0.9}}));
    EXPECT_EQ(q.consistency, 100);
    EXPECT_EQ(q.signal_clarity, 100);
    EXPECT_EQ(q.sample_sufficiency, 100);
    EXPECT_EQ(q.overall, 100);
    EXPECT_EQ(q.grade, 'A');
}

TEST(ModelQuality, NarrowSeparation) {
    const auto q = model_quality(flat(400, {{99.5, 1.0}, {100.5, 0.8}}));
    EXPECT_EQ(q.signal_clarity, 10);
    EXPECT_EQ(q.overall, 73);
    EXPECT_EQ(q.grade, 'B');
}

TEST(ModelQuality, OnlyFirstThreeAttractorsCount) {
    const auto q = model_quality(flat(400, {{99.0, 1.0}, {100.0, 0.9}, {101.0, 0.8}, {500.0, 0.1}}));
    EXPECT_EQ(q.signal_clarity, 20);
}

TEST(ModelQuality, NoisyCurvatureLowersConsistency) {
    auto m = flat(40, {{100.0, 1.0}});
    for (std::size_t i = 0; i < m.curvature.size(); ++i) {
        m.curvature[i] = (i % 2 == 0) ? 1.0 : -1.0;
    }
    EXPECT_EQ(model_quality(m).consistency, 50);
}

TEST(ModelQuality, ShortNoisySeriesGradesD) {
    auto m = flat(10, {{100.0, 1.0}});
    for (std::size_t i = 0; i < m.curvature.size(); ++i) {
        m.curvature[i] = (i % 2 == 0) ? 100.0 : -100.0;
    }
    const auto q = model_quality(m);
    EXPECT_EQ(q.consistency, 0);
    EXPECT_EQ(q.sample_sufficiency, 5);
    EXPECT_EQ(q.grade, 'D');
}

// ─── project ─────────────────────────────────────────────────────────────────

TEST(Project, HorizonMultipliers) {
    EXPECT_DOUBLE_EQ(horizon_multiplier(Horizon::Micro), 0.5);
    EXPECT_DOUBLE_EQ(horizon_multiplier(Horizon::Short), 1.0);
    EXPECT_DOUBLE_EQ(horizon_multiplier(Horizon::Medium), 2.0);
    EXPECT_DOUBLE_EQ(horizon_multiplier(Horizon::Long), 4.0);
    EXPECT_DOUBLE_EQ(horizon_multiplier(Horizon::Macro), 8.0);
}

TEST(Project, RangeFromEntropy) {
    const auto p = project(latest(2.0, 0.0), 100.0, Horizon::Medium);
    EXPECT_NEAR(p.range_pct, 40.0, 1e-9);
    EXPECT_NEAR(p.low, 60.0, 1e-9);
    EXPECT_NEAR(p.high, 140.0, 1e-9);
    EXPECT_EQ(p.horizon, Horizon::Medium);
    EXPECT_DOUBLE_EQ(p.current_price, 100.0);
}

TEST(Project, NegativeEntropyGivesZeroWidthBand) {
    const auto p = project(latest(-250.0, 2.0), 100.0, Horizon::Macro);
    EXPECT_DOUBLE_EQ(p.range_pct, 0.0);
    EXPECT_DOUBLE_EQ(p.low, 100.0);
    EXPECT_DOUBLE_EQ(p.high, 100.0);
}

TEST(Project, RangeScalesWithHorizonAndTension) {
    const auto m = latest(1.0, 1.0);
    const auto medium = project(m, 100.0, Horizon::Medium);
    const auto macro  = project(m, 100.0, Horizon::Macro);
    EXPECT_NEAR(macro.range_pct, 4.0 * medium.range_pct, 1e-9);
    EXPECT_NEAR(medium.range_pct, 0.1 * 2.0 * 1.2 * 100.0, 1e-9);
}

TEST(Project, Bias) {
    const auto up = project(latest(1.0, 1.0), 100.0, Horizon::Short);
    EXPECT_EQ(up.bias, Bias::Bullish);
    EXPECT_EQ(up.bias_confidence, 50);

    const auto down = project(latest(1.0, -3.0), 100.0, Horizon::Short);
    EXPECT_EQ(down.bias, Bias::Bearish);
    EXPECT_EQ(down.bias_confidence, 100);

    const auto flat_bias = project(latest(1.0, 0.0), 100.0, Horizon::Short);
    EXPECT_EQ(flat_bias.bias, Bias::Neutral);
    EXPECT_EQ(flat_bias.bias_confidence, 50);

    const auto edge = project(latest(1.0, 0.5), 100.0, Horizon::Short);
    EXPECT_EQ(edge.bias, Bias::Neutral);
    EXPECT_EQ(edge.bias_confidence, 35);
}

TEST(Project, TargetsStrongestFirstCappedAtFive) {
    const std::vector<Attractor> attractors{
        {90.0, 0.2}, {95.0, 1.0}, {105.0, 0.6}, {110.0, 0.6},
        {120.0, 0.9}, {80.0, 0.1}, {130.0, 0.3},
    };
    const auto p = project(latest(1.0, 0.0, attractors), 100.0, Horizon::Short);
    ASSERT_EQ(p.targets.size(), 5u);
    EXPECT_DOUBLE_EQ(p.targets[0].price, 95.0);
    EXPECT_DOUBLE_EQ(p.targets[1].price, 120.0);
    EXPECT_DOUBLE_EQ(p.targets[2].price, 105.0);  // ties keep input order
    EXPECT_DOUBLE_EQ(p.targets[3].price, 110.0);
    EXPECT_DOUBLE_EQ(p.targets[4].price, 130.0);

    EXPECT_FALSE(p.targets[0].above);
    EXPECT_NEAR(p.targets[0].distance_pct, -5.0, 1e-12);
    EXPECT_TRUE(p.targets[1].above);
    EXPECT_NEAR(p.targets[1].distance_pct, 20.0, 1e-12);
}
