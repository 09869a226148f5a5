/// @file tests/interpreter/test_phase_rules.cpp
/// @brief Unit tests for the ordered phase cascade and wire tags.
///
/// Each row of the cascade is exercised on its own, then the ordering
/// between overlapping rows, then the fallback.

#include <gtest/gtest.h>
#include "cmf/interpreter.hpp"

#include <string>

using namespace cmf;

namespace {

PhaseInputs inputs(double c, double t, double e, double f) {
    return PhaseInputs{.curvature = c, .tension = t, .entropy = e, .flow = f};
}

}  // anonymous namespace

// ─── Rows ────────────────────────────────────────────────────────────────────

TEST(PhaseRules, TableHasFiveOrderedRows) {
    const auto rules = phase_rules();
    ASSERT_EQ(rules.size(), 5u);
    EXPECT_EQ(rules[0].phase, Phase::SingularityForming);
    EXPECT_EQ(rules[1].phase, Phase::RicciFlowSmoothing);
    EXPECT_EQ(rules[2].phase, Phase::ImpulseLegSharpening);
    EXPECT_EQ(rules[3].phase, Phase::CompressionBuilding);
    EXPECT_EQ(rules[4].phase, Phase::StableEquilibrium);
    for (const auto& r : rules) {
        EXPECT_NE(r.condition, nullptr);
        EXPECT_FALSE(std::string(r.condition).empty());
    }
}

TEST(PhaseRules, SingularityForming) {
    EXPECT_EQ(diagnose_phase(inputs(2.5, 2.0, 0.0, 0.0)), Phase::SingularityForming);
    EXPECT_EQ(diagnose_phase(inputs(-2.5, -2.0, 9.0, 0.0)), Phase::SingularityForming);
}

TEST(PhaseRules, SingularityAnyEntropy) {
    for (double e : {-500.0, 0.0, 3.0, 7.9}) {
        EXPECT_EQ(diagnose_phase(inputs(2.5, 2.0, e, 0.0)), Phase::SingularityForming);
    }
}

TEST(PhaseRules, RicciFlowSmoothing) {
    EXPECT_EQ(diagnose_phase(inputs(0.0, 0.6, 0.0, 0.6)), Phase::RicciFlowSmoothing);
    EXPECT_EQ(diagnose_phase(inputs(0.0, -0.6, 0.0, -0.6)), Phase::RicciFlowSmoothing);
}

TEST(PhaseRules, ImpulseLegSharpening) {
    EXPECT_EQ(diagnose_phase(inputs(0.8, 0.9, 5.0, 0.1)), Phase::ImpulseLegSharpening);
}

TEST(PhaseRules, CompressionBuilding) {
    EXPECT_EQ(diagnose_phase(inputs(0.2, 1.2, 5.0, 0.0)), Phase::CompressionBuilding);
}

TEST(PhaseRules, StableEquilibrium) {
    EXPECT_EQ(diagnose_phase(inputs(0.1, 0.2, 3.0, 0.0)), Phase::StableEquilibrium);
}

TEST(PhaseRules, FallbackIsAttractorConvergence) {
    EXPECT_EQ(diagnose_phase(inputs(0.1, 0.2, 4.0, 0.0)), Phase::AttractorConvergence);
    EXPECT_EQ(diagnose_phase(inputs(0.4, 0.6, 1.0, 0.4)), Phase::AttractorConvergence);
    EXPECT_EQ(diagnose_phase(inputs(0.4, 0.4, 1.0, 0.0)), Phase::AttractorConvergence);
}

// ─── Ordering / boundaries ───────────────────────────────────────────────────

TEST(PhaseRules, SingularityOutranksFlow) {
    EXPECT_EQ(diagnose_phase(inputs(2.5, 2.0, 0.0, 0.9)), Phase::SingularityForming);
}

TEST(PhaseRules, ThresholdsAreStrict) {
    // |c| == 2.0 is not a singularity; the impulse row catches it instead.
    EXPECT_EQ(diagnose_phase(inputs(2.0, 2.0, 0.0, 0.0)), Phase::ImpulseLegSharpening);
    // |t| == 1.0 with low curvature does not compress.
    EXPECT_EQ(diagnose_phase(inputs(0.4, 1.0, 5.0, 0.0)), Phase::AttractorConvergence);
}

TEST(PhaseRules, CustomThresholds) {
    PhaseThresholds th;
    th.singularity_curvature = 5.0;
    EXPECT_EQ(diagnose_phase(inputs(2.5, 2.0, 0.0, 0.0), th), Phase::ImpulseLegSharpening);
}

// ─── Wire tags ───────────────────────────────────────────────────────────────

TEST(WireTags, PhaseTags) {
    EXPECT_STREQ(to_string(Phase::SingularityForming), "singularity_forming");
    EXPECT_STREQ(to_string(Phase::AttractorConvergence), "attractor_convergence");
    EXPECT_EQ(try_parse_phase("compression_building"), Phase::CompressionBuilding);
    EXPECT_FALSE(try_parse_phase("Compression").has_value());
}

TEST(WireTags, ReadingTags) {
    EXPECT_STREQ(to_string(ConductorReading::SustainedTension), "sustained_tension");
    EXPECT_STREQ(to_string(SingerReading::DissonantStrain), "dissonant_strain");
    EXPECT_EQ(try_parse_conductor("crescendo"), ConductorReading::Crescendo);
    EXPECT_EQ(try_parse_singer("resonant_stable"), SingerReading::ResonantStable);
    EXPECT_FALSE(try_parse_singer("").has_value());
}
