/// @file tests/metrics/test_multiscale.cpp
/// @brief Unit tests for MultiScaleAnalyzer.

#include <gtest/gtest.h>
#include "cmf/errors.hpp"
#include "cmf/multiscale.hpp"

#include <array>
#include <cmath>
#include <exception>
#include <future>
#include <new>
#include <string>
#include <vector>

using namespace cmf;

namespace {

std::vector<double> wave(std::size_t n) {
    std::vector<double> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = 100.0 + 5.0 * std::sin(static_cast<double>(i) / 7.0) + 0.05 * static_cast<double>(i);
    }
    return out;
}

}  // anonymous namespace

TEST(Decimate, EveryStrideSample) {
    const std::vector<double> x{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    EXPECT_EQ(MultiScaleAnalyzer::decimate(x, 5), (std::vector<double>{0, 5, 10}));
    EXPECT_EQ(MultiScaleAnalyzer::decimate(x, 1), x);
    EXPECT_TRUE(MultiScaleAnalyzer::decimate({}, 20).empty());
}

TEST(Decimate, Strides) {
    EXPECT_EQ(MultiScaleAnalyzer::stride(Timescale::Monthly), 20u);
    EXPECT_EQ(MultiScaleAnalyzer::stride(Timescale::Weekly), 5u);
    EXPECT_EQ(MultiScaleAnalyzer::stride(Timescale::Daily), 1u);
    EXPECT_EQ(MultiScaleAnalyzer::stride(Timescale::Intraday), 1u);
}

TEST(MultiScale, AllScalesByDefault) {
    const MultiScaleAnalyzer analyzer;
    const auto prices = wave(400);
    const auto r = analyzer.analyze_multiscale(prices);

    EXPECT_TRUE(r.failures.empty());
    ASSERT_EQ(r.scales.size(), 4u);
    EXPECT_EQ(r.scales.at(Timescale::Daily).size(), 400u);
    EXPECT_EQ(r.scales.at(Timescale::Weekly).size(), 80u);
    EXPECT_EQ(r.scales.at(Timescale::Monthly).size(), 20u);
    for (const auto& [scale, metrics] : r.scales) {
        EXPECT_EQ(metrics.timescale, scale);
        EXPECT_TRUE(metrics.is_consistent());
    }
}

TEST(MultiScale, ShortScaleFailsOthersSucceed) {
    const MultiScaleAnalyzer analyzer;
    const auto prices = wave(15);  // monthly → 1 sample
    const auto r = analyzer.analyze_multiscale(prices);

    EXPECT_FALSE(r.contains(Timescale::Monthly));
    ASSERT_EQ(r.failures.count(Timescale::Monthly), 1u);
    EXPECT_FALSE(r.failures.at(Timescale::Monthly).empty());

    EXPECT_TRUE(r.contains(Timescale::Weekly));
    EXPECT_TRUE(r.contains(Timescale::Daily));
    EXPECT_TRUE(r.contains(Timescale::Intraday));
}

TEST(MultiScale, DuplicateScalesAnalysedOnce) {
    const MultiScaleAnalyzer analyzer;
    const auto prices = wave(100);
    const std::array scales{Timescale::Daily, Timescale::Daily, Timescale::Weekly};
    const auto r = analyzer.analyze_multiscale(prices, {}, scales);
    EXPECT_EQ(r.scales.size(), 2u);
    EXPECT_TRUE(r.failures.empty());
}

TEST(MultiScale, VolumeAndTimestampsAreDecimatedTogether) {
    const MultiScaleAnalyzer analyzer;
    const auto prices = wave(100);
    std::vector<double> ts(100), vol(100, 10.0);
    for (std::size_t i = 0; i < ts.size(); ++i) ts[i] = static_cast<double>(i) * 60.0;

    const std::array scales{Timescale::Weekly};
    const auto r = analyzer.analyze_multiscale(prices, ts, scales, vol);
    ASSERT_TRUE(r.contains(Timescale::Weekly));
    const auto& m = r.scales.at(Timescale::Weekly);
    ASSERT_EQ(m.timestamps.size(), 20u);
    EXPECT_DOUBLE_EQ(m.timestamps[1], 300.0);
}

TEST(MultiScale, InvalidInputIsReportedPerScale) {
    const MultiScaleAnalyzer analyzer;
    const auto prices = wave(50);
    const std::vector<double> bad_volume(50, -1.0);
    const auto r = analyzer.analyze_multiscale(prices, {}, {}, bad_volume);
    EXPECT_TRUE(r.scales.empty());
    EXPECT_EQ(r.failures.size(), 4u);
}

TEST(MultiScale, RecordKeepsSnapshotOnSuccess) {
    const MultiScaleAnalyzer analyzer;
    std::promise<ManifoldMetrics> done;
    done.set_value(analyzer.engine().analyze(wave(60)));
    auto task = done.get_future();

    MultiScaleResult r;
    MultiScaleAnalyzer::record(Timescale::Daily, task, r);
    EXPECT_TRUE(r.contains(Timescale::Daily));
    EXPECT_TRUE(r.failures.empty());
}

TEST(MultiScale, RecordCapturesManifoldError) {
    std::promise<ManifoldMetrics> failed;
    failed.set_exception(std::make_exception_ptr(InsufficientDataError("need at least 2 prices")));
    auto task = failed.get_future();

    MultiScaleResult r;
    MultiScaleAnalyzer::record(Timescale::Monthly, task, r);
    EXPECT_FALSE(r.contains(Timescale::Monthly));
    ASSERT_EQ(r.failures.count(Timescale::Monthly), 1u);
    EXPECT_NE(r.failures.at(Timescale::Monthly).find("need at least 2 prices"), std::string::npos);
}

TEST(MultiScale, NonManifoldErrorStaysWithItsScale) {
    const MultiScaleAnalyzer analyzer;
    MultiScaleResult r;

    std::promise<ManifoldMetrics> ok;
    ok.set_value(analyzer.engine().analyze(wave(60)));
    auto first = ok.get_future();
    MultiScaleAnalyzer::record(Timescale::Daily, first, r);

    std::promise<ManifoldMetrics> oom;
    oom.set_exception(std::make_exception_ptr(std::bad_alloc()));
    auto second = oom.get_future();
    EXPECT_NO_THROW(MultiScaleAnalyzer::record(Timescale::Weekly, second, r));

    EXPECT_TRUE(r.contains(Timescale::Daily));
    EXPECT_FALSE(r.contains(Timescale::Weekly));
    ASSERT_EQ(r.failures.count(Timescale::Weekly), 1u);
    EXPECT_EQ(r.failures.at(Timescale::Weekly).rfind("weekly analysis failed: ", 0), 0u);
}
