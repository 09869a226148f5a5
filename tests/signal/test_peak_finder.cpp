/// @file tests/signal/test_peak_finder.cpp
/// @brief Unit tests for local_maxima / peak_prominences / find_peaks.
///
/// Test categories:
///   - Strict maxima, end points excluded
///   - Plateau midpoint
///   - Prominence against the higher of the two bases
///   - Height, distance and prominence filters

#include <gtest/gtest.h>
#include "cmf/signal.hpp"

#include <vector>

using namespace cmf::signal;

using Indices = std::vector<std::size_t>;

TEST(LocalMaxima, EndPointsAreNeverPeaks) {
    const std::vector<double> x{5.0, 1.0, 3.0, 1.0, 5.0};
    EXPECT_EQ(local_maxima(x), (Indices{2}));
}

TEST(LocalMaxima, PlateauReportsMiddleSample) {
    const std::vector<double> odd{0.0, 1.0, 1.0, 1.0, 0.0};
    EXPECT_EQ(local_maxima(odd), (Indices{2}));

    const std::vector<double> even{0.0, 1.0, 1.0, 0.0};
    EXPECT_EQ(local_maxima(even), (Indices{1}));
}

TEST(LocalMaxima, PlateauRunningToEndIsNotAPeak) {
    const std::vector<double> x{0.0, 1.0, 1.0, 1.0};
    EXPECT_TRUE(local_maxima(x).empty());
}

TEST(LocalMaxima, ShortInputHasNoPeaks) {
    const std::vector<double> x{0.0, 1.0};
    EXPECT_TRUE(local_maxima(x).empty());
}

TEST(PeakProminences, HigherBaseWins) {
    const std::vector<double> x{0.0, 2.0, 1.0, 3.0, 0.0};
    const Indices peaks{1, 3};
    const auto prom = peak_prominences(x, peaks);
    ASSERT_EQ(prom.size(), 2u);
    EXPECT_DOUBLE_EQ(prom[0], 1.0);  // 2 − max(0, 1)
    EXPECT_DOUBLE_EQ(prom[1], 3.0);
}

TEST(FindPeaks, HeightFilter) {
    const std::vector<double> x{0.0, 1.0, 0.0, 2.0, 0.0, 3.0, 0.0};
    PeakCriteria c;
    c.min_height = 2.0;
    EXPECT_EQ(find_peaks(x, c), (Indices{3, 5}));
}

TEST(FindPeaks, DistanceKeepsHighestFirst) {
    const std::vector<double> x{0.0, 1.0, 0.0, 2.0, 0.0, 3.0, 0.0};
    PeakCriteria c;
    c.min_distance = 3;
    // 5 (highest) suppresses 3; 1 is 4 samples from 5 and survives.
    EXPECT_EQ(find_peaks(x, c), (Indices{1, 5}));
}

TEST(FindPeaks, DistanceOneIsNoOp) {
    const std::vector<double> x{0.0, 1.0, 0.0, 2.0, 0.0};
    EXPECT_EQ(find_peaks(x, PeakCriteria{}), (Indices{1, 3}));
}

TEST(FindPeaks, ProminenceFilter) {
    const std::vector<double> x{0.0, 2.0, 1.0, 3.0, 0.0};
    PeakCriteria c;
    c.min_prominence = 1.5;
    EXPECT_EQ(find_peaks(x, c), (Indices{3}));
}

TEST(FindPeaks, SeparationInvariantHolds) {
    std::vector<double> x(200);
    for (std::size_t i = 0; i < x.size(); ++i) {
        x[i] = static_cast<double>((i * 37) % 11);
    }
    PeakCriteria c;
    c.min_distance = 10;
    const auto peaks = find_peaks(x, c);
    ASSERT_FALSE(peaks.empty());
    for (std::size_t k = 1; k < peaks.size(); ++k) {
        EXPECT_GE(peaks[k] - peaks[k - 1], 10u);
    }
}
