#include <gtest/gtest.h>
#include "distinctness_selector.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <algorithm>

namespace thumbgrid {

namespace {

std::vector<double> timestamps_of(const std::vector<ExtractedFrame>& frames) {
    std::vector<double> out;
    for (const auto& f : frames) {
        out.push_back(f.timestamp);
    }
    return out;
}

} // namespace

class DistinctnessSelectorTest : public ::testing::Test {
protected:
    DistinctnessSelector selector_;
};

TEST_F(DistinctnessSelectorTest, RejectsNonPositiveCount) {
    auto candidates = test::make_varied_candidates(4);
    EXPECT_THROW(selector_.select(candidates, 0), std::invalid_argument);
}

TEST_F(DistinctnessSelectorTest, FewerCandidatesThanRequestedReturnsAll) {
    auto candidates = test::make_varied_candidates(5);

    auto selected = selector_.select(candidates, 16);
    EXPECT_EQ(timestamps_of(selected), timestamps_of(candidates));
}

TEST_F(DistinctnessSelectorTest, FastPathUsesEvenlySpacedIndices) {
    // Metrics are irrelevant here, so hand it frames that would all fail the
    // quality filter.
    auto candidates = test::make_solid_frames(18, cv::Size(32, 32), cv::Scalar(0, 0, 0));

    auto selected = selector_.select(candidates, 12);
    ASSERT_EQ(selected.size(), 12u);

    const std::vector<size_t> expected = {0, 1, 3, 4, 6, 7, 9, 10, 12, 13, 15, 16};
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_DOUBLE_EQ(selected[i].timestamp, candidates[expected[i]].timestamp);
    }
}

TEST_F(DistinctnessSelectorTest, EvenlySpacedIndicesFollowFloorRule) {
    auto indices = DistinctnessSelector::evenly_spaced_indices(24, 16);
    ASSERT_EQ(indices.size(), 16u);
    for (size_t i = 0; i < indices.size(); ++i) {
        EXPECT_EQ(indices[i], i * 24 / 16);
    }
    EXPECT_TRUE(DistinctnessSelector::evenly_spaced_indices(0, 4).empty());
}

TEST_F(DistinctnessSelectorTest, ScoringPathReturnsExactCountInTimeOrder) {
    auto candidates = test::make_varied_candidates(24);

    auto selected = selector_.select(candidates, 16);
    ASSERT_EQ(selected.size(), 16u);

    auto times = timestamps_of(selected);
    EXPECT_TRUE(std::is_sorted(times.begin(), times.end()));
    EXPECT_EQ(std::adjacent_find(times.begin(), times.end()), times.end());
}

TEST_F(DistinctnessSelectorTest, QualityFilterDropsFadeFrames) {
    auto candidates = test::make_varied_candidates(20);
    // Four black fade frames at the tail.
    for (int i = 0; i < 4; ++i) {
        candidates.push_back(ExtractedFrame{cv::Mat(64, 64, CV_8UC3, cv::Scalar(0, 0, 0)), 100.0 + i});
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const ExtractedFrame& a, const ExtractedFrame& b) { return a.timestamp < b.timestamp; });

    auto selected = selector_.select(candidates, 16);
    ASSERT_EQ(selected.size(), 16u);
    for (const auto& frame : selected) {
        EXPECT_LT(frame.timestamp, 100.0) << "fade frame was selected";
    }
}

TEST_F(DistinctnessSelectorTest, AggressiveFilterFallsBackToAllFrames) {
    // Every frame is too dark to pass; the selector must still fill the grid.
    std::vector<ExtractedFrame> candidates;
    for (int i = 0; i < 24; ++i) {
        candidates.push_back(ExtractedFrame{test::make_split_frame(5 + i, 20 + i), static_cast<double>(i)});
    }

    auto selected = selector_.select(candidates, 16);
    ASSERT_EQ(selected.size(), 16u);
    auto times = timestamps_of(selected);
    EXPECT_TRUE(std::is_sorted(times.begin(), times.end()));
}

TEST_F(DistinctnessSelectorTest, FramesWithoutMetricsAreExcluded) {
    auto candidates = test::make_varied_candidates(24);
    for (size_t i = 0; i < candidates.size(); i += 2) {
        candidates[i].image = cv::Mat();
    }

    // Only 12 frames rasterize, fewer than requested: all of them come back.
    auto selected = selector_.select(candidates, 16);
    ASSERT_EQ(selected.size(), 12u);
    for (const auto& frame : selected) {
        EXPECT_FALSE(frame.image.empty());
    }
    auto times = timestamps_of(selected);
    EXPECT_TRUE(std::is_sorted(times.begin(), times.end()));
}

TEST_F(DistinctnessSelectorTest, ComparisonIndicesAreBounded) {
    EXPECT_EQ(DistinctnessSelector::comparison_indices(0, 24), (std::vector<size_t>{1, 6, 12, 18}));
    EXPECT_EQ(DistinctnessSelector::comparison_indices(12, 24), (std::vector<size_t>{11, 13, 6, 18}));
    EXPECT_EQ(DistinctnessSelector::comparison_indices(5, 24), (std::vector<size_t>{4, 6, 12, 18}));
    EXPECT_EQ(DistinctnessSelector::comparison_indices(0, 2), (std::vector<size_t>{1}));
    EXPECT_TRUE(DistinctnessSelector::comparison_indices(0, 1).empty());

    for (size_t total = 2; total < 40; ++total) {
        for (size_t i = 0; i < total; ++i) {
            auto partners = DistinctnessSelector::comparison_indices(i, total);
            EXPECT_LE(partners.size(), 5u);
            EXPECT_FALSE(partners.empty());
            EXPECT_EQ(std::find(partners.begin(), partners.end(), i), partners.end());
        }
    }
}

TEST_F(DistinctnessSelectorTest, PairScoreWeightsDifferences) {
    FrameMetrics a;
    a.brightness = 0.2;
    a.color_variance = 0.05;
    FrameMetrics b;
    b.brightness = 0.7;
    b.color_variance = 0.15;

    EXPECT_NEAR(selector_.pair_score(a, b), 0.5 * 0.6 + 0.1 * 0.4, 1e-12);
    EXPECT_DOUBLE_EQ(selector_.pair_score(a, a), 0.0);

    // Edge density counts only with a weight and on both sides.
    SelectionOptions options;
    options.weights.edge_density = 1.0;
    DistinctnessSelector weighted(options);
    a.edge_density = 0.1;
    EXPECT_NEAR(weighted.pair_score(a, b), selector_.pair_score(a, b), 1e-12);
    b.edge_density = 0.4;
    EXPECT_NEAR(weighted.pair_score(a, b), selector_.pair_score(a, b) + 0.3, 1e-12);
}

TEST_F(DistinctnessSelectorTest, QualityFilterBoundsAreExclusive) {
    FrameMetrics m;
    m.color_variance = 0.05;

    m.brightness = 0.15;
    EXPECT_FALSE(selector_.passes_quality_filter(m));
    m.brightness = 0.85;
    EXPECT_FALSE(selector_.passes_quality_filter(m));
    m.brightness = 0.5;
    EXPECT_TRUE(selector_.passes_quality_filter(m));
    m.color_variance = 0.008;
    EXPECT_FALSE(selector_.passes_quality_filter(m));
}

TEST_F(DistinctnessSelectorTest, ProgressIsMonotonicAndFinishes) {
    auto candidates = test::make_varied_candidates(40);

    std::vector<double> progress;
    selector_.select(candidates, 16, CancellationToken(), [&](double p) { progress.push_back(p); });

    ASSERT_FALSE(progress.empty());
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);
}

TEST_F(DistinctnessSelectorTest, CancelledTokenAbortsScoring) {
    auto candidates = test::make_varied_candidates(24);
    CancellationToken token;
    token.cancel();

    EXPECT_THROW(selector_.select(candidates, 16, token), CancelledError);
}

} // namespace thumbgrid
