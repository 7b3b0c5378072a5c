#include <gtest/gtest.h>
#include "grid_composer.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <opencv2/imgcodecs.hpp>
#include <fstream>
#include <set>
#include <thread>

namespace fs = std::filesystem;

namespace thumbgrid {

class GridComposerTest : public ::testing::Test {
protected:
    void SetUp() override {
        asset_ = std::make_shared<test::SyntheticVideoAsset>(125.0);
        downloads_ = temp_.path() / "Downloads";
        output_ = temp_.path() / "out";
    }

    GridComposer make_composer() {
        return GridComposer(asset_, OutputPathResolver(downloads_));
    }

    static cv::Vec3b pixel(const cv::Mat& image, cv::Point at) {
        return image.at<cv::Vec3b>(at);
    }

    test::TempDir temp_;
    std::shared_ptr<test::SyntheticVideoAsset> asset_;
    fs::path downloads_;
    fs::path output_;
};

TEST_F(GridComposerTest, DefaultLayoutFillsTargetWidth) {
    GridConfig config;
    GridLayout layout = compute_layout(config, 16.0 / 9.0);

    EXPECT_EQ(layout.thumb_width, 466);
    EXPECT_EQ(layout.thumb_height, 262);
    EXPECT_EQ(layout.canvas_width, 1920);
    EXPECT_EQ(layout.canvas_height, 266 * 4 + 8 * 5 + kTitleHeight + kBottomPadding);
}

TEST_F(GridComposerTest, SourceModeFollowsAspectRatio) {
    GridConfig config;
    config.aspect_mode = AspectMode::Source;

    EXPECT_EQ(compute_layout(config, 4.0 / 3.0).thumb_height, 349);
    EXPECT_EQ(compute_layout(config, 9.0 / 16.0).thumb_height, 828);

    // Fill and Fit always assume 16:9.
    config.aspect_mode = AspectMode::Fit;
    EXPECT_EQ(compute_layout(config, 4.0 / 3.0).thumb_height, 262);
}

TEST_F(GridComposerTest, CellsAreLaidOutRowMajor) {
    GridConfig config;
    GridLayout layout = compute_layout(config, 16.0 / 9.0);

    EXPECT_EQ(layout.cell_rect(0), cv::Rect(8, kTitleHeight + 8, 470, 266));
    EXPECT_EQ(layout.cell_rect(5), cv::Rect(8 + 478, kTitleHeight + 8 + 274, 470, 266));
    EXPECT_EQ(layout.image_rect(5), cv::Rect(8 + 478 + 2, kTitleHeight + 8 + 274 + 2, 466, 262));

    cv::Rect last = layout.cell_rect(15);
    EXPECT_EQ(last.x + last.width + kFramePadding, layout.canvas_width);
    EXPECT_EQ(last.y + last.height + kFramePadding + kBottomPadding, layout.canvas_height);
}

TEST_F(GridComposerTest, NarrowTargetWidthIsRejected) {
    GridConfig config;
    config.target_width = 50;
    EXPECT_THROW(compute_layout(config, 16.0 / 9.0), std::invalid_argument);

    config = GridConfig();
    config.rows = 0;
    EXPECT_THROW(compute_layout(config, 16.0 / 9.0), std::invalid_argument);
}

TEST_F(GridComposerTest, TimestampFormatting) {
    EXPECT_EQ(format_timestamp(0.0), "0:00");
    EXPECT_EQ(format_timestamp(59.9), "0:59");
    EXPECT_EQ(format_timestamp(65.0), "1:05");
    EXPECT_EQ(format_timestamp(3599.0), "59:59");
    EXPECT_EQ(format_timestamp(3661.0), "1:01:01");
}

TEST_F(GridComposerTest, DurationFormatting) {
    EXPECT_EQ(format_duration(45.0), "45s");
    EXPECT_EQ(format_duration(125.0), "2m 5s");
    EXPECT_EQ(format_duration(3720.0), "1h 2m");
}

TEST_F(GridComposerTest, AspectRatioResolutionOrder) {
    GridComposer composer = make_composer();
    auto frames = test::make_solid_frames(2, cv::Size(400, 300), cv::Scalar(50, 100, 150));

    EXPECT_DOUBLE_EQ(composer.resolve_aspect_ratio(frames, "clip.mp4", AspectMode::Fill), 16.0 / 9.0);

    // No track dimensions: first frame decides.
    EXPECT_DOUBLE_EQ(composer.resolve_aspect_ratio(frames, "clip.mp4", AspectMode::Source), 4.0 / 3.0);

    // Nothing at all: 16:9.
    EXPECT_DOUBLE_EQ(composer.resolve_aspect_ratio({}, "clip.mp4", AspectMode::Source), 16.0 / 9.0);

    // Rotated portrait track wins over the frames.
    asset_->display_size = cv::Size(1080, 1920);
    EXPECT_DOUBLE_EQ(composer.resolve_aspect_ratio(frames, "clip.mp4", AspectMode::Source), 1080.0 / 1920.0);
}

TEST_F(GridComposerTest, RenderUsesThemeColours) {
    GridComposer composer = make_composer();
    GridConfig config;
    config.rows = 2;
    config.columns = 2;
    config.target_width = 800;
    config.show_timestamps = false;
    auto frames = test::make_solid_frames(4, cv::Size(320, 180), cv::Scalar(0, 0, 255));

    cv::Mat black = composer.render(frames, "clip.mp4", config);
    GridLayout layout = compute_layout(config, 16.0 / 9.0);
    ASSERT_EQ(black.cols, layout.canvas_width);
    ASSERT_EQ(black.rows, layout.canvas_height);

    const cv::Rect cell = layout.cell_rect(0);
    const cv::Rect image = layout.image_rect(0);
    EXPECT_EQ(pixel(black, cv::Point(0, black.rows - 1)), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(pixel(black, cell.tl()), cv::Vec3b(255, 255, 255));
    EXPECT_EQ(pixel(black, image.tl() + cv::Point(image.width / 2, image.height / 2)), cv::Vec3b(0, 0, 255));

    config.background_theme = BackgroundTheme::White;
    cv::Mat white = composer.render(frames, "clip.mp4", config);
    EXPECT_EQ(pixel(white, cv::Point(0, white.rows - 1)), cv::Vec3b(255, 255, 255));
    EXPECT_EQ(pixel(white, cell.tl()), cv::Vec3b(0, 0, 0));
}

TEST_F(GridComposerTest, FitModePadsShortAxis) {
    GridComposer composer = make_composer();
    GridConfig config;
    config.rows = 1;
    config.columns = 1;
    config.target_width = 420;
    config.aspect_mode = AspectMode::Fit;
    config.show_timestamps = false;
    // Square frames into a 16:9 cell leave bars left and right.
    auto frames = test::make_solid_frames(1, cv::Size(200, 200), cv::Scalar(0, 255, 0));

    cv::Mat canvas = composer.render(frames, "clip.mp4", config);
    cv::Rect image = compute_layout(config, 16.0 / 9.0).image_rect(0);

    EXPECT_EQ(pixel(canvas, image.tl() + cv::Point(1, image.height / 2)), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(pixel(canvas, image.tl() + cv::Point(image.width / 2, image.height / 2)), cv::Vec3b(0, 255, 0));

    config.aspect_mode = AspectMode::Fill;
    canvas = composer.render(frames, "clip.mp4", config);
    EXPECT_EQ(pixel(canvas, image.tl() + cv::Point(1, image.height / 2)), cv::Vec3b(0, 255, 0));
}

TEST_F(GridComposerTest, MissingFramesLeaveCellsEmpty) {
    GridComposer composer = make_composer();
    GridConfig config;
    config.rows = 2;
    config.columns = 2;
    config.target_width = 800;
    auto frames = test::make_solid_frames(3, cv::Size(320, 180), cv::Scalar(200, 0, 0));

    cv::Mat canvas = composer.render(frames, "clip.mp4", config);
    GridLayout layout = compute_layout(config, 16.0 / 9.0);

    EXPECT_EQ(pixel(canvas, layout.cell_rect(3).tl()), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(pixel(canvas, layout.cell_rect(2).tl()), cv::Vec3b(255, 255, 255));
}

TEST_F(GridComposerTest, TimestampsDrawIntoCellCorner) {
    GridComposer composer = make_composer();
    GridConfig config;
    config.rows = 1;
    config.columns = 1;
    config.target_width = 600;
    auto frames = test::make_solid_frames(1, cv::Size(320, 180), cv::Scalar(120, 120, 120));

    config.show_timestamps = false;
    cv::Mat plain = composer.render(frames, "clip.mp4", config);
    config.show_timestamps = true;
    cv::Mat stamped = composer.render(frames, "clip.mp4", config);

    cv::Rect image = compute_layout(config, 16.0 / 9.0).image_rect(0);
    cv::Rect corner(image.x, image.y + image.height - 40, 80, 40);
    EXPECT_GT(cv::norm(plain(corner), stamped(corner), cv::NORM_L1), 0.0);

    cv::Rect far(image.x + image.width - 60, image.y, 60, 40);
    EXPECT_EQ(cv::norm(plain(far), stamped(far), cv::NORM_L1), 0.0);
}

TEST_F(GridComposerTest, ComposeWritesJpegWithCollisionSuffix) {
    GridComposer composer = make_composer();
    GridConfig config;
    config.target_width = 960;
    auto frames = test::make_solid_frames(16, cv::Size(320, 180), cv::Scalar(30, 160, 90));
    const std::string source = (temp_.path() / "holiday.mov").string();

    std::string first = composer.compose(frames, source, config, output_.string());
    std::string second = composer.compose(frames, source, config, output_.string());

    EXPECT_EQ(first, (output_ / "holiday_4x4.jpg").string());
    EXPECT_EQ(second, (output_ / "holiday_4x4_1.jpg").string());

    cv::Mat decoded = cv::imread(first);
    ASSERT_FALSE(decoded.empty());
    GridLayout layout = compute_layout(config, 16.0 / 9.0);
    EXPECT_EQ(decoded.cols, layout.canvas_width);
    EXPECT_EQ(decoded.rows, layout.canvas_height);
}

TEST_F(GridComposerTest, OutputDefaultsToSourceFolder) {
    OutputPathResolver resolver(downloads_);
    const fs::path source = temp_.path() / "clip.mp4";

    fs::path resolved = resolver.resolve(source.string(), 3, 5);
    EXPECT_EQ(resolved.string(), (temp_.path() / "clip_3x5.jpg").string());
    EXPECT_TRUE(fs::exists(resolved));
}

TEST_F(GridComposerTest, UnwritableSourceFolderFallsBackToDownloads) {
    OutputPathResolver resolver(downloads_);
    const fs::path source = temp_.path() / "missing_dir" / "clip.mp4";

    fs::path resolved = resolver.resolve(source.string(), 4, 4);
    EXPECT_EQ(resolved.string(), (downloads_ / "clip_4x4.jpg").string());
}

TEST_F(GridComposerTest, WriteCheckLeavesNothingBehind) {
    EXPECT_TRUE(OutputPathResolver::is_writable(temp_.path()));
    EXPECT_FALSE(OutputPathResolver::is_writable(temp_.path() / "nope"));
    EXPECT_TRUE(fs::is_empty(temp_.path()));
}

TEST_F(GridComposerTest, ConcurrentResolutionNeverCollides) {
    OutputPathResolver resolver(downloads_);
    const std::string source = (temp_.path() / "clip.mp4").string();

    std::vector<fs::path> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] {
            results[i] = resolver.resolve(source, 4, 4, output_.string());
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::set<std::string> unique;
    for (const auto& path : results) {
        unique.insert(path.string());
    }
    EXPECT_EQ(unique.size(), results.size());
}

} // namespace thumbgrid
