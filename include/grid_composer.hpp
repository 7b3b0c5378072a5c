#pragma once

#include "types.hpp"
#include "video_asset.hpp"
#include <opencv2/core.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace thumbgrid {

// Fixed layout constants, in pixels.
constexpr int kBorderWidth = 2;
constexpr int kFramePadding = 8;
constexpr int kTitleHeight = 90;
constexpr int kTitleMargin = 20;
constexpr int kBottomPadding = 20;
constexpr int kJpegQuality = 92;

struct GridLayout {
    int rows = 0;
    int columns = 0;
    int thumb_width = 0;
    int thumb_height = 0;
    int canvas_width = 0;
    int canvas_height = 0;

    int cell_width() const { return thumb_width + kBorderWidth * 2; }
    int cell_height() const { return thumb_height + kBorderWidth * 2; }

    // Bordered cell for the frame at `index` (row-major).
    cv::Rect cell_rect(int index) const;
    // Image area inside the border.
    cv::Rect image_rect(int index) const;
};

// Throws std::invalid_argument when the target width leaves no room for a
// thumbnail column.
GridLayout compute_layout(const GridConfig& config, double aspect_ratio);

// "H:MM:SS" from one hour upwards, otherwise "M:SS".
std::string format_timestamp(double seconds);

// "Xh Ym", "Xm Ys" or "Xs".
std::string format_duration(double seconds);

// Picks a collision-free output path: explicit folder, else the source's own
// folder when a write check succeeds, else the Downloads folder. The chosen
// file is created empty before returning so concurrent callers in this
// process never pick the same name.
class OutputPathResolver {
public:
    OutputPathResolver();
    explicit OutputPathResolver(std::filesystem::path downloads_directory);

    std::filesystem::path resolve(const std::string& source_path, int rows, int columns,
                                  const std::optional<std::string>& output_folder = std::nullopt) const;

    static bool is_writable(const std::filesystem::path& directory);
    static std::filesystem::path default_downloads_directory();

    const std::filesystem::path& downloads_directory() const { return downloads_; }

private:
    std::filesystem::path downloads_;
};

// Lays selected frames out into one JPEG contact sheet.
class GridComposer {
public:
    explicit GridComposer(std::shared_ptr<VideoAsset> asset,
                          OutputPathResolver resolver = OutputPathResolver());
    ~GridComposer();

    GridComposer(GridComposer&&) noexcept;
    GridComposer& operator=(GridComposer&&) noexcept;

    // Renders and writes the grid; returns the written path. Throws
    // CompositionError when encoding yields nothing and OutputWriteError
    // when the file cannot be written.
    std::string compose(const std::vector<ExtractedFrame>& frames,
                        const std::string& source_path,
                        const GridConfig& config,
                        const std::optional<std::string>& output_folder = std::nullopt);

    // Renders the canvas without touching the filesystem.
    cv::Mat render(const std::vector<ExtractedFrame>& frames,
                   const std::string& source_path,
                   const GridConfig& config);

    // Width / height used for thumbnails. Source mode asks the asset, then
    // the first frame, then falls back to 16:9.
    double resolve_aspect_ratio(const std::vector<ExtractedFrame>& frames,
                                const std::string& source_path,
                                AspectMode mode);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace thumbgrid
