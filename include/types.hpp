#pragma once

#include <opencv2/core.hpp>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace thumbgrid {

// A decoded candidate or selected frame. The pixel buffer is shared by
// reference count and never written after construction.
struct ExtractedFrame {
    cv::Mat image;
    double timestamp = 0.0; // seconds from the start of the source
};

struct FrameMetrics {
    std::size_t index = 0;        // position in the candidate sequence
    double brightness = 0.0;      // mean relative luminance, [0, 1]
    double color_variance = 0.0;  // mean per-channel population variance, [0, 1]
    std::optional<double> edge_density;
    // Colour histogram normalised to sum 1: bins 0-11 are 30 degree hue
    // sectors starting at red, bins 12-15 are dark to light unsaturated pixels.
    std::optional<std::array<double, 16>> histogram;
};

enum class AspectMode { Fill, Fit, Source };

enum class BackgroundTheme { Black, White };

struct GridConfig {
    int rows = 4;
    int columns = 4;
    int target_width = 1920;
    AspectMode aspect_mode = AspectMode::Fill;
    BackgroundTheme background_theme = BackgroundTheme::Black;
    bool show_timestamps = true;

    int frame_count() const { return rows * columns; }

    // Throws std::invalid_argument when the grid cannot be laid out.
    void validate() const;
};

std::string to_string(AspectMode mode);
std::string to_string(BackgroundTheme theme);

// Accepts the display spelling ("Fill", "Fit", "Source") case-insensitively.
AspectMode parse_aspect_mode(const std::string& value);
BackgroundTheme parse_background_theme(const std::string& value);

} // namespace thumbgrid
