#include "grid_composer.hpp"
#include "errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace thumbgrid {

namespace {

constexpr double kDefaultAspect = 16.0 / 9.0;
constexpr int kMaxCollisionSuffix = 100000;
constexpr int kTimestampInset = 10;

// Serialises name picking within this process.
std::mutex& output_name_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::string random_hex() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::ostringstream oss;
    oss << std::hex << gen();
    return oss.str();
}

// Creates `path` only if it does not exist yet.
bool create_exclusive(const fs::path& path) {
    std::FILE* file = std::fopen(path.string().c_str(), "wbx");
    if (file == nullptr) {
        return false;
    }
    std::fclose(file);
    return true;
}

struct Palette {
    cv::Scalar background;
    cv::Scalar border;
    cv::Scalar text;
    cv::Scalar shadow;
};

Palette palette_for(BackgroundTheme theme) {
    const cv::Scalar black(0, 0, 0);
    const cv::Scalar white(255, 255, 255);
    if (theme == BackgroundTheme::White) {
        return Palette{white, black, black, cv::Scalar(235, 235, 235)};
    }
    return Palette{black, white, white, cv::Scalar(20, 20, 20)};
}

cv::Mat as_bgr(const cv::Mat& image) {
    cv::Mat src = image;
    if (src.depth() != CV_8U) {
        src.convertTo(src, CV_8U);
    }
    cv::Mat bgr;
    switch (src.channels()) {
        case 1: cv::cvtColor(src, bgr, cv::COLOR_GRAY2BGR); break;
        case 4: cv::cvtColor(src, bgr, cv::COLOR_BGRA2BGR); break;
        default: bgr = src; break;
    }
    return bgr;
}

// Scale to cover the cell, then crop the overflow evenly from both sides.
void draw_fill(cv::Mat& cell, const cv::Mat& image) {
    double scale = std::max(static_cast<double>(cell.cols) / image.cols,
                            static_cast<double>(cell.rows) / image.rows);
    cv::Size scaled(std::max(cell.cols, static_cast<int>(std::ceil(image.cols * scale))),
                    std::max(cell.rows, static_cast<int>(std::ceil(image.rows * scale))));

    cv::Mat resized;
    cv::resize(image, resized, scaled, 0, 0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR);

    cv::Rect crop((resized.cols - cell.cols) / 2, (resized.rows - cell.rows) / 2, cell.cols, cell.rows);
    resized(crop).copyTo(cell);
}

// Scale to fit inside the cell and pad the short axis with the background.
void draw_fit(cv::Mat& cell, const cv::Mat& image, const cv::Scalar& background) {
    cell.setTo(background);

    double scale = std::min(static_cast<double>(cell.cols) / image.cols,
                            static_cast<double>(cell.rows) / image.rows);
    cv::Size scaled(std::clamp(static_cast<int>(std::lround(image.cols * scale)), 1, cell.cols),
                    std::clamp(static_cast<int>(std::lround(image.rows * scale)), 1, cell.rows));

    cv::Mat resized;
    cv::resize(image, resized, scaled, 0, 0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR);

    cv::Rect target((cell.cols - scaled.width) / 2, (cell.rows - scaled.height) / 2,
                    scaled.width, scaled.height);
    resized.copyTo(cell(target));
}

void draw_shadowed_text(cv::Mat& target, const std::string& text, cv::Point origin,
                        double scale, int thickness, const Palette& palette) {
    cv::putText(target, text, origin + cv::Point(1, 1), cv::FONT_HERSHEY_SIMPLEX, scale,
                palette.shadow, thickness + 2, cv::LINE_AA);
    cv::putText(target, text, origin, cv::FONT_HERSHEY_SIMPLEX, scale,
                palette.text, thickness, cv::LINE_AA);
}

} // namespace

// ---- Layout ----

cv::Rect GridLayout::cell_rect(int index) const {
    const int col = index % columns;
    const int row = index / columns;
    const int x = kFramePadding + col * (cell_width() + kFramePadding);
    const int y = kTitleHeight + kFramePadding + row * (cell_height() + kFramePadding);
    return cv::Rect(x, y, cell_width(), cell_height());
}

cv::Rect GridLayout::image_rect(int index) const {
    cv::Rect cell = cell_rect(index);
    return cv::Rect(cell.x + kBorderWidth, cell.y + kBorderWidth, thumb_width, thumb_height);
}

GridLayout compute_layout(const GridConfig& config, double aspect_ratio) {
    config.validate();

    const int total_padding = kFramePadding * (config.columns + 1) + kBorderWidth * 2 * config.columns;
    const int thumb_width = (config.target_width - total_padding) / config.columns;
    if (thumb_width < 1) {
        throw std::invalid_argument("Target width " + std::to_string(config.target_width) +
                                    " is too small for " + std::to_string(config.columns) + " columns");
    }

    int thumb_height;
    if (config.aspect_mode == AspectMode::Source && aspect_ratio > 0.0) {
        thumb_height = static_cast<int>(thumb_width / aspect_ratio);
    } else {
        thumb_height = static_cast<int>(thumb_width * 9.0 / 16.0);
    }
    thumb_height = std::max(1, thumb_height);

    GridLayout layout;
    layout.rows = config.rows;
    layout.columns = config.columns;
    layout.thumb_width = thumb_width;
    layout.thumb_height = thumb_height;
    layout.canvas_width = layout.cell_width() * config.columns + kFramePadding * (config.columns + 1);
    layout.canvas_height = layout.cell_height() * config.rows + kFramePadding * (config.rows + 1)
                         + kTitleHeight + kBottomPadding;
    return layout;
}

// ---- Formatting ----

std::string format_timestamp(double seconds) {
    const long total = std::max(0L, static_cast<long>(seconds));
    const long hours = total / 3600;
    const long minutes = (total % 3600) / 60;
    const long secs = total % 60;

    char buffer[32];
    if (hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%ld:%02ld:%02ld", hours, minutes, secs);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%ld:%02ld", minutes, secs);
    }
    return buffer;
}

std::string format_duration(double seconds) {
    const long total = std::max(0L, static_cast<long>(seconds));
    const long hours = total / 3600;
    const long minutes = (total % 3600) / 60;
    const long secs = total % 60;

    char buffer[32];
    if (hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%ldh %ldm", hours, minutes);
    } else if (minutes > 0) {
        std::snprintf(buffer, sizeof(buffer), "%ldm %lds", minutes, secs);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%lds", secs);
    }
    return buffer;
}

// ---- Output path resolution ----

OutputPathResolver::OutputPathResolver()
    : downloads_(default_downloads_directory()) {}

OutputPathResolver::OutputPathResolver(fs::path downloads_directory)
    : downloads_(std::move(downloads_directory)) {}

fs::path OutputPathResolver::default_downloads_directory() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / "Downloads";
    }
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    return ec ? fs::path(".") : tmp;
}

bool OutputPathResolver::is_writable(const fs::path& directory) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return false;
    }
    const fs::path marker = directory / (".thumbgrid_write_check_" + random_hex());
    if (!create_exclusive(marker)) {
        return false;
    }
    fs::remove(marker, ec);
    return true;
}

fs::path OutputPathResolver::resolve(const std::string& source_path, int rows, int columns,
                                     const std::optional<std::string>& output_folder) const {
    fs::path folder;
    if (output_folder && !output_folder->empty()) {
        folder = *output_folder;
    } else {
        fs::path source_dir = fs::path(source_path).parent_path();
        if (source_dir.empty()) {
            source_dir = ".";
        }
        if (is_writable(source_dir)) {
            folder = source_dir;
        } else {
            std::cerr << "Cannot write to " << source_dir << ", using " << downloads_ << std::endl;
            folder = downloads_;
        }
    }

    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec && !fs::is_directory(folder)) {
        throw OutputWriteError("Cannot create output folder " + folder.string() + ": " + ec.message());
    }

    const std::string base = fs::path(source_path).stem().string();
    const std::string grid = std::to_string(rows) + "x" + std::to_string(columns);

    std::lock_guard<std::mutex> lock(output_name_mutex());
    for (int counter = 0; counter < kMaxCollisionSuffix; ++counter) {
        std::string name = base + "_" + grid;
        if (counter > 0) {
            name += "_" + std::to_string(counter);
        }
        fs::path candidate = folder / (name + ".jpg");
        if (fs::exists(candidate, ec)) {
            continue;
        }
        if (create_exclusive(candidate)) {
            return candidate;
        }
        if (!fs::exists(candidate, ec)) {
            throw OutputWriteError("Cannot create " + candidate.string());
        }
    }
    throw OutputWriteError("No free output name for " + base + "_" + grid + " in " + folder.string());
}

// ---- Composer ----

class GridComposer::Impl {
public:
    Impl(std::shared_ptr<VideoAsset> asset, OutputPathResolver resolver)
        : asset_(std::move(asset))
        , resolver_(std::move(resolver)) {}

    double resolve_aspect_ratio(const std::vector<ExtractedFrame>& frames,
                                const std::string& source_path,
                                AspectMode mode) {
        if (mode != AspectMode::Source) {
            return kDefaultAspect;
        }

        if (asset_) {
            try {
                if (auto size = asset_->native_display_size(source_path)) {
                    if (size->height > 0 && size->width > 0) {
                        return static_cast<double>(size->width) / size->height;
                    }
                }
            } catch (const GridError& e) {
                std::cerr << "Track dimensions unavailable: " << e.what() << std::endl;
            }
        }

        if (!frames.empty() && !frames.front().image.empty()) {
            const cv::Mat& first = frames.front().image;
            return static_cast<double>(first.cols) / first.rows;
        }

        return kDefaultAspect;
    }

    cv::Mat render(const std::vector<ExtractedFrame>& frames,
                   const std::string& source_path,
                   const GridConfig& config) {
        const double aspect = resolve_aspect_ratio(frames, source_path, config.aspect_mode);
        const GridLayout layout = compute_layout(config, aspect);
        const Palette palette = palette_for(config.background_theme);

        cv::Mat canvas(layout.canvas_height, layout.canvas_width, CV_8UC3, palette.background);

        draw_title(canvas, layout, source_path, config, palette);

        const int cells = std::min(static_cast<int>(frames.size()), config.frame_count());
        for (int index = 0; index < cells; ++index) {
            const ExtractedFrame& frame = frames[static_cast<size_t>(index)];

            cv::rectangle(canvas, layout.cell_rect(index), palette.border, cv::FILLED);

            cv::Mat cell = canvas(layout.image_rect(index));
            if (frame.image.empty()) {
                std::cerr << "Frame " << index << " has no pixels, leaving cell blank" << std::endl;
                cell.setTo(palette.background);
                continue;
            }

            const cv::Mat image = as_bgr(frame.image);
            if (config.aspect_mode == AspectMode::Fill) {
                draw_fill(cell, image);
            } else {
                draw_fit(cell, image, palette.background);
            }

            if (config.show_timestamps) {
                const double scale = 0.6;
                const int thickness = 2;
                cv::Point origin(kTimestampInset, cell.rows - kTimestampInset);
                draw_shadowed_text(cell, format_timestamp(frame.timestamp), origin, scale, thickness, palette);
            }
        }

        return canvas;
    }

    std::string compose(const std::vector<ExtractedFrame>& frames,
                        const std::string& source_path,
                        const GridConfig& config,
                        const std::optional<std::string>& output_folder) {
        cv::Mat canvas = render(frames, source_path, config);
        std::cout << "Grid image composed, size: " << canvas.cols << "x" << canvas.rows << std::endl;

        const fs::path output = resolver_.resolve(source_path, config.rows, config.columns, output_folder);

        std::vector<uchar> jpeg;
        bool encoded = false;
        try {
            encoded = cv::imencode(".jpg", canvas, jpeg, {cv::IMWRITE_JPEG_QUALITY, kJpegQuality});
        } catch (const cv::Exception& e) {
            discard(output);
            throw CompositionError(std::string("JPEG encoding failed: ") + e.what());
        }
        if (!encoded || jpeg.empty()) {
            discard(output);
            throw CompositionError("Failed to generate JPEG");
        }

        std::ofstream out(output, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(jpeg.data()), static_cast<std::streamsize>(jpeg.size()));
        out.close();
        if (!out) {
            discard(output);
            throw OutputWriteError("Failed to write " + output.string());
        }

        std::cout << "Wrote " << jpeg.size() << " bytes to " << output.string() << std::endl;
        return output.string();
    }

private:
    void draw_title(cv::Mat& canvas, const GridLayout& layout, const std::string& source_path,
                    const GridConfig& config, const Palette& palette) {
        std::string title = fs::path(source_path).filename().string() + "  |  " +
                            std::to_string(config.rows) + "x" + std::to_string(config.columns);

        if (asset_) {
            try {
                double seconds = asset_->duration(source_path);
                if (seconds > 0.0) {
                    title += "  |  " + format_duration(seconds);
                }
            } catch (const GridError& e) {
                std::cerr << "Duration unavailable for title: " << e.what() << std::endl;
            }
        }

        const int max_width = layout.canvas_width - kTitleMargin * 2;
        const int thickness = 2;
        double scale = 0.9;
        int baseline = 0;
        cv::Size text = cv::getTextSize(title, cv::FONT_HERSHEY_SIMPLEX, scale, thickness, &baseline);
        while (text.width > max_width && scale > 0.3) {
            scale -= 0.05;
            text = cv::getTextSize(title, cv::FONT_HERSHEY_SIMPLEX, scale, thickness, &baseline);
        }

        cv::Mat strip = canvas(cv::Rect(0, 0, layout.canvas_width, kTitleHeight));
        cv::Point origin(kTitleMargin, (kTitleHeight + text.height) / 2);
        cv::putText(strip, title, origin, cv::FONT_HERSHEY_SIMPLEX, scale, palette.text, thickness, cv::LINE_AA);
    }

    static void discard(const fs::path& reserved) {
        std::error_code ec;
        fs::remove(reserved, ec);
    }

    std::shared_ptr<VideoAsset> asset_;
    OutputPathResolver resolver_;
};

GridComposer::GridComposer(std::shared_ptr<VideoAsset> asset, OutputPathResolver resolver)
    : pimpl_(std::make_unique<Impl>(std::move(asset), std::move(resolver))) {}

GridComposer::~GridComposer() = default;

GridComposer::GridComposer(GridComposer&&) noexcept = default;
GridComposer& GridComposer::operator=(GridComposer&&) noexcept = default;

std::string GridComposer::compose(const std::vector<ExtractedFrame>& frames,
                                  const std::string& source_path,
                                  const GridConfig& config,
                                  const std::optional<std::string>& output_folder) {
    return pimpl_->compose(frames, source_path, config, output_folder);
}

cv::Mat GridComposer::render(const std::vector<ExtractedFrame>& frames,
                             const std::string& source_path,
                             const GridConfig& config) {
    return pimpl_->render(frames, source_path, config);
}

double GridComposer::resolve_aspect_ratio(const std::vector<ExtractedFrame>& frames,
                                          const std::string& source_path,
                                          AspectMode mode) {
    return pimpl_->resolve_aspect_ratio(frames, source_path, mode);
}

} // namespace thumbgrid
