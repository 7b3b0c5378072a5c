#include "metric_computer.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace thumbgrid {

namespace {

// Edge detection on the 16x16 grid is meaningless; use a slightly larger one.
constexpr int kEdgeGridScale = 4;

bool to_bgr(const cv::Mat& image, cv::Mat& bgr) {
    if (image.empty() || image.depth() != CV_8U) {
        return false;
    }
    switch (image.channels()) {
        case 1: cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR); return true;
        case 3: bgr = image; return true;
        case 4: cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR); return true;
        default: return false;
    }
}

// Colour histogram layout: twelve 30 degree hue sectors for chromatic
// pixels, then four luminance bands for pixels too unsaturated to have a hue.
constexpr std::size_t kHueBins = 12;
constexpr std::size_t kGrayBins = 4;
constexpr double kMinChroma = 0.1;

std::size_t colour_bin(double r, double g, double b, double luminance) {
    const double high = std::max({r, g, b});
    const double chroma = high - std::min({r, g, b});
    if (chroma < kMinChroma) {
        return kHueBins + std::min(kGrayBins - 1, static_cast<std::size_t>(luminance * kGrayBins));
    }

    double hue;
    if (high == r) {
        hue = std::fmod((g - b) / chroma + 6.0, 6.0);
    } else if (high == g) {
        hue = (b - r) / chroma + 2.0;
    } else {
        hue = (r - g) / chroma + 4.0;
    }
    return std::min(kHueBins - 1, static_cast<std::size_t>(hue * 60.0 / 30.0));
}

double edge_density_of(const cv::Mat& bgr, int grid) {
    cv::Mat small, gray, edges;
    cv::resize(bgr, small, cv::Size(grid, grid), 0, 0, cv::INTER_AREA);
    cv::cvtColor(small, gray, cv::COLOR_BGR2GRAY);
    cv::Canny(gray, edges, 50, 150);
    return static_cast<double>(cv::countNonZero(edges)) / static_cast<double>(edges.total());
}

} // namespace

MetricComputer::MetricComputer(const MetricOptions& options)
    : options_(options) {
    options_.grid_size = std::max(1, options_.grid_size);
}

std::optional<FrameMetrics> MetricComputer::compute(const cv::Mat& image, std::size_t index) const {
    cv::Mat bgr;
    cv::Mat grid;
    try {
        if (!to_bgr(image, bgr)) {
            return std::nullopt;
        }
        cv::resize(bgr, grid, cv::Size(options_.grid_size, options_.grid_size), 0, 0, cv::INTER_AREA);
    } catch (const cv::Exception& e) {
        std::cerr << "Metric computation skipped frame " << index << ": " << e.what() << std::endl;
        return std::nullopt;
    }

    const double pixel_count = static_cast<double>(grid.total());
    double luminance_sum = 0.0;
    double sum[3] = {0.0, 0.0, 0.0};
    double sum_sq[3] = {0.0, 0.0, 0.0};
    std::array<double, 16> histogram{};

    for (int y = 0; y < grid.rows; ++y) {
        const cv::Vec3b* row = grid.ptr<cv::Vec3b>(y);
        for (int x = 0; x < grid.cols; ++x) {
            // OpenCV stores BGR
            double b = row[x][0] / 255.0;
            double g = row[x][1] / 255.0;
            double r = row[x][2] / 255.0;

            double luminance = 0.299 * r + 0.587 * g + 0.114 * b;
            luminance_sum += luminance;

            const double channel[3] = {r, g, b};
            for (int c = 0; c < 3; ++c) {
                sum[c] += channel[c];
                sum_sq[c] += channel[c] * channel[c];
            }

            histogram[colour_bin(r, g, b, luminance)] += 1.0;
        }
    }

    FrameMetrics metrics;
    metrics.index = index;
    metrics.brightness = luminance_sum / pixel_count;

    double variance_total = 0.0;
    for (int c = 0; c < 3; ++c) {
        double mean = sum[c] / pixel_count;
        variance_total += std::max(0.0, sum_sq[c] / pixel_count - mean * mean);
    }
    metrics.color_variance = variance_total / 3.0;

    if (options_.edge_density) {
        metrics.edge_density = edge_density_of(bgr, options_.grid_size * kEdgeGridScale);
    }
    if (options_.histogram) {
        for (auto& bin : histogram) {
            bin /= pixel_count;
        }
        metrics.histogram = histogram;
    }

    return metrics;
}

} // namespace thumbgrid
