#pragma once

#include "types.hpp"
#include <opencv2/core.hpp>
#include <cstddef>
#include <optional>

namespace thumbgrid {

struct MetricOptions {
    int grid_size = 16;           // side of the downsampled grid
    bool edge_density = false;
    bool histogram = false;       // 16-bin colour histogram, see FrameMetrics
};

// Cheap per-frame summary statistics over a heavily downsampled raster.
class MetricComputer {
public:
    explicit MetricComputer(const MetricOptions& options = {});

    // Returns nullopt when the raster is empty or in a layout that cannot be
    // read as 8-bit gray/BGR/BGRA.
    std::optional<FrameMetrics> compute(const cv::Mat& image, std::size_t index = 0) const;

    const MetricOptions& options() const { return options_; }

private:
    MetricOptions options_;
};

} // namespace thumbgrid
