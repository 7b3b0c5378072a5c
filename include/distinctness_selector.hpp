#pragma once

#include "cancellation.hpp"
#include "metric_computer.hpp"
#include "types.hpp"
#include <cstddef>
#include <functional>
#include <vector>

namespace thumbgrid {

struct ScoreWeights {
    double brightness = 0.6;
    double color_variance = 0.4;
    double edge_density = 0.0;   // used only when both frames carry the metric
    double histogram = 0.0;      // half L1 distance, same condition
};

struct SelectionOptions {
    int fast_path_max = 12;          // grids this small skip scoring
    double min_brightness = 0.15;    // exclusive bounds; outside means fade
    double max_brightness = 0.85;
    double min_color_variance = 0.008;
    ScoreWeights weights;
    int yield_every = 10;
};

// Picks the most visually varied subset of candidates, returned in
// chronological order.
class DistinctnessSelector {
public:
    using ProgressCallback = std::function<void(double)>;

    explicit DistinctnessSelector(const SelectionOptions& options = {},
                                  const MetricOptions& metric_options = {});

    // Returns min(requested_count, usable candidates) frames. Throws
    // std::invalid_argument for a non-positive count and CancelledError when
    // `token` fires at a yield point.
    std::vector<ExtractedFrame> select(const std::vector<ExtractedFrame>& candidates,
                                       int requested_count,
                                       const CancellationToken& token = CancellationToken(),
                                       const ProgressCallback& progress = {}) const;

    // Indices into a scoring set of `total` entries that entry `index` is
    // compared against: time neighbours first, then the quarter, half and
    // three-quarter points. Never contains `index`, at most five entries.
    static std::vector<std::size_t> comparison_indices(std::size_t index, std::size_t total);

    // Index rule used by the fast path: floor(i * n / count), clamped.
    static std::vector<std::size_t> evenly_spaced_indices(std::size_t candidate_count,
                                                          std::size_t requested_count);

    double pair_score(const FrameMetrics& a, const FrameMetrics& b) const;

    bool passes_quality_filter(const FrameMetrics& metrics) const;

private:
    SelectionOptions options_;
    MetricComputer metric_computer_;
};

} // namespace thumbgrid
