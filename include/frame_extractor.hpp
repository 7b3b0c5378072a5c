#pragma once

#include "cancellation.hpp"
#include "distinctness_selector.hpp"
#include "frame_cache.hpp"
#include "frame_sampler.hpp"
#include "metric_computer.hpp"
#include "types.hpp"
#include "video_asset.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace thumbgrid {

enum class ExtractionPhase { Sampling, Selecting };

struct ExtractionResult {
    std::vector<ExtractedFrame> frames;
    bool from_cache = false;
    int candidate_count = 0;  // 0 on a cache hit
};

// Cache lookup, then sample + select on a miss, then a background cache
// write. Progress is reported as one fraction over both phases: sampling
// covers [0, 0.5], selection [0.5, 1].
class FrameExtractor {
public:
    using ProgressCallback = std::function<void(ExtractionPhase, double)>;

    // `cache` may be null to disable caching.
    FrameExtractor(std::shared_ptr<VideoAsset> asset,
                   std::shared_ptr<FrameCache> cache,
                   const SamplerOptions& sampler_options = {},
                   const SelectionOptions& selection_options = {},
                   const MetricOptions& metric_options = {});
    ~FrameExtractor();

    ExtractionResult extract(const std::string& video_path, int frame_count,
                             const CancellationToken& token,
                             const ProgressCallback& progress = {});

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace thumbgrid
