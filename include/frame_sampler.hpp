#pragma once

#include "cancellation.hpp"
#include "types.hpp"
#include "video_asset.hpp"
#include <opencv2/core.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace thumbgrid {

struct SamplerOptions {
    double skip_fraction = 0.05;       // trimmed from each end (intro/outro)
    double oversample_factor = 1.5;
    cv::Size max_frame_size{480, 480};
    int yield_every = 5;               // decodes between cooperative yields
};

// Picks oversampled candidate timestamps across the usable span of a video
// and decodes them through the VideoAsset.
class FrameSampler {
public:
    FrameSampler(std::shared_ptr<VideoAsset> asset, const SamplerOptions& options = {});

    // Candidate count for a requested grid size.
    int candidate_count(int requested_count) const;

    // Evenly spaced timestamps inside [skip, duration - skip]. Throws
    // VideoTooShortError when nothing is left after trimming.
    std::vector<double> plan(double duration, int requested_count) const;

    // Decodes every timestamp in order. Any decode failure aborts the whole
    // extraction. `progress` receives the completed fraction in [0, 1].
    std::vector<ExtractedFrame> extract(const std::string& path,
                                        const std::vector<double>& timestamps,
                                        const CancellationToken& token,
                                        const std::function<void(double)>& progress = {}) const;

    // duration() + plan() + extract().
    std::vector<ExtractedFrame> sample(const std::string& path, int requested_count,
                                       const CancellationToken& token,
                                       const std::function<void(double)>& progress = {}) const;

    const SamplerOptions& options() const { return options_; }

private:
    std::shared_ptr<VideoAsset> asset_;
    SamplerOptions options_;
};

} // namespace thumbgrid
