#include "frame_sampler.hpp"
#include "errors.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace thumbgrid {

FrameSampler::FrameSampler(std::shared_ptr<VideoAsset> asset, const SamplerOptions& options)
    : asset_(std::move(asset))
    , options_(options) {
    if (!asset_) {
        throw std::invalid_argument("FrameSampler requires a video asset");
    }
    if (options_.oversample_factor < 1.0) {
        options_.oversample_factor = 1.0;
    }
    if (options_.yield_every < 1) {
        options_.yield_every = 1;
    }
}

int FrameSampler::candidate_count(int requested_count) const {
    if (requested_count < 1) {
        throw std::invalid_argument("Requested frame count must be positive");
    }
    // The epsilon keeps exact products (16 * 1.5) from rounding up.
    return static_cast<int>(std::ceil(requested_count * options_.oversample_factor - 1e-9));
}

std::vector<double> FrameSampler::plan(double duration, int requested_count) const {
    const int count = candidate_count(requested_count);

    const double skip_start = duration * options_.skip_fraction;
    const double skip_end = duration * options_.skip_fraction;
    const double usable = duration - skip_start - skip_end;
    if (!(usable > 0.0)) {
        throw VideoTooShortError(duration);
    }

    const double step = usable / static_cast<double>(count + 1);
    std::vector<double> timestamps;
    timestamps.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        timestamps.push_back(skip_start + step * static_cast<double>(i + 1));
    }
    return timestamps;
}

std::vector<ExtractedFrame> FrameSampler::extract(const std::string& path,
                                                  const std::vector<double>& timestamps,
                                                  const CancellationToken& token,
                                                  const std::function<void(double)>& progress) const {
    auto start_time = std::chrono::high_resolution_clock::now();

    std::vector<ExtractedFrame> frames;
    frames.reserve(timestamps.size());

    for (size_t i = 0; i < timestamps.size(); ++i) {
        if (i % static_cast<size_t>(options_.yield_every) == 0) {
            cooperative_yield(token);
        }

        cv::Mat image = asset_->decode_frame(path, timestamps[i], options_.max_frame_size);
        if (image.empty()) {
            throw DecodeError("Empty frame at " + std::to_string(timestamps[i]) + "s in " + path);
        }
        frames.push_back(ExtractedFrame{image, timestamps[i]});

        if (progress) {
            progress(static_cast<double>(i + 1) / static_cast<double>(timestamps.size()));
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    double elapsed = std::chrono::duration<double>(end_time - start_time).count();
    std::cout << "Frame extraction took " << elapsed << "s for "
              << frames.size() << " candidates" << std::endl;

    return frames;
}

std::vector<ExtractedFrame> FrameSampler::sample(const std::string& path, int requested_count,
                                                 const CancellationToken& token,
                                                 const std::function<void(double)>& progress) const {
    const double duration = asset_->duration(path);
    const auto timestamps = plan(duration, requested_count);
    return extract(path, timestamps, token, progress);
}

} // namespace thumbgrid
