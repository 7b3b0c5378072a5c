#include "frame_extractor.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace thumbgrid {

class FrameExtractor::Impl {
public:
    Impl(std::shared_ptr<VideoAsset> asset,
         std::shared_ptr<FrameCache> cache,
         const SamplerOptions& sampler_options,
         const SelectionOptions& selection_options,
         const MetricOptions& metric_options)
        : cache_(std::move(cache))
        , sampler_(std::move(asset), sampler_options)
        , selector_(selection_options, metric_options) {}

    ExtractionResult extract(const std::string& video_path, int frame_count,
                             const CancellationToken& token,
                             const ProgressCallback& progress) {
        auto report = [&](ExtractionPhase phase, double fraction) {
            if (progress) {
                progress(phase, fraction);
            }
        };

        token.throw_if_cancelled();

        // Taken before decoding; a source rewritten mid-extraction must not
        // have the stale frames published under its new fingerprint.
        std::string cache_key;
        if (cache_) {
            cache_key = cache_->fingerprint(video_path, frame_count);
            if (auto entry = cache_->find(cache_key)) {
                std::cout << "Cache hit for " << std::filesystem::path(video_path).filename().string()
                          << " (" << entry->frames.size() << " frames)" << std::endl;
                report(ExtractionPhase::Selecting, 1.0);
                ExtractionResult result;
                result.frames = std::move(entry->frames);
                result.from_cache = true;
                return result;
            }
        }

        auto start = std::chrono::high_resolution_clock::now();
        const std::string name = std::filesystem::path(video_path).filename().string();

        std::vector<ExtractedFrame> candidates = sampler_.sample(video_path, frame_count, token,
            [&](double fraction) { report(ExtractionPhase::Sampling, fraction * 0.5); });

        std::cout << "Extracted " << candidates.size() << " candidates from " << name << std::endl;

        token.throw_if_cancelled();

        std::vector<ExtractedFrame> selected = selector_.select(candidates, frame_count, token,
            [&](double fraction) { report(ExtractionPhase::Selecting, 0.5 + fraction * 0.5); });

        auto elapsed = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - start).count();
        std::cout << "Selected " << selected.size() << " of " << candidates.size()
                  << " frames from " << name << " in " << elapsed << "s" << std::endl;

        if (cache_) {
            cache_->store_as(cache_key, selected);
        }

        ExtractionResult result;
        result.frames = std::move(selected);
        result.candidate_count = static_cast<int>(candidates.size());
        return result;
    }

private:
    std::shared_ptr<FrameCache> cache_;
    FrameSampler sampler_;
    DistinctnessSelector selector_;
};

FrameExtractor::FrameExtractor(std::shared_ptr<VideoAsset> asset,
                               std::shared_ptr<FrameCache> cache,
                               const SamplerOptions& sampler_options,
                               const SelectionOptions& selection_options,
                               const MetricOptions& metric_options)
    : pimpl_(std::make_unique<Impl>(std::move(asset), std::move(cache),
                                    sampler_options, selection_options, metric_options)) {}

FrameExtractor::~FrameExtractor() = default;

ExtractionResult FrameExtractor::extract(const std::string& video_path, int frame_count,
                                         const CancellationToken& token,
                                         const ProgressCallback& progress) {
    return pimpl_->extract(video_path, frame_count, token, progress);
}

} // namespace thumbgrid
