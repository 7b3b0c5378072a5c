#pragma once

#include <opencv2/core.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cv {
class VideoCapture;
}

namespace thumbgrid {

// Decoding backend consumed by the pipeline. Implementations must be safe to
// call from several jobs at once.
class VideoAsset {
public:
    virtual ~VideoAsset() = default;

    // Duration in seconds. Throws DecodeError when the file cannot be opened.
    virtual double duration(const std::string& path) = 0;

    // Decodes the frame nearest to `timestamp`, oriented for display and
    // scaled down (never up) to fit within `max_size`. Throws DecodeError.
    virtual cv::Mat decode_frame(const std::string& path, double timestamp,
                                 cv::Size max_size) = 0;

    // Display dimensions of the video track with rotation applied, or
    // nullopt when the container does not expose them.
    virtual std::optional<cv::Size> native_display_size(const std::string& path) = 0;

    // Drops any decoder state held for `path`.
    virtual void close(const std::string& /*path*/) {}
};

struct VideoInfo {
    int total_frames = 0;
    double fps = 0.0;
    double duration = 0.0;
    cv::Size frame_size;
    cv::Size display_size;
    int rotation = 0;
    std::string codec;
};

// VideoAsset backed by cv::VideoCapture. Open captures are pooled per path
// so consecutive decodes for one job reuse the demuxer.
class OpenCvVideoAsset : public VideoAsset {
public:
    OpenCvVideoAsset();
    ~OpenCvVideoAsset() override;

    double duration(const std::string& path) override;
    cv::Mat decode_frame(const std::string& path, double timestamp,
                         cv::Size max_size) override;
    std::optional<cv::Size> native_display_size(const std::string& path) override;
    void close(const std::string& path) override;

    VideoInfo info(const std::string& path);

private:
    class Lease;

    Lease acquire(const std::string& path);
    void give_back(const std::string& path, std::unique_ptr<cv::VideoCapture> capture);

    std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::unique_ptr<cv::VideoCapture>>> idle_;
};

// Scales `image` down to fit within `max_size`, preserving aspect ratio.
cv::Mat fit_within(const cv::Mat& image, cv::Size max_size);

} // namespace thumbgrid
