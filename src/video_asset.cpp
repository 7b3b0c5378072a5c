#include "video_asset.hpp"
#include "errors.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace thumbgrid {

namespace {

constexpr std::size_t kMaxIdleCapturesPerPath = 2;

int rotation_of(cv::VideoCapture& cap) {
    int rotation = static_cast<int>(std::lround(cap.get(cv::CAP_PROP_ORIENTATION_META)));
    rotation %= 360;
    if (rotation < 0) {
        rotation += 360;
    }
    return rotation;
}

double duration_of(cv::VideoCapture& cap) {
    double frames = cap.get(cv::CAP_PROP_FRAME_COUNT);
    double fps = cap.get(cv::CAP_PROP_FPS);
    if (frames <= 0.0 || fps <= 0.0) {
        return 0.0;
    }
    return frames / fps;
}

} // namespace

// Borrowed capture, returned to the pool when it goes out of scope. A lease
// whose capture failed mid-decode is discarded instead of pooled.
class OpenCvVideoAsset::Lease {
public:
    Lease(OpenCvVideoAsset& owner, std::string path, std::unique_ptr<cv::VideoCapture> capture)
        : owner_(&owner), path_(std::move(path)), capture_(std::move(capture)) {}

    Lease(Lease&& other) noexcept
        : owner_(other.owner_), path_(std::move(other.path_)), capture_(std::move(other.capture_)) {
        other.owner_ = nullptr;
    }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease& operator=(Lease&&) = delete;

    ~Lease() {
        if (owner_ && capture_) {
            owner_->give_back(path_, std::move(capture_));
        }
    }

    cv::VideoCapture& operator*() { return *capture_; }
    cv::VideoCapture* operator->() { return capture_.get(); }

    void discard() { capture_.reset(); }

private:
    OpenCvVideoAsset* owner_;
    std::string path_;
    std::unique_ptr<cv::VideoCapture> capture_;
};

OpenCvVideoAsset::OpenCvVideoAsset() = default;

OpenCvVideoAsset::~OpenCvVideoAsset() = default;

OpenCvVideoAsset::Lease OpenCvVideoAsset::acquire(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = idle_.find(path);
        if (it != idle_.end() && !it->second.empty()) {
            auto capture = std::move(it->second.back());
            it->second.pop_back();
            return Lease(*this, path, std::move(capture));
        }
    }

    auto capture = std::make_unique<cv::VideoCapture>(path);
    if (!capture->isOpened()) {
        throw DecodeError("Cannot open video file: " + path);
    }
    return Lease(*this, path, std::move(capture));
}

void OpenCvVideoAsset::give_back(const std::string& path,
                                 std::unique_ptr<cv::VideoCapture> capture) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& pool = idle_[path];
    if (pool.size() < kMaxIdleCapturesPerPath) {
        pool.push_back(std::move(capture));
    }
}

void OpenCvVideoAsset::close(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.erase(path);
}

double OpenCvVideoAsset::duration(const std::string& path) {
    auto cap = acquire(path);
    return duration_of(*cap);
}

cv::Mat OpenCvVideoAsset::decode_frame(const std::string& path, double timestamp,
                                       cv::Size max_size) {
    auto cap = acquire(path);

    cv::Mat frame;
    bool ok = false;
    try {
        ok = cap->set(cv::CAP_PROP_POS_MSEC, std::max(0.0, timestamp) * 1000.0) && cap->read(frame);
    } catch (const cv::Exception& e) {
        cap.discard();
        throw DecodeError("Decode failed at " + std::to_string(timestamp) + "s in " + path + ": " + e.what());
    }

    if (!ok || frame.empty()) {
        cap.discard();
        throw DecodeError("No frame at " + std::to_string(timestamp) + "s in " + path);
    }

    return fit_within(frame, max_size);
}

std::optional<cv::Size> OpenCvVideoAsset::native_display_size(const std::string& path) {
    try {
        auto cap = acquire(path);
        int width = static_cast<int>(cap->get(cv::CAP_PROP_FRAME_WIDTH));
        int height = static_cast<int>(cap->get(cv::CAP_PROP_FRAME_HEIGHT));
        if (width <= 0 || height <= 0) {
            return std::nullopt;
        }
        int rotation = rotation_of(*cap);
        if (rotation == 90 || rotation == 270) {
            std::swap(width, height);
        }
        return cv::Size(width, height);
    } catch (const DecodeError& e) {
        std::cerr << "Display size unavailable: " << e.what() << std::endl;
        return std::nullopt;
    }
}

VideoInfo OpenCvVideoAsset::info(const std::string& path) {
    auto cap = acquire(path);

    VideoInfo info;
    info.total_frames = static_cast<int>(cap->get(cv::CAP_PROP_FRAME_COUNT));
    info.fps = cap->get(cv::CAP_PROP_FPS);
    info.duration = duration_of(*cap);
    info.frame_size = cv::Size(
        static_cast<int>(cap->get(cv::CAP_PROP_FRAME_WIDTH)),
        static_cast<int>(cap->get(cv::CAP_PROP_FRAME_HEIGHT))
    );
    info.rotation = rotation_of(*cap);
    info.display_size = info.frame_size;
    if (info.rotation == 90 || info.rotation == 270) {
        info.display_size = cv::Size(info.frame_size.height, info.frame_size.width);
    }

    int fourcc = static_cast<int>(cap->get(cv::CAP_PROP_FOURCC));
    char codec_chars[5];
    codec_chars[0] = static_cast<char>(fourcc & 0xFF);
    codec_chars[1] = static_cast<char>((fourcc >> 8) & 0xFF);
    codec_chars[2] = static_cast<char>((fourcc >> 16) & 0xFF);
    codec_chars[3] = static_cast<char>((fourcc >> 24) & 0xFF);
    codec_chars[4] = '\0';
    info.codec = std::string(codec_chars);

    return info;
}

cv::Mat fit_within(const cv::Mat& image, cv::Size max_size) {
    if (image.empty() || max_size.width <= 0 || max_size.height <= 0) {
        return image;
    }
    if (image.cols <= max_size.width && image.rows <= max_size.height) {
        return image;
    }

    double scale = std::min(static_cast<double>(max_size.width) / image.cols,
                            static_cast<double>(max_size.height) / image.rows);
    cv::Size target(std::max(1, static_cast<int>(std::lround(image.cols * scale))),
                    std::max(1, static_cast<int>(std::lround(image.rows * scale))));

    cv::Mat resized;
    cv::resize(image, resized, target, 0, 0, cv::INTER_AREA);
    return resized;
}

} // namespace thumbgrid
