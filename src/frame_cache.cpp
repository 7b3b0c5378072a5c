#include "frame_cache.hpp"
#include "errors.hpp"
#include "hashing.hpp"
#include <opencv2/imgcodecs.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <sstream>

using json = nlohmann::json;

namespace fs = std::filesystem;

namespace thumbgrid {

namespace {

constexpr const char* kFormatName = "thumbgrid-frame-cache";
constexpr int kFormatVersion = 1;
constexpr const char* kEntryExtension = ".cache";

std::string random_suffix() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::ostringstream oss;
    oss << std::hex << gen();
    return oss.str();
}

std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw CacheCorruptError("Cannot open cache entry " + path.string());
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in),
                                     std::istreambuf_iterator<char>());
}

} // namespace

FrameCache::FrameCache(fs::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    available_ = !ec && fs::is_directory(directory_, ec);
    if (!available_) {
        std::cerr << "Frame cache disabled, cannot use " << directory_
                  << (ec ? ": " + ec.message() : std::string()) << std::endl;
    }
}

FrameCache::~FrameCache() {
    wait_for_pending_writes();
}

fs::path FrameCache::default_directory() {
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "thumbgrid" / "frame_cache";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".cache" / "thumbgrid" / "frame_cache";
    }
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    return (ec ? fs::path(".") : tmp) / "thumbgrid" / "frame_cache";
}

std::string FrameCache::fingerprint(const std::string& source_path, int frame_count) const {
    std::error_code ec;
    fs::path absolute = fs::absolute(source_path, ec);
    if (ec) {
        absolute = source_path;
    }

    auto modified = fs::last_write_time(absolute, ec);
    if (ec) {
        return sha256_hex(absolute.string());
    }

    std::ostringstream input;
    input << absolute.string() << '_' << modified.time_since_epoch().count() << '_' << frame_count;
    return sha256_hex(input.str());
}

fs::path FrameCache::entry_path(const std::string& fingerprint) const {
    return directory_ / (fingerprint + kEntryExtension);
}

std::optional<CacheEntry> FrameCache::lookup(const std::string& source_path, int frame_count) {
    std::optional<CacheEntry> entry = find(fingerprint(source_path, frame_count));
    if (entry) {
        std::cout << "Cache hit for " << fs::path(source_path).filename().string()
                  << " (" << entry->frames.size() << " frames)" << std::endl;
    }
    return entry;
}

std::optional<CacheEntry> FrameCache::find(const std::string& key) {
    if (!available_) {
        ++misses_;
        return std::nullopt;
    }

    const fs::path path = entry_path(key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        ++misses_;
        return std::nullopt;
    }

    try {
        auto start = std::chrono::high_resolution_clock::now();
        CacheEntry entry = read_entry(path, key);
        auto elapsed = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - start).count();
        std::cout << "Read cache entry " << key << " in " << elapsed << "s" << std::endl;
        ++hits_;
        return entry;
    } catch (const CacheCorruptError& e) {
        std::cerr << "Cache entry corrupt, extracting fresh frames: " << e.what() << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "Cache entry unreadable, extracting fresh frames: " << e.what() << std::endl;
    } catch (const cv::Exception& e) {
        std::cerr << "Cache image undecodable, extracting fresh frames: " << e.what() << std::endl;
    }

    ++corrupt_;
    ++misses_;
    return std::nullopt;
}

CacheEntry FrameCache::read_entry(const fs::path& path, const std::string& fingerprint) const {
    const std::vector<std::uint8_t> bytes = read_file(path);
    if (bytes.empty()) {
        throw CacheCorruptError("Empty cache entry " + path.string());
    }

    const json doc = json::from_msgpack(bytes);
    if (!doc.is_object() || doc.value("format", std::string()) != kFormatName) {
        throw CacheCorruptError("Unrecognised cache format in " + path.string());
    }
    if (doc.value("version", 0) != kFormatVersion) {
        throw CacheCorruptError("Unsupported cache version in " + path.string());
    }
    if (doc.value("fingerprint", std::string()) != fingerprint) {
        throw CacheCorruptError("Fingerprint mismatch in " + path.string());
    }

    const json& records = doc.at("frames");
    if (!records.is_array() || records.empty()) {
        throw CacheCorruptError("No frames in " + path.string());
    }

    CacheEntry entry;
    entry.fingerprint = fingerprint;
    entry.frames.reserve(records.size());

    for (const auto& record : records) {
        const std::vector<std::uint8_t>& encoded = record.at("image").get_binary();
        cv::Mat image = cv::imdecode(encoded, cv::IMREAD_COLOR);
        if (image.empty()) {
            throw CacheCorruptError("Undecodable frame in " + path.string());
        }
        entry.frames.push_back(ExtractedFrame{image, record.at("timestamp").get<double>()});
    }

    return entry;
}

void FrameCache::store(const std::string& source_path, int frame_count, std::vector<ExtractedFrame> frames) {
    if (!available_ || frames.empty()) {
        return;
    }
    store_as(fingerprint(source_path, frame_count), std::move(frames));
}

void FrameCache::store_as(const std::string& key, std::vector<ExtractedFrame> frames) {
    if (!available_ || frames.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(pending_mutex_);

    // Drop handles of writes that have already finished.
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(), [](std::future<void>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), pending_.end());

    pending_.push_back(std::async(std::launch::async,
        [this, key, frames = std::move(frames)]() {
            try {
                write_entry(key, frames);
                ++writes_;
            } catch (const std::exception& e) {
                ++write_failures_;
                std::cerr << "Failed to save frame cache entry " << key << ": " << e.what() << std::endl;
            }
        }));
}

void FrameCache::write_entry(const std::string& fingerprint, const std::vector<ExtractedFrame>& frames) {
    json records = json::array();
    for (const auto& frame : frames) {
        std::vector<std::uint8_t> encoded;
        if (frame.image.empty() || !cv::imencode(".png", frame.image, encoded) || encoded.empty()) {
            throw std::runtime_error("PNG encoding failed for frame at " + std::to_string(frame.timestamp) + "s");
        }
        records.push_back({
            {"timestamp", frame.timestamp},
            {"image", json::binary(std::move(encoded))}
        });
    }

    json doc;
    doc["format"] = kFormatName;
    doc["version"] = kFormatVersion;
    doc["fingerprint"] = fingerprint;
    doc["frames"] = std::move(records);

    const std::vector<std::uint8_t> bytes = json::to_msgpack(doc);

    const fs::path target = entry_path(fingerprint);
    const fs::path temp = directory_ / (fingerprint + ".tmp-" + random_suffix());
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            throw std::runtime_error("Cannot write " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw std::runtime_error("Cannot publish cache entry " + target.string() + ": " + ec.message());
    }
}

void FrameCache::wait_for_pending_writes() {
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& f : pending) {
        f.wait();
    }
}

bool FrameCache::remove(const std::string& source_path, int frame_count) {
    std::error_code ec;
    return fs::remove(entry_path(fingerprint(source_path, frame_count)), ec) && !ec;
}

std::size_t FrameCache::clear() {
    wait_for_pending_writes();

    std::size_t removed = 0;
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == kEntryExtension) {
            std::error_code remove_ec;
            if (fs::remove(it->path(), remove_ec)) {
                ++removed;
            }
        }
    }
    return removed;
}

CacheStats FrameCache::stats() const {
    CacheStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.corrupt = corrupt_.load();
    s.writes = writes_.load();
    s.write_failures = write_failures_.load();
    return s;
}

} // namespace thumbgrid
