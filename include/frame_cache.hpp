#pragma once

#include "types.hpp"
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace thumbgrid {

struct CacheEntry {
    std::string fingerprint;
    std::vector<ExtractedFrame> frames;
};

struct CacheStats {
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t corrupt = 0;
    std::size_t writes = 0;
    std::size_t write_failures = 0;
};

// Content-addressed store of selected frames, one file per fingerprint of
// (absolute path, modification time, frame count). Entries are published by
// renaming a fully written temp file, so readers never see partial data.
// The cache never evicts.
class FrameCache {
public:
    explicit FrameCache(std::filesystem::path directory = default_directory());
    ~FrameCache();

    FrameCache(const FrameCache&) = delete;
    FrameCache& operator=(const FrameCache&) = delete;

    // $XDG_CACHE_HOME/thumbgrid/frame_cache, $HOME/.cache/..., or temp.
    static std::filesystem::path default_directory();

    // Falls back to a digest of the path alone when the modification time
    // cannot be read.
    std::string fingerprint(const std::string& source_path, int frame_count) const;

    std::filesystem::path entry_path(const std::string& fingerprint) const;

    // Missing, unreadable or corrupt entries all come back as nullopt.
    std::optional<CacheEntry> lookup(const std::string& source_path, int frame_count);
    std::optional<CacheEntry> find(const std::string& fingerprint);

    // Encodes and publishes in the background; returns immediately. Failures
    // are logged and counted, never thrown. The fingerprint is taken before
    // this returns.
    void store(const std::string& source_path, int frame_count, std::vector<ExtractedFrame> frames);

    // Publishes under a fingerprint taken earlier, so frames decoded from a
    // source that changed in the meantime land under the old, unreachable key.
    void store_as(const std::string& fingerprint, std::vector<ExtractedFrame> frames);

    void wait_for_pending_writes();

    bool remove(const std::string& source_path, int frame_count);

    // Deletes every entry; returns the number removed.
    std::size_t clear();

    CacheStats stats() const;

    const std::filesystem::path& directory() const { return directory_; }

private:
    CacheEntry read_entry(const std::filesystem::path& path, const std::string& fingerprint) const;
    void write_entry(const std::string& fingerprint, const std::vector<ExtractedFrame>& frames);

    std::filesystem::path directory_;
    bool available_ = false;

    std::mutex pending_mutex_;
    std::vector<std::future<void>> pending_;

    std::atomic<std::size_t> hits_{0};
    std::atomic<std::size_t> misses_{0};
    std::atomic<std::size_t> corrupt_{0};
    std::atomic<std::size_t> writes_{0};
    std::atomic<std::size_t> write_failures_{0};
};

} // namespace thumbgrid
