#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace thumbgrid {

enum class JobState {
    Queued,
    Loading,
    Extracting,
    Selecting,
    Composing,
    Complete,
    Cancelled,
    Failed
};

bool is_terminal(JobState state);
std::string to_string(JobState state);

// Generational handle: a handle to a removed job never matches the job that
// later reuses its slot.
struct JobId {
    std::uint32_t index = 0;
    std::uint32_t generation = 0;

    bool operator==(const JobId& other) const {
        return index == other.index && generation == other.generation;
    }
    bool operator!=(const JobId& other) const { return !(*this == other); }
};

struct VideoJob {
    JobId id;
    std::string source_path;
    double progress = 0.0;
    JobState state = JobState::Queued;
    std::string status = "Queued";
    std::string output_path;
    std::string error;
    bool from_cache = false;

    bool is_complete() const { return is_terminal(state); }
    bool is_cancelled() const { return state == JobState::Cancelled; }
};

// Arena of job records plus a display-order index.
class JobTable {
public:
    JobId add(const std::string& source_path);

    VideoJob* find(JobId id);
    const VideoJob* find(JobId id) const;

    // Snapshot in insertion order.
    std::vector<VideoJob> jobs() const;
    const std::vector<JobId>& order() const { return order_; }

    bool remove(JobId id);

    // Removes every job in a terminal state; returns how many went.
    std::size_t clear_completed();
    void clear();

    std::size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

private:
    struct Entry {
        std::uint32_t generation = 0;
        std::optional<VideoJob> job;
    };

    std::vector<Entry> entries_;
    std::vector<std::uint32_t> free_;
    std::vector<JobId> order_;
};

} // namespace thumbgrid
