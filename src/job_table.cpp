#include "job_table.hpp"
#include <algorithm>

namespace thumbgrid {

bool is_terminal(JobState state) {
    return state == JobState::Complete || state == JobState::Cancelled || state == JobState::Failed;
}

std::string to_string(JobState state) {
    switch (state) {
        case JobState::Queued: return "Queued";
        case JobState::Loading: return "Loading";
        case JobState::Extracting: return "Extracting";
        case JobState::Selecting: return "Selecting";
        case JobState::Composing: return "Composing";
        case JobState::Complete: return "Complete";
        case JobState::Cancelled: return "Cancelled";
        case JobState::Failed: return "Failed";
    }
    return "Unknown";
}

JobId JobTable::add(const std::string& source_path) {
    std::uint32_t index;
    if (!free_.empty()) {
        index = free_.back();
        free_.pop_back();
    } else {
        index = static_cast<std::uint32_t>(entries_.size());
        entries_.emplace_back();
    }

    Entry& entry = entries_[index];
    JobId id{index, entry.generation};

    VideoJob job;
    job.id = id;
    job.source_path = source_path;
    entry.job = std::move(job);

    order_.push_back(id);
    return id;
}

VideoJob* JobTable::find(JobId id) {
    if (id.index >= entries_.size()) {
        return nullptr;
    }
    Entry& entry = entries_[id.index];
    if (entry.generation != id.generation || !entry.job) {
        return nullptr;
    }
    return &*entry.job;
}

const VideoJob* JobTable::find(JobId id) const {
    return const_cast<JobTable*>(this)->find(id);
}

std::vector<VideoJob> JobTable::jobs() const {
    std::vector<VideoJob> snapshot;
    snapshot.reserve(order_.size());
    for (const JobId& id : order_) {
        if (const VideoJob* job = find(id)) {
            snapshot.push_back(*job);
        }
    }
    return snapshot;
}

bool JobTable::remove(JobId id) {
    if (!find(id)) {
        return false;
    }
    Entry& entry = entries_[id.index];
    entry.job.reset();
    ++entry.generation;
    free_.push_back(id.index);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return true;
}

std::size_t JobTable::clear_completed() {
    std::vector<JobId> finished;
    for (const JobId& id : order_) {
        const VideoJob* job = find(id);
        if (job && job->is_complete()) {
            finished.push_back(id);
        }
    }
    for (const JobId& id : finished) {
        remove(id);
    }
    return finished.size();
}

void JobTable::clear() {
    for (std::uint32_t index = 0; index < entries_.size(); ++index) {
        Entry& entry = entries_[index];
        if (entry.job) {
            entry.job.reset();
            ++entry.generation;
            free_.push_back(index);
        }
    }
    order_.clear();
}

} // namespace thumbgrid
