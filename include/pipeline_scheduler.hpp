#pragma once

#include "admission_gate.hpp"
#include "cancellation.hpp"
#include "distinctness_selector.hpp"
#include "frame_cache.hpp"
#include "frame_extractor.hpp"
#include "frame_sampler.hpp"
#include "grid_composer.hpp"
#include "job_table.hpp"
#include "metric_computer.hpp"
#include "types.hpp"
#include "video_asset.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace thumbgrid {

constexpr int kDefaultMaxConcurrency = 2;
constexpr int kMaxConcurrencyLimit = 10;

struct SchedulerConfig {
    int max_concurrency = kDefaultMaxConcurrency;
    int worker_threads = 0;  // 0 means one per admission slot

    // max_concurrency clamped to [1, kMaxConcurrencyLimit].
    int effective_concurrency() const;
    int effective_worker_threads() const;
};

struct PipelineRequest {
    std::string source_path;
    GridConfig config;
    std::optional<std::string> output_folder;
};

struct PipelineResult {
    std::string output_path;
    int frame_count = 0;
    bool from_cache = false;
};

enum class PipelinePhase { Extracting, Selecting, Composing };

// `fraction` covers extraction plus selection in [0, 1]; it is 0 for
// Composing.
using PhaseCallback = std::function<void(PipelinePhase phase, double fraction)>;

// The per-job work the scheduler runs once a job holds an admission slot.
class JobPipeline {
public:
    virtual ~JobPipeline() = default;

    // Throws CancelledError when `token` fires, any other exception on failure.
    virtual PipelineResult run(const PipelineRequest& request,
                               const CancellationToken& token,
                               const PhaseCallback& on_phase) = 0;
};

// Extract, select and compose through the real components.
class GridPipeline : public JobPipeline {
public:
    GridPipeline(std::shared_ptr<VideoAsset> asset,
                 std::shared_ptr<FrameCache> cache,
                 const SamplerOptions& sampler_options = {},
                 const SelectionOptions& selection_options = {},
                 const MetricOptions& metric_options = {},
                 OutputPathResolver resolver = OutputPathResolver());

    PipelineResult run(const PipelineRequest& request,
                       const CancellationToken& token,
                       const PhaseCallback& on_phase) override;

private:
    std::shared_ptr<VideoAsset> asset_;
    FrameExtractor extractor_;
    GridComposer composer_;
};

struct ProgressEvent {
    JobId id;
    std::string source_path;
    JobState state = JobState::Queued;
    double progress = 0.0;
    std::string status;
};

struct RunSummary {
    std::size_t completed = 0;
    std::size_t cancelled = 0;
    std::size_t failed = 0;
    std::optional<std::string> last_output_path;
    double elapsed_seconds = 0.0;
};

// Runs one pipeline per queued job on a fixed worker pool, at most
// max_concurrency at a time. Workers never touch the job table; they post
// updates that run() applies on the calling thread.
class PipelineScheduler {
public:
    using ProgressCallback = std::function<void(const ProgressEvent&)>;

    explicit PipelineScheduler(std::shared_ptr<JobPipeline> pipeline,
                               const SchedulerConfig& config = {});
    ~PipelineScheduler();

    PipelineScheduler(const PipelineScheduler&) = delete;
    PipelineScheduler& operator=(const PipelineScheduler&) = delete;

    JobId add_job(const std::string& source_path);
    std::vector<JobId> add_jobs(const std::vector<std::string>& source_paths);

    std::optional<VideoJob> job(JobId id) const;
    std::vector<VideoJob> jobs() const;

    // Processes every Queued job and blocks until each is terminal. The
    // callback runs on this thread. Throws std::logic_error if a run is
    // already in progress. If the callback throws, the remaining jobs are
    // cancelled and joined before the exception propagates.
    RunSummary run(const GridConfig& config,
                   const std::optional<std::string>& output_folder = std::nullopt,
                   const ProgressCallback& on_progress = {});

    // Safe from any thread. Returns false for unknown or finished jobs.
    bool cancel_job(JobId id);
    void cancel_all();

    // Removes terminal jobs. The summary counters are reset too, unless a
    // run is in progress.
    std::size_t clear_completed();
    void clear_all();

    RunSummary summary() const;
    bool running() const;

    int max_concurrency() const { return concurrency_; }
    const AdmissionGate& gate() const { return gate_; }

private:
    struct Task {
        JobId id;
        std::string source_path;
        CancellationToken token;
    };

    struct Update {
        JobId id;
        JobState state = JobState::Queued;
        double progress = 0.0;
        std::string status;
        std::string output_path;
        std::string error;
        bool from_cache = false;
    };

    void worker_loop(const GridConfig& config, const std::optional<std::string>& output_folder);
    void process(const Task& task, const GridConfig& config,
                 const std::optional<std::string>& output_folder);
    void post(Update update);
    Update next_update(std::deque<Update>& batch);
    // Sets `finished` when the update moved the job into a terminal state.
    std::optional<ProgressEvent> apply(const Update& update, bool& finished);
    void abandon_run(std::vector<std::thread>& workers, std::deque<Update>& batch,
                     std::size_t remaining, const GridConfig& config,
                     const std::optional<std::string>& output_folder);

    std::shared_ptr<JobPipeline> pipeline_;
    const int concurrency_;
    const int worker_threads_;
    AdmissionGate gate_;

    mutable std::mutex mutex_;
    JobTable table_;
    RunSummary summary_;
    bool running_ = false;
    CancellationToken run_token_;
    std::vector<std::pair<JobId, CancellationToken>> job_tokens_;
    std::deque<Task> pending_;

    std::mutex updates_mutex_;
    std::condition_variable updates_cv_;
    std::deque<Update> updates_;
};

} // namespace thumbgrid
