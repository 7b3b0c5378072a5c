#include "pipeline_scheduler.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace thumbgrid {

namespace {

// Job progress allocation: decoding 0.1 -> 0.5, selection 0.5 -> 0.8.
constexpr double kLoadingProgress = 0.1;
constexpr double kSelectingProgress = 0.5;
constexpr double kSelectedProgress = 0.8;
constexpr double kComposingProgress = 0.85;

// The extractor reports decoding in [0, 0.5] and selection in [0.5, 1].
double job_progress(PipelinePhase phase, double fraction) {
    fraction = std::clamp(fraction, 0.0, 1.0);
    if (phase == PipelinePhase::Extracting) {
        return kLoadingProgress + std::min(fraction, 0.5) * 2.0 * (kSelectingProgress - kLoadingProgress);
    }
    return kSelectingProgress + (std::max(fraction, 0.5) - 0.5) * 2.0 * (kSelectedProgress - kSelectingProgress);
}

std::string display_name(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

} // namespace

int SchedulerConfig::effective_concurrency() const {
    return std::clamp(max_concurrency, 1, kMaxConcurrencyLimit);
}

int SchedulerConfig::effective_worker_threads() const {
    return worker_threads > 0 ? worker_threads : effective_concurrency();
}

// ---- GridPipeline ----

GridPipeline::GridPipeline(std::shared_ptr<VideoAsset> asset,
                           std::shared_ptr<FrameCache> cache,
                           const SamplerOptions& sampler_options,
                           const SelectionOptions& selection_options,
                           const MetricOptions& metric_options,
                           OutputPathResolver resolver)
    : asset_(asset)
    , extractor_(asset, std::move(cache), sampler_options, selection_options, metric_options)
    , composer_(asset, std::move(resolver)) {}

PipelineResult GridPipeline::run(const PipelineRequest& request,
                                 const CancellationToken& token,
                                 const PhaseCallback& on_phase) {
    // Decoder state for this source is dropped however the job ends.
    struct CloseOnExit {
        VideoAsset& asset;
        const std::string& path;
        ~CloseOnExit() { asset.close(path); }
    } close_on_exit{*asset_, request.source_path};

    auto notify = [&](PipelinePhase phase, double fraction) {
        if (on_phase) {
            on_phase(phase, fraction);
        }
    };

    ExtractionResult extraction = extractor_.extract(
        request.source_path, request.config.frame_count(), token,
        [&](ExtractionPhase phase, double fraction) {
            notify(phase == ExtractionPhase::Sampling ? PipelinePhase::Extracting
                                                      : PipelinePhase::Selecting,
                   fraction);
        });

    token.throw_if_cancelled();
    notify(PipelinePhase::Composing, 0.0);

    PipelineResult result;
    result.output_path = composer_.compose(extraction.frames, request.source_path,
                                           request.config, request.output_folder);
    result.frame_count = static_cast<int>(extraction.frames.size());
    result.from_cache = extraction.from_cache;
    return result;
}

// ---- PipelineScheduler ----

PipelineScheduler::PipelineScheduler(std::shared_ptr<JobPipeline> pipeline,
                                     const SchedulerConfig& config)
    : pipeline_(std::move(pipeline))
    , concurrency_(config.effective_concurrency())
    , worker_threads_(config.effective_worker_threads())
    , gate_(concurrency_) {
    if (!pipeline_) {
        throw std::invalid_argument("PipelineScheduler requires a pipeline");
    }
}

PipelineScheduler::~PipelineScheduler() = default;

JobId PipelineScheduler::add_job(const std::string& source_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.add(source_path);
}

std::vector<JobId> PipelineScheduler::add_jobs(const std::vector<std::string>& source_paths) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobId> ids;
    ids.reserve(source_paths.size());
    for (const auto& path : source_paths) {
        ids.push_back(table_.add(path));
    }
    return ids;
}

std::optional<VideoJob> PipelineScheduler::job(JobId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const VideoJob* found = table_.find(id)) {
        return *found;
    }
    return std::nullopt;
}

std::vector<VideoJob> PipelineScheduler::jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.jobs();
}

RunSummary PipelineScheduler::run(const GridConfig& config,
                                  const std::optional<std::string>& output_folder,
                                  const ProgressCallback& on_progress) {
    config.validate();

    std::size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            throw std::logic_error("PipelineScheduler::run is already in progress");
        }
        running_ = true;
        run_token_ = CancellationToken();
        gate_.reset();
        job_tokens_.clear();
        pending_.clear();

        for (const JobId& id : table_.order()) {
            const VideoJob* job = table_.find(id);
            if (job && job->state == JobState::Queued) {
                CancellationToken token = run_token_.child();
                job_tokens_.emplace_back(id, token);
                pending_.push_back(Task{id, job->source_path, token});
            }
        }
        remaining = pending_.size();
    }

    auto start = std::chrono::high_resolution_clock::now();
    std::cout << "Processing " << remaining << " videos with max "
              << concurrency_ << " concurrent" << std::endl;

    std::vector<std::thread> workers;
    std::deque<Update> batch;
    try {
        const int thread_count = std::min<int>(worker_threads_, static_cast<int>(remaining));
        workers.reserve(static_cast<size_t>(std::max(thread_count, 0)));
        for (int i = 0; i < thread_count; ++i) {
            workers.emplace_back(&PipelineScheduler::worker_loop, this, std::cref(config), std::cref(output_folder));
        }

        // Apply updates on this thread until every job is terminal.
        while (remaining > 0) {
            Update update = next_update(batch);
            bool finished = false;
            std::optional<ProgressEvent> event = apply(update, finished);
            if (finished) {
                --remaining;
            }
            if (event && on_progress) {
                on_progress(*event);
            }
        }
    } catch (...) {
        abandon_run(workers, batch, remaining, config, output_folder);
        throw;
    }

    for (auto& worker : workers) {
        worker.join();
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - start).count();

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    job_tokens_.clear();
    summary_.elapsed_seconds = elapsed;

    std::cout << "Run finished in " << elapsed << "s: " << summary_.completed << " complete, "
              << summary_.cancelled << " cancelled, " << summary_.failed << " failed" << std::endl;
    return summary_;
}

void PipelineScheduler::abandon_run(std::vector<std::thread>& workers, std::deque<Update>& batch,
                                    std::size_t remaining, const GridConfig& config,
                                    const std::optional<std::string>& output_folder) {
    std::cerr << "Run aborted, cancelling " << remaining << " unfinished jobs" << std::endl;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        run_token_.cancel();
    }
    gate_.cancel_all();

    // Tasks no worker has claimed yet are cancelled from this thread.
    worker_loop(config, output_folder);

    while (remaining > 0) {
        bool finished = false;
        apply(next_update(batch), finished);
        if (finished) {
            --remaining;
        }
    }

    for (auto& worker : workers) {
        worker.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    job_tokens_.clear();
}

PipelineScheduler::Update PipelineScheduler::next_update(std::deque<Update>& batch) {
    if (batch.empty()) {
        std::unique_lock<std::mutex> lock(updates_mutex_);
        updates_cv_.wait(lock, [this] { return !updates_.empty(); });
        batch.swap(updates_);
    }
    Update update = std::move(batch.front());
    batch.pop_front();
    return update;
}

void PipelineScheduler::worker_loop(const GridConfig& config,
                                    const std::optional<std::string>& output_folder) {
    for (;;) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.empty()) {
                return;
            }
            task = std::move(pending_.front());
            pending_.pop_front();
        }
        process(task, config, output_folder);
    }
}

void PipelineScheduler::process(const Task& task, const GridConfig& config,
                                const std::optional<std::string>& output_folder) {
    auto cancelled = [&] {
        post(Update{task.id, JobState::Cancelled, 0.0, "Cancelled"});
    };

    if (task.token.is_cancelled()) {
        cancelled();
        return;
    }

    std::optional<AdmissionGate::Slot> slot = gate_.acquire(task.token);
    if (!slot || task.token.is_cancelled()) {
        cancelled();
        return;
    }

    post(Update{task.id, JobState::Loading, kLoadingProgress, "Loading..."});

    try {
        PipelineRequest request{task.source_path, config, output_folder};

        PipelineResult result = pipeline_->run(request, task.token,
            [&](PipelinePhase phase, double fraction) {
                switch (phase) {
                    case PipelinePhase::Extracting:
                        post(Update{task.id, JobState::Extracting,
                                    job_progress(phase, fraction), "Extracting frames..."});
                        break;
                    case PipelinePhase::Selecting:
                        post(Update{task.id, JobState::Selecting,
                                    job_progress(phase, fraction), "Selecting frames..."});
                        break;
                    case PipelinePhase::Composing:
                        post(Update{task.id, JobState::Composing, kComposingProgress, "Compositing..."});
                        break;
                }
            });

        Update done{task.id, JobState::Complete, 1.0, "Complete"};
        done.output_path = result.output_path;
        done.from_cache = result.from_cache;
        post(std::move(done));
    } catch (const CancelledError&) {
        cancelled();
    } catch (const std::exception& e) {
        std::cerr << "Error processing " << display_name(task.source_path) << ": " << e.what() << std::endl;
        Update failed{task.id, JobState::Failed, 0.0, std::string("Error: ") + e.what()};
        failed.error = e.what();
        post(std::move(failed));
    }
}

void PipelineScheduler::post(Update update) {
    {
        std::lock_guard<std::mutex> lock(updates_mutex_);
        updates_.push_back(std::move(update));
    }
    updates_cv_.notify_one();
}

std::optional<ProgressEvent> PipelineScheduler::apply(const Update& update, bool& finished) {
    ProgressEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        VideoJob* job = table_.find(update.id);
        if (!job) {
            // Removed mid-run; still counts toward completion of the run.
            finished = is_terminal(update.state);
            return std::nullopt;
        }
        if (job->is_complete()) {
            return std::nullopt;
        }

        // Phases only move forward.
        if (is_terminal(update.state) || static_cast<int>(update.state) >= static_cast<int>(job->state)) {
            job->state = update.state;
            job->status = update.status;
        }
        job->progress = std::max(job->progress, update.progress);

        if (is_terminal(update.state)) {
            finished = true;
            switch (update.state) {
                case JobState::Complete:
                    job->output_path = update.output_path;
                    job->from_cache = update.from_cache;
                    ++summary_.completed;
                    summary_.last_output_path = update.output_path;
                    break;
                case JobState::Cancelled:
                    ++summary_.cancelled;
                    break;
                default:
                    job->error = update.error;
                    ++summary_.failed;
                    break;
            }
        }

        event.id = job->id;
        event.source_path = job->source_path;
        event.state = job->state;
        event.progress = job->progress;
        event.status = job->status;
    }
    return event;
}

bool PipelineScheduler::cancel_job(JobId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    VideoJob* job = table_.find(id);
    if (!job || job->is_complete()) {
        return false;
    }

    for (auto& entry : job_tokens_) {
        if (entry.first == id) {
            entry.second.cancel();
            gate_.interrupt();
            return true;
        }
    }

    // Not part of a run: a Queued job is cancelled on the spot.
    job->state = JobState::Cancelled;
    job->status = "Cancelled";
    ++summary_.cancelled;
    return true;
}

void PipelineScheduler::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        run_token_.cancel();
        gate_.cancel_all();
        return;
    }

    for (const JobId& id : table_.order()) {
        VideoJob* job = table_.find(id);
        if (job && !job->is_complete()) {
            job->state = JobState::Cancelled;
            job->status = "Cancelled";
            ++summary_.cancelled;
        }
    }
}

std::size_t PipelineScheduler::clear_completed() {
    std::lock_guard<std::mutex> lock(mutex_);
    // The counters belong to the run in progress until it returns.
    if (!running_) {
        summary_ = RunSummary();
    }
    return table_.clear_completed();
}

void PipelineScheduler::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        throw std::logic_error("Cannot clear jobs while a run is in progress");
    }
    table_.clear();
    summary_ = RunSummary();
}

RunSummary PipelineScheduler::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summary_;
}

bool PipelineScheduler::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

} // namespace thumbgrid
