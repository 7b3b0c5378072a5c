#include "distinctness_selector.hpp"
#include "frame_extractor.hpp"
#include "grid_composer.hpp"
#include "metric_computer.hpp"
#include "pipeline_scheduler.hpp"
#include "video_asset.hpp"
#include <benchmark/benchmark.h>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>
#include <thread>

namespace thumbgrid {

class BenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        work_dir_ = std::filesystem::temp_directory_path() / "thumbgrid_benchmark";
        std::filesystem::create_directories(work_dir_);
        video_path_ = (work_dir_ / "benchmark_video.avi").string();

        if (!std::filesystem::exists(video_path_)) {
            create_synthetic_video();
        }
        asset_ = std::make_shared<OpenCvVideoAsset>();
        candidates_ = random_candidates(48);
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        asset_.reset();
    }

protected:
    void create_synthetic_video() {
        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
        if (!writer.open(video_path_, fourcc, 30.0, cv::Size(1280, 720))) {
            throw std::runtime_error("Failed to create benchmark video file");
        }

        std::mt19937 gen(42);
        std::uniform_int_distribution<> dis(0, 255);

        // 20 seconds at 30 fps; the palette changes every second.
        for (int i = 0; i < 600; ++i) {
            cv::Mat frame = cv::Mat::zeros(720, 1280, CV_8UC3);
            if (i % 30 == 0) {
                palette_ = cv::Scalar(dis(gen), dis(gen), dis(gen));
            }
            frame.setTo(palette_);
            for (int y = 0; y < frame.rows; y += 80) {
                for (int x = 0; x < frame.cols; x += 80) {
                    cv::rectangle(frame, cv::Point(x, y), cv::Point(x + 70, y + 70),
                                  cv::Scalar(dis(gen), dis(gen), dis(gen)), -1);
                }
            }

            int circle_x = (i * 5) % frame.cols;
            int circle_y = 300 + static_cast<int>(100 * std::sin(i * 0.1));
            cv::circle(frame, cv::Point(circle_x, circle_y), 50, cv::Scalar(255, 255, 255), -1);

            writer << frame;
        }
        writer.release();

        std::cout << "Created benchmark video: " << video_path_ << std::endl;
    }

    static std::vector<ExtractedFrame> random_candidates(int count) {
        std::vector<ExtractedFrame> frames;
        for (int i = 0; i < count; ++i) {
            cv::Mat image(270, 480, CV_8UC3);
            cv::randu(image, cv::Scalar(40, 40, 40), cv::Scalar(220, 220, 220));
            frames.push_back(ExtractedFrame{image, 1.0 + i});
        }
        return frames;
    }

    std::filesystem::path work_dir_;
    std::string video_path_;
    cv::Scalar palette_;
    std::shared_ptr<OpenCvVideoAsset> asset_;
    std::vector<ExtractedFrame> candidates_;
};

// Decode and select without the cache
BENCHMARK_DEFINE_F(BenchmarkFixture, FrameExtraction)(benchmark::State& state) {
    FrameExtractor extractor(asset_, nullptr);
    const int frame_count = static_cast<int>(state.range(0));

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto result = extractor.extract(video_path_, frame_count, CancellationToken());
        asset_->close(video_path_);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["frames"] = static_cast<double>(result.frames.size());
        state.counters["candidates"] = static_cast<double>(result.candidate_count);
    }
}

BENCHMARK_DEFINE_F(BenchmarkFixture, Metrics)(benchmark::State& state) {
    MetricOptions options;
    options.edge_density = state.range(0) != 0;
    options.histogram = state.range(0) != 0;
    MetricComputer computer(options);

    for (auto _ : state) {
        for (size_t i = 0; i < candidates_.size(); ++i) {
            benchmark::DoNotOptimize(computer.compute(candidates_[i].image, i));
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(candidates_.size()));
}

// Scoring path only; the fast path is disabled so small grids are scored too
BENCHMARK_DEFINE_F(BenchmarkFixture, Selection)(benchmark::State& state) {
    SelectionOptions options;
    options.fast_path_max = 0;
    DistinctnessSelector selector(options);
    const int count = static_cast<int>(state.range(0));

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto selected = selector.select(candidates_, count);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["selected"] = static_cast<double>(selected.size());
    }
}

BENCHMARK_DEFINE_F(BenchmarkFixture, Composition)(benchmark::State& state) {
    GridComposer composer(asset_, OutputPathResolver(work_dir_));
    GridConfig config;
    config.target_width = static_cast<int>(state.range(0));
    std::vector<ExtractedFrame> frames(candidates_.begin(), candidates_.begin() + config.frame_count());

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        cv::Mat canvas = composer.render(frames, video_path_, config);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["canvas_pixels"] = static_cast<double>(canvas.total());
    }
}

// Whole batch through the scheduler, varying the admission limit
BENCHMARK_DEFINE_F(BenchmarkFixture, BatchProcessing)(benchmark::State& state) {
    SchedulerConfig scheduler_config;
    scheduler_config.max_concurrency = static_cast<int>(state.range(0));
    const std::filesystem::path output_dir = work_dir_ / "grids";

    for (auto _ : state) {
        auto pipeline = std::make_shared<GridPipeline>(asset_, nullptr);
        PipelineScheduler scheduler(pipeline, scheduler_config);
        for (int i = 0; i < 4; ++i) {
            scheduler.add_job(video_path_);
        }

        auto start = std::chrono::high_resolution_clock::now();
        RunSummary summary = scheduler.run(GridConfig(), output_dir.string());
        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["completed"] = static_cast<double>(summary.completed);
        state.counters["avg_time_per_video"] = elapsed_seconds.count() / 4.0;
        state.counters["peak_in_use"] = static_cast<double>(scheduler.gate().peak_in_use());
    }

    std::error_code ec;
    std::filesystem::remove_all(output_dir, ec);
}

BENCHMARK_REGISTER_F(BenchmarkFixture, FrameExtraction)->Arg(9)->Arg(16)->Arg(36)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, Metrics)->Arg(0)->Arg(1)->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, Selection)->Arg(4)->Arg(16)->Arg(32)->UseManualTime()->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, Composition)->Arg(1280)->Arg(1920)->Arg(3840)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, BatchProcessing)->DenseRange(1, 4)->UseManualTime()->Unit(benchmark::kSecond);

} // namespace thumbgrid

int main(int argc, char** argv) {
    std::cout << "thumbgrid - Performance Benchmarks" << std::endl;
    std::cout << "==================================" << std::endl;
    std::cout << "System Information:" << std::endl;
    std::cout << "  CPU Cores: " << std::thread::hardware_concurrency() << std::endl;
    std::cout << "  OpenCV: " << CV_VERSION << std::endl;
    std::cout << std::endl;

    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    std::cout << std::endl << "Benchmark completed!" << std::endl;

    return 0;
}
