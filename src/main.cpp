#include "config.hpp"
#include "frame_cache.hpp"
#include "pipeline_scheduler.hpp"
#include "signal_watcher.hpp"
#include "video_asset.hpp"
#include "video_collection.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] PATH...\n"
              << "Each PATH is a video (mp4, m4v, mov) or a directory to scan.\n"
              << "Options:\n"
              << "  -r, --rows NUM           Grid rows (default: 4)\n"
              << "  -c, --columns NUM        Grid columns (default: 4)\n"
              << "  -w, --width NUM          Output width in pixels (default: 1920)\n"
              << "  --aspect MODE            Fill, Fit or Source (default: Fill)\n"
              << "  --theme THEME            Black or White (default: Black)\n"
              << "  --no-timestamps          Do not draw frame timestamps\n"
              << "  -j, --max-concurrent NUM Videos processed at once, 1-10 (default: 2)\n"
              << "  -o, --output-dir DIR     Write grids here instead of next to each video\n"
              << "  --cache-dir DIR          Frame cache location\n"
              << "  --no-cache               Disable the frame cache\n"
              << "  --config FILE            Load settings from a JSON file\n"
              << "  --summary FILE           Write a JSON run summary\n"
              << "  --info                   Print video information only\n"
              << "  -h, --help               Show this help\n";
}

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
}

// Flags given on the command line; each one overrides the config file.
struct CommandLine {
    std::vector<std::string> inputs;
    std::optional<std::string> config_file;
    std::optional<std::string> summary_file;
    std::optional<int> rows;
    std::optional<int> columns;
    std::optional<int> width;
    std::optional<std::string> aspect;
    std::optional<std::string> theme;
    std::optional<int> max_concurrent;
    std::optional<std::string> output_dir;
    std::optional<std::string> cache_dir;
    bool no_timestamps = false;
    bool no_cache = false;
    bool info_only = false;
    bool help = false;
};

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cli;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (++i >= argc) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return argv[i];
        };

        if (arg == "-r" || arg == "--rows") {
            cli.rows = parse_int(arg, value());
        } else if (arg == "-c" || arg == "--columns") {
            cli.columns = parse_int(arg, value());
        } else if (arg == "-w" || arg == "--width") {
            cli.width = parse_int(arg, value());
        } else if (arg == "--aspect") {
            cli.aspect = value();
        } else if (arg == "--theme") {
            cli.theme = value();
        } else if (arg == "--no-timestamps") {
            cli.no_timestamps = true;
        } else if (arg == "-j" || arg == "--max-concurrent") {
            cli.max_concurrent = parse_int(arg, value());
        } else if (arg == "-o" || arg == "--output-dir") {
            cli.output_dir = value();
        } else if (arg == "--cache-dir") {
            cli.cache_dir = value();
        } else if (arg == "--no-cache") {
            cli.no_cache = true;
        } else if (arg == "--config") {
            cli.config_file = value();
        } else if (arg == "--summary") {
            cli.summary_file = value();
        } else if (arg == "--info") {
            cli.info_only = true;
        } else if (arg == "-h" || arg == "--help") {
            cli.help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            cli.inputs.push_back(arg);
        }
    }

    return cli;
}

thumbgrid::AppConfig build_config(const CommandLine& cli) {
    thumbgrid::AppConfig config = cli.config_file ? thumbgrid::AppConfig::load(*cli.config_file)
                                                  : thumbgrid::AppConfig();

    if (cli.rows) config.grid.rows = *cli.rows;
    if (cli.columns) config.grid.columns = *cli.columns;
    if (cli.width) config.grid.target_width = *cli.width;
    if (cli.aspect) config.grid.aspect_mode = thumbgrid::parse_aspect_mode(*cli.aspect);
    if (cli.theme) config.grid.background_theme = thumbgrid::parse_background_theme(*cli.theme);
    if (cli.no_timestamps) config.grid.show_timestamps = false;
    if (cli.max_concurrent) config.scheduler.max_concurrency = *cli.max_concurrent;
    if (cli.output_dir) config.output_folder = *cli.output_dir;
    if (cli.cache_dir) config.cache_directory = *cli.cache_dir;
    if (cli.no_cache) config.use_cache = false;

    config.validate();
    return config;
}

json video_info_json(thumbgrid::OpenCvVideoAsset& asset, const std::string& path) {
    thumbgrid::VideoInfo info = asset.info(path);

    json info_json;
    info_json["video_path"] = path;
    info_json["total_frames"] = info.total_frames;
    info_json["fps"] = info.fps;
    info_json["duration"] = info.duration;
    info_json["frame_size"] = {info.frame_size.width, info.frame_size.height};
    info_json["display_size"] = {info.display_size.width, info.display_size.height};
    info_json["rotation"] = info.rotation;
    info_json["codec"] = info.codec;
    return info_json;
}

json summary_json(const thumbgrid::RunSummary& summary,
                  const std::vector<thumbgrid::VideoJob>& jobs,
                  const thumbgrid::AppConfig& config) {
    json output_json;
    output_json["completed"] = summary.completed;
    output_json["cancelled"] = summary.cancelled;
    output_json["failed"] = summary.failed;
    output_json["last_output_path"] = summary.last_output_path ? json(*summary.last_output_path) : json(nullptr);
    output_json["elapsed_seconds"] = summary.elapsed_seconds;
    output_json["config"] = config.to_json();

    json jobs_json = json::array();
    for (const auto& job : jobs) {
        json job_json;
        job_json["source_path"] = job.source_path;
        job_json["state"] = thumbgrid::to_string(job.state);
        job_json["status"] = job.status;
        job_json["progress"] = job.progress;
        job_json["output_path"] = job.output_path;
        job_json["from_cache"] = job.from_cache;
        if (!job.error.empty()) {
            job_json["error"] = job.error;
        }
        jobs_json.push_back(job_json);
    }
    output_json["jobs"] = jobs_json;
    return output_json;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Must run before any other thread exists so the mask is inherited.
    // Until a scheduler is bound, an interrupt exits with 128 + signal.
    thumbgrid::SignalWatcher signal_watcher;

    CommandLine cli;
    thumbgrid::AppConfig config;
    try {
        cli = parse_command_line(argc, argv);
        if (cli.help) {
            print_usage(argv[0]);
            return 0;
        }
        config = build_config(cli);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::vector<std::string> videos = thumbgrid::collect_videos(cli.inputs);
    if (videos.empty()) {
        std::cerr << "Error: No video files to process" << std::endl;
        return 1;
    }

    try {
        auto asset = std::make_shared<thumbgrid::OpenCvVideoAsset>();

        if (cli.info_only) {
            json info_json = json::array();
            for (const auto& path : videos) {
                info_json.push_back(video_info_json(*asset, path));
            }
            std::cout << (videos.size() == 1 ? info_json[0] : info_json).dump(2) << std::endl;
            return 0;
        }

        std::shared_ptr<thumbgrid::FrameCache> cache;
        if (config.use_cache) {
            cache = std::make_shared<thumbgrid::FrameCache>(config.cache_directory);
        }

        auto pipeline = std::make_shared<thumbgrid::GridPipeline>(
            asset, cache, config.sampler, config.selection, config.metrics);
        thumbgrid::PipelineScheduler scheduler(pipeline, config.scheduler);
        scheduler.add_jobs(videos);

        thumbgrid::ScopedSignalHandler interrupt_handler(signal_watcher, [&scheduler](int) {
            std::cerr << "\nInterrupted, cancelling remaining jobs..." << std::endl;
            scheduler.cancel_all();
        });

        std::map<std::uint32_t, std::string> last_status;
        auto on_progress = [&](const thumbgrid::ProgressEvent& event) {
            std::string& previous = last_status[event.id.index];
            if (previous == event.status) {
                return;
            }
            previous = event.status;
            std::cout << "[" << std::setw(3) << static_cast<int>(event.progress * 100.0) << "%] "
                      << std::filesystem::path(event.source_path).filename().string()
                      << ": " << event.status << std::endl;
        };

        thumbgrid::RunSummary summary = scheduler.run(config.grid, config.output_folder, on_progress);

        if (cache) {
            cache->wait_for_pending_writes();
            thumbgrid::CacheStats stats = cache->stats();
            std::cout << "Cache: " << stats.hits << " hits, " << stats.misses << " misses, "
                      << stats.writes << " writes" << std::endl;
        }

        if (summary.last_output_path) {
            std::cout << "Last grid: " << *summary.last_output_path << std::endl;
        }

        if (cli.summary_file) {
            std::ofstream file(*cli.summary_file);
            file << summary_json(summary, scheduler.jobs(), config).dump(2);
            if (!file) {
                std::cerr << "Error: Cannot write summary to " << *cli.summary_file << std::endl;
                return 1;
            }
            std::cout << "Summary saved to: " << *cli.summary_file << std::endl;
        }

        if (summary.failed > 0) {
            return 1;
        }
        return summary.cancelled > 0 ? 130 : 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
