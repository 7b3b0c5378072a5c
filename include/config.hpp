#pragma once

#include "distinctness_selector.hpp"
#include "frame_sampler.hpp"
#include "metric_computer.hpp"
#include "pipeline_scheduler.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace thumbgrid {

// Everything a run needs, loaded from an optional JSON file and then
// overridden from the command line.
struct AppConfig {
    GridConfig grid;
    SchedulerConfig scheduler;
    SamplerOptions sampler;
    SelectionOptions selection;
    MetricOptions metrics;
    std::optional<std::string> output_folder;
    std::filesystem::path cache_directory;
    bool use_cache = true;

    AppConfig();

    // Every key is optional; missing keys keep their defaults. Throws
    // std::invalid_argument on wrong types or unknown enum spellings.
    static AppConfig from_json(const nlohmann::json& doc);

    // Throws std::runtime_error when the file cannot be read or parsed.
    static AppConfig load(const std::filesystem::path& path);

    nlohmann::json to_json() const;

    // Throws std::invalid_argument on out-of-range values.
    void validate() const;
};

} // namespace thumbgrid
