#include "config.hpp"
#include "frame_cache.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace thumbgrid {

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

const json& section_or_empty(const json& doc, const char* name) {
    static const json empty = json::object();
    auto it = doc.find(name);
    if (it == doc.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("Config section '") + name + "' must be an object");
    }
    return *it;
}

} // namespace

AppConfig::AppConfig()
    : cache_directory(FrameCache::default_directory()) {}

AppConfig AppConfig::from_json(const json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("Config root must be a JSON object");
    }

    AppConfig config;
    try {
        const json& grid = section_or_empty(doc, "grid");
        read_key(grid, "rows", config.grid.rows);
        read_key(grid, "columns", config.grid.columns);
        read_key(grid, "target_width", config.grid.target_width);
        read_key(grid, "show_timestamps", config.grid.show_timestamps);
        if (grid.contains("aspect_mode")) {
            config.grid.aspect_mode = parse_aspect_mode(grid.at("aspect_mode").get<std::string>());
        }
        if (grid.contains("background_theme")) {
            config.grid.background_theme = parse_background_theme(grid.at("background_theme").get<std::string>());
        }

        const json& scheduler = section_or_empty(doc, "scheduler");
        read_key(scheduler, "max_concurrency", config.scheduler.max_concurrency);
        read_key(scheduler, "worker_threads", config.scheduler.worker_threads);

        const json& sampler = section_or_empty(doc, "sampler");
        read_key(sampler, "skip_fraction", config.sampler.skip_fraction);
        read_key(sampler, "oversample_factor", config.sampler.oversample_factor);
        read_key(sampler, "max_frame_width", config.sampler.max_frame_size.width);
        read_key(sampler, "max_frame_height", config.sampler.max_frame_size.height);
        read_key(sampler, "yield_every", config.sampler.yield_every);

        const json& selection = section_or_empty(doc, "selection");
        read_key(selection, "fast_path_max", config.selection.fast_path_max);
        read_key(selection, "min_brightness", config.selection.min_brightness);
        read_key(selection, "max_brightness", config.selection.max_brightness);
        read_key(selection, "min_color_variance", config.selection.min_color_variance);
        read_key(selection, "yield_every", config.selection.yield_every);

        const json& weights = section_or_empty(selection, "weights");
        read_key(weights, "brightness", config.selection.weights.brightness);
        read_key(weights, "color_variance", config.selection.weights.color_variance);
        read_key(weights, "edge_density", config.selection.weights.edge_density);
        read_key(weights, "histogram", config.selection.weights.histogram);

        const json& metrics = section_or_empty(doc, "metrics");
        read_key(metrics, "grid_size", config.metrics.grid_size);
        read_key(metrics, "edge_density", config.metrics.edge_density);
        read_key(metrics, "histogram", config.metrics.histogram);

        if (doc.contains("output_folder") && !doc.at("output_folder").is_null()) {
            config.output_folder = doc.at("output_folder").get<std::string>();
        }
        if (doc.contains("cache_directory") && !doc.at("cache_directory").is_null()) {
            config.cache_directory = doc.at("cache_directory").get<std::string>();
        }
        read_key(doc, "use_cache", config.use_cache);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid config value: ") + e.what());
    }

    return config;
}

AppConfig AppConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    json doc;
    try {
        file >> doc;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Cannot parse config file " + path.string() + ": " + e.what());
    }
    return from_json(doc);
}

json AppConfig::to_json() const {
    json doc;
    doc["grid"] = {
        {"rows", grid.rows},
        {"columns", grid.columns},
        {"target_width", grid.target_width},
        {"aspect_mode", to_string(grid.aspect_mode)},
        {"background_theme", to_string(grid.background_theme)},
        {"show_timestamps", grid.show_timestamps}
    };
    doc["scheduler"] = {
        {"max_concurrency", scheduler.max_concurrency},
        {"worker_threads", scheduler.worker_threads}
    };
    doc["sampler"] = {
        {"skip_fraction", sampler.skip_fraction},
        {"oversample_factor", sampler.oversample_factor},
        {"max_frame_width", sampler.max_frame_size.width},
        {"max_frame_height", sampler.max_frame_size.height},
        {"yield_every", sampler.yield_every}
    };
    doc["selection"] = {
        {"fast_path_max", selection.fast_path_max},
        {"min_brightness", selection.min_brightness},
        {"max_brightness", selection.max_brightness},
        {"min_color_variance", selection.min_color_variance},
        {"yield_every", selection.yield_every},
        {"weights", {
            {"brightness", selection.weights.brightness},
            {"color_variance", selection.weights.color_variance},
            {"edge_density", selection.weights.edge_density},
            {"histogram", selection.weights.histogram}
        }}
    };
    doc["metrics"] = {
        {"grid_size", metrics.grid_size},
        {"edge_density", metrics.edge_density},
        {"histogram", metrics.histogram}
    };
    doc["output_folder"] = output_folder ? json(*output_folder) : json(nullptr);
    doc["cache_directory"] = cache_directory.string();
    doc["use_cache"] = use_cache;
    return doc;
}

void AppConfig::validate() const {
    grid.validate();

    if (sampler.skip_fraction < 0.0 || sampler.skip_fraction >= 0.5) {
        throw std::invalid_argument("sampler.skip_fraction must be in [0, 0.5)");
    }
    if (sampler.oversample_factor < 1.0) {
        throw std::invalid_argument("sampler.oversample_factor must be at least 1");
    }
    if (sampler.max_frame_size.width < 1 || sampler.max_frame_size.height < 1) {
        throw std::invalid_argument("sampler max frame size must be positive");
    }
    if (sampler.yield_every < 1 || selection.yield_every < 1) {
        throw std::invalid_argument("yield_every must be at least 1");
    }
    if (selection.fast_path_max < 0) {
        throw std::invalid_argument("selection.fast_path_max must not be negative");
    }
    if (selection.min_brightness >= selection.max_brightness) {
        throw std::invalid_argument("selection brightness window is empty");
    }
    if (metrics.grid_size < 1) {
        throw std::invalid_argument("metrics.grid_size must be at least 1");
    }
}

} // namespace thumbgrid
