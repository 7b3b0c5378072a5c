#include "video_collection.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace thumbgrid {

namespace {

bool is_hidden(const fs::path& path) {
    const std::string name = path.filename().string();
    return !name.empty() && name[0] == '.';
}

void walk_directory(const fs::path& directory, std::vector<fs::path>& found) {
    std::vector<fs::path> children;
    std::error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        std::cerr << "Cannot read directory " << directory << ": " << ec.message() << std::endl;
    }

    std::sort(children.begin(), children.end());
    for (const auto& child : children) {
        if (is_hidden(child)) {
            continue;
        }
        std::error_code status_ec;
        if (fs::is_directory(child, status_ec)) {
            walk_directory(child, found);
        } else if (fs::is_regular_file(child, status_ec) && is_supported_video(child)) {
            found.push_back(child);
        }
    }
}

} // namespace

bool is_supported_video(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".mp4" || ext == ".m4v" || ext == ".mov";
}

std::vector<std::string> collect_videos(const std::vector<std::string>& inputs) {
    std::vector<std::string> videos;
    std::set<std::string> seen;

    auto add = [&](const fs::path& path) {
        std::error_code ec;
        fs::path absolute = fs::absolute(path, ec);
        std::string key = (ec ? path : absolute).lexically_normal().string();
        if (seen.insert(key).second) {
            videos.push_back(path.string());
        }
    };

    for (const auto& input : inputs) {
        fs::path path(input);
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            std::vector<fs::path> found;
            walk_directory(path, found);
            if (found.empty()) {
                std::cerr << "No videos found in " << input << std::endl;
            }
            for (const auto& video : found) {
                add(video);
            }
        } else if (!fs::exists(path, ec)) {
            std::cerr << "Skipping missing path: " << input << std::endl;
        } else if (!is_supported_video(path)) {
            std::cerr << "Skipping unsupported file: " << input << std::endl;
        } else {
            add(path);
        }
    }

    return videos;
}

} // namespace thumbgrid
