#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace thumbgrid {

// mp4, m4v and mov, compared case-insensitively.
bool is_supported_video(const std::filesystem::path& path);

// Expands each input into video files. Directories are walked recursively
// (sorted, hidden entries skipped); unsupported or missing inputs are
// reported on stderr and left out. Duplicates keep their first position.
std::vector<std::string> collect_videos(const std::vector<std::string>& inputs);

} // namespace thumbgrid
