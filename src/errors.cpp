#include "errors.hpp"
#include <cstdio>

namespace thumbgrid {

namespace {

std::string too_short_message(double duration_seconds) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "Video too short (%.2fs)", duration_seconds);
    return buffer;
}

} // namespace

VideoTooShortError::VideoTooShortError(double duration_seconds)
    : GridError(too_short_message(duration_seconds))
    , duration_(duration_seconds) {}

} // namespace thumbgrid
