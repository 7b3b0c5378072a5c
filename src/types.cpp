#include "types.hpp"
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace thumbgrid {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

void GridConfig::validate() const {
    if (rows < 1 || columns < 1) {
        throw std::invalid_argument("Grid needs at least one row and one column");
    }
    if (target_width < 1) {
        throw std::invalid_argument("Target width must be positive");
    }
}

std::string to_string(AspectMode mode) {
    switch (mode) {
        case AspectMode::Fill: return "Fill";
        case AspectMode::Fit: return "Fit";
        case AspectMode::Source: return "Source";
    }
    return "Fill";
}

std::string to_string(BackgroundTheme theme) {
    return theme == BackgroundTheme::White ? "White" : "Black";
}

AspectMode parse_aspect_mode(const std::string& value) {
    const std::string v = lowercase(value);
    if (v == "fill") return AspectMode::Fill;
    if (v == "fit") return AspectMode::Fit;
    if (v == "source") return AspectMode::Source;
    throw std::invalid_argument("Unknown aspect mode: " + value);
}

BackgroundTheme parse_background_theme(const std::string& value) {
    const std::string v = lowercase(value);
    if (v == "black") return BackgroundTheme::Black;
    if (v == "white") return BackgroundTheme::White;
    throw std::invalid_argument("Unknown background theme: " + value);
}

} // namespace thumbgrid
