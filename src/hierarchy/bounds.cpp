// =============================================================================
// Bounds codec
// =============================================================================

#include "hierarchy/bounds.hpp"

#include <cmath>
#include <regex>
#include <stdexcept>

namespace batdroid::hierarchy {

Rect parse_bounds(const std::string& bounds) {
    // [left,top][right,bottom], first occurrence anywhere in the value
    static const std::regex bounds_regex(R"(\[(\d+),(\d+)\]\[(\d+),(\d+)\])");
    std::smatch match;

    if (!std::regex_search(bounds, match, bounds_regex)) {
        return Rect{};
    }

    try {
        int left = std::stoi(match[1]);
        int top = std::stoi(match[2]);
        int right = std::stoi(match[3]);
        int bottom = std::stoi(match[4]);
        return Rect{left, top, right - left, bottom - top};
    } catch (const std::out_of_range&) {
        return Rect{};
    }
}

Point element_center(const Rect& b) {
    return Point{
        static_cast<int>(std::floor(b.x + b.width / 2.0 + 0.5)),
        static_cast<int>(std::floor(b.y + b.height / 2.0 + 0.5)),
    };
}

} // namespace batdroid::hierarchy
