#pragma once
// =============================================================================
// Bounds codec - "[left,top][right,bottom]" <-> Rect
// =============================================================================

#include <string>

#include "ui_element.hpp"

namespace batdroid::hierarchy {

/// Parse uiautomator bounds "[l,t][r,b]".
/// Returns {l, t, r-l, b-t}; the zero rect when the text does not match.
/// Never fails: a bad bounds attribute must not abort a dump parse.
Rect parse_bounds(const std::string& bounds);

/// Center of a rect, halves rounded up: (floor(x + w/2 + 0.5), floor(y + h/2 + 0.5))
Point element_center(const Rect& bounds);

inline Point element_center(const UiElement& element) {
    return element_center(element.bounds);
}

} // namespace batdroid::hierarchy
