#pragma once
// =============================================================================
// UiElement - one node of a parsed uiautomator dump
// =============================================================================
// Strict tree: a node owns its children by value, there is no parent link.
// Depth and sibling index exist only during traversal.
// =============================================================================

#include <string>
#include <vector>
#include <optional>

namespace batdroid::hierarchy {

// Screen rectangle. width/height come straight from right-left / bottom-top
// and stay negative for inverted source rectangles.
struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Rect& o) const { return !(*this == o); }
};

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
};

struct UiElement {
    std::string resource_id;
    std::string text;
    std::string content_desc;
    std::string class_name;
    std::string package;
    Rect bounds;
    bool clickable = false;
    bool enabled = false;
    bool scrollable = false;
    std::vector<UiElement> children;
};

// Scalar fields only; the subtree is not copied
inline UiElement copy_without_children(const UiElement& el) {
    UiElement out;
    out.resource_id = el.resource_id;
    out.text = el.text;
    out.content_desc = el.content_desc;
    out.class_name = el.class_name;
    out.package = el.package;
    out.bounds = el.bounds;
    out.clickable = el.clickable;
    out.enabled = el.enabled;
    out.scrollable = el.scrollable;
    return out;
}

// A dump may carry several top-level nodes
using Forest = std::vector<UiElement>;

// Absent fields match anything
struct Selector {
    std::optional<std::string> resource_id;
    std::optional<std::string> text;
    std::optional<std::string> content_desc;

    bool empty() const { return !resource_id && !text && !content_desc; }
};

// Pre-order record produced by flatten_hierarchy(); element.children is empty
struct FlatElement {
    UiElement element;
    int depth = 0;
};

} // namespace batdroid::hierarchy
