// =============================================================================
// Tree renderers
// =============================================================================

#include "hierarchy/tree_render.hpp"
#include "hierarchy/tree_query.hpp"

namespace batdroid::hierarchy {

namespace {

constexpr const char* kPlatformPrefixes[] = {
    "android.widget.",
    "android.view.",
    "android.webkit.",
};

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

void walk_compact(const std::vector<UiElement>& elements, int depth, int max_depth,
                  std::string& out) {
    if (depth > max_depth) return;
    for (const auto& el : elements) {
        if (!out.empty()) out += '\n';
        out.append(static_cast<size_t>(depth) * 2, ' ');
        out += format_compact_line(el);
        walk_compact(el.children, depth + 1, max_depth, out);
    }
}

void walk_flat(const std::vector<UiElement>& elements, int depth, int max_depth,
               std::vector<FlatElement>& out) {
    if (depth > max_depth) return;
    for (const auto& el : elements) {
        FlatElement rec;
        rec.element = copy_without_children(el);
        rec.depth = depth;
        out.push_back(std::move(rec));
        walk_flat(el.children, depth + 1, max_depth, out);
    }
}

} // namespace

std::string shorten_class_name(const std::string& class_name) {
    for (const char* prefix : kPlatformPrefixes) {
        std::string p(prefix);
        if (starts_with(class_name, p)) return class_name.substr(p.size());
    }
    if (starts_with(class_name, "androidx.")) {
        return class_name.substr(class_name.rfind('.') + 1);
    }
    return class_name;
}

std::string format_compact_line(const UiElement& el) {
    std::string line = shorten_class_name(el.class_name);

    if (!el.text.empty()) line += " \"" + el.text + "\"";

    const Rect& b = el.bounds;
    line += " [" + std::to_string(b.x) + "," + std::to_string(b.y) + " " +
            std::to_string(b.width) + "x" + std::to_string(b.height) + "]";

    if (!el.resource_id.empty()) line += " id:" + short_resource_id(el.resource_id);
    if (!el.content_desc.empty()) line += " desc:\"" + el.content_desc + "\"";
    if (el.clickable) line += " [clickable]";
    if (el.scrollable) line += " [scrollable]";
    return line;
}

std::string format_compact_tree(const Forest& roots, int max_depth) {
    std::string out;
    walk_compact(roots, 0, max_depth, out);
    return out;
}

std::vector<FlatElement> flatten_hierarchy(const Forest& roots, int max_depth) {
    std::vector<FlatElement> out;
    walk_flat(roots, 0, max_depth, out);
    return out;
}

} // namespace batdroid::hierarchy
