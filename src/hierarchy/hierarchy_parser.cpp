// =============================================================================
// HierarchyParser
// =============================================================================

#include "hierarchy/hierarchy_parser.hpp"
#include "hierarchy/bounds.hpp"
#include "batdroid_log.hpp"

#include <cctype>
#include <string_view>
#include <vector>
#include <utility>

static constexpr const char* TAG = "HierarchyParser";

namespace batdroid::hierarchy {

namespace {

constexpr std::string_view kOpenTag = "<node";
constexpr std::string_view kCloseTag = "</node>";

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// name="value" pairs of one tag, in document order. Values are verbatim.
using AttrList = std::vector<std::pair<std::string_view, std::string_view>>;

AttrList split_attributes(std::string_view attrs) {
    AttrList out;
    size_t i = 0;
    const size_t n = attrs.size();
    while (i < n) {
        while (i < n && is_space(attrs[i])) ++i;
        size_t name_begin = i;
        while (i < n && attrs[i] != '=' && !is_space(attrs[i])) ++i;
        std::string_view name = attrs.substr(name_begin, i - name_begin);

        if (i + 1 < n && attrs[i] == '=' && attrs[i + 1] == '"') {
            size_t value_begin = i + 2;
            size_t value_end = attrs.find('"', value_begin);
            if (value_end == std::string_view::npos) break;  // unterminated value
            out.emplace_back(name, attrs.substr(value_begin, value_end - value_begin));
            i = value_end + 1;
        } else {
            // not a name="value" pair: skip to the next separator
            while (i < n && !is_space(attrs[i])) ++i;
        }
    }
    return out;
}

// First occurrence wins; missing attribute -> ""
std::string_view find_attr(const AttrList& attrs, std::string_view name) {
    for (const auto& kv : attrs) {
        if (kv.first == name) return kv.second;
    }
    return {};
}

UiElement build_element(std::string_view raw_attrs) {
    AttrList attrs = split_attributes(raw_attrs);

    UiElement elem;
    elem.resource_id = std::string(find_attr(attrs, "resource-id"));
    elem.text = std::string(find_attr(attrs, "text"));
    elem.content_desc = std::string(find_attr(attrs, "content-desc"));
    elem.class_name = std::string(find_attr(attrs, "class"));
    elem.package = std::string(find_attr(attrs, "package"));
    elem.bounds = parse_bounds(std::string(find_attr(attrs, "bounds")));
    elem.clickable = find_attr(attrs, "clickable") == "true";
    elem.enabled = find_attr(attrs, "enabled") == "true";
    elem.scrollable = find_attr(attrs, "scrollable") == "true";
    return elem;
}

} // namespace

Forest parse_hierarchy_xml(const std::string& xml, ParseStats* stats) {
    Forest roots;
    ParseStats local;

    // Open nodes, innermost last. Each entry points at the last element of
    // its parent's children (or of roots). Only the top entry's children
    // grow while it is open, so no entry is invalidated by a push_back.
    std::vector<UiElement*> stack;

    const std::string_view doc(xml);
    size_t pos = 0;

    while ((pos = doc.find('<', pos)) != std::string_view::npos) {
        if (doc.compare(pos, kCloseTag.size(), kCloseTag) == 0) {
            if (stack.empty()) {
                ++local.stray_closers;
                BLOG_DEBUG(TAG, "stray </node> at offset %zu ignored", pos);
            } else {
                stack.pop_back();
            }
            pos += kCloseTag.size();
            continue;
        }

        // "<node" must end at whitespace, '/' or '>' (so <nodes ...> is skipped)
        size_t after_name = pos + kOpenTag.size();
        if (doc.compare(pos, kOpenTag.size(), kOpenTag) != 0 || after_name >= doc.size() ||
            !(is_space(doc[after_name]) || doc[after_name] == '/' || doc[after_name] == '>')) {
            ++pos;  // <hierarchy>, <?xml ...?>, </hierarchy> and anything else
            continue;
        }

        size_t gt = doc.find('>', after_name);
        if (gt == std::string_view::npos) break;  // truncated tag at end of input

        std::string_view body = doc.substr(after_name, gt - after_name);
        bool self_closing = !body.empty() && body.back() == '/';
        if (self_closing) body.remove_suffix(1);

        UiElement elem = build_element(body);
        ++local.node_count;

        UiElement* placed = nullptr;
        if (!stack.empty()) {
            stack.back()->children.push_back(std::move(elem));
            placed = &stack.back()->children.back();
        } else {
            roots.push_back(std::move(elem));
            placed = &roots.back();
        }

        if (!self_closing) {
            stack.push_back(placed);
        }
        pos = gt + 1;
    }

    local.unclosed_nodes = stack.size();
    if (local.stray_closers > 0 || local.unclosed_nodes > 0) {
        BLOG_DEBUG(TAG, "unbalanced dump: %zu stray closers, %zu unclosed nodes",
                   local.stray_closers, local.unclosed_nodes);
    }
    BLOG_TRACE(TAG, "parsed %zu nodes, %zu roots", local.node_count, roots.size());

    if (stats) *stats = local;
    return roots;
}

} // namespace batdroid::hierarchy
