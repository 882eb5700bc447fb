#pragma once
// =============================================================================
// Tree renderers - read-only projections of a Forest
// =============================================================================
// format_compact_tree : one line per node, dense text for LLM / terminal use.
//                       Not meant to be parsed back.
// flatten_hierarchy   : pre-order records annotated with depth.
//
// Both omit nodes deeper than max_depth together with their subtrees
// (roots are depth 0).
// =============================================================================

#include <string>
#include <vector>

#include "ui_element.hpp"

namespace batdroid::hierarchy {

constexpr int kDefaultCompactMaxDepth = 15;
constexpr int kDefaultFlatMaxDepth = 20;

/// Strip android.widget. / android.view. / android.webkit.; reduce androidx.*
/// to the last dotted segment; anything else is returned unchanged.
std::string shorten_class_name(const std::string& class_name);

/// One node as a compact line, without indentation:
///   Class "text" [x,y wxh] id:short desc:"desc" [clickable] [scrollable]
std::string format_compact_line(const UiElement& element);

/// Two spaces of indentation per depth level, lines joined by '\n'
std::string format_compact_tree(const Forest& roots, int max_depth = kDefaultCompactMaxDepth);

std::vector<FlatElement> flatten_hierarchy(const Forest& roots, int max_depth = kDefaultFlatMaxDepth);

} // namespace batdroid::hierarchy
