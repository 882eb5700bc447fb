#pragma once
// =============================================================================
// HierarchyParser - uiautomator dump text -> Forest
// =============================================================================
// The dump grammar is flat: only <node ...> / <node .../> / </node> carry
// structure, attribute values never contain '>' and nodes have no text
// content. One left-to-right pass with an explicit stack of open nodes.
//
// Lenient by design of the input source:
//   - a stray </node> with nothing open is ignored
//   - a node left open at end of input stays attached to its parent
// Both cases are counted in ParseStats.
// =============================================================================

#include <string>
#include <cstddef>

#include "ui_element.hpp"

namespace batdroid::hierarchy {

struct ParseStats {
    size_t node_count = 0;
    size_t stray_closers = 0;
    size_t unclosed_nodes = 0;
};

/// Parse the dump body. Never fails; malformed structure degrades to the
/// best-effort tree described above.
Forest parse_hierarchy_xml(const std::string& xml, ParseStats* stats = nullptr);

} // namespace batdroid::hierarchy
