#pragma once
// =============================================================================
// Tree query - selector search over a Forest
// =============================================================================

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

#include "ui_element.hpp"
#include "../result.hpp"

namespace batdroid::hierarchy {

/// "com.app:id/name" -> "name"; strings without '/' are returned unchanged
std::string short_resource_id(const std::string& resource_id);

/// True when every field present in the selector holds for the element.
/// resource_id matches the raw id or its short form; text and content_desc
/// are exact comparisons.
bool matches(const UiElement& element, const Selector& selector);

/// Pre-order search of the whole forest. Nested matches are all reported.
/// Pointers stay valid as long as the forest is not modified.
std::vector<const UiElement*> find_elements(const Forest& roots, const Selector& selector);

/// Pick one match for an action.
///   no match                    -> errc::kNotFound
///   several matches, no index   -> errc::kAmbiguous (message lists candidates)
///   index >= matches.size()     -> errc::kInvalidArgument
Result<const UiElement*> select_match(const std::vector<const UiElement*>& matches,
                                      std::optional<size_t> index);

/// Selector as a JSON object, e.g. {"resource_id":"ok"}.
/// Invalid UTF-8 in a value is replaced with U+FFFD; never throws.
std::string describe_selector(const Selector& selector);

/// Copy of the selector where fields holding "" are absent
Selector drop_empty_fields(const Selector& selector);

} // namespace batdroid::hierarchy
