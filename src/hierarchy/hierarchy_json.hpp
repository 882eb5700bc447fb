#pragma once
// =============================================================================
// JSON projection of a Forest (nlohmann/json ADL serializers)
// =============================================================================
// Element keys: resource_id, text, content_desc, class, package,
//               bounds{x,y,width,height}, clickable, enabled, scrollable,
//               children[]   (+ depth for FlatElement, whose children is [])
// =============================================================================

#include <nlohmann/json.hpp>

#include "ui_element.hpp"

namespace batdroid::hierarchy {

void to_json(nlohmann::json& j, const Rect& rect);
void to_json(nlohmann::json& j, const UiElement& element);
void to_json(nlohmann::json& j, const FlatElement& record);

nlohmann::json forest_to_json(const Forest& roots);
nlohmann::json flat_to_json(const std::vector<FlatElement>& records);

} // namespace batdroid::hierarchy
