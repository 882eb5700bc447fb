// =============================================================================
// JSON projection
// =============================================================================

#include "hierarchy/hierarchy_json.hpp"

namespace batdroid::hierarchy {

void to_json(nlohmann::json& j, const Rect& rect) {
    j = nlohmann::json{
        {"x", rect.x},
        {"y", rect.y},
        {"width", rect.width},
        {"height", rect.height},
    };
}

void to_json(nlohmann::json& j, const UiElement& element) {
    j = nlohmann::json::object();
    j["resource_id"] = element.resource_id;
    j["text"] = element.text;
    j["content_desc"] = element.content_desc;
    j["class"] = element.class_name;
    j["package"] = element.package;
    j["bounds"] = element.bounds;
    j["clickable"] = element.clickable;
    j["enabled"] = element.enabled;
    j["scrollable"] = element.scrollable;

    nlohmann::json children = nlohmann::json::array();
    for (const auto& child : element.children) {
        children.push_back(child);
    }
    j["children"] = std::move(children);
}

void to_json(nlohmann::json& j, const FlatElement& record) {
    to_json(j, record.element);
    j["depth"] = record.depth;
}

nlohmann::json forest_to_json(const Forest& roots) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& root : roots) arr.push_back(root);
    return arr;
}

nlohmann::json flat_to_json(const std::vector<FlatElement>& records) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& rec : records) arr.push_back(rec);
    return arr;
}

} // namespace batdroid::hierarchy
