// =============================================================================
// Tree query
// =============================================================================

#include "hierarchy/tree_query.hpp"

#include <nlohmann/json.hpp>

namespace batdroid::hierarchy {

namespace {

void collect(const std::vector<UiElement>& elements, const Selector& selector,
             std::vector<const UiElement*>& out) {
    for (const auto& el : elements) {
        if (matches(el, selector)) {
            out.push_back(&el);
        }
        collect(el.children, selector, out);
    }
}

std::string summarize(size_t index, const UiElement& el) {
    const Rect& b = el.bounds;
    return "[" + std::to_string(index) + "] class=" + el.class_name +
           " text=\"" + el.text + "\" bounds=[" +
           std::to_string(b.x) + "," + std::to_string(b.y) + "," +
           std::to_string(b.width) + "x" + std::to_string(b.height) + "]";
}

} // namespace

std::string short_resource_id(const std::string& resource_id) {
    size_t slash = resource_id.rfind('/');
    if (slash == std::string::npos) return resource_id;
    return resource_id.substr(slash + 1);
}

bool matches(const UiElement& element, const Selector& selector) {
    if (selector.resource_id) {
        const std::string& want = *selector.resource_id;
        if (element.resource_id != want && short_resource_id(element.resource_id) != want) {
            return false;
        }
    }
    if (selector.text && element.text != *selector.text) {
        return false;
    }
    if (selector.content_desc && element.content_desc != *selector.content_desc) {
        return false;
    }
    return true;
}

std::vector<const UiElement*> find_elements(const Forest& roots, const Selector& selector) {
    std::vector<const UiElement*> out;
    collect(roots, selector, out);
    return out;
}

Result<const UiElement*> select_match(const std::vector<const UiElement*>& matches,
                                      std::optional<size_t> index) {
    if (matches.empty()) {
        return Err<const UiElement*>("No element found", errc::kNotFound);
    }

    if (matches.size() > 1 && !index) {
        std::string msg = "Multiple elements match (" + std::to_string(matches.size()) +
                          "). Specify index:";
        for (size_t i = 0; i < matches.size(); ++i) {
            msg += "\n" + summarize(i, *matches[i]);
        }
        return Err<const UiElement*>(msg, errc::kAmbiguous);
    }

    size_t chosen = index.value_or(0);
    if (chosen >= matches.size()) {
        return Err<const UiElement*>("Index " + std::to_string(chosen) + " out of range (" +
                                     std::to_string(matches.size()) + " matches)",
                                     errc::kInvalidArgument);
    }
    return matches[chosen];
}

std::string describe_selector(const Selector& selector) {
    nlohmann::json j = nlohmann::json::object();
    if (selector.resource_id) j["resource_id"] = *selector.resource_id;
    if (selector.text) j["text"] = *selector.text;
    if (selector.content_desc) j["content_desc"] = *selector.content_desc;
    // selector values come from the command line and may not be UTF-8
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Selector drop_empty_fields(const Selector& selector) {
    Selector out;
    if (selector.resource_id && !selector.resource_id->empty()) out.resource_id = selector.resource_id;
    if (selector.text && !selector.text->empty()) out.text = selector.text;
    if (selector.content_desc && !selector.content_desc->empty()) out.content_desc = selector.content_desc;
    return out;
}

} // namespace batdroid::hierarchy
