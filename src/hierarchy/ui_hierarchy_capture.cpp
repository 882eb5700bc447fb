// =============================================================================
// UiHierarchyCapture
// =============================================================================

#include "hierarchy/ui_hierarchy_capture.hpp"
#include "hierarchy/hierarchy_parser.hpp"
#include "hierarchy/tree_query.hpp"
#include "hierarchy/bounds.hpp"
#include "batdroid_log.hpp"

#include <regex>

static constexpr const char* TAG = "UiHierarchy";

namespace batdroid::hierarchy {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

std::string strip_dump_trailer(const std::string& raw) {
    // uiautomator prints "UI hierchary dumped to: /dev/tty" after the XML
    static const std::regex trailer(
        R"(UI hier(?:archy|chary|arcy) dumped to:[^\n]*\s*$)",
        std::regex::ECMAScript | std::regex::icase);

    std::smatch m;
    if (std::regex_search(raw, m, trailer)) {
        return trim(raw.substr(0, static_cast<size_t>(m.position(0))));
    }
    return trim(raw);
}

Result<Forest> parse_dump_output(const std::string& raw) {
    std::string xml = strip_dump_trailer(raw);

    if (xml.find("<hierarchy") == std::string::npos) {
        std::string excerpt = xml.substr(0, kDiagnosticExcerptChars);
        BLOG_WARN(TAG, "unexpected dump output (%zu bytes)", xml.size());
        return Err<Forest>("UIAutomator dump returned unexpected output: " + excerpt,
                           errc::kUnexpectedOutput);
    }

    ParseStats stats;
    Forest forest = parse_hierarchy_xml(xml, &stats);
    BLOG_DEBUG(TAG, "dump parsed: %zu nodes, %zu roots", stats.node_count, forest.size());
    return forest;
}

UiHierarchyCapture::UiHierarchyCapture(adb::AdbClient& adb) : adb_(adb) {}

Result<Forest> UiHierarchyCapture::capture(const CaptureOptions& opts) {
    adb::AdbOptions adb_opts;
    adb_opts.device_id = opts.device_id;
    adb_opts.timeout_ms = opts.timeout_ms > 0 ? opts.timeout_ms : kDefaultDumpTimeoutMs;

    auto forest = adb_.run({"exec-out", "uiautomator", "dump", "/dev/tty"}, adb_opts)
                      .and_then(parse_dump_output);
    if (forest.is_err()) {
        BLOG_ERROR(TAG, "dump failed: %s", forest.error().message.c_str());
    }
    return forest;
}

Result<TapResult> UiHierarchyCapture::tap_element(const Selector& requested,
                                                  std::optional<size_t> index,
                                                  const CaptureOptions& opts) {
    const Selector selector = drop_empty_fields(requested);
    if (selector.empty()) {
        return Err<TapResult>("at least one of resource_id, text, or content_desc must be provided",
                              errc::kInvalidArgument);
    }

    Forest forest = BATDROID_TRY(capture(opts));

    auto found = find_elements(forest, selector);
    auto chosen = select_match(found, index);
    if (chosen.is_err()) {
        const Error& e = chosen.error();
        std::string msg = e.code == errc::kNotFound
            ? "No element found matching " + describe_selector(selector)
            : e.message;
        return Err<TapResult>(msg, e.code);
    }

    const UiElement& target = *chosen.value();
    TapResult result;
    result.element = copy_without_children(target);
    result.center = element_center(target.bounds);

    adb::AdbOptions adb_opts;
    adb_opts.device_id = opts.device_id;
    auto tapped = adb_.tap(result.center.x, result.center.y, adb_opts);
    if (tapped.is_err()) return tapped.error();

    BLOG_INFO(TAG, "tapped %s \"%s\" at (%d, %d)",
              target.class_name.c_str(), target.text.c_str(),
              result.center.x, result.center.y);
    return result;
}

} // namespace batdroid::hierarchy
