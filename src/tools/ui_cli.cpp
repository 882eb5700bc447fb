// =============================================================================
// batdroid_ui command line
// =============================================================================

#include "tools/ui_cli.hpp"
#include "hierarchy/tree_query.hpp"
#include "hierarchy/tree_render.hpp"
#include "hierarchy/hierarchy_json.hpp"
#include "batdroid_log.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>

static constexpr const char* TAG = "cli";

namespace batdroid::cli {

using namespace batdroid::hierarchy;

namespace {

Result<int> parse_int(const std::string& option, const std::string& s) {
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || v < 0 || v > 1000000000L) {
        return Err<int>("invalid value for " + option + ": " + s, errc::kInvalidArgument);
    }
    return static_cast<int>(v);
}

void set_field(std::optional<std::string>& field, const std::string& value) {
    if (!value.empty()) field = value;
}

void print_json(std::ostream& out, const nlohmann::json& j) {
    // Dumps may carry invalid UTF-8 in text attributes
    out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void report_error(const Error& e) {
    BLOG_ERROR(TAG, "%s [%s]", e.message.c_str(), errc::name(e.code));
}

} // namespace

Result<CliArgs> parse_args(const std::vector<std::string>& argv) {
    CliArgs args;
    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& a = argv[i];
        auto value = [&]() -> Result<std::string> {
            if (i + 1 >= argv.size()) {
                return Err<std::string>("missing value for " + a, errc::kInvalidArgument);
            }
            return argv[++i];
        };

        if (a == "--config") {
            args.config_path = BATDROID_TRY(value());
            args.config_given = true;
        } else if (a == "--device") {
            args.device_id = BATDROID_TRY(value());
        } else if (a == "--input") {
            args.input_path = BATDROID_TRY(value());
        } else if (a == "--timeout") {
            std::string v = BATDROID_TRY(value());
            int n = BATDROID_TRY(parse_int(a, v));
            if (n == 0) return Err<CliArgs>("invalid value for --timeout: 0", errc::kInvalidArgument);
            args.timeout_ms = n;
        } else if (a == "--max-depth") {
            std::string v = BATDROID_TRY(value());
            args.max_depth = BATDROID_TRY(parse_int(a, v));
        } else if (a == "--index") {
            std::string v = BATDROID_TRY(value());
            args.index = static_cast<size_t>(BATDROID_TRY(parse_int(a, v)));
        } else if (a == "--resource-id") {
            set_field(args.selector.resource_id, BATDROID_TRY(value()));
        } else if (a == "--text") {
            set_field(args.selector.text, BATDROID_TRY(value()));
        } else if (a == "--content-desc") {
            set_field(args.selector.content_desc, BATDROID_TRY(value()));
        } else if (a == "--json") {
            args.json = true;
        } else if (a == "--flat") {
            args.flat = true;
            args.json = true;
        } else if (a == "--find") {
            args.find = true;
        } else if (a == "--tap") {
            args.tap = true;
        } else if (a == "--verbose") {
            args.verbose = true;
        } else {
            return Err<CliArgs>("unknown option: " + a, errc::kInvalidArgument);
        }
    }

    if ((args.find || args.tap) && args.selector.empty()) {
        return Err<CliArgs>("--find/--tap need a non-empty --resource-id, --text or --content-desc",
                            errc::kInvalidArgument);
    }
    if (args.tap && !args.input_path.empty()) {
        return Err<CliArgs>("--tap needs a live device, not --input", errc::kInvalidArgument);
    }
    return args;
}

void print_usage(std::FILE* out) {
    std::fprintf(out,
        "usage: batdroid_ui [--config FILE] [--device ID] [--input FILE] [--timeout MS]\n"
        "                   [--json] [--flat] [--max-depth N] [--find] [--tap] [--index N]\n"
        "                   [--resource-id ID] [--text T] [--content-desc D] [--verbose]\n");
}

Result<Forest> load_forest(const CliArgs& args, UiHierarchyCapture& capture, int timeout_ms) {
    if (!args.input_path.empty()) {
        std::ifstream file(args.input_path, std::ios::binary);
        if (!file) {
            return Err<Forest>("cannot open " + args.input_path, errc::kInvalidArgument);
        }
        std::string raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        return parse_dump_output(raw).with_context(args.input_path);
    }
    CaptureOptions opts;
    opts.device_id = args.device_id;
    opts.timeout_ms = timeout_ms;
    return capture.capture(opts);
}

int run(const CliArgs& args, const config::AppConfig& cfg,
        UiHierarchyCapture& capture, std::ostream& out) {
    const int timeout_ms = args.timeout_ms > 0 ? args.timeout_ms : cfg.hierarchy.dump_timeout_ms;

    if (args.tap) {
        CaptureOptions opts;
        opts.device_id = args.device_id;
        opts.timeout_ms = timeout_ms;
        auto result = capture.tap_element(args.selector, args.index, opts);
        if (result.is_err()) {
            report_error(result.error());
            return kExitFailure;
        }
        const TapResult& r = result.value();
        print_json(out, {
            {"success", true},
            {"element_found", {
                {"class", r.element.class_name},
                {"text", r.element.text},
                {"resource_id", r.element.resource_id},
            }},
            {"coordinates_tapped", {{"x", r.center.x}, {"y", r.center.y}}},
        });
        return kExitOk;
    }

    auto forest = load_forest(args, capture, timeout_ms);
    if (forest.is_err()) {
        report_error(forest.error());
        return kExitFailure;
    }
    const Forest& roots = forest.value();

    if (args.find) {
        nlohmann::json arr = nlohmann::json::array();
        for (const UiElement* el : find_elements(roots, args.selector)) {
            arr.push_back(*el);
        }
        print_json(out, arr);
        if (arr.empty()) {
            BLOG_WARN(TAG, "No element found matching %s", describe_selector(args.selector).c_str());
            return kExitFailure;
        }
    } else if (args.flat) {
        print_json(out, flat_to_json(flatten_hierarchy(
                            roots, args.max_depth.value_or(cfg.hierarchy.flat_max_depth))));
    } else if (args.json) {
        print_json(out, forest_to_json(roots));
    } else {
        out << format_compact_tree(roots, args.max_depth.value_or(cfg.hierarchy.compact_max_depth))
            << std::endl;
    }
    return kExitOk;
}

} // namespace batdroid::cli
