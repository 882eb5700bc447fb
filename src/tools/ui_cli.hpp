#pragma once
// =============================================================================
// batdroid_ui command line - argument parsing and command dispatch
// =============================================================================
// main() only wires config, logging and the adb client together; everything
// that decides what is printed and which exit code is returned lives here.
// =============================================================================

#include <cstdio>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "config_loader.hpp"
#include "hierarchy/ui_element.hpp"
#include "hierarchy/ui_hierarchy_capture.hpp"
#include "result.hpp"

namespace batdroid::cli {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliArgs {
    std::string config_path = "batdroid.json";
    bool config_given = false;   // --config seen: the file must load
    std::string device_id;
    std::string input_path;      // saved dump instead of a live device
    int timeout_ms = 0;          // 0: hierarchy.dump_timeout_ms from config
    std::optional<int> max_depth;
    bool json = false;
    bool flat = false;
    bool find = false;
    bool tap = false;
    bool verbose = false;
    std::optional<size_t> index;
    hierarchy::Selector selector;  // fields given as "" are left absent
};

/// Parse argv without the program name. Usage errors are errc::kInvalidArgument.
Result<CliArgs> parse_args(const std::vector<std::string>& args);

void print_usage(std::FILE* out);

/// Forest from --input (file) or from a live dump
Result<hierarchy::Forest> load_forest(const CliArgs& args,
                                      hierarchy::UiHierarchyCapture& capture,
                                      int timeout_ms);

/// Execute the command and write its output to out. Returns kExitOk or kExitFailure.
int run(const CliArgs& args, const config::AppConfig& cfg,
        hierarchy::UiHierarchyCapture& capture, std::ostream& out);

} // namespace batdroid::cli
