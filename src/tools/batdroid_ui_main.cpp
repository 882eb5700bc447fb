// =============================================================================
// batdroid_ui - dump, search and tap the UI hierarchy of an Android device
// =============================================================================
// Usage:
//   batdroid_ui [options]
//     --config FILE        config file (default batdroid.json, else
//                          ~/.config/batdroid/batdroid.json); an explicit
//                          file that cannot be loaded is an error
//     --device ID          adb device serial
//     --input FILE         parse a saved dump instead of running adb
//     --timeout MS         dump timeout
//     --json               full JSON tree instead of compact text
//     --flat               flat JSON list with depth (implies --json)
//     --max-depth N        depth limit for compact / flat output
//     --find               print elements matching the selector as JSON
//     --tap                tap the element matching the selector
//     --index N            pick one of several matches (with --tap)
//     --resource-id ID | --text T | --content-desc D   selector fields
//     --verbose            debug logging
// Exit codes: 0 ok, 1 runtime error, 2 usage error
// =============================================================================

#include "tools/ui_cli.hpp"
#include "adb/adb_client.hpp"
#include "hierarchy/ui_hierarchy_capture.hpp"
#include "config_loader.hpp"
#include "batdroid_log.hpp"

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

using namespace batdroid;

static constexpr const char* TAG = "main";

int main(int argc, char* argv[]) {
    auto parsed = cli::parse_args(std::vector<std::string>(argv + 1, argv + argc));
    if (parsed.is_err()) {
        std::fprintf(stderr, "%s\n", parsed.error().message.c_str());
        cli::print_usage(stderr);
        return cli::kExitUsage;
    }
    const cli::CliArgs& args = parsed.value();

    config::AppConfig cfg;
    if (args.config_given) {
        auto loaded = config::loadConfigFile(args.config_path);
        if (loaded.is_err()) {
            BLOG_ERROR(TAG, "%s", loaded.error().message.c_str());
            return cli::kExitFailure;
        }
        cfg = loaded.value();
    } else {
        cfg = config::loadConfig(args.config_path);
    }

    log::Level level = log::Level::Info;
    if (!log::parseLevel(cfg.log.level, level)) {
        BLOG_WARN(TAG, "unknown log level '%s', using info", cfg.log.level.c_str());
    }
    if (args.verbose) level = log::Level::Debug;
    log::setLogLevel(level);
    if (!cfg.log.log_path.empty() && !log::openLogFile(cfg.log.log_path.c_str())) {
        BLOG_WARN(TAG, "cannot open log file %s", cfg.log.log_path.c_str());
    }
    BLOG_DEBUG(TAG, "batdroid_ui starting (adb=%s)", cfg.adb.adb_path.c_str());

    adb::AdbClient adb(cfg.adb.adb_path, cfg.adb.default_timeout_ms, cfg.adb.max_output_bytes);
    hierarchy::UiHierarchyCapture capture(adb);

    int rc = cli::run(args, cfg, capture, std::cout);
    log::closeLogFile();
    return rc;
}
