#pragma once
// =============================================================================
// batdroid Config Loader
// =============================================================================
// Loads settings from batdroid.json with nlohmann/json. Every key is optional
// and a wrong-typed value falls back to its default.
// =============================================================================

#include <string>
#include <fstream>
#include <cstdint>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "batdroid_log.hpp"
#include "result.hpp"

namespace batdroid {
namespace config {

struct AdbConfig {
    std::string adb_path = "adb";
    int default_timeout_ms = 15000;
    int64_t max_output_bytes = 50LL * 1024 * 1024;
};

struct HierarchyConfig {
    int dump_timeout_ms = 10000;
    int compact_max_depth = 15;
    int flat_max_depth = 20;
};

struct LogConfig {
    std::string level = "info";
    std::string log_path;  // empty: stderr only
};

struct AppConfig {
    AdbConfig adb;
    HierarchyConfig hierarchy;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    if (!j.is_object()) return def;
    auto sec = j.find(section);
    if (sec == j.end() || !sec->is_object()) return def;
    auto it = sec->find(key);
    if (it == sec->end()) return def;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        BLOG_WARN("config", "%s.%s has wrong type, using default (%s)",
                  section.c_str(), key.c_str(), e.what());
        return def;
    }
}

inline AppConfig configFromJson(const nlohmann::json& j) {
    AppConfig config;
    const AppConfig def;

    config.adb.adb_path = jsonGet<std::string>(j, "adb", "adb_path", def.adb.adb_path);
    config.adb.default_timeout_ms = jsonGet<int>(j, "adb", "default_timeout_ms", def.adb.default_timeout_ms);
    config.adb.max_output_bytes = jsonGet<int64_t>(j, "adb", "max_output_bytes", def.adb.max_output_bytes);

    config.hierarchy.dump_timeout_ms = jsonGet<int>(j, "hierarchy", "dump_timeout_ms", def.hierarchy.dump_timeout_ms);
    config.hierarchy.compact_max_depth = jsonGet<int>(j, "hierarchy", "compact_max_depth", def.hierarchy.compact_max_depth);
    config.hierarchy.flat_max_depth = jsonGet<int>(j, "hierarchy", "flat_max_depth", def.hierarchy.flat_max_depth);

    config.log.level = jsonGet<std::string>(j, "log", "level", def.log.level);
    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", def.log.log_path);

    if (config.adb.default_timeout_ms <= 0) {
        BLOG_WARN("config", "adb.default_timeout_ms must be positive, using %d", def.adb.default_timeout_ms);
        config.adb.default_timeout_ms = def.adb.default_timeout_ms;
    }
    if (config.hierarchy.dump_timeout_ms <= 0) {
        BLOG_WARN("config", "hierarchy.dump_timeout_ms must be positive, using %d", def.hierarchy.dump_timeout_ms);
        config.hierarchy.dump_timeout_ms = def.hierarchy.dump_timeout_ms;
    }
    if (config.adb.max_output_bytes <= 0) {
        config.adb.max_output_bytes = def.adb.max_output_bytes;
    }
    return config;
}

// Read one config file. Unlike loadConfig() a missing or malformed file is
// an error (errc::kConfig); wrong-typed keys still fall back per key.
inline Result<AppConfig> loadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<AppConfig>("cannot open config file " + path, errc::kConfig);
    }
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        return configFromJson(j);
    } catch (const nlohmann::json::exception& e) {
        return Err<AppConfig>(path + ": JSON parse error: " + e.what(), errc::kConfig);
    }
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
// Never fails: anything unreadable yields the defaults.
inline AppConfig loadConfig(const std::string& configPath = "batdroid.json",
                            bool strict = false) {
    std::string path = configPath;
    if (!strict && !std::ifstream(path).is_open()) {
        if (const char* home = std::getenv("HOME")) {
            path = std::string(home) + "/.config/batdroid/batdroid.json";
        }
    }

    auto loaded = loadConfigFile(path);
    if (loaded.is_err()) {
        BLOG_DEBUG("config", "%s, using defaults", loaded.error().message.c_str());
        return AppConfig{};
    }

    const AppConfig& config = loaded.value();
    BLOG_DEBUG("config", "Loaded %s: adb=%s, dump_timeout=%dms, compact_depth=%d, flat_depth=%d",
               path.c_str(),
               config.adb.adb_path.c_str(),
               config.hierarchy.dump_timeout_ms,
               config.hierarchy.compact_max_depth,
               config.hierarchy.flat_max_depth);
    return config;
}

} // namespace config
} // namespace batdroid
