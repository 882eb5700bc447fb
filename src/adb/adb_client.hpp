#pragma once
// =============================================================================
// AdbClient - thin wrapper over the adb command line
// =============================================================================
// Builds "adb [-s <device>] <args...>", applies the default timeout and hands
// the request to an injectable CommandExecutor.
// =============================================================================

#include <string>
#include <vector>
#include <mutex>

#include "command_runner.hpp"
#include "../result.hpp"

namespace batdroid::adb {

struct AdbOptions {
    std::string device_id;  // empty: let adb pick the only device
    int timeout_ms = 0;     // <= 0: client default
};

class AdbClient {
public:
    static constexpr int kDefaultTimeoutMs = 15000;

    AdbClient();
    explicit AdbClient(std::string adb_path,
                       int default_timeout_ms = kDefaultTimeoutMs,
                       int64_t max_output_bytes = 50LL * 1024 * 1024);

    AdbClient(const AdbClient&) = delete;
    AdbClient& operator=(const AdbClient&) = delete;

    /// Replace the process executor (tests inject a fake here)
    void set_executor(CommandExecutor executor);

    /// Full argv that run() would execute, without the program name
    Result<std::vector<std::string>> build_args(const std::vector<std::string>& args,
                                                const AdbOptions& opts) const;

    /// Run adb and return stdout (text or binary bytes)
    Result<std::string> run(const std::vector<std::string>& args, const AdbOptions& opts = {});

    /// "adb shell <args...>"; every argument must be shell-safe
    Result<std::string> shell(const std::vector<std::string>& args, const AdbOptions& opts = {});

    /// "adb shell input tap X Y"
    Result<void> tap(int x, int y, const AdbOptions& opts = {});

    const std::string& adb_path() const { return adb_path_; }
    int default_timeout_ms() const { return default_timeout_ms_; }

private:
    std::string adb_path_;
    int default_timeout_ms_;
    int64_t max_output_bytes_;

    mutable std::mutex mutex_;
    CommandExecutor executor_;
};

} // namespace batdroid::adb
