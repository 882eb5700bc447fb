// =============================================================================
// AdbClient
// =============================================================================

#include "adb/adb_client.hpp"
#include "adb_security.hpp"
#include "batdroid_log.hpp"

static constexpr const char* TAG = "adb";

namespace batdroid::adb {

AdbClient::AdbClient() : AdbClient("adb") {}

AdbClient::AdbClient(std::string adb_path, int default_timeout_ms, int64_t max_output_bytes)
    : adb_path_(std::move(adb_path)),
      default_timeout_ms_(default_timeout_ms > 0 ? default_timeout_ms : kDefaultTimeoutMs),
      max_output_bytes_(max_output_bytes),
      executor_(run_command) {}

void AdbClient::set_executor(CommandExecutor executor) {
    std::lock_guard<std::mutex> lock(mutex_);
    executor_ = std::move(executor);
}

Result<std::vector<std::string>> AdbClient::build_args(const std::vector<std::string>& args,
                                                       const AdbOptions& opts) const {
    std::vector<std::string> full;
    full.reserve(args.size() + 2);
    if (!opts.device_id.empty()) {
        if (!security::isValidAdbId(opts.device_id)) {
            BLOG_ERROR(TAG, "Invalid device ID rejected: %s", opts.device_id.c_str());
            return Err<std::vector<std::string>>("invalid device id: " + opts.device_id,
                                                 errc::kInvalidArgument);
        }
        full.push_back("-s");
        full.push_back(opts.device_id);
    }
    full.insert(full.end(), args.begin(), args.end());
    return full;
}

Result<std::string> AdbClient::run(const std::vector<std::string>& args, const AdbOptions& opts) {
    auto full = build_args(args, opts);
    if (full.is_err()) return full.error();

    CommandRequest request;
    request.program = adb_path_;
    request.args = std::move(full).value();
    request.timeout_ms = opts.timeout_ms > 0 ? opts.timeout_ms : default_timeout_ms_;
    request.max_output_bytes = max_output_bytes_;

    CommandExecutor executor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        executor = executor_;
    }
    if (!executor) {
        return Err<std::string>("adb executor not set", errc::kCommandFailed);
    }

    BLOG_DEBUG(TAG, "%s (timeout %dms)", request.display().c_str(), request.timeout_ms);
    auto out = executor(request);
    if (out.is_err()) return out.error();
    return std::move(out.value().stdout_data);
}

Result<std::string> AdbClient::shell(const std::vector<std::string>& args, const AdbOptions& opts) {
    std::vector<std::string> full;
    full.reserve(args.size() + 1);
    full.push_back("shell");
    for (const auto& a : args) {
        if (!security::isSafeShellArg(a)) {
            BLOG_ERROR(TAG, "Unsafe shell argument rejected: %s", a.c_str());
            return Err<std::string>("unsafe shell argument: " + a, errc::kInvalidArgument);
        }
        full.push_back(a);
    }
    return run(full, opts);
}

Result<void> AdbClient::tap(int x, int y, const AdbOptions& opts) {
    auto out = shell({"input", "tap", std::to_string(x), std::to_string(y)}, opts);
    if (out.is_err()) return out.error();
    return Ok();
}

} // namespace batdroid::adb
