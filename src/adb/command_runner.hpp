#pragma once
// =============================================================================
// CommandRunner - external process execution
// =============================================================================
// Runs a program with an argv vector (no shell), captures stdout/stderr as
// bytes, and enforces a deadline. Output is returned whole or not at all.
// =============================================================================

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

#include "../result.hpp"

namespace batdroid::adb {

struct CommandRequest {
    std::string program;
    std::vector<std::string> args;
    int timeout_ms = 15000;
    int64_t max_output_bytes = 50LL * 1024 * 1024;

    // "program arg1 arg2" for messages
    std::string display() const;
};

struct CommandOutput {
    std::string stdout_data;   // raw bytes, may be binary
    std::string stderr_data;
    int exit_code = 0;
};

// Injectable executor. Tests replace it with a fake.
using CommandExecutor = std::function<Result<CommandOutput>(const CommandRequest&)>;

/// Spawn the process and wait for it.
/// - could not start / killed by signal / non-zero exit -> errc::kCommandFailed
/// - deadline exceeded (child is killed)               -> errc::kCommandTimeout
/// - stdout+stderr above max_output_bytes              -> errc::kOutputTooLarge
/// A non-zero exit is reported as an error carrying stderr.
Result<CommandOutput> run_command(const CommandRequest& request);

} // namespace batdroid::adb
