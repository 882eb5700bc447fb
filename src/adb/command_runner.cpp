// =============================================================================
// CommandRunner - fork/exec with pipes, poll() deadline, SIGKILL on timeout
// =============================================================================

#include "adb/command_runner.hpp"
#include "batdroid_log.hpp"

#include <chrono>
#include <thread>
#include <cerrno>
#include <cstring>
#include <csignal>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

static constexpr const char* TAG = "CommandRunner";

namespace batdroid::adb {

namespace {

// RAII wrapper for a file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) { reset(); fd_ = other.fd_; other.fd_ = -1; }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

bool make_pipe(Pipe& p) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    p.read_end = UniqueFd(fds[0]);
    p.write_end = UniqueFd(fds[1]);
    return true;
}

using Clock = std::chrono::steady_clock;

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void kill_and_reap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

std::string trim_copy(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

std::string CommandRequest::display() const {
    std::string out = program;
    for (const auto& a : args) {
        out += ' ';
        out += a;
    }
    return out;
}

Result<CommandOutput> run_command(const CommandRequest& request) {
    const std::string cmdline = request.display();
    if (request.program.empty()) {
        return Err<CommandOutput>("empty program name", errc::kInvalidArgument);
    }

    Pipe out_pipe, err_pipe, exec_pipe;
    if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_pipe)) {
        return Err<CommandOutput>(cmdline + " failed: pipe: " + std::strerror(errno),
                                  errc::kCommandFailed);
    }

    std::vector<char*> argv;
    argv.reserve(request.args.size() + 2);
    argv.push_back(const_cast<char*>(request.program.c_str()));
    for (const auto& a : request.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    const auto deadline = Clock::now() + std::chrono::milliseconds(request.timeout_ms);

    pid_t pid = ::fork();
    if (pid < 0) {
        return Err<CommandOutput>(cmdline + " failed: fork: " + std::strerror(errno),
                                  errc::kCommandFailed);
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end.get(), STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe.write_end.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    exec_pipe.write_end.reset();

    // exec_pipe is CLOEXEC: EOF means execvp succeeded, 4 bytes carry its errno
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        BLOG_WARN(TAG, "exec failed: %s (%s)", request.program.c_str(), std::strerror(exec_errno));
        return Err<CommandOutput>(cmdline + " failed: " + std::strerror(exec_errno),
                                  errc::kCommandFailed);
    }

    CommandOutput output;
    struct pollfd fds[2];
    fds[0] = {out_pipe.read_end.get(), POLLIN, 0};
    fds[1] = {err_pipe.read_end.get(), POLLIN, 0};
    std::string* sinks[2] = {&output.stdout_data, &output.stderr_data};
    int open_count = 2;
    char buffer[65536];

    while (open_count > 0) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            kill_and_reap(pid);
            BLOG_WARN(TAG, "timeout after %dms: %s", request.timeout_ms, cmdline.c_str());
            return Err<CommandOutput>(cmdline + " timed out after " +
                                      std::to_string(request.timeout_ms) + "ms",
                                      errc::kCommandTimeout);
        }

        int ready = ::poll(fds, 2, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            kill_and_reap(pid);
            return Err<CommandOutput>(cmdline + " failed: poll: " + std::strerror(err),
                                      errc::kCommandFailed);
        }
        if (ready == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t got = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (got < 0 && errno == EINTR) continue;
            if (got <= 0) {
                fds[i].fd = -1;
                --open_count;
                continue;
            }
            sinks[i]->append(buffer, static_cast<size_t>(got));
            int64_t total = static_cast<int64_t>(output.stdout_data.size() + output.stderr_data.size());
            if (total > request.max_output_bytes) {
                kill_and_reap(pid);
                BLOG_WARN(TAG, "output exceeded %lld bytes: %s",
                          static_cast<long long>(request.max_output_bytes), cmdline.c_str());
                return Err<CommandOutput>(cmdline + " failed: output exceeded " +
                                          std::to_string(request.max_output_bytes) + " bytes",
                                          errc::kOutputTooLarge);
            }
        }
    }

    // Both streams closed; reap within whatever is left of the deadline
    int status = 0;
    while (true) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            return Err<CommandOutput>(cmdline + " failed: waitpid: " + std::strerror(errno),
                                      errc::kCommandFailed);
        }
        if (remaining_ms(deadline) == 0) {
            kill_and_reap(pid);
            return Err<CommandOutput>(cmdline + " timed out after " +
                                      std::to_string(request.timeout_ms) + "ms",
                                      errc::kCommandTimeout);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (WIFSIGNALED(status)) {
        return Err<CommandOutput>(cmdline + " failed: killed by signal " +
                                  std::to_string(WTERMSIG(status)),
                                  errc::kCommandFailed);
    }

    output.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (output.exit_code != 0) {
        std::string detail = trim_copy(output.stderr_data);
        if (detail.empty()) detail = "exit status " + std::to_string(output.exit_code);
        BLOG_DEBUG(TAG, "%s exited with %d", cmdline.c_str(), output.exit_code);
        return Err<CommandOutput>(cmdline + " failed: " + detail, errc::kCommandFailed);
    }

    BLOG_TRACE(TAG, "%s -> %zu bytes", cmdline.c_str(), output.stdout_data.size());
    return output;
}

} // namespace batdroid::adb
