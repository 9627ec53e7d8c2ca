#pragma once

#include <lazymcp/core/result.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace lazymcp {

using SteadyClock = std::chrono::steady_clock;
using Deadline = SteadyClock::time_point;

struct SpawnOptions {
    std::string command;                       // resolved through PATH
    std::vector<std::string> args;
    std::map<std::string, std::string> env;    // added to / overriding the parent env
    bool capture_stderr = false;               // otherwise inherited
    std::size_t max_line_bytes = 64 * 1024 * 1024;  // ReadLine() limit
};

struct ProcessOutput {
    int exit_code = -1;
    std::string out;
    std::string err;
};

// ---------------------------------------------------------------------------
// Subprocess: a child process with piped stdin/stdout (and optionally
// stderr). All reads and writes are bounded by a deadline.
//
// Not thread-safe: callers serialize access (the server registry holds the
// owning backend's mutex around every use).
// ---------------------------------------------------------------------------
class Subprocess {
private:
    // Constructor key: only the factories can build one.
    struct Key {
        explicit Key() = default;
    };

public:
    [[nodiscard]] static Result<std::unique_ptr<Subprocess>, Error> Spawn(
        const SpawnOptions& options);

    Subprocess(Key, std::string command, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
        : command_(std::move(command)), pid_(pid),
          stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    [[nodiscard]] Result<void, Error> Write(std::string_view data, Deadline deadline);

    /// Next '\n'-terminated line from stdout, without the terminator.
    /// A line longer than max_line_bytes kills the child: the stream
    /// cannot be resynchronized.
    [[nodiscard]] Result<std::string, Error> ReadLine(Deadline deadline);

    /// Write `input`, close stdin, collect stdout/stderr until EOF, reap.
    /// On deadline expiry the child is killed and Timeout is returned.
    [[nodiscard]] Result<ProcessOutput, Error> Communicate(std::string_view input,
                                                           Deadline deadline);

    void CloseStdin();

    [[nodiscard]] bool IsRunning();

    /// SIGTERM, grace period, then SIGKILL. Idempotent.
    void Terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }
    [[nodiscard]] const std::string& Command() const noexcept { return command_; }

private:
    void CloseFds();
    bool Reap(bool block);

    std::string command_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool exited_ = false;
    int exit_status_ = 0;
    std::string read_buffer_;
    std::size_t max_line_bytes_ = 0;
};

} // namespace lazymcp
