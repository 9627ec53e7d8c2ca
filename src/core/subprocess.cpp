#include <lazymcp/core/subprocess.hpp>

#include <lazymcp/core/log.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace lazymcp {

namespace {

constexpr const char* kComponent = "process";

Error MakeProcessError(ErrorCategory category, const std::string& operation,
                       const std::string& command, const std::string& message) {
    return Error::Make(category, operation, command, message);
}

// A write to a child that already exited must surface as EPIPE, not kill us.
void IgnoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

int RemainingMs(Deadline deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now()).count();
    if (remaining <= 0) return 0;
    if (remaining > 60 * 60 * 1000) return 60 * 60 * 1000;
    return static_cast<int>(remaining);
}

std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        auto key = entry.substr(0, eq);
        if (overrides.count(key) == 0) {
            env.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> ToCharPtrs(std::vector<std::string>& strings) {
    std::vector<char*> ptrs;
    ptrs.reserve(strings.size() + 1);
    for (auto& s : strings) {
        ptrs.push_back(s.data());
    }
    ptrs.push_back(nullptr);
    return ptrs;
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int ExitCodeFromStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // anonymous namespace

Result<std::unique_ptr<Subprocess>, Error> Subprocess::Spawn(const SpawnOptions& options) {
    using R = Result<std::unique_ptr<Subprocess>, Error>;
    IgnoreSigpipeOnce();

    if (options.command.empty()) {
        return R::Err(MakeProcessError(ErrorCategory::ServerSpawnFailed, "Spawn", "",
                                       "No command configured"));
    }

    // O_CLOEXEC so sibling children never inherit each other's pipe ends;
    // dup2 in the file actions clears the flag on the child's 0/1/2.
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
    };
    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        (options.capture_stderr && ::pipe2(err_pipe, O_CLOEXEC) != 0)) {
        auto msg = std::string("pipe2() failed: ") + std::strerror(errno);
        close_all();
        return R::Err(MakeProcessError(ErrorCategory::ServerSpawnFailed, "Spawn",
                                       options.command, msg));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, in_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
    if (options.capture_stderr) {
        posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);
    }

    std::vector<std::string> argv_strings;
    argv_strings.push_back(options.command);
    argv_strings.insert(argv_strings.end(), options.args.begin(), options.args.end());
    auto argv = ToCharPtrs(argv_strings);

    auto env_strings = BuildEnvironment(options.env);
    auto envp = ToCharPtrs(env_strings);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, options.command.c_str(), &actions, nullptr,
                            argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        close_all();
        return R::Err(MakeProcessError(ErrorCategory::ServerSpawnFailed, "Spawn",
                                       options.command,
                                       std::string("posix_spawnp failed: ") +
                                           std::strerror(rc)));
    }

    // Parent keeps the write end of stdin and the read ends of stdout/stderr.
    CloseFd(in_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);

    // Non-blocking stdin so a full pipe never stalls past the deadline.
    int flags = ::fcntl(in_pipe[1], F_GETFL);
    if (flags >= 0) {
        ::fcntl(in_pipe[1], F_SETFL, flags | O_NONBLOCK);
    }

    LogDebug(kComponent, "Spawned '" + options.command + "' pid=" + std::to_string(pid));

    auto process = std::make_unique<Subprocess>(Key{}, options.command, pid, in_pipe[1],
                                                out_pipe[0], err_pipe[0]);
    process->max_line_bytes_ = options.max_line_bytes;
    return R::Ok(std::move(process));
}

Subprocess::~Subprocess() {
    Terminate();
}

Result<void, Error> Subprocess::Write(std::string_view data, Deadline deadline) {
    std::size_t written = 0;
    while (written < data.size()) {
        if (stdin_fd_ < 0) {
            return Result<void, Error>::Err(MakeProcessError(
                ErrorCategory::BackendError, "Write", command_, "stdin is closed"));
        }
        auto n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            int wait_ms = RemainingMs(deadline);
            if (wait_ms == 0) {
                return Result<void, Error>::Err(MakeProcessError(
                    ErrorCategory::Timeout, "Write", command_,
                    "Timed out writing to process stdin"));
            }
            pollfd pfd{stdin_fd_, POLLOUT, 0};
            int ret = ::poll(&pfd, 1, wait_ms);
            if (ret < 0 && errno != EINTR) {
                return Result<void, Error>::Err(MakeProcessError(
                    ErrorCategory::BackendError, "Write", command_,
                    std::string("poll() failed: ") + std::strerror(errno)));
            }
            continue;
        }
        return Result<void, Error>::Err(MakeProcessError(
            ErrorCategory::BackendError, "Write", command_,
            std::string("write() failed: ") + std::strerror(errno)));
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> Subprocess::ReadLine(Deadline deadline) {
    using R = Result<std::string, Error>;
    for (;;) {
        auto nl = read_buffer_.find('\n');
        if (nl != std::string::npos) {
            auto line = read_buffer_.substr(0, nl);
            read_buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return R::Ok(std::move(line));
        }
        if (stdout_fd_ < 0) {
            return R::Err(MakeProcessError(ErrorCategory::BackendError, "Read",
                                           command_, "stdout is closed"));
        }

        int wait_ms = RemainingMs(deadline);
        if (wait_ms == 0) {
            return R::Err(MakeProcessError(ErrorCategory::Timeout, "Read", command_,
                                           "Timed out waiting for process output"));
        }
        pollfd pfd{stdout_fd_, POLLIN, 0};
        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return R::Err(MakeProcessError(ErrorCategory::BackendError, "Read", command_,
                                           std::string("poll() failed: ") +
                                               std::strerror(errno)));
        }
        if (ret == 0) {
            continue;  // deadline re-checked at the top
        }

        char chunk[4096];
        auto n = ::read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            CloseFd(stdout_fd_);
            return R::Err(MakeProcessError(ErrorCategory::BackendError, "Read", command_,
                                           "Process closed its stdout"));
        }
        read_buffer_.append(chunk, static_cast<std::size_t>(n));
        if (read_buffer_.size() > max_line_bytes_ &&
            read_buffer_.find('\n') == std::string::npos) {
            read_buffer_.clear();
            LogWarn(kComponent, "'" + command_ + "' pid=" + std::to_string(pid_) +
                                    " wrote an over-long line, terminating");
            Terminate(std::chrono::milliseconds(0));
            return R::Err(MakeProcessError(ErrorCategory::BackendError, "Read", command_,
                                           "Output line exceeds " +
                                               std::to_string(max_line_bytes_) + " bytes"));
        }
    }
}

Result<ProcessOutput, Error> Subprocess::Communicate(std::string_view input,
                                                     Deadline deadline) {
    using R = Result<ProcessOutput, Error>;

    if (!input.empty()) {
        auto written = Write(input, deadline);
        if (written.IsErr() && written.Error().category == ErrorCategory::Timeout) {
            Terminate(std::chrono::milliseconds(0));
            return R::Err(std::move(written).Error());
        }
        // EPIPE is fine: the child may exit without reading its input.
    }
    CloseStdin();

    ProcessOutput output;
    output.out = std::move(read_buffer_);
    read_buffer_.clear();

    while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        int wait_ms = RemainingMs(deadline);
        if (wait_ms == 0) {
            Terminate(std::chrono::milliseconds(0));
            return R::Err(MakeProcessError(ErrorCategory::Timeout, "Communicate", command_,
                                           "Process did not finish before the deadline"));
        }
        pollfd fds[2];
        nfds_t count = 0;
        if (stdout_fd_ >= 0) fds[count++] = pollfd{stdout_fd_, POLLIN, 0};
        if (stderr_fd_ >= 0) fds[count++] = pollfd{stderr_fd_, POLLIN, 0};
        int ret = ::poll(fds, count, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return R::Err(MakeProcessError(ErrorCategory::Internal, "Communicate", command_,
                                           std::string("poll() failed: ") +
                                               std::strerror(errno)));
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            char chunk[4096];
            auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) continue;
            bool is_out = fds[i].fd == stdout_fd_;
            if (n <= 0) {
                CloseFd(is_out ? stdout_fd_ : stderr_fd_);
                continue;
            }
            (is_out ? output.out : output.err).append(chunk, static_cast<std::size_t>(n));
        }
    }

    while (!Reap(false)) {
        if (RemainingMs(deadline) == 0) {
            Terminate(std::chrono::milliseconds(0));
            return R::Err(MakeProcessError(ErrorCategory::Timeout, "Communicate", command_,
                                           "Process did not exit before the deadline"));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    output.exit_code = ExitCodeFromStatus(exit_status_);
    return R::Ok(std::move(output));
}

void Subprocess::CloseStdin() {
    CloseFd(stdin_fd_);
}

bool Subprocess::IsRunning() {
    if (pid_ <= 0 || exited_) return false;
    return !Reap(false);
}

void Subprocess::Terminate(std::chrono::milliseconds grace) {
    if (pid_ > 0 && !exited_) {
        CloseStdin();
        if (!Reap(false)) {
            ::kill(pid_, SIGTERM);
            auto until = SteadyClock::now() + grace;
            while (!Reap(false) && SteadyClock::now() < until) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            if (!exited_) {
                LogWarn(kComponent, "Process '" + command_ + "' pid=" +
                                        std::to_string(pid_) +
                                        " ignored SIGTERM, sending SIGKILL");
                ::kill(pid_, SIGKILL);
                Reap(true);
            }
        }
    }
    CloseFds();
}

void Subprocess::CloseFds() {
    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
}

bool Subprocess::Reap(bool block) {
    if (exited_) return true;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        exited_ = true;
        exit_status_ = status;
        return true;
    }
    if (r < 0) {
        // ECHILD: already reaped elsewhere.
        exited_ = true;
        return true;
    }
    return false;
}

} // namespace lazymcp
