#include "mcplink/transport/process_transport.hpp"
#include "mcplink/log/logger.hpp"

#include <sys/wait.h>
#include <poll.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>

extern char** environ;

namespace mcplink {

namespace {

constexpr int kStderrPollIntervalMs = 100;

// Written by the child to the status pipe when it fails before exec.
struct ChildFailure {
    int stage;
    int error;
};

enum ChildStage : int {
    kStageRedirect = 1,
    kStageChdir = 2,
    kStageExec = 3
};

const char* stage_name(int stage) {
    switch (stage) {
        case kStageRedirect: return "redirect";
        case kStageChdir:    return "chdir";
        case kStageExec:     return "exec";
        default:             return "spawn";
    }
}

TransportError make_error(TransportError::Category cat, const std::string& msg) {
    return TransportError{cat, msg, std::nullopt};
}

std::string errno_message(int err) {
    return std::string(std::strerror(err));
}

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() {
        struct sigaction action{};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        if (sigaction(SIGPIPE, &action, nullptr) != 0) {
            MCPLINK_LOG_WARN("Failed to ignore SIGPIPE: " + errno_message(errno));
        }
    });
}

bool set_cloexec(int fd) {
    const int flags = fcntl(fd, F_GETFD);
    return flags != -1 && fcntl(fd, F_SETFD, flags | FD_CLOEXEC) != -1;
}

bool set_nonblocking(int fd) {
    const int flags = fcntl(fd, F_GETFL);
    return flags != -1 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

void close_fd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

// Pipe whose ends are both close-on-exec. The child clears the flag on the
// ends it needs by dup2'ing them onto 0/1/2.
bool make_pipe(int fds[2]) {
    if (pipe(fds) == -1) {
        return false;
    }
    if (set_cloexec(fds[0]) == false || set_cloexec(fds[1]) == false) {
        const int saved = errno;
        close_fd(fds[0]);
        close_fd(fds[1]);
        errno = saved;
        return false;
    }
    return true;
}

int remaining_ms(ProcessTransport::Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - ProcessTransport::Clock::now());
    if (left.count() <= 0) {
        return 0;
    }
    return static_cast<int>(std::min<std::int64_t>(left.count(), 0x7fffffff));
}

/// Poll a single fd, retrying on EINTR. Returns revents, 0 on timeout, -1 on error.
int poll_one(int fd, short events, ProcessTransport::Clock::time_point deadline) {
    while (true) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        const int result = ::poll(&pfd, 1, remaining_ms(deadline));
        if (result == -1 && errno == EINTR) {
            continue;
        }
        if (result <= 0) {
            return result;
        }
        return pfd.revents;
    }
}

void reap_blocking(pid_t pid, std::optional<int>& exit_code) {
    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid, &status, 0);
    } while (result == -1 && errno == EINTR);

    if (result == pid) {
        if (WIFEXITED(status)) {
            exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code = -WTERMSIG(status);
        }
    } else if (result == -1) {
        MCPLINK_LOG_WARN("waitpid failed for pid " + std::to_string(pid) + ": " + errno_message(errno));
    }
}

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\r';
    });
}

}  // namespace

ProcessTransport::ProcessTransport(ProcessTransportConfig config)
    : config_(std::move(config))
{}

ProcessTransport::~ProcessTransport() {
    stop();
}

TransportResult<void> ProcessTransport::start() {
    {
        std::lock_guard lock(mutex_);
        if (running_) {
            return tl::unexpected(make_error(
                TransportError::Category::Spawn,
                "Process already running"
            ));
        }
    }

    if (config_.program.empty()) {
        return tl::unexpected(make_error(TransportError::Category::Spawn, "spawn error: empty program"));
    }

    ignore_sigpipe_once();

    // Everything the child touches is prepared here: after fork() only the
    // calling thread exists, and allocating could deadlock on a malloc lock
    // held by another thread at the time of the fork.
    std::vector<std::string> argv_storage = config_.argv;
    if (argv_storage.empty()) {
        argv_storage.push_back(config_.program);
    }
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view var(*entry);
        const auto eq = var.find('=');
        const auto name = var.substr(0, eq);
        const bool overridden = std::any_of(
            config_.env_overrides.begin(), config_.env_overrides.end(),
            [name](const auto& kv) { return kv.first == name; });
        if (overridden == false) {
            env_storage.emplace_back(var);
        }
    }
    for (const auto& [name, value] : config_.env_overrides) {
        env_storage.push_back(name + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& var : env_storage) {
        envp.push_back(var.data());
    }
    envp.push_back(nullptr);

    const char* program = config_.program.c_str();
    const char* cwd = config_.working_directory.has_value() ? config_.working_directory->c_str() : nullptr;
    const StderrHandling stderr_mode = config_.stderr_handling;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };

    if (make_pipe(stdin_pipe) == false || make_pipe(stdout_pipe) == false ||
        make_pipe(status_pipe) == false ||
        (stderr_mode == StderrHandling::Capture && make_pipe(stderr_pipe) == false)) {
        const int saved = errno;
        close_all();
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            "spawn error: failed to create pipes: " + errno_message(saved)
        ));
    }

    int devnull = -1;
    if (stderr_mode == StderrHandling::Discard) {
        devnull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
    }

    const pid_t pid = fork();

    if (pid == -1) {
        const int saved = errno;
        close_all();
        close_fd(devnull);
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            "spawn error: fork failed: " + errno_message(saved)
        ));
    }

    if (pid == 0) {
        // Child process - no allocations from here on
        const int status_fd = status_pipe[1];
        auto fail = [status_fd](int stage) {
            ChildFailure failure{stage, errno};
            ssize_t ignored = ::write(status_fd, &failure, sizeof(failure));
            (void)ignored;
            _exit(127);
        };

        // Own process group so teardown reaches grandchildren (shell, npx, ...)
        setpgid(0, 0);

        if (dup2(stdin_pipe[0], STDIN_FILENO) == -1 || dup2(stdout_pipe[1], STDOUT_FILENO) == -1) {
            fail(kStageRedirect);
        }
        if (stderr_mode == StderrHandling::Capture) {
            if (dup2(stderr_pipe[1], STDERR_FILENO) == -1) {
                fail(kStageRedirect);
            }
        } else if (stderr_mode == StderrHandling::Discard && devnull != -1) {
            if (dup2(devnull, STDERR_FILENO) == -1) {
                fail(kStageRedirect);
            }
        }

        signal(SIGPIPE, SIG_DFL);

        if (cwd != nullptr && chdir(cwd) == -1) {
            fail(kStageChdir);
        }

        execve(program, argv.data(), envp.data());
        fail(kStageExec);
    }

    // Parent process. Set the group here too so kill(-pid) cannot race the
    // child's own setpgid.
    setpgid(pid, pid);

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);
    close_fd(devnull);

    // The status pipe reaches EOF once exec succeeds (close-on-exec), or
    // carries a ChildFailure when anything before it failed.
    const auto spawn_deadline = Clock::now() + config_.spawn_timeout;
    std::optional<TransportError> spawn_error;
    const int revents = poll_one(status_pipe[0], POLLIN, spawn_deadline);
    if (revents == 0) {
        spawn_error = make_error(TransportError::Category::Spawn, "spawn timeout");
    } else if (revents < 0) {
        spawn_error = make_error(TransportError::Category::Spawn,
            "spawn error: failed to wait for exec: " + errno_message(errno));
    } else {
        ChildFailure failure{};
        ssize_t n;
        do {
            n = ::read(status_pipe[0], &failure, sizeof(failure));
        } while (n == -1 && errno == EINTR);
        if (n == static_cast<ssize_t>(sizeof(failure))) {
            spawn_error = make_error(TransportError::Category::Spawn,
                "spawn error: " + std::string(stage_name(failure.stage)) + " failed for " + config_.program + ": " +
                errno_message(failure.error));
        } else if (n != 0) {
            spawn_error = make_error(TransportError::Category::Spawn,
                "spawn error: failed to read exec status for " + config_.program);
        }
    }
    close_fd(status_pipe[0]);

    if (spawn_error.has_value()) {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
        std::optional<int> code;
        reap_blocking(pid, code);
        close_all();
        MCPLINK_LOG_WARN("Process spawn failed: " + spawn_error->message);
        return tl::unexpected(*spawn_error);
    }

    if (set_nonblocking(stdin_pipe[1]) == false) {
        MCPLINK_LOG_WARN("Failed to make child stdin non-blocking: " + errno_message(errno));
    }

    {
        std::lock_guard lock(mutex_);
        child_pid_ = pid;
        stdin_fd_ = stdin_pipe[1];
        stdout_fd_ = stdout_pipe[0];
        stderr_fd_ = stderr_pipe[0];
        running_ = true;
        reaped_ = false;
        exit_code_.reset();
        read_buffer_pos_ = 0;
        read_buffer_len_ = 0;
        pending_line_.clear();
        discarding_line_ = false;
    }
    stdin_pipe[1] = -1;
    stdout_pipe[0] = -1;
    stderr_pipe[0] = -1;

    if (stderr_fd_ != -1) {
        stderr_stop_.store(false);
        {
            std::lock_guard stderr_lock(stderr_mutex_);
            stderr_closed_ = false;
        }
        stderr_thread_ = std::thread(&ProcessTransport::stderr_reader_loop, this, stderr_fd_);
    }

    get_logger().info_fmt("Started process {} (pid {})", config_.program, pid);

    return {};
}

void ProcessTransport::stop() {
    pid_t pid_to_kill = -1;
    bool already_reaped = false;
    int stdin_to_close = -1;
    int stdout_to_close = -1;

    {
        std::lock_guard lock(mutex_);
        if (running_ == false) {
            return;
        }

        pid_to_kill = child_pid_;
        already_reaped = reaped_;
        stdin_to_close = stdin_fd_;
        stdout_to_close = stdout_fd_;

        running_ = false;
        stdin_fd_ = -1;
        stdout_fd_ = -1;
        read_buffer_pos_ = 0;
        read_buffer_len_ = 0;
        pending_line_.clear();
        discarding_line_ = false;
    }

    close_fd(stdin_to_close);
    close_fd(stdout_to_close);

    // A reaped pid may already belong to an unrelated process; never signal it.
    if (pid_to_kill > 0 && already_reaped == false) {
        if (::kill(-pid_to_kill, SIGKILL) == -1 && ::kill(pid_to_kill, SIGKILL) == -1 && errno != ESRCH) {
            MCPLINK_LOG_WARN("Failed to kill pid " + std::to_string(pid_to_kill) + ": " + errno_message(errno));
        }
        std::optional<int> code;
        reap_blocking(pid_to_kill, code);
        std::lock_guard lock(mutex_);
        reaped_ = true;
        if (exit_code_.has_value() == false) {
            exit_code_ = code;
        }
    }

    if (stderr_thread_.joinable()) {
        stderr_stop_.store(true);
        stderr_thread_.join();
    }
    close_fd(stderr_fd_);

    get_logger().debug_fmt("Stopped process (pid {})", pid_to_kill);
}

bool ProcessTransport::is_running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

bool ProcessTransport::is_process_alive() {
    std::lock_guard lock(mutex_);
    if (running_ == false || child_pid_ <= 0) {
        return false;
    }
    reap_if_exited_locked();
    return reaped_ == false;
}

std::optional<int> ProcessTransport::exit_code() const {
    std::lock_guard lock(mutex_);
    return exit_code_;
}

pid_t ProcessTransport::pid() const {
    std::lock_guard lock(mutex_);
    return child_pid_;
}

std::string ProcessTransport::read_stderr() const {
    std::lock_guard lock(stderr_mutex_);
    return stderr_tail_;
}

bool ProcessTransport::wait_stderr_closed(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(stderr_mutex_);
    return stderr_cv_.wait_for(lock, timeout, [this] { return stderr_closed_; });
}

void ProcessTransport::reap_if_exited_locked() {
    if (reaped_ || child_pid_ <= 0) {
        return;
    }
    int status = 0;
    const pid_t result = waitpid(child_pid_, &status, WNOHANG);
    if (result == child_pid_) {
        reaped_ = true;
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = -WTERMSIG(status);  // Negative indicates signal
        }
    }
}

TransportResult<void> ProcessTransport::ensure_alive_locked() {
    if (running_ == false) {
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Process not running"
        ));
    }
    reap_if_exited_locked();
    if (reaped_) {
        std::string msg = "Process exited";
        if (exit_code_.has_value()) {
            msg += " with code " + std::to_string(*exit_code_);
        }
        return tl::unexpected(make_error(TransportError::Category::Network, msg));
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Send / Receive
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> ProcessTransport::send(const Json& message, std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    std::lock_guard lock(mutex_);

    if (auto alive = ensure_alive_locked(); !alive) {
        return alive;
    }

    std::string data = message.dump();
    data.push_back('\n');
    return write_all(data, deadline);
}

TransportResult<Json> ProcessTransport::receive(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    std::lock_guard lock(mutex_);

    if (running_ == false) {
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Process not running"
        ));
    }

    // An exited child may still have unread output in the pipe, so liveness
    // is not checked here: EOF surfaces as "Process closed connection".
    while (true) {
        auto line = read_line(deadline);
        if (!line) {
            return tl::unexpected(line.error());
        }
        if (is_blank(*line)) {
            continue;
        }
        try {
            return Json::parse(*line);
        } catch (const Json::parse_error& e) {
            return tl::unexpected(make_error(
                TransportError::Category::Protocol,
                std::string("invalid JSON from process: ") + e.what()
            ));
        }
    }
}

TransportResult<void> ProcessTransport::write_all(const std::string& data, Clock::time_point deadline) {
    const char* ptr = data.data();
    std::size_t remaining = data.size();

    while (remaining > 0) {
        const ssize_t written = ::write(stdin_fd_, ptr, remaining);
        if (written >= 0) {
            ptr += written;
            remaining -= static_cast<std::size_t>(written);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            return tl::unexpected(make_error(
                TransportError::Category::Network,
                "Failed to write to process: " + errno_message(errno)
            ));
        }

        const int revents = poll_one(stdin_fd_, POLLOUT, deadline);
        if (revents == 0) {
            return tl::unexpected(make_error(TransportError::Category::Timeout, "write timeout"));
        }
        if (revents < 0) {
            return tl::unexpected(make_error(
                TransportError::Category::Network,
                "Failed to poll process stdin: " + errno_message(errno)
            ));
        }
        if ((revents & (POLLERR | POLLHUP)) != 0 && (revents & POLLOUT) == 0) {
            return tl::unexpected(make_error(
                TransportError::Category::Network,
                "Failed to write to process: stdin closed"
            ));
        }
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Buffered I/O Helpers
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<std::size_t> ProcessTransport::fill_read_buffer(Clock::time_point deadline) {
    const int revents = poll_one(stdout_fd_, POLLIN, deadline);
    if (revents == 0) {
        return tl::unexpected(make_error(TransportError::Category::Timeout, "read timeout"));
    }
    if (revents < 0) {
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to poll process stdout: " + errno_message(errno)
        ));
    }

    ssize_t n;
    do {
        n = ::read(stdout_fd_, read_buffer_, read_buffer_size);
    } while (n == -1 && errno == EINTR);

    if (n < 0) {
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to read from process: " + errno_message(errno)
        ));
    }
    if (n == 0) {
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Process closed connection"
        ));
    }
    read_buffer_pos_ = 0;
    read_buffer_len_ = static_cast<std::size_t>(n);
    return read_buffer_len_;
}

TransportResult<std::string> ProcessTransport::read_line(Clock::time_point deadline) {
    while (true) {
        while (read_buffer_pos_ < read_buffer_len_) {
            const char c = read_buffer_[read_buffer_pos_++];
            if (c == '\n') {
                if (discarding_line_) {
                    discarding_line_ = false;
                    continue;
                }
                std::string line = std::move(pending_line_);
                pending_line_.clear();
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return line;
            }
            if (discarding_line_) {
                continue;
            }
            pending_line_.push_back(c);
            if (pending_line_.size() > config_.max_line_length) {
                // The remainder of this line is dropped as it arrives.
                pending_line_.clear();
                discarding_line_ = true;
                return tl::unexpected(make_error(
                    TransportError::Category::Protocol,
                    "Line exceeds maximum length of " + std::to_string(config_.max_line_length) + " bytes"
                ));
            }
        }

        // A timeout leaves pending_line_ intact for the next call.
        auto filled = fill_read_buffer(deadline);
        if (!filled) {
            return tl::unexpected(filled.error());
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Stderr drain
// ─────────────────────────────────────────────────────────────────────────────

void ProcessTransport::stderr_reader_loop(int fd) {
    std::string pending;
    char chunk[4096];

    auto emit = [this](const std::string& text) {
        get_logger().debug_fmt("[{} stderr] {}", config_.program, text);
    };

    while (stderr_stop_.load() == false) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        const int result = ::poll(&pfd, 1, kStderrPollIntervalMs);
        if (result == 0 || (result == -1 && errno == EINTR)) {
            continue;
        }
        if (result == -1) {
            break;
        }

        const ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n == -1 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }

        {
            std::lock_guard lock(stderr_mutex_);
            stderr_tail_.append(chunk, static_cast<std::size_t>(n));
            if (stderr_tail_.size() > config_.stderr_tail_limit) {
                stderr_tail_.erase(0, stderr_tail_.size() - config_.stderr_tail_limit);
            }
        }

        pending.append(chunk, static_cast<std::size_t>(n));
        std::size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            emit(pending.substr(0, newline));
            pending.erase(0, newline + 1);
        }
    }

    if (!pending.empty()) {
        emit(pending);
    }

    {
        std::lock_guard lock(stderr_mutex_);
        stderr_closed_ = true;
    }
    stderr_cv_.notify_all();
}

}  // namespace mcplink
