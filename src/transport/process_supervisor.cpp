#include "transport/process_supervisor.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace bridge::transport {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr auto kTerminateGrace = std::chrono::milliseconds(2000);

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pipe(int (&fds)[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

// Reads whatever is available. Returns false once the pipe reached EOF or
// failed, after closing it.
bool drain_pipe(int& fd, const std::function<void(std::string_view)>& sink) {
    char buffer[kReadChunk];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            sink(std::string_view(buffer, static_cast<std::size_t>(n)));
            if (static_cast<std::size_t>(n) < sizeof(buffer)) {
                return true;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        close_fd(fd);
        return false;
    }
}

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

ProcessSupervisor::ProcessSupervisor(StdoutHandler on_stdout, ExitHandler on_exit)
    : on_stdout_(std::move(on_stdout)), on_exit_(std::move(on_exit)) {}

ProcessSupervisor::~ProcessSupervisor() {
    stop();
}

core::errors::Status ProcessSupervisor::start(const ProcessSpec& spec) {
    if (pid_ > 0 && !running_) {
        // Previous child died on its own; reap the reader and the pipes.
        stop();
    }
    if (pid_ > 0) {
        return BridgeError{ErrorCategory::Startup, "MCP server process is already running.",
                           "already_started"};
    }
    if (spec.command.empty()) {
        return BridgeError{ErrorCategory::Startup, "MCP server command is empty.",
                           "spawn_failed"};
    }

    // A dead child must surface as EPIPE from write(), not kill us.
    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0 ||
        pipe2(wake_fd_, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_pipe);
        close_pipe(wake_fd_);
        return BridgeError{ErrorCategory::Startup,
                           "Failed to create process pipes: " + reason, "spawn_failed"};
    }

    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.command);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const std::string cwd = spec.working_directory.string();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_pipe);
        close_pipe(wake_fd_);
        return BridgeError{ErrorCategory::Startup, "Failed to fork process.",
                           "spawn_failed"};
    }

    if (pid == 0) {
        // Only async-signal-safe calls from here on.
        static_cast<void>(std::signal(SIGPIPE, SIG_DFL));
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            const int err = errno;
            static_cast<void>(::write(exec_pipe[1], &err, sizeof(err)));
            _exit(126);
        }
        execvp(argv[0], argv.data());
        const int err = errno;
        static_cast<void>(::write(exec_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    // exec_pipe is close-on-exec: EOF means exec succeeded, data is an errno.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n > 0) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        close_pipe(wake_fd_);
        return BridgeError{ErrorCategory::Startup,
                           "Failed to launch '" + spec.command +
                               "': " + std::strerror(child_errno),
                           "spawn_failed",
                           "Check server_command and working_directory."};
    }

    pid_ = pid;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];
    static_cast<void>(fcntl(stdout_fd_, F_SETFL, fcntl(stdout_fd_, F_GETFL, 0) | O_NONBLOCK));
    static_cast<void>(fcntl(stderr_fd_, F_SETFL, fcntl(stderr_fd_, F_GETFL, 0) | O_NONBLOCK));

    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        exited_ = false;
    }
    stderr_buffer_.clear();
    stop_requested_ = false;
    running_ = true;
    reader_thread_ = std::thread(&ProcessSupervisor::reader_loop, this);

    LOG_INFO("Started MCP server: " + spec.command + " (pid " + std::to_string(pid_) + ")");
    return core::errors::ok();
}

void ProcessSupervisor::stop() {
    if (pid_ <= 0) {
        return;
    }

    stop_requested_ = true;
    if (wake_fd_[1] >= 0) {
        const char byte = 'x';
        static_cast<void>(::write(wake_fd_[1], &byte, 1));
    }
    close_stdin();

    {
        std::unique_lock<std::mutex> lock(exit_mutex_);
        if (!exited_) {
            LOG_INFO("Stopping MCP server (pid " + std::to_string(pid_) + ")");
            static_cast<void>(kill(pid_, SIGTERM));
            if (!exit_cv_.wait_for(lock, kTerminateGrace, [this] { return exited_; })) {
                LOG_WARN("MCP server ignored SIGTERM, sending SIGKILL");
                static_cast<void>(kill(pid_, SIGKILL));
            }
        }
    }

    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    close_fds();
    pid_ = -1;
    running_ = false;
}

core::errors::Status ProcessSupervisor::write(std::string_view bytes) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0 || !running_) {
        return BridgeError{ErrorCategory::ProcessExit, "MCP process stdin is not available.",
                           "stdin_write_failed"};
    }

    std::size_t offset = 0;
    while (offset < bytes.size()) {
        const ssize_t n = ::write(stdin_fd_, bytes.data() + offset, bytes.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return BridgeError{ErrorCategory::ProcessExit,
                               "Failed to write to MCP process stdin: " +
                                   std::string(std::strerror(errno)),
                               "stdin_write_failed"};
        }
        offset += static_cast<std::size_t>(n);
    }
    return core::errors::ok();
}

void ProcessSupervisor::reader_loop() {
    const auto forward_stdout = [this](std::string_view chunk) {
        if (on_stdout_) {
            on_stdout_(chunk);
        }
    };
    const auto forward_stderr = [this](std::string_view chunk) { log_stderr(chunk); };

    bool stdout_open = true;
    bool stderr_open = true;
    while ((stdout_open || stderr_open) && !stop_requested_) {
        pollfd fds[3];
        nfds_t nfds = 0;
        fds[nfds++] = pollfd{wake_fd_[0], POLLIN, 0};
        if (stdout_open) {
            fds[nfds++] = pollfd{stdout_fd_, POLLIN, 0};
        }
        if (stderr_open) {
            fds[nfds++] = pollfd{stderr_fd_, POLLIN, 0};
        }

        const int ready = poll(fds, nfds, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("poll() failed on MCP process pipes: " + std::string(std::strerror(errno)));
            break;
        }
        if ((fds[0].revents & POLLIN) != 0) {
            break;
        }

        for (nfds_t i = 1; i < nfds; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == stdout_fd_) {
                stdout_open = drain_pipe(stdout_fd_, forward_stdout);
            } else if (fds[i].fd == stderr_fd_) {
                stderr_open = drain_pipe(stderr_fd_, forward_stderr);
            }
        }
    }

    if (!stderr_buffer_.empty()) {
        LOG_WARN("[mcp stderr] " + stderr_buffer_);
        stderr_buffer_.clear();
    }

    int status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(pid_, &status, 0);
    } while (waited < 0 && errno == EINTR);
    const int exit_code = waited == pid_ ? decode_status(status) : -1;

    running_ = false;
    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        exited_ = true;
    }
    exit_cv_.notify_all();

    if (stop_requested_) {
        LOG_INFO("MCP server stopped (exit code " + std::to_string(exit_code) + ")");
        return;
    }

    LOG_WARN("MCP server exited unexpectedly (exit code " + std::to_string(exit_code) + ")");
    if (on_exit_) {
        on_exit_(exit_code);
    }
}

void ProcessSupervisor::log_stderr(std::string_view chunk) {
    stderr_buffer_.append(chunk.data(), chunk.size());
    std::size_t start = 0;
    while (true) {
        const auto newline = stderr_buffer_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        if (newline > start) {
            LOG_WARN("[mcp stderr] " + stderr_buffer_.substr(start, newline - start));
        }
        start = newline + 1;
    }
    stderr_buffer_.erase(0, start);
}

void ProcessSupervisor::close_stdin() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    close_fd(stdin_fd_);
}

void ProcessSupervisor::close_fds() {
    close_stdin();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_pipe(wake_fd_);
}

}  // namespace bridge::transport
