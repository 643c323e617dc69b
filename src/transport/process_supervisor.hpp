#pragma once

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <thread>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace bridge::transport {

struct ProcessSpec {
    std::string command;
    std::vector<std::string> args;
    std::filesystem::path working_directory = ".";
};

// Owns one child process and its three standard streams. A reader thread
// forwards stdout bytes to `on_stdout`, logs stderr line by line and reports
// the exit status once the child has been reaped.
class ProcessSupervisor {
public:
    using StdoutHandler = std::function<void(std::string_view chunk)>;
    using ExitHandler = std::function<void(int exit_code)>;

    ProcessSupervisor(StdoutHandler on_stdout, ExitHandler on_exit);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    core::errors::Status start(const ProcessSpec& spec);

    // Closes stdin, then SIGTERM, then SIGKILL after a grace period. The exit
    // handler is not invoked for a stop requested here. Safe to call twice.
    void stop();

    // Writes all of `bytes` to the child's stdin.
    core::errors::Status write(std::string_view bytes);

    bool running() const { return running_.load(); }
    pid_t pid() const { return pid_; }

private:
    void reader_loop();
    void log_stderr(std::string_view chunk);
    void close_stdin();
    void close_fds();

    StdoutHandler on_stdout_;
    ExitHandler on_exit_;

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int wake_fd_[2] = {-1, -1};

    std::mutex write_mutex_;
    std::atomic_bool running_{false};
    std::atomic_bool stop_requested_{false};
    std::mutex exit_mutex_;
    std::condition_variable exit_cv_;
    bool exited_ = false;

    std::string stderr_buffer_;
    std::thread reader_thread_;
};

}  // namespace bridge::transport
