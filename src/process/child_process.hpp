#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>

namespace runguard::process {

// Owning handle to a spawned child. Closes its pipe ends and reaps the child on
// destruction; a child still running at that point is killed first.
class ChildProcess {
public:
    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    // Parent ends of the child's stdio pipes, -1 when not piped.
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    // Queues text for the child's stdin. The pipe is closed once it is written.
    void set_pending_input(std::string text);

    // Writes as much queued input as the pipe accepts without blocking.
    void feed_stdin();
    void close_stdin();

    // Non-blocking exit check. Safe to call from several threads.
    // Throws std::system_error when the child can no longer be waited on.
    std::optional<int> poll();

    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    std::optional<int> exit_code() const;

private:
    static int decode_status(int status);

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    std::string pending_input_;
    std::size_t input_offset_ = 0;

    mutable std::mutex mutex_;
    std::optional<int> exit_code_;
};

}  // namespace runguard::process
