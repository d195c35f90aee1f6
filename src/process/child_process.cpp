#include "process/child_process.hpp"

#include <cerrno>
#include <signal.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>

namespace runguard::process {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

}  // namespace

ChildProcess::ChildProcess(const pid_t pid, const int stdin_fd,
                           const int stdout_fd, const int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::~ChildProcess() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (exit_code_.has_value() || pid_ <= 0) {
        return;
    }
    static_cast<void>(kill(pid_, SIGKILL));
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
}

int ChildProcess::decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void ChildProcess::set_pending_input(std::string text) {
    pending_input_ = std::move(text);
    input_offset_ = 0;
    if (pending_input_.empty()) {
        close_stdin();
    }
}

void ChildProcess::feed_stdin() {
    if (stdin_fd_ < 0) {
        return;
    }
    while (input_offset_ < pending_input_.size()) {
        const ssize_t n = write(stdin_fd_, pending_input_.data() + input_offset_,
                                pending_input_.size() - input_offset_);
        if (n > 0) {
            input_offset_ += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        // EPIPE: the child stopped reading.
        break;
    }
    close_stdin();
}

void ChildProcess::close_stdin() {
    close_fd(stdin_fd_);
}

std::optional<int> ChildProcess::poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exit_code_.has_value()) {
        return exit_code_;
    }

    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &status, WNOHANG);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "waitpid failed for pid " + std::to_string(pid_));
    }
    if (waited == pid_) {
        exit_code_ = decode_status(status);
    }
    return exit_code_;
}

std::optional<int> ChildProcess::wait_for(const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto code = poll();
        if (code.has_value() || std::chrono::steady_clock::now() >= deadline) {
            return code;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

std::optional<int> ChildProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

}  // namespace runguard::process
