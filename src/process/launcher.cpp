#include "process/launcher.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace runguard::process {

using core::errors::ErrorCategory;
using core::errors::RunError;
using protocol::ExecutionMode;

namespace {

struct Pipe {
    int read_end = -1;
    int write_end = -1;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pipe(Pipe& p) {
    close_fd(p.read_end);
    close_fd(p.write_end);
}

bool open_pipe(Pipe& p) {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    p.read_end = fds[0];
    p.write_end = fds[1];
    return true;
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Writing to a child that stopped reading stdin must fail with EPIPE instead
// of killing us.
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { static_cast<void>(signal(SIGPIPE, SIG_IGN)); });
}

[[noreturn]] void report_and_exit(const int status_fd, const int exit_code) {
    const int err = errno;
    static_cast<void>(write(status_fd, &err, sizeof(err)));
    _exit(exit_code);
}

RunError launch_error(const std::string& message) {
    return RunError{ErrorCategory::Launch, message, "launch_failed"};
}

}  // namespace

core::errors::Result<ResolvedEntry> resolve_entry(const std::filesystem::path& entry_file) {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(entry_file, ec);
    if (ec || entry_file.empty()) {
        return RunError{ErrorCategory::Input,
                        "file not found " + entry_file.string(), "file_not_found"};
    }
    const auto normalized = absolute.lexically_normal();
    if (!std::filesystem::exists(normalized, ec) || ec) {
        return RunError{ErrorCategory::Input, "file not found " + normalized.string(),
                        "file_not_found",
                        "The entry file must exist before the run starts."};
    }
    if (std::filesystem::is_directory(normalized, ec)) {
        return RunError{ErrorCategory::Input,
                        "entry is a directory: " + normalized.string(),
                        "file_not_found"};
    }
    return ResolvedEntry{normalized, normalized.parent_path()};
}

core::errors::Result<std::unique_ptr<ChildProcess>> launch(const ResolvedEntry& entry,
                                                           const LaunchOptions& options) {
    // argv is built before fork; the child only calls async-signal-safe functions.
    std::vector<std::string> argv_storage = options.interpreter;
    argv_storage.push_back(entry.file.string());
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    const std::string cwd = entry.working_directory.string();

    const bool pipe_stdin =
        options.mode == ExecutionMode::Captured ||
        (options.mode == ExecutionMode::Console && options.pipe_stdin);
    const bool pipe_stdout = options.mode != ExecutionMode::Console;
    const bool pipe_stderr = options.mode == ExecutionMode::Captured;

    Pipe in_pipe;
    Pipe out_pipe;
    Pipe err_pipe;
    Pipe status_pipe;
    auto close_all = [&]() {
        close_pipe(in_pipe);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(status_pipe);
    };

    if ((pipe_stdin && !open_pipe(in_pipe)) || (pipe_stdout && !open_pipe(out_pipe)) ||
        (pipe_stderr && !open_pipe(err_pipe)) || !open_pipe(status_pipe)) {
        const std::string reason = std::strerror(errno);
        close_all();
        return launch_error("Failed to create process pipes: " + reason);
    }
    if (pipe_stdin) {
        ignore_sigpipe_once();
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_all();
        return launch_error("Failed to fork process: " + reason);
    }

    if (pid == 0) {
        const int status_fd = status_pipe.write_end;
        if (options.mode == ExecutionMode::Service && setpgid(0, 0) != 0) {
            report_and_exit(status_fd, 126);
        }
        if (chdir(cwd.c_str()) != 0) {
            report_and_exit(status_fd, 126);
        }

        if (pipe_stdin) {
            if (dup2(in_pipe.read_end, STDIN_FILENO) < 0) {
                report_and_exit(status_fd, 126);
            }
        } else if (options.mode == ExecutionMode::Service) {
            const int null_fd = open("/dev/null", O_RDONLY);
            if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0) {
                report_and_exit(status_fd, 126);
            }
            static_cast<void>(close(null_fd));
        }

        if (pipe_stdout && dup2(out_pipe.write_end, STDOUT_FILENO) < 0) {
            report_and_exit(status_fd, 126);
        }

        if (options.mode == ExecutionMode::Service) {
            if (dup2(out_pipe.write_end, STDERR_FILENO) < 0) {
                report_and_exit(status_fd, 126);
            }
        } else if (pipe_stderr) {
            if (dup2(err_pipe.write_end, STDERR_FILENO) < 0) {
                report_and_exit(status_fd, 126);
            }
        } else if (options.stderr_sink_fd >= 0) {
            if (dup2(options.stderr_sink_fd, STDERR_FILENO) < 0) {
                report_and_exit(status_fd, 126);
            }
        }

        // Every pipe end is O_CLOEXEC; only the dup2'd copies survive exec.
        execvp(argv[0], argv.data());
        report_and_exit(status_fd, 127);
    }

    if (options.mode == ExecutionMode::Service) {
        // Mirrors the child's own setpgid so the group exists before we signal it.
        static_cast<void>(setpgid(pid, pid));
    }

    close_fd(in_pipe.read_end);
    close_fd(out_pipe.write_end);
    close_fd(err_pipe.write_end);
    close_fd(status_pipe.write_end);

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(status_pipe.read_end, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe.read_end);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_all();
        return launch_error("Failed to start " + argv_storage.front() + ": " +
                           std::strerror(child_errno));
    }

    for (const int fd : {in_pipe.write_end, out_pipe.read_end, err_pipe.read_end}) {
        if (fd >= 0) {
            set_nonblocking(fd);
        }
    }

    LOG_DEBUG("Launcher: spawned pid " + std::to_string(pid) + " in " +
              protocol::to_string(options.mode) + " mode for " + entry.file.string());
    return std::make_unique<ChildProcess>(pid, in_pipe.write_end, out_pipe.read_end,
                                          err_pipe.read_end);
}

core::errors::Result<std::unique_ptr<StderrSink>> StderrSink::create() {
    std::string pattern = "/tmp/runguard_stderr_XXXXXX";
    const int fd = mkostemp(pattern.data(), O_CLOEXEC);
    if (fd < 0) {
        return launch_error(std::string("Failed to create stderr sink: ") +
                            std::strerror(errno));
    }
    static_cast<void>(unlink(pattern.c_str()));
    return std::make_unique<StderrSink>(Token{}, fd);
}

StderrSink::~StderrSink() {
    close_fd(fd_);
}

std::string StderrSink::read_all() const {
    std::string contents;
    char buffer[4096];
    off_t offset = 0;
    while (true) {
        const ssize_t n = pread(fd_, buffer, sizeof(buffer), offset);
        if (n > 0) {
            contents.append(buffer, static_cast<std::size_t>(n));
            offset += n;
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    return contents;
}

}  // namespace runguard::process
