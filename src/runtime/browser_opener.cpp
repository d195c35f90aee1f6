#include "runtime/browser_opener.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace runguard::runtime {

using core::errors::ErrorCategory;
using core::errors::RunError;

core::errors::Result<bool> open_browser(const std::string& command, const std::string& url) {
    if (command.empty()) {
        return RunError{ErrorCategory::Config, "No browser command configured.",
                        "browser_not_configured"};
    }

    std::string program = command;
    std::string target = url;
    std::vector<char*> argv = {program.data(), target.data(), nullptr};

    // Double fork so the opener is re-parented away from us and never left a zombie.
    const pid_t pid = fork();
    if (pid < 0) {
        return RunError{ErrorCategory::Launch,
                        std::string("can't open browser: ") + std::strerror(errno),
                        "browser_launch_failed"};
    }
    if (pid == 0) {
        static_cast<void>(setsid());
        if (fork() != 0) {
            _exit(0);
        }
        const int null_fd = open("/dev/null", O_RDWR);
        if (null_fd >= 0) {
            static_cast<void>(dup2(null_fd, STDIN_FILENO));
            static_cast<void>(dup2(null_fd, STDOUT_FILENO));
            static_cast<void>(dup2(null_fd, STDERR_FILENO));
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return true;
}

}  // namespace runguard::runtime
