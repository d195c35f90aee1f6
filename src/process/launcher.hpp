#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/run_errors.hpp"
#include "process/child_process.hpp"
#include "protocol/execution_result.hpp"

namespace runguard::process {

struct ResolvedEntry {
    std::filesystem::path file;
    std::filesystem::path working_directory;
};

// Absolute path of the entry file plus the directory the child runs in.
// Fails with code "file_not_found" when nothing exists at the path.
core::errors::Result<ResolvedEntry> resolve_entry(const std::filesystem::path& entry_file);

struct LaunchOptions {
    protocol::ExecutionMode mode = protocol::ExecutionMode::Console;
    std::vector<std::string> interpreter;
    bool pipe_stdin = false;   // Console mode; captured mode always pipes stdin
    int stderr_sink_fd = -1;   // Console mode only
};

// Console: inherits stdin/stdout, stderr goes to the sink.
// Service: stdout+stderr merged into one pipe, stdin from /dev/null, own process group.
// Captured: stdin, stdout and stderr are three separate pipes.
core::errors::Result<std::unique_ptr<ChildProcess>> launch(const ResolvedEntry& entry,
                                                           const LaunchOptions& options);

// Unlinked temporary file that collects a console child's stderr.
class StderrSink {
    struct Token {};

public:
    static core::errors::Result<std::unique_ptr<StderrSink>> create();

    // Only reachable through create().
    StderrSink(Token, int fd) : fd_(fd) {}
    ~StderrSink();

    StderrSink(const StderrSink&) = delete;
    StderrSink& operator=(const StderrSink&) = delete;

    int fd() const { return fd_; }
    std::string read_all() const;

private:
    int fd_;
};

}  // namespace runguard::process
