#pragma once

#include <filesystem>
#include <string>
#include "core/errors/run_errors.hpp"
#include "protocol/execution_result.hpp"
#include "protocol/run_request.hpp"

namespace runguard::session {

// Appends one JSON object per line to <root>/<subdir>/<run_id>.jsonl.
class ArtifactWriter {
public:
    explicit ArtifactWriter(std::filesystem::path workspace_root,
                            std::filesystem::path artifact_subdir = ".runguard_runs");

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& run_id, const protocol::RunRequest& request) const;

    core::errors::Result<std::filesystem::path> write_result(
        const std::string& run_id, const protocol::ExecutionResult& result) const;

    core::errors::Result<std::filesystem::path> run_log_path(
        const std::string& run_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& run_id, const std::string& event_json) const;

    std::filesystem::path workspace_root_;
    std::filesystem::path artifact_subdir_;
};

}  // namespace runguard::session
