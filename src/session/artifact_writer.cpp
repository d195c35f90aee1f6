#include "session/artifact_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <optional>
#include <utility>
#include <nlohmann/json.hpp>

namespace runguard::session {

using core::errors::ErrorCategory;
using core::errors::RunError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

template <typename T>
json optional_to_json(const std::optional<T>& value) {
    return value.has_value() ? json(value.value()) : json(nullptr);
}

json request_to_json(const protocol::RunRequest& request) {
    json payload;
    payload["entry_file"] = request.entry_file.string();
    payload["mode"] = protocol::to_string(request.mode);
    payload["timeout_seconds"] = optional_to_json(request.timeout_seconds);
    payload["has_stdin_text"] = request.stdin_text.has_value();
    payload["open_browser"] = request.open_browser;
    payload["verbose"] = request.verbose;
    return payload;
}

json result_to_json(const protocol::ExecutionResult& result) {
    json payload;
    payload["success"] = result.success;
    payload["mode"] = protocol::to_string(result.mode);
    payload["entry_file"] = result.entry_file.string();
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    payload["return_code"] = optional_to_json(result.return_code);
    payload["error"] = optional_to_json(result.error);
    payload["diagnostic_tail"] = optional_to_json(result.diagnostic_tail);
    payload["failure"] =
        result.failure.has_value() ? json(protocol::to_string(*result.failure)) : json(nullptr);
    payload["bound_url"] = optional_to_json(result.bound_url);
    payload["service_state"] = result.service_state.has_value()
                                   ? json(protocol::to_string(*result.service_state))
                                   : json(nullptr);
    payload["duration_ms"] = result.duration_ms;
    return payload;
}

// Child output is not guaranteed to be valid UTF-8.
std::string dump_event(const json& event) {
    return event.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path workspace_root,
                               std::filesystem::path artifact_subdir)
    : workspace_root_(std::move(workspace_root)),
      artifact_subdir_(std::move(artifact_subdir)) {}

core::errors::Result<std::filesystem::path> ArtifactWriter::run_log_path(
    const std::string& run_id) const {
    if (run_id.empty()) {
        return RunError{ErrorCategory::Input, "Run ID cannot be empty.",
                        "invalid_run_id"};
    }

    std::error_code ec;
    if (!std::filesystem::exists(workspace_root_, ec) || ec) {
        return RunError{ErrorCategory::Input,
                        "Workspace root does not exist: " +
                            workspace_root_.string(),
                        "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return RunError{ErrorCategory::Input,
                        "Workspace root is not a directory: " +
                            workspace_root_.string(),
                        "invalid_workspace_root"};
    }

    const auto canonical_root =
        std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return RunError{ErrorCategory::Input,
                        "Unable to resolve workspace root: " +
                            workspace_root_.string(),
                        "invalid_workspace_root"};
    }

    auto artifacts_dir = canonical_root / artifact_subdir_;
    std::filesystem::create_directories(artifacts_dir, ec);
    if (ec) {
        return RunError{ErrorCategory::Internal,
                        "Unable to create artifacts directory: " +
                            artifacts_dir.string(),
                        "artifact_dir_create_failed"};
    }

    return artifacts_dir / (run_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> ArtifactWriter::append_event(
    const std::string& run_id, const std::string& event_json) const {
    auto run_path_result = run_log_path(run_id);
    if (core::errors::is_error(run_path_result)) {
        return core::errors::get_error(run_path_result);
    }
    const auto run_path = core::errors::get_value(run_path_result);

    std::ofstream out(run_path, std::ios::app);
    if (!out.is_open()) {
        return RunError{ErrorCategory::Internal,
                        "Unable to open artifact file: " + run_path.string(),
                        "artifact_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return RunError{ErrorCategory::Internal,
                        "Unable to write artifact event: " + run_path.string(),
                        "artifact_write_failed"};
    }

    return run_path;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_request(
    const std::string& run_id, const protocol::RunRequest& request) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "request";
    event["run_id"] = run_id;
    event["payload"] = request_to_json(request);
    return append_event(run_id, dump_event(event));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_result(
    const std::string& run_id, const protocol::ExecutionResult& result) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "result";
    event["run_id"] = run_id;
    event["payload"] = result_to_json(result);
    return append_event(run_id, dump_event(event));
}

}  // namespace runguard::session
