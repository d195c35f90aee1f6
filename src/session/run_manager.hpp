#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/run_errors.hpp"
#include "protocol/execution_result.hpp"
#include "protocol/run_request.hpp"

namespace runguard::session {

enum class RunState {
    Created,
    Running,
    Completed,
    Failed,
    Cancelled
};

struct RunRecord {
    std::string run_id;
    protocol::RunRequest request;
    RunState state = RunState::Created;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

class RunManager {
public:
    core::errors::Result<std::string> start_run(const protocol::RunRequest& request);
    core::errors::Result<std::shared_ptr<std::atomic_bool>> get_cancel_token(
        const std::string& run_id) const;

    // Completed on success, Failed otherwise. A run whose token was set is
    // Cancelled regardless of the outcome.
    core::errors::Result<RunState> record_result(const std::string& run_id,
                                                 const protocol::ExecutionResult& result);

    static std::string to_string(RunState state);

private:
    core::errors::Result<RunState> mark_completed(const std::string& run_id);
    core::errors::Result<RunState> mark_failed(const std::string& run_id,
                                               const std::string& reason);
    core::errors::Result<RunState> transition_to_terminal(
        const std::string& run_id, RunState next_state,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(RunState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunRecord> runs_;
};

}  // namespace runguard::session
