#pragma once

#include <atomic>
#include <functional>
#include <iostream>
#include <memory>
#include "core/config/runner_config.hpp"
#include "process/child_process.hpp"
#include "process/launcher.hpp"
#include "protocol/execution_result.hpp"
#include "protocol/run_request.hpp"
#include "runtime/service_session.hpp"

namespace runguard::runtime {

// Runs one entry file to a terminal outcome. Every failure is folded into the
// returned ExecutionResult; any process started by a call is gone when the
// call returns.
class Supervisor {
public:
    // Invoked once when a service run transitions to RUNNING.
    using SessionObserver = std::function<void(const ServiceSession&)>;

    explicit Supervisor(core::config::RunnerConfig config, std::ostream& echo = std::cout);

    protocol::ExecutionResult run(
        const protocol::RunRequest& request,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr,
        const SessionObserver& on_running = nullptr) const;

    const core::config::RunnerConfig& config() const { return config_; }

private:
    protocol::ExecutionResult run_console(
        const process::ResolvedEntry& entry, const protocol::RunRequest& request,
        const std::shared_ptr<std::atomic_bool>& cancel_token) const;

    protocol::ExecutionResult run_captured(
        const process::ResolvedEntry& entry, const protocol::RunRequest& request,
        const std::shared_ptr<std::atomic_bool>& cancel_token) const;

    protocol::ExecutionResult run_service(
        const process::ResolvedEntry& entry, const protocol::RunRequest& request,
        const std::shared_ptr<std::atomic_bool>& cancel_token,
        const SessionObserver& on_running) const;

    // SIGTERM to the whole tree, SIGKILL to whatever outlives the grace period.
    void stop_tree(process::ChildProcess& child) const;

    // Immediate SIGKILL to the tree, used once waiting can no longer be trusted.
    void force_kill(process::ChildProcess& child) const;

    core::config::RunnerConfig config_;
    std::ostream& echo_;
};

}  // namespace runguard::runtime
