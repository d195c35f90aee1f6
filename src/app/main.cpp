#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/run_id.hpp"
#include "core/config/runner_config.hpp"
#include "core/errors/run_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/execution_result.hpp"
#include "runtime/supervisor.hpp"
#include "session/artifact_writer.hpp"
#include "session/run_manager.hpp"

namespace {

// Raw pointer to the active run's token; the handler only performs a lock-free store.
std::atomic<std::atomic_bool*> g_active_cancel_token{nullptr};

extern "C" void handle_interrupt(int) {
    std::atomic_bool* token = g_active_cancel_token.load();
    if (token != nullptr) {
        token->store(true);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Generate a bootstrap ID so early log lines are tagged too
    std::string bootstrap_run_id = runguard::core::config::generate_run_id();
    runguard::core::logging::Logger::get().set_run_id(bootstrap_run_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = runguard::app::cli::parse_and_validate(argc, argv);
    if (runguard::core::errors::is_error(parsed)) {
        const auto& err = runguard::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& options = runguard::core::errors::get_value(parsed);
    const auto& req = options.request;
    if (req.verbose) {
        runguard::core::logging::Logger::get().set_min_level(
            runguard::core::logging::LogLevel::DEBUG);
    }

    // 3. Load runner configuration (defaults unless --config is given)
    runguard::core::config::RunnerConfig config;
    if (options.config_file.has_value()) {
        auto loaded = runguard::core::config::load_runner_config(options.config_file.value());
        if (runguard::core::errors::is_error(loaded)) {
            const auto& err = runguard::core::errors::get_error(loaded);
            LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
            return 3;
        }
        config = runguard::core::errors::get_value(loaded);
        LOG_DEBUG("Loaded configuration from " + options.config_file->string());
    }

    runguard::session::RunManager run_manager;
    auto started = run_manager.start_run(req);
    if (runguard::core::errors::is_error(started)) {
        const auto& err = runguard::core::errors::get_error(started);
        LOG_ERROR("Failed to start run [" + err.code + "]: " + err.message);
        return 3;
    }

    const std::string run_id = runguard::core::errors::get_value(started);
    runguard::core::logging::Logger::get().set_run_id(run_id);
    LOG_INFO("Run started: " + run_id + " (" + runguard::protocol::to_string(req.mode) +
             " mode)");

    auto cancel_token_result = run_manager.get_cancel_token(run_id);
    if (runguard::core::errors::is_error(cancel_token_result)) {
        const auto& err = runguard::core::errors::get_error(cancel_token_result);
        LOG_ERROR("Failed to get cancellation token [" + err.code + "]: " +
                  err.message);
        return 3;
    }
    auto cancel_token = runguard::core::errors::get_value(cancel_token_result);

    // 4. Ctrl+C stops the run at the next tick instead of killing us mid-run
    g_active_cancel_token.store(cancel_token.get());
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    const auto artifact_root = std::filesystem::absolute(req.entry_file).parent_path();
    runguard::session::ArtifactWriter artifact_writer(artifact_root, config.artifact_subdir);
    bool artifacts_enabled = true;
    auto request_artifact = artifact_writer.write_request(run_id, req);
    if (runguard::core::errors::is_error(request_artifact)) {
        const auto& err = runguard::core::errors::get_error(request_artifact);
        LOG_WARN("Run artifacts disabled [" + err.code + "]: " + err.message);
        artifacts_enabled = false;
    }

    // 5. Run to a terminal outcome
    runguard::runtime::Supervisor supervisor(config);
    if (req.mode == runguard::protocol::ExecutionMode::Service) {
        LOG_INFO("Press Ctrl+C to stop the service.");
    }
    const auto result = supervisor.run(
        req, cancel_token, [](const runguard::runtime::ServiceSession& session) {
            LOG_INFO("Service pid " + std::to_string(session.pid) + " listening at " +
                     session.bound_url.value_or("?"));
        });

    g_active_cancel_token.store(nullptr);
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    if (result.return_code.has_value()) {
        LOG_INFO("Return code: " + std::to_string(*result.return_code));
    }
    if (!result.stderr_text.empty() && !result.success) {
        LOG_INFO("Captured stderr:\n" + result.stderr_text);
    }
    if (result.diagnostic_tail.has_value()) {
        LOG_ERROR("Diagnostic tail:\n" + *result.diagnostic_tail);
    }
    if (req.mode == runguard::protocol::ExecutionMode::Captured && !result.stdout_text.empty()) {
        std::cout << result.stdout_text << std::flush;
    }

    auto recorded = run_manager.record_result(run_id, result);
    if (runguard::core::errors::is_error(recorded)) {
        const auto& err = runguard::core::errors::get_error(recorded);
        LOG_ERROR("Failed to record run result [" + err.code + "]: " + err.message);
        return 3;
    }
    LOG_INFO("Final run state: " +
             runguard::session::RunManager::to_string(runguard::core::errors::get_value(recorded)));

    if (artifacts_enabled) {
        auto final_artifact = artifact_writer.write_result(run_id, result);
        if (runguard::core::errors::is_error(final_artifact)) {
            const auto& err = runguard::core::errors::get_error(final_artifact);
            LOG_ERROR("Failed to write result artifact [" + err.code + "]: " +
                      err.message);
            return 6;
        }
        LOG_INFO("Artifacts: " + runguard::core::errors::get_value(final_artifact).string());
    }

    return result.success ? 0 : 1;
}
