#include "runtime/supervisor.hpp"

#include <cerrno>
#include <chrono>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "monitor/output_monitor.hpp"
#include "net/port_probe.hpp"
#include "process/process_tree.hpp"
#include "runtime/browser_opener.hpp"
#include "runtime/crash_detector.hpp"

namespace runguard::runtime {

using core::errors::get_error;
using core::errors::get_value;
using core::errors::is_error;
using process::ChildProcess;
using process::LaunchOptions;
using process::ResolvedEntry;
using protocol::ExecutionMode;
using protocol::ExecutionResult;
using protocol::FailureKind;
using protocol::RunRequest;
using protocol::ServiceState;

namespace {

using Clock = std::chrono::steady_clock;

bool is_cancelled(const std::shared_ptr<std::atomic_bool>& cancel_token) {
    return cancel_token && cancel_token->load();
}

bool has_timed_out(const Clock::time_point started,
                   const std::optional<double>& timeout_seconds) {
    if (!timeout_seconds.has_value() || *timeout_seconds <= 0.0) {
        return false;
    }
    const std::chrono::duration<double> elapsed = Clock::now() - started;
    return elapsed.count() > *timeout_seconds;
}

std::string format_seconds(const double seconds) {
    std::ostringstream out;
    out << seconds;
    return out.str();
}

void fail(ExecutionResult& result, const FailureKind kind, std::string message) {
    result.success = false;
    result.failure = kind;
    result.error = std::move(message);
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        return;
    }
}

}  // namespace

Supervisor::Supervisor(core::config::RunnerConfig config, std::ostream& echo)
    : config_(std::move(config)), echo_(echo) {}

ExecutionResult Supervisor::run(const RunRequest& request,
                                std::shared_ptr<std::atomic_bool> cancel_token,
                                const SessionObserver& on_running) const {
    const auto started = Clock::now();

    ExecutionResult result;
    auto resolved = process::resolve_entry(request.entry_file);
    if (is_error(resolved)) {
        const auto& err = get_error(resolved);
        LOG_ERROR("Supervisor: " + err.message);
        fail(result, FailureKind::FileNotFound, err.message);
        result.mode = request.mode;
        result.entry_file = request.entry_file;
        return result;
    }
    const ResolvedEntry& entry = get_value(resolved);

    switch (request.mode) {
        case ExecutionMode::Service:
            result = run_service(entry, request, cancel_token, on_running);
            break;
        case ExecutionMode::Captured:
            result = run_captured(entry, request, cancel_token);
            break;
        case ExecutionMode::Console:
        default:
            result = run_console(entry, request, cancel_token);
            break;
    }

    result.mode = request.mode;
    result.entry_file = entry.file;
    result.duration_ms =
        std::chrono::duration<double, std::milli>(Clock::now() - started).count();

    if (result.success) {
        LOG_INFO("Supervisor: " + protocol::to_string(request.mode) + " run succeeded");
    } else {
        LOG_WARN("Supervisor: " + protocol::to_string(request.mode) + " run failed [" +
                 (result.failure ? protocol::to_string(*result.failure) : "unknown") +
                 "]: " + result.error.value_or(""));
    }
    return result;
}

ExecutionResult Supervisor::run_console(
    const ResolvedEntry& entry, const RunRequest& request,
    const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    ExecutionResult result;

    auto sink_result = process::StderrSink::create();
    if (is_error(sink_result)) {
        fail(result, FailureKind::LaunchFailure, get_error(sink_result).message);
        return result;
    }
    const auto sink = std::move(get_value(sink_result));

    LaunchOptions options;
    options.mode = ExecutionMode::Console;
    options.interpreter = config_.interpreter;
    options.pipe_stdin = request.stdin_text.has_value();
    options.stderr_sink_fd = sink->fd();

    auto launched = process::launch(entry, options);
    if (is_error(launched)) {
        fail(result, FailureKind::LaunchFailure, get_error(launched).message);
        return result;
    }
    const auto child = std::move(get_value(launched));
    if (request.stdin_text.has_value()) {
        child->set_pending_input(*request.stdin_text);
    }

    const auto started = Clock::now();
    const std::chrono::milliseconds tick(config_.console_tick_ms);

    try {
        while (true) {
            if (is_cancelled(cancel_token)) {
                LOG_INFO("Supervisor: stop requested, terminating console program");
                stop_tree(*child);
                fail(result, FailureKind::Cancelled, "run cancelled");
                result.stderr_text = sink->read_all();
                return result;
            }

            child->feed_stdin();

            if (const auto code = child->poll()) {
                result.return_code = *code;
                result.success = (*code == 0);
                result.stderr_text = sink->read_all();
                if (!result.success) {
                    fail(result, FailureKind::NonZeroExit,
                         "failed to run (exit code " + std::to_string(*code) + ")");
                }
                return result;
            }

            if (has_timed_out(started, request.timeout_seconds)) {
                LOG_WARN("Supervisor: console program exceeded " +
                         format_seconds(*request.timeout_seconds) + "s, terminating");
                stop_tree(*child);
                fail(result, FailureKind::Timeout,
                     "timeout " + format_seconds(*request.timeout_seconds) + " seconds");
                result.stderr_text = sink->read_all();
                return result;
            }

            std::this_thread::sleep_for(tick);
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Supervisor: console run aborted: ") + e.what());
        force_kill(*child);
        fail(result, FailureKind::RunException,
             std::string("Execution exception: ") + e.what());
        result.stderr_text = sink->read_all();
    }
    return result;
}

ExecutionResult Supervisor::run_captured(
    const ResolvedEntry& entry, const RunRequest& request,
    const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    ExecutionResult result;

    LaunchOptions options;
    options.mode = ExecutionMode::Captured;
    options.interpreter = config_.interpreter;

    auto launched = process::launch(entry, options);
    if (is_error(launched)) {
        fail(result, FailureKind::LaunchFailure, get_error(launched).message);
        return result;
    }
    const auto child = std::move(get_value(launched));
    child->set_pending_input(request.stdin_text.value_or(""));

    const auto started = Clock::now();
    const std::chrono::milliseconds tick(config_.console_tick_ms);
    const std::chrono::milliseconds grace(config_.termination_grace_ms);

    bool stdout_open = child->stdout_fd() >= 0;
    bool stderr_open = child->stderr_fd() >= 0;
    std::optional<Clock::time_point> exited_at;

    try {
        while (true) {
            if (!exited_at.has_value()) {
                if (is_cancelled(cancel_token)) {
                    stop_tree(*child);
                    fail(result, FailureKind::Cancelled, "run cancelled");
                    break;
                }
                if (has_timed_out(started, request.timeout_seconds)) {
                    stop_tree(*child);
                    fail(result, FailureKind::Timeout,
                         "timeout " + format_seconds(*request.timeout_seconds) + " seconds");
                    break;
                }
                child->feed_stdin();
            }

            pollfd fds[2];
            nfds_t nfds = 0;
            if (stdout_open) {
                fds[nfds].fd = child->stdout_fd();
                fds[nfds].events = POLLIN;
                ++nfds;
            }
            if (stderr_open) {
                fds[nfds].fd = child->stderr_fd();
                fds[nfds].events = POLLIN;
                ++nfds;
            }
            if (nfds > 0) {
                static_cast<void>(::poll(fds, nfds, static_cast<int>(tick.count())));
            } else {
                std::this_thread::sleep_for(tick);
            }

            drain_pipe(child->stdout_fd(), stdout_open, result.stdout_text);
            drain_pipe(child->stderr_fd(), stderr_open, result.stderr_text);

            if (!exited_at.has_value() && child->poll().has_value()) {
                exited_at = Clock::now();
            }
            if (exited_at.has_value() &&
                ((!stdout_open && !stderr_open) || Clock::now() - *exited_at > grace)) {
                break;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Supervisor: captured run aborted: ") + e.what());
        force_kill(*child);
        fail(result, FailureKind::RunException,
             std::string("Execution exception: ") + e.what());
        return result;
    }

    // Whatever was written before the stop is still in the pipes.
    drain_pipe(child->stdout_fd(), stdout_open, result.stdout_text);
    drain_pipe(child->stderr_fd(), stderr_open, result.stderr_text);

    result.return_code = child->exit_code();
    if (result.failure.has_value()) {
        return result;
    }
    result.success = result.return_code.has_value() && *result.return_code == 0;
    if (!result.success) {
        fail(result, FailureKind::NonZeroExit,
             "failed to run (exit code " + std::to_string(result.return_code.value_or(-1)) +
                 ")");
    }
    return result;
}

ExecutionResult Supervisor::run_service(
    const ResolvedEntry& entry, const RunRequest& request,
    const std::shared_ptr<std::atomic_bool>& cancel_token,
    const SessionObserver& on_running) const {
    ExecutionResult result;
    result.service_state = ServiceState::Starting;

    LaunchOptions options;
    options.mode = ExecutionMode::Service;
    options.interpreter = config_.interpreter;

    LOG_INFO("Supervisor: starting service " + entry.file.string());
    auto launched = process::launch(entry, options);
    if (is_error(launched)) {
        fail(result, FailureKind::LaunchFailure, get_error(launched).message);
        return result;
    }
    // Declared before the monitor: the monitor reads the child's pipe and must
    // be gone before the child closes it.
    const auto child = std::move(get_value(launched));

    auto buffer = std::make_shared<monitor::OutputBuffer>();
    auto exited = [&child]() {
        try {
            return child->poll().has_value();
        } catch (const std::system_error& e) {
            LOG_WARN(std::string("Supervisor: lost track of service process: ") + e.what());
            return true;
        }
    };

    monitor::OutputMonitor output_monitor(child->stdout_fd(), buffer, exited, echo_);
    output_monitor.start();

    const std::chrono::milliseconds grace(config_.termination_grace_ms);
    ServiceSession session;
    session.pid = child->pid();
    session.output = buffer;
    session.started_at = Clock::now();

    auto finish = [&](const ServiceState state) {
        session.state = state;
        result.service_state = state;
        output_monitor.finish(grace);
        result.stdout_text = buffer->joined();
    };
    auto report_crash = [&](std::string tail) {
        LOG_ERROR("Supervisor: crash detected in service output");
        stop_tree(*child);
        fail(result, FailureKind::CrashDetected, "crash detected in service output");
        result.diagnostic_tail = std::move(tail);
        result.return_code = child->exit_code();
        finish(ServiceState::Crashed);
    };

    try {
        const net::PortProbe probe(config_);
        auto bound = probe.wait_for_bind(exited, cancel_token);
        if (is_error(bound)) {
            const auto& err = get_error(bound);
            stop_tree(*child);

            ServiceState state = ServiceState::StartTimeout;
            FailureKind kind = FailureKind::ServerStartTimeout;
            if (err.code == "server_never_bound") {
                state = ServiceState::NeverBound;
                kind = FailureKind::ServerNeverBound;
            } else if (err.code == "probe_cancelled") {
                state = ServiceState::CancelledStopped;
                kind = FailureKind::Cancelled;
            }
            fail(result, kind, err.message);
            result.return_code = child->exit_code();
            finish(state);
            result.diagnostic_tail = find_crash_tail(buffer->snapshot(), config_.crash_marker);
            return result;
        }

        const auto& endpoint = get_value(bound);
        session.bound_url = endpoint.url;
        session.state = ServiceState::Running;
        session.started_at = Clock::now();
        result.bound_url = endpoint.url;
        result.service_state = ServiceState::Running;
        LOG_INFO("Supervisor: service running at " + endpoint.url);

        if (request.open_browser) {
            auto opened = open_browser(config_.browser_command, endpoint.url);
            if (is_error(opened)) {
                LOG_WARN(get_error(opened).message);
            }
        }
        if (on_running) {
            on_running(session);
        }

        monitor::OutputCursor cursor;
        const std::chrono::milliseconds tick(config_.service_tick_ms);
        while (true) {
            if (is_cancelled(cancel_token)) {
                LOG_INFO("Supervisor: stop requested, stopping service");
                stop_tree(*child);
                result.success = true;
                finish(ServiceState::CancelledStopped);
                return result;
            }

            auto batch = buffer->read_since(cursor);
            if (auto tail = find_crash_tail(batch, config_.crash_marker)) {
                report_crash(std::move(*tail));
                return result;
            }

            if (exited()) {
                // Pick up lines the monitor had not delivered when the exit was seen.
                output_monitor.wait_finished(grace);
                batch = buffer->read_since(cursor);
                if (auto tail = find_crash_tail(batch, config_.crash_marker)) {
                    report_crash(std::move(*tail));
                    return result;
                }
                stop_tree(*child);
                fail(result, FailureKind::UnexpectedExit, "service stopped unexpectedly");
                result.return_code = child->exit_code();
                finish(ServiceState::Exited);
                return result;
            }

            if (has_timed_out(session.started_at, request.timeout_seconds)) {
                LOG_INFO("Supervisor: service ran for " +
                         format_seconds(*request.timeout_seconds) + "s, stopping");
                stop_tree(*child);
                result.success = true;
                finish(ServiceState::TimedOutStopped);
                return result;
            }

            std::this_thread::sleep_for(tick);
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Supervisor: service run aborted: ") + e.what());
        force_kill(*child);
        fail(result, FailureKind::RunException,
             std::string("Execution exception: ") + e.what());
        finish(session.state);
    }
    return result;
}

void Supervisor::stop_tree(ChildProcess& child) const {
    const std::chrono::milliseconds grace(config_.termination_grace_ms);

    std::vector<pid_t> members = {child.pid()};
    auto signalled = process::terminate_tree(child.pid(), SIGTERM);
    if (is_error(signalled)) {
        LOG_WARN("Supervisor: " + get_error(signalled).message);
    } else {
        members = get_value(signalled);
    }

    const bool root_gone = child.wait_for(grace).has_value();
    if (root_gone && process::wait_until_gone(members, grace)) {
        return;
    }

    LOG_WARN("Supervisor: process tree of pid " + std::to_string(child.pid()) +
             " outlived SIGTERM, sending SIGKILL");
    process::kill_survivors(members);
    if (!root_gone) {
        static_cast<void>(kill(child.pid(), SIGKILL));
        static_cast<void>(child.wait_for(grace));
    }
    if (!process::wait_until_gone(members, grace)) {
        LOG_ERROR("Supervisor: part of the process tree of pid " +
                  std::to_string(child.pid()) + " is still running");
    }
}

void Supervisor::force_kill(ChildProcess& child) const {
    std::vector<pid_t> members = process::list_descendants(child.pid());
    process::kill_survivors(members);
    static_cast<void>(kill(child.pid(), SIGKILL));
}

}  // namespace runguard::runtime
