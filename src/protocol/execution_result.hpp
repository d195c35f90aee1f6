#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace runguard::protocol {

enum class ExecutionMode {
    Console,
    Service,
    Captured
};

enum class FailureKind {
    FileNotFound,
    LaunchFailure,
    ServerNeverBound,
    ServerStartTimeout,
    CrashDetected,
    UnexpectedExit,
    NonZeroExit,
    Timeout,
    Cancelled,
    RunException
};

enum class ServiceState {
    Starting,
    Running,
    Crashed,
    Exited,
    TimedOutStopped,
    CancelledStopped,
    NeverBound,
    StartTimeout
};

struct ExecutionResult {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> return_code;
    std::optional<std::string> error;
    std::optional<std::string> diagnostic_tail;

    std::optional<FailureKind> failure;
    ExecutionMode mode = ExecutionMode::Console;
    std::filesystem::path entry_file;
    std::optional<std::string> bound_url;
    std::optional<ServiceState> service_state;
    double duration_ms = 0.0;
};

inline std::string to_string(const ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Console:
            return "console";
        case ExecutionMode::Service:
            return "service";
        case ExecutionMode::Captured:
            return "captured";
        default:
            return "unknown";
    }
}

inline std::string to_string(const FailureKind kind) {
    switch (kind) {
        case FailureKind::FileNotFound:
            return "file_not_found";
        case FailureKind::LaunchFailure:
            return "launch_failure";
        case FailureKind::ServerNeverBound:
            return "server_never_bound";
        case FailureKind::ServerStartTimeout:
            return "server_start_timeout";
        case FailureKind::CrashDetected:
            return "crash_detected";
        case FailureKind::UnexpectedExit:
            return "unexpected_exit";
        case FailureKind::NonZeroExit:
            return "non_zero_exit";
        case FailureKind::Timeout:
            return "timeout";
        case FailureKind::Cancelled:
            return "cancelled";
        case FailureKind::RunException:
            return "run_exception";
        default:
            return "unknown";
    }
}

inline std::string to_string(const ServiceState state) {
    switch (state) {
        case ServiceState::Starting:
            return "starting";
        case ServiceState::Running:
            return "running";
        case ServiceState::Crashed:
            return "crashed";
        case ServiceState::Exited:
            return "exited";
        case ServiceState::TimedOutStopped:
            return "timed_out_stopped";
        case ServiceState::CancelledStopped:
            return "cancelled_stopped";
        case ServiceState::NeverBound:
            return "never_bound";
        case ServiceState::StartTimeout:
            return "start_timeout";
        default:
            return "unknown";
    }
}

inline std::optional<ExecutionMode> parse_execution_mode(const std::string& text) {
    if (text == "console") {
        return ExecutionMode::Console;
    }
    if (text == "service") {
        return ExecutionMode::Service;
    }
    if (text == "captured") {
        return ExecutionMode::Captured;
    }
    return std::nullopt;
}

}  // namespace runguard::protocol
