#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include "monitor/output_buffer.hpp"
#include "protocol/execution_result.hpp"

namespace runguard::runtime {

// Live view of a service run, handed to the caller when the service starts
// answering. Valid only for the duration of the call that produced it.
struct ServiceSession {
    pid_t pid = -1;
    std::optional<std::string> bound_url;
    std::shared_ptr<const monitor::OutputBuffer> output;
    std::chrono::steady_clock::time_point started_at;
    protocol::ServiceState state = protocol::ServiceState::Starting;
};

}  // namespace runguard::runtime
