#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/config/runner_config.hpp"
#include "core/errors/run_errors.hpp"

namespace runguard::net {

// One TCP connect attempt bounded by timeout.
bool is_port_open(const std::string& host, std::uint16_t port,
                  std::chrono::milliseconds timeout);

std::string make_http_url(const std::string& host, std::uint16_t port);

struct BoundEndpoint {
    std::uint16_t port = 0;
    std::string url;
};

// Polls a fixed candidate list until a service answers on one of them.
class PortProbe {
public:
    explicit PortProbe(const core::config::RunnerConfig& config);

    // One sweep over the candidates in list order; the first open one wins.
    std::optional<std::uint16_t> probe_once() const;

    // Error codes: "server_never_bound" (process_exited() turned true),
    // "server_start_timeout" (wait window elapsed), "probe_cancelled".
    core::errors::Result<BoundEndpoint> wait_for_bind(
        const std::function<bool()>& process_exited,
        const std::shared_ptr<std::atomic_bool>& cancel_token = nullptr) const;

private:
    std::string host_;
    std::vector<std::uint16_t> ports_;
    std::chrono::milliseconds max_wait_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds connect_timeout_;
};

}  // namespace runguard::net
