#include "net/port_probe.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace runguard::net {

using core::errors::ErrorCategory;
using core::errors::RunError;

bool is_port_open(const std::string& host, const std::uint16_t port,
                  const std::chrono::milliseconds timeout) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        return false;
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    if (fd < 0) {
        return false;
    }

    bool open = false;
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        open = true;
    } else if (errno == EINPROGRESS) {
        pollfd pfd{fd, POLLOUT, 0};
        int ready = 0;
        do {
            ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (ready < 0 && errno == EINTR);

        if (ready > 0) {
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            open = getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 &&
                   so_error == 0;
        }
    }
    static_cast<void>(close(fd));
    return open;
}

std::string make_http_url(const std::string& host, const std::uint16_t port) {
    return "http://" + host + ":" + std::to_string(port);
}

PortProbe::PortProbe(const core::config::RunnerConfig& config)
    : host_(config.probe_host),
      ports_(config.candidate_ports),
      max_wait_(config.max_bind_wait_ms),
      interval_(config.probe_interval_ms),
      connect_timeout_(config.probe_connect_timeout_ms) {}

std::optional<std::uint16_t> PortProbe::probe_once() const {
    for (const auto port : ports_) {
        if (is_port_open(host_, port, connect_timeout_)) {
            return port;
        }
    }
    return std::nullopt;
}

core::errors::Result<BoundEndpoint> PortProbe::wait_for_bind(
    const std::function<bool()>& process_exited,
    const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    const auto started = std::chrono::steady_clock::now();

    while (std::chrono::steady_clock::now() - started < max_wait_) {
        if (process_exited()) {
            return RunError{ErrorCategory::Execution,
                            "server exited before binding a port", "server_never_bound",
                            "Check the captured output for a startup error."};
        }
        if (cancel_token && cancel_token->load()) {
            return RunError{ErrorCategory::Execution, "stopped before the server bound a port",
                            "probe_cancelled"};
        }

        if (const auto port = probe_once()) {
            LOG_DEBUG("PortProbe: port " + std::to_string(*port) + " is accepting connections");
            return BoundEndpoint{*port, make_http_url(host_, *port)};
        }
        std::this_thread::sleep_for(interval_);
    }

    return RunError{ErrorCategory::Execution,
                    "server did not start in time (" +
                        std::to_string(max_wait_.count()) + " ms)",
                    "server_start_timeout",
                    "Make sure the service listens on one of the candidate ports."};
}

}  // namespace runguard::net
