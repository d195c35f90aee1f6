#include <atomic>
#include <chrono>
#include <memory>
#include <gtest/gtest.h>
#include "core/errors/run_errors.hpp"
#include "net/port_probe.hpp"
#include "test_support.hpp"

namespace {

using runguard::core::errors::get_error;
using runguard::core::errors::get_value;
using runguard::core::errors::is_error;
using runguard::net::PortProbe;
using runguard::net::is_port_open;
using runguard::testing::LoopbackListener;
using runguard::testing::shell_config;
using runguard::testing::unused_port;

TEST(PortProbeTest, DetectsListeningPort) {
    LoopbackListener listener;
    ASSERT_NE(listener.port(), 0);
    EXPECT_TRUE(is_port_open("127.0.0.1", listener.port(), std::chrono::milliseconds(200)));
}

TEST(PortProbeTest, ClosedPortIsNotOpen) {
    EXPECT_FALSE(is_port_open("127.0.0.1", unused_port(), std::chrono::milliseconds(200)));
}

TEST(PortProbeTest, InvalidHostIsNotOpen) {
    EXPECT_FALSE(is_port_open("not-an-address", 80, std::chrono::milliseconds(50)));
}

TEST(PortProbeTest, FormatsHttpUrl) {
    EXPECT_EQ(runguard::net::make_http_url("127.0.0.1", 8501), "http://127.0.0.1:8501");
}

TEST(PortProbeTest, PrefersEarlierCandidate) {
    LoopbackListener first;
    LoopbackListener second;
    auto config = shell_config();
    config.candidate_ports = {unused_port(), second.port(), first.port()};

    const PortProbe probe(config);
    const auto port = probe.probe_once();
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(*port, second.port());
}

TEST(PortProbeTest, WaitReturnsBoundEndpoint) {
    LoopbackListener listener;
    auto config = shell_config();
    config.candidate_ports = {listener.port()};

    const PortProbe probe(config);
    auto result = probe.wait_for_bind([] { return false; });
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).port, listener.port());
    EXPECT_EQ(get_value(result).url,
              "http://127.0.0.1:" + std::to_string(listener.port()));
}

TEST(PortProbeTest, ReportsNeverBoundWhenProcessExits) {
    const PortProbe probe(shell_config());
    auto result = probe.wait_for_bind([] { return true; });
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "server_never_bound");
}

TEST(PortProbeTest, ReportsStartTimeout) {
    auto config = shell_config();
    config.max_bind_wait_ms = 300;

    const PortProbe probe(config);
    const auto started = std::chrono::steady_clock::now();
    auto result = probe.wait_for_bind([] { return false; });
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "server_start_timeout");
    EXPECT_GE(elapsed, std::chrono::milliseconds(300));
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(PortProbeTest, StopsWhenCancelled) {
    auto token = std::make_shared<std::atomic_bool>(true);
    const PortProbe probe(shell_config());
    auto result = probe.wait_for_bind([] { return false; }, token);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "probe_cancelled");
}

}  // namespace
