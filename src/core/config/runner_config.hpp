#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/run_errors.hpp"

namespace runguard::core::config {

// Constants that shape every run. Loaded once and passed by value.
struct RunnerConfig {
    // Program used to start the entry file. Empty means exec the entry itself.
    std::vector<std::string> interpreter = {"python3", "-u"};

    std::vector<std::uint16_t> candidate_ports = {5000, 8000, 8080, 3000, 8501};
    std::string probe_host = "127.0.0.1";
    std::uint32_t max_bind_wait_ms = 15000;
    std::uint32_t probe_interval_ms = 200;
    std::uint32_t probe_connect_timeout_ms = 200;

    std::uint32_t service_tick_ms = 1000;
    std::uint32_t console_tick_ms = 100;
    std::uint32_t termination_grace_ms = 2000;

    std::string crash_marker = "Traceback (most recent call last)";
    std::string browser_command = "xdg-open";
    std::filesystem::path artifact_subdir = ".runguard_runs";
};

// Reads a JSON object whose keys mirror RunnerConfig. Missing keys keep their
// defaults, unknown keys are ignored.
errors::Result<RunnerConfig> load_runner_config(const std::filesystem::path& path);

errors::Result<RunnerConfig> parse_runner_config(const std::string& json_text);

}  // namespace runguard::core::config
