#include "core/config/runner_config.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace runguard::core::config {

using errors::ErrorCategory;
using errors::RunError;
using nlohmann::json;

namespace {

RunError config_error(const std::string& message) {
    return RunError{ErrorCategory::Config, message, "invalid_config",
                    "Check the runner configuration file."};
}

bool read_millis(const json& doc, const char* key, std::uint32_t& out,
                 std::string& problem) {
    if (!doc.contains(key)) {
        return true;
    }
    const auto& value = doc.at(key);
    if (!value.is_number_unsigned()) {
        problem = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    const auto raw = value.get<std::uint64_t>();
    if (raw == 0 || raw > 24ull * 3600 * 1000) {
        problem = std::string("'") + key + "' out of range";
        return false;
    }
    out = static_cast<std::uint32_t>(raw);
    return true;
}

bool read_string(const json& doc, const char* key, std::string& out,
                 std::string& problem) {
    if (!doc.contains(key)) {
        return true;
    }
    const auto& value = doc.at(key);
    if (!value.is_string()) {
        problem = std::string("'") + key + "' must be a string";
        return false;
    }
    out = value.get<std::string>();
    return true;
}

}  // namespace

errors::Result<RunnerConfig> parse_runner_config(const std::string& json_text) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return config_error("Configuration is not valid JSON.");
    }
    if (!doc.is_object()) {
        return config_error("Configuration must be a JSON object.");
    }

    RunnerConfig config;
    std::string problem;

    if (doc.contains("interpreter")) {
        const auto& value = doc.at("interpreter");
        if (!value.is_array()) {
            return config_error("'interpreter' must be an array of strings");
        }
        config.interpreter.clear();
        for (const auto& part : value) {
            if (!part.is_string()) {
                return config_error("'interpreter' must be an array of strings");
            }
            config.interpreter.push_back(part.get<std::string>());
        }
    }

    if (doc.contains("candidate_ports")) {
        const auto& value = doc.at("candidate_ports");
        if (!value.is_array() || value.empty()) {
            return config_error("'candidate_ports' must be a non-empty array");
        }
        config.candidate_ports.clear();
        for (const auto& port : value) {
            if (!port.is_number_unsigned() || port.get<std::uint64_t>() == 0 ||
                port.get<std::uint64_t>() > 65535) {
                return config_error("'candidate_ports' entries must be in 1..65535");
            }
            config.candidate_ports.push_back(
                static_cast<std::uint16_t>(port.get<std::uint64_t>()));
        }
    }

    if (!read_string(doc, "probe_host", config.probe_host, problem) ||
        !read_millis(doc, "max_bind_wait_ms", config.max_bind_wait_ms, problem) ||
        !read_millis(doc, "probe_interval_ms", config.probe_interval_ms, problem) ||
        !read_millis(doc, "probe_connect_timeout_ms",
                     config.probe_connect_timeout_ms, problem) ||
        !read_millis(doc, "service_tick_ms", config.service_tick_ms, problem) ||
        !read_millis(doc, "console_tick_ms", config.console_tick_ms, problem) ||
        !read_millis(doc, "termination_grace_ms", config.termination_grace_ms,
                     problem) ||
        !read_string(doc, "crash_marker", config.crash_marker, problem) ||
        !read_string(doc, "browser_command", config.browser_command, problem)) {
        return config_error(problem);
    }

    std::string artifact_subdir = config.artifact_subdir.string();
    if (!read_string(doc, "artifact_subdir", artifact_subdir, problem)) {
        return config_error(problem);
    }
    config.artifact_subdir = artifact_subdir;

    if (config.crash_marker.empty()) {
        return config_error("'crash_marker' cannot be empty");
    }
    return config;
}

errors::Result<RunnerConfig> load_runner_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return RunError{ErrorCategory::Config,
                        "Unable to open configuration file: " + path.string(),
                        "config_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_runner_config(buffer.str());
}

}  // namespace runguard::core::config
