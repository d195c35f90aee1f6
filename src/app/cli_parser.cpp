#include "cli_parser.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <vector>

namespace runguard::app::cli {

    using namespace runguard::core::errors;
    using runguard::protocol::ExecutionMode;
    using runguard::protocol::RunRequest;

    constexpr const char* kUsage =
        "Usage: runguard run <entry-file> [--mode console|service|captured] [--service] "
        "[--timeout SECONDS] [--stdin TEXT | --stdin-file PATH] [--open-browser] "
        "[--config PATH] [--verbose]";

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> entry_file;
        std::optional<std::string> mode;
        bool service = false;
        std::optional<std::string> timeout;
        std::optional<std::string> stdin_text;
        std::optional<std::string> stdin_file;
        std::optional<std::string> config;
        bool open_browser = false;
        bool verbose = false;
    };

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return RunError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        if (command != "run") {
            return RunError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--mode") {
                if (i + 1 < args.size()) raw.mode = args[++i];
                else return RunError{ErrorCategory::Input, "Missing value for --mode", "missing_value"};
            } else if (args[i] == "--service") {
                raw.service = true;
            } else if (args[i] == "--timeout") {
                if (i + 1 < args.size()) raw.timeout = args[++i];
                else return RunError{ErrorCategory::Input, "Missing value for --timeout", "missing_value"};
            } else if (args[i] == "--stdin") {
                if (i + 1 < args.size()) raw.stdin_text = args[++i];
                else return RunError{ErrorCategory::Input, "Missing value for --stdin", "missing_value"};
            } else if (args[i] == "--stdin-file") {
                if (i + 1 < args.size()) raw.stdin_file = args[++i];
                else return RunError{ErrorCategory::Input, "Missing value for --stdin-file", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return RunError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--open-browser") {
                raw.open_browser = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (args[i].rfind("--", 0) == 0) {
                return RunError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            } else if (!raw.entry_file.has_value()) {
                raw.entry_file = args[i];
            } else {
                return RunError{ErrorCategory::Input, "Unexpected extra argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliOptions options;
        RunRequest& req = options.request;
        req.verbose = raw.verbose;

        if (!raw.entry_file.has_value()) {
            return RunError{ErrorCategory::Input, "Missing entry file", "missing_entry_file", kUsage};
        }
        req.entry_file = std::filesystem::path(raw.entry_file.value());

        if (raw.mode) {
            auto mode = runguard::protocol::parse_execution_mode(raw.mode.value());
            if (!mode.has_value()) {
                return RunError{ErrorCategory::Input, "Invalid value for --mode: " + raw.mode.value(), "invalid_mode", "Use console, service or captured."};
            }
            if (raw.service && mode.value() != ExecutionMode::Service) {
                return RunError{ErrorCategory::Input, "Cannot combine --service with --mode " + raw.mode.value(), "conflicting_flags"};
            }
            req.mode = mode.value();
        } else if (raw.service) {
            req.mode = ExecutionMode::Service;
        }

        // Exception-free number parsing
        if (raw.timeout) {
            const std::string& text = raw.timeout.value();
            errno = 0;
            char* end = nullptr;
            const double seconds = std::strtod(text.c_str(), &end);
            if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(seconds)) {
                return RunError{ErrorCategory::Input, "Invalid number for --timeout", "invalid_number", "Provide the timeout in seconds, e.g. 30 or 2.5."};
            }
            if (seconds <= 0.0 || seconds > 86400.0) {
                return RunError{ErrorCategory::Input, "--timeout out of bounds", "bounds_error", "Must be greater than 0 and at most 86400."};
            }
            req.timeout_seconds = seconds;
        }

        if (raw.stdin_text && raw.stdin_file) {
            return RunError{ErrorCategory::Input, "Cannot provide both --stdin and --stdin-file", "conflicting_flags"};
        }
        if ((raw.stdin_text || raw.stdin_file) && req.mode == ExecutionMode::Service) {
            return RunError{ErrorCategory::Input, "Service runs do not accept stdin input", "invalid_flag_for_mode"};
        }
        if (raw.open_browser && req.mode != ExecutionMode::Service) {
            return RunError{ErrorCategory::Input, "--open-browser requires service mode", "invalid_flag_for_mode", "Add --service."};
        }
        req.open_browser = raw.open_browser;

        if (raw.stdin_text) req.stdin_text = raw.stdin_text.value();
        if (raw.stdin_file) {
            std::ifstream in(raw.stdin_file.value());
            if (!in.is_open()) {
                return RunError{ErrorCategory::Input, "Unable to read --stdin-file: " + raw.stdin_file.value(), "invalid_path"};
            }
            std::ostringstream contents;
            contents << in.rdbuf();
            req.stdin_text = contents.str();
        }

        // Path validation
        if (raw.config) {
            std::filesystem::path p(raw.config.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return RunError{ErrorCategory::Input, "Config file does not exist or is not a regular file", "invalid_path"};
            }
            options.config_file = std::move(p);
        }

        return options;
    }

} // namespace runguard::app::cli
