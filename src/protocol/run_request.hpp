#pragma once
#include <string>
#include <filesystem>
#include <optional>
#include "protocol/execution_result.hpp"

namespace runguard::protocol {

    // Everything a caller decides about a single run
    struct RunRequest {
        std::filesystem::path entry_file;
        ExecutionMode mode = ExecutionMode::Console;
        std::optional<double> timeout_seconds;   // Unset means run until exit or stop
        std::optional<std::string> stdin_text;   // Fed to the child, then stdin is closed
        bool open_browser = false;               // Service mode only
        bool verbose = false;
    };

} // namespace runguard::protocol
