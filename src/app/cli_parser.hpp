#pragma once
#include <filesystem>
#include <optional>
#include "protocol/run_request.hpp"
#include "core/errors/run_errors.hpp"

namespace runguard::app::cli {

    struct CliOptions {
        runguard::protocol::RunRequest request;
        std::optional<std::filesystem::path> config_file;
    };

    runguard::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
