#pragma once

#include <string>
#include "core/errors/run_errors.hpp"

namespace runguard::runtime {

// Starts `command url` fully detached (own session, stdio on /dev/null).
// The opener is never waited on; only a failed spawn is reported.
core::errors::Result<bool> open_browser(const std::string& command, const std::string& url);

}  // namespace runguard::runtime
