#pragma once

#include <optional>
#include <string>
#include <vector>

namespace runguard::runtime {

// Plain substring match: any line containing the marker counts, even a log
// line that merely quotes it. Returns that line and every later line of the
// batch joined with '\n'.
std::optional<std::string> find_crash_tail(const std::vector<std::string>& lines,
                                           const std::string& marker);

}  // namespace runguard::runtime
