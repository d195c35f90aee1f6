#include "runtime/crash_detector.hpp"

namespace runguard::runtime {

std::optional<std::string> find_crash_tail(const std::vector<std::string>& lines,
                                           const std::string& marker) {
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].find(marker) == std::string::npos) {
            continue;
        }
        std::string tail = lines[i];
        for (std::size_t j = i + 1; j < lines.size(); ++j) {
            tail += "\n" + lines[j];
        }
        return tail;
    }
    return std::nullopt;
}

}  // namespace runguard::runtime
