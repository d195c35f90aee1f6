#include "process/process_tree.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <unordered_map>

namespace runguard::process {

using core::errors::ErrorCategory;
using core::errors::RunError;

namespace {

struct StatEntry {
    char state = '?';
    pid_t parent = 0;
};

// /proc/<pid>/stat is "pid (comm) S ppid ...". comm may contain spaces and
// parentheses, so parse from the last ')'.
std::optional<StatEntry> read_stat(const pid_t pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string line;
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    const auto close_paren = line.rfind(')');
    if (close_paren == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream rest(line.substr(close_paren + 1));
    StatEntry entry;
    long parent = 0;
    if (!(rest >> entry.state >> parent)) {
        return std::nullopt;
    }
    entry.parent = static_cast<pid_t>(parent);
    return entry;
}

bool is_pid_name(const std::string& name) {
    return !name.empty() &&
           std::all_of(name.begin(), name.end(), [](const char c) {
               return std::isdigit(static_cast<unsigned char>(c)) != 0;
           });
}

std::unordered_multimap<pid_t, pid_t> snapshot_children() {
    std::unordered_multimap<pid_t, pid_t> children;
    std::error_code ec;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    for (const auto& entry : std::filesystem::directory_iterator("/proc", options, ec)) {
        const std::string name = entry.path().filename().string();
        if (!is_pid_name(name)) {
            continue;
        }
        const pid_t pid = static_cast<pid_t>(std::stol(name));
        const auto stat = read_stat(pid);
        if (stat.has_value()) {
            children.emplace(stat->parent, pid);
        }
    }
    return children;
}

// ESRCH means the target already exited.
bool send_signal(const pid_t pid, const int signal_number, std::string& denied) {
    if (kill(pid, signal_number) == 0 || errno == ESRCH) {
        return true;
    }
    denied = "pid " + std::to_string(pid) + ": " + std::strerror(errno);
    return false;
}

}  // namespace

bool is_running(const pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    const auto stat = read_stat(pid);
    if (!stat.has_value()) {
        return false;
    }
    return stat->state != 'Z' && stat->state != 'X' && stat->state != 'x';
}

std::vector<pid_t> list_descendants(const pid_t root) {
    const auto children = snapshot_children();

    std::vector<pid_t> found;
    std::vector<pid_t> generation = {root};
    while (!generation.empty()) {
        std::vector<pid_t> next;
        for (const pid_t parent : generation) {
            const auto range = children.equal_range(parent);
            for (auto it = range.first; it != range.second; ++it) {
                if (std::find(found.begin(), found.end(), it->second) == found.end() &&
                    it->second != root) {
                    next.push_back(it->second);
                }
            }
        }
        found.insert(found.end(), next.begin(), next.end());
        generation = std::move(next);
    }
    return found;
}

core::errors::Result<std::vector<pid_t>> terminate_tree(const pid_t root,
                                                        const int signal_number) {
    if (root <= 0) {
        return RunError{ErrorCategory::Internal,
                        "Refusing to signal pid " + std::to_string(root),
                        "invalid_pid"};
    }

    std::vector<pid_t> targets = list_descendants(root);
    std::reverse(targets.begin(), targets.end());

    std::string denied;
    bool all_delivered = true;
    for (const pid_t pid : targets) {
        all_delivered = send_signal(pid, signal_number, denied) && all_delivered;
    }
    all_delivered = send_signal(root, signal_number, denied) && all_delivered;
    targets.push_back(root);

    // A service child leads its own group; catch members that re-parented
    // themselves away from the tree.
    if (getpgid(root) == root && root != getpgrp()) {
        if (killpg(root, signal_number) != 0 && errno != ESRCH && errno != EPERM) {
            denied = "group " + std::to_string(root) + ": " + std::strerror(errno);
            all_delivered = false;
        }
    }

    if (!all_delivered) {
        return RunError{ErrorCategory::Execution,
                        "Unable to signal process tree (" + denied + ")",
                        "terminate_denied"};
    }
    return targets;
}

void kill_survivors(const std::vector<pid_t>& pids) {
    for (const pid_t pid : pids) {
        if (is_running(pid)) {
            static_cast<void>(kill(pid, SIGKILL));
        }
    }
}

bool wait_until_gone(const std::vector<pid_t>& pids,
                     const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const bool any_running =
            std::any_of(pids.begin(), pids.end(), [](const pid_t pid) {
                return is_running(pid);
            });
        if (!any_running) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

}  // namespace runguard::process
