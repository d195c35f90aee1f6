#pragma once

#include <chrono>
#include <signal.h>
#include <sys/types.h>
#include <vector>
#include "core/errors/run_errors.hpp"

namespace runguard::process {

// False for processes that no longer exist and for zombies.
bool is_running(pid_t pid);

// All descendants of root, one generation after another (children first,
// then grandchildren, ...). Root itself is not included.
std::vector<pid_t> list_descendants(pid_t root);

// Signals every descendant, deepest generation first, then root, then root's
// process group when root leads one. Vanished processes are skipped silently.
// Returns the pids that were targeted, root last.
core::errors::Result<std::vector<pid_t>> terminate_tree(pid_t root,
                                                        int signal_number = SIGTERM);

// SIGKILLs whichever of pids is still running.
void kill_survivors(const std::vector<pid_t>& pids);

bool wait_until_gone(const std::vector<pid_t>& pids, std::chrono::milliseconds timeout);

}  // namespace runguard::process
