#include <algorithm>
#include <chrono>
#include <signal.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include "core/errors/run_errors.hpp"
#include "process/launcher.hpp"
#include "process/process_tree.hpp"
#include "test_support.hpp"

namespace {

using runguard::core::errors::get_error;
using runguard::core::errors::get_value;
using runguard::core::errors::is_error;
using runguard::process::LaunchOptions;
using runguard::process::is_running;
using runguard::process::list_descendants;
using runguard::process::terminate_tree;
using runguard::process::wait_until_gone;
using runguard::protocol::ExecutionMode;
using runguard::testing::TempWorkspace;
using runguard::testing::wait_for_pid_file;
using runguard::testing::write_file;

TEST(ProcessTreeTest, OwnProcessIsRunning) {
    EXPECT_TRUE(is_running(getpid()));
}

TEST(ProcessTreeTest, UnknownPidIsNotRunning) {
    EXPECT_FALSE(is_running(0));
    EXPECT_FALSE(is_running(-1));
}

TEST(ProcessTreeTest, RejectsInvalidRoot) {
    auto result = terminate_tree(0);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_pid");
}

TEST(ProcessTreeTest, TerminatesRootAndDescendants) {
    TempWorkspace workspace(".tmp_process_tree_");
    const auto script = workspace.root() / "tree.sh";
    write_file(script, "sleep 30 &\necho $! > child.pid\nwait\n");

    auto resolved = runguard::process::resolve_entry(script);
    ASSERT_FALSE(is_error(resolved));

    LaunchOptions options;
    options.mode = ExecutionMode::Service;
    options.interpreter = {"/bin/sh"};
    auto launched = runguard::process::launch(get_value(resolved), options);
    ASSERT_FALSE(is_error(launched));
    const auto& child = get_value(launched);

    const auto sleeper = wait_for_pid_file(workspace.root() / "child.pid");
    ASSERT_TRUE(sleeper.has_value());

    const auto descendants = list_descendants(child->pid());
    EXPECT_NE(std::find(descendants.begin(), descendants.end(), *sleeper),
              descendants.end());
    EXPECT_EQ(std::find(descendants.begin(), descendants.end(), child->pid()),
              descendants.end());

    auto signalled = terminate_tree(child->pid());
    ASSERT_FALSE(is_error(signalled));
    const auto& targets = get_value(signalled);
    ASSERT_FALSE(targets.empty());
    EXPECT_EQ(targets.back(), child->pid());

    EXPECT_TRUE(child->wait_for(std::chrono::milliseconds(3000)).has_value());
    EXPECT_TRUE(wait_until_gone({*sleeper, child->pid()}, std::chrono::milliseconds(3000)));
}

TEST(ProcessTreeTest, SignallingAGoneTreeSucceeds) {
    TempWorkspace workspace(".tmp_process_tree_");
    const auto script = workspace.root() / "quick.sh";
    write_file(script, "exit 0\n");

    auto resolved = runguard::process::resolve_entry(script);
    ASSERT_FALSE(is_error(resolved));

    LaunchOptions options;
    options.mode = ExecutionMode::Service;
    options.interpreter = {"/bin/sh"};
    auto launched = runguard::process::launch(get_value(resolved), options);
    ASSERT_FALSE(is_error(launched));
    const auto& child = get_value(launched);
    ASSERT_TRUE(child->wait_for(std::chrono::milliseconds(3000)).has_value());

    auto first = terminate_tree(child->pid());
    auto second = terminate_tree(child->pid());
    EXPECT_FALSE(is_error(first));
    EXPECT_FALSE(is_error(second));
}

}  // namespace
