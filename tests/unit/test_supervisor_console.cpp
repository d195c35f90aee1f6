#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "process/process_tree.hpp"
#include "protocol/execution_result.hpp"
#include "protocol/run_request.hpp"
#include "runtime/supervisor.hpp"
#include "test_support.hpp"

namespace {

using runguard::protocol::ExecutionMode;
using runguard::protocol::ExecutionResult;
using runguard::protocol::FailureKind;
using runguard::protocol::RunRequest;
using runguard::runtime::Supervisor;
using runguard::testing::TempWorkspace;
using runguard::testing::shell_config;
using runguard::testing::wait_for_pid_file;
using runguard::testing::write_file;

// With SIGCHLD ignored the kernel reaps children itself, so waiting on one
// fails with ECHILD.
class ScopedIgnoreSigchld {
public:
    ScopedIgnoreSigchld() : previous_(std::signal(SIGCHLD, SIG_IGN)) {}
    ~ScopedIgnoreSigchld() { std::signal(SIGCHLD, previous_); }

    ScopedIgnoreSigchld(const ScopedIgnoreSigchld&) = delete;
    ScopedIgnoreSigchld& operator=(const ScopedIgnoreSigchld&) = delete;

private:
    void (*previous_)(int);
};

class SupervisorConsoleTest : public ::testing::Test {
protected:
    SupervisorConsoleTest() : workspace_(".tmp_supervisor_console_") {}

    RunRequest request_for(const std::string& name, const std::string& script,
                           const ExecutionMode mode = ExecutionMode::Console) {
        write_file(workspace_.root() / name, script);
        RunRequest req;
        req.entry_file = workspace_.root() / name;
        req.mode = mode;
        return req;
    }

    ExecutionResult run(const RunRequest& req,
                        std::shared_ptr<std::atomic_bool> token = nullptr) {
        Supervisor supervisor(shell_config(), echo_);
        return supervisor.run(req, std::move(token));
    }

    TempWorkspace workspace_;
    std::ostringstream echo_;
};

TEST_F(SupervisorConsoleTest, ReportsMissingEntryFile) {
    RunRequest req;
    req.entry_file = workspace_.root() / "absent.py";

    const auto result = run(req);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(*result.failure, FailureKind::FileNotFound);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("file not found"), std::string::npos);
    EXPECT_FALSE(result.return_code.has_value());
}

TEST_F(SupervisorConsoleTest, SucceedsOnZeroExit) {
    const auto result = run(request_for("ok.sh", "exit 0\n"));
    EXPECT_TRUE(result.success);
    ASSERT_TRUE(result.return_code.has_value());
    EXPECT_EQ(*result.return_code, 0);
    EXPECT_FALSE(result.failure.has_value());
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.mode, ExecutionMode::Console);
    EXPECT_TRUE(result.entry_file.is_absolute());
    EXPECT_GE(result.duration_ms, 0.0);
}

TEST_F(SupervisorConsoleTest, CollectsStderrOnFailure) {
    const auto result = run(request_for("bad.sh", "echo 'value error' >&2\nexit 3\n"));
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.return_code.has_value());
    EXPECT_EQ(*result.return_code, 3);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(*result.failure, FailureKind::NonZeroExit);
    EXPECT_EQ(result.error.value_or(""), "failed to run (exit code 3)");
    EXPECT_EQ(result.stderr_text, "value error\n");
}

TEST_F(SupervisorConsoleTest, FeedsStdinText) {
    auto req = request_for("sum.sh",
                           "read a\nread b\n[ \"$a$b\" = \"34\" ] || exit 5\n");
    req.stdin_text = "3\n4\n";

    const auto result = run(req);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.return_code.value_or(-1), 0);
}

TEST_F(SupervisorConsoleTest, TimeoutTerminatesWholeTree) {
    auto req = request_for("hang.sh", "sleep 30 &\necho $! > child.pid\nwait\n");
    req.timeout_seconds = 0.5;

    const auto started = std::chrono::steady_clock::now();
    const auto result = run(req);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(*result.failure, FailureKind::Timeout);
    EXPECT_EQ(result.error.value_or(""), "timeout 0.5 seconds");
    EXPECT_LT(elapsed, std::chrono::seconds(10));

    const auto sleeper = wait_for_pid_file(workspace_.root() / "child.pid");
    ASSERT_TRUE(sleeper.has_value());
    EXPECT_TRUE(runguard::process::wait_until_gone({*sleeper}, std::chrono::milliseconds(3000)));
}

TEST_F(SupervisorConsoleTest, CancelStopsRun) {
    auto req = request_for("wait.sh", "sleep 30\n");
    auto token = std::make_shared<std::atomic_bool>(true);

    const auto result = run(req, token);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(*result.failure, FailureKind::Cancelled);
    EXPECT_EQ(result.error.value_or(""), "run cancelled");
}

TEST_F(SupervisorConsoleTest, ReportsLaunchFailure) {
    auto req = request_for("ok.sh", "exit 0\n");
    auto config = shell_config();
    config.interpreter = {"/nonexistent/runguard-interpreter"};
    Supervisor supervisor(config, echo_);

    const auto result = supervisor.run(req);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(*result.failure, FailureKind::LaunchFailure);
}

TEST_F(SupervisorConsoleTest, CapturedModeSeparatesStreams) {
    const auto result = run(request_for("both.sh", "echo out\necho err >&2\nexit 0\n",
                                        ExecutionMode::Captured));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.mode, ExecutionMode::Captured);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
    EXPECT_EQ(result.return_code.value_or(-1), 0);
}

TEST_F(SupervisorConsoleTest, CapturedModeEchoesStdin) {
    auto req = request_for("cat.sh", "cat\n", ExecutionMode::Captured);
    req.stdin_text = "hello runguard";

    const auto result = run(req);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "hello runguard");
}

TEST_F(SupervisorConsoleTest, CapturedModeRunsInEntryDirectory) {
    const auto result = run(request_for("nested/where.sh", "pwd -P\n", ExecutionMode::Captured));
    EXPECT_TRUE(result.success);
    const auto expected = std::filesystem::canonical(workspace_.root() / "nested").string();
    EXPECT_EQ(result.stdout_text, expected + "\n");
}

TEST_F(SupervisorConsoleTest, CapturedModeReportsExitCode) {
    const auto result = run(request_for("fail.sh", "echo partial\nexit 7\n",
                                        ExecutionMode::Captured));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.return_code.value_or(-1), 7);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(*result.failure, FailureKind::NonZeroExit);
    EXPECT_EQ(result.stdout_text, "partial\n");
}

TEST_F(SupervisorConsoleTest, CapturedModeTimesOut) {
    auto req = request_for("slow.sh", "echo begun\nsleep 30\n", ExecutionMode::Captured);
    req.timeout_seconds = 0.3;

    const auto result = run(req);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(*result.failure, FailureKind::Timeout);
    EXPECT_TRUE(result.return_code.has_value());
    EXPECT_EQ(result.stdout_text, "begun\n");
}

TEST_F(SupervisorConsoleTest, LostChildBecomesRunException) {
    auto req = request_for("ok.sh", "exit 0\n");

    ExecutionResult result;
    {
        ScopedIgnoreSigchld ignore;
        result = run(req);
    }

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(*result.failure, FailureKind::RunException);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->rfind("Execution exception: ", 0), 0u);
}

TEST_F(SupervisorConsoleTest, CapturedModeLostChildBecomesRunException) {
    auto req = request_for("ok.sh", "echo hi\nexit 0\n", ExecutionMode::Captured);

    ExecutionResult result;
    {
        ScopedIgnoreSigchld ignore;
        result = run(req);
    }

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(*result.failure, FailureKind::RunException);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->rfind("Execution exception: ", 0), 0u);
}

}  // namespace
