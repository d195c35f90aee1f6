#include <gtest/gtest.h>
#include "core/errors/run_errors.hpp"

using namespace runguard::core::errors;

// A dummy function to simulate an entry lookup failing
Result<std::string> simulate_resolve_entry(bool should_fail) {
    if (should_fail) {
        return RunError{ErrorCategory::Input, "file not found /tmp/main.py", "file_not_found"};
    }
    return std::string("/tmp/main.py");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_resolve_entry(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "/tmp/main.py");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_resolve_entry(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Input);
    EXPECT_EQ(error.message, "file not found /tmp/main.py");
    EXPECT_EQ(error.code, "file_not_found");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeWhenOmitted) {
    RunError error{ErrorCategory::Launch, "fork failed"};
    EXPECT_EQ(error.code, "unknown_error");
    EXPECT_EQ(to_string(error.category), "launch");
}
