#include <string>
#include <gtest/gtest.h>
#include "core/errors/tool_errors.hpp"

using namespace wasmbox::core::errors;

// Simulates a package check that can fail
Result<std::string> simulate_read_manifest(bool should_fail) {
    if (should_fail) {
        return ToolError{ErrorCategory::Validation, "Package is missing manifest.json",
                         "package_validation_failed"};
    }
    return std::string("{\"name\":\"echo\"}");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_read_manifest(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "{\"name\":\"echo\"}");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_read_manifest(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Validation);
    EXPECT_EQ(error.message, "Package is missing manifest.json");
    EXPECT_EQ(error.code, "package_validation_failed");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeToUnknown) {
    ToolError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, TakeValueMovesOutOfResult) {
    auto result = simulate_read_manifest(false);
    std::string taken = take_value(result);
    EXPECT_EQ(taken, "{\"name\":\"echo\"}");
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Timeout), "timeout");
    EXPECT_EQ(to_string(ErrorCategory::Cancelled), "cancelled");
    EXPECT_EQ(to_string(ErrorCategory::Configuration), "configuration");
    EXPECT_EQ(to_string(ErrorCategory::Policy), "policy");
}
