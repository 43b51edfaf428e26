#include <gtest/gtest.h>
#include "core/errors/orchestration_errors.hpp"

using namespace conductor::core::errors;

// A dummy function to simulate a resource call failing
Result<std::string> simulate_query(bool should_fail) {
    if (should_fail) {
        return OrchestrationError{ErrorCategory::Connection, "Backend unreachable"};
    }
    return std::string("row data here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_query(false);

    // Check that it is NOT an error
    EXPECT_FALSE(is_error(result));
    // Check that the value is correct
    EXPECT_EQ(get_value(result), "row data here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_query(true);

    // Check that it IS an error
    EXPECT_TRUE(is_error(result));

    // Check the error details
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Connection);
    EXPECT_EQ(error.message, "Backend unreachable");
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, OkStatusIsNotAnError) {
    Status status = ok();
    EXPECT_FALSE(is_error(status));
}

TEST(ErrorModelTest, TakeValueMovesOut) {
    Result<std::string> result = std::string("payload");
    const std::string taken = take_value(std::move(result));
    EXPECT_EQ(taken, "payload");
}

TEST(ErrorModelTest, OnlyStageAndConnectionFailuresAreTransient) {
    EXPECT_TRUE(is_transient(ErrorCategory::StageExecution));
    EXPECT_TRUE(is_transient(ErrorCategory::Connection));
    EXPECT_FALSE(is_transient(ErrorCategory::Validation));
    EXPECT_FALSE(is_transient(ErrorCategory::QuotaExceeded));
    EXPECT_FALSE(is_transient(ErrorCategory::Timeout));
    EXPECT_FALSE(is_transient(ErrorCategory::Internal));
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::QuotaExceeded), "quota_exceeded");
    EXPECT_EQ(to_string(ErrorCategory::StageExecution), "stage_execution");
    EXPECT_EQ(to_string(ErrorCategory::Timeout), "timeout");
}
