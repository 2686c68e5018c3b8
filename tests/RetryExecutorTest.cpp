#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <upload/RetryExecutor.hpp>

#include "UploadTestUtils.hpp"

using MediaUpload::RetryExecutor;
using MediaUpload::RetryPolicy;
using MediaUpload::UploadError;
using MediaUpload::UploadResult;
using std::chrono_literals::operator""ms;

class RetryExecutorTest : public ::testing::Test {
   protected:
    RecordingSleeper sleeper;
    RetryExecutor retry{RetryPolicy{}, sleeper.sleeper()};
    std::stop_source stop;
    int calls = 0;

    // Fails transiently @p failures times, then succeeds with 42.
    auto failingTimes(int failures) {
        return [this, failures]() -> UploadResult<int> {
            if (++calls <= failures) {
                return std::unexpected(transientError("connection reset"));
            }
            return 42;
        };
    }
};

TEST_F(RetryExecutorTest, SucceedsWithoutRetry) {
    auto result = retry.run("op", failingTimes(0), stop.get_token());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(retry.lastState().retries(), 0);
    EXPECT_TRUE(sleeper.delays.empty());
}

TEST_F(RetryExecutorTest, RetriesTransientFailuresWithBackoff) {
    auto result = retry.run("op", failingTimes(2), stop.get_token());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(retry.lastState().retries(), 2);
    EXPECT_EQ(sleeper.delays,
              (std::vector<std::chrono::milliseconds>{1000ms, 2000ms}));
}

TEST_F(RetryExecutorTest, GivesUpAfterMaxAttempts) {
    auto result = retry.run("op", failingTimes(100), stop.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, UploadError::Kind::TransientNetwork);
    EXPECT_EQ(result.error().attempts, 5);
    EXPECT_EQ(calls, 5);
    // No sleep after the last attempt.
    EXPECT_EQ(sleeper.delays, (std::vector<std::chrono::milliseconds>{
                                  1000ms, 2000ms, 4000ms, 8000ms}));
}

TEST_F(RetryExecutorTest, DoesNotRetryProtocolErrors) {
    auto result = retry.run(
        "op",
        [this]() -> UploadResult<void> {
            ++calls;
            return std::unexpected(protocolError("bad request"));
        },
        stop.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, UploadError::Kind::Protocol);
    EXPECT_EQ(result.error().attempts, 1);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeper.delays.empty());
}

TEST_F(RetryExecutorTest, StopBeforeFirstAttempt) {
    stop.request_stop();
    auto result = retry.run("op", failingTimes(0), stop.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, UploadError::Kind::Cancelled);
    EXPECT_EQ(calls, 0);
}

TEST_F(RetryExecutorTest, StopDuringBackoff) {
    sleeper.completes = false;
    auto result = retry.run("op", failingTimes(3), stop.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, UploadError::Kind::Cancelled);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(sleeper.delays.size(), 1U);
}

TEST_F(RetryExecutorTest, DelayDoublesPerAttempt) {
    RetryExecutor custom({.maxAttempts = 3, .baseDelay = 250ms},
                         sleeper.sleeper());
    EXPECT_EQ(custom.delayFor(1), 250ms);
    EXPECT_EQ(custom.delayFor(2), 500ms);
    EXPECT_EQ(custom.delayFor(3), 1000ms);
}

TEST(RetryExecutorPolicyTest, RejectsZeroAttempts) {
    EXPECT_THROW(RetryExecutor({.maxAttempts = 0}), std::invalid_argument);
}
