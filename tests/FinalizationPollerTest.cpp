#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <mocks/UploadTransport.hpp>
#include <stop_token>
#include <upload/FinalizationPoller.hpp>

#include "UploadTestUtils.hpp"

using MediaUpload::FinalizationPoller;
using MediaUpload::RetryPolicy;
using MediaUpload::TokenHandle;
using MediaUpload::TokenStatus;
using MediaUpload::TokenStatusReport;
using MediaUpload::UploadError;
using std::chrono_literals::operator""ms;
using testing::_;
using testing::Return;

namespace {

constexpr std::uint64_t kTotalSize = 5 * 1024 * 1024;

TokenStatusReport report(TokenStatus status, std::uint64_t bytes) {
    return {.status = status, .uploadedBytes = bytes};
}

}  // namespace

class FinalizationPollerTest : public ::testing::Test {
   protected:
    MockUploadTransport transport;
    RecordingSleeper sleeper;
    FinalizationPoller poller{transport, RetryPolicy{}, RetryPolicy{},
                              sleeper.sleeper()};
    TokenHandle handle{.id = "0_token"};
    std::stop_source stop;
};

TEST_F(FinalizationPollerTest, FinalizesOnFirstFullReport) {
    EXPECT_CALL(transport, getTokenStatus("0_token", _))
        .WillOnce(Return(report(TokenStatus::Full, kTotalSize)));

    auto result = poller.await(handle, kTotalSize, stop.get_token());
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(poller.state(), FinalizationPoller::State::Finalized);
    EXPECT_EQ(poller.polls(), 1);
    EXPECT_EQ(handle.status, TokenStatus::Full);
    EXPECT_EQ(handle.uploadedBytes, kTotalSize);
    EXPECT_TRUE(sleeper.delays.empty());
}

TEST_F(FinalizationPollerTest, BacksOffUntilFull) {
    EXPECT_CALL(transport, getTokenStatus("0_token", _))
        .WillOnce(Return(report(TokenStatus::Partial, 1024)))
        .WillOnce(Return(report(TokenStatus::Pending, 0)))
        .WillOnce(Return(report(TokenStatus::Full, kTotalSize)));

    auto result = poller.await(handle, kTotalSize, stop.get_token());
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(poller.polls(), 3);
    EXPECT_EQ(sleeper.delays,
              (std::vector<std::chrono::milliseconds>{1000ms, 2000ms}));
}

TEST_F(FinalizationPollerTest, GivesUpAfterMaxPolls) {
    EXPECT_CALL(transport, getTokenStatus("0_token", _))
        .Times(5)
        .WillRepeatedly(Return(report(TokenStatus::Partial, 1024)));

    auto result = poller.await(handle, kTotalSize, stop.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, UploadError::Kind::TokenNotFinalized);
    EXPECT_EQ(result.error().tokenId, "0_token");
    EXPECT_EQ(result.error().attempts, 5);
    EXPECT_EQ(poller.state(), FinalizationPoller::State::Abandoned);
    EXPECT_EQ(sleeper.delays, (std::vector<std::chrono::milliseconds>{
                                  1000ms, 2000ms, 4000ms, 8000ms}));
    EXPECT_EQ(handle.status, TokenStatus::Partial);
}

TEST_F(FinalizationPollerTest, FullWithWrongSizeIsNotFinal) {
    EXPECT_CALL(transport, getTokenStatus("0_token", _))
        .WillOnce(Return(report(TokenStatus::Full, kTotalSize - 1)))
        .WillOnce(Return(report(TokenStatus::Full, kTotalSize)));

    auto result = poller.await(handle, kTotalSize, stop.get_token());
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(poller.polls(), 2);
}

TEST_F(FinalizationPollerTest, TransientStatusErrorDoesNotConsumeAPoll) {
    EXPECT_CALL(transport, getTokenStatus("0_token", _))
        .WillOnce(Return(std::unexpected(transientError("timed out"))))
        .WillOnce(Return(report(TokenStatus::Full, kTotalSize)));

    auto result = poller.await(handle, kTotalSize, stop.get_token());
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(poller.polls(), 1);
    // The only wait is the status retry backoff.
    EXPECT_EQ(sleeper.delays, (std::vector<std::chrono::milliseconds>{1000ms}));
}

TEST_F(FinalizationPollerTest, StatusErrorAbandons) {
    EXPECT_CALL(transport, getTokenStatus("0_token", _))
        .WillOnce(Return(std::unexpected(protocolError("invalid ks"))));

    auto result = poller.await(handle, kTotalSize, stop.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, UploadError::Kind::Protocol);
    EXPECT_EQ(result.error().tokenId, "0_token");
    EXPECT_EQ(poller.state(), FinalizationPoller::State::Abandoned);
}

TEST_F(FinalizationPollerTest, StopDuringWaitCancels) {
    sleeper.completes = false;
    EXPECT_CALL(transport, getTokenStatus("0_token", _))
        .WillOnce(Return(report(TokenStatus::Partial, 1024)));

    auto result = poller.await(handle, kTotalSize, stop.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, UploadError::Kind::Cancelled);
    EXPECT_EQ(result.error().tokenId, "0_token");
}
