#pragma once

#include <cstdint>
#include <stop_token>
#include <string>

#include "CancellableSleep.hpp"
#include "RetryExecutor.hpp"
#include "UploadError.hpp"
#include "UploadTransport.hpp"
#include "UploadTypes.hpp"

namespace MediaUpload {

/**
 * @brief Waits for the server to report a token as fully uploaded.
 *
 * Each poll goes through its own RetryExecutor (statusRetry), so a transient
 * failure of one getTokenStatus call does not consume a poll. Between polls
 * the poller backs off by pollPolicy.baseDelay * 2^(poll-1). The token is
 * finalized only when the status is Full and the reported byte count equals
 * the local file size.
 */
class FinalizationPoller {
   public:
    enum class State { Polling, Finalized, Abandoned };

    FinalizationPoller(UploadTransport& transport, RetryPolicy pollPolicy,
                       RetryPolicy statusRetry, Sleeper sleeper = sleepFor);

    /**
     * @brief Poll @p handle until finalized or out of attempts.
     *
     * Updates @p handle with the last status seen. Fails with
     * TokenNotFinalized after pollPolicy.maxAttempts polls, or with the
     * status call's own error if it could not be fetched.
     */
    UploadResult<void> await(TokenHandle& handle, std::uint64_t totalSize,
                             const std::stop_token& token);

    [[nodiscard]] State state() const noexcept { return _state; }
    [[nodiscard]] int polls() const noexcept { return _polls; }

   private:
    UploadTransport& _transport;
    RetryPolicy _pollPolicy;
    RetryExecutor _statusRetry;
    Sleeper _sleeper;
    State _state = State::Polling;
    int _polls = 0;
};

}  // namespace MediaUpload
