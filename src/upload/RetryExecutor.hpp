#pragma once

#include <chrono>
#include <concepts>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "CancellableSleep.hpp"
#include "UploadError.hpp"

namespace MediaUpload {

struct RetryPolicy {
    int maxAttempts = 5;
    std::chrono::milliseconds baseDelay{1000};
};

// Bookkeeping for one retryable operation.
struct RetryState {
    int attempt = 0;
    std::chrono::milliseconds nextDelay{0};
    int maxAttempts = 0;

    // Failed attempts before the outcome, i.e. how often it was retried.
    [[nodiscard]] int retries() const noexcept {
        return attempt > 0 ? attempt - 1 : 0;
    }
};

template <typename T>
struct is_upload_result : std::false_type {};

template <typename T>
struct is_upload_result<UploadResult<T>> : std::true_type {};

/**
 * @brief Runs an operation with bounded retries and exponential backoff.
 *
 * Transient failures are retried after baseDelay * 2^(attempt-1), counting
 * attempts from 1. Anything that is not UploadError::retryable() is returned
 * right away. When maxAttempts attempts failed, the last error is returned.
 * A stop request ends the loop before the next attempt or during the
 * backoff, with UploadError::Kind::Cancelled.
 */
class RetryExecutor {
   public:
    // Throws std::invalid_argument if maxAttempts < 1.
    explicit RetryExecutor(RetryPolicy policy, Sleeper sleeper = sleepFor);

    template <typename Op>
        requires std::invocable<Op> &&
                 is_upload_result<std::invoke_result_t<Op>>::value
    std::invoke_result_t<Op> run(std::string_view what, Op&& op,
                                 const std::stop_token& token);

    // State of the most recent run().
    [[nodiscard]] const RetryState& lastState() const noexcept {
        return _state;
    }
    [[nodiscard]] const RetryPolicy& policy() const noexcept {
        return _policy;
    }

    // Delay slept after the given failed attempt (1-based).
    [[nodiscard]] std::chrono::milliseconds delayFor(int attempt) const;

   private:
    // Decides what happens after a failed attempt. Returns true to retry.
    bool onFailure(std::string_view what, UploadError& error,
                   const std::stop_token& token);

    RetryPolicy _policy;
    Sleeper _sleeper;
    RetryState _state;
};

template <typename Op>
    requires std::invocable<Op> &&
             is_upload_result<std::invoke_result_t<Op>>::value
std::invoke_result_t<Op> RetryExecutor::run(std::string_view what, Op&& op,
                                            const std::stop_token& token) {
    _state = RetryState{.maxAttempts = _policy.maxAttempts};

    while (true) {
        if (token.stop_requested()) {
            return std::unexpected(
                UploadError::cancelled(what).withAttempts(_state.attempt));
        }
        ++_state.attempt;
        auto result = op();
        if (result.has_value()) {
            return result;
        }
        if (!onFailure(what, result.error(), token)) {
            return result;
        }
    }
}

}  // namespace MediaUpload
