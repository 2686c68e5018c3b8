#include "RetryExecutor.hpp"

#include <fmt/format.h>

#include <LogCompat.hpp>
#include <stdexcept>
#include <utility>

namespace MediaUpload {

RetryExecutor::RetryExecutor(RetryPolicy policy, Sleeper sleeper)
    : _policy(policy), _sleeper(std::move(sleeper)) {
    if (_policy.maxAttempts < 1) {
        throw std::invalid_argument("maxAttempts must be at least 1");
    }
    if (!_sleeper) {
        _sleeper = sleepFor;
    }
}

std::chrono::milliseconds RetryExecutor::delayFor(int attempt) const {
    return _policy.baseDelay * (1LL << (attempt - 1));
}

bool RetryExecutor::onFailure(std::string_view what, UploadError& error,
                              const std::stop_token& token) {
    error.withAttempts(_state.attempt);

    if (!error.retryable()) {
        if (error.kind != UploadError::Kind::Cancelled) {
            LOG(WARNING) << fmt::format(
                "{} failed with a non-retryable error: {}", what, error);
        }
        return false;
    }
    if (_state.attempt >= _policy.maxAttempts) {
        LOG(ERROR) << fmt::format(
            "{}: attempt {}/{} failed with error: {}. No more retries.", what,
            _state.attempt, _policy.maxAttempts, std::string(error.cause.message()));
        return false;
    }

    _state.nextDelay = delayFor(_state.attempt);
    LOG(WARNING) << fmt::format(
        "{}: attempt {}/{} failed with error: {}. Retrying in {:.1f}s...", what,
        _state.attempt, _policy.maxAttempts, std::string(error.cause.message()),
        std::chrono::duration<double>(_state.nextDelay).count());

    if (!_sleeper(_state.nextDelay, token)) {
        error = UploadError::cancelled(what).withAttempts(_state.attempt);
        return false;
    }
    return true;
}

}  // namespace MediaUpload
