#include "FinalizationPoller.hpp"

#include <fmt/format.h>

#include <LogCompat.hpp>
#include <utility>

namespace MediaUpload {

FinalizationPoller::FinalizationPoller(UploadTransport& transport,
                                       RetryPolicy pollPolicy,
                                       RetryPolicy statusRetry, Sleeper sleeper)
    : _transport(transport),
      _pollPolicy(pollPolicy),
      _statusRetry(statusRetry, sleeper),
      _sleeper(std::move(sleeper)) {
    if (!_sleeper) {
        _sleeper = sleepFor;
    }
}

UploadResult<void> FinalizationPoller::await(TokenHandle& handle,
                                             std::uint64_t totalSize,
                                             const std::stop_token& token) {
    _state = State::Polling;
    _polls = 0;
    auto delay = _pollPolicy.baseDelay;

    while (_polls < _pollPolicy.maxAttempts) {
        ++_polls;
        auto report = _statusRetry.run(
            "Token status check",
            [&] { return _transport.getTokenStatus(handle.id, token); }, token);
        if (!report) {
            _state = State::Abandoned;
            return std::unexpected(std::move(report.error().withToken(handle.id)));
        }

        handle.status = report->status;
        handle.uploadedBytes = report->uploadedBytes;

        if (report->status == TokenStatus::Full &&
            report->uploadedBytes == totalSize) {
            _state = State::Finalized;
            LOG(INFO) << fmt::format("Upload token {} finalized: {}/{} bytes",
                                     handle.id, report->uploadedBytes,
                                     totalSize);
            return {};
        }
        if (report->status == TokenStatus::Full) {
            LOG(WARNING) << fmt::format(
                "Upload token {} reports full upload with {} bytes, expected {}",
                handle.id, report->uploadedBytes, totalSize);
        }

        if (_polls < _pollPolicy.maxAttempts) {
            LOG(DEBUG) << fmt::format(
                "Upload token {} is {} on attempt {}/{}; waiting {:.1f}s "
                "before next check...",
                handle.id, report->status, _polls, _pollPolicy.maxAttempts,
                std::chrono::duration<double>(delay).count());
            if (!_sleeper(delay, token)) {
                _state = State::Abandoned;
                return std::unexpected(UploadError::cancelled("Finalization")
                                           .withToken(handle.id)
                                           .withAttempts(_polls));
            }
            delay *= 2;
        }
    }

    _state = State::Abandoned;
    LOG(ERROR) << fmt::format("Upload token {} not finalized after {} attempts",
                              handle.id, _polls);
    return std::unexpected(UploadError::tokenNotFinalized(handle.id, _polls));
}

}  // namespace MediaUpload
