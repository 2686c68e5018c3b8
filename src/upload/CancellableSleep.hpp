#pragma once

#include <chrono>
#include <functional>
#include <stop_token>

namespace MediaUpload {

/**
 * @brief Sleep for @p duration unless a stop is requested on @p token.
 *
 * @return true if the full duration elapsed, false if the sleep was cut
 * short by a stop request (including one made before the call).
 */
bool sleepFor(std::chrono::milliseconds duration, const std::stop_token& token);

// Backoff wait used by the retry and polling loops. Tests substitute one that
// records the requested delays instead of waiting.
using Sleeper =
    std::function<bool(std::chrono::milliseconds, const std::stop_token&)>;

}  // namespace MediaUpload
