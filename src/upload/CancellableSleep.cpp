#include "CancellableSleep.hpp"

#include <condition_variable>
#include <mutex>

namespace MediaUpload {

bool sleepFor(std::chrono::milliseconds duration,
              const std::stop_token& token) {
    if (token.stop_requested()) {
        return false;
    }
    std::mutex mutex;
    std::condition_variable_any condvar;
    std::unique_lock<std::mutex> lock(mutex);
    // Wakes early only through the stop token.
    condvar.wait_for(lock, token, duration, [] { return false; });
    return !token.stop_requested();
}

}  // namespace MediaUpload
