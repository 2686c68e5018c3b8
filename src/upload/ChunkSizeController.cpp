#include "ChunkSizeController.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace MediaUpload {

ChunkSizeController::ChunkSizeController(const Options& options)
    : _options(options), _currentKB(options.initialSizeKB) {
    if (options.initialSizeKB < 1) {
        throw std::invalid_argument("chunk size must be at least 1 KB");
    }
    if (options.minSizeKB > options.maxSizeKB) {
        throw std::invalid_argument(
            fmt::format("min chunk size {} KB exceeds max chunk size {} KB",
                        options.minSizeKB, options.maxSizeKB));
    }
}

void ChunkSizeController::adjust(double elapsedSeconds,
                                 std::size_t chunkBytesSent) {
    if (!_options.adaptive || elapsedSeconds <= 0) {
        return;
    }

    const double speedKBps =
        (static_cast<double>(chunkBytesSent) / 1024.0) / elapsedSeconds;
    const double idealKB = speedKBps * _options.targetSecondsPerChunk;
    const double oldKB = _currentKB;

    // Halfway between the old and the ideal size, so one outlier only nudges.
    _currentKB = std::clamp((oldKB + idealKB) / 2.0, _options.minSizeKB,
                            _options.maxSizeKB);

    // Formatted by spdlog only when debug is enabled; runs once per chunk.
    spdlog::debug(
        "Adaptive chunking: old={:.2f}KB, new={:.2f}KB, speed={:.2f}KB/s, "
        "time={:.2f}s",
        oldKB, _currentKB, speedKBps, elapsedSeconds);
}

std::size_t ChunkSizeController::currentSizeBytes() const noexcept {
    return std::max<std::size_t>(1, static_cast<std::size_t>(_currentKB * 1024));
}

}  // namespace MediaUpload
