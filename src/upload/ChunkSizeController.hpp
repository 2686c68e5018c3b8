#pragma once

#include <cstddef>

namespace MediaUpload {

/**
 * @brief Owns the chunk size of one upload and adapts it to the measured
 * throughput.
 *
 * After each chunk the size moves halfway towards the size that would have
 * taken targetSecondsPerChunk at the observed speed, then gets clamped into
 * [minSizeKB, maxSizeKB]. The initial size is used as given until the first
 * adaptation.
 */
class ChunkSizeController {
   public:
    struct Options {
        double initialSizeKB = 2048;
        double minSizeKB = 1024;
        double maxSizeKB = 102400;
        double targetSecondsPerChunk = 5.0;
        bool adaptive = false;
    };

    // Throws std::invalid_argument if initialSizeKB < 1 or min > max.
    explicit ChunkSizeController(const Options& options);

    /**
     * @brief Feed the timing of the chunk that was just acknowledged.
     *
     * No-op when adaptive sizing is off or @p elapsedSeconds is not
     * positive.
     */
    void adjust(double elapsedSeconds, std::size_t chunkBytesSent);

    [[nodiscard]] double currentSizeKB() const noexcept { return _currentKB; }
    // Byte size to request for the next read, never less than 1.
    [[nodiscard]] std::size_t currentSizeBytes() const noexcept;
    [[nodiscard]] const Options& options() const noexcept { return _options; }

   private:
    Options _options;
    double _currentKB;
};

}  // namespace MediaUpload
