#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stop_token>
#include <string>
#include <system_error>
#include <upload/CancellableSleep.hpp>
#include <upload/UploadError.hpp>
#include <vector>

// Records requested backoff delays instead of sleeping.
struct RecordingSleeper {
    std::vector<std::chrono::milliseconds> delays;
    // What the sleep reports, false simulates a stop during the wait.
    bool completes = true;

    MediaUpload::Sleeper sleeper() {
        return [this](std::chrono::milliseconds delay,
                      const std::stop_token& /*token*/) {
            delays.push_back(delay);
            return completes;
        };
    }
};

// A file under the test temp dir, filled with a byte pattern derived from
// the offset, removed again on destruction.
class TempFile {
   public:
    TempFile(const std::string& name, std::uint64_t size)
        : _path(std::filesystem::path(testing::TempDir()) / name) {
        std::ofstream out(_path, std::ios::binary | std::ios::trunc);
        for (std::uint64_t i = 0; i < size; ++i) {
            out.put(static_cast<char>(i % 251));
        }
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(_path, ec);
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return _path; }

   private:
    std::filesystem::path _path;
};

inline MediaUpload::UploadError transientError(const std::string& message) {
    return MediaUpload::UploadError::transient(
        absl::UnavailableError(message));
}

inline MediaUpload::UploadError protocolError(const std::string& message) {
    return MediaUpload::UploadError::protocol(
        absl::InvalidArgumentError(message));
}
