#pragma once

#include <absl/status/status.h>
#include <fmt/format.h>

#include <expected>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

namespace MediaUpload {

/**
 * @brief Error reported by every fallible step of an upload.
 *
 * @c kind selects the member of the error taxonomy, @c cause keeps the
 * canonical code and the underlying message. File path, token id and
 * attempt count are filled in as the error bubbles up through the layers
 * that know them.
 */
struct UploadError {
    enum class Kind {
        FileValidation,     // Missing, not a regular file, empty, unreadable.
        TokenCreation,      // createToken failed after retries.
        TransientNetwork,   // Timeout, reset, 5xx. Retryable.
        Protocol,           // Rejected by the server. Never retried.
        TokenNotFinalized,  // Finalization polling gave up.
        Cancelled,          // Stop was requested.
    };

    Kind kind;
    absl::Status cause;
    std::filesystem::path file;
    std::string tokenId;
    int attempts = 0;

    [[nodiscard]] bool retryable() const noexcept {
        return kind == Kind::TransientNetwork;
    }

    UploadError& withFile(const std::filesystem::path& path) {
        if (file.empty()) {
            file = path;
        }
        return *this;
    }
    UploadError& withToken(std::string_view id) {
        if (tokenId.empty()) {
            tokenId = id;
        }
        return *this;
    }
    UploadError& withAttempts(int count) {
        attempts = count;
        return *this;
    }

    [[nodiscard]] std::string toString() const;

    static UploadError fileValidation(absl::Status cause);
    static UploadError tokenCreation(absl::Status cause);
    static UploadError transient(absl::Status cause);
    static UploadError protocol(absl::Status cause);
    static UploadError tokenNotFinalized(std::string_view tokenId,
                                         int attempts);
    static UploadError cancelled(std::string_view what);
};

template <typename T>
using UploadResult = std::expected<T, UploadError>;

std::string_view toString(UploadError::Kind kind);

inline std::ostream& operator<<(std::ostream& os, const UploadError& error) {
    return os << error.toString();
}

}  // namespace MediaUpload

template <>
struct fmt::formatter<MediaUpload::UploadError::Kind>
    : formatter<std::string_view> {
    auto format(MediaUpload::UploadError::Kind c,
                format_context& ctx) const -> format_context::iterator {
        return formatter<std::string_view>::format(MediaUpload::toString(c),
                                                   ctx);
    }
};

template <>
struct fmt::formatter<MediaUpload::UploadError> : formatter<std::string_view> {
    auto format(const MediaUpload::UploadError& e,
                format_context& ctx) const -> format_context::iterator {
        return formatter<std::string_view>::format(e.toString(), ctx);
    }
};
