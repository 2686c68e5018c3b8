#include "UploadError.hpp"

#include <fmt/format.h>

#include <utility>

namespace MediaUpload {

std::string_view toString(UploadError::Kind kind) {
    switch (kind) {
        case UploadError::Kind::FileValidation:
            return "FileValidation";
        case UploadError::Kind::TokenCreation:
            return "TokenCreation";
        case UploadError::Kind::TransientNetwork:
            return "TransientNetwork";
        case UploadError::Kind::Protocol:
            return "Protocol";
        case UploadError::Kind::TokenNotFinalized:
            return "TokenNotFinalized";
        case UploadError::Kind::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

std::string UploadError::toString() const {
    std::string out = fmt::format("{}: {}", kind, std::string(cause.message()));
    if (!tokenId.empty()) {
        out += fmt::format(" (token={})", tokenId);
    }
    if (attempts > 0) {
        out += fmt::format(" (attempts={})", attempts);
    }
    if (!file.empty()) {
        out += fmt::format(" (file={})", file.string());
    }
    return out;
}

UploadError UploadError::fileValidation(absl::Status cause) {
    return {.kind = Kind::FileValidation, .cause = std::move(cause)};
}

UploadError UploadError::tokenCreation(absl::Status cause) {
    return {.kind = Kind::TokenCreation, .cause = std::move(cause)};
}

UploadError UploadError::transient(absl::Status cause) {
    return {.kind = Kind::TransientNetwork, .cause = std::move(cause)};
}

UploadError UploadError::protocol(absl::Status cause) {
    return {.kind = Kind::Protocol, .cause = std::move(cause)};
}

UploadError UploadError::tokenNotFinalized(std::string_view tokenId,
                                           int attempts) {
    return {.kind = Kind::TokenNotFinalized,
            .cause = absl::DeadlineExceededError(
                fmt::format("Upload token {} not finalized after {} attempts",
                            tokenId, attempts)),
            .tokenId = std::string(tokenId),
            .attempts = attempts};
}

UploadError UploadError::cancelled(std::string_view what) {
    return {.kind = Kind::Cancelled,
            .cause = absl::CancelledError(
                fmt::format("{} cancelled", what))};
}

}  // namespace MediaUpload
