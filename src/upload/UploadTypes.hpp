#pragma once

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace MediaUpload {

// Server-side state of an upload token.
enum class TokenStatus { Pending, Partial, Full, Unknown };

// Identity of one server-side upload token.
struct TokenHandle {
    std::string id;
    TokenStatus status = TokenStatus::Pending;
    std::uint64_t uploadedBytes = 0;
};

// What getTokenStatus reports.
struct TokenStatusReport {
    TokenStatus status = TokenStatus::Unknown;
    std::uint64_t uploadedBytes = 0;
};

// One chunk about to be sent. The payload is borrowed from the reader.
struct ChunkPlan {
    std::span<const std::uint8_t> payload;
    std::uint64_t offset = 0;
    bool isFinal = false;
    bool isResume = false;
};

// Acknowledged chunk, kept for progress reporting and inspection.
struct ChunkRecord {
    std::uint64_t offset = 0;
    std::size_t length = 0;
    bool isFinal = false;
    int retries = 0;
    std::chrono::duration<double> elapsed{};
};

// One file transfer in progress.
struct UploadSession {
    std::filesystem::path filePath;
    std::uint64_t totalSize = 0;
    std::uint64_t offset = 0;
    TokenHandle token;
    std::vector<ChunkRecord> chunks;
};

std::string_view toString(TokenStatus status);

}  // namespace MediaUpload

template <>
struct fmt::formatter<MediaUpload::TokenStatus> : formatter<std::string_view> {
    auto format(MediaUpload::TokenStatus c,
                format_context& ctx) const -> format_context::iterator {
        return formatter<std::string_view>::format(MediaUpload::toString(c),
                                                   ctx);
    }
};
