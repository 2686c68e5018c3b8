#pragma once

#include <fmt/format.h>

#include <filesystem>
#include <string_view>

namespace MediaUpload {

// Kind of platform entry a file would become once uploaded.
enum class EntryType { Media, Document, Data };

// MIME type from the file extension (case-insensitive),
// application/octet-stream when unknown.
std::string_view guessMimeType(const std::filesystem::path& path);

EntryType guessEntryType(std::string_view mimeType);

std::string_view toString(EntryType type);

}  // namespace MediaUpload

template <>
struct fmt::formatter<MediaUpload::EntryType> : formatter<std::string_view> {
    auto format(MediaUpload::EntryType c,
                format_context& ctx) const -> format_context::iterator {
        return formatter<std::string_view>::format(MediaUpload::toString(c),
                                                   ctx);
    }
};
