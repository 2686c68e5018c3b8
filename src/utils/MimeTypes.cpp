#include "MimeTypes.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>

#include <array>
#include <string>
#include <utility>

namespace MediaUpload {

namespace {

constexpr std::string_view kDefaultMimeType = "application/octet-stream";

constexpr std::array<std::pair<std::string_view, std::string_view>, 29>
    kExtensionMap = {{
        // Video
        {".mp4", "video/mp4"},
        {".mov", "video/quicktime"},
        {".avi", "video/x-msvideo"},
        {".wmv", "video/x-ms-wmv"},
        {".flv", "video/x-flv"},
        {".mkv", "video/x-matroska"},
        {".webm", "video/webm"},
        // Audio
        {".mp3", "audio/mpeg"},
        {".wav", "audio/x-wav"},
        {".aac", "audio/aac"},
        {".m4a", "audio/mp4"},
        {".flac", "audio/flac"},
        {".ogg", "audio/ogg"},
        // Image
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".bmp", "image/bmp"},
        {".webp", "image/webp"},
        // Documents
        {".pdf", "application/pdf"},
        {".swf", "application/x-shockwave-flash"},
        {".doc", "application/msword"},
        {".docx",
         "application/"
         "vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx",
         "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".pptx",
         "application/"
         "vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".odt", "application/vnd.oasis.opendocument.text"},
        {".txt", "text/plain"},
    }};

}  // namespace

std::string_view guessMimeType(const std::filesystem::path& path) {
    const std::string ext = absl::AsciiStrToLower(path.extension().string());
    for (const auto& [extension, mime] : kExtensionMap) {
        if (ext == extension) {
            return mime;
        }
    }
    return kDefaultMimeType;
}

EntryType guessEntryType(std::string_view mimeType) {
    const std::string mime = absl::AsciiStrToLower(std::string(mimeType));
    if (absl::StartsWith(mime, "image/") || absl::StartsWith(mime, "audio/") ||
        absl::StartsWith(mime, "video/")) {
        return EntryType::Media;
    }
    if (mime == "application/pdf" || mime == "application/x-shockwave-flash" ||
        absl::StartsWith(mime, "application/msword") ||
        absl::StrContains(mime,
                          "application/vnd.openxmlformats-officedocument")) {
        return EntryType::Document;
    }
    return EntryType::Data;
}

std::string_view toString(EntryType type) {
    switch (type) {
        case EntryType::Media:
            return "media";
        case EntryType::Document:
            return "document";
        case EntryType::Data:
            return "data";
    }
    return "unknown";
}

}  // namespace MediaUpload
