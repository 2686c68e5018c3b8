#include "ApiProtocol.hpp"

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/strip.h>
#include <fmt/format.h>

#include <LogCompat.hpp>
#include <cmath>
#include <string>

namespace MediaUpload::Api {

namespace {

constexpr long HTTP_REQUEST_TIMEOUT = 408;
constexpr long HTTP_TOO_MANY_REQUESTS = 429;
constexpr long HTTP_UNAUTHORIZED = 401;
constexpr long HTTP_FORBIDDEN = 403;
constexpr long HTTP_NOT_FOUND = 404;
constexpr std::string_view kApiExceptionType = "KalturaAPIException";
constexpr std::size_t kMaxBodyInMessage = 200;

std::string_view excerpt(std::string_view body) {
    return body.substr(0, kMaxBodyInMessage);
}

// Numbers may arrive as JSON numbers or as strings.
bool readNumber(const Json::Value& node, double* out) {
    if (node.isNumeric()) {
        *out = node.asDouble();
        return true;
    }
    if (node.isString()) {
        return absl::SimpleAtod(node.asString(), out);
    }
    return false;
}

std::string stringMember(const Json::Value& root, const char* key) {
    const Json::Value& node = root[key];
    return node.isString() ? node.asString() : std::string();
}

}  // namespace

std::string actionUrl(std::string_view serviceUrl, std::string_view action) {
    absl::string_view url(serviceUrl.data(), serviceUrl.size());
    while (absl::ConsumeSuffix(&url, "/")) {
    }
    return absl::StrCat(url, std::string(kServicePath), std::string(action));
}

std::vector<FormField> createTokenFields(std::string_view fileName,
                                         std::uint64_t fileSize) {
    return {
        {"uploadToken[objectType]", "KalturaUploadToken"},
        {"uploadToken[fileName]", std::string(fileName)},
        {"uploadToken[fileSize]", std::to_string(fileSize)},
    };
}

std::vector<FormField> chunkFields(const ChunkPlan& chunk) {
    return {
        {"resume", chunk.isResume ? "1" : "0"},
        {"resumeAt", std::to_string(chunk.offset)},
        {"finalChunk", chunk.isFinal ? "1" : "0"},
    };
}

std::string chunkFileName(std::uint64_t offset) {
    return absl::StrCat("chunk_", offset);
}

TokenStatus toTokenStatus(int code) {
    switch (static_cast<TokenStatusCode>(code)) {
        case TokenStatusCode::PENDING:
            return TokenStatus::Pending;
        case TokenStatusCode::PARTIAL_UPLOAD:
            return TokenStatus::Partial;
        case TokenStatusCode::FULL_UPLOAD:
            return TokenStatus::Full;
        default:
            break;
    }
    return TokenStatus::Unknown;
}

UploadError classifyHttpStatus(long httpCode, std::string_view body) {
    const std::string message =
        fmt::format("HTTP status code {}: {}", httpCode, excerpt(body));

    if (httpCode == HTTP_REQUEST_TIMEOUT ||
        httpCode == HTTP_TOO_MANY_REQUESTS || httpCode >= 500) {
        return UploadError::transient(absl::UnavailableError(message));
    }
    switch (httpCode) {
        case HTTP_UNAUTHORIZED:
        case HTTP_FORBIDDEN:
            return UploadError::protocol(
                absl::PermissionDeniedError(message));
        case HTTP_NOT_FOUND:
            return UploadError::protocol(absl::NotFoundError(message));
        default:
            break;
    }
    return UploadError::protocol(absl::InvalidArgumentError(message));
}

UploadResult<Json::Value> parseResponse(std::string_view body) {
    Json::Value root;
    if (absl::StripAsciiWhitespace(std::string(body)).empty()) {
        return root;
    }

    Json::Reader reader;
    if (!reader.parse(body.data(), body.data() + body.size(), root)) {
        LOG(WARNING) << "Failed to parse json: "
                     << reader.getFormattedErrorMessages();
        return std::unexpected(UploadError::protocol(absl::DataLossError(
            fmt::format("Malformed response: {}", excerpt(body)))));
    }

    if (root.isObject() &&
        stringMember(root, "objectType") == kApiExceptionType) {
        const std::string code = stringMember(root, "code");
        const std::string message = stringMember(root, "message");
        return std::unexpected(UploadError::protocol(
            absl::FailedPreconditionError(fmt::format("{}: {}", code, message))));
    }
    return root;
}

UploadResult<TokenHandle> parseTokenHandle(const Json::Value& root) {
    const std::string id =
        root.isObject() ? stringMember(root, "id") : std::string();
    if (id.empty()) {
        return std::unexpected(UploadError::protocol(
            absl::DataLossError("Upload token response has no id")));
    }

    TokenHandle handle{.id = id};
    if (root["status"].isIntegral()) {
        handle.status = toTokenStatus(root["status"].asInt());
    }
    return handle;
}

UploadResult<TokenStatusReport> parseTokenStatus(const Json::Value& root) {
    if (!root.isObject()) {
        return std::unexpected(UploadError::protocol(
            absl::DataLossError("Upload token status response is not an object")));
    }

    TokenStatusReport report;
    double status = 0;
    if (readNumber(root["status"], &status)) {
        report.status = toTokenStatus(static_cast<int>(status));
    }
    double uploaded = 0;
    if (readNumber(root["uploadedFileSize"], &uploaded) && uploaded > 0) {
        report.uploadedBytes = static_cast<std::uint64_t>(std::llround(uploaded));
    }
    return report;
}

}  // namespace MediaUpload::Api
