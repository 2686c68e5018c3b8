#pragma once

#include <json/json.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <upload/UploadError.hpp>
#include <upload/UploadTypes.hpp>

// Request layout and response parsing of the upload token REST API (v3).
namespace MediaUpload::Api {

constexpr std::string_view kServicePath = "/api_v3/service/uploadtoken/action/";
constexpr std::string_view kActionAdd = "add";
constexpr std::string_view kActionUpload = "upload";
constexpr std::string_view kActionGet = "get";

// Query parameter names.
constexpr std::string_view kParamFormat = "format";
constexpr std::string_view kFormatJson = "1";
constexpr std::string_view kParamSessionKey = "ks";
constexpr std::string_view kParamTokenId = "uploadTokenId";

// Multipart payload part of a chunk upload.
constexpr std::string_view kChunkFieldName = "fileData";
constexpr std::string_view kChunkContentType = "application/octet-stream";

// Server-side status codes of an upload token.
enum class TokenStatusCode : int {
    PENDING = 0,
    PARTIAL_UPLOAD = 1,
    FULL_UPLOAD = 2,
    CLOSED = 3,
    TIMED_OUT = 4,
    DELETED = 5,
};

struct FormField {
    std::string name;
    std::string value;

    bool operator==(const FormField& other) const = default;
};

// <serviceUrl>/api_v3/service/uploadtoken/action/<action>
std::string actionUrl(std::string_view serviceUrl, std::string_view action);

std::vector<FormField> createTokenFields(std::string_view fileName,
                                         std::uint64_t fileSize);

// resume, resumeAt and finalChunk, in that order.
std::vector<FormField> chunkFields(const ChunkPlan& chunk);

// chunk_<offset>
std::string chunkFileName(std::uint64_t offset);

TokenStatus toTokenStatus(int code);

/**
 * @brief Maps a non-2xx HTTP status to an error.
 *
 * 408, 429 and 5xx are transient; other codes are protocol errors.
 */
UploadError classifyHttpStatus(long httpCode, std::string_view body);

/**
 * @brief Parses a JSON response body.
 *
 * An API exception object or a body that is not JSON becomes a Protocol
 * error. An empty body yields a null value.
 */
UploadResult<Json::Value> parseResponse(std::string_view body);

UploadResult<TokenHandle> parseTokenHandle(const Json::Value& root);
UploadResult<TokenStatusReport> parseTokenStatus(const Json::Value& root);

}  // namespace MediaUpload::Api
