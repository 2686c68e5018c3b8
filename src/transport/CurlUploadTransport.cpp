#include "CurlUploadTransport.hpp"

#include <absl/strings/str_cat.h>
#include <fmt/format.h>

#include <LogCompat.hpp>
#include <memory>
#include <stop_token>
#include <utility>

namespace MediaUpload {

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
struct MimeDeleter {
    void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};
struct CurlStringDeleter {
    void operator()(char* str) const { curl_free(str); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using MimeHandle = std::unique_ptr<curl_mime, MimeDeleter>;

std::string escape(std::string_view value) {
    std::unique_ptr<char, CurlStringDeleter> escaped(curl_easy_escape(
        nullptr, value.data(), static_cast<int>(value.size())));
    if (!escaped) {
        return std::string(value);
    }
    return escaped.get();
}

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents),
                                             size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progressCallback(void* clientp, curl_off_t /*dltotal*/,
                     curl_off_t /*dlnow*/, curl_off_t /*ultotal*/,
                     curl_off_t /*ulnow*/) {
    const auto* token = static_cast<const std::stop_token*>(clientp);
    return token->stop_requested() ? 1 : 0;
}

}  // namespace

CurlUploadTransport::CurlUploadTransport(Options options)
    : _options(std::move(options)) {}

std::string CurlUploadTransport::requestUrl(std::string_view action,
                                            std::string_view tokenId) const {
    std::string url = absl::StrCat(
        Api::actionUrl(_options.serviceUrl, action), "?", std::string(Api::kParamFormat),
        "=", std::string(Api::kFormatJson), "&", std::string(Api::kParamSessionKey), "=",
        escape(_options.sessionKey));
    if (!tokenId.empty()) {
        absl::StrAppend(&url, "&", std::string(Api::kParamTokenId), "=", escape(tokenId));
    }
    return url;
}

UploadError CurlUploadTransport::classifyCurlCode(CURLcode code,
                                                  std::string_view detail) {
    const std::string message =
        detail.empty() ? std::string(curl_easy_strerror(code))
                       : fmt::format("{}: {}", curl_easy_strerror(code), detail);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return UploadError::transient(absl::DeadlineExceededError(message));
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
        case CURLE_SSL_CONNECT_ERROR:
            return UploadError::transient(absl::UnavailableError(message));
        case CURLE_ABORTED_BY_CALLBACK:
            return UploadError::cancelled("Request");
        default:
            break;
    }
    return UploadError::protocol(absl::InternalError(message));
}

UploadResult<Json::Value> CurlUploadTransport::post(
    std::string_view action, std::string_view tokenId,
    const std::vector<Api::FormField>& fields, const ChunkPlan* chunk,
    const std::stop_token& token) {
    if (token.stop_requested()) {
        return std::unexpected(UploadError::cancelled("Request"));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        LOG(ERROR) << "Failed to initialize cURL";
        return std::unexpected(UploadError::transient(
            absl::ResourceExhaustedError("Failed to initialize cURL")));
    }

    const std::string url = requestUrl(action, tokenId);
    std::string result;
    char errorBuffer[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,
                     static_cast<long>(_options.requestTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    // Build the form
    MimeHandle mime(curl_mime_init(curl.get()));
    for (const auto& field : fields) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, field.name.c_str());
        curl_mime_data(part, field.value.c_str(), CURL_ZERO_TERMINATED);
    }
    std::string chunkName;
    if (chunk != nullptr) {
        chunkName = Api::chunkFileName(chunk->offset);
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, Api::kChunkFieldName.data());
        curl_mime_data(part, reinterpret_cast<const char*>(chunk->payload.data()),
                       chunk->payload.size());
        curl_mime_filename(part, chunkName.c_str());
        curl_mime_type(part, Api::kChunkContentType.data());
    }
    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());

    // Write the response
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result);

    // Abort on stop request
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &token);

    DLOG(DEBUG) << fmt::format("POST {} ({} fields{})", action, fields.size(),
                               chunk != nullptr
                                   ? fmt::format(", {} bytes", chunk->payload.size())
                                   : std::string());
    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        LOG(WARNING) << "cURL error: " << curl_easy_strerror(res);
        return std::unexpected(classifyCurlCode(res, errorBuffer));
    }

    long httpCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
    if (httpCode < 200 || httpCode >= 300) {
        LOG(WARNING) << fmt::format("{} failed: HTTP status code {}", action,
                                    httpCode);
        return std::unexpected(Api::classifyHttpStatus(httpCode, result));
    }
    return Api::parseResponse(result);
}

UploadResult<TokenHandle> CurlUploadTransport::createToken(
    const std::string& fileName, std::uint64_t fileSize,
    const std::stop_token& token) {
    auto response = post(Api::kActionAdd, {},
                         Api::createTokenFields(fileName, fileSize), nullptr,
                         token);
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }
    return Api::parseTokenHandle(*response);
}

UploadResult<void> CurlUploadTransport::uploadChunk(
    const std::string& tokenId, const ChunkPlan& chunk,
    const std::stop_token& token) {
    auto response = post(Api::kActionUpload, tokenId, Api::chunkFields(chunk),
                         &chunk, token);
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }
    return {};
}

UploadResult<TokenStatusReport> CurlUploadTransport::getTokenStatus(
    const std::string& tokenId, const std::stop_token& token) {
    auto response = post(Api::kActionGet, tokenId, {}, nullptr, token);
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }
    return Api::parseTokenStatus(*response);
}

}  // namespace MediaUpload
