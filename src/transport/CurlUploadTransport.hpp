#pragma once

#include <curl/curl.h>

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <upload/UploadTransport.hpp>

#include "ApiProtocol.hpp"

namespace MediaUpload {

/**
 * @brief UploadTransport over libcurl, speaking the upload token REST API.
 *
 * Every call is a multipart/form-data POST to
 * <serviceUrl>/api_v3/service/uploadtoken/action/<action> with the session
 * key and JSON output format in the query string. A stop request aborts the
 * transfer in progress. One instance may be used by one thread at a time.
 */
class CurlUploadTransport : public UploadTransport {
   public:
    struct Options {
        std::string serviceUrl;
        std::string sessionKey;
        std::chrono::seconds requestTimeout{30};
    };

    explicit CurlUploadTransport(Options options);
    ~CurlUploadTransport() override = default;

    UploadResult<TokenHandle> createToken(const std::string& fileName,
                                          std::uint64_t fileSize,
                                          const std::stop_token& token) override;
    UploadResult<void> uploadChunk(const std::string& tokenId,
                                   const ChunkPlan& chunk,
                                   const std::stop_token& token) override;
    UploadResult<TokenStatusReport> getTokenStatus(
        const std::string& tokenId, const std::stop_token& token) override;

    // Full request URL of @p action, query string included.
    [[nodiscard]] std::string requestUrl(std::string_view action,
                                         std::string_view tokenId = {}) const;

    // Timeouts and connection level failures are transient.
    static UploadError classifyCurlCode(CURLcode code, std::string_view detail);

   private:
    UploadResult<Json::Value> post(std::string_view action,
                                   std::string_view tokenId,
                                   const std::vector<Api::FormField>& fields,
                                   const ChunkPlan* chunk,
                                   const std::stop_token& token);

    Options _options;
};

}  // namespace MediaUpload
