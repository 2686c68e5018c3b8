#pragma once

#include <cstdint>
#include <stop_token>
#include <string>

#include "UploadError.hpp"
#include "UploadTypes.hpp"

namespace MediaUpload {

/**
 * @brief The only component of the uploader that talks to the network.
 *
 * Implementations must report timeouts and connection failures as
 * UploadError::Kind::TransientNetwork and server-side rejections as
 * UploadError::Kind::Protocol, so the caller can tell what is worth retrying.
 * An in-flight call should abort with UploadError::Kind::Cancelled once
 * @p token has a stop request.
 */
class UploadTransport {
   public:
    virtual ~UploadTransport() = default;

    /**
     * @brief Create a server-side upload token.
     *
     * @param fileName Base name of the file, without directories.
     * @param fileSize Size of the file in bytes.
     */
    virtual UploadResult<TokenHandle> createToken(
        const std::string& fileName, std::uint64_t fileSize,
        const std::stop_token& token) = 0;

    /**
     * @brief Send a single chunk as a multipart body.
     *
     * Fields: resume ("1"/"0"), resumeAt (decimal offset),
     * finalChunk ("1"/"0") and fileData (the payload).
     */
    virtual UploadResult<void> uploadChunk(const std::string& tokenId,
                                           const ChunkPlan& chunk,
                                           const std::stop_token& token) = 0;

    // Fetch the server's view of the token.
    virtual UploadResult<TokenStatusReport> getTokenStatus(
        const std::string& tokenId, const std::stop_token& token) = 0;
};

}  // namespace MediaUpload
