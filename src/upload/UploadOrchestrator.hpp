#pragma once

#include <filesystem>
#include <stop_token>
#include <string>

#include "CancellableSleep.hpp"
#include "UploadError.hpp"
#include "UploadTransport.hpp"
#include "UploadTypes.hpp"
#include "UploaderOptions.hpp"

namespace MediaUpload {

class FileSource;

/**
 * @brief End-to-end chunked upload of one file.
 *
 * Validates the file, creates an upload token, sends the file in strictly
 * increasing offset order (each chunk retried on its own, an acknowledged
 * chunk is never sent again), then waits for the server to finalize the
 * token. Nothing is cleaned up on the server when an upload fails.
 */
class UploadOrchestrator {
   public:
    // Throws std::invalid_argument if @p options does not validate.
    UploadOrchestrator(UploadTransport& transport, UploaderOptions options,
                       Sleeper sleeper = sleepFor);

    /**
     * @brief Upload @p filePath and return the upload token id.
     *
     * Fails with the first error met: FileValidation, TokenCreation, the
     * chunk error once its retries are exhausted, TokenNotFinalized or
     * Cancelled.
     */
    UploadResult<std::string> upload(const std::filesystem::path& filePath,
                                     const std::stop_token& token = {});

    // Session of the most recent upload(), successful or not.
    [[nodiscard]] const UploadSession& lastSession() const noexcept {
        return _session;
    }

   private:
    UploadResult<TokenHandle> createToken(const std::stop_token& token);
    UploadResult<void> sendChunks(FileSource& source,
                                  const std::stop_token& token);

    UploadTransport& _transport;
    UploaderOptions _options;
    Sleeper _sleeper;
    UploadSession _session;
};

}  // namespace MediaUpload
