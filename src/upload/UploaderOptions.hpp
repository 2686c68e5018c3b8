#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <chrono>

#include "ChunkSizeController.hpp"
#include "RetryExecutor.hpp"

namespace MediaUpload {

class ConfigManager;

struct UploaderOptions {
    ChunkSizeController::Options chunking;
    // Used for createToken and every chunk.
    RetryPolicy chunkRetry;
    // Used for each getTokenStatus call during finalization.
    RetryPolicy statusRetry;
    // Number of finalization polls and the backoff between them.
    RetryPolicy finalizePoll;
    std::chrono::seconds requestTimeout{30};

    [[nodiscard]] absl::Status validate() const;

    // Defaults overridden by whatever @p config sets.
    static absl::StatusOr<UploaderOptions> fromConfig(
        const ConfigManager& config);
};

}  // namespace MediaUpload
