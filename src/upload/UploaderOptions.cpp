#include "UploaderOptions.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <fmt/format.h>

#include <ConfigManager.hpp>
#include <optional>
#include <string>

namespace MediaUpload {

namespace {

using Configs = ConfigManager::Configs;

absl::Status parseError(Configs config, const std::string& value,
                        std::string_view expected) {
    return absl::InvalidArgumentError(
        fmt::format("{}: '{}' is not {}", ConfigManager::entryOf(config).name,
                    value, expected));
}

absl::Status readInt(const ConfigManager& config, Configs which, int* out) {
    const auto value = config.get(which);
    if (!value) {
        return absl::OkStatus();
    }
    if (!absl::SimpleAtoi(*value, out)) {
        return parseError(which, *value, "an integer");
    }
    return absl::OkStatus();
}

absl::Status readDouble(const ConfigManager& config, Configs which,
                        double* out) {
    const auto value = config.get(which);
    if (!value) {
        return absl::OkStatus();
    }
    if (!absl::SimpleAtod(*value, out)) {
        return parseError(which, *value, "a number");
    }
    return absl::OkStatus();
}

absl::Status readBool(const ConfigManager& config, Configs which, bool* out) {
    const auto value = config.get(which);
    if (!value) {
        return absl::OkStatus();
    }
    if (!absl::SimpleAtob(absl::StripAsciiWhitespace(*value), out)) {
        return parseError(which, *value, "a boolean");
    }
    return absl::OkStatus();
}

}  // namespace

absl::Status UploaderOptions::validate() const {
    if (chunking.initialSizeKB < 1) {
        return absl::InvalidArgumentError("chunk size must be at least 1 KB");
    }
    if (chunking.minSizeKB < 1 || chunking.minSizeKB > chunking.maxSizeKB) {
        return absl::InvalidArgumentError(fmt::format(
            "invalid adaptive chunk bounds [{}, {}] KB", chunking.minSizeKB,
            chunking.maxSizeKB));
    }
    if (chunking.targetSecondsPerChunk <= 0) {
        return absl::InvalidArgumentError(
            "target upload time must be positive");
    }
    if (requestTimeout.count() <= 0) {
        return absl::InvalidArgumentError("request timeout must be positive");
    }
    for (const auto* policy : {&chunkRetry, &statusRetry, &finalizePoll}) {
        if (policy->maxAttempts < 1 || policy->baseDelay.count() < 0) {
            return absl::InvalidArgumentError("invalid retry policy");
        }
    }
    return absl::OkStatus();
}

absl::StatusOr<UploaderOptions> UploaderOptions::fromConfig(
    const ConfigManager& config) {
    UploaderOptions options;
    // Adaptive sizing is on unless configured otherwise.
    options.chunking.adaptive = true;

    int chunkKB = static_cast<int>(options.chunking.initialSizeKB);
    int minKB = static_cast<int>(options.chunking.minSizeKB);
    int maxKB = static_cast<int>(options.chunking.maxSizeKB);
    int timeout = static_cast<int>(options.requestTimeout.count());

    for (auto status :
         {readInt(config, Configs::CHUNK_SIZE_KB, &chunkKB),
          readInt(config, Configs::MIN_CHUNK_SIZE_KB, &minKB),
          readInt(config, Configs::MAX_CHUNK_SIZE_KB, &maxKB),
          readInt(config, Configs::REQUEST_TIMEOUT, &timeout),
          readDouble(config, Configs::TARGET_UPLOAD_TIME,
                     &options.chunking.targetSecondsPerChunk),
          readBool(config, Configs::ADAPTIVE_CHUNKING,
                   &options.chunking.adaptive)}) {
        if (!status.ok()) {
            return status;
        }
    }

    options.chunking.initialSizeKB = chunkKB;
    options.chunking.minSizeKB = minKB;
    options.chunking.maxSizeKB = maxKB;
    options.requestTimeout = std::chrono::seconds(timeout);

    if (auto status = options.validate(); !status.ok()) {
        return status;
    }
    return options;
}

}  // namespace MediaUpload
