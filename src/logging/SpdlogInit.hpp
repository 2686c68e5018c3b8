#pragma once

#include <filesystem>
#include <optional>

/**
 * Initializes spdlog for the uploader.
 *
 * Installs a colored stderr sink as the default logger. When @p logFile is
 * given, a plain file sink is attached as well. @p verbose lowers the level
 * to debug so per-chunk and per-poll decisions are visible.
 *
 * @note Calling it again is a no-op until MediaUpload_SpdlogDeInit().
 */
extern void MediaUpload_SpdlogInit(
    bool verbose = false,
    const std::optional<std::filesystem::path>& logFile = std::nullopt);

// Deregister and cleanup spdlog
extern void MediaUpload_SpdlogDeInit();
