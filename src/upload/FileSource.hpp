#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

#include "UploadError.hpp"

namespace MediaUpload {

/**
 * @brief Sequential, non-restartable binary reader over a local file.
 *
 * open() rejects paths that do not exist, are not regular files or are
 * empty. The underlying handle is closed when the FileSource is destroyed,
 * whichever way the upload ends.
 */
class FileSource {
   public:
    struct Chunk {
        std::vector<std::uint8_t> data;
        // True when this read reached the end of the file.
        bool eof = false;
    };

    static UploadResult<FileSource> open(const std::filesystem::path& path);

    FileSource(FileSource&&) noexcept = default;
    FileSource& operator=(FileSource&&) noexcept = default;
    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    /**
     * @brief Read the next chunk.
     *
     * Never returns more than @p maxBytes, nor more than what is left of the
     * size measured at open(). A short chunk is only returned at the end of
     * the file. Reading past the end yields an empty chunk with eof set.
     */
    UploadResult<Chunk> read(std::size_t maxBytes);

    [[nodiscard]] std::uint64_t size() const noexcept { return _size; }
    [[nodiscard]] std::uint64_t position() const noexcept { return _position; }
    [[nodiscard]] bool eof() const noexcept { return _position >= _size; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return _path;
    }

   private:
    struct Closer {
        void operator()(std::FILE* handle) const noexcept;
    };
    using Handle = std::unique_ptr<std::FILE, Closer>;

    FileSource(std::filesystem::path path, std::uint64_t size, Handle handle);

    std::filesystem::path _path;
    std::uint64_t _size = 0;
    std::uint64_t _position = 0;
    Handle _handle;
};

}  // namespace MediaUpload
