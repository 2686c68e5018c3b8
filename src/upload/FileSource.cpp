#include "FileSource.hpp"

#include <absl/status/status.h>
#include <fmt/format.h>

#include <LogCompat.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

namespace MediaUpload {

void FileSource::Closer::operator()(std::FILE* handle) const noexcept {
    if (handle != nullptr && std::fclose(handle) != 0) {
        PLOG(WARNING) << "fclose failed";
    }
}

FileSource::FileSource(std::filesystem::path path, std::uint64_t size,
                       Handle handle)
    : _path(std::move(path)), _size(size), _handle(std::move(handle)) {}

UploadResult<FileSource> FileSource::open(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (!std::filesystem::exists(status)) {
        return std::unexpected(
            UploadError::fileValidation(
                absl::NotFoundError(
                    fmt::format("File '{}' does not exist", path.string())))
                .withFile(path));
    }
    if (!std::filesystem::is_regular_file(status)) {
        return std::unexpected(
            UploadError::fileValidation(
                absl::InvalidArgumentError(fmt::format(
                    "Path '{}' is not a regular file", path.string())))
                .withFile(path));
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(
            UploadError::fileValidation(
                absl::UnavailableError(fmt::format(
                    "Cannot stat '{}': {}", path.string(), ec.message())))
                .withFile(path));
    }
    if (size == 0) {
        return std::unexpected(
            UploadError::fileValidation(
                absl::InvalidArgumentError(fmt::format(
                    "File '{}' is empty. Aborting upload", path.string())))
                .withFile(path));
    }

    Handle handle(std::fopen(path.c_str(), "rb"));
    if (!handle) {
        const int err = errno;
        return std::unexpected(
            UploadError::fileValidation(
                absl::PermissionDeniedError(fmt::format(
                    "Cannot open '{}': {}", path.string(), std::strerror(err))))
                .withFile(path));
    }

    DLOG(DEBUG) << "Opened " << path << " (" << size << " bytes)";
    return FileSource(path, size, std::move(handle));
}

UploadResult<FileSource::Chunk> FileSource::read(std::size_t maxBytes) {
    Chunk chunk;
    const std::uint64_t remaining = _size - std::min(_position, _size);
    const auto want = static_cast<std::size_t>(
        std::min<std::uint64_t>(maxBytes, remaining));

    chunk.data.resize(want);
    std::size_t got = 0;
    if (want != 0) {
        got = std::fread(chunk.data.data(), 1, want, _handle.get());
    }
    if (got != want) {
        if (std::ferror(_handle.get()) != 0) {
            return std::unexpected(
                UploadError::fileValidation(
                    absl::DataLossError(fmt::format(
                        "Read error at offset {} of '{}'", _position,
                        _path.string())))
                    .withFile(_path));
        }
        // The file shrank after open(); the caller decides what that means.
        LOG(WARNING) << "Short read at offset " << _position << " of "
                     << _path << ": wanted " << want << ", got " << got;
        chunk.data.resize(got);
        _position += got;
        chunk.eof = true;
        return chunk;
    }

    _position += got;
    chunk.eof = _position >= _size;
    return chunk;
}

}  // namespace MediaUpload
