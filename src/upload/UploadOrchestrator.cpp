#include "UploadOrchestrator.hpp"

#include <fmt/format.h>

#include <DurationPoint.hpp>
#include <LogCompat.hpp>
#include <stdexcept>
#include <utility>

#include "ChunkSizeController.hpp"
#include "FileSource.hpp"
#include "FinalizationPoller.hpp"
#include "RetryExecutor.hpp"

namespace MediaUpload {

namespace {

constexpr int kProgressEveryNChunks = 10;

}  // namespace

UploadOrchestrator::UploadOrchestrator(UploadTransport& transport,
                                       UploaderOptions options, Sleeper sleeper)
    : _transport(transport),
      _options(std::move(options)),
      _sleeper(std::move(sleeper)) {
    if (const auto status = _options.validate(); !status.ok()) {
        throw std::invalid_argument(std::string(status.message()));
    }
    if (!_sleeper) {
        _sleeper = sleepFor;
    }
}

UploadResult<std::string> UploadOrchestrator::upload(
    const std::filesystem::path& filePath, const std::stop_token& token) {
    _session = UploadSession{.filePath = filePath};

    auto source = FileSource::open(filePath);
    if (!source) {
        LOG(ERROR) << "Error uploading file: " << source.error();
        return std::unexpected(std::move(source.error()));
    }
    _session.totalSize = source->size();
    LOG(INFO) << fmt::format(
        "Uploading '{}' ({} bytes, chunk size {:.0f} KB, adaptive {})",
        filePath.string(), _session.totalSize,
        _options.chunking.initialSizeKB, _options.chunking.adaptive);

    auto handle = createToken(token);
    if (!handle) {
        handle.error().withFile(filePath);
        LOG(ERROR) << "Error uploading file: " << handle.error();
        return std::unexpected(std::move(handle.error()));
    }
    _session.token = std::move(*handle);
    LOG(INFO) << "Created upload token " << _session.token.id;

    if (auto sent = sendChunks(*source, token); !sent) {
        sent.error().withToken(_session.token.id).withFile(filePath);
        LOG(ERROR) << "Error uploading file: " << sent.error();
        return std::unexpected(std::move(sent.error()));
    }

    FinalizationPoller poller(_transport, _options.finalizePoll,
                              _options.statusRetry, _sleeper);
    if (auto finalized = poller.await(_session.token, _session.totalSize, token);
        !finalized) {
        finalized.error().withFile(filePath);
        LOG(ERROR) << "Error uploading file: " << finalized.error();
        return std::unexpected(std::move(finalized.error()));
    }

    LOG(INFO) << fmt::format("Successfully uploaded file '{}' with token ID {}",
                             filePath.string(), _session.token.id);
    return _session.token.id;
}

UploadResult<TokenHandle> UploadOrchestrator::createToken(
    const std::stop_token& token) {
    const std::string fileName = _session.filePath.filename().string();
    DLOG(DEBUG) << fmt::format("Creating upload token for '{}' ({} bytes)",
                               fileName, _session.totalSize);

    RetryExecutor retry(_options.chunkRetry, _sleeper);
    auto handle = retry.run(
        "Create upload token",
        [&] {
            return _transport.createToken(fileName, _session.totalSize, token);
        },
        token);
    if (handle) {
        return handle;
    }
    if (handle.error().kind == UploadError::Kind::Cancelled) {
        return handle;
    }
    const int attempts = handle.error().attempts;
    return std::unexpected(
        UploadError::tokenCreation(std::move(handle.error().cause))
            .withAttempts(attempts));
}

UploadResult<void> UploadOrchestrator::sendChunks(FileSource& source,
                                                  const std::stop_token& token) {
    ChunkSizeController chunkSize(_options.chunking);
    RetryExecutor retry(_options.chunkRetry, _sleeper);
    const std::uint64_t totalSize = _session.totalSize;

    while (_session.offset < totalSize) {
        auto chunk = source.read(chunkSize.currentSizeBytes());
        if (!chunk) {
            return std::unexpected(std::move(chunk.error()));
        }
        if (chunk->data.empty()) {
            return std::unexpected(UploadError::fileValidation(
                absl::DataLossError(fmt::format(
                    "File ended at offset {} of {} bytes", _session.offset,
                    totalSize))));
        }

        const ChunkPlan plan{
            .payload = chunk->data,
            .offset = _session.offset,
            .isFinal = _session.offset + chunk->data.size() >= totalSize,
            .isResume = _session.offset > 0,
        };

        SecondsFloatDP timer;
        auto sent = retry.run(
            fmt::format("Upload chunk at offset {}", plan.offset),
            [&] {
                return _transport.uploadChunk(_session.token.id, plan, token);
            },
            token);
        const auto elapsed = timer.get();
        if (!sent) {
            return std::unexpected(std::move(sent.error()));
        }

        _session.offset += plan.payload.size();
        _session.chunks.push_back(ChunkRecord{
            .offset = plan.offset,
            .length = plan.payload.size(),
            .isFinal = plan.isFinal,
            .retries = retry.lastState().retries(),
            .elapsed = elapsed,
        });
        DLOG(DEBUG) << fmt::format(
            "Uploaded {} bytes in {:.2f}s (offset {}/{}, final: {})",
            plan.payload.size(), elapsed.count(), _session.offset, totalSize,
            plan.isFinal);

        const auto count = _session.chunks.size();
        if (count % kProgressEveryNChunks == 1 || plan.isFinal) {
            LOG(INFO) << fmt::format(
                "Progress: {} chunks, {}/{} bytes ({:.1f}%)", count,
                _session.offset, totalSize,
                static_cast<double>(_session.offset) * 100.0 /
                    static_cast<double>(totalSize));
        }

        chunkSize.adjust(elapsed.count(), plan.payload.size());
    }
    return {};
}

}  // namespace MediaUpload
