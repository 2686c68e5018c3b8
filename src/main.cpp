#include <absl/strings/numbers.h>
#include <curl/curl.h>
#include <fmt/format.h>

#include <CommandLine.hpp>
#include <ConfigManager.hpp>
#include <LogCompat.hpp>
#include <MimeTypes.hpp>
#include <SpdlogInit.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <libos/libsighandler.hpp>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <transport/CurlUploadTransport.hpp>
#include <upload/CancellableSleep.hpp>
#include <upload/UploadOrchestrator.hpp>
#include <upload/UploaderOptions.hpp>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUploadFailed = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitCancelled = 130;
constexpr std::chrono::milliseconds kSignalPollInterval{100};
constexpr std::string_view kDefaultServiceUrl = "https://www.kaltura.com";

using MediaUpload::ConfigManager;
using Configs = ConfigManager::Configs;

bool readFlag(const ConfigManager& config, Configs which) {
    const auto value = config.get(which);
    bool result = false;
    return value && absl::SimpleAtob(*value, &result) && result;
}

// Makes sure curl_global_cleanup runs on every exit path.
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

int runUpload(const ConfigManager& config,
              const MediaUpload::UploaderOptions& options,
              const std::filesystem::path& file) {
    const auto mimeType = MediaUpload::guessMimeType(file);
    LOG(INFO) << fmt::format("Detected MIME type '{}' ({} entry) for '{}'",
                             mimeType, MediaUpload::guessEntryType(mimeType),
                             file.string());

    CurlGlobal curlGlobal;
    MediaUpload::CurlUploadTransport transport({
        .serviceUrl = config.get(Configs::SERVICE_URL)
                          .value_or(std::string(kDefaultServiceUrl)),
        .sessionKey = *config.get(Configs::SESSION_KEY),
        .requestTimeout = options.requestTimeout,
    });
    MediaUpload::UploadOrchestrator orchestrator(transport, options);

    std::stop_source stopSource;
    SignalHandler::install();
    std::jthread signalWatcher([&stopSource](const std::stop_token& self) {
        while (!self.stop_requested()) {
            if (SignalHandler::isSignaled()) {
                LOG(WARNING) << "Received signal "
                             << SignalHandler::signalNumber()
                             << ", cancelling upload";
                stopSource.request_stop();
                return;
            }
            MediaUpload::sleepFor(kSignalPollInterval, self);
        }
    });

    auto result = orchestrator.upload(file, stopSource.get_token());
    signalWatcher.request_stop();
    signalWatcher.join();
    SignalHandler::uninstall();

    if (!result) {
        if (result.error().kind == MediaUpload::UploadError::Kind::Cancelled) {
            return kExitCancelled;
        }
        return kExitUploadFailed;
    }
    std::cout << *result << std::endl;
    return kExitSuccess;
}

}  // namespace

int main(int argc, char** argv) {
    const CommandLine line(argc, argv);
    const ConfigManager config(line);

    if (!config.status().ok()) {
        std::cerr << config.status().message() << std::endl;
        ConfigManager::serializeHelpToOStream(std::cerr);
        return kExitConfigError;
    }
    if (readFlag(config, Configs::HELP)) {
        ConfigManager::serializeHelpToOStream(std::cout);
        return kExitSuccess;
    }

    std::optional<std::filesystem::path> logFile;
    if (const auto value = config.get(Configs::LOG_FILE); value) {
        logFile = *value;
    }
    MediaUpload_SpdlogInit(readFlag(config, Configs::VERBOSE), logFile);

    int exitCode = kExitConfigError;
    const auto file = config.get(Configs::FILE);
    if (!config.get(Configs::SESSION_KEY)) {
        LOG(ERROR) << "No session key given, set SESSION_KEY";
    } else if (!file) {
        LOG(ERROR) << "No file given";
        ConfigManager::serializeHelpToOStream(std::cerr);
    } else if (auto options = MediaUpload::UploaderOptions::fromConfig(config);
               !options.ok()) {
        LOG(ERROR) << "Invalid configuration: " << options.status().message();
    } else {
        exitCode = runUpload(config, *options, *file);
    }

    MediaUpload_SpdlogDeInit();
    return exitCode;
}
