#include "SpdlogInit.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

static std::shared_ptr<spdlog::logger> main_logger;

void MediaUpload_SpdlogInit(
    bool verbose, const std::optional<std::filesystem::path>& logFile) {
    if (main_logger) return;

    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    sinks.emplace_back(std::move(console_sink));

    if (logFile) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                logFile->string(), /*truncate=*/false);
            file_sink->set_level(spdlog::level::trace);
            sinks.emplace_back(std::move(file_sink));
        } catch (const spdlog::spdlog_ex& e) {
            // Console logging still works, report through it below.
            spdlog::error("Cannot open log file {}: {}", logFile->string(),
                          e.what());
        }
    }

    main_logger = std::make_shared<spdlog::logger>("mediaupload", sinks.begin(),
                                                   sinks.end());
    main_logger->set_level(verbose ? spdlog::level::debug
                                   : spdlog::level::info);

    spdlog::set_default_logger(main_logger);
    spdlog::set_pattern("[%L] %v");
}

void MediaUpload_SpdlogDeInit() {
    if (!main_logger) {
        return;
    }
    main_logger->flush();
    spdlog::drop_all();
    main_logger.reset();
}
