#pragma once

/**
 * Stream-style logging on top of spdlog.
 *
 * Call sites keep the familiar LOG(INFO) << ... shape, the message is
 * assembled in a stream and handed to the default spdlog logger when the
 * temporary goes out of scope.
 */

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>

namespace MediaUpload::detail {

class LogStream {
    std::ostringstream oss;
    spdlog::level::level_enum level;

   public:
    explicit LogStream(spdlog::level::level_enum l) : level(l) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& value) {
        oss << value;
        return *this;
    }

    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        manip(oss);
        return *this;
    }

    ~LogStream() {
        const std::string msg = oss.str();
        if (!msg.empty()) {
            spdlog::log(level, "{}", msg);
        }
    }
};

// Swallows the stream when a log statement is compiled out.
struct LogVoidify {
    void operator&(const LogStream& /*unused*/) const {}
};

}  // namespace MediaUpload::detail

#define LOG(severity)                  \
    ::MediaUpload::detail::LogStream( \
        ::spdlog::level::MEDIAUPLOAD_LOG_LEVEL_##severity)

#ifdef NDEBUG
#define DLOG(severity) \
    true ? (void)0 : ::MediaUpload::detail::LogVoidify() & LOG(severity)
#else
#define DLOG(severity) LOG(severity)
#endif

// Logs strerror(errno) ahead of the message.
#define PLOG(severity) LOG(severity) << std::strerror(errno) << ": "

#define MEDIAUPLOAD_LOG_LEVEL_DEBUG debug
#define MEDIAUPLOAD_LOG_LEVEL_INFO info
#define MEDIAUPLOAD_LOG_LEVEL_WARNING warn
#define MEDIAUPLOAD_LOG_LEVEL_ERROR err
#define MEDIAUPLOAD_LOG_LEVEL_FATAL critical
