#pragma once

/**
 * Stream-style logging on top of spdlog.
 * Provides LOG(severity) << ..., DLOG(severity) << ... and the CHECK family,
 * so call sites read the same as Abseil logging.
 */

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>
#include <string>

namespace imageless::detail {

class LogStream {
    std::ostringstream oss;
    spdlog::level::level_enum level;

   public:
    explicit LogStream(spdlog::level::level_enum l) : level(l) {}

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

}  // namespace imageless::detail

#define LOG(severity) \
    ::imageless::detail::LogStream(spdlog::level::severity)

#ifdef NDEBUG
#define DLOG(severity) \
    if (false) ::imageless::detail::LogStream(spdlog::level::severity)
#else
#define DLOG(severity) \
    ::imageless::detail::LogStream(spdlog::level::severity)
#endif

#define CHECK(condition)                                    \
    do {                                                    \
        if (!(condition)) {                                 \
            SPDLOG_CRITICAL("Check failed: {}", #condition); \
            spdlog::shutdown();                             \
            std::abort();                                   \
        }                                                   \
    } while (false)

#define CHECK_EQ(a, b) CHECK((a) == (b))
#define CHECK_NE(a, b) CHECK((a) != (b))
#define CHECK_LT(a, b) CHECK((a) < (b))
#define CHECK_LE(a, b) CHECK((a) <= (b))
#define CHECK_GT(a, b) CHECK((a) > (b))
#define CHECK_GE(a, b) CHECK((a) >= (b))

// Severity names accepted by LOG() and DLOG()
#define INFO info
#define WARNING warn
#define ERROR err
#define FATAL critical
