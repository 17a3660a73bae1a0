#include "LogInit.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <LogCompat.hpp>
#include <algorithm>
#include <memory>
#include <utility>

namespace {

constexpr const char* kLoggerName = "imageless";
constexpr const char* kLogPattern = "[%H:%M:%S.%e] [%^%l%$] %v";

// File sink attached to the default logger. Its destructor only closes the
// file, detaching is left to detachFileSink().
spdlog::sink_ptr fileSink;

void detachFileSink() {
    if (!fileSink) {
        return;
    }
    if (auto* logger = spdlog::default_logger_raw(); logger != nullptr) {
        auto& sinks = logger->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), fileSink),
                    sinks.end());
    }
    fileSink.reset();
}

}  // namespace

void Imageless_LogInit(const LogOptions& options) {
    detachFileSink();
    if (!spdlog::get(kLoggerName)) {
        auto logger = spdlog::stderr_color_mt(kLoggerName);
        spdlog::set_default_logger(std::move(logger));
    }
    spdlog::set_pattern(kLogPattern);
    spdlog::set_level(options.verbose ? spdlog::level::debug
                                      : spdlog::level::info);

    if (options.logFile) {
        try {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                options.logFile->string());
            sink->set_pattern(kLogPattern);
            spdlog::default_logger()->sinks().push_back(sink);
            fileSink = std::move(sink);
            LOG(INFO) << "File " << *options.logFile << " added as logsink";
        } catch (const spdlog::spdlog_ex& ex) {
            LOG(ERROR) << "Couldn't open log file " << *options.logFile << ": "
                       << ex.what();
        }
    }
}

void Imageless_LogDeInit() {
    spdlog::default_logger()->flush();
    detachFileSink();
}
