#pragma once

#include <filesystem>
#include <optional>

struct LogOptions {
    // Emit DLOG / debug-level messages
    bool verbose = false;
    // Additionally append every message to this file
    std::optional<std::filesystem::path> logFile;
};

/**
 * Initializes spdlog for the imageless library and executable.
 * Installs a stderr logger as the default logger, applies the level selected
 * by @p options and attaches the optional file sink.
 *
 * @note Calling it again replaces the previous configuration.
 */
extern void Imageless_LogInit(const LogOptions& options = {});

/**
 * Detaches the file sink added by Imageless_LogInit, if any, and flushes.
 */
extern void Imageless_LogDeInit();
