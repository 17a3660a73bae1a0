#pragma once

#include <absl/status/statusor.h>

#include <filesystem>
#include <logging/LogInit.hpp>
#include <string>

namespace imageless {

struct CommandLineOptions {
    // --help was given, nothing else is filled in
    bool help = false;
    std::filesystem::path file;
    std::filesystem::path out;
    std::filesystem::path config;
    LogOptions log;
};

/**
 * @brief Parses the imageless command line.
 *
 * @return The options, or kInvalidArgument naming the unknown, malformed or
 * missing option.
 */
absl::StatusOr<CommandLineOptions> parseCommandLine(int argc,
                                                    const char* const argv[]);

// Option summary printed for --help and after parse errors.
std::string usage();

}  // namespace imageless
