#pragma once

#include <absl/status/statusor.h>
#include <json/value.h>

#include <filesystem>
#include <imagep/ImageIO.hpp>
#include <operations/Operation.hpp>
#include <string_view>
#include <vector>

namespace imageless {

// Everything a configuration document describes.
struct Config {
    OutputFormat outFormat;
    std::vector<Operation> operations;
};

/**
 * @brief Builds a Config from a parsed JSON document.
 *
 * The document looks like
 * @code
 * {
 *   "out_format": "png" | {"jpeg": {"quality": 0-100}},
 *   "operations": [
 *     {"grayscale": {}},
 *     {"blur": {"sigma": 1.5}},
 *     {"adjust-brightness": {"darken": 10}},
 *     {"crop": {"from": {"x": {"pixel": 5}, "y": {"percentage": 0.1}},
 *               "to": {"maximum": {"x": ..., "y": ...}}}},
 *     {"resize": {"width": ..., "height": ..., "filter": "lanczos3",
 *                 "crop_mode": "fill"}}
 *   ]
 * }
 * @endcode
 * "filter" may be omitted and defaults to "nearest".
 *
 * @return The configuration, or
 * - absl::StatusCode::kInvalidArgument: a field is missing, unknown or of
 *   the wrong type. The message starts with the field path.
 * - absl::StatusCode::kOutOfRange: a percentage outside [0, 1].
 */
absl::StatusOr<Config> parseConfig(const Json::Value& root);

// Parses @p document as JSON, then parseConfig().
absl::StatusOr<Config> parseConfigString(std::string_view document);

// Reads @p path, then parseConfigString(). kNotFound if it does not exist.
absl::StatusOr<Config> loadConfig(const std::filesystem::path& path);

}  // namespace imageless
