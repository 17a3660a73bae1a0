#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <cstdint>
#include <filesystem>
#include <opencv2/core.hpp>
#include <ostream>
#include <span>
#include <vector>

namespace imageless {

// Container format the processed image is written in.
struct OutputFormat {
    enum class Kind {
        kPng,
        kJpeg,
        kGif,
        kIco,
        kBmp,
        kFarbfeld,
        kTga,
        kOpenExr,
        kTiff,
        kAvif,
        kQoi,
        kWebP,
    };
    static constexpr int kMaxJpegQuality = 100;

    Kind kind = Kind::kPng;
    // JPEG quality in [0, 100], ignored by every other kind.
    int quality = kMaxJpegQuality;

    static OutputFormat jpeg(int quality) { return {Kind::kJpeg, quality}; }

    bool operator==(const OutputFormat&) const = default;
};

std::ostream& operator<<(std::ostream& os, OutputFormat::Kind kind);
std::ostream& operator<<(std::ostream& os, const OutputFormat& format);

/**
 * @brief Reads an image file, detecting its format from the content.
 *
 * Bit depth and alpha channel are preserved.
 *
 * @return The image, or
 * - absl::StatusCode::kNotFound: the file does not exist.
 * - absl::StatusCode::kInvalidArgument: the content is not a decodable image.
 */
absl::StatusOr<cv::Mat> decodeFile(const std::filesystem::path& path);

// Same as decodeFile, from an in-memory buffer.
absl::StatusOr<cv::Mat> decodeBytes(std::span<const std::uint8_t> bytes);

/**
 * @brief Encodes @p image in the given container format.
 *
 * @return The encoded bytes, or
 * - absl::StatusCode::kInvalidArgument: empty image or JPEG quality outside
 *   [0, 100].
 * - absl::StatusCode::kUnimplemented: no encoder for this format is available.
 * - absl::StatusCode::kInternal: the encoder failed.
 */
absl::StatusOr<std::vector<std::uint8_t>> encode(const cv::Mat& image,
                                                 const OutputFormat& format);

// encode() followed by writing the bytes to @p path.
absl::Status encodeToFile(const cv::Mat& image, const OutputFormat& format,
                          const std::filesystem::path& path);

}  // namespace imageless
