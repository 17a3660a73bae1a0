#include "ImageIO.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <fstream>
#include <opencv2/imgcodecs.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <LogCompat.hpp>

namespace imageless {

namespace {

// OpenCV codec extension for a format, if OpenCV has a writer for it at all.
std::optional<std::string_view> codecExtension(const OutputFormat::Kind kind) {
    switch (kind) {
        case OutputFormat::Kind::kPng:
            return ".png";
        case OutputFormat::Kind::kJpeg:
            return ".jpg";
        case OutputFormat::Kind::kGif:
            return ".gif";
        case OutputFormat::Kind::kBmp:
            return ".bmp";
        case OutputFormat::Kind::kOpenExr:
            return ".exr";
        case OutputFormat::Kind::kTiff:
            return ".tiff";
        case OutputFormat::Kind::kAvif:
            return ".avif";
        case OutputFormat::Kind::kWebP:
            return ".webp";
        case OutputFormat::Kind::kIco:
        case OutputFormat::Kind::kFarbfeld:
        case OutputFormat::Kind::kTga:
        case OutputFormat::Kind::kQoi:
            return std::nullopt;
    }
    return std::nullopt;
}

// OpenEXR stores floating point samples in [0, 1].
cv::Mat toFloatingPoint(const cv::Mat& image) {
    if (image.depth() == CV_32F) {
        return image;
    }
    double scale = 1.0;
    if (image.depth() == CV_8U) {
        scale = 1.0 / 255.0;
    } else if (image.depth() == CV_16U) {
        scale = 1.0 / 65535.0;
    }
    cv::Mat converted;
    image.convertTo(converted, CV_32F, scale);
    return converted;
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const OutputFormat::Kind kind) {
    switch (kind) {
        case OutputFormat::Kind::kPng:
            return os << "png";
        case OutputFormat::Kind::kJpeg:
            return os << "jpeg";
        case OutputFormat::Kind::kGif:
            return os << "gif";
        case OutputFormat::Kind::kIco:
            return os << "ico";
        case OutputFormat::Kind::kBmp:
            return os << "bmp";
        case OutputFormat::Kind::kFarbfeld:
            return os << "farbfeld";
        case OutputFormat::Kind::kTga:
            return os << "tga";
        case OutputFormat::Kind::kOpenExr:
            return os << "open-exr";
        case OutputFormat::Kind::kTiff:
            return os << "tiff";
        case OutputFormat::Kind::kAvif:
            return os << "avif";
        case OutputFormat::Kind::kQoi:
            return os << "qoi";
        case OutputFormat::Kind::kWebP:
            return os << "web-p";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const OutputFormat& format) {
    os << format.kind;
    if (format.kind == OutputFormat::Kind::kJpeg) {
        os << "(quality=" << format.quality << ")";
    }
    return os;
}

absl::StatusOr<cv::Mat> decodeFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG(ERROR) << "Input image does not exist: " << path;
        return absl::NotFoundError(
            fmt::format("No such file: {}", path.string()));
    }
    cv::Mat handle;
    try {
        handle = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& ex) {
        LOG(ERROR) << "Error reading image: " << ex.what();
        return absl::InternalError(
            fmt::format("Error reading image {}: {}", path.string(), ex.msg));
    }
    if (handle.empty()) {
        LOG(ERROR) << "Error reading image: " << path;
        return absl::InvalidArgumentError(
            fmt::format("Cannot decode image: {}", path.string()));
    }
    LOG(INFO) << "Image dimensions: " << handle.cols << "x" << handle.rows
              << ", channels: " << handle.channels();
    return handle;
}

absl::StatusOr<cv::Mat> decodeBytes(const std::span<const std::uint8_t> bytes) {
    if (bytes.empty()) {
        return absl::InvalidArgumentError("Cannot decode an empty buffer");
    }
    cv::Mat handle;
    try {
        const cv::Mat buffer(1, static_cast<int>(bytes.size()), CV_8UC1,
                             const_cast<std::uint8_t*>(bytes.data()));
        handle = cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& ex) {
        LOG(ERROR) << "Error decoding image buffer: " << ex.what();
        return absl::InternalError(
            fmt::format("Error decoding image buffer: {}", ex.msg));
    }
    if (handle.empty()) {
        return absl::InvalidArgumentError(fmt::format(
            "Cannot decode image from {} byte buffer", bytes.size()));
    }
    return handle;
}

absl::StatusOr<std::vector<std::uint8_t>> encode(const cv::Mat& image,
                                                 const OutputFormat& format) {
    if (image.empty()) {
        return absl::InvalidArgumentError("Cannot encode an empty image");
    }
    const auto extension = codecExtension(format.kind);
    if (!extension || !cv::haveImageWriter(std::string(*extension))) {
        LOG(ERROR) << "No encoder available for " << format.kind;
        return absl::UnimplementedError(fmt::format(
            "Output format {} is not supported", fmt::streamed(format.kind)));
    }

    std::vector<int> params;
    cv::Mat output = image;
    switch (format.kind) {
        case OutputFormat::Kind::kJpeg:
            if (format.quality < 0 ||
                format.quality > OutputFormat::kMaxJpegQuality) {
                return absl::InvalidArgumentError(fmt::format(
                    "JPEG quality must be within [0, {}], got {}",
                    OutputFormat::kMaxJpegQuality, format.quality));
            }
            params = {cv::IMWRITE_JPEG_QUALITY, format.quality};
            break;
        case OutputFormat::Kind::kWebP:
            // Quality above 100 selects lossless compression
            params = {cv::IMWRITE_WEBP_QUALITY, 101};
            break;
        case OutputFormat::Kind::kOpenExr:
            output = toFloatingPoint(image);
            break;
        default:
            break;
    }

    std::vector<std::uint8_t> bytes;
    try {
        if (!cv::imencode(std::string(*extension), output, bytes, params)) {
            return absl::InternalError(
                fmt::format("Failed to encode image as {}",
                            fmt::streamed(format)));
        }
    } catch (const cv::Exception& ex) {
        LOG(ERROR) << "Error encoding image: " << ex.what();
        return absl::InternalError(fmt::format("Error encoding image as {}: {}",
                                               fmt::streamed(format), ex.msg));
    }
    DLOG(INFO) << "Encoded " << image.cols << "x" << image.rows << " image as "
               << format << ": " << bytes.size() << " bytes";
    return bytes;
}

absl::Status encodeToFile(const cv::Mat& image, const OutputFormat& format,
                          const std::filesystem::path& path) {
    auto bytes = encode(image, format);
    if (!bytes.ok()) {
        return bytes.status();
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        LOG(ERROR) << "Could not open the output file for write: " << path;
        return absl::InternalError(
            fmt::format("Failed to open {} for writing", path.string()));
    }
    file.write(reinterpret_cast<const char*>(bytes->data()),
               static_cast<std::streamsize>(bytes->size()));
    file.close();
    if (!file) {
        LOG(ERROR) << "Failed to write image to " << path;
        std::error_code ec;
        // Do not leave a truncated image behind
        if (std::filesystem::is_regular_file(path, ec)) {
            std::filesystem::remove(path, ec);
        }
        return absl::InternalError(
            fmt::format("Failed to write image to {}", path.string()));
    }
    LOG(INFO) << "Wrote " << bytes->size() << " bytes to " << path;
    return absl::OkStatus();
}

}  // namespace imageless
