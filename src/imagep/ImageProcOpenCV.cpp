#include "ImageProcOpenCV.hpp"

#include <absl/status/status.h>
#include <fmt/format.h>

#include <algorithm>
#include <climits>
#include <cmath>
#include <opencv2/core/utility.hpp>
#include <opencv2/imgproc.hpp>
#include <string_view>
#include <utility>
#include <vector>

#include <LogCompat.hpp>

namespace imageless {

namespace {

template <typename Fn>
absl::StatusOr<cv::Mat> guarded(const std::string_view what, Fn&& fn) {
    try {
        return fn();
    } catch (const cv::Exception& ex) {
        LOG(ERROR) << "OpenCV error in " << what << ": " << ex.what();
        return absl::InternalError(fmt::format("{} failed: {}", what, ex.msg));
    }
}

// Per-pixel adjustments have nothing to do on an empty image, e.g. the result
// of a zero-area crop, and OpenCV rejects empty input.
template <typename Fn>
absl::StatusOr<cv::Mat> guardedPixels(const std::string_view what,
                                      const cv::Mat& mat, Fn&& fn) {
    if (mat.empty()) {
        DLOG(INFO) << what << ": empty image passed through";
        return cv::Mat();
    }
    return guarded(what, std::forward<Fn>(fn));
}

bool hasAlpha(const cv::Mat& mat) {
    return mat.channels() == 2 || mat.channels() == 4;
}

bool isFloating(const cv::Mat& mat) {
    return mat.depth() == CV_32F || mat.depth() == CV_64F;
}

// Applies fn to every channel but alpha and reassembles the image.
template <typename Fn>
cv::Mat mapColourChannels(const cv::Mat& mat, Fn&& fn) {
    std::vector<cv::Mat> channels;
    cv::split(mat, channels);
    const size_t colour =
        hasAlpha(mat) ? channels.size() - 1 : channels.size();
    for (size_t i = 0; i < colour; ++i) {
        channels[i] = fn(channels[i]);
    }
    cv::Mat result;
    cv::merge(channels, result);
    return result;
}

int interpolation(const FilterType filter) {
    switch (filter) {
        case FilterType::kNearest:
            return cv::INTER_NEAREST;
        case FilterType::kTriangle:
            return cv::INTER_LINEAR;
        case FilterType::kCatmullRom:
            return cv::INTER_CUBIC;
        case FilterType::kGaussian:
            return cv::INTER_AREA;
        case FilterType::kLanczos3:
            return cv::INTER_LANCZOS4;
    }
    return cv::INTER_NEAREST;
}

int toSide(const double value) {
    return static_cast<int>(
        std::clamp(std::round(value), 1.0, static_cast<double>(INT_MAX)));
}

// Size of mat scaled uniformly to fit in (fill == false) or cover
// (fill == true) the width x height box. Never smaller than 1x1.
cv::Size scaledDimensions(const cv::Mat& mat, const std::uint32_t width,
                          const std::uint32_t height, const bool fill) {
    const double wratio = static_cast<double>(width) / mat.cols;
    const double hratio = static_cast<double>(height) / mat.rows;
    const double ratio =
        fill ? std::max(wratio, hratio) : std::min(wratio, hratio);
    return {toSide(mat.cols * ratio), toSide(mat.rows * ratio)};
}

cv::Mat cropClamped(const cv::Mat& mat, std::uint32_t x, std::uint32_t y,
                    std::uint32_t width, std::uint32_t height) {
    const auto cols = static_cast<std::uint32_t>(mat.cols);
    const auto rows = static_cast<std::uint32_t>(mat.rows);
    x = std::min(x, cols);
    y = std::min(y, rows);
    width = std::min(width, cols - x);
    height = std::min(height, rows - y);
    return mat(cv::Rect(static_cast<int>(x), static_cast<int>(y),
                        static_cast<int>(width), static_cast<int>(height)))
        .clone();
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const FilterType filter) {
    switch (filter) {
        case FilterType::kNearest:
            return os << "nearest";
        case FilterType::kTriangle:
            return os << "triangle";
        case FilterType::kCatmullRom:
            return os << "catmull-rom";
        case FilterType::kGaussian:
            return os << "gaussian";
        case FilterType::kLanczos3:
            return os << "lanczos3";
    }
    return os;
}

absl::StatusOr<cv::Mat> OpenCVImage::brighten(const cv::Mat& mat,
                                              const int value) {
    return guardedPixels("brighten", mat, [&] {
        return mapColourChannels(mat, [value](const cv::Mat& channel) {
            cv::Mat adjusted;
            channel.convertTo(adjusted, -1, 1.0, value);
            return adjusted;
        });
    });
}

absl::StatusOr<cv::Mat> OpenCVImage::blur(const cv::Mat& mat, float sigma) {
    if (sigma <= 0.0F) {
        sigma = 1.0F;
    }
    return guardedPixels("blur", mat, [&] {
        cv::Mat blurred;
        cv::GaussianBlur(mat, blurred, cv::Size(), sigma, sigma,
                         cv::BORDER_REPLICATE);
        return blurred;
    });
}

absl::StatusOr<cv::Mat> OpenCVImage::greyscale(const cv::Mat& mat) {
    return guardedPixels("greyscale", mat, [&] {
        cv::Mat gray_image;
        if (mat.channels() == 3) {
            cv::cvtColor(mat, gray_image, cv::COLOR_BGR2GRAY);
        } else if (mat.channels() == 4) {
            // Keep the alpha channel next to the grey values
            std::vector<cv::Mat> channels(4);
            cv::split(mat, channels);
            cv::Mat luma;
            cv::cvtColor(mat, luma, cv::COLOR_BGRA2GRAY);
            cv::merge(std::vector<cv::Mat>{luma, luma, luma, channels[3]},
                      gray_image);
        } else {
            DLOG(INFO) << "Image with " << mat.channels()
                       << " channel(s) is already grey";
            gray_image = mat.clone();
        }
        return gray_image;
    });
}

absl::StatusOr<cv::Mat> OpenCVImage::invert(const cv::Mat& mat) {
    return guardedPixels("invert", mat, [&] {
        return mapColourChannels(mat, [](const cv::Mat& channel) {
            cv::Mat inverted;
            if (isFloating(channel)) {
                cv::subtract(cv::Scalar::all(1.0), channel, inverted);
            } else {
                cv::bitwise_not(channel, inverted);
            }
            return inverted;
        });
    });
}

absl::StatusOr<cv::Mat> OpenCVImage::unsharpen(const cv::Mat& mat,
                                               float sigma,
                                               const int threshold) {
    if (sigma <= 0.0F) {
        sigma = 1.0F;
    }
    return guardedPixels("unsharpen", mat, [&] {
        cv::Mat blurred;
        cv::GaussianBlur(mat, blurred, cv::Size(), sigma, sigma,
                         cv::BORDER_REPLICATE);

        cv::Mat original;
        cv::Mat smooth;
        mat.convertTo(original, CV_32F);
        blurred.convertTo(smooth, CV_32F);

        cv::Mat diff = original - smooth;
        cv::Mat magnitude = cv::abs(diff);
        cv::Mat mask = magnitude > static_cast<double>(threshold);
        cv::Mat sharpened = original + diff;
        sharpened.copyTo(original, mask);

        cv::Mat result;
        original.convertTo(result, mat.type());
        return result;
    });
}

absl::StatusOr<cv::Mat> OpenCVImage::crop(const cv::Mat& mat,
                                          const std::uint32_t x,
                                          const std::uint32_t y,
                                          const std::uint32_t width,
                                          const std::uint32_t height) {
    return guarded("crop",
                   [&] { return cropClamped(mat, x, y, width, height); });
}

absl::StatusOr<cv::Mat> OpenCVImage::resize(const cv::Mat& mat,
                                            const std::uint32_t width,
                                            const std::uint32_t height,
                                            const FilterType filter) {
    if (mat.empty()) {
        return absl::InvalidArgumentError("resize: empty image");
    }
    return guarded("resize", [&] {
        const cv::Size size = scaledDimensions(mat, width, height, false);
        if (size == mat.size()) {
            return mat.clone();
        }
        cv::Mat resized;
        cv::resize(mat, resized, size, 0, 0, interpolation(filter));
        return resized;
    });
}

absl::StatusOr<cv::Mat> OpenCVImage::resizeExact(const cv::Mat& mat,
                                                 const std::uint32_t width,
                                                 const std::uint32_t height,
                                                 const FilterType filter) {
    return guarded("resize_exact", [&] {
        cv::Mat resized;
        cv::resize(mat, resized,
                   cv::Size(static_cast<int>(width), static_cast<int>(height)),
                   0, 0, interpolation(filter));
        return resized;
    });
}

absl::StatusOr<cv::Mat> OpenCVImage::resizeToFill(const cv::Mat& mat,
                                                  const std::uint32_t width,
                                                  const std::uint32_t height,
                                                  const FilterType filter) {
    if (mat.empty()) {
        return absl::InvalidArgumentError("resize_to_fill: empty image");
    }
    return guarded("resize_to_fill", [&] {
        cv::Mat intermediate;
        cv::resize(mat, intermediate,
                   scaledDimensions(mat, width, height, true), 0, 0,
                   interpolation(filter));

        const auto iwidth = static_cast<std::uint32_t>(intermediate.cols);
        const auto iheight = static_cast<std::uint32_t>(intermediate.rows);
        const std::uint64_t ratio =
            static_cast<std::uint64_t>(iwidth) * height;
        const std::uint64_t nratio =
            static_cast<std::uint64_t>(width) * iheight;

        if (nratio > ratio) {
            const std::uint32_t top =
                iheight > height ? (iheight - height) / 2 : 0;
            return cropClamped(intermediate, 0, top, width, height);
        }
        const std::uint32_t left = iwidth > width ? (iwidth - width) / 2 : 0;
        return cropClamped(intermediate, left, 0, width, height);
    });
}

std::string OpenCVImage::version() {
    return "OpenCV version: " + cv::getVersionString();
}

}  // namespace imageless
