#pragma once

#include <absl/status/statusor.h>

#include <cstdint>
#include <opencv2/core.hpp>
#include <ostream>
#include <string>

namespace imageless {

// Resampling kernels understood by the resize functions.
enum class FilterType {
    kNearest,
    kTriangle,
    kCatmullRom,
    kGaussian,
    kLanczos3,
};

std::ostream& operator<<(std::ostream& os, FilterType filter);

/**
 * @brief Pixel-level image transformations implemented with OpenCV.
 *
 * Every function takes its input by const reference and returns a new image;
 * the input is never modified. OpenCV exceptions are turned into an Internal
 * status naming the transformation.
 */
struct OpenCVImage {
    // Adds @p value to each colour channel, saturating. Alpha is kept.
    static absl::StatusOr<cv::Mat> brighten(const cv::Mat& mat, int value);

    // Gaussian blur. A non-positive sigma is treated as 1.
    static absl::StatusOr<cv::Mat> blur(const cv::Mat& mat, float sigma);

    /**
     * @brief Converts to luma.
     *
     * BGR becomes a single channel, BGRA keeps its alpha channel with luma in
     * the three colour channels. Single channel and grey+alpha images are
     * already grey and are returned unchanged.
     */
    static absl::StatusOr<cv::Mat> greyscale(const cv::Mat& mat);

    // Bitwise inversion of the colour channels. Alpha is kept.
    static absl::StatusOr<cv::Mat> invert(const cv::Mat& mat);

    /**
     * @brief Unsharp mask.
     *
     * Values differing from the blurred image by more than @p threshold are
     * pushed away from it by that difference, others are left alone.
     */
    static absl::StatusOr<cv::Mat> unsharpen(const cv::Mat& mat, float sigma,
                                             int threshold);

    /**
     * @brief Copies the given rectangle out of @p mat.
     *
     * The rectangle is clamped to the image, so a request reaching past the
     * right or bottom edge yields the part that exists.
     */
    static absl::StatusOr<cv::Mat> crop(const cv::Mat& mat, std::uint32_t x,
                                        std::uint32_t y, std::uint32_t width,
                                        std::uint32_t height);

    // Largest size fitting in width x height with the same aspect ratio.
    static absl::StatusOr<cv::Mat> resize(const cv::Mat& mat,
                                          std::uint32_t width,
                                          std::uint32_t height,
                                          FilterType filter);

    // Exactly width x height, aspect ratio ignored.
    static absl::StatusOr<cv::Mat> resizeExact(const cv::Mat& mat,
                                               std::uint32_t width,
                                               std::uint32_t height,
                                               FilterType filter);

    // Covers width x height keeping the aspect ratio, then centre-crops the
    // overflow so the result is exactly width x height.
    static absl::StatusOr<cv::Mat> resizeToFill(const cv::Mat& mat,
                                                std::uint32_t width,
                                                std::uint32_t height,
                                                FilterType filter);

    static std::string version();
};

}  // namespace imageless
