#include "Adjustments.hpp"

#include <imagep/ImageProcOpenCV.hpp>

namespace imageless {

absl::StatusOr<cv::Mat> AdjustBrightness::process(cv::Mat image) const {
    return OpenCVImage::brighten(image, offset());
}

absl::StatusOr<cv::Mat> Blur::process(cv::Mat image) const {
    return OpenCVImage::blur(image, sigma);
}

absl::StatusOr<cv::Mat> Grayscale::process(cv::Mat image) const {
    return OpenCVImage::greyscale(image);
}

absl::StatusOr<cv::Mat> Invert::process(cv::Mat image) const {
    return OpenCVImage::invert(image);
}

absl::StatusOr<cv::Mat> Unsharpen::process(cv::Mat image) const {
    return OpenCVImage::unsharpen(image, sigma, threshold);
}

std::ostream& operator<<(std::ostream& os, const AdjustBrightness& adjust) {
    os << "AdjustBrightness{";
    switch (adjust.direction) {
        case AdjustBrightness::Direction::kDarken:
            os << "darken=";
            break;
        case AdjustBrightness::Direction::kBrighten:
            os << "brighten=";
            break;
    }
    return os << adjust.magnitude << "}";
}

std::ostream& operator<<(std::ostream& os, const Blur& blur) {
    return os << "Blur{sigma=" << blur.sigma << "}";
}

std::ostream& operator<<(std::ostream& os, const Grayscale& /*grayscale*/) {
    return os << "Grayscale";
}

std::ostream& operator<<(std::ostream& os, const Invert& /*invert*/) {
    return os << "Invert";
}

std::ostream& operator<<(std::ostream& os, const Unsharpen& unsharpen) {
    return os << "Unsharpen{sigma=" << unsharpen.sigma
              << ", threshold=" << unsharpen.threshold << "}";
}

}  // namespace imageless
