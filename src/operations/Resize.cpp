#include "Resize.hpp"

#include <cstdint>

#include <LogCompat.hpp>

namespace imageless {

std::ostream& operator<<(std::ostream& os, const CropMode mode) {
    switch (mode) {
        case CropMode::kPreserve:
            return os << "preserve";
        case CropMode::kFill:
            return os << "fill";
        case CropMode::kExact:
            return os << "exact";
    }
    return os;
}

absl::StatusOr<cv::Mat> Resize::process(cv::Mat image) const {
    const ResizeTarget box = target(static_cast<std::uint32_t>(image.cols),
                                    static_cast<std::uint32_t>(image.rows));
    DLOG(INFO) << "Resizing " << image.cols << "x" << image.rows << " into "
               << box.width << " x " << box.height << " (" << cropMode << ", "
               << filter << ")";

    switch (cropMode) {
        case CropMode::kPreserve:
            return OpenCVImage::resize(image, box.width.value(),
                                       box.height.value(), filter);
        case CropMode::kExact:
            return OpenCVImage::resizeExact(image, box.width.value(),
                                            box.height.value(), filter);
        case CropMode::kFill:
            return OpenCVImage::resizeToFill(image, box.width.value(),
                                             box.height.value(), filter);
    }
    return image;
}

std::ostream& operator<<(std::ostream& os, const Resize& resize) {
    return os << "Resize{width=" << resize.width
              << ", height=" << resize.height << ", filter=" << resize.filter
              << ", crop_mode=" << resize.cropMode << "}";
}

}  // namespace imageless
