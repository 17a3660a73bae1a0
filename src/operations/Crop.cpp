#include "Crop.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <imagep/ImageProcOpenCV.hpp>
#include <cstdint>
#include <string>
#include <string_view>

#include "OperationError.hpp"

#include <LogCompat.hpp>

namespace imageless {

namespace {

// dimension - inset, refusing insets that reach past the opposite edge.
absl::StatusOr<PixelUnit> insetFrom(const PixelUnit dimension,
                                    const PixelUnit inset,
                                    const std::string_view axis) {
    if (inset > dimension) {
        return absl::FailedPreconditionError(
            fmt::format("Inset {} exceeds image {} {}", fmt::streamed(inset),
                        axis, fmt::streamed(dimension)));
    }
    if (inset == dimension) {
        return PixelUnit{};
    }
    return dimension - inset;
}

// Only called once far >= near has been verified.
PixelUnit extent(const PixelUnit nearEdge, const PixelUnit farEdge) {
    if (farEdge == nearEdge) {
        return {};
    }
    return farEdge - nearEdge;
}

}  // namespace

absl::StatusOr<PixelPoint> CropOrigin::farCorner(const PixelPoint nearCorner,
                                                 const PixelUnit width,
                                                 const PixelUnit height) const {
    const PixelPoint resolved = coordinate.resolve(width, height);
    switch (anchor) {
        case Anchor::kMinimum:
            return resolved;
        case Anchor::kMaximum: {
            auto right = insetFrom(width, resolved.x, "width");
            if (!right.ok()) {
                return right.status();
            }
            auto bottom = insetFrom(height, resolved.y, "height");
            if (!bottom.ok()) {
                return bottom.status();
            }
            return PixelPoint{*right, *bottom};
        }
        case Anchor::kCropStart:
            return PixelPoint{nearCorner.x + resolved.x,
                              nearCorner.y + resolved.y};
    }
    return resolved;
}

std::ostream& operator<<(std::ostream& os, const CropOrigin::Anchor anchor) {
    switch (anchor) {
        case CropOrigin::Anchor::kMinimum:
            return os << "minimum";
        case CropOrigin::Anchor::kMaximum:
            return os << "maximum";
        case CropOrigin::Anchor::kCropStart:
            return os << "crop-start";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const CropOrigin& origin) {
    return os << origin.anchor << origin.coordinate;
}

std::ostream& operator<<(std::ostream& os, const CropRegion& region) {
    return os << region.width.value() << "x" << region.height.value() << "+"
              << region.left.value() << "+" << region.top.value();
}

absl::StatusOr<CropRegion> Crop::region(const PixelUnit width,
                                        const PixelUnit height) const {
    const PixelPoint nearCorner = from.resolve(width, height);
    auto farCorner = to.farCorner(nearCorner, width, height);
    if (!farCorner.ok()) {
        return OperationError(
            fmt::format("{} for crop operation {}",
                        std::string(farCorner.status().message()),
                        fmt::streamed(*this)));
    }

    if (farCorner->y < nearCorner.y) {
        return OperationError(
            fmt::format("Bottom cannot be less than top for crop operation {}",
                        fmt::streamed(*this)));
    }
    if (farCorner->x < nearCorner.x) {
        return OperationError(
            fmt::format("Right cannot be less than left for crop operation {}",
                        fmt::streamed(*this)));
    }

    return CropRegion{
        .left = nearCorner.x,
        .top = nearCorner.y,
        .width = extent(nearCorner.x, farCorner->x),
        .height = extent(nearCorner.y, farCorner->y),
    };
}

absl::StatusOr<cv::Mat> Crop::process(cv::Mat image) const {
    const auto cropRegion = region(static_cast<std::uint32_t>(image.cols),
                                   static_cast<std::uint32_t>(image.rows));
    if (!cropRegion.ok()) {
        return cropRegion.status();
    }
    DLOG(INFO) << "Cropping " << image.cols << "x" << image.rows << " to "
               << *cropRegion;
    return OpenCVImage::crop(image, cropRegion->left.value(),
                             cropRegion->top.value(),
                             cropRegion->width.value(),
                             cropRegion->height.value());
}

std::ostream& operator<<(std::ostream& os, const Crop& crop) {
    return os << "Crop{from=" << crop.from << ", to=" << crop.to << "}";
}

}  // namespace imageless
