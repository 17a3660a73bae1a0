#pragma once

#include <absl/status/statusor.h>

#include <geometry/Unit.hpp>
#include <opencv2/core.hpp>
#include <ostream>
#include <string_view>

namespace imageless {

/**
 * @brief How the far corner of a crop is derived from its coordinate.
 */
struct CropOrigin {
    enum class Anchor {
        // The coordinate is the far corner itself.
        kMinimum,
        // The coordinate is an inset from the right and bottom edges.
        kMaximum,
        // The coordinate is a width/height added to the near corner.
        kCropStart,
    };

    Anchor anchor = Anchor::kMinimum;
    Coordinate coordinate;

    static CropOrigin minimum(Coordinate coordinate) {
        return {Anchor::kMinimum, coordinate};
    }
    static CropOrigin maximum(Coordinate coordinate) {
        return {Anchor::kMaximum, coordinate};
    }
    static CropOrigin cropStart(Coordinate coordinate) {
        return {Anchor::kCropStart, coordinate};
    }

    /**
     * @brief Resolves the far corner of the crop.
     *
     * @param[in] nearCorner The already resolved start of the crop.
     * @param[in] width Current image width.
     * @param[in] height Current image height.
     * @return The far corner, or a FailedPrecondition status when a maximum
     * inset is larger than the image on that axis.
     */
    [[nodiscard]] absl::StatusOr<PixelPoint> farCorner(PixelPoint nearCorner,
                                                       PixelUnit width,
                                                       PixelUnit height) const;

    bool operator==(const CropOrigin&) const = default;
};

std::ostream& operator<<(std::ostream& os, CropOrigin::Anchor anchor);
std::ostream& operator<<(std::ostream& os, const CropOrigin& origin);

// A resolved crop rectangle in pixels.
struct CropRegion {
    PixelUnit left;
    PixelUnit top;
    PixelUnit width;
    PixelUnit height;

    bool operator==(const CropRegion&) const = default;
};

std::ostream& operator<<(std::ostream& os, const CropRegion& region);

struct Crop {
    static constexpr std::string_view kName = "crop";

    Coordinate from;
    CropOrigin to;

    /**
     * @brief Resolves the crop against an image of the given size.
     *
     * @return The rectangle to keep, or an OperationError when the far corner
     * lies above or left of the near corner.
     */
    [[nodiscard]] absl::StatusOr<CropRegion> region(PixelUnit width,
                                                    PixelUnit height) const;

    [[nodiscard]] absl::StatusOr<cv::Mat> process(cv::Mat image) const;

    bool operator==(const Crop&) const = default;
};

std::ostream& operator<<(std::ostream& os, const Crop& crop);

}  // namespace imageless
