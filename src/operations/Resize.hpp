#pragma once

#include <absl/status/statusor.h>

#include <geometry/Unit.hpp>
#include <imagep/ImageProcOpenCV.hpp>
#include <opencv2/core.hpp>
#include <ostream>
#include <string_view>

namespace imageless {

// What happens when the target box has a different aspect ratio.
enum class CropMode {
    // Fit inside the box, one side may come out smaller.
    kPreserve,
    // Cover the box and cut off what sticks out.
    kFill,
    // Stretch to the box.
    kExact,
};

std::ostream& operator<<(std::ostream& os, CropMode mode);

struct ResizeTarget {
    PixelUnit width;
    PixelUnit height;

    bool operator==(const ResizeTarget&) const = default;
};

struct Resize {
    static constexpr std::string_view kName = "resize";

    Unit width;
    Unit height;
    FilterType filter = FilterType::kNearest;
    CropMode cropMode = CropMode::kPreserve;

    // Target box for an image of the given size. Zero is passed through.
    [[nodiscard]] ResizeTarget target(PixelUnit imageWidth,
                                      PixelUnit imageHeight) const {
        return {width.asPixel(imageWidth), height.asPixel(imageHeight)};
    }

    [[nodiscard]] absl::StatusOr<cv::Mat> process(cv::Mat image) const;

    bool operator==(const Resize&) const = default;
};

std::ostream& operator<<(std::ostream& os, const Resize& resize);

}  // namespace imageless
