#pragma once

#include <absl/status/statusor.h>

#include <cstdint>
#include <opencv2/core.hpp>
#include <ostream>
#include <string_view>

namespace imageless {

struct AdjustBrightness {
    static constexpr std::string_view kName = "adjust-brightness";

    enum class Direction {
        kDarken,
        kBrighten,
    };

    Direction direction = Direction::kBrighten;
    std::uint16_t magnitude = 0;

    static AdjustBrightness darken(std::uint16_t value) {
        return {Direction::kDarken, value};
    }
    static AdjustBrightness brighten(std::uint16_t value) {
        return {Direction::kBrighten, value};
    }

    // Signed amount added to every colour channel.
    [[nodiscard]] int offset() const {
        return direction == Direction::kDarken ? -static_cast<int>(magnitude)
                                               : static_cast<int>(magnitude);
    }

    [[nodiscard]] absl::StatusOr<cv::Mat> process(cv::Mat image) const;

    bool operator==(const AdjustBrightness&) const = default;
};

struct Blur {
    static constexpr std::string_view kName = "blur";

    float sigma = 0.0F;

    [[nodiscard]] absl::StatusOr<cv::Mat> process(cv::Mat image) const;

    bool operator==(const Blur&) const = default;
};

struct Grayscale {
    static constexpr std::string_view kName = "grayscale";

    [[nodiscard]] absl::StatusOr<cv::Mat> process(cv::Mat image) const;

    bool operator==(const Grayscale&) const = default;
};

// Tonal inversion. Usable on its own, not selectable from a config file.
struct Invert {
    static constexpr std::string_view kName = "invert";

    [[nodiscard]] absl::StatusOr<cv::Mat> process(cv::Mat image) const;

    bool operator==(const Invert&) const = default;
};

// Unsharp-mask sharpening. Usable on its own, not selectable from a config
// file.
struct Unsharpen {
    static constexpr std::string_view kName = "unsharpen";

    float sigma = 0.0F;
    int threshold = 0;

    [[nodiscard]] absl::StatusOr<cv::Mat> process(cv::Mat image) const;

    bool operator==(const Unsharpen&) const = default;
};

std::ostream& operator<<(std::ostream& os, const AdjustBrightness& adjust);
std::ostream& operator<<(std::ostream& os, const Blur& blur);
std::ostream& operator<<(std::ostream& os, const Grayscale& grayscale);
std::ostream& operator<<(std::ostream& os, const Invert& invert);
std::ostream& operator<<(std::ostream& os, const Unsharpen& unsharpen);

}  // namespace imageless
