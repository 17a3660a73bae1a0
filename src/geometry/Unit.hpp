#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <variant>

namespace imageless {

/**
 * @brief An exact, non-negative pixel count.
 *
 * Subtraction is only defined when the minuend is strictly greater than the
 * subtrahend. Violating that is a programming error and aborts the process;
 * callers holding untrusted values must compare first.
 */
class PixelUnit {
   public:
    constexpr PixelUnit() = default;
    constexpr PixelUnit(std::uint32_t pixels) : _pixels(pixels) {}

    [[nodiscard]] constexpr std::uint32_t value() const { return _pixels; }
    constexpr explicit operator std::uint32_t() const { return _pixels; }

    constexpr auto operator<=>(const PixelUnit&) const = default;

    PixelUnit operator+(PixelUnit rhs) const;
    PixelUnit operator-(PixelUnit rhs) const;

   private:
    std::uint32_t _pixels = 0;
};

std::ostream& operator<<(std::ostream& os, PixelUnit unit);

// Type URL under which the rejected value is attached to the status.
inline constexpr absl::string_view kPercentagePayloadUrl =
    "type.imageless/PercentageOutOfRange";

/**
 * @brief A fraction of a reference dimension, always within [0, 1].
 *
 * The only way to obtain one is fromFloat(), which validates the range once.
 */
class PercentageUnit {
   public:
    /**
     * @brief Validates @p percentage and wraps it.
     *
     * @return The unit, or an OutOfRange status (PercentageOutOfRange) with
     * the rejected value in its message and under kPercentagePayloadUrl.
     * NaN is rejected.
     */
    static absl::StatusOr<PercentageUnit> fromFloat(float percentage);

    [[nodiscard]] float value() const { return _percentage; }

    bool operator==(const PercentageUnit&) const = default;

   private:
    explicit PercentageUnit(float percentage) : _percentage(percentage) {}

    float _percentage;
};

std::ostream& operator<<(std::ostream& os, PercentageUnit unit);

// Builds the PercentageOutOfRange error for @p percentage.
absl::Status PercentageOutOfRangeError(float percentage);

// Returns the value carried by a PercentageOutOfRange status, if it is one.
std::optional<float> GetOutOfRangePercentage(const absl::Status& status);

/**
 * @brief A size or position given either in pixels or as a percentage of a
 * reference dimension. Meaningless until resolved with asPixel().
 */
class Unit {
   public:
    // Zero pixels
    Unit() = default;
    Unit(PixelUnit pixels) : _value(pixels) {}
    Unit(PercentageUnit percentage) : _value(percentage) {}

    static Unit pixels(std::uint32_t count) { return {PixelUnit(count)}; }

    [[nodiscard]] bool isPercentage() const {
        return std::holds_alternative<PercentageUnit>(_value);
    }

    /**
     * @brief Resolves the unit against an axis length.
     *
     * Pixels are returned unchanged. A percentage is multiplied with the
     * dimension in single precision and truncated toward zero, so 99% of 3
     * pixels is 2 pixels.
     */
    [[nodiscard]] PixelUnit asPixel(PixelUnit dimension) const;

    bool operator==(const Unit&) const = default;

    friend std::ostream& operator<<(std::ostream& os, const Unit& unit);

   private:
    std::variant<PixelUnit, PercentageUnit> _value;
};

// A resolved point on the image.
struct PixelPoint {
    PixelUnit x;
    PixelUnit y;

    bool operator==(const PixelPoint&) const = default;
};

std::ostream& operator<<(std::ostream& os, const PixelPoint& point);

/**
 * @brief An unresolved 2D point.
 *
 * x always resolves against the image width and y against the image height,
 * for every corner of every operation.
 */
struct Coordinate {
    Unit x;
    Unit y;

    [[nodiscard]] PixelPoint resolve(PixelUnit width, PixelUnit height) const {
        return {x.asPixel(width), y.asPixel(height)};
    }

    bool operator==(const Coordinate&) const = default;
};

std::ostream& operator<<(std::ostream& os, const Coordinate& coordinate);

}  // namespace imageless
