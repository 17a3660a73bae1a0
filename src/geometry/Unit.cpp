#include "Unit.hpp"

#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>
#include <fmt/format.h>

#include <limits>
#include <string>

#include <LogCompat.hpp>

namespace imageless {

namespace {

// 2^32, the first float not representable as a pixel count.
constexpr float kPixelLimit = 4294967296.0F;

}  // namespace

PixelUnit PixelUnit::operator+(PixelUnit rhs) const {
    return {_pixels + rhs._pixels};
}

PixelUnit PixelUnit::operator-(PixelUnit rhs) const {
    CHECK_GT(_pixels, rhs._pixels);
    return {_pixels - rhs._pixels};
}

std::ostream& operator<<(std::ostream& os, const PixelUnit unit) {
    return os << unit.value() << "px";
}

absl::Status PercentageOutOfRangeError(const float percentage) {
    absl::Status status = absl::OutOfRangeError(
        fmt::format("Percentage out of range: {}", percentage));
    status.SetPayload(kPercentagePayloadUrl,
                      absl::Cord(fmt::format("{}", percentage)));
    return status;
}

std::optional<float> GetOutOfRangePercentage(const absl::Status& status) {
    if (status.code() != absl::StatusCode::kOutOfRange) {
        return std::nullopt;
    }
    auto payload = status.GetPayload(kPercentagePayloadUrl);
    if (!payload) {
        return std::nullopt;
    }
    float value = 0;
    if (!absl::SimpleAtof(std::string(*payload), &value)) {
        return std::nullopt;
    }
    return value;
}

absl::StatusOr<PercentageUnit> PercentageUnit::fromFloat(
    const float percentage) {
    // Written so that NaN fails the check as well.
    if (!(percentage >= 0.0F && percentage <= 1.0F)) {
        return PercentageOutOfRangeError(percentage);
    }
    return PercentageUnit(percentage);
}

std::ostream& operator<<(std::ostream& os, const PercentageUnit unit) {
    return os << unit.value() * 100.0F << "%";
}

PixelUnit Unit::asPixel(const PixelUnit dimension) const {
    if (const auto* pixels = std::get_if<PixelUnit>(&_value)) {
        return *pixels;
    }
    const float scaled = static_cast<float>(dimension.value()) *
                         std::get<PercentageUnit>(_value).value();
    // float rounds dimensions near the top of the range up to 2^32
    if (!(scaled < kPixelLimit)) {
        return {std::numeric_limits<std::uint32_t>::max()};
    }
    return {static_cast<std::uint32_t>(scaled)};
}

std::ostream& operator<<(std::ostream& os, const Unit& unit) {
    std::visit([&os](const auto& value) { os << value; }, unit._value);
    return os;
}

std::ostream& operator<<(std::ostream& os, const PixelPoint& point) {
    return os << "(" << point.x << ", " << point.y << ")";
}

std::ostream& operator<<(std::ostream& os, const Coordinate& coordinate) {
    return os << "(" << coordinate.x << ", " << coordinate.y << ")";
}

}  // namespace imageless
