#include "Operation.hpp"

#include <utility>

namespace imageless {

absl::StatusOr<cv::Mat> apply(const Operation& operation, cv::Mat image) {
    return std::visit(
        [&image](const auto& step) { return step.process(std::move(image)); },
        operation);
}

std::string_view name(const Operation& operation) {
    return std::visit(
        [](const auto& step) -> std::string_view { return step.kName; },
        operation);
}

std::ostream& operator<<(std::ostream& os, const Operation& operation) {
    std::visit([&os](const auto& step) { os << step; }, operation);
    return os;
}

}  // namespace imageless
