#pragma once

#include <absl/status/statusor.h>

#include <opencv2/core.hpp>
#include <ostream>
#include <string_view>
#include <variant>

#include "Adjustments.hpp"
#include "Crop.hpp"
#include "Resize.hpp"

namespace imageless {

/**
 * @brief One step of a pipeline.
 *
 * Every alternative provides
 *   static constexpr std::string_view kName;
 *   absl::StatusOr<cv::Mat> process(cv::Mat image) const;
 *   std::ostream& operator<<(std::ostream&, const T&);
 * so a new kind of step only has to be listed here.
 */
using Operation = std::variant<AdjustBrightness, Blur, Crop, Grayscale, Resize>;

/**
 * @brief Applies @p operation to @p image.
 *
 * @param[in] operation The step to run.
 * @param[in] image The image, owned by the call from here on.
 * @return The transformed image, or the step's error.
 */
absl::StatusOr<cv::Mat> apply(const Operation& operation, cv::Mat image);

// Configuration name of the step, e.g. "crop".
std::string_view name(const Operation& operation);

std::ostream& operator<<(std::ostream& os, const Operation& operation);

}  // namespace imageless
