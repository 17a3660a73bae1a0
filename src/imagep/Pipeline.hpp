#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <filesystem>
#include <opencv2/core.hpp>
#include <operations/Operation.hpp>
#include <span>

#include "ImageIO.hpp"

namespace imageless {

/**
 * @brief Applies @p operations to @p image in order.
 *
 * Each step consumes the previous step's output. The first failing step
 * stops the run and its status is returned unchanged; later steps are not
 * executed.
 *
 * @param[in] image Input image, owned by the pipeline.
 * @param[in] operations Steps to apply, possibly none.
 * @return The final image or the first error.
 */
absl::StatusOr<cv::Mat> run(cv::Mat image,
                            std::span<const Operation> operations);

// Decodes @p path and runs @p operations on it.
absl::StatusOr<cv::Mat> processFile(const std::filesystem::path& path,
                                    std::span<const Operation> operations);

/**
 * @brief Reads, processes and writes an image.
 *
 * @param[in] inPath Image to read, format auto-detected.
 * @param[in] outPath Destination, overwritten if present.
 * @param[in] format Container format of the output.
 * @param[in] operations Steps to apply.
 * @return OkStatus, or the first error from decoding, any step, or encoding.
 */
absl::Status processAndSave(const std::filesystem::path& inPath,
                            const std::filesystem::path& outPath,
                            const OutputFormat& format,
                            std::span<const Operation> operations);

}  // namespace imageless
