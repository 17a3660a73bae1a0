#include "Pipeline.hpp"

#include <utility>

#include <LogCompat.hpp>

namespace imageless {

absl::StatusOr<cv::Mat> run(cv::Mat image,
                            const std::span<const Operation> operations) {
    size_t index = 0;
    for (const auto& operation : operations) {
        ++index;
        DLOG(INFO) << "Step " << index << "/" << operations.size() << ": "
                   << operation;
        auto result = apply(operation, std::move(image));
        if (!result.ok()) {
            LOG(ERROR) << "Step " << index << " (" << name(operation)
                       << ") failed: " << result.status();
            return result.status();
        }
        image = *std::move(result);
    }
    return image;
}

absl::StatusOr<cv::Mat> processFile(
    const std::filesystem::path& path,
    const std::span<const Operation> operations) {
    LOG(INFO) << "processFile(): file=" << path
              << " operations=" << operations.size();
    auto image = decodeFile(path);
    if (!image.ok()) {
        return image.status();
    }
    return run(*std::move(image), operations);
}

absl::Status processAndSave(const std::filesystem::path& inPath,
                            const std::filesystem::path& outPath,
                            const OutputFormat& format,
                            const std::span<const Operation> operations) {
    auto image = processFile(inPath, operations);
    if (!image.ok()) {
        return image.status();
    }
    DLOG(INFO) << "Writing " << image->cols << "x" << image->rows << " as "
               << format << " to " << outPath;
    return encodeToFile(*image, format, outPath);
}

}  // namespace imageless
