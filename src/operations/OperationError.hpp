#pragma once

#include <absl/status/status.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/string_view.h>

namespace imageless {

inline constexpr absl::string_view kOperationErrorPrefix =
    "Error processing image: ";

// An operation rejected its own parameters against the current image.
inline absl::Status OperationError(const absl::string_view message) {
    return absl::FailedPreconditionError(
        absl::StrCat(kOperationErrorPrefix, message));
}

inline bool IsOperationError(const absl::Status& status) {
    return status.code() == absl::StatusCode::kFailedPrecondition &&
           absl::StartsWith(status.message(), kOperationErrorPrefix);
}

}  // namespace imageless
