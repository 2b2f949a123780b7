#include "error.h"

namespace wcopt {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kBlockedQuery:
        case ErrorCode::kUnknownDataset:
        case ErrorCode::kUnknownAnalysis:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kMissingColumn:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kUnimplemented:
            return absl::StatusCode::kUnimplemented;
        case ErrorCode::kInternal:
        case ErrorCode::kQueryFailed:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnavailable:
        case ErrorCode::kConnectionFailed:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
}

bool IsClientError(const absl::Status& status) {
    return absl::IsInvalidArgument(status) || absl::IsOutOfRange(status);
}

}  // namespace wcopt
