#pragma once

/// @file error.h
/// @brief wcopt error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace wcopt {

/// @brief Error codes used across the engine and the stores
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kUnimplemented,
    kInternal,
    kUnavailable,

    // wcopt-specific error codes
    kConnectionFailed,
    kQueryFailed,
    kBlockedQuery,
    kMissingColumn,
    kUnknownDataset,
    kUnknownAnalysis,
    kConfigurationError,
};

/// @brief Convert wcopt error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief True for statuses that describe bad caller input rather than a
/// store or computation failure.
bool IsClientError(const absl::Status& status);

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define WCOPT_RETURN_IF_ERROR(expr)                                            \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define WCOPT_ASSIGN_OR_RETURN(lhs, rhs)                                       \
    WCOPT_ASSIGN_OR_RETURN_IMPL(                                               \
        WCOPT_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define WCOPT_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                        \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define WCOPT_CONCAT(a, b) WCOPT_CONCAT_IMPL(a, b)
#define WCOPT_CONCAT_IMPL(a, b) a##b

}  // namespace wcopt
