#pragma once

/// @file error.h
/// @brief PromptShield error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace promptshield {

/// @brief Error codes specific to PromptShield
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kUnauthenticated,
    kInternal,

    // Detector configuration errors
    kUnknownCategory,
    kInvalidWeight,
    kInvalidPattern,
    kUnknownPolicy,
    kConfigurationError,
};

/// @brief Convert PromptShield error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Map a status to the HTTP status code reported by the service
int ToHttpStatus(const absl::Status& status);

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define PROMPTSHIELD_RETURN_IF_ERROR(expr)                                     \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define PROMPTSHIELD_ASSIGN_OR_RETURN(lhs, rhs)                                \
    PROMPTSHIELD_ASSIGN_OR_RETURN_IMPL(                                        \
        PROMPTSHIELD_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define PROMPTSHIELD_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                 \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define PROMPTSHIELD_CONCAT(a, b) PROMPTSHIELD_CONCAT_IMPL(a, b)
#define PROMPTSHIELD_CONCAT_IMPL(a, b) a##b

}  // namespace promptshield
