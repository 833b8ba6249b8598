#include "error.h"

namespace promptshield {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kInvalidWeight:
        case ErrorCode::kInvalidPattern:
        case ErrorCode::kUnknownPolicy:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
        case ErrorCode::kUnknownCategory:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kUnauthenticated:
            return absl::StatusCode::kUnauthenticated;
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
}

int ToHttpStatus(const absl::Status& status) {
    switch (status.code()) {
        case absl::StatusCode::kOk:
            return 200;
        case absl::StatusCode::kInvalidArgument:
        case absl::StatusCode::kOutOfRange:
            return 400;
        case absl::StatusCode::kUnauthenticated:
            return 401;
        case absl::StatusCode::kPermissionDenied:
            return 403;
        case absl::StatusCode::kNotFound:
            return 404;
        case absl::StatusCode::kResourceExhausted:
            return 429;
        case absl::StatusCode::kUnavailable:
            return 503;
        default:
            return 500;
    }
}

}  // namespace promptshield
