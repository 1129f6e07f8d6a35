#include "common/error.h"

namespace plotwise {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidInput:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kDuplicateName:
        case ErrorCode::kDuplicateId:
            return absl::StatusCode::kAlreadyExists;
        case ErrorCode::kNoProject:
        case ErrorCode::kInvalidState:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kExecutionFailure:
            return absl::StatusCode::kInternal;
        case ErrorCode::kIoError:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "Ok";
        case ErrorCode::kInvalidInput:
            return "InvalidInput";
        case ErrorCode::kNotFound:
            return "NotFound";
        case ErrorCode::kDuplicateName:
            return "DuplicateName";
        case ErrorCode::kDuplicateId:
            return "DuplicateId";
        case ErrorCode::kNoProject:
            return "NoProject";
        case ErrorCode::kExecutionFailure:
            return "ExecutionFailure";
        case ErrorCode::kInvalidState:
            return "InvalidState";
        case ErrorCode::kIoError:
            return "IoError";
        case ErrorCode::kUnknown:
        default:
            return "Unknown";
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code),
                        absl::StrCat(ErrorCodeName(code), ": ", message));
}

}  // namespace plotwise
