#pragma once

/// @file error.h
/// @brief Plotwise error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace plotwise {

/// @brief Domain error kinds raised by the analysis engine and commands
enum class ErrorCode {
    kOk = 0,
    kUnknown,

    /// Misaligned series, non-numeric column, empty slice
    kInvalidInput,
    /// Missing dataset or item id
    kNotFound,
    /// Column name or item id collision
    kDuplicateName,
    kDuplicateId,
    /// Operation requires a loaded project or a saved path
    kNoProject,
    /// Unexpected failure inside execute/undo/redo
    kExecutionFailure,
    /// Undo/redo attempted on a command that never ran
    kInvalidState,

    /// File could not be read or written
    kIoError,
};

/// @brief Convert a Plotwise error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Human readable name of an error code
std::string_view ErrorCodeName(ErrorCode code);

/// @brief Create an OK status
inline absl::Status OkStatus() {
    return absl::OkStatus();
}

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Create an invalid input error
inline absl::Status InvalidInputError(std::string_view message) {
    return absl::InvalidArgumentError(message);
}

/// @brief Create a not found error
inline absl::Status NotFoundError(std::string_view message) {
    return absl::NotFoundError(message);
}

/// @brief Create an execution failure
inline absl::Status ExecutionFailureError(std::string_view message) {
    return absl::InternalError(message);
}

/// @brief Create a failed precondition error
inline absl::Status FailedPreconditionError(std::string_view message) {
    return absl::FailedPreconditionError(message);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define PLOTWISE_RETURN_IF_ERROR(expr)                                         \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define PLOTWISE_ASSIGN_OR_RETURN(lhs, rhs)                                    \
    PLOTWISE_ASSIGN_OR_RETURN_IMPL(                                            \
        PLOTWISE_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define PLOTWISE_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                     \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define PLOTWISE_CONCAT(a, b) PLOTWISE_CONCAT_IMPL(a, b)
#define PLOTWISE_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define PLOTWISE_CHECK_OR_RETURN(condition, error_status)                      \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace plotwise
