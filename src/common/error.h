#pragma once

/// @file error.h
/// @brief Drifter error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace drifter {

/// @brief Error codes specific to Drifter
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kOutOfRange,
    kUnimplemented,
    kInternal,
    kDataLoss,

    // Drift-check taxonomy
    kSchemaMismatch,      ///< Column absent from one of the datasets
    kInsufficientData,    ///< Sample too small for the chosen test
    kDegenerateColumn,    ///< All-null or zero-variance column
    kConfigurationError,  ///< Invalid run configuration, aborts the run
    kParseError,
};

/// @brief Convert Drifter error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Stable lowercase name of an error code ("insufficient_data", ...)
std::string_view ErrorCodeToString(ErrorCode code);

/// @brief Create an OK status
inline absl::Status OkStatus() {
    return absl::OkStatus();
}

/// @brief Create an error status with the given code and message
///
/// The Drifter code is attached as a payload so that callers can recover
/// the exact taxonomy entry with GetErrorCode().
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Recover the Drifter error code from a status
///
/// Statuses not created by MakeError() map back from their absl code.
ErrorCode GetErrorCode(const absl::Status& status);

/// @brief Create an internal error
inline absl::Status InternalError(std::string_view message) {
    return absl::InternalError(absl::string_view(message.data(), message.size()));
}

/// @brief Create an invalid argument error
inline absl::Status InvalidArgumentError(std::string_view message) {
    return absl::InvalidArgumentError(absl::string_view(message.data(), message.size()));
}

/// @brief Create a not found error
inline absl::Status NotFoundError(std::string_view message) {
    return absl::NotFoundError(absl::string_view(message.data(), message.size()));
}

inline absl::Status ConfigurationError(std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

inline absl::Status InsufficientDataError(std::string_view message) {
    return MakeError(ErrorCode::kInsufficientData, message);
}

inline absl::Status DegenerateColumnError(std::string_view message) {
    return MakeError(ErrorCode::kDegenerateColumn, message);
}

inline absl::Status SchemaMismatchError(std::string_view message) {
    return MakeError(ErrorCode::kSchemaMismatch, message);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define DRIFTER_RETURN_IF_ERROR(expr)                                          \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define DRIFTER_ASSIGN_OR_RETURN(lhs, rhs)                                     \
    DRIFTER_ASSIGN_OR_RETURN_IMPL(                                             \
        DRIFTER_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define DRIFTER_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                      \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define DRIFTER_CONCAT(a, b) DRIFTER_CONCAT_IMPL(a, b)
#define DRIFTER_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define DRIFTER_CHECK_OR_RETURN(condition, error_status)                       \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace drifter
