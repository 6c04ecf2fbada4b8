#include "error.h"

#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>

namespace drifter {

namespace {

constexpr char kErrorCodePayloadUrl[] = "type.drifter/error_code";

}  // namespace

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kParseError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
        case ErrorCode::kSchemaMismatch:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
        case ErrorCode::kDegenerateColumn:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kOutOfRange:
        case ErrorCode::kInsufficientData:
            return absl::StatusCode::kOutOfRange;
        case ErrorCode::kUnimplemented:
            return absl::StatusCode::kUnimplemented;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kDataLoss:
            return absl::StatusCode::kDataLoss;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "ok";
        case ErrorCode::kInvalidArgument: return "invalid_argument";
        case ErrorCode::kNotFound: return "not_found";
        case ErrorCode::kFailedPrecondition: return "failed_precondition";
        case ErrorCode::kOutOfRange: return "out_of_range";
        case ErrorCode::kUnimplemented: return "unimplemented";
        case ErrorCode::kInternal: return "internal";
        case ErrorCode::kDataLoss: return "data_loss";
        case ErrorCode::kSchemaMismatch: return "schema_mismatch";
        case ErrorCode::kInsufficientData: return "insufficient_data";
        case ErrorCode::kDegenerateColumn: return "degenerate_column";
        case ErrorCode::kConfigurationError: return "configuration_error";
        case ErrorCode::kParseError: return "parse_error";
        case ErrorCode::kUnknown:
        default:
            return "unknown";
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
    if (!status.ok()) {
        status.SetPayload(kErrorCodePayloadUrl,
                          absl::Cord(std::to_string(static_cast<int>(code))));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }

    auto payload = status.GetPayload(kErrorCodePayloadUrl);
    if (payload.has_value()) {
        int raw = 0;
        if (absl::SimpleAtoi(std::string(*payload), &raw)) {
            return static_cast<ErrorCode>(raw);
        }
    }

    switch (status.code()) {
        case absl::StatusCode::kInvalidArgument:
            return ErrorCode::kInvalidArgument;
        case absl::StatusCode::kNotFound:
            return ErrorCode::kNotFound;
        case absl::StatusCode::kFailedPrecondition:
            return ErrorCode::kFailedPrecondition;
        case absl::StatusCode::kOutOfRange:
            return ErrorCode::kOutOfRange;
        case absl::StatusCode::kUnimplemented:
            return ErrorCode::kUnimplemented;
        case absl::StatusCode::kInternal:
            return ErrorCode::kInternal;
        case absl::StatusCode::kDataLoss:
            return ErrorCode::kDataLoss;
        default:
            return ErrorCode::kUnknown;
    }
}

}  // namespace drifter
