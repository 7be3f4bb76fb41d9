#pragma once

#include <cstdint>
#include <string>

namespace ftr {

/**
 * @brief Failure classification surfaced to RPC callers
 *
 * Values are part of the wire protocol (Status frame), do not renumber.
 */
enum class StatusCode : std::uint8_t {
    Ok = 0,
    Cancelled = 1,
    InvalidArgument = 3,
    DeadlineExceeded = 4,
    NotFound = 5,
    PermissionDenied = 7,
    Unimplemented = 12,
    Internal = 13,
    Unavailable = 14,
    DataLoss = 15,
    Unauthenticated = 16
};

inline const char* status_code_name(StatusCode code) {
    switch (code) {
        case StatusCode::Ok: return "OK";
        case StatusCode::Cancelled: return "CANCELLED";
        case StatusCode::InvalidArgument: return "INVALID_ARGUMENT";
        case StatusCode::DeadlineExceeded: return "DEADLINE_EXCEEDED";
        case StatusCode::NotFound: return "NOT_FOUND";
        case StatusCode::PermissionDenied: return "PERMISSION_DENIED";
        case StatusCode::Unimplemented: return "UNIMPLEMENTED";
        case StatusCode::Internal: return "INTERNAL";
        case StatusCode::Unavailable: return "UNAVAILABLE";
        case StatusCode::DataLoss: return "DATA_LOSS";
        case StatusCode::Unauthenticated: return "UNAUTHENTICATED";
    }
    return "UNKNOWN";
}

inline bool is_known_status_code(std::uint8_t raw) {
    switch (static_cast<StatusCode>(raw)) {
        case StatusCode::Ok:
        case StatusCode::Cancelled:
        case StatusCode::InvalidArgument:
        case StatusCode::DeadlineExceeded:
        case StatusCode::NotFound:
        case StatusCode::PermissionDenied:
        case StatusCode::Unimplemented:
        case StatusCode::Internal:
        case StatusCode::Unavailable:
        case StatusCode::DataLoss:
        case StatusCode::Unauthenticated:
            return true;
    }
    return false;
}

/**
 * @brief Classified error carried by Result
 */
struct Error {
    StatusCode code = StatusCode::Internal;
    std::string message;

    Error() = default;
    Error(StatusCode c, std::string msg) : code(c), message(std::move(msg)) {}

    /// Same classification, message prefixed with context
    Error wrap(const std::string& context) const {
        return Error{code, context + ": " + message};
    }

    std::string to_string() const {
        return std::string(status_code_name(code)) + ": " + message;
    }
};

} // namespace ftr
