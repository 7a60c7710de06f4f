#include "swarmshare/Error.hpp"

#include <array>

namespace swarmshare {

namespace {

struct CodeName {
    ErrorCode code;
    std::string_view name;
};

constexpr std::array<CodeName, 14> kCodeNames{{
    {ErrorCode::None, "OK"},
    {ErrorCode::AccessDenied, "ACCESS_DENIED"},
    {ErrorCode::ChecksumMismatch, "CHECKSUM_MISMATCH"},
    {ErrorCode::FileNotFound, "FILE_NOT_FOUND"},
    {ErrorCode::ShareLimitExceeded, "SHARE_LIMIT_EXCEEDED"},
    {ErrorCode::PermissionDenied, "PERMISSION_DENIED"},
    {ErrorCode::DrainTimeout, "DRAIN_TIMEOUT"},
    {ErrorCode::IntegrityFailure, "INTEGRITY_FAILURE"},
    {ErrorCode::RateLimited, "RATE_LIMITED"},
    {ErrorCode::InvalidArgument, "INVALID_ARGUMENT"},
    {ErrorCode::Unavailable, "UNAVAILABLE"},
    {ErrorCode::Cancelled, "CANCELLED"},
    {ErrorCode::TransportFailure, "TRANSPORT_FAILURE"},
    {ErrorCode::AlreadyActive, "ALREADY_ACTIVE"},
}};

}  // namespace

std::string_view error_code_name(ErrorCode code) noexcept {
    for (const auto& entry : kCodeNames) {
        if (entry.code == code) {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

std::optional<ErrorCode> error_code_from_name(std::string_view name) noexcept {
    for (const auto& entry : kCodeNames) {
        if (entry.name == name) {
            return entry.code;
        }
    }
    return std::nullopt;
}

ErrorCategory error_category(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return ErrorCategory::None;
        case ErrorCode::AccessDenied:
        case ErrorCode::PermissionDenied:
            return ErrorCategory::AccessControl;
        case ErrorCode::ChecksumMismatch:
        case ErrorCode::IntegrityFailure:
            return ErrorCategory::Integrity;
        case ErrorCode::DrainTimeout:
        case ErrorCode::Unavailable:
        case ErrorCode::TransportFailure:
            return ErrorCategory::Availability;
        case ErrorCode::ShareLimitExceeded:
        case ErrorCode::RateLimited:
            return ErrorCategory::Resource;
        case ErrorCode::FileNotFound:
        case ErrorCode::InvalidArgument:
        case ErrorCode::Cancelled:
        case ErrorCode::AlreadyActive:
            return ErrorCategory::Request;
    }
    return ErrorCategory::Request;
}

bool is_retryable(ErrorCode code) noexcept {
    return error_category(code) == ErrorCategory::Availability || code == ErrorCode::RateLimited ||
           code == ErrorCode::Cancelled;
}

std::string_view user_message(ErrorCode code) noexcept {
    switch (error_category(code)) {
        case ErrorCategory::None:
            return "done";
        case ErrorCategory::AccessControl:
            return "no access";
        case ErrorCategory::Integrity:
            return "cannot verify, discarded";
        case ErrorCategory::Availability:
            return "waiting for parts";
        case ErrorCategory::Resource:
            return code == ErrorCode::RateLimited ? "too many requests, try again shortly" : "share limit reached";
        case ErrorCategory::Request:
            break;
    }
    if (code == ErrorCode::Cancelled) {
        return "cancelled";
    }
    if (code == ErrorCode::FileNotFound) {
        return "file not found";
    }
    return "request rejected";
}

}  // namespace swarmshare
