#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace swarmshare {

enum class ErrorCode : std::uint8_t {
    None = 0,
    AccessDenied,
    ChecksumMismatch,
    FileNotFound,
    ShareLimitExceeded,
    PermissionDenied,
    DrainTimeout,
    IntegrityFailure,
    RateLimited,
    InvalidArgument,
    Unavailable,
    Cancelled,
    TransportFailure,
    AlreadyActive
};

enum class ErrorCategory : std::uint8_t {
    None,
    AccessControl,
    Integrity,
    Availability,
    Resource,
    Request
};

std::string_view error_code_name(ErrorCode code) noexcept;
std::optional<ErrorCode> error_code_from_name(std::string_view name) noexcept;
ErrorCategory error_category(ErrorCode code) noexcept;
bool is_retryable(ErrorCode code) noexcept;

// Text shown to the person using the client; never carries detail for access errors.
std::string_view user_message(ErrorCode code) noexcept;

struct Status {
    ErrorCode code{ErrorCode::None};
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return code == ErrorCode::None; }
};

inline Status make_ok() {
    return Status{};
}

inline Status make_error(ErrorCode code, std::string message) {
    return Status{code, std::move(message)};
}

template <typename T>
struct Result {
    Status status;
    std::optional<T> value;

    [[nodiscard]] bool ok() const noexcept { return status.ok() && value.has_value(); }
};

template <typename T>
Result<T> make_result(T value) {
    return Result<T>{Status{}, std::optional<T>(std::move(value))};
}

template <typename T>
Result<T> make_failure(ErrorCode code, std::string message) {
    return Result<T>{Status{code, std::move(message)}, std::nullopt};
}

template <typename T>
Result<T> make_failure(Status status) {
    return Result<T>{std::move(status), std::nullopt};
}

}  // namespace swarmshare
