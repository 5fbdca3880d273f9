// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace pagent
{

/// @brief Error codes for categorizing failures reported by services and infrastructure.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    NotFound,
    Validation,
    IoError,
    Serialization,
    Storage,
    Network,
    Authentication,
    ConfigError,
    Cancelled,
    Internal,
};

/// @brief Returns a short human readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::NotFound: return "not found";
        case ErrorCode::Validation: return "validation";
        case ErrorCode::IoError: return "io";
        case ErrorCode::Serialization: return "serialization";
        case ErrorCode::Storage: return "storage";
        case ErrorCode::Network: return "network";
        case ErrorCode::Authentication: return "authentication";
        case ErrorCode::ConfigError: return "configuration";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::Internal: return "internal";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace pagent

template <>
struct std::formatter<pagent::Error>: std::formatter<std::string>
{
    auto format(const pagent::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", pagent::errorCodeName(error.code), error.message), ctx);
    }
};
