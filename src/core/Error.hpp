// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <memory>
#include <string>
#include <string_view>

namespace toolmesh
{

/// @brief Error codes for categorizing failures across the network and client layers.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    ConfigLoadError,
    DestinationNotFound,
    TransportInitError,
    TransportClosed,
    ConnectionError,
    RequestTimeout,
    RequestFailed,
    CompressionError,
    InvocationError,
    InvalidResponse,
    InvocationFailed,
};

/// @brief Returns the symbolic name of an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ConfigLoadError: return "ConfigLoadError";
        case ErrorCode::DestinationNotFound: return "DestinationNotFound";
        case ErrorCode::TransportInitError: return "TransportInitError";
        case ErrorCode::TransportClosed: return "TransportClosed";
        case ErrorCode::ConnectionError: return "ConnectionError";
        case ErrorCode::RequestTimeout: return "RequestTimeout";
        case ErrorCode::RequestFailed: return "RequestFailed";
        case ErrorCode::CompressionError: return "CompressionError";
        case ErrorCode::InvocationError: return "InvocationError";
        case ErrorCode::InvalidResponse: return "InvalidResponse";
        case ErrorCode::InvocationFailed: return "InvocationFailed";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
///
/// Transport errors additionally carry the last HTTP status seen and the number of
/// attempts made. Wrapping errors (RequestFailed, InvocationFailed) keep the underlying
/// error in @c cause.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    int status = 0;
    int attempts = 0;
    std::shared_ptr<const Error> cause;

    /// @brief Returns the innermost error of the cause chain.
    [[nodiscard]] auto rootCause() const -> const Error&
    {
        auto const* current = this;
        while (current->cause)
            current = current->cause.get();
        return *current;
    }
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
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message) });
}

/// @brief Creates an unexpected Error that wraps another error as its cause.
/// @param code The error code of the wrapping error.
/// @param message A descriptive error message.
/// @param cause The underlying error.
/// @return An unexpected Error.
[[nodiscard]] inline auto wrapError(ErrorCode code, std::string message, Error cause) -> std::unexpected<Error>
{
    auto error = Error {
        .code = code,
        .message = std::move(message),
        .status = cause.status,
        .attempts = cause.attempts,
        .cause = std::make_shared<const Error>(std::move(cause)),
    };
    return std::unexpected<Error>(std::move(error));
}

} // namespace toolmesh

template <>
struct std::formatter<toolmesh::Error>: std::formatter<std::string>
{
    auto format(const toolmesh::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", toolmesh::errorCodeName(error.code), error.message), ctx);
    }
};
