// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace voxgate
{

/// @brief Error codes for categorizing failures across the VAD pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ModelLoadError,
    InferenceError,
    AudioError,
    SessionClosed,
};

/// @brief Returns a short lowercase name for an error code (used in JSON event output).
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::ConfigError: return "config-error";
        case ErrorCode::ModelLoadError: return "model-load-error";
        case ErrorCode::InferenceError: return "inference-error";
        case ErrorCode::AudioError: return "audio-error";
        case ErrorCode::SessionClosed: return "session-closed";
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

} // namespace voxgate

template <>
struct std::formatter<voxgate::Error>: std::formatter<std::string>
{
    auto format(const voxgate::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", voxgate::errorCodeName(error.code), error.message), ctx);
    }
};
