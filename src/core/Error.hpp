// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace voicecore
{

/// @brief Error codes for categorizing failures across the voice pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    InvalidState,
    IoError,
    ConfigError,
    CredentialError,
    ModelLoadError,
    AudioError,
    TranscriptionError,
    GenerationError,
    SynthesisError,
    TransportError,
    ProtocolError,
    TimeoutError,
    Cancelled,
    ProviderExhausted,
    InternalError,
};

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) noexcept -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::CredentialError: return "CredentialError";
        case ErrorCode::ModelLoadError: return "ModelLoadError";
        case ErrorCode::AudioError: return "AudioError";
        case ErrorCode::TranscriptionError: return "TranscriptionError";
        case ErrorCode::GenerationError: return "GenerationError";
        case ErrorCode::SynthesisError: return "SynthesisError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::ProviderExhausted: return "ProviderExhausted";
        case ErrorCode::InternalError: return "InternalError";
    }
    return "Unknown";
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

} // namespace voicecore

template <>
struct std::formatter<voicecore::Error>: std::formatter<std::string>
{
    auto format(const voicecore::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", voicecore::errorCodeName(error.code), error.message), ctx);
    }
};
