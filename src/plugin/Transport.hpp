// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>

namespace voicecore
{

/// @brief Abstract message channel to a plugin process.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the plugin.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next JSON message from the plugin.
    /// @param timeout Maximum wait; blocks indefinitely if not set.
    /// @return The message, ErrorCode::TimeoutError if none arrived in time, or another error.
    [[nodiscard]] virtual auto receive(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json> = 0;

    /// @brief Closes the channel.
    virtual void close() = 0;

    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace voicecore
