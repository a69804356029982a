// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <plugin/Transport.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace voicecore
{

/// @brief Configuration for spawning a plugin process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;

    /// Added to the inherited environment. Values are never logged.
    std::map<std::string, std::string> env;
};

/// @brief Transport that talks newline-delimited JSON to a child process over its stdin/stdout.
///
/// The child's stderr is inherited. POSIX only.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Spawns the plugin process.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicecore
