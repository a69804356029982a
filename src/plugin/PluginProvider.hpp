// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Log.hpp>
#include <plugin/JsonRpc.hpp>
#include <plugin/PluginCodec.hpp>
#include <plugin/StdioTransport.hpp>
#include <provider/Provider.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <variant>

namespace voicecore
{

struct PluginProviderConfig
{
    std::string name;
    StdioTransportConfig process;

    /// How often a waiting request checks for cancellation.
    std::chrono::milliseconds pollInterval { 50 };
};

/// @brief A provider implemented by an external program speaking JSON-RPC 2.0 over stdio.
///
/// Each request is sent as "transcribe", "generate" or "synthesize" with a
/// fresh id. The plugin answers with any number of "chunk" notifications whose
/// params carry that id, followed by a response for the id. A cancelled
/// request is announced with a "cancel" notification; late messages for it
/// are skipped.
template <ProviderKind Kind>
class PluginProvider: public Provider<Kind>
{
  public:
    using Base = Provider<Kind>;
    using typename Base::ChunkCallback;
    using typename Base::Request;
    using TransportFactory = std::function<Result<std::unique_ptr<Transport>>(const PluginProviderConfig&)>;

    explicit PluginProvider(PluginProviderConfig config, TransportFactory factory = {}):
        _config(std::move(config)), _factory(std::move(factory))
    {
        if (!_factory)
            _factory = &spawnProcess;
    }

    ~PluginProvider() override { stop(); }

    [[nodiscard]] auto name() const -> const std::string& override { return _config.name; }

    [[nodiscard]] auto start() -> VoidResult override
    {
        auto const requestLock = std::lock_guard { _requestMutex };
        if (isConnected())
            return {};

        auto transport = _factory(_config);
        if (!transport)
            return std::unexpected(transport.error());

        auto const lock = std::lock_guard { _transportMutex };
        _transport = std::shared_ptr<Transport>(std::move(*transport));
        return {};
    }

    void stop() override
    {
        auto const requestLock = std::lock_guard { _requestMutex };
        auto transport = std::shared_ptr<Transport> {};
        {
            auto const lock = std::lock_guard { _transportMutex };
            transport = std::exchange(_transport, nullptr);
        }
        if (transport)
            transport->close();
    }

    [[nodiscard]] auto isConnected() const -> bool override
    {
        auto const lock = std::lock_guard { _transportMutex };
        return _transport && _transport->isConnected();
    }

    [[nodiscard]] auto streamRequest(const Request& request, const ChunkCallback& onChunk, std::stop_token stop)
        -> VoidResult override
    {
        auto const requestLock = std::lock_guard { _requestMutex };
        auto transport = [this] {
            auto const lock = std::lock_guard { _transportMutex };
            return _transport;
        }();
        if (!transport || !transport->isConnected())
            return makeError(ErrorCode::TransportError, std::format("Plugin '{}' is not running", _config.name));

        auto const id = ++_nextId;
        if (auto sent = transport->send(jsonrpc::makeRequest(id, pluginMethod(Kind), encodeRequest(request))); !sent)
            return sent;

        while (true)
        {
            if (stop.stop_requested())
            {
                if (auto sent = transport->send(jsonrpc::makeNotification("cancel", { { "id", id } })); !sent)
                    log::debug("Plugin '{}': could not send cancel: {}", _config.name, sent.error());
                return makeError(ErrorCode::Cancelled, "Request cancelled");
            }

            auto message = transport->receive(_config.pollInterval);
            if (!message)
            {
                if (message.error().code == ErrorCode::TimeoutError)
                    continue;
                return makeError(pluginErrorCode(Kind),
                                 std::format("Plugin '{}': {}", _config.name, message.error().message));
            }

            auto parsed = jsonrpc::parseMessage(*message);
            if (!parsed)
            {
                log::warning("Plugin '{}' sent an invalid message: {}", _config.name, parsed.error());
                continue;
            }

            if (auto const* notification = std::get_if<jsonrpc::Notification>(&*parsed))
            {
                if (auto handled = handleNotification(*notification, id, onChunk); !handled)
                    return handled;
                continue;
            }

            auto const& response = std::get<jsonrpc::Response>(*parsed);
            if (!response.id.is_number_integer() || response.id.get<std::int64_t>() != id)
            {
                log::debug("Plugin '{}': skipping stale response {}", _config.name, response.id.dump());
                continue;
            }

            if (response.error)
                return makeError(pluginErrorCode(Kind),
                                 std::format("Plugin '{}' error {}: {}",
                                             _config.name,
                                             response.error->code,
                                             response.error->message));
            return {};
        }
    }

  private:
    static auto spawnProcess(const PluginProviderConfig& config) -> Result<std::unique_ptr<Transport>>
    {
        auto transport = std::make_unique<StdioTransport>();
        if (auto started = transport->start(config.process); !started)
            return std::unexpected(started.error());
        return transport;
    }

    auto handleNotification(const jsonrpc::Notification& notification, std::int64_t id, const ChunkCallback& onChunk)
        -> VoidResult
    {
        if (!notification.params.is_object())
            return {};

        if (notification.method == "log")
        {
            log::debug("[{}] {}", _config.name, notification.params.value("message", ""));
            return {};
        }

        if (notification.method != "chunk")
        {
            log::debug("Plugin '{}': ignoring notification '{}'", _config.name, notification.method);
            return {};
        }

        if (notification.params.value("id", std::int64_t { -1 }) != id)
            return {};

        auto chunk = decodeChunk<Kind>(notification.params);
        if (!chunk)
            return makeError(ErrorCode::ProtocolError,
                             std::format("Plugin '{}' sent a malformed chunk: {}", _config.name, chunk.error().message));
        onChunk(*chunk);
        return {};
    }

    PluginProviderConfig _config;
    TransportFactory _factory;
    std::mutex _requestMutex; ///< One request at a time per plugin process.
    mutable std::mutex _transportMutex;
    std::shared_ptr<Transport> _transport;
    std::int64_t _nextId = 0;
};

using TranscriptionPlugin = PluginProvider<ProviderKind::Transcription>;
using GenerationPlugin = PluginProvider<ProviderKind::Generation>;
using SynthesisPlugin = PluginProvider<ProviderKind::Synthesis>;

} // namespace voicecore
