// SPDX-License-Identifier: Apache-2.0
#include "PluginCodec.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace voicecore
{

auto toPcm16(std::span<const float> samples) -> std::vector<std::int16_t>
{
    auto result = std::vector<std::int16_t>(samples.size());
    std::ranges::transform(samples, result.begin(), [](float s) {
        auto const clamped = std::clamp(s, -1.0f, 1.0f);
        return static_cast<std::int16_t>(std::lround(clamped * 32767.0f));
    });
    return result;
}

auto fromPcm16(std::span<const std::int16_t> samples) -> std::vector<float>
{
    auto result = std::vector<float>(samples.size());
    std::ranges::transform(samples, result.begin(), [](std::int16_t s) { return static_cast<float>(s) / 32768.0f; });
    return result;
}

auto pluginMethod(ProviderKind kind) -> std::string_view
{
    switch (kind)
    {
        case ProviderKind::Transcription: return "transcribe";
        case ProviderKind::Generation: return "generate";
        case ProviderKind::Synthesis: return "synthesize";
    }
    return "unknown";
}

auto pluginErrorCode(ProviderKind kind) -> ErrorCode
{
    switch (kind)
    {
        case ProviderKind::Transcription: return ErrorCode::TranscriptionError;
        case ProviderKind::Generation: return ErrorCode::GenerationError;
        case ProviderKind::Synthesis: return ErrorCode::SynthesisError;
    }
    return ErrorCode::Unknown;
}

auto encodeRequest(const TranscriptionRequest& request) -> nlohmann::json
{
    return nlohmann::json {
        { "turn", request.turn },
        { "pcm16", toPcm16(request.samples) },
        { "sampleRate", request.sampleRate },
        { "language", request.language },
    };
}

auto encodeRequest(const GenerationRequest& request) -> nlohmann::json
{
    auto messages = nlohmann::json::array();
    for (auto const& message: request.messages)
        messages.push_back({ { "role", roleToString(message.role) }, { "content", message.content } });

    return nlohmann::json {
        { "turn", request.turn },
        { "messages", std::move(messages) },
    };
}

auto encodeRequest(const SynthesisRequest& request) -> nlohmann::json
{
    return nlohmann::json {
        { "turn", request.turn },
        { "text", request.text },
    };
}

template <>
auto decodeChunk<ProviderKind::Transcription>(const nlohmann::json& params) -> Result<TranscriptChunk>
{
    auto text = json::getString(params, "text");
    if (!text)
        return std::unexpected(text.error());
    return TranscriptChunk {
        .text = std::move(*text),
        .isFinal = json::getBoolOr(params, "final", false),
        .confidence = json::getFloatOr(params, "confidence", 1.0f),
    };
}

template <>
auto decodeChunk<ProviderKind::Generation>(const nlohmann::json& params) -> Result<TextChunk>
{
    auto text = json::getString(params, "text");
    if (!text)
        return std::unexpected(text.error());
    return TextChunk { .delta = std::move(*text) };
}

template <>
auto decodeChunk<ProviderKind::Synthesis>(const nlohmann::json& params) -> Result<AudioChunk>
{
    if (!params.contains("pcm16") || !params["pcm16"].is_array())
        return makeError(ErrorCode::ProtocolError, "Audio chunk without pcm16 array");

    auto pcm = std::vector<std::int16_t> {};
    pcm.reserve(params["pcm16"].size());
    for (auto const& sample: params["pcm16"])
    {
        if (!sample.is_number_integer())
            return makeError(ErrorCode::ProtocolError, "pcm16 samples must be integers");
        pcm.push_back(static_cast<std::int16_t>(std::clamp(sample.get<int>(), -32768, 32767)));
    }

    auto const sampleRate = json::getIntOr(params, "sampleRate", 22050);
    if (sampleRate <= 0)
        return makeError(ErrorCode::ProtocolError, std::format("Invalid sample rate {}", sampleRate));

    return AudioChunk { .samples = fromPcm16(pcm), .sampleRate = sampleRate };
}

} // namespace voicecore
