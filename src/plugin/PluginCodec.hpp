// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <provider/Provider.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace voicecore
{

/// @brief Converts float samples in [-1, 1] to signed 16-bit PCM, clamping out-of-range values.
[[nodiscard]] auto toPcm16(std::span<const float> samples) -> std::vector<std::int16_t>;

/// @brief Converts signed 16-bit PCM to float samples in [-1, 1).
[[nodiscard]] auto fromPcm16(std::span<const std::int16_t> samples) -> std::vector<float>;

/// @brief JSON-RPC method name used for requests of a provider kind.
[[nodiscard]] auto pluginMethod(ProviderKind kind) -> std::string_view;

/// @brief Error code reported for plugin failures of a provider kind.
[[nodiscard]] auto pluginErrorCode(ProviderKind kind) -> ErrorCode;

[[nodiscard]] auto encodeRequest(const TranscriptionRequest& request) -> nlohmann::json;
[[nodiscard]] auto encodeRequest(const GenerationRequest& request) -> nlohmann::json;
[[nodiscard]] auto encodeRequest(const SynthesisRequest& request) -> nlohmann::json;

/// @brief Decodes the params of a "chunk" notification into an output chunk.
template <ProviderKind Kind>
[[nodiscard]] auto decodeChunk(const nlohmann::json& params) -> Result<typename ProviderTraits<Kind>::Chunk>;

template <>
auto decodeChunk<ProviderKind::Transcription>(const nlohmann::json& params) -> Result<TranscriptChunk>;

template <>
auto decodeChunk<ProviderKind::Generation>(const nlohmann::json& params) -> Result<TextChunk>;

template <>
auto decodeChunk<ProviderKind::Synthesis>(const nlohmann::json& params) -> Result<AudioChunk>;

} // namespace voicecore
