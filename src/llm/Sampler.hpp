// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <format>

namespace voicecore
{

/// @brief Token sampling settings of a local generation back-end.
struct SamplerConfig
{
    float temperature = 0.7f;
    float topP = 0.9f;
    float minP = 0.05f; ///< 0 disables min-p filtering.
    int topK = 40;
    float repeatPenalty = 1.1f;
    int repeatLastN = 64;
    int seed = -1; // -1 means random

    /// Spoken replies are short; longer generations are cut off.
    int maxTokens = 512;
};

/// @brief Checks that the settings are usable, naming the first offending field.
[[nodiscard]] inline auto validateSampler(const SamplerConfig& config) -> VoidResult
{
    auto const invalid = [](std::string_view field, auto value) -> VoidResult {
        return makeError(ErrorCode::ConfigError, std::format("{} out of range: {}", field, value));
    };

    if (config.temperature < 0.0f)
        return invalid("temperature", config.temperature);
    if (config.topP <= 0.0f || config.topP > 1.0f)
        return invalid("topP", config.topP);
    if (config.minP < 0.0f || config.minP >= 1.0f)
        return invalid("minP", config.minP);
    if (config.topK < 0)
        return invalid("topK", config.topK);
    if (config.repeatLastN < -1)
        return invalid("repeatLastN", config.repeatLastN);
    if (config.maxTokens <= 0)
        return invalid("maxTokens", config.maxTokens);
    return {};
}

} // namespace voicecore
