// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <llm/Sampler.hpp>
#include <pipeline/PipelineConfig.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voicecore
{

/// @brief Logging configuration section.
struct LoggingConfig
{
    std::string level = "info";
};

/// @brief Audio device configuration section.
struct AudioConfig
{
    /// Case-insensitive substring of the capture device name; empty selects automatically.
    std::string deviceName;
    int playbackSampleRate = 22050;

    /// Frames that may wait for the detectors before the oldest is dropped.
    int detectorQueueFrames = 64;
};

/// @brief Activation phrase configuration section.
struct WakeWordConfig
{
    bool enabled = true;

    /// Whisper model used for spotting; empty selects the tiny English model under defaultModelDir().
    std::string modelPath;
    std::vector<std::string> phrases { "hey assistant" };
    int threads = 2;
    int windowMs = 2000;
    int strideMs = 500;
    int cooldownMs = 2000;
    float energyGate = 0.005f;
    float minScore = 0.4f;
};

/// @brief Voice activity detection configuration section.
struct VadConfig
{
    float energyThreshold = 0.01f;
    float threshold = 0.5f;
    float negativeThreshold = 0.35f;
    int minSpeechMs = 250;
    int silenceMs = 1500;
    int pauseMs = 500;
};

enum class BackendType : std::uint8_t
{
    Whisper,
    Llama,
    Piper,
    Plugin,
};

[[nodiscard]] constexpr auto backendTypeName(BackendType type) noexcept -> std::string_view
{
    switch (type)
    {
        case BackendType::Whisper: return "whisper";
        case BackendType::Llama: return "llama";
        case BackendType::Piper: return "piper";
        case BackendType::Plugin: return "plugin";
    }
    return "plugin";
}

[[nodiscard]] auto parseBackendType(std::string_view name) -> std::optional<BackendType>;

/// @brief One provider instance of a provider section.
struct BackendConfig
{
    std::string name;
    BackendType type = BackendType::Plugin;

    // Local model back-ends.
    std::string modelPath;
    std::string espeakDataPath;
    int threads = 4;
    int contextSize = 4096;
    int gpuLayers = -1;
    SamplerConfig sampler;
    int sampleRate = 22050;

    // Plugin back-ends.
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// Name of the secret to look up at startup; empty if none is needed.
    std::string secret;

    /// Environment variable the secret is handed to the plugin in.
    std::string secretEnv = "VOICECORE_API_KEY";
};

/// @brief Routing settings and ordered back-ends of one provider kind.
struct ProviderSectionConfig
{
    int failureThreshold = 3;
    int cooldownMs = 60'000;
    int firstChunkTimeoutMs = 10'000;

    /// Highest priority first.
    std::vector<BackendConfig> backends;
};

struct ProvidersConfig
{
    ProviderSectionConfig transcription;
    ProviderSectionConfig generation;
    ProviderSectionConfig synthesis;
};

/// @brief Where secrets are looked up. The environment is consulted before the file.
struct SecretsConfig
{
    std::string envPrefix = "VOICECORE_SECRET_";
    std::string file;
};

/// @brief Local whisper, llama and piper back-ends with models under defaultModelDir().
[[nodiscard]] auto defaultProviders() -> ProvidersConfig;

/// @brief Top-level application configuration.
struct AppConfig
{
    LoggingConfig logging;
    AudioConfig audio;
    WakeWordConfig wakeWord;
    VadConfig vad;
    PipelineConfig pipeline;
    ProvidersConfig providers = defaultProviders();
    SecretsConfig secrets;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document. Missing sections keep their defaults.
/// @return The configuration, or a ConfigError naming the offending value.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/voicecore or ~/.local/share/voicecore
/// On macOS: ~/Library/Application Support/voicecore
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the directory local models are expected in.
[[nodiscard]] auto defaultModelDir() -> std::string;

/// @brief Returns the activation-phrase model used when wakeWord.modelPath is empty.
[[nodiscard]] auto defaultWakeModelPath() -> std::string;

} // namespace voicecore
