// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace voicecore
{

namespace
{

    constexpr auto DefaultWhisperModelFilename = std::string_view { "ggml-small.en.bin" };
    constexpr auto DefaultWakeModelFilename = std::string_view { "ggml-tiny.en.bin" };
    constexpr auto DefaultLlmModelFilename = std::string_view { "SmolLM2-360M-Instruct-Q8_0.gguf" };
    constexpr auto DefaultTtsModelFilename = std::string_view { "en_US-lessac-medium.onnx" };

    auto modelPath(std::string_view filename) -> std::string
    {
        return defaultModelDir() + "/" + std::string(filename);
    }

    auto durationMs(const nlohmann::json& obj, std::string_view key, std::chrono::milliseconds defaultValue)
        -> std::chrono::milliseconds
    {
        return std::chrono::milliseconds { json::getIntOr(obj, key, static_cast<int>(defaultValue.count())) };
    }

    auto parseSampler(const nlohmann::json& obj, SamplerConfig defaults) -> SamplerConfig
    {
        return SamplerConfig {
            .temperature = json::getFloatOr(obj, "temperature", defaults.temperature),
            .topP = json::getFloatOr(obj, "topP", defaults.topP),
            .minP = json::getFloatOr(obj, "minP", defaults.minP),
            .topK = json::getIntOr(obj, "topK", defaults.topK),
            .repeatPenalty = json::getFloatOr(obj, "repeatPenalty", defaults.repeatPenalty),
            .repeatLastN = json::getIntOr(obj, "repeatLastN", defaults.repeatLastN),
            .seed = json::getIntOr(obj, "seed", defaults.seed),
            .maxTokens = json::getIntOr(obj, "maxTokens", defaults.maxTokens),
        };
    }

    auto parseBackend(const nlohmann::json& obj, std::string_view section, std::size_t index) -> Result<BackendConfig>
    {
        if (!obj.is_object())
            return makeError(ErrorCode::ConfigError,
                             std::format("providers.{}.backends[{}] must be an object", section, index));

        auto const typeName = json::getStringOr(obj, "type", "");
        auto const type = parseBackendType(typeName);
        if (!type)
            return makeError(ErrorCode::ConfigError,
                             std::format("providers.{}.backends[{}]: unknown type '{}'", section, index, typeName));

        auto backend = BackendConfig {};
        backend.type = *type;
        backend.name = json::getStringOr(obj, "name", std::format("{}-{}", backendTypeName(*type), index));
        backend.modelPath = json::getStringOr(obj, "modelPath", "");
        backend.espeakDataPath = json::getStringOr(obj, "espeakDataPath", "");
        backend.threads = json::getIntOr(obj, "threads", backend.threads);
        backend.contextSize = json::getIntOr(obj, "contextSize", backend.contextSize);
        backend.gpuLayers = json::getIntOr(obj, "gpuLayers", backend.gpuLayers);
        backend.sampler = parseSampler(obj, backend.sampler);
        if (auto valid = validateSampler(backend.sampler); !valid)
            return makeError(ErrorCode::ConfigError,
                             std::format("providers.{}.backends[{}]: {}", section, index, valid.error().message));
        backend.sampleRate = json::getIntOr(obj, "sampleRate", backend.sampleRate);
        backend.command = json::getStringOr(obj, "command", "");
        backend.args = json::getStringList(obj, "args");
        for (auto& [key, value]: json::getStringMap(obj, "env"))
            backend.env[key] = std::move(value);
        backend.secret = json::getStringOr(obj, "secret", "");
        backend.secretEnv = json::getStringOr(obj, "secretEnv", backend.secretEnv);

        if (backend.type == BackendType::Plugin && backend.command.empty())
            return makeError(ErrorCode::ConfigError,
                             std::format("providers.{}.backends[{}]: plugin '{}' has no command",
                                         section,
                                         index,
                                         backend.name));
        if (backend.type != BackendType::Plugin && backend.modelPath.empty())
            return makeError(ErrorCode::ConfigError,
                             std::format("providers.{}.backends[{}]: '{}' has no modelPath",
                                         section,
                                         index,
                                         backend.name));
        return backend;
    }

    auto parseProviderSection(const nlohmann::json& root, std::string_view section, ProviderSectionConfig& config)
        -> VoidResult
    {
        auto const key = std::string(section);
        if (!root.contains(key))
            return {};

        auto const& obj = root[key];
        config.failureThreshold = json::getIntOr(obj, "failureThreshold", config.failureThreshold);
        config.cooldownMs = json::getIntOr(obj, "cooldownMs", config.cooldownMs);
        config.firstChunkTimeoutMs = json::getIntOr(obj, "firstChunkTimeoutMs", config.firstChunkTimeoutMs);
        if (config.failureThreshold < 1)
            return makeError(ErrorCode::ConfigError,
                             std::format("providers.{}.failureThreshold must be at least 1", section));

        if (!obj.contains("backends"))
            return {};
        if (!obj["backends"].is_array())
            return makeError(ErrorCode::ConfigError, std::format("providers.{}.backends must be an array", section));

        config.backends.clear();
        for (auto i = std::size_t { 0 }; i < obj["backends"].size(); ++i)
        {
            auto backend = parseBackend(obj["backends"][i], section, i);
            if (!backend)
                return std::unexpected(backend.error());
            config.backends.push_back(std::move(*backend));
        }
        return {};
    }

    auto parsePipeline(const nlohmann::json& obj, PipelineConfig& config) -> VoidResult
    {
        config.wakeThreshold = json::getFloatOr(obj, "wakeThreshold", config.wakeThreshold);
        config.maxSegmentDuration = durationMs(obj, "maxSegmentMs", config.maxSegmentDuration);
        config.segmentCapacityFrames = static_cast<std::size_t>(
            json::getIntOr(obj, "segmentCapacityFrames", static_cast<int>(config.segmentCapacityFrames)));
        config.preRoll = durationMs(obj, "preRollMs", config.preRoll);
        config.listenTimeout = durationMs(obj, "listenTimeoutMs", config.listenTimeout);
        config.stageTimeout = durationMs(obj, "stageTimeoutMs", config.stageTimeout);
        config.errorRecoveryDelay = durationMs(obj, "errorRecoveryMs", config.errorRecoveryDelay);
        config.minSentenceChars =
            static_cast<std::size_t>(json::getIntOr(obj, "minSentenceChars", static_cast<int>(config.minSentenceChars)));
        config.language = json::getStringOr(obj, "language", config.language);
        config.systemPrompt = json::getStringOr(obj, "systemPrompt", config.systemPrompt);
        config.maxHistoryTurns =
            static_cast<std::size_t>(json::getIntOr(obj, "maxHistoryTurns", static_cast<int>(config.maxHistoryTurns)));

        auto const bargeIn = json::getStringOr(obj, "bargeIn", bargeInTriggerName(config.bargeIn));
        auto const trigger = parseBargeInTrigger(bargeIn);
        if (!trigger)
            return makeError(ErrorCode::ConfigError, std::format("pipeline.bargeIn: unknown trigger '{}'", bargeIn));
        config.bargeIn = *trigger;

        auto const granularity = json::getStringOr(obj, "granularity", "sentence");
        if (granularity == "sentence")
            config.granularity = SynthesisGranularity::Sentence;
        else if (granularity == "chunk")
            config.granularity = SynthesisGranularity::Chunk;
        else
            return makeError(ErrorCode::ConfigError,
                             std::format("pipeline.granularity: expected 'sentence' or 'chunk', got '{}'", granularity));

        if (config.wakeThreshold < 0.0f || config.wakeThreshold > 1.0f)
            return makeError(ErrorCode::ConfigError, "pipeline.wakeThreshold must be within [0, 1]");
        return {};
    }

    auto backendToJson(const BackendConfig& backend) -> nlohmann::json
    {
        auto obj = nlohmann::json::object();
        obj["name"] = backend.name;
        obj["type"] = backendTypeName(backend.type);
        if (backend.type == BackendType::Plugin)
        {
            obj["command"] = backend.command;
            if (!backend.args.empty())
                obj["args"] = backend.args;
            if (!backend.env.empty())
                obj["env"] = backend.env;
            if (!backend.secret.empty())
            {
                obj["secret"] = backend.secret;
                obj["secretEnv"] = backend.secretEnv;
            }
            return obj;
        }

        obj["modelPath"] = backend.modelPath;
        switch (backend.type)
        {
            case BackendType::Whisper: obj["threads"] = backend.threads; break;
            case BackendType::Llama:
                obj["contextSize"] = backend.contextSize;
                obj["gpuLayers"] = backend.gpuLayers;
                obj["temperature"] = backend.sampler.temperature;
                obj["topP"] = backend.sampler.topP;
                obj["minP"] = backend.sampler.minP;
                obj["topK"] = backend.sampler.topK;
                obj["maxTokens"] = backend.sampler.maxTokens;
                break;
            case BackendType::Piper:
                if (!backend.espeakDataPath.empty())
                    obj["espeakDataPath"] = backend.espeakDataPath;
                obj["sampleRate"] = backend.sampleRate;
                break;
            case BackendType::Plugin: break;
        }
        return obj;
    }

    auto providerSectionToJson(const ProviderSectionConfig& section) -> nlohmann::json
    {
        auto obj = nlohmann::json::object();
        obj["failureThreshold"] = section.failureThreshold;
        obj["cooldownMs"] = section.cooldownMs;
        obj["firstChunkTimeoutMs"] = section.firstChunkTimeoutMs;
        auto backends = nlohmann::json::array();
        for (auto const& backend: section.backends)
            backends.push_back(backendToJson(backend));
        obj["backends"] = std::move(backends);
        return obj;
    }

} // namespace

auto parseBackendType(std::string_view name) -> std::optional<BackendType>
{
    for (auto const type: { BackendType::Whisper, BackendType::Llama, BackendType::Piper, BackendType::Plugin })
        if (backendTypeName(type) == name)
            return type;
    return std::nullopt;
}

auto defaultProviders() -> ProvidersConfig
{
    auto providers = ProvidersConfig {};
    providers.transcription.backends.push_back(BackendConfig {
        .name = "whisper", .type = BackendType::Whisper, .modelPath = modelPath(DefaultWhisperModelFilename) });
    providers.generation.backends.push_back(BackendConfig {
        .name = "llama", .type = BackendType::Llama, .modelPath = modelPath(DefaultLlmModelFilename) });
    providers.synthesis.backends.push_back(BackendConfig {
        .name = "piper", .type = BackendType::Piper, .modelPath = modelPath(DefaultTtsModelFilename) });
    return providers;
}

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/voicecore";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/voicecore";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/voicecore";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/voicecore";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/voicecore";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/voicecore";
    return ".";
#endif
}

auto defaultModelDir() -> std::string
{
    return defaultDataDir() + "/models";
}

auto defaultWakeModelPath() -> std::string
{
    return modelPath(DefaultWakeModelFilename);
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, parseResult.error().message);

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration must be a JSON object");

    auto config = AppConfig {};

    // Logging section
    if (root.contains("logging"))
    {
        config.logging.level = json::getStringOr(root["logging"], "level", config.logging.level);
        if (!log::parseLevel(config.logging.level))
            return makeError(ErrorCode::ConfigError, std::format("logging.level: unknown level '{}'", config.logging.level));
    }

    // Audio section
    if (root.contains("audio"))
    {
        auto const& audio = root["audio"];
        config.audio.deviceName = json::getStringOr(audio, "deviceName", "");
        config.audio.playbackSampleRate = json::getIntOr(audio, "playbackSampleRate", config.audio.playbackSampleRate);
        config.audio.detectorQueueFrames =
            json::getIntOr(audio, "detectorQueueFrames", config.audio.detectorQueueFrames);
        config.pipeline.sampleRate = json::getIntOr(audio, "sampleRate", config.pipeline.sampleRate);
        config.pipeline.frameSamples = json::getIntOr(audio, "frameSamples", config.pipeline.frameSamples);
        if (config.pipeline.sampleRate <= 0 || config.pipeline.frameSamples <= 0)
            return makeError(ErrorCode::ConfigError, "audio.sampleRate and audio.frameSamples must be positive");
    }

    // Wake word section
    if (root.contains("wakeWord"))
    {
        auto const& wake = root["wakeWord"];
        config.wakeWord.enabled = json::getBoolOr(wake, "enabled", config.wakeWord.enabled);
        config.wakeWord.modelPath = json::getStringOr(wake, "modelPath", config.wakeWord.modelPath);
        if (auto phrases = json::getStringList(wake, "phrases"); !phrases.empty())
            config.wakeWord.phrases = std::move(phrases);
        config.wakeWord.threads = json::getIntOr(wake, "threads", config.wakeWord.threads);
        config.wakeWord.windowMs = json::getIntOr(wake, "windowMs", config.wakeWord.windowMs);
        config.wakeWord.strideMs = json::getIntOr(wake, "strideMs", config.wakeWord.strideMs);
        config.wakeWord.cooldownMs = json::getIntOr(wake, "cooldownMs", config.wakeWord.cooldownMs);
        config.wakeWord.energyGate = json::getFloatOr(wake, "energyGate", config.wakeWord.energyGate);
        config.wakeWord.minScore = json::getFloatOr(wake, "minScore", config.wakeWord.minScore);
    }

    // VAD section
    if (root.contains("vad"))
    {
        auto const& vad = root["vad"];
        config.vad.energyThreshold = json::getFloatOr(vad, "energyThreshold", config.vad.energyThreshold);
        config.vad.threshold = json::getFloatOr(vad, "threshold", config.vad.threshold);
        config.vad.negativeThreshold = json::getFloatOr(vad, "negativeThreshold", config.vad.negativeThreshold);
        config.vad.minSpeechMs = json::getIntOr(vad, "minSpeechMs", config.vad.minSpeechMs);
        config.vad.silenceMs = json::getIntOr(vad, "silenceMs", config.vad.silenceMs);
        config.vad.pauseMs = json::getIntOr(vad, "pauseMs", config.vad.pauseMs);
        if (config.vad.negativeThreshold > config.vad.threshold)
            return makeError(ErrorCode::ConfigError, "vad.negativeThreshold must not exceed vad.threshold");
    }

    // Pipeline section
    if (root.contains("pipeline"))
    {
        if (auto result = parsePipeline(root["pipeline"], config.pipeline); !result)
            return std::unexpected(result.error());
    }

    // Providers section
    if (root.contains("providers"))
    {
        auto const& providers = root["providers"];
        for (auto const& [section, target]: { std::pair { "transcription", &config.providers.transcription },
                                              std::pair { "generation", &config.providers.generation },
                                              std::pair { "synthesis", &config.providers.synthesis } })
        {
            if (auto result = parseProviderSection(providers, section, *target); !result)
                return std::unexpected(result.error());
        }
    }

    // Secrets section
    if (root.contains("secrets"))
    {
        auto const& secrets = root["secrets"];
        config.secrets.envPrefix = json::getStringOr(secrets, "envPrefix", config.secrets.envPrefix);
        config.secrets.file = json::getStringOr(secrets, "file", "");
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["logging"] = { { "level", config.logging.level } };

    auto audio = nlohmann::json::object();
    if (!config.audio.deviceName.empty())
        audio["deviceName"] = config.audio.deviceName;
    audio["sampleRate"] = config.pipeline.sampleRate;
    audio["frameSamples"] = config.pipeline.frameSamples;
    audio["playbackSampleRate"] = config.audio.playbackSampleRate;
    audio["detectorQueueFrames"] = config.audio.detectorQueueFrames;
    root["audio"] = std::move(audio);

    auto const& wakeWord = config.wakeWord;
    root["wakeWord"] = {
        { "enabled", wakeWord.enabled },       { "phrases", wakeWord.phrases },
        { "threads", wakeWord.threads },
        { "windowMs", wakeWord.windowMs },     { "strideMs", wakeWord.strideMs },
        { "cooldownMs", wakeWord.cooldownMs }, { "energyGate", wakeWord.energyGate },
        { "minScore", wakeWord.minScore },
    };
    if (!wakeWord.modelPath.empty())
        root["wakeWord"]["modelPath"] = wakeWord.modelPath;

    auto const& vad = config.vad;
    root["vad"] = {
        { "energyThreshold", vad.energyThreshold },
        { "threshold", vad.threshold },
        { "negativeThreshold", vad.negativeThreshold },
        { "minSpeechMs", vad.minSpeechMs },
        { "silenceMs", vad.silenceMs },
        { "pauseMs", vad.pauseMs },
    };

    auto const& pipeline = config.pipeline;
    root["pipeline"] = {
        { "wakeThreshold", pipeline.wakeThreshold },
        { "maxSegmentMs", pipeline.maxSegmentDuration.count() },
        { "segmentCapacityFrames", pipeline.segmentCapacityFrames },
        { "preRollMs", pipeline.preRoll.count() },
        { "listenTimeoutMs", pipeline.listenTimeout.count() },
        { "stageTimeoutMs", pipeline.stageTimeout.count() },
        { "errorRecoveryMs", pipeline.errorRecoveryDelay.count() },
        { "bargeIn", bargeInTriggerName(pipeline.bargeIn) },
        { "granularity", pipeline.granularity == SynthesisGranularity::Chunk ? "chunk" : "sentence" },
        { "minSentenceChars", pipeline.minSentenceChars },
        { "language", pipeline.language },
        { "systemPrompt", pipeline.systemPrompt },
        { "maxHistoryTurns", pipeline.maxHistoryTurns },
    };

    root["providers"] = {
        { "transcription", providerSectionToJson(config.providers.transcription) },
        { "generation", providerSectionToJson(config.providers.generation) },
        { "synthesis", providerSectionToJson(config.providers.synthesis) },
    };

    auto secrets = nlohmann::json::object();
    secrets["envPrefix"] = config.secrets.envPrefix;
    if (!config.secrets.file.empty())
        secrets["file"] = config.secrets.file;
    root["secrets"] = std::move(secrets);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace voicecore
