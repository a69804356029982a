// SPDX-License-Identifier: Apache-2.0
#include "ProviderFactory.hpp"

#include <audio/PiperSynthesizer.hpp>
#include <audio/WhisperTranscriber.hpp>
#include <core/Log.hpp>
#include <llm/LlamaGenerator.hpp>
#include <plugin/PluginProvider.hpp>

#include <format>

namespace voicecore
{

namespace
{

    template <ProviderKind Kind>
    auto makeLocal(const BackendConfig& backend) -> std::shared_ptr<Provider<Kind>>;

    template <>
    auto makeLocal<ProviderKind::Transcription>(const BackendConfig& backend) -> std::shared_ptr<TranscriptionProvider>
    {
        if (backend.type != BackendType::Whisper)
            return nullptr;
        return std::make_shared<WhisperTranscriber>(
            backend.name, WhisperModelConfig { .modelPath = backend.modelPath, .threads = backend.threads });
    }

    template <>
    auto makeLocal<ProviderKind::Generation>(const BackendConfig& backend) -> std::shared_ptr<GenerationProvider>
    {
        if (backend.type != BackendType::Llama)
            return nullptr;
        return std::make_shared<LlamaGenerator>(backend.name,
                                                LlamaGeneratorConfig {
                                                    .modelPath = backend.modelPath,
                                                    .contextSize = backend.contextSize,
                                                    .gpuLayers = backend.gpuLayers,
                                                    .threads = backend.threads,
                                                    .sampler = backend.sampler,
                                                });
    }

    template <>
    auto makeLocal<ProviderKind::Synthesis>(const BackendConfig& backend) -> std::shared_ptr<SynthesisProvider>
    {
        if (backend.type != BackendType::Piper)
            return nullptr;
        return std::make_shared<PiperSynthesizer>(backend.name,
                                                  PiperSynthesizerConfig {
                                                      .modelPath = backend.modelPath,
                                                      .espeakDataPath = backend.espeakDataPath,
                                                      .sampleRate = backend.sampleRate,
                                                  });
    }

    template <ProviderKind Kind>
    auto buildManager(const ProviderSectionConfig& section,
                      const CredentialSource& credentials,
                      std::vector<Error>& configErrors) -> std::unique_ptr<ProviderManager<Kind>>
    {
        auto manager = std::make_unique<ProviderManager<Kind>>(managerConfig(section));

        auto const reject = [&](const BackendConfig& backend, ErrorCode code, std::string reason) {
            auto error = Error { .code = code,
                                 .message = std::format("{} provider '{}': {}", providerKindName(Kind), backend.name, reason) };
            log::error("{}", error);
            configErrors.push_back(std::move(error));
            manager->addUnavailable(backend.name, std::move(reason));
        };

        for (auto const& backend: section.backends)
        {
            auto secret = std::string {};
            if (!backend.secret.empty())
            {
                auto lookup = credentials.getSecret(backend.secret);
                if (!lookup)
                {
                    reject(backend, ErrorCode::CredentialError, std::format("credential '{}' not available", backend.secret));
                    continue;
                }
                secret = std::move(*lookup);
            }

            if (backend.type == BackendType::Plugin)
            {
                auto config = PluginProviderConfig {
                    .name = backend.name,
                    .process = StdioTransportConfig { .command = backend.command, .args = backend.args, .env = backend.env },
                };
                if (!secret.empty())
                    config.process.env[backend.secretEnv] = std::move(secret);
                manager->addProvider(std::make_shared<PluginProvider<Kind>>(std::move(config)));
                continue;
            }

            auto provider = makeLocal<Kind>(backend);
            if (!provider)
            {
                reject(backend,
                       ErrorCode::ConfigError,
                       std::format("back-end type '{}' cannot serve {}", backendTypeName(backend.type), providerKindName(Kind)));
                continue;
            }
            manager->addProvider(std::move(provider));
        }
        return manager;
    }

} // namespace

auto makeCredentialSource(const SecretsConfig& config) -> Result<std::unique_ptr<CredentialSource>>
{
    auto chain = std::make_unique<ChainedCredentialSource>();
    chain->add(std::make_unique<EnvironmentCredentialSource>(config.envPrefix));
    if (!config.file.empty())
    {
        auto file = MapCredentialSource::fromFile(config.file);
        if (!file)
            return std::unexpected(file.error());
        chain->add(std::move(*file));
    }
    return chain;
}

auto managerConfig(const ProviderSectionConfig& section) -> ProviderManagerConfig
{
    return ProviderManagerConfig {
        .breaker = CircuitBreakerConfig { .failureThreshold = section.failureThreshold,
                                          .cooldown = std::chrono::milliseconds { section.cooldownMs } },
        .firstChunkTimeout = std::chrono::milliseconds { section.firstChunkTimeoutMs },
    };
}

auto buildProviders(const ProvidersConfig& config, const CredentialSource& credentials) -> ProviderSet
{
    auto set = ProviderSet {};
    set.transcription = buildManager<ProviderKind::Transcription>(config.transcription, credentials, set.configErrors);
    set.generation = buildManager<ProviderKind::Generation>(config.generation, credentials, set.configErrors);
    set.synthesis = buildManager<ProviderKind::Synthesis>(config.synthesis, credentials, set.configErrors);
    return set;
}

} // namespace voicecore
