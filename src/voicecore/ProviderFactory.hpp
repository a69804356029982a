// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Credentials.hpp>
#include <core/Error.hpp>
#include <provider/ProviderManager.hpp>
#include <voicecore/Config.hpp>

#include <memory>
#include <vector>

namespace voicecore
{

/// @brief The provider managers of all three kinds, built from the configuration.
struct ProviderSet
{
    std::unique_ptr<TranscriptionManager> transcription;
    std::unique_ptr<GenerationManager> generation;
    std::unique_ptr<SynthesisManager> synthesis;

    /// Configuration problems that disabled individual back-ends.
    std::vector<Error> configErrors;
};

/// @brief Builds the credential chain: environment first, then the secrets file if configured.
[[nodiscard]] auto makeCredentialSource(const SecretsConfig& config) -> Result<std::unique_ptr<CredentialSource>>;

[[nodiscard]] auto managerConfig(const ProviderSectionConfig& section) -> ProviderManagerConfig;

/// @brief Creates a manager per provider kind with its back-ends in configured order.
///
/// Secrets are looked up once, here. A back-end whose secret is missing, or
/// whose type does not serve the kind, is listed as unavailable and reported
/// in configErrors; the remaining back-ends are unaffected.
[[nodiscard]] auto buildProviders(const ProvidersConfig& config, const CredentialSource& credentials)
    -> ProviderSet;

} // namespace voicecore
