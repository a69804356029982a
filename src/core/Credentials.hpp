// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace voicecore
{

/// @brief Abstract lookup of named secrets (API keys, tokens).
///
/// Implementations must never log secret values.
class CredentialSource
{
  public:
    virtual ~CredentialSource() = default;

    /// @brief Looks up a secret by name.
    /// @return The secret, or a CredentialError if it is not available.
    [[nodiscard]] virtual auto getSecret(std::string_view name) const -> Result<std::string> = 0;
};

/// @brief Maps a secret name to its environment variable name.
///
/// The name is upper-cased and every non-alphanumeric character becomes '_',
/// e.g. prefix "VOICECORE_SECRET_" and name "openai.key" give "VOICECORE_SECRET_OPENAI_KEY".
[[nodiscard]] auto secretEnvironmentName(std::string_view prefix, std::string_view name) -> std::string;

/// @brief Reads secrets from environment variables.
class EnvironmentCredentialSource: public CredentialSource
{
  public:
    explicit EnvironmentCredentialSource(std::string prefix = "VOICECORE_SECRET_");

    [[nodiscard]] auto getSecret(std::string_view name) const -> Result<std::string> override;

  private:
    std::string _prefix;
};

/// @brief Reads secrets from an in-memory map, typically loaded from a JSON file.
class MapCredentialSource: public CredentialSource
{
  public:
    explicit MapCredentialSource(std::map<std::string, std::string> secrets);

    /// @brief Loads a JSON file of the form { "name": "secret", ... }.
    [[nodiscard]] static auto fromFile(std::string_view path) -> Result<std::unique_ptr<MapCredentialSource>>;

    [[nodiscard]] auto getSecret(std::string_view name) const -> Result<std::string> override;

  private:
    std::map<std::string, std::string, std::less<>> _secrets;
};

/// @brief Tries each source in order and returns the first secret found.
class ChainedCredentialSource: public CredentialSource
{
  public:
    void add(std::unique_ptr<CredentialSource> source);

    [[nodiscard]] auto getSecret(std::string_view name) const -> Result<std::string> override;

  private:
    std::vector<std::unique_ptr<CredentialSource>> _sources;
};

} // namespace voicecore
