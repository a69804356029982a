// SPDX-License-Identifier: Apache-2.0
#include "Credentials.hpp"

#include <core/JsonUtils.hpp>

#include <cctype>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace voicecore
{

auto secretEnvironmentName(std::string_view prefix, std::string_view name) -> std::string
{
    auto result = std::string(prefix);
    result.reserve(prefix.size() + name.size());
    for (auto const ch: name)
    {
        auto const c = static_cast<unsigned char>(ch);
        result += std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
    }
    return result;
}

EnvironmentCredentialSource::EnvironmentCredentialSource(std::string prefix): _prefix(std::move(prefix))
{
}

auto EnvironmentCredentialSource::getSecret(std::string_view name) const -> Result<std::string>
{
    auto const variable = secretEnvironmentName(_prefix, name);
    auto const* const value = std::getenv(variable.c_str());
    if (!value || *value == '\0')
        return makeError(ErrorCode::CredentialError, std::format("Secret '{}' not found in environment", name));
    return std::string(value);
}

MapCredentialSource::MapCredentialSource(std::map<std::string, std::string> secrets):
    _secrets(secrets.begin(), secrets.end())
{
}

auto MapCredentialSource::fromFile(std::string_view path) -> Result<std::unique_ptr<MapCredentialSource>>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::CredentialError, std::format("Cannot open secrets file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parsed = json::parse(ss.str());
    if (!parsed)
        return makeError(ErrorCode::CredentialError,
                         std::format("Invalid secrets file '{}': {}", path, parsed.error().message));
    if (!parsed->is_object())
        return makeError(ErrorCode::CredentialError, std::format("Secrets file '{}' must contain an object", path));

    auto secrets = std::map<std::string, std::string> {};
    for (auto const& [name, value]: parsed->items())
    {
        if (value.is_string())
            secrets[name] = value.get<std::string>();
    }
    return std::make_unique<MapCredentialSource>(std::move(secrets));
}

auto MapCredentialSource::getSecret(std::string_view name) const -> Result<std::string>
{
    auto const it = _secrets.find(name);
    if (it == _secrets.end() || it->second.empty())
        return makeError(ErrorCode::CredentialError, std::format("Secret '{}' not found", name));
    return it->second;
}

void ChainedCredentialSource::add(std::unique_ptr<CredentialSource> source)
{
    _sources.push_back(std::move(source));
}

auto ChainedCredentialSource::getSecret(std::string_view name) const -> Result<std::string>
{
    for (auto const& source: _sources)
    {
        if (auto secret = source->getSecret(name); secret)
            return secret;
    }
    return makeError(ErrorCode::CredentialError, std::format("Secret '{}' not found in any credential source", name));
}

} // namespace voicecore
