// SPDX-License-Identifier: Apache-2.0
#include <core/Credentials.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>

using namespace voicecore;

TEST_CASE("secretEnvironmentName upper-cases and replaces separators", "[credentials]")
{
    CHECK(secretEnvironmentName("VOICECORE_SECRET_", "openai.key") == "VOICECORE_SECRET_OPENAI_KEY");
    CHECK(secretEnvironmentName("", "my-plugin/token2") == "MY_PLUGIN_TOKEN2");
}

TEST_CASE("EnvironmentCredentialSource reads prefixed variables", "[credentials]")
{
    ::setenv("VOICECORE_TEST_SECRET_SPEECH_KEY", "s3cret", 1);
    auto source = EnvironmentCredentialSource("VOICECORE_TEST_SECRET_");

    auto secret = source.getSecret("speech.key");
    REQUIRE(secret.has_value());
    CHECK(*secret == "s3cret");

    auto missing = source.getSecret("other.key");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::CredentialError);

    ::setenv("VOICECORE_TEST_SECRET_EMPTY", "", 1);
    CHECK(!source.getSecret("empty").has_value());

    ::unsetenv("VOICECORE_TEST_SECRET_SPEECH_KEY");
    ::unsetenv("VOICECORE_TEST_SECRET_EMPTY");
}

TEST_CASE("MapCredentialSource loads string secrets from a JSON file", "[credentials]")
{
    auto const path = std::filesystem::temp_directory_path() / "voicecore_test_secrets.json";
    {
        auto file = std::ofstream(path);
        file << R"({"llm.key": "abc", "count": 3, "blank": ""})";
    }

    auto source = MapCredentialSource::fromFile(path.string());
    REQUIRE(source.has_value());

    auto secret = (*source)->getSecret("llm.key");
    REQUIRE(secret.has_value());
    CHECK(*secret == "abc");
    CHECK(!(*source)->getSecret("count").has_value());
    CHECK(!(*source)->getSecret("blank").has_value());

    std::filesystem::remove(path);
}

TEST_CASE("MapCredentialSource reports unreadable files", "[credentials]")
{
    auto missing = MapCredentialSource::fromFile("/nonexistent/voicecore/secrets.json");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::CredentialError);

    auto const path = std::filesystem::temp_directory_path() / "voicecore_test_secrets_array.json";
    {
        auto file = std::ofstream(path);
        file << "[1, 2]";
    }
    auto notObject = MapCredentialSource::fromFile(path.string());
    REQUIRE(!notObject.has_value());
    CHECK(notObject.error().code == ErrorCode::CredentialError);
    std::filesystem::remove(path);
}

TEST_CASE("ChainedCredentialSource returns the first secret found", "[credentials]")
{
    auto chain = ChainedCredentialSource {};
    chain.add(std::make_unique<MapCredentialSource>(std::map<std::string, std::string> { { "a", "first" } }));
    chain.add(std::make_unique<MapCredentialSource>(
        std::map<std::string, std::string> { { "a", "second" }, { "b", "only-second" } }));

    CHECK(chain.getSecret("a").value() == "first");
    CHECK(chain.getSecret("b").value() == "only-second");

    auto missing = chain.getSecret("c");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::CredentialError);
}
