// SPDX-License-Identifier: Apache-2.0
#include <llm/ChatSession.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace voicecore;

TEST_CASE("ChatSession starts with system prompt", "[chat]")
{
    auto session = ChatSession("You are a helpful assistant.");

    REQUIRE(session.messages().size() == 1);
    CHECK(session.messages()[0].role == Role::System);
    CHECK(session.messages()[0].content == "You are a helpful assistant.");
    CHECK(session.messageCount() == 0); // System prompt doesn't count
}

TEST_CASE("ChatSession without system prompt", "[chat]")
{
    auto session = ChatSession();

    REQUIRE(session.messages().empty());
    CHECK(session.messageCount() == 0);
}

TEST_CASE("ChatSession records completed exchanges", "[chat]")
{
    auto session = ChatSession("system");

    session.addExchange("Hello!", "Hi there!");
    REQUIRE(session.messages().size() == 3);
    CHECK(session.messages()[1].role == Role::User);
    CHECK(session.messages()[1].content == "Hello!");
    CHECK(session.messages()[2].role == Role::Assistant);
    CHECK(session.messages()[2].content == "Hi there!");
    CHECK(session.messageCount() == 2);
    CHECK(session.exchangeCount() == 1);
}

TEST_CASE("ChatSession requestMessages appends the new user text without recording it", "[chat]")
{
    auto session = ChatSession("system");
    session.addExchange("first", "reply");

    auto const messages = session.requestMessages("second");
    REQUIRE(messages.size() == 4);
    CHECK(messages[0].role == Role::System);
    CHECK(messages[3].role == Role::User);
    CHECK(messages[3].content == "second");
    CHECK(session.messageCount() == 2);
}

TEST_CASE("ChatSession keeps only the most recent exchanges", "[chat]")
{
    auto session = ChatSession("system", 2);

    session.addExchange("one", "1");
    session.addExchange("two", "2");
    session.addExchange("three", "3");

    REQUIRE(session.exchangeCount() == 2);
    auto const& messages = session.messages();
    CHECK(messages[0].role == Role::System);
    CHECK(messages[1].content == "two");
    CHECK(messages[2].content == "2");
    CHECK(messages[3].content == "three");
    CHECK(messages[4].content == "3");
}

TEST_CASE("ChatSession with zero history keeps no exchanges", "[chat]")
{
    auto session = ChatSession("", 0);
    session.addExchange("hello", "hi");

    CHECK(session.messages().empty());
    CHECK(session.requestMessages("again").size() == 1);
}

TEST_CASE("ChatSession clear resets to system prompt", "[chat]")
{
    auto session = ChatSession("system");

    session.addExchange("Hello", "Hi");
    REQUIRE(session.messageCount() == 2);

    session.clear();
    REQUIRE(session.messageCount() == 0);
    REQUIRE(session.messages().size() == 1); // System prompt remains
    CHECK(session.messages()[0].role == Role::System);
}

TEST_CASE("ChatSession setSystemPrompt replaces prompt", "[chat]")
{
    auto session = ChatSession("old prompt");

    session.addExchange("Hello", "Hi");
    session.setSystemPrompt("new prompt");

    REQUIRE(session.messages().size() == 1);
    CHECK(session.messages()[0].content == "new prompt");
    CHECK(session.systemPrompt() == "new prompt");
}

TEST_CASE("Role conversion roundtrips", "[types]")
{
    CHECK(roleToString(Role::System) == "system");
    CHECK(roleToString(Role::User) == "user");
    CHECK(roleToString(Role::Assistant) == "assistant");

    CHECK(roleFromString("system") == Role::System);
    CHECK(roleFromString("user") == Role::User);
    CHECK(roleFromString("assistant") == Role::Assistant);
    CHECK(roleFromString("unknown") == Role::User); // Default
}
