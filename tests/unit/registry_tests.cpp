#include <doctest/doctest.h>
#include <cmdhost/command.hpp>

#include "../support/test_commands.hpp"

using namespace cmdhost;

TEST_CASE("register_command stores a command and rejects duplicates") {
    CommandsRegistry registry;
    auto first = std::make_shared<MockCommand>("test-cmd", "Test command");
    auto second = std::make_shared<MockCommand>("test-cmd", "Another command");

    REQUIRE(registry.register_command(first).isOk());

    auto duplicate = registry.register_command(second);
    REQUIRE(duplicate.isErr());
    CHECK(duplicate.error().code() == ErrorCode::DUPLICATE_COMMAND);
    CHECK(duplicate.error().message().find("test-cmd") != std::string::npos);

    // The first registration is retained
    CHECK(registry.size() == 1);
    CHECK(registry.command("test-cmd") == first);
    CHECK(registry.command("test-cmd")->description() == "Test command");
}

TEST_CASE("register_command rejects invalid commands") {
    CommandsRegistry registry;

    SUBCASE("null command") {
        auto result = registry.register_command(nullptr);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::INVALID_COMMAND);
    }

    SUBCASE("empty id") {
        auto result = registry.register_command(std::make_shared<MockCommand>("", "Nameless"));
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::INVALID_COMMAND);
    }

    SUBCASE("reserved help id") {
        auto result = registry.register_command(std::make_shared<MockCommand>("help", "My help"));
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::DUPLICATE_COMMAND);
    }

    CHECK(registry.size() == 0);
}

TEST_CASE("commands() returns a copy of the registered commands") {
    CommandsRegistry registry;
    REQUIRE(registry.register_command(std::make_shared<MockCommand>("cmd1", "Command 1")).isOk());
    REQUIRE(registry.register_command(std::make_shared<MockCommand>("cmd2", "Command 2")).isOk());

    auto commands = registry.commands();
    REQUIRE(commands.size() == 2);
    CHECK(commands.at("cmd1") == registry.command("cmd1"));
    CHECK(commands.at("cmd2") == registry.command("cmd2"));

    commands.erase("cmd1");
    commands["cmd3"] = std::make_shared<MockCommand>("cmd3", "Command 3");

    CHECK(registry.command("cmd1") != nullptr);
    CHECK(registry.command("cmd3") == nullptr);
    CHECK(registry.size() == 2);
}

TEST_CASE("command() finds registered commands by id") {
    CommandsRegistry registry;
    REQUIRE(registry.register_command(std::make_shared<MockCommand>("test-cmd", "Test command")).isOk());

    auto found = registry.command("test-cmd");
    REQUIRE(found != nullptr);
    CHECK(found->id() == "test-cmd");
    CHECK(registry.contains("test-cmd"));

    CHECK(registry.command("non-existent") == nullptr);
    CHECK_FALSE(registry.contains("non-existent"));
}
