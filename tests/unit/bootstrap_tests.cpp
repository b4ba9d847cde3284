#include <doctest/doctest.h>
#include <cmdhost/bootstrap.hpp>

#include "../support/test_commands.hpp"

#include <sstream>

using namespace cmdhost;

TEST_CASE("parse_cmd_input splits the command name from its arguments") {
    SUBCASE("empty args") {
        auto input = parse_cmd_input({});
        CHECK(input.name.empty());
        CHECK(input.args.empty());
    }

    SUBCASE("command only") {
        auto input = parse_cmd_input({"test-cmd"});
        CHECK(input.name == "test-cmd");
        CHECK(input.args.empty());
    }

    SUBCASE("command with args") {
        auto input = parse_cmd_input({"test-cmd", "arg1", "arg2"});
        CHECK(input.name == "test-cmd");
        CHECK(input.args == std::vector<std::string>{"arg1", "arg2"});
    }

    SUBCASE("leading separator is dropped") {
        auto input = parse_cmd_input({"--", "test-cmd", "arg1"});
        CHECK(input.name == "test-cmd");
        CHECK(input.args == std::vector<std::string>{"arg1"});
    }

    SUBCASE("lone separator leaves an empty name") {
        auto input = parse_cmd_input({"--"});
        CHECK(input.name.empty());
        CHECK(input.args.empty());
    }

    SUBCASE("name is trimmed") {
        auto input = parse_cmd_input({"  test-cmd\t", "--flag"});
        CHECK(input.name == "test-cmd");
        CHECK(input.args == std::vector<std::string>{"--flag"});
    }
}

TEST_CASE("args_from_main drops the program name") {
    char prog[] = "cmdhost";
    char cmd[] = "greet";
    char flag[] = "--name";
    char* argv[] = {prog, cmd, flag, nullptr};

    CHECK(args_from_main(3, argv) == std::vector<std::string>{"greet", "--name"});
    CHECK(args_from_main(1, argv).empty());
}

TEST_CASE("dispatch runs the named command") {
    CommandsRegistry registry;
    REQUIRE(registry.register_command(std::make_shared<MockCommand>("test-cmd", "Test command",
        [](std::ostream& out) {
            out << "Test command executed";
            return Result<void>::ok();
        })).isOk());

    std::ostringstream out;
    CHECK(dispatch({"test-cmd"}, registry, out) == STATUS_OK);
    CHECK(out.str() == "Test command executed");
}

TEST_CASE("dispatch reports unknown commands") {
    CommandsRegistry registry;
    std::ostringstream out;

    CHECK(dispatch({"non-existent-cmd"}, registry, out) == STATUS_ERR);
    CHECK(out.str() == "Failed to execute command non-existent-cmd with error: "
                       "The command non-existent-cmd does not exist\n");
}

TEST_CASE("dispatch writes one diagnostic for pipeline failures") {
    CommandsRegistry registry;
    REQUIRE(registry.register_command(std::make_shared<MockCommand>("error-cmd", "Fails",
        [](std::ostream&) {
            return Result<void>::err(Error(ErrorCode::EXECUTION_ERROR, "disk full"));
        })).isOk());

    std::ostringstream out;
    CHECK(dispatch({"error-cmd"}, registry, out) == STATUS_ERR);
    CHECK(out.str() == "Failed to execute command error-cmd with error: disk full\n");
}

TEST_CASE("dispatch runs help for an empty command name") {
    CommandsRegistry registry;
    REQUIRE(registry.register_command(std::make_shared<MockCommand>("test-cmd", "Test command")).isOk());

    std::ostringstream out;
    CHECK(dispatch({}, registry, out) == STATUS_OK);
    CHECK(out.str().find("Lists all available commands") != std::string::npos);
    CHECK(out.str().find("test-cmd") != std::string::npos);

    std::ostringstream named;
    CHECK(dispatch({"help"}, registry, named) == STATUS_OK);
    CHECK(named.str() == out.str());

    std::ostringstream separator_only;
    CHECK(dispatch({"--"}, registry, separator_only) == STATUS_OK);
    CHECK(separator_only.str() == out.str());
}

TEST_CASE("help reflects the registry at the time of each dispatch") {
    CommandsRegistry registry;
    REQUIRE(registry.register_command(std::make_shared<MockCommand>("first-cmd", "First")).isOk());

    std::ostringstream before;
    REQUIRE(dispatch({"help"}, registry, before) == STATUS_OK);
    CHECK(before.str().find("second-cmd") == std::string::npos);

    REQUIRE(registry.register_command(std::make_shared<MockCommand>("second-cmd", "Second")).isOk());

    std::ostringstream after;
    REQUIRE(dispatch({"help"}, registry, after) == STATUS_OK);
    CHECK(after.str().find("second-cmd") != std::string::npos);

    // Dispatch never adds help to the caller's registry
    CHECK_FALSE(registry.contains(HELP_COMMAND_ID));
}

TEST_CASE("bootstrap reports the status through the exit function") {
    CommandsRegistry registry;
    REQUIRE(registry.register_command(std::make_shared<MockCommand>("test-cmd", "Test command")).isOk());

    std::ostringstream out;
    int exit_code = -1;
    DispatchOptions options{&out, [&exit_code](int code) { exit_code = code; }};

    bootstrap({"test-cmd"}, registry, options);
    CHECK(exit_code == STATUS_OK);

    out.str("");
    exit_code = -1;
    bootstrap({"non-existent-cmd"}, registry, options);
    CHECK(exit_code == STATUS_ERR);
    CHECK(out.str().find("does not exist") != std::string::npos);
}
