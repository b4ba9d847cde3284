#include <doctest/doctest.h>
#include <cmdhost/flag.hpp>

using namespace cmdhost;

TEST_CASE("make_flag renders the default value as text") {
    std::string name;
    int count = 0;
    bool verbose = true;
    double ratio = 0;

    CHECK(make_flag("name", "User name", name, "guest").default_value() == "guest");
    CHECK(make_flag("count", "Count", count, 3).default_value() == "3");
    CHECK(make_flag("verbose", "Verbose", verbose, false).default_value() == "false");
    CHECK(make_flag("ratio", "Ratio", ratio, 0.5).default_value() == "0.5");

    auto def = make_flag("name", "User name", name, "", true);
    CHECK(def.name() == "name");
    CHECK(def.description() == "User name");
    CHECK(def.required());
}

TEST_CASE("FlagSet parses values into bound variables") {
    std::string name;
    int count = 0;
    bool verbose = false;

    FlagSet flags("greet");
    flags.add(make_flag("name", "User name", name, ""));
    flags.add(make_flag("count", "Count", count, 1));
    flags.add(make_flag("verbose", "Verbose", verbose, false));

    REQUIRE(flags.parse({"--name", "Ada", "--count=4", "--verbose"}).isOk());

    CHECK(name == "Ada");
    CHECK(count == 4);
    CHECK(verbose);
    CHECK(flags.was_set("name"));
    CHECK(flags.was_set("verbose"));
    CHECK(flags.lookup("name") == std::optional<std::string>("Ada"));
    CHECK(flags.lookup("count") == std::optional<std::string>("4"));
    CHECK_FALSE(flags.help_requested());
}

TEST_CASE("FlagSet get returns typed values") {
    std::string name;
    int count = 0;
    bool verbose = false;
    double ratio = 0;

    FlagSet flags("greet");
    flags.add(make_flag("name", "User name", name, "guest"));
    flags.add(make_flag("count", "Count", count, 1));
    flags.add(make_flag("verbose", "Verbose", verbose, false));
    flags.add(make_flag("ratio", "Ratio", ratio, 0.5));

    SUBCASE("supplied values") {
        REQUIRE(flags.parse({"--name", "Ada", "--count", "7", "--verbose"}).isOk());
        CHECK(flags.get<std::string>("name") == std::optional<std::string>("Ada"));
        CHECK(flags.get<int>("count") == std::optional<int>(7));
        CHECK(flags.get<bool>("verbose") == std::optional<bool>(true));
    }

    SUBCASE("defaults when not supplied") {
        REQUIRE(flags.parse({}).isOk());
        CHECK(flags.get<std::string>("name") == std::optional<std::string>("guest"));
        CHECK(flags.get<int>("count") == std::optional<int>(1));
        CHECK(flags.get<bool>("verbose") == std::optional<bool>(false));
        CHECK(flags.get<double>("ratio") == std::optional<double>(0.5));
    }

    SUBCASE("undeclared or unconvertible") {
        REQUIRE(flags.parse({"--name", "Ada"}).isOk());
        CHECK_FALSE(flags.get<int>("missing").has_value());
        CHECK_FALSE(flags.get<int>("name").has_value());
    }
}

TEST_CASE("binding a flag resets its variable to the default") {
    int count = 0;
    auto def = make_flag("count", "Count", count, 1);

    {
        FlagSet first("greet");
        first.add(def);
        REQUIRE(first.parse({"--count", "3"}).isOk());
        CHECK(count == 3);
    }

    FlagSet second("greet");
    second.add(def);
    REQUIRE(second.parse({}).isOk());
    CHECK(count == 1);
    CHECK(second.lookup("count") == std::optional<std::string>("1"));
}

TEST_CASE("FlagSet lookup falls back to defaults and ignores undeclared flags") {
    std::string name;

    FlagSet flags("greet");
    flags.add(make_flag("name", "User name", name, "guest"));
    REQUIRE(flags.parse({}).isOk());

    CHECK_FALSE(flags.was_set("name"));
    CHECK(flags.lookup("name") == std::optional<std::string>("guest"));
    CHECK_FALSE(flags.lookup("missing").has_value());
    CHECK_FALSE(flags.was_set("missing"));
}

TEST_CASE("FlagSet reports malformed input as parse errors") {
    std::string name;
    int count = 0;

    FlagSet flags("greet");
    flags.add(make_flag("name", "User name", name, ""));
    flags.add(make_flag("count", "Count", count, 1));

    SUBCASE("unknown flag") {
        auto result = flags.parse({"--nope", "x"});
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::PARSE_ERROR);
    }

    SUBCASE("wrong type") {
        auto result = flags.parse({"--count", "many"});
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::PARSE_ERROR);
    }

    SUBCASE("missing value") {
        auto result = flags.parse({"--name"});
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::PARSE_ERROR);
    }

    SUBCASE("unexpected positional") {
        auto result = flags.parse({"stray"});
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::PARSE_ERROR);
    }
}

TEST_CASE("FlagSet recognizes help requests") {
    FlagSet flags("greet");
    REQUIRE(flags.parse({"--help"}).isOk());
    CHECK(flags.help_requested());
}

TEST_CASE("usage text identifies the command and lists flags") {
    std::string name;
    int count = 0;

    FlagSet flags("greet");
    flags.add(make_flag("name", "User name", name, "", true));
    flags.add(make_flag("count", "How many times", count, 2));

    auto usage = flags.usage();
    CHECK(usage.rfind("Usage of greet:", 0) == 0);
    CHECK(usage.find("--name") != std::string::npos);
    CHECK(usage.find("[required]") != std::string::npos);
    CHECK(usage.find("How many times (default 2)") != std::string::npos);

    flags.set_usage_renderer([](const FlagSet& f) { return "custom " + f.command_id(); });
    CHECK(flags.usage() == "custom greet");
}
