#include <catch2/catch_test_macros.hpp>

#include "cli_options.hpp"

#include <string>
#include <vector>

TEST_CASE("Command line", "[cli]") {

    SECTION("Defaults") {
        auto opts = parse_cli({});
        REQUIRE(opts.has_value());
        REQUIRE_FALSE(opts->foreground);
        REQUIRE_FALSE(opts->verbose);
        REQUIRE_FALSE(opts->help);
        REQUIRE(opts->config_path.empty());
    }

    SECTION("ShortAndLongFlags") {
        auto opts = parse_cli({"-f", "--verbose", "-c", "/tmp/deck.json"});
        REQUIRE(opts.has_value());
        REQUIRE(opts->foreground);
        REQUIRE(opts->verbose);
        REQUIRE(opts->config_path == "/tmp/deck.json");

        REQUIRE(parse_cli({"--config", "x.json"})->config_path == "x.json");
        REQUIRE(parse_cli({"-h"})->help);
    }

    SECTION("ConfigWithoutPath") {
        auto opts = parse_cli({"-v", "--config"});
        REQUIRE_FALSE(opts.has_value());
        REQUIRE(opts.error() == "--config needs a path");
    }

    SECTION("UnknownOption") {
        auto opts = parse_cli({"--brightness", "50"});
        REQUIRE_FALSE(opts.has_value());
        REQUIRE(opts.error().find("'--brightness'") != std::string::npos);
    }

    SECTION("UsageDescribesTheDaemon") {
        auto text = usage_text();
        REQUIRE(text.starts_with("Usage: plasma-deck"));
        REQUIRE(text.find("Stream Deck") != std::string::npos);
        REQUIRE(text.find("--config PATH") != std::string::npos);
    }
}
