#include <catch2/catch_test_macros.hpp>

#include "kwin/script_synth.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace {

size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

const CallbackAddress ADDR{"org.example.Deck", "/org/example/Deck", "org.example.Deck"};

} // namespace

TEST_CASE("Script synthesis", "[script]") {

    SECTION("ActivationEmbedsIdentityOnce") {
        auto script = script_synth::activation_script(ADDR, "abc-123");
        REQUIRE(count_occurrences(script, "abc-123") == 1);
        REQUIRE(script.find(R"(const TARGET = "abc-123";)") != std::string::npos);
        REQUIRE(script.find("id === TARGET") != std::string::npos);
        REQUIRE(script.find("workspace.activeWindow = win") != std::string::npos);
    }

    SECTION("ActivationLogsEveryComparison") {
        auto script = script_synth::activation_script(ADDR, "abc-123");
        REQUIRE(script.find(R"(log(id + " == " + TARGET);)") != std::string::npos);
    }

    SECTION("AdversarialIdentityIsEscaped") {
        const std::string evil = "x'); workspace.activeWindow = null; (\"\\\n ";
        auto script = script_synth::activation_script(ADDR, evil);

        auto literal = script_synth::js_string_literal(evil);
        REQUIRE(count_occurrences(script, literal) == 1);
        // The raw value never reaches the script text
        REQUIRE(script.find(evil) == std::string::npos);
        // The literal decodes back to the exact identity
        REQUIRE(nlohmann::json::parse(literal).get<std::string>() == evil);
    }

    SECTION("LiteralEscapesQuotesAndBackslashes") {
        REQUIRE(script_synth::js_string_literal("a\"b") == R"("a\"b")");
        REQUIRE(script_synth::js_string_literal("a\\b") == R"("a\\b")");
        REQUIRE(script_synth::js_string_literal("line\nbreak") == R"("line\nbreak")");
    }

    SECTION("RenderLeavesUnknownPlaceholders") {
        auto out = script_synth::render("a {{x}} b {{y}}", {{"x", "1"}});
        REQUIRE(out == R"(a "1" b {{y}})");
    }

    SECTION("RenderDoesNotRescanValues") {
        auto out = script_synth::render("{{x}}", {{"x", "{{x}}"}});
        REQUIRE(out == R"("{{x}}")");
    }

    SECTION("ObserverForwardsLifecycleEvents") {
        auto script = script_synth::observer_script(ADDR);
        REQUIRE(script.find(R"(const SERVICE = "org.example.Deck";)") != std::string::npos);
        REQUIRE(script.find(R"(const PATH = "/org/example/Deck";)") != std::string::npos);
        REQUIRE(script.find("workspace.windowList()") != std::string::npos);
        REQUIRE(script.find("workspace.windowAdded.connect(add)") != std::string::npos);
        REQUIRE(script.find("workspace.windowRemoved.connect(remove)") != std::string::npos);
        REQUIRE(script.find(R"("WindowAdded")") != std::string::npos);
        REQUIRE(script.find(R"("WindowRemoved")") != std::string::npos);
        REQUIRE(count_occurrences(script, "try {") == 2);
        REQUIRE(count_occurrences(script, "catch (e)") == 2);
        REQUIRE(script.find("{{") == std::string::npos);
    }
}
