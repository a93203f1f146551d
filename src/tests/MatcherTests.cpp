// SPDX-License-Identifier: Apache-2.0
#include <engine/Matcher.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mimic;

namespace
{
auto rule(Pattern pattern, std::string text, std::optional<unsigned> maxMatches = std::nullopt) -> Rule
{
    return Rule { .pattern = std::move(pattern),
                  .response = ResponseSpec { .text = std::move(text) },
                  .maxMatches = maxMatches };
}

auto textOf(MatchResult const& result) -> std::string const&
{
    REQUIRE(result.rule != nullptr);
    return result.rule->response.text;
}
} // namespace

TEST_CASE("Matcher: rules are tried in declaration order", "[matcher]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(rule(makeContains("test"), "first"));
    scenario.rules.push_back(rule(makeExact("run tests"), "second"));

    auto matcher = Matcher(scenario);
    auto const result = matcher.match("run tests");
    CHECK(textOf(result) == "first");
    CHECK(result.ruleIndex == 0u);
}

TEST_CASE("Matcher: unmatched input gets the default response", "[matcher]")
{
    auto scenario = Scenario {};
    scenario.defaultResponse = ResponseSpec { .text = "No idea." };
    scenario.rules.push_back(rule(makeExact("hello"), "Hi!"));

    auto matcher = Matcher(scenario);
    auto const result = matcher.match("goodbye");
    CHECK_FALSE(result.ruleIndex.has_value());
    CHECK(textOf(result) == "No idea.");
}

TEST_CASE("Matcher: the built-in default response", "[matcher]")
{
    auto const scenario = Scenario {};
    auto matcher = Matcher(scenario);
    CHECK(textOf(matcher.match("anything")) == FallbackResponseText);
}

TEST_CASE("Matcher: a rule stops matching after max_matches", "[matcher]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(rule(makeContains("deploy"), "Deploying...", 2));
    scenario.rules.push_back(rule(makeContains("deploy"), "Already deployed."));

    auto matcher = Matcher(scenario);
    CHECK(textOf(matcher.match("deploy")) == "Deploying...");
    CHECK(textOf(matcher.match("deploy now")) == "Deploying...");
    CHECK(textOf(matcher.match("deploy")) == "Already deployed.");
    CHECK(textOf(matcher.match("deploy")) == "Already deployed.");

    SECTION("resetCounts makes the rule eligible again")
    {
        matcher.resetCounts();
        CHECK(textOf(matcher.match("deploy")) == "Deploying...");
    }
}

TEST_CASE("Matcher: an exhausted rule falls back when nothing else matches", "[matcher]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(rule(makeExact("once"), "only once", 1));

    auto matcher = Matcher(scenario);
    CHECK(matcher.match("once").ruleIndex == 0u);
    CHECK_FALSE(matcher.match("once").ruleIndex.has_value());
}

TEST_CASE("Matcher: the same input sequence yields the same responses", "[matcher]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(rule(makeContains("a"), "A", 1));
    scenario.rules.push_back(rule(makeContains("a"), "B"));

    auto const run = [&] {
        auto matcher = Matcher(scenario);
        auto texts = std::vector<std::string> {};
        for (auto const* input: { "a", "a", "x", "a" })
            texts.push_back(textOf(matcher.match(input)));
        return texts;
    };

    CHECK(run() == run());
}
