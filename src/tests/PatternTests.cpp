// SPDX-License-Identifier: Apache-2.0
#include <engine/Pattern.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mimic;

namespace
{
auto glob(std::string source) -> Pattern
{
    auto result = makeGlob(std::move(source));
    REQUIRE(result.has_value());
    return std::move(*result);
}

auto regex(std::string source) -> Pattern
{
    auto result = makeRegex(std::move(source));
    REQUIRE(result.has_value());
    return std::move(*result);
}
} // namespace

TEST_CASE("Pattern: contains is a case-sensitive substring match", "[pattern]")
{
    auto const pattern = makeContains("hello");
    CHECK(matches(pattern, "hello"));
    CHECK(matches(pattern, "well hello there"));
    CHECK_FALSE(matches(pattern, "Hello"));
    CHECK_FALSE(matches(pattern, "help"));
    CHECK(patternKindName(pattern) == "contains");
}

TEST_CASE("Pattern: exact requires the whole input", "[pattern]")
{
    auto const pattern = makeExact("/status");
    CHECK(matches(pattern, "/status"));
    CHECK_FALSE(matches(pattern, "/status "));
    CHECK_FALSE(matches(pattern, "show /status"));
    CHECK(patternKindName(pattern) == "exact");
}

TEST_CASE("Pattern: regex searches anywhere in the input", "[pattern]")
{
    auto const pattern = regex("fix(es)? #[0-9]+");
    CHECK(matches(pattern, "please fix #42 today"));
    CHECK(matches(pattern, "fixes #7"));
    CHECK_FALSE(matches(pattern, "fix issue"));
    CHECK(patternKindName(pattern) == "regex");

    SECTION("anchors are honored")
    {
        auto const anchored = regex("^deploy$");
        CHECK(matches(anchored, "deploy"));
        CHECK_FALSE(matches(anchored, "deploy now"));
    }
}

TEST_CASE("Pattern: an invalid regex is rejected at construction", "[pattern]")
{
    auto const result = makeRegex("([unclosed");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::PatternError);
    CHECK(result.error().message.find("([unclosed") != std::string::npos);
}

TEST_CASE("Pattern: glob matches the whole input", "[pattern][glob]")
{
    SECTION("star matches any run, including an empty one")
    {
        auto const pattern = glob("*.rs");
        CHECK(matches(pattern, "main.rs"));
        CHECK(matches(pattern, ".rs"));
        CHECK(matches(pattern, "src/lib.rs"));
        CHECK_FALSE(matches(pattern, "main.rs.bak"));
    }

    SECTION("question mark matches exactly one character")
    {
        auto const pattern = glob("v?.0");
        CHECK(matches(pattern, "v1.0"));
        CHECK_FALSE(matches(pattern, "v.0"));
        CHECK_FALSE(matches(pattern, "v10.0"));
    }

    SECTION("question mark counts codepoints, not bytes")
    {
        CHECK(matches(glob("caf?"), "café"));
    }

    SECTION("character classes and ranges")
    {
        auto const pattern = glob("file[0-9a].txt");
        CHECK(matches(pattern, "file3.txt"));
        CHECK(matches(pattern, "filea.txt"));
        CHECK_FALSE(matches(pattern, "fileb.txt"));
    }

    SECTION("negated classes")
    {
        auto const pattern = glob("[!a-c]*");
        CHECK(matches(pattern, "deploy"));
        CHECK_FALSE(matches(pattern, "build"));
    }

    SECTION("a closing bracket first in a class is literal")
    {
        auto const pattern = glob("[]x]");
        CHECK(matches(pattern, "]"));
        CHECK(matches(pattern, "x"));
        CHECK_FALSE(matches(pattern, "y"));
    }

    SECTION("backtracking over several stars")
    {
        auto const pattern = glob("*run*tests*");
        CHECK(matches(pattern, "please run the unit tests now"));
        CHECK_FALSE(matches(pattern, "tests run"));
    }

    CHECK(patternKindName(glob("*")) == "glob");
}

TEST_CASE("Pattern: malformed globs are rejected", "[pattern][glob]")
{
    auto const unterminated = makeGlob("file[0-9");
    REQUIRE_FALSE(unterminated.has_value());
    CHECK(unterminated.error().code == ErrorCode::PatternError);
    CHECK(unterminated.error().message.find("unterminated character class") != std::string::npos);

    auto const backwards = makeGlob("[z-a]");
    REQUIRE_FALSE(backwards.has_value());
    CHECK(backwards.error().message.find("invalid range") != std::string::npos);
}

TEST_CASE("Pattern: any accepts everything", "[pattern]")
{
    auto const pattern = Pattern { AnyPattern {} };
    CHECK(matches(pattern, ""));
    CHECK(matches(pattern, "anything at all"));
    CHECK(patternKindName(pattern) == "any");
}
