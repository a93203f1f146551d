// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mimic
{

/// @brief Case-sensitive substring match.
struct ContainsPattern
{
    std::string text;
};

/// @brief Full-string equality.
struct ExactPattern
{
    std::string text;
};

/// @brief Unanchored ECMAScript regular expression search.
struct RegexPattern
{
    std::string source;
    std::shared_ptr<std::regex const> compiled;
};

/// @brief One element of a compiled glob.
struct GlobToken
{
    enum class Kind : std::uint8_t
    {
        Literal,  ///< Matches exactly @c ranges.front().first.
        AnyOne,   ///< '?'
        AnySeq,   ///< '*'
        Class,    ///< '[...]' or '[!...]'
    };

    Kind kind = Kind::Literal;
    bool negated = false;
    std::vector<std::pair<char32_t, char32_t>> ranges;
};

/// @brief Shell-style wildcard pattern matched against the whole input.
struct GlobPattern
{
    std::string source;
    std::vector<GlobToken> tokens;
};

/// @brief Matches every input.
struct AnyPattern
{
};

/// @brief A compiled rule pattern. Construct through the make* helpers so
/// that regex and glob sources are validated exactly once.
using Pattern = std::variant<ContainsPattern, ExactPattern, RegexPattern, GlobPattern, AnyPattern>;

[[nodiscard]] auto makeContains(std::string text) -> Pattern;
[[nodiscard]] auto makeExact(std::string text) -> Pattern;
[[nodiscard]] auto makeRegex(std::string source) -> Result<Pattern>;
[[nodiscard]] auto makeGlob(std::string source) -> Result<Pattern>;

/// @brief Tests @p input against @p pattern. Pure and total.
[[nodiscard]] auto matches(Pattern const& pattern, std::string_view input) -> bool;

/// @brief Returns the scenario-file name of the pattern's kind ("contains", "regex", ...).
[[nodiscard]] auto patternKindName(Pattern const& pattern) -> std::string_view;

} // namespace mimic
