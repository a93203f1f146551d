// SPDX-License-Identifier: Apache-2.0
#include "Pattern.hpp"

#include <core/Utf8.hpp>

#include <format>

namespace mimic
{

namespace
{
    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };

    auto compileGlob(std::u32string_view source) -> Result<std::vector<GlobToken>>
    {
        auto tokens = std::vector<GlobToken> {};
        auto i = std::size_t { 0 };
        while (i < source.size())
        {
            auto const ch = source[i];
            if (ch == U'*')
            {
                // Consecutive stars collapse into one.
                if (tokens.empty() || tokens.back().kind != GlobToken::Kind::AnySeq)
                    tokens.push_back(GlobToken { .kind = GlobToken::Kind::AnySeq });
                ++i;
                continue;
            }
            if (ch == U'?')
            {
                tokens.push_back(GlobToken { .kind = GlobToken::Kind::AnyOne });
                ++i;
                continue;
            }
            if (ch != U'[')
            {
                tokens.push_back(GlobToken { .kind = GlobToken::Kind::Literal, .ranges = { { ch, ch } } });
                ++i;
                continue;
            }

            auto token = GlobToken { .kind = GlobToken::Kind::Class };
            auto j = i + 1;
            if (j < source.size() && source[j] == U'!')
            {
                token.negated = true;
                ++j;
            }
            // A ']' directly after the opening bracket is literal.
            auto first = true;
            auto closed = false;
            while (j < source.size())
            {
                if (source[j] == U']' && !first)
                {
                    closed = true;
                    break;
                }
                first = false;
                auto const lo = source[j];
                if (j + 2 < source.size() && source[j + 1] == U'-' && source[j + 2] != U']')
                {
                    auto const hi = source[j + 2];
                    if (hi < lo)
                        return makeError(ErrorCode::PatternError, "invalid range in character class");
                    token.ranges.emplace_back(lo, hi);
                    j += 3;
                }
                else
                {
                    token.ranges.emplace_back(lo, lo);
                    ++j;
                }
            }
            if (!closed)
                return makeError(ErrorCode::PatternError, "unterminated character class");
            tokens.push_back(std::move(token));
            i = j + 1;
        }
        return tokens;
    }

    auto tokenAccepts(GlobToken const& token, char32_t ch) -> bool
    {
        switch (token.kind)
        {
            case GlobToken::Kind::Literal: return token.ranges.front().first == ch;
            case GlobToken::Kind::AnyOne: return true;
            case GlobToken::Kind::AnySeq: return true;
            case GlobToken::Kind::Class: {
                auto inside = false;
                for (auto const& [lo, hi]: token.ranges)
                    if (ch >= lo && ch <= hi)
                    {
                        inside = true;
                        break;
                    }
                return inside != token.negated;
            }
        }
        return false;
    }

    /// Iterative wildcard matching with single-star backtracking.
    auto globMatches(std::vector<GlobToken> const& tokens, std::u32string_view input) -> bool
    {
        auto t = std::size_t { 0 };
        auto s = std::size_t { 0 };
        auto starToken = std::string::npos;
        auto starInput = std::size_t { 0 };

        while (s < input.size())
        {
            if (t < tokens.size() && tokens[t].kind == GlobToken::Kind::AnySeq)
            {
                starToken = t++;
                starInput = s;
            }
            else if (t < tokens.size() && tokenAccepts(tokens[t], input[s]))
            {
                ++t;
                ++s;
            }
            else if (starToken != std::string::npos)
            {
                t = starToken + 1;
                s = ++starInput;
            }
            else
            {
                return false;
            }
        }

        while (t < tokens.size() && tokens[t].kind == GlobToken::Kind::AnySeq)
            ++t;
        return t == tokens.size();
    }
} // namespace

auto makeContains(std::string text) -> Pattern
{
    return ContainsPattern { std::move(text) };
}

auto makeExact(std::string text) -> Pattern
{
    return ExactPattern { std::move(text) };
}

auto makeRegex(std::string source) -> Result<Pattern>
{
    try
    {
        auto compiled = std::make_shared<std::regex const>(source, std::regex::ECMAScript);
        return RegexPattern { .source = std::move(source), .compiled = std::move(compiled) };
    }
    catch (std::regex_error const& e)
    {
        return makeError(ErrorCode::PatternError, std::format("Invalid regex pattern '{}': {}", source, e.what()));
    }
}

auto makeGlob(std::string source) -> Result<Pattern>
{
    auto tokens = compileGlob(utf8::decode(source));
    if (!tokens)
        return makeError(ErrorCode::PatternError,
                         std::format("Invalid glob pattern '{}': {}", source, tokens.error().message));
    return GlobPattern { .source = std::move(source), .tokens = std::move(*tokens) };
}

auto matches(Pattern const& pattern, std::string_view input) -> bool
{
    return std::visit(
        Overloaded {
            [&](ContainsPattern const& p) { return input.find(p.text) != std::string_view::npos; },
            [&](ExactPattern const& p) { return input == p.text; },
            [&](RegexPattern const& p) {
                return std::regex_search(input.begin(), input.end(), *p.compiled);
            },
            [&](GlobPattern const& p) { return globMatches(p.tokens, utf8::decode(input)); },
            [](AnyPattern const&) { return true; },
        },
        pattern);
}

auto patternKindName(Pattern const& pattern) -> std::string_view
{
    return std::visit(Overloaded {
                          [](ContainsPattern const&) { return std::string_view { "contains" }; },
                          [](ExactPattern const&) { return std::string_view { "exact" }; },
                          [](RegexPattern const&) { return std::string_view { "regex" }; },
                          [](GlobPattern const&) { return std::string_view { "glob" }; },
                          [](AnyPattern const&) { return std::string_view { "any" }; },
                      },
                      pattern);
}

} // namespace mimic
