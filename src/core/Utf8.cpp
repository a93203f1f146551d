// SPDX-License-Identifier: Apache-2.0
#include "Utf8.hpp"

#include <libunicode/utf8_grapheme_segmenter.h>
#include <libunicode/width.h>

namespace mimic::utf8
{

namespace
{
    constexpr auto ReplacementCharacter = char32_t { 0xFFFD };

    auto isContinuation(char c) noexcept -> bool
    {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    /// Decodes the codepoint starting at @p pos; @p length receives its byte count.
    auto decodeAt(std::string_view text, std::size_t pos, std::size_t& length) noexcept -> char32_t
    {
        auto const lead = static_cast<unsigned char>(text[pos]);
        auto expected = std::size_t { 0 };
        auto cp = char32_t { 0 };

        if (lead < 0x80)
        {
            length = 1;
            return lead;
        }
        if ((lead & 0xE0) == 0xC0)
        {
            expected = 2;
            cp = lead & 0x1F;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            expected = 3;
            cp = lead & 0x0F;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            expected = 4;
            cp = lead & 0x07;
        }
        else
        {
            length = 1;
            return ReplacementCharacter;
        }

        if (pos + expected > text.size())
        {
            length = 1;
            return ReplacementCharacter;
        }

        for (auto i = std::size_t { 1 }; i < expected; ++i)
        {
            if (!isContinuation(text[pos + i]))
            {
                length = 1;
                return ReplacementCharacter;
            }
            cp = (cp << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);
        }

        length = expected;
        return cp;
    }
} // namespace

auto encode(char32_t cp) -> std::string
{
    auto result = std::string {};
    if (cp < 0x80)
    {
        result += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        result += static_cast<char>(0xC0 | (cp >> 6));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        result += static_cast<char>(0xE0 | (cp >> 12));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x110000)
    {
        result += static_cast<char>(0xF0 | (cp >> 18));
        result += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return result;
}

auto decode(std::string_view text) -> std::u32string
{
    auto result = std::u32string {};
    result.reserve(text.size());
    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        auto length = std::size_t { 0 };
        result += decodeAt(text, pos, length);
        pos += length;
    }
    return result;
}

auto nextCodepoint(std::string_view text, std::size_t pos) noexcept -> std::size_t
{
    if (pos >= text.size())
        return text.size();
    ++pos;
    while (pos < text.size() && isContinuation(text[pos]))
        ++pos;
    return pos;
}

auto prevCodepoint(std::string_view text, std::size_t pos) noexcept -> std::size_t
{
    if (pos == 0)
        return 0;
    --pos;
    while (pos > 0 && isContinuation(text[pos]))
        --pos;
    return pos;
}

auto nextGrapheme(std::string_view text, std::size_t pos) -> std::size_t
{
    if (pos >= text.size())
        return text.size();

    // The segmenter iterator's _clusterStart points into the viewed buffer.
    auto const tail = text.substr(pos);
    auto segmenter = unicode::utf8_grapheme_segmenter(tail);
    auto it = segmenter.begin();
    if (it == segmenter.end())
        return nextCodepoint(text, pos);

    ++it;
    if (it != segmenter.end())
        return pos + static_cast<std::size_t>(it._clusterStart - tail.data());

    return text.size();
}

auto prevGrapheme(std::string_view text, std::size_t pos) -> std::size_t
{
    if (pos == 0)
        return 0;

    auto const head = text.substr(0, pos);
    auto segmenter = unicode::utf8_grapheme_segmenter(head);

    auto lastBoundary = std::size_t { 0 };
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        lastBoundary = static_cast<std::size_t>(it._clusterStart - head.data());

    return lastBoundary;
}

auto graphemes(std::string_view text) -> std::vector<std::string_view>
{
    auto result = std::vector<std::string_view> {};
    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        auto const next = nextGrapheme(text, pos);
        result.push_back(text.substr(pos, next - pos));
        pos = next;
    }
    return result;
}

auto clusterWidth(std::string_view cluster) -> int
{
    auto const codepoints = decode(cluster);
    if (codepoints.empty())
        return 0;

    // Emoji presentation selector widens the base character.
    for (auto const cp: codepoints)
        if (cp == 0xFE0F)
            return 2;

    auto const base = static_cast<int>(unicode::width(codepoints.front()));
    return base < 0 ? 0 : (base > 2 ? 2 : base);
}

auto displayWidth(std::string_view text) -> int
{
    auto width = 0;
    for (auto const cluster: graphemes(text))
        width += clusterWidth(cluster);
    return width;
}

} // namespace mimic::utf8
