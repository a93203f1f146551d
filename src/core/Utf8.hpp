// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mimic::utf8
{

/// @brief Encodes a Unicode codepoint as UTF-8.
[[nodiscard]] auto encode(char32_t cp) -> std::string;

/// @brief Decodes a UTF-8 string into codepoints. Malformed bytes decode as U+FFFD.
[[nodiscard]] auto decode(std::string_view text) -> std::u32string;

/// @brief Advances past one UTF-8 codepoint starting at @p pos.
[[nodiscard]] auto nextCodepoint(std::string_view text, std::size_t pos) noexcept -> std::size_t;

/// @brief Moves back one UTF-8 codepoint from @p pos.
[[nodiscard]] auto prevCodepoint(std::string_view text, std::size_t pos) noexcept -> std::size_t;

/// @brief Returns the byte offset of the grapheme cluster following the one at @p pos.
[[nodiscard]] auto nextGrapheme(std::string_view text, std::size_t pos) -> std::size_t;

/// @brief Returns the byte offset of the grapheme cluster preceding @p pos.
[[nodiscard]] auto prevGrapheme(std::string_view text, std::size_t pos) -> std::size_t;

/// @brief Splits @p text into grapheme clusters.
[[nodiscard]] auto graphemes(std::string_view text) -> std::vector<std::string_view>;

/// @brief Number of terminal columns a single grapheme cluster occupies (0, 1 or 2).
[[nodiscard]] auto clusterWidth(std::string_view cluster) -> int;

/// @brief Number of terminal columns @p text occupies.
[[nodiscard]] auto displayWidth(std::string_view text) -> int;

} // namespace mimic::utf8
