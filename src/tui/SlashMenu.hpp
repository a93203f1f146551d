// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mimic::tui
{

/// @brief One entry of the slash command autocomplete menu.
struct SlashCommandInfo
{
    std::string_view name;         ///< Without the leading '/'.
    std::string_view description;
    std::string_view argumentHint; ///< Shown after a completed command, e.g. "<path>". May be empty.

    [[nodiscard]] auto fullName() const -> std::string { return "/" + std::string(name); }
};

/// @brief All commands the menu offers, in alphabetical order.
[[nodiscard]] auto slashCommands() noexcept -> std::vector<SlashCommandInfo> const&;

/// @brief The command named exactly @p name (without '/'), if any.
[[nodiscard]] auto findSlashCommand(std::string_view name) -> std::optional<SlashCommandInfo>;

/// @brief Case-insensitive subsequence match: every character of @p query appears in @p text in order.
[[nodiscard]] auto fuzzyMatches(std::string_view query, std::string_view text) -> bool;

/// @brief The commands whose names fuzzy-match @p query, keeping alphabetical order.
[[nodiscard]] auto filterSlashCommands(std::string_view query) -> std::vector<SlashCommandInfo>;

/// @brief The autocomplete menu shown while the input starts with '/'.
class SlashMenu
{
  public:
    /// @brief Rows rendered at most; the selection may move past them.
    static constexpr auto VisibleRows = std::size_t { 10 };

    explicit SlashMenu(std::string_view filter = {}) { setFilter(filter); }

    /// @brief Refilters; the selection snaps back to the top when it falls out of range.
    void setFilter(std::string_view filter);

    /// @brief Moves the selection down, wrapping at the end.
    void selectNext() noexcept;

    /// @brief Moves the selection up, wrapping at the start.
    void selectPrevious() noexcept;

    [[nodiscard]] auto filter() const noexcept -> std::string const& { return _filter; }
    [[nodiscard]] auto entries() const noexcept -> std::vector<SlashCommandInfo> const& { return _entries; }
    [[nodiscard]] auto selected() const noexcept -> std::size_t { return _selected; }
    [[nodiscard]] auto selectedCommand() const -> std::optional<SlashCommandInfo>;

  private:
    std::string _filter;
    std::vector<SlashCommandInfo> _entries;
    std::size_t _selected = 0;
};

} // namespace mimic::tui
