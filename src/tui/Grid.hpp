// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/Style.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mimic::tui
{

/// @brief One character cell. A double-width grapheme occupies its cell plus
///        a continuation cell to the right.
struct Cell
{
    std::string text = " "; ///< One grapheme cluster.
    Style style;
    bool continuation = false;

    auto operator==(Cell const&) const -> bool = default;
};

/// @brief Zero-based cell coordinate.
struct CellPosition
{
    int row = 0;
    int column = 0;

    auto operator==(CellPosition const&) const -> bool = default;
};

/// @brief A fixed-size character grid with per-cell style.
///
/// Writing never wraps: text past the right edge is clipped, and writes
/// outside the grid are dropped.
class Grid
{
  public:
    Grid(int columns, int rows);

    [[nodiscard]] auto columns() const noexcept -> int { return _columns; }
    [[nodiscard]] auto rows() const noexcept -> int { return _rows; }

    [[nodiscard]] auto cell(int row, int column) const -> Cell const&;

    /// @brief Writes @p text starting at (@p row, @p column).
    /// @return The column after the last cell written.
    auto write(int row, int column, std::string_view text, Style const& style = {}) -> int;

    /// @brief Repeats @p grapheme @p count times starting at (@p row, @p column).
    void fill(int row, int column, int count, std::string_view grapheme, Style const& style = {});

    /// @brief Plain text of one row with trailing blanks removed.
    [[nodiscard]] auto rowText(int row) const -> std::string;

    /// @brief Plain text of the whole grid, one line per row.
    [[nodiscard]] auto toText() const -> std::string;

    /// @brief Where the terminal cursor is shown; nullopt hides it.
    [[nodiscard]] auto cursor() const noexcept -> std::optional<CellPosition> const& { return _cursor; }
    void setCursor(std::optional<CellPosition> position) noexcept { _cursor = position; }

    auto operator==(Grid const&) const -> bool = default;

  private:
    [[nodiscard]] auto at(int row, int column) -> Cell&;
    void place(int row, int column, std::string_view grapheme, int width, Style const& style);

    int _columns;
    int _rows;
    std::vector<Cell> _cells;
    std::optional<CellPosition> _cursor;
};

} // namespace mimic::tui
