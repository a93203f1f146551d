// SPDX-License-Identifier: Apache-2.0
#include <core/Utf8.hpp>
#include <tui/Grid.hpp>

#include <algorithm>
#include <stdexcept>

namespace mimic::tui
{

Grid::Grid(int columns, int rows):
    _columns(std::max(columns, 1)),
    _rows(std::max(rows, 1)),
    _cells(static_cast<std::size_t>(_columns) * static_cast<std::size_t>(_rows))
{
}

auto Grid::cell(int row, int column) const -> Cell const&
{
    if (row < 0 || row >= _rows || column < 0 || column >= _columns)
        throw std::out_of_range("Grid::cell");
    return _cells[static_cast<std::size_t>(row * _columns + column)];
}

auto Grid::at(int row, int column) -> Cell&
{
    return _cells[static_cast<std::size_t>(row * _columns + column)];
}

void Grid::place(int row, int column, std::string_view grapheme, int width, Style const& style)
{
    auto& target = at(row, column);

    // Overwriting half of a wide character blanks the other half.
    if (target.continuation && column > 0)
        at(row, column - 1) = Cell { .style = at(row, column - 1).style };
    auto const tail = column + width;
    if (tail < _columns && at(row, tail).continuation)
        at(row, tail) = Cell { .style = at(row, tail).style };

    target = Cell { .text = std::string(grapheme), .style = style };
    if (width == 2)
        at(row, column + 1) = Cell { .text = {}, .style = style, .continuation = true };
}

auto Grid::write(int row, int column, std::string_view text, Style const& style) -> int
{
    if (row < 0 || row >= _rows)
        return column;

    for (auto const cluster: utf8::graphemes(text))
    {
        if (column >= _columns)
            break;

        auto const lead = static_cast<unsigned char>(cluster.front());
        if (lead == '\t')
        {
            if (column >= 0)
                place(row, column, " ", 1, style);
            ++column;
            continue;
        }
        if (lead < 0x20 || lead == 0x7F)
            continue;

        auto const width = utf8::clusterWidth(cluster);
        if (width == 0)
            continue;

        if (column >= 0)
        {
            if (column + width > _columns)
            {
                // A wide glyph that does not fit leaves a blank.
                place(row, column, " ", 1, style);
                column = _columns;
                break;
            }
            place(row, column, cluster, width, style);
        }
        column += width;
    }
    return column;
}

void Grid::fill(int row, int column, int count, std::string_view grapheme, Style const& style)
{
    for (auto i = 0; i < count && column < _columns; ++i)
        column = write(row, column, grapheme, style);
}

auto Grid::rowText(int row) const -> std::string
{
    auto result = std::string {};
    for (auto column = 0; column < _columns; ++column)
    {
        auto const& c = cell(row, column);
        if (!c.continuation)
            result += c.text;
    }
    auto const end = result.find_last_not_of(' ');
    result.erase(end == std::string::npos ? 0 : end + 1);
    return result;
}

auto Grid::toText() const -> std::string
{
    auto result = std::string {};
    for (auto row = 0; row < _rows; ++row)
    {
        if (row > 0)
            result += '\n';
        result += rowText(row);
    }
    return result;
}

} // namespace mimic::tui
