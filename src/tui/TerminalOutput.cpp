// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <cstring>
#include <format>
#include <utility>

#include <unistd.h>

#include <tui/TerminalOutput.hpp>

namespace mimic::tui
{

// --- SyncGuard ---

SyncGuard::SyncGuard(int fd): _fd(fd)
{
    static constexpr auto Begin = "\033[?2026h";
    static_cast<void>(::write(_fd, Begin, std::strlen(Begin)));
}

SyncGuard::~SyncGuard()
{
    static constexpr auto End = "\033[?2026l";
    static_cast<void>(::write(_fd, End, std::strlen(End)));
}

// --- Serialization ---

namespace
{
    void appendColor(std::string& out, Color const& color, int base)
    {
        if (auto const* idx = std::get_if<std::uint8_t>(&color))
            out += std::format(";{};5;{}", base, *idx);
        else if (auto const* rgb = std::get_if<RgbColor>(&color))
            out += std::format(";{};2;{};{};{}", base, rgb->r, rgb->g, rgb->b);
    }
} // namespace

auto sgrSequence(Style const& style) -> std::string
{
    if (style.isDefault())
        return {};

    // Always starts from a reset so that the sequence is independent of the previous cell.
    auto result = std::string { "\033[0" };
    if (style.bold)
        result += ";1";
    if (style.dim)
        result += ";2";
    if (style.italic)
        result += ";3";
    if (style.underline)
        result += ";4";
    if (style.inverse)
        result += ";7";
    appendColor(result, style.fg, 38);
    appendColor(result, style.bg, 48);
    result += 'm';
    return result;
}

auto serializeRow(Grid const& grid, int row) -> std::string
{
    auto result = std::string {};
    auto current = Style {};

    for (auto column = 0; column < grid.columns(); ++column)
    {
        auto const& cell = grid.cell(row, column);
        if (cell.continuation)
            continue;
        if (cell.style != current)
        {
            result += cell.style.isDefault() ? std::string { "\033[0m" } : sgrSequence(cell.style);
            current = cell.style;
        }
        result += cell.text;
    }
    if (!current.isDefault())
        result += "\033[0m";
    return result;
}

auto serializeGrid(Grid const& grid) -> std::string
{
    auto result = std::string { "\033[?25l" };
    for (auto row = 0; row < grid.rows(); ++row)
    {
        result += std::format("\033[{};1H", row + 1);
        result += serializeRow(grid, row);
    }
    if (auto const& cursor = grid.cursor(); cursor)
        result += std::format("\033[{};{}H\033[?25h", cursor->row + 1, cursor->column + 1);
    return result;
}

// --- TerminalOutput ---

auto TerminalOutput::initialize() -> VoidResult
{
    if (!isatty(STDOUT_FILENO))
        return makeError(ErrorCode::TerminalError, "stdout is not a terminal");
    updateDimensions();
    return {};
}

void TerminalOutput::moveTo(int row, int col)
{
    _buffer += std::format("\033[{};{}H", row, col);
}

void TerminalOutput::clearScreen()
{
    _buffer += "\033[2J\033[H";
    invalidate();
}

void TerminalOutput::enterAltScreen()
{
    _buffer += "\033[?1049h";
    invalidate();
}

void TerminalOutput::leaveAltScreen()
{
    _buffer += "\033[?1049l";
}

auto TerminalOutput::syncGuard() -> SyncGuard
{
    flush(); // Flush any pending output before entering sync mode
    return SyncGuard(STDOUT_FILENO);
}

void TerminalOutput::showCursor()
{
    _buffer += "\033[?25h";
}

void TerminalOutput::hideCursor()
{
    _buffer += "\033[?25l";
}

void TerminalOutput::present(Grid const& grid)
{
    // Rows never contain a newline, so it marks rows that must be redrawn.
    if (_previousRows.size() != static_cast<std::size_t>(grid.rows()))
        _previousRows.assign(static_cast<std::size_t>(grid.rows()), std::string { "\n" });

    hideCursor();
    for (auto row = 0; row < grid.rows(); ++row)
    {
        auto line = serializeRow(grid, row);
        auto& previous = _previousRows[static_cast<std::size_t>(row)];
        if (line == previous)
            continue;
        moveTo(row + 1, 1);
        _buffer += "\033[2K";
        _buffer += line;
        previous = std::move(line);
    }

    if (auto const& cursor = grid.cursor(); cursor)
    {
        moveTo(cursor->row + 1, cursor->column + 1);
        showCursor();
    }
}

void TerminalOutput::flush()
{
    if (!_buffer.empty())
    {
        static_cast<void>(::write(STDOUT_FILENO, _buffer.data(), _buffer.size()));
        _buffer.clear();
    }
}

auto TerminalOutput::columns() const noexcept -> int
{
    return _cols;
}

auto TerminalOutput::rows() const noexcept -> int
{
    return _rows;
}

void TerminalOutput::updateDimensions()
{
    auto ws = winsize {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0)
    {
        _cols = ws.ws_col;
        _rows = ws.ws_row;
    }
}

} // namespace mimic::tui
