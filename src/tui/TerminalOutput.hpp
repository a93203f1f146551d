// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <tui/Grid.hpp>
#include <tui/Style.hpp>

#include <string>
#include <vector>

namespace mimic::tui
{

/// @brief RAII guard for synchronized terminal output.
///
/// Uses CSI ?2026h/l (synchronized output mode) to prevent tearing.
/// The constructor writes the begin sequence, the destructor writes the end sequence
/// and flushes.
class SyncGuard
{
  public:
    /// @brief Begins synchronized output mode.
    /// @param fd File descriptor to write to (typically STDOUT_FILENO).
    explicit SyncGuard(int fd);

    /// @brief Ends synchronized output mode and flushes.
    ~SyncGuard();

    SyncGuard(SyncGuard const&) = delete;
    auto operator=(SyncGuard const&) -> SyncGuard& = delete;
    SyncGuard(SyncGuard&&) = delete;
    auto operator=(SyncGuard&&) -> SyncGuard& = delete;

  private:
    int _fd;
};

/// @brief SGR sequence selecting @p style from a reset state, or empty for the default style.
[[nodiscard]] auto sgrSequence(Style const& style) -> std::string;

/// @brief Serializes one grid row: styled cells, then a trailing SGR reset if any style was used.
[[nodiscard]] auto serializeRow(Grid const& grid, int row) -> std::string;

/// @brief Serializes a whole grid as an absolute-positioned frame, including the cursor.
[[nodiscard]] auto serializeGrid(Grid const& grid) -> std::string;

/// @brief Writes rendered grids to the terminal.
///
/// Buffers output internally and flushes on demand. Frames are presented
/// row by row; rows unchanged since the previous frame are skipped.
class TerminalOutput
{
  public:
    /// @brief Initializes the terminal output by querying terminal dimensions.
    /// @return Success or IoError.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Moves the cursor to an absolute position.
    /// @param row Row (1-based).
    /// @param col Column (1-based).
    void moveTo(int row, int col);

    /// @brief Clears the entire screen and forgets the previous frame.
    void clearScreen();

    void enterAltScreen();
    void leaveAltScreen();

    /// @brief Creates a synchronized output guard.
    [[nodiscard]] auto syncGuard() -> SyncGuard;

    void showCursor();
    void hideCursor();

    /// @brief Draws @p grid, rewriting only rows that changed since the last frame.
    void present(Grid const& grid);

    /// @brief Forces the next present() to redraw every row.
    void invalidate() { _previousRows.clear(); }

    /// @brief Flushes the internal buffer to stdout.
    void flush();

    /// @brief Returns the terminal width in columns.
    [[nodiscard]] auto columns() const noexcept -> int;

    /// @brief Returns the terminal height in rows.
    [[nodiscard]] auto rows() const noexcept -> int;

    /// @brief Updates the cached terminal dimensions.
    void updateDimensions();

  private:
    std::string _buffer; ///< Output buffer for batching writes.
    std::vector<std::string> _previousRows;
    int _cols = 80;
    int _rows = 24;
};

} // namespace mimic::tui
