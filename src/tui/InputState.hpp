// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mimic::tui
{

/// @brief Marker that prefixes shell commands in history.
constexpr auto ShellHistoryPrefix = std::string_view { "!" };

/// @brief Pure-model line editor: buffer, cursor, history, stash and undo.
///
/// Holds no mode; the InputController decides which edit a key performs.
/// The cursor is a byte offset that always sits on a grapheme cluster
/// boundary. Any edit that changes the buffer stops history browsing, so the
/// history cursor is set only while the buffer still mirrors the browsed entry.
class InputState
{
  public:
    [[nodiscard]] auto text() const noexcept -> std::string_view { return _buffer; }
    [[nodiscard]] auto cursor() const noexcept -> std::size_t { return _cursor; }
    [[nodiscard]] auto empty() const noexcept -> bool { return _buffer.empty(); }

    // Editing. Each of these counts as a divergent edit.
    void insert(std::string_view text);
    void deleteBackward();
    void deleteForward();
    void killToStart();
    void killToEnd();
    void killWordBackward();
    void yank();
    void clear();

    /// @brief Restores the buffer as it was before the last edit group.
    /// @return false when there is nothing to undo.
    auto undo() -> bool;

    // Cursor movement; never changes the buffer.
    void moveLeft();
    void moveRight();
    void moveHome() noexcept { _cursor = 0; }
    void moveEnd() noexcept { _cursor = _buffer.size(); }

    /// @brief Replaces the buffer (cursor at end) without touching history or undo.
    void load(std::string text);

    // History
    void pushHistory(std::string entry);
    [[nodiscard]] auto history() const noexcept -> std::vector<std::string> const& { return _history; }
    [[nodiscard]] auto historyCursor() const noexcept -> std::optional<std::size_t> { return _historyCursor; }

    /// @brief Moves the history cursor one entry back and returns that entry.
    ///
    /// Starts from the newest entry when not browsing. The caller mirrors the
    /// entry into the buffer with load(), which keeps the history cursor.
    [[nodiscard]] auto historyPrevious() -> std::optional<std::string>;

    /// @brief Moves the history cursor one entry forward.
    /// @return The entry, an empty string after stepping past the newest entry
    ///         (browsing ends), or nullopt when not browsing.
    [[nodiscard]] auto historyNext() -> std::optional<std::string>;

    // Stash
    [[nodiscard]] auto stash() const noexcept -> std::optional<std::string> const& { return _stash; }

    /// @brief Swaps the buffer with the stash slot (empty and saved swap places).
    /// @return false when both are empty.
    auto swapStash() -> bool;

    /// @brief Moves a pending stash back into an empty buffer.
    auto restoreStash() -> bool;

  private:
    enum class EditKind : unsigned char
    {
        None,
        Insert,
        Delete,
    };

    struct Snapshot
    {
        std::string buffer;
        std::size_t cursor;
    };

    static constexpr std::size_t MaxUndo = 100;
    static constexpr std::size_t MaxHistory = 500;

    void snapshot(EditKind kind, bool force);
    void diverged() noexcept { _historyCursor.reset(); }

    std::string _buffer;
    std::size_t _cursor = 0;

    std::vector<std::string> _history;
    std::optional<std::size_t> _historyCursor;

    std::optional<std::string> _stash;
    std::string _killBuffer;

    std::vector<Snapshot> _undo;
    EditKind _lastEdit = EditKind::None;
};

} // namespace mimic::tui
