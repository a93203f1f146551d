// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <tui/InputEvent.hpp>
#include <tui/InputState.hpp>
#include <tui/Mode.hpp>
#include <tui/SlashMenu.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mimic::tui
{

/// @brief The input/mode state machine.
///
/// Interprets normalized key events against the current mode, edits the
/// InputState, transitions the Mode and reports side effects as Commands.
/// It never touches the conversation or the scheduler: the Session executes
/// the returned Commands and reports back through responseFinished(),
/// openPermissionDialog() and the suspend/resume pair.
///
/// Key priority, first match wins:
///  - Ctrl+Z suspends and Shift+Tab cycles permissions in every mode.
///  - Modal modes (permission dialog, model picker, thinking toggle) consume
///    everything else.
///  - An open slash menu takes Up, Down, Tab and Escape.
///  - Escape dismisses the shortcuts panel, then leaves shell entry, then
///    arms or fires the clear-input hint.
///  - Ctrl+C and Ctrl+D arm or fire the exit hint.
///  - Everything else edits the line.
class InputController
{
  public:
    explicit InputController(Millis exitHintTimeout = Millis { 2000 }): _exitHintTimeout(exitHintTimeout) {}

    /// @brief Processes one key press.
    /// @return The commands the key produced, in execution order.
    [[nodiscard]] auto handleKey(KeyEvent const& key, Millis now) -> std::vector<Command>;

    /// @brief Inserts bracketed-paste text into the line, if the mode accepts editing.
    void handlePaste(std::string_view text);

    /// @brief Drops an exit hint whose window has elapsed.
    /// @return true if a hint was removed.
    auto expireHints(Millis now) -> bool;

    /// @brief Sets the model the picker marks as current.
    void setModel(std::string_view modelId);

    /// @brief Switches to ThinkingWait after a submit resolved into a schedule.
    void beginResponse();

    /// @brief Shows a permission dialog on top of ThinkingWait.
    void openPermissionDialog(PermissionDialogMode dialog);

    /// @brief Returns from ThinkingWait to line editing, restoring a pending stash.
    void responseFinished();

    /// @brief Returns from ThinkingWait to line editing after an interrupt. A pending stash stays stashed.
    void responseInterrupted();

    /// @brief Sets the thinking state the toggle dialog marks as current.
    void setThinking(bool enabled) noexcept { _thinkingEnabled = enabled; }

    /// @brief Enters Suspended, remembering the mode to return to.
    void suspend();

    /// @brief Leaves Suspended. A response wait cut short by the suspension comes back as Normal.
    void resume();

    [[nodiscard]] auto mode() const noexcept -> Mode const& { return _mode; }
    [[nodiscard]] auto input() const noexcept -> InputState const& { return _input; }
    [[nodiscard]] auto input() noexcept -> InputState& { return _input; }
    [[nodiscard]] auto exitHint() const noexcept -> std::optional<ExitHint> const& { return _exitHint; }
    [[nodiscard]] auto modelIndex() const noexcept -> std::size_t { return _modelIndex; }
    [[nodiscard]] auto thinkingEnabled() const noexcept -> bool { return _thinkingEnabled; }
    [[nodiscard]] auto slashMenu() const noexcept -> std::optional<SlashMenu> const& { return _slashMenu; }

    template <typename T>
    [[nodiscard]] auto is() const noexcept -> bool
    {
        return std::holds_alternative<T>(_mode);
    }

  private:
    using Commands = std::vector<Command>;

    void handleLineKey(KeyEvent const& key, Millis now, std::optional<ExitHint> hint, Commands& out);
    void handlePermissionKey(KeyEvent const& key, Commands& out);
    void handleModelPickerKey(KeyEvent const& key, Commands& out);
    void handleThinkingKey(KeyEvent const& key, Commands& out);
    [[nodiscard]] auto handleSlashMenuKey(KeyEvent const& key, Millis now) -> bool;
    void updateSlashMenu();

    void handleEscape(Millis now, std::optional<ExitHint> hint, Commands& out);
    void handleInterrupt(Millis now, std::optional<ExitHint> hint, Commands& out);
    void handleEndOfInput(Millis now, std::optional<ExitHint> hint, Commands& out);
    void handleEnter(Commands& out);
    void handleHistory(bool backwards);
    void loadHistoryEntry(std::string const& entry);
    void resolvePermission(PermissionDecision decision, Commands& out);
    void chooseThinking(bool enabled, Commands& out);
    void leaveResponse();

    [[nodiscard]] auto withinWindow(std::optional<ExitHint> const& hint, ExitHintKind kind, Millis now) const
        -> bool;

    Millis _exitHintTimeout;
    InputState _input;
    Mode _mode = NormalMode {};
    Mode _resumeMode = NormalMode {};
    std::optional<ExitHint> _exitHint;
    std::size_t _modelIndex = 0;
    bool _thinkingEnabled = true;
    std::optional<SlashMenu> _slashMenu;
};

} // namespace mimic::tui
