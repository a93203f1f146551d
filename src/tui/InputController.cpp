// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <core/Utf8.hpp>
#include <tui/InputController.hpp>

#include <utility>

namespace mimic::tui
{

namespace
{
    constexpr auto PermissionOptionCount = std::size_t { 3 };

    auto isPlain(KeyEvent const& key) noexcept -> bool
    {
        return key.modifiers == Modifier::None || key.modifiers == Modifier::Shift;
    }

    auto isTyped(KeyEvent const& key, char32_t ch) noexcept -> bool
    {
        return key.key == static_cast<KeyCode>(ch) && isPlain(key);
    }

    auto digitOf(KeyEvent const& key) noexcept -> std::optional<std::size_t>
    {
        if (!isPlain(key))
            return std::nullopt;
        auto const value = static_cast<std::uint32_t>(key.key);
        if (value >= U'1' && value <= U'9')
            return value - U'1';
        return std::nullopt;
    }

    auto decisionAt(std::size_t index) noexcept -> PermissionDecision
    {
        switch (index)
        {
            case 0: return PermissionDecision::Allow;
            case 1: return PermissionDecision::AllowAlways;
            default: return PermissionDecision::Deny;
        }
    }
} // namespace

auto InputController::handleKey(KeyEvent const& key, Millis now) -> std::vector<Command>
{
    auto commands = Commands {};

    if (is<SuspendedMode>())
        return commands;

    // Every keystroke consumes the pending hint; the handlers re-arm it.
    auto const hint = std::exchange(_exitHint, std::nullopt);

    if (key.isCtrl(U'z'))
    {
        suspend();
        commands.emplace_back(SuspendCommand {});
        return commands;
    }

    if (key.is(KeyCode::Tab, Modifier::Shift))
    {
        commands.emplace_back(CyclePermissionCommand {});
        return commands;
    }

    if (is<PermissionDialogMode>())
    {
        handlePermissionKey(key, commands);
        return commands;
    }

    if (is<ModelPickerMode>())
    {
        handleModelPickerKey(key, commands);
        return commands;
    }

    if (is<ThinkingToggleMode>())
    {
        handleThinkingKey(key, commands);
        return commands;
    }

    if (is<ShortcutsPanelMode>())
    {
        if (key.is(KeyCode::Escape))
        {
            _mode = NormalMode {};
            return commands;
        }
        if (isTyped(key, U'?'))
        {
            _mode = NormalMode {};
            commands.emplace_back(TogglePanelCommand {});
            return commands;
        }
        // Any other key closes the panel and is handled as usual.
        _mode = NormalMode {};
    }

    if (handleSlashMenuKey(key, now))
        return commands;

    auto const before = std::string(_input.text());
    handleLineKey(key, now, hint, commands);
    if (_input.text() != before)
        updateSlashMenu();
    return commands;
}

void InputController::handleLineKey(KeyEvent const& key,
                                    Millis now,
                                    std::optional<ExitHint> hint,
                                    Commands& out)
{
    auto const shell = is<ShellEntryMode>();

    if (key.is(KeyCode::Escape))
        return handleEscape(now, hint, out);

    if (key.isCtrl(U'c'))
        return handleInterrupt(now, hint, out);

    if (key.isCtrl(U'd'))
        return handleEndOfInput(now, hint, out);

    if (key.isCtrl(U'l'))
    {
        out.emplace_back(ClearScreenCommand {});
        return;
    }

    if (key.isAlt(U't') && is<NormalMode>())
    {
        _mode = ThinkingToggleMode { .selected = _thinkingEnabled ? std::size_t { 0 } : std::size_t { 1 } };
        return;
    }

    if (key.isAlt(U'p') && is<NormalMode>())
    {
        _mode = ModelPickerMode { .selected = _modelIndex };
        return;
    }

    if (key.is(KeyCode::Enter))
        return handleEnter(out);

    if (key.is(KeyCode::Enter, Modifier::Shift) || key.is(KeyCode::Enter, Modifier::Alt))
    {
        _input.insert("\n");
        return;
    }

    if (key.key == KeyCode::Backspace)
    {
        if (_input.cursor() > 0)
            _input.deleteBackward();
        else if (shell && _input.empty())
            _mode = NormalMode {};
        return;
    }

    if (key.key == KeyCode::Delete)
        return _input.deleteForward();
    if (key.key == KeyCode::Left)
        return _input.moveLeft();
    if (key.key == KeyCode::Right)
        return _input.moveRight();
    if (key.key == KeyCode::Home || key.isCtrl(U'a'))
        return _input.moveHome();
    if (key.key == KeyCode::End || key.isCtrl(U'e'))
        return _input.moveEnd();
    if (key.key == KeyCode::Up)
        return handleHistory(true);
    if (key.key == KeyCode::Down)
        return handleHistory(false);
    if (key.isCtrl(U'u'))
        return _input.killToStart();
    if (key.isCtrl(U'k'))
        return _input.killToEnd();
    if (key.isCtrl(U'w'))
        return _input.killWordBackward();
    if (key.isCtrl(U'y'))
        return _input.yank();
    if (key.isCtrl(U'_') || key.isCtrl(U'/'))
    {
        _input.undo();
        return;
    }

    if (key.isCtrl(U's'))
    {
        if (_input.swapStash())
            log::debug("Stash {}", _input.stash() ? "saved" : "restored");
        return;
    }

    if (isTyped(key, U'!') && is<NormalMode>() && _input.empty())
    {
        _mode = ShellEntryMode {};
        return;
    }

    if (isTyped(key, U'?') && is<NormalMode>() && _input.empty())
    {
        _mode = ShortcutsPanelMode {};
        out.emplace_back(TogglePanelCommand {});
        return;
    }

    if (isPlain(key) && isPrintable(key.key))
    {
        _input.insert(utf8::encode(static_cast<char32_t>(key.key)));
        return;
    }

    log::trace("Ignoring key {} in {} mode", describeKey(key), modeName(_mode));
}

void InputController::handleEscape(Millis now, std::optional<ExitHint> hint, Commands& out)
{
    if (is<ThinkingWaitMode>())
    {
        out.emplace_back(InterruptCommand {});
        responseInterrupted();
        return;
    }

    if (is<ShellEntryMode>())
    {
        _input.clear();
        _mode = NormalMode {};
        return;
    }

    if (_input.empty())
        return;

    if (withinWindow(hint, ExitHintKind::Escape, now))
    {
        _input.clear();
        return;
    }

    _exitHint = ExitHint { .kind = ExitHintKind::Escape, .shownAt = now };
}

void InputController::handleInterrupt(Millis now, std::optional<ExitHint> hint, Commands& out)
{
    if (is<ThinkingWaitMode>())
    {
        out.emplace_back(InterruptCommand {});
        responseInterrupted();
        return;
    }

    if (withinWindow(hint, ExitHintKind::CtrlC, now))
    {
        out.emplace_back(ExitCommand {});
        return;
    }

    _input.clear();
    _exitHint = ExitHint { .kind = ExitHintKind::CtrlC, .shownAt = now };
}

void InputController::handleEndOfInput(Millis now, std::optional<ExitHint> hint, Commands& out)
{
    if (is<ThinkingWaitMode>() || !_input.empty())
        return;

    if (withinWindow(hint, ExitHintKind::CtrlD, now))
    {
        out.emplace_back(ExitCommand {});
        return;
    }

    _exitHint = ExitHint { .kind = ExitHintKind::CtrlD, .shownAt = now };
}

void InputController::handleEnter(Commands& out)
{
    auto const text = std::string(_input.text());

    // A trailing backslash continues the line instead of submitting.
    if (!text.empty() && text.back() == '\\' && _input.cursor() == text.size())
    {
        _input.deleteBackward();
        _input.insert("\n");
        return;
    }

    if (is<ShellEntryMode>())
    {
        if (text.empty())
            return;
        _input.pushHistory(std::string(ShellHistoryPrefix) + text);
        _input.load({});
        _mode = NormalMode {};
        out.emplace_back(ExecuteShellCommand { .command = text });
        return;
    }

    if (text.empty())
        return;

    // A shell entry recalled verbatim while waiting runs as a shell command, not a prompt.
    if (is<ThinkingWaitMode>() && _input.historyCursor() && text.starts_with(ShellHistoryPrefix)
        && text.size() > ShellHistoryPrefix.size())
    {
        _input.pushHistory(text);
        _input.load({});
        out.emplace_back(ExecuteShellCommand { .command = text.substr(ShellHistoryPrefix.size()) });
        return;
    }

    _input.pushHistory(text);
    _input.load({});
    if (is<NormalMode>())
        _mode = ThinkingWaitMode {};
    out.emplace_back(SubmitCommand { .text = text });
}

void InputController::handleHistory(bool backwards)
{
    if (backwards)
    {
        if (!_input.empty() && !_input.historyCursor())
            return;
        if (auto const entry = _input.historyPrevious(); entry)
            loadHistoryEntry(*entry);
        return;
    }

    auto const entry = _input.historyNext();
    if (!entry)
        return;

    if (entry->empty())
    {
        _input.load({});
        if (is<ShellEntryMode>())
            _mode = NormalMode {};
        return;
    }
    loadHistoryEntry(*entry);
}

void InputController::loadHistoryEntry(std::string const& entry)
{
    // While waiting for a response the mode cannot change, so shell entries load verbatim.
    if (is<ThinkingWaitMode>())
        return _input.load(entry);

    if (entry.starts_with(ShellHistoryPrefix))
    {
        _input.load(entry.substr(ShellHistoryPrefix.size()));
        _mode = ShellEntryMode {};
        return;
    }

    _input.load(entry);
    _mode = NormalMode {};
}

void InputController::handlePermissionKey(KeyEvent const& key, Commands& out)
{
    auto& dialog = std::get<PermissionDialogMode>(_mode);

    if (key.is(KeyCode::Escape) || key.isCtrl(U'c'))
        return resolvePermission(PermissionDecision::Deny, out);

    if (key.is(KeyCode::Up))
    {
        if (dialog.selected > 0)
            --dialog.selected;
        return;
    }

    if (key.is(KeyCode::Down))
    {
        if (dialog.selected + 1 < PermissionOptionCount)
            ++dialog.selected;
        return;
    }

    if (key.is(KeyCode::Enter))
        return resolvePermission(decisionAt(dialog.selected), out);

    if (auto const digit = digitOf(key); digit && *digit < PermissionOptionCount)
        return resolvePermission(decisionAt(*digit), out);
}

void InputController::resolvePermission(PermissionDecision decision, Commands& out)
{
    _mode = ThinkingWaitMode {};
    out.emplace_back(ResolvePermissionCommand { .decision = decision });
}

void InputController::handleModelPickerKey(KeyEvent const& key, Commands& out)
{
    auto& picker = std::get<ModelPickerMode>(_mode);
    auto const count = ModelChoices.size();

    if (key.is(KeyCode::Escape) || key.isCtrl(U'c'))
    {
        _mode = NormalMode {};
        return;
    }

    if (key.is(KeyCode::Up))
    {
        picker.selected = (picker.selected + count - 1) % count;
        return;
    }

    if (key.is(KeyCode::Down))
    {
        picker.selected = (picker.selected + 1) % count;
        return;
    }

    auto chosen = std::optional<std::size_t> {};
    if (key.is(KeyCode::Enter))
        chosen = picker.selected;
    else if (auto const digit = digitOf(key); digit && *digit < count)
        chosen = *digit;

    if (!chosen)
        return;

    _modelIndex = *chosen;
    _mode = NormalMode {};
    out.emplace_back(SelectModelCommand { .id = std::string(ModelChoices[*chosen].id) });
}

void InputController::chooseThinking(bool enabled, Commands& out)
{
    _thinkingEnabled = enabled;
    _mode = NormalMode {};
    out.emplace_back(SetThinkingCommand { .enabled = enabled });
}

void InputController::handleThinkingKey(KeyEvent const& key, Commands& out)
{
    auto& dialog = std::get<ThinkingToggleMode>(_mode);

    if (key.is(KeyCode::Escape) || key.isCtrl(U'c'))
    {
        _mode = NormalMode {};
        return;
    }

    if (key.is(KeyCode::Up) || key.is(KeyCode::Down) || key.is(KeyCode::Tab))
    {
        dialog.selected = dialog.selected == 0 ? 1 : 0;
        return;
    }

    if (key.is(KeyCode::Enter))
        return chooseThinking(dialog.selected == 0, out);

    if (auto const digit = digitOf(key); digit && *digit < 2)
        return chooseThinking(*digit == 0, out);
}

auto InputController::handleSlashMenuKey(KeyEvent const& key, Millis now) -> bool
{
    if (!_slashMenu || !is<NormalMode>())
        return false;

    if (key.is(KeyCode::Down))
    {
        _slashMenu->selectNext();
        return true;
    }

    if (key.is(KeyCode::Up))
    {
        _slashMenu->selectPrevious();
        return true;
    }

    if (key.is(KeyCode::Tab))
    {
        if (auto const command = _slashMenu->selectedCommand(); command)
            _input.load(command->fullName());
        _slashMenu.reset();
        return true;
    }

    if (key.is(KeyCode::Escape))
    {
        // Closing the menu keeps the text; a second Escape clears it.
        _slashMenu.reset();
        _exitHint = ExitHint { .kind = ExitHintKind::Escape, .shownAt = now };
        return true;
    }

    return false;
}

void InputController::updateSlashMenu()
{
    auto const text = _input.text();
    if (!is<NormalMode>() || _input.historyCursor() || !text.starts_with('/'))
    {
        _slashMenu.reset();
        return;
    }

    if (_slashMenu)
        _slashMenu->setFilter(text.substr(1));
    else
        _slashMenu.emplace(text.substr(1));
}

void InputController::handlePaste(std::string_view text)
{
    if (!is<NormalMode>() && !is<ShellEntryMode>() && !is<ThinkingWaitMode>())
        return;
    _input.insert(text);
    updateSlashMenu();
}

auto InputController::expireHints(Millis now) -> bool
{
    if (!_exitHint || now - _exitHint->shownAt < _exitHintTimeout)
        return false;
    _exitHint.reset();
    return true;
}

void InputController::setModel(std::string_view modelId)
{
    _modelIndex = modelChoiceIndex(modelId);
}

void InputController::beginResponse()
{
    if (is<NormalMode>() || is<ShellEntryMode>())
        _mode = ThinkingWaitMode {};
}

void InputController::openPermissionDialog(PermissionDialogMode dialog)
{
    _mode = std::move(dialog);
}

void InputController::leaveResponse()
{
    if (is<ThinkingWaitMode>() || is<PermissionDialogMode>())
        _mode = NormalMode {};
    else if (is<SuspendedMode>())
        _resumeMode = NormalMode {};
}

void InputController::responseFinished()
{
    leaveResponse();
    _input.restoreStash();
}

void InputController::responseInterrupted()
{
    leaveResponse();
}

void InputController::suspend()
{
    if (is<SuspendedMode>())
        return;
    _resumeMode = _mode;
    _mode = SuspendedMode {};
    _exitHint.reset();
}

void InputController::resume()
{
    if (!is<SuspendedMode>())
        return;
    if (std::holds_alternative<ThinkingWaitMode>(_resumeMode)
        || std::holds_alternative<PermissionDialogMode>(_resumeMode))
        _resumeMode = NormalMode {};
    _mode = std::exchange(_resumeMode, NormalMode {});
}

auto InputController::withinWindow(std::optional<ExitHint> const& hint, ExitHintKind kind, Millis now) const
    -> bool
{
    return hint && hint->kind == kind && now - hint->shownAt < _exitHintTimeout;
}

} // namespace mimic::tui
