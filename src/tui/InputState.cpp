// SPDX-License-Identifier: Apache-2.0
#include <algorithm>

#include <core/Utf8.hpp>
#include <tui/InputState.hpp>

namespace mimic::tui
{

namespace
{
    auto isSpace(char c) noexcept -> bool
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }
} // namespace

void InputState::snapshot(EditKind kind, bool force)
{
    // Runs of typing or deleting collapse into one undo step, split at word boundaries.
    if (!force && kind == _lastEdit)
        return;
    if (!_undo.empty() && _undo.back().buffer == _buffer)
    {
        _lastEdit = kind;
        return;
    }
    _undo.push_back(Snapshot { .buffer = _buffer, .cursor = _cursor });
    if (_undo.size() > MaxUndo)
        _undo.erase(_undo.begin());
    _lastEdit = kind;
}

void InputState::insert(std::string_view text)
{
    if (text.empty())
        return;
    snapshot(EditKind::Insert, _buffer.empty() || isSpace(text.front()));
    _buffer.insert(_cursor, text);
    _cursor += text.size();
    diverged();
}

void InputState::deleteBackward()
{
    if (_cursor == 0)
        return;
    snapshot(EditKind::Delete, false);
    auto const prev = utf8::prevGrapheme(_buffer, _cursor);
    _buffer.erase(prev, _cursor - prev);
    _cursor = prev;
    diverged();
}

void InputState::deleteForward()
{
    if (_cursor >= _buffer.size())
        return;
    snapshot(EditKind::Delete, false);
    auto const next = utf8::nextGrapheme(_buffer, _cursor);
    _buffer.erase(_cursor, next - _cursor);
    diverged();
}

void InputState::killToStart()
{
    if (_cursor == 0)
        return;
    snapshot(EditKind::None, true);
    _killBuffer = _buffer.substr(0, _cursor);
    _buffer.erase(0, _cursor);
    _cursor = 0;
    diverged();
}

void InputState::killToEnd()
{
    if (_cursor >= _buffer.size())
        return;
    snapshot(EditKind::None, true);
    _killBuffer = _buffer.substr(_cursor);
    _buffer.erase(_cursor);
    diverged();
}

void InputState::killWordBackward()
{
    if (_cursor == 0)
        return;
    snapshot(EditKind::None, true);
    auto start = _cursor;
    while (start > 0 && isSpace(_buffer[start - 1]))
        --start;
    while (start > 0 && !isSpace(_buffer[start - 1]))
        --start;
    _killBuffer = _buffer.substr(start, _cursor - start);
    _buffer.erase(start, _cursor - start);
    _cursor = start;
    diverged();
}

void InputState::yank()
{
    if (_killBuffer.empty())
        return;
    snapshot(EditKind::None, true);
    _buffer.insert(_cursor, _killBuffer);
    _cursor += _killBuffer.size();
    diverged();
}

void InputState::clear()
{
    if (!_buffer.empty())
        snapshot(EditKind::None, true);
    _buffer.clear();
    _cursor = 0;
    diverged();
}

auto InputState::undo() -> bool
{
    if (_undo.empty())
        return false;
    auto previous = std::move(_undo.back());
    _undo.pop_back();
    _buffer = std::move(previous.buffer);
    _cursor = std::min(previous.cursor, _buffer.size());
    _lastEdit = EditKind::None;
    diverged();
    return true;
}

void InputState::moveLeft()
{
    _cursor = utf8::prevGrapheme(_buffer, _cursor);
    _lastEdit = EditKind::None;
}

void InputState::moveRight()
{
    _cursor = utf8::nextGrapheme(_buffer, _cursor);
    _lastEdit = EditKind::None;
}

void InputState::load(std::string text)
{
    _buffer = std::move(text);
    _cursor = _buffer.size();
    _undo.clear();
    _lastEdit = EditKind::None;
}

void InputState::pushHistory(std::string entry)
{
    _historyCursor.reset();
    if (entry.empty())
        return;
    _history.push_back(std::move(entry));
    if (_history.size() > MaxHistory)
        _history.erase(_history.begin());
}

auto InputState::historyPrevious() -> std::optional<std::string>
{
    if (_history.empty())
        return std::nullopt;

    if (!_historyCursor)
        _historyCursor = _history.size() - 1;
    else if (*_historyCursor == 0)
        return std::nullopt;
    else
        --*_historyCursor;
    return _history[*_historyCursor];
}

auto InputState::historyNext() -> std::optional<std::string>
{
    if (!_historyCursor)
        return std::nullopt;
    if (*_historyCursor + 1 >= _history.size())
    {
        _historyCursor.reset();
        return std::string {};
    }
    ++*_historyCursor;
    return _history[*_historyCursor];
}

auto InputState::swapStash() -> bool
{
    if (_buffer.empty() && !_stash)
        return false;

    auto previous = std::move(_stash);
    if (_buffer.empty())
        _stash.reset();
    else
        _stash = std::move(_buffer);

    load(previous.value_or(std::string {}));
    diverged();
    return true;
}

auto InputState::restoreStash() -> bool
{
    if (!_stash || !_buffer.empty())
        return false;
    load(std::move(*_stash));
    _stash.reset();
    diverged();
    return true;
}

} // namespace mimic::tui
