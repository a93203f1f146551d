// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <vector>

#include <termios.h>

#include <tui/InputEvent.hpp>
#include <tui/KeyDecoder.hpp>

namespace mimic::tui
{

/// @brief Signals forwarded from handlers into the input loop.
enum class SignalNote : char
{
    Resize = 'W',
    Stop = 'T',
    Continue = 'C',
};

/// @brief Handles raw terminal input, polling, and event production.
///
/// Manages raw mode, enables the Kitty keyboard protocol (disambiguate only)
/// and bracketed paste. Uses poll() for non-blocking reads with timeout.
/// Signals are handled via a self-pipe so handlers stay async-signal-safe.
class TerminalInput
{
  public:
    TerminalInput();
    ~TerminalInput();

    TerminalInput(TerminalInput const&) = delete;
    auto operator=(TerminalInput const&) -> TerminalInput& = delete;
    TerminalInput(TerminalInput&&) = delete;
    auto operator=(TerminalInput&&) -> TerminalInput& = delete;

    /// @brief Initializes raw mode and enables terminal protocols.
    /// @return Success, or a TerminalError when stdin is not a terminal.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Restores the original terminal state.
    void shutdown();

    /// @brief Leaves raw mode temporarily, e.g. before the process stops.
    void pause();

    /// @brief Re-enters raw mode after pause().
    void unpause();

    /// @brief Polls for input events with optional timeout.
    /// @param timeoutMs -1 = block indefinitely, 0 = non-blocking, >0 = timeout in milliseconds.
    /// @return Vector of parsed events (empty on timeout or no data).
    [[nodiscard]] auto poll(int timeoutMs = -1) -> std::vector<InputEvent>;

    /// @brief Wakes poll() with a signal note. Async-signal-safe.
    void notify(SignalNote note) const noexcept;

  private:
    KeyDecoder _decoder;
    int _fd = 0; // STDIN_FILENO
    struct termios _origTermios {};
    bool _rawMode = false;
    int _signalPipe[2] = { -1, -1 };

    void enableRawMode();
    void disableRawMode();
    void enableProtocols();
    void disableProtocols();
};

} // namespace mimic::tui
