// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <vector>

#include <tui/InputEvent.hpp>
#include <tui/TerminalInput.hpp>
#include <tui/TerminalOutput.hpp>

namespace mimic::tui
{

/// @brief Top-level terminal coordinator that owns both input and output subsystems.
///
/// Manages initialization order, cleanup, the alternate screen and the
/// SIGWINCH/SIGTSTP/SIGCONT handlers.
class Terminal
{
  public:
    Terminal();
    ~Terminal();

    Terminal(Terminal const&) = delete;
    auto operator=(Terminal const&) -> Terminal& = delete;
    Terminal(Terminal&&) = delete;
    auto operator=(Terminal&&) -> Terminal& = delete;

    /// @brief Enters raw mode and the alternate screen and installs the signal handlers.
    /// @return Success or a TerminalError.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Restores the terminal and the previous signal handlers.
    void shutdown();

    /// @brief Stops the process like a shell job would, restoring the terminal first.
    ///
    /// Returns once the process has been continued, with raw mode and the
    /// alternate screen re-entered.
    void stopProcess();

    [[nodiscard]] auto input() noexcept -> TerminalInput&;
    [[nodiscard]] auto output() noexcept -> TerminalOutput&;

    /// @brief Convenience: polls for input events with the given timeout.
    /// @param timeoutMs -1 = block, 0 = non-blocking, >0 = timeout in ms.
    [[nodiscard]] auto poll(int timeoutMs = -1) -> std::vector<InputEvent>;

    [[nodiscard]] auto columns() const noexcept -> int;
    [[nodiscard]] auto rows() const noexcept -> int;

  private:
    void enterScreen();
    void leaveScreen();

    TerminalInput _input;
    TerminalOutput _output;
    bool _initialized = false;
};

} // namespace mimic::tui
