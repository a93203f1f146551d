// SPDX-License-Identifier: Apache-2.0
#include <csignal>

#include <unistd.h>

#include <core/Log.hpp>
#include <tui/Terminal.hpp>

namespace mimic::tui
{

namespace
{
    // Global pointer for the signal handlers to notify the TerminalInput instance.
    // Only one Terminal instance should be active at a time.
    TerminalInput* gActiveInput = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigwinch {};     // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigtstp {};      // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigcont {};      // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void signalHandler(int sig)
    {
        if (gActiveInput == nullptr)
            return;
        switch (sig)
        {
            case SIGWINCH: gActiveInput->notify(SignalNote::Resize); break;
            case SIGTSTP: gActiveInput->notify(SignalNote::Stop); break;
            case SIGCONT: gActiveInput->notify(SignalNote::Continue); break;
            default: break;
        }
    }

    void install(int sig, struct sigaction* previous)
    {
        struct sigaction sa {};
        sa.sa_handler = signalHandler;
        sa.sa_flags = SA_RESTART;
        sigemptyset(&sa.sa_mask);
        sigaction(sig, &sa, previous);
    }
} // namespace

Terminal::Terminal() = default;

Terminal::~Terminal()
{
    shutdown();
}

auto Terminal::initialize() -> VoidResult
{
    if (_initialized)
        return {};

    // Initialize output first (queries dimensions)
    if (auto result = _output.initialize(); !result)
        return result;

    // Initialize input (raw mode, protocols)
    if (auto result = _input.initialize(); !result)
        return result;

    gActiveInput = &_input;
    install(SIGWINCH, &gPrevSigwinch);
    install(SIGTSTP, &gPrevSigtstp);
    install(SIGCONT, &gPrevSigcont);

    enterScreen();
    _initialized = true;
    return {};
}

void Terminal::shutdown()
{
    if (!_initialized)
        return;

    sigaction(SIGWINCH, &gPrevSigwinch, nullptr);
    sigaction(SIGTSTP, &gPrevSigtstp, nullptr);
    sigaction(SIGCONT, &gPrevSigcont, nullptr);
    gActiveInput = nullptr;

    leaveScreen();
    _input.shutdown();
    _initialized = false;
}

void Terminal::stopProcess()
{
    if (!_initialized)
        return;

    leaveScreen();
    _input.pause();

    // Stop for real with the default disposition, then take SIGTSTP back.
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    sigaction(SIGTSTP, &dfl, nullptr);
    log::info("Stopping process");
    raise(SIGTSTP);
    install(SIGTSTP, nullptr);
    log::info("Process continued");

    _input.unpause();
    _output.updateDimensions();
    enterScreen();
}

void Terminal::enterScreen()
{
    _output.enterAltScreen();
    _output.clearScreen();
    _output.flush();
}

void Terminal::leaveScreen()
{
    _output.showCursor();
    _output.leaveAltScreen();
    _output.flush();
}

auto Terminal::input() noexcept -> TerminalInput&
{
    return _input;
}

auto Terminal::output() noexcept -> TerminalOutput&
{
    return _output;
}

auto Terminal::poll(int timeoutMs) -> std::vector<InputEvent>
{
    return _input.poll(timeoutMs);
}

auto Terminal::columns() const noexcept -> int
{
    return _output.columns();
}

auto Terminal::rows() const noexcept -> int
{
    return _output.rows();
}

} // namespace mimic::tui
