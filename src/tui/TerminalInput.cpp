// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <core/Log.hpp>
#include <tui/TerminalInput.hpp>

namespace mimic::tui
{

namespace
{
    // Kitty keyboard protocol flag 1 (disambiguate escape codes): Escape, Alt and
    // Ctrl combinations arrive as CSI-u while plain text stays plain.
    constexpr auto EnableCsiU = "\033[>1u";
    constexpr auto DisableCsiU = "\033[<u";
    constexpr auto EnableBracketedPaste = "\033[?2004h";
    constexpr auto DisableBracketedPaste = "\033[?2004l";

    void writeSequence(char const* sequence)
    {
        static_cast<void>(write(STDOUT_FILENO, sequence, std::strlen(sequence)));
    }
} // namespace

TerminalInput::TerminalInput() = default;

TerminalInput::~TerminalInput()
{
    shutdown();
}

auto TerminalInput::initialize() -> VoidResult
{
    _fd = STDIN_FILENO;

    if (!isatty(_fd))
        return makeError(ErrorCode::TerminalError, "stdin is not a terminal");

    if (pipe(_signalPipe) == -1)
        return makeError(ErrorCode::IoError, std::format("Failed to create signal pipe: {}", std::strerror(errno)));

    for (auto const fd: _signalPipe)
    {
        auto const flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    enableRawMode();
    enableProtocols();

    return {};
}

void TerminalInput::shutdown()
{
    if (_rawMode)
    {
        disableProtocols();
        disableRawMode();
    }

    if (_signalPipe[0] != -1)
    {
        close(_signalPipe[0]);
        close(_signalPipe[1]);
        _signalPipe[0] = -1;
        _signalPipe[1] = -1;
    }
}

void TerminalInput::pause()
{
    if (!_rawMode)
        return;
    disableProtocols();
    disableRawMode();
}

void TerminalInput::unpause()
{
    if (_rawMode)
        return;
    enableRawMode();
    enableProtocols();
}

auto TerminalInput::poll(int timeoutMs) -> std::vector<InputEvent>
{
    auto fds = std::array<struct pollfd, 2> {};
    fds[0] = { .fd = _fd, .events = POLLIN, .revents = 0 };
    fds[1] = { .fd = _signalPipe[0], .events = POLLIN, .revents = 0 };

    auto const nfds = (_signalPipe[0] != -1) ? 2 : 1;
    auto const pollResult = ::poll(fds.data(), static_cast<nfds_t>(nfds), timeoutMs);

    if (pollResult <= 0)
    {
        // Timeout resolves a pending bare ESC; EINTR just returns.
        if (pollResult == 0)
            return _decoder.timeout();
        return {};
    }

    auto events = std::vector<InputEvent> {};

    if (nfds >= 2 && (fds[1].revents & POLLIN) != 0)
    {
        auto resized = false;
        auto note = char {};
        while (read(_signalPipe[0], &note, 1) > 0)
        {
            switch (static_cast<SignalNote>(note))
            {
                case SignalNote::Stop: events.emplace_back(SuspendEvent {}); break;
                case SignalNote::Resize:
                case SignalNote::Continue: resized = true; break;
            }
        }

        auto ws = winsize {};
        if (resized && ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0)
            events.emplace_back(ResizeEvent { .columns = ws.ws_col, .rows = ws.ws_row });
    }

    if ((fds[0].revents & POLLIN) != 0)
    {
        auto buf = std::array<char, 512> {};
        auto const n = read(_fd, buf.data(), buf.size());
        if (n > 0)
        {
            auto decoded = _decoder.feed(std::string_view(buf.data(), static_cast<size_t>(n)));
            events.insert(
                events.end(), std::make_move_iterator(decoded.begin()), std::make_move_iterator(decoded.end()));
        }
    }

    return events;
}

void TerminalInput::notify(SignalNote note) const noexcept
{
    if (_signalPipe[1] != -1)
    {
        auto const byte = static_cast<char>(note);
        auto const result = write(_signalPipe[1], &byte, 1);
        static_cast<void>(result);
    }
}

void TerminalInput::enableRawMode()
{
    if (tcgetattr(_fd, &_origTermios) != 0)
    {
        log::warning("tcgetattr failed: {}", std::strerror(errno));
        return;
    }
    auto raw = _origTermios;
    // ISIG off: Ctrl+C, Ctrl+Z and Ctrl+\ arrive as keys.
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG | IEXTEN);
    raw.c_iflag &= ~static_cast<tcflag_t>(IXON | ICRNL);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(_fd, TCSAFLUSH, &raw);
    _rawMode = true;
}

void TerminalInput::disableRawMode()
{
    if (_rawMode)
    {
        tcsetattr(_fd, TCSAFLUSH, &_origTermios);
        _rawMode = false;
    }
}

void TerminalInput::enableProtocols()
{
    writeSequence(EnableCsiU);
    writeSequence(EnableBracketedPaste);
}

void TerminalInput::disableProtocols()
{
    writeSequence(DisableBracketedPaste);
    writeSequence(DisableCsiU);
}

} // namespace mimic::tui
