// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Clock.hpp>
#include <core/Log.hpp>
#include <tui/Terminal.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <iostream>
#include <print>
#include <string>
#include <vector>

namespace mimic
{

namespace
{
    /// Longest the loop sleeps; also bounds how long a lone Escape stays undecided.
    constexpr auto MaxPollInterval = Millis { 100 };
} // namespace

struct App::Impl
{
    AppConfig config;
    Scenario scenario;
    SteadyClock clock;
    Session session;
    tui::Terminal terminal;

    std::ofstream logFile;
    std::vector<std::string> pendingLogs; ///< Warnings held back while the TUI owns the terminal.
    bool fixedSize = false;

    Impl(Scenario s, SessionOptions options, AppConfig c):
        config(std::move(c)),
        scenario(std::move(s)),
        session(scenario, clock, std::move(options)),
        fixedSize(config.ui.columns > 0 && config.ui.rows > 0)
    {
    }

    void present()
    {
        auto& output = terminal.output();
        auto const grid = session.render();
        auto sync = output.syncGuard();
        output.present(grid);
        output.flush();
    }

    void followTerminalSize(int columns, int rows)
    {
        if (!fixedSize)
            session.resize(columns, rows);
    }

    void stopProcess()
    {
        present();
        terminal.stopProcess();
        session.resume();
        followTerminalSize(terminal.columns(), terminal.rows());
        terminal.output().invalidate();
    }

    /// @brief Handles one input event.
    /// @return false once the session asked to exit.
    auto handleEvent(tui::InputEvent const& event) -> bool
    {
        if (auto const* key = std::get_if<tui::KeyEvent>(&event))
        {
            switch (session.handleKey(*key))
            {
                case SessionRequest::None: break;
                case SessionRequest::ClearScreen: terminal.output().clearScreen(); break;
                case SessionRequest::Suspend: stopProcess(); break;
                case SessionRequest::Exit: return false;
            }
        }
        else if (auto const* paste = std::get_if<tui::PasteEvent>(&event))
            session.handlePaste(paste->text);
        else if (auto const* resize = std::get_if<tui::ResizeEvent>(&event))
        {
            terminal.output().updateDimensions();
            followTerminalSize(resize->columns, resize->rows);
            terminal.output().invalidate();
        }
        else if (std::holds_alternative<tui::SuspendEvent>(event))
        {
            session.suspend();
            stopProcess();
        }
        return true;
    }

    void flushPendingLogs()
    {
        for (auto const& line: pendingLogs)
            std::println(stderr, "{}", line);
        pendingLogs.clear();
    }
};

App::App(Scenario scenario, SessionOptions options, AppConfig config):
    _impl(std::make_unique<Impl>(std::move(scenario), std::move(options), std::move(config)))
{
    if (!_impl->config.log.file.empty())
    {
        _impl->logFile.open(_impl->config.log.file, std::ios::app);
        if (!_impl->logFile)
            log::warning("Cannot open log file {}, logging to stderr after exit", _impl->config.log.file);
    }

    // The terminal belongs to the UI: messages go to the log file, or are held
    // back until the terminal has been restored.
    log::setCallback([this](log::Level level, std::string_view message) {
        auto line = std::format("[{}] {}", log::levelPrefix(level), message);
        if (_impl->logFile.is_open())
        {
            _impl->logFile << line << '\n';
            _impl->logFile.flush();
        }
        else if (level <= log::Level::Warning)
            _impl->pendingLogs.push_back(std::move(line));
    });
}

App::~App()
{
    log::setCallback({});
    _impl->flushPendingLogs();
}

auto App::run() -> int
{
    // Flush any pending stdout before entering raw mode
    std::cout.flush();

    auto termResult = _impl->terminal.initialize();
    if (!termResult)
    {
        log::setCallback({});
        _impl->flushPendingLogs();
        std::println(stderr, "Failed to initialize terminal: {}", termResult.error().message);
        return 1;
    }

    _impl->followTerminalSize(_impl->terminal.columns(), _impl->terminal.rows());
    _impl->present();

    auto running = true;
    while (running)
    {
        auto const wakeup = _impl->session.nextWakeup().value_or(MaxPollInterval);
        auto const timeout = std::clamp(wakeup, Millis { 0 }, MaxPollInterval);

        for (auto const& event: _impl->terminal.poll(static_cast<int>(timeout.count())))
        {
            if (!_impl->handleEvent(event))
            {
                running = false;
                break;
            }
        }

        _impl->session.tick();
        if (_impl->session.exitRequested())
            running = false;

        _impl->present();
    }

    _impl->terminal.shutdown();
    log::setCallback({});
    _impl->flushPendingLogs();
    log::info("Session ended with exit code {}", _impl->session.exitCode());
    return _impl->session.exitCode();
}

} // namespace mimic
