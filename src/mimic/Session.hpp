// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <engine/Conversation.hpp>
#include <engine/Matcher.hpp>
#include <engine/Permission.hpp>
#include <engine/ResponseScheduler.hpp>
#include <engine/Scenario.hpp>
#include <tui/Grid.hpp>
#include <tui/InputController.hpp>
#include <tui/InputEvent.hpp>

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace mimic
{

/// @brief Per-run settings that override the scenario.
struct SessionOptions
{
    std::string model;                          ///< Empty means the scenario's identity model.
    std::optional<PermissionState> permission;  ///< Overrides environment.permission_mode.
    bool allowBypass = false;                   ///< Set by --dangerously-skip-permissions.
    std::string workingDirectory;               ///< Header path, already abbreviated.
    int columns = 80;
    int rows = 24;
};

/// @brief What the process around the session has to do after an event.
enum class SessionRequest : std::uint8_t
{
    None,
    ClearScreen,
    Suspend,
    Exit,
};

/// @brief The interactive simulator: one owner for all mutable state.
///
/// Key events, timer ticks and suspend/resume notifications all enter through
/// this class, each under the same lock. Commands produced by the input state
/// machine are executed here: prompts are matched and scheduled, scheduler
/// events are drained into the conversation, and tool calls that need
/// consent open a permission dialog that holds the scheduler.
class Session
{
  public:
    Session(Scenario const& scenario, Clock const& clock, SessionOptions options = {});

    /// @brief Processes one key press.
    [[nodiscard]] auto handleKey(tui::KeyEvent const& key) -> SessionRequest;

    /// @brief Inserts pasted text into the input line.
    void handlePaste(std::string_view text);

    /// @brief Delivers due scheduler events and expires hints.
    /// @return true if anything visible changed.
    auto tick() -> bool;

    /// @brief Time until tick() has work to do, or nullopt when idle.
    [[nodiscard]] auto nextWakeup() const -> std::optional<Millis>;

    /// @brief The process is being stopped (Ctrl+Z or SIGTSTP). Cancels the in-flight response.
    void suspend();

    /// @brief The process was continued.
    void resume();

    /// @brief Changes the grid dimensions used by render().
    void resize(int columns, int rows);

    /// @brief Renders the current state.
    [[nodiscard]] auto render() const -> tui::Grid;

    /// @brief Whether a queued /exit fired during tick(). Consumes the request.
    [[nodiscard]] auto exitRequested() -> bool;

    /// @brief Exit status for the process once an exit was requested.
    [[nodiscard]] auto exitCode() const -> int;

    // Observers, mainly for tests.
    [[nodiscard]] auto conversation() const -> Conversation;
    [[nodiscard]] auto mode() const -> tui::Mode;
    [[nodiscard]] auto inputText() const -> std::string;
    [[nodiscard]] auto stash() const -> std::optional<std::string>;
    [[nodiscard]] auto permission() const -> PermissionState;
    [[nodiscard]] auto model() const -> std::string;
    [[nodiscard]] auto preview() const -> std::string;
    [[nodiscard]] auto queuedPrompts() const -> std::size_t;
    [[nodiscard]] auto thinkingEnabled() const -> bool;
    [[nodiscard]] auto responding() const -> bool;

  private:
    /// @brief A prompt or shell command submitted while a response was in flight.
    struct QueuedInput
    {
        std::string text;
        bool shell = false;
    };

    void execute(tui::Command const& command, SessionRequest& request);
    void submit(std::string text);
    void submitShell(std::string command);
    [[nodiscard]] auto busy() const -> bool;
    void startTurn(std::string text);
    void beginResponse(ResponseSpec const& response);
    void finishTurn();
    void executeShell(std::string command);
    [[nodiscard]] auto runSlashCommand(std::string_view text) -> bool;
    void deliver(ResponseEvent event);
    [[nodiscard]] auto requestPermission(ToolCallSpec const& call) -> bool;
    void resolvePermission(PermissionDecision decision);
    void interrupt();
    void abandonResponse();
    auto drain() -> bool;

    mutable std::mutex _mutex;

    Scenario const& _scenario;
    Clock const& _clock;
    Matcher _matcher;
    ResponseScheduler _scheduler;
    Conversation _conversation;
    tui::InputController _controller;

    PermissionState _permission;
    bool _allowBypass;
    std::string _model;
    std::string _workingDirectory;
    int _columns;
    int _rows;

    std::string _preview;                     ///< Text streamed so far for the in-flight response.
    std::deque<QueuedInput> _queue;           ///< Input submitted while a response was in flight.
    std::optional<ToolCallSpec> _pendingTool; ///< Tool call waiting in the permission dialog.
    std::set<std::string> _allowedTools;      ///< Tools allowed for the rest of the session.
    std::size_t _spinnerSeed = 0;
    bool _exitRequested = false;
    int _exitCode = exit_code::Success;
};

} // namespace mimic
