// SPDX-License-Identifier: Apache-2.0
#include "Session.hpp"

#include <core/Log.hpp>
#include <tui/Renderer.hpp>

#include <algorithm>
#include <format>
#include <utility>

namespace mimic
{

namespace
{
    constexpr auto RejectedToolUse = std::string_view { "User rejected tool use" };
    constexpr auto InterruptedMarker = std::string_view { "[Interrupted]" };
    constexpr auto Farewell = std::string_view { "Goodbye!" };

    constexpr auto HelpText = std::string_view { "/clear  Clear conversation history\n"
                                                 "/exit   Exit the session\n"
                                                 "/help   Show available commands" };

    auto interruptedText(std::string_view partial) -> std::string
    {
        if (partial.empty())
            return std::string(InterruptedMarker);
        return std::format("{}\n\n{}", partial, InterruptedMarker);
    }

    auto permissionKindFor(std::string_view tool) -> std::optional<tui::PermissionKind>
    {
        if (tool == "Bash")
            return tui::PermissionKind::Bash;
        if (tool == "Edit")
            return tui::PermissionKind::Edit;
        if (tool == "Write")
            return tui::PermissionKind::Write;
        return std::nullopt;
    }

    /// Content preview shown between the dashed rules of an Edit or Write dialog.
    auto permissionBody(ToolCallSpec const& call) -> std::vector<std::string>
    {
        auto const key = call.tool == "Write" ? "content" : "new_string";
        if (!call.input.contains(key) || !call.input[key].is_string())
            return {};

        auto lines = std::vector<std::string> {};
        auto const text = call.input[key].get<std::string>();
        auto start = std::size_t { 0 };
        while (start <= text.size())
        {
            auto const end = std::min(text.find('\n', start), text.size());
            lines.emplace_back(text.substr(start, end - start));
            start = end + 1;
        }
        return lines;
    }

    void raise(SessionRequest& current, SessionRequest candidate)
    {
        current = std::max(current, candidate);
    }
} // namespace

Session::Session(Scenario const& scenario, Clock const& clock, SessionOptions options):
    _scenario(scenario),
    _clock(clock),
    _matcher(scenario),
    _scheduler(scenario.timeouts.responseDelay),
    _controller(scenario.timeouts.exitHint),
    _permission(options.permission.value_or(scenario.environment.permissionMode)),
    _allowBypass(options.allowBypass || scenario.environment.allowBypass),
    _model(options.model.empty() ? scenario.identity.model : std::move(options.model)),
    _workingDirectory(std::move(options.workingDirectory)),
    _columns(options.columns),
    _rows(options.rows)
{
    _controller.setModel(_model);
    log::info("Session started with scenario '{}' ({} rule(s)), model {}, permission mode {}",
              _scenario.name,
              _scenario.rules.size(),
              _model,
              permissionLabel(_permission));
}

auto Session::handleKey(tui::KeyEvent const& key) -> SessionRequest
{
    auto const lock = std::lock_guard { _mutex };
    auto const now = _clock.now();
    auto const hintBefore = _controller.exitHint();

    auto request = SessionRequest::None;
    for (auto const& command: _controller.handleKey(key, now))
        execute(command, request);

    if (std::exchange(_exitRequested, false))
    {
        raise(request, SessionRequest::Exit);
        // A double Ctrl+C quits the way an interrupted process does.
        if (hintBefore && hintBefore->kind == tui::ExitHintKind::CtrlC)
            _exitCode = exit_code::Interrupted;
    }

    // Zero-delay responses become visible in the same frame.
    drain();
    if (std::exchange(_exitRequested, false))
        raise(request, SessionRequest::Exit);
    return request;
}

void Session::handlePaste(std::string_view text)
{
    auto const lock = std::lock_guard { _mutex };
    _controller.handlePaste(text);
}

auto Session::tick() -> bool
{
    auto const lock = std::lock_guard { _mutex };
    auto changed = _controller.expireHints(_clock.now());
    if (drain())
        changed = true;
    return changed;
}

auto Session::exitRequested() -> bool
{
    auto const lock = std::lock_guard { _mutex };
    return std::exchange(_exitRequested, false);
}

auto Session::nextWakeup() const -> std::optional<Millis>
{
    auto const lock = std::lock_guard { _mutex };
    auto const now = _clock.now();

    auto wakeup = std::optional<Millis> {};
    auto const consider = [&](Millis at) {
        auto const delta = std::max(at - now, Millis { 0 });
        if (!wakeup || delta < *wakeup)
            wakeup = delta;
    };

    if (auto const due = _scheduler.nextDue(); due)
        consider(*due);
    if (auto const& hint = _controller.exitHint(); hint)
        consider(hint->shownAt + _scenario.timeouts.exitHint);
    return wakeup;
}

void Session::suspend()
{
    auto const lock = std::lock_guard { _mutex };
    _controller.suspend();
    abandonResponse();
    log::info("Session suspended");
}

void Session::resume()
{
    auto const lock = std::lock_guard { _mutex };
    _controller.resume();
    log::info("Session resumed in {} mode", tui::modeName(_controller.mode()));
}

void Session::resize(int columns, int rows)
{
    auto const lock = std::lock_guard { _mutex };
    _columns = std::max(columns, 1);
    _rows = std::max(rows, 1);
}

auto Session::render() const -> tui::Grid
{
    auto const lock = std::lock_guard { _mutex };
    auto const preview = _pendingTool ? pendingToolCallDisplay(*_pendingTool) : _preview;
    return tui::render(tui::RenderInput {
        .conversation = _conversation,
        .input = _controller.input(),
        .mode = _controller.mode(),
        .identity = _scenario.identity,
        .permission = _permission,
        .exitHint = _controller.exitHint(),
        .model = _model,
        .workingDirectory = _workingDirectory,
        .preview = preview,
        .spinnerSeed = _spinnerSeed,
        .thinkingEnabled = _controller.thinkingEnabled(),
        .slashMenu = _controller.slashMenu() ? &*_controller.slashMenu() : nullptr,
        .columns = _columns,
        .rows = _rows,
    });
}

auto Session::exitCode() const -> int
{
    auto const lock = std::lock_guard { _mutex };
    return _exitCode;
}

auto Session::conversation() const -> Conversation
{
    auto const lock = std::lock_guard { _mutex };
    return _conversation;
}

auto Session::mode() const -> tui::Mode
{
    auto const lock = std::lock_guard { _mutex };
    return _controller.mode();
}

auto Session::inputText() const -> std::string
{
    auto const lock = std::lock_guard { _mutex };
    return _controller.input().text();
}

auto Session::stash() const -> std::optional<std::string>
{
    auto const lock = std::lock_guard { _mutex };
    return _controller.input().stash();
}

auto Session::permission() const -> PermissionState
{
    auto const lock = std::lock_guard { _mutex };
    return _permission;
}

auto Session::model() const -> std::string
{
    auto const lock = std::lock_guard { _mutex };
    return _model;
}

auto Session::preview() const -> std::string
{
    auto const lock = std::lock_guard { _mutex };
    return _preview;
}

auto Session::queuedPrompts() const -> std::size_t
{
    auto const lock = std::lock_guard { _mutex };
    return _queue.size();
}

auto Session::thinkingEnabled() const -> bool
{
    auto const lock = std::lock_guard { _mutex };
    return _controller.thinkingEnabled();
}

auto Session::responding() const -> bool
{
    auto const lock = std::lock_guard { _mutex };
    return busy();
}

auto Session::busy() const -> bool
{
    return _scheduler.active() || _pendingTool.has_value();
}

void Session::execute(tui::Command const& command, SessionRequest& request)
{
    if (auto const* submitCommand = std::get_if<tui::SubmitCommand>(&command))
        submit(submitCommand->text);
    else if (auto const* shell = std::get_if<tui::ExecuteShellCommand>(&command))
        submitShell(shell->command);
    else if (std::holds_alternative<tui::CyclePermissionCommand>(command))
    {
        _permission = nextPermission(_permission, _allowBypass);
        log::debug("Permission mode is now {}", permissionLabel(_permission));
    }
    else if (std::holds_alternative<tui::TogglePanelCommand>(command))
        log::trace("Shortcuts panel toggled");
    else if (std::holds_alternative<tui::SuspendCommand>(command))
    {
        abandonResponse();
        log::info("Session suspended");
        raise(request, SessionRequest::Suspend);
    }
    else if (std::holds_alternative<tui::ExitCommand>(command))
    {
        _scheduler.cancel();
        _queue.clear();
        _exitRequested = true;
    }
    else if (std::holds_alternative<tui::InterruptCommand>(command))
        interrupt();
    else if (std::holds_alternative<tui::ClearScreenCommand>(command))
        raise(request, SessionRequest::ClearScreen);
    else if (auto const* thinking = std::get_if<tui::SetThinkingCommand>(&command))
        log::debug("Thinking {}", thinking->enabled ? "enabled" : "disabled");
    else if (auto const* select = std::get_if<tui::SelectModelCommand>(&command))
    {
        _model = select->id;
        _controller.setModel(_model);
        log::info("Model set to {}", _model);
    }
    else if (auto const* resolve = std::get_if<tui::ResolvePermissionCommand>(&command))
        resolvePermission(resolve->decision);
}

void Session::submit(std::string text)
{
    if (busy() || !_queue.empty())
    {
        log::debug("Queueing prompt behind the active response ({} waiting)", _queue.size() + 1);
        _queue.push_back(QueuedInput { .text = std::move(text), .shell = false });
        return;
    }
    startTurn(std::move(text));
}

void Session::submitShell(std::string command)
{
    if (busy() || !_queue.empty())
    {
        log::debug("Queueing shell command behind the active response ({} waiting)", _queue.size() + 1);
        _queue.push_back(QueuedInput { .text = std::move(command), .shell = true });
        return;
    }
    executeShell(std::move(command));
}

void Session::startTurn(std::string text)
{
    if (text.starts_with('/') && runSlashCommand(text))
    {
        finishTurn();
        return;
    }

    _conversation.addPrompt(text);
    beginResponse(_matcher.match(text).rule->response);
}

void Session::beginResponse(ResponseSpec const& response)
{
    _preview.clear();
    ++_spinnerSeed;

    if (auto scheduled = _scheduler.schedule(response, _clock.now()); !scheduled)
    {
        log::error("Failed to schedule response: {}", scheduled.error());
        _conversation.addError(std::format("Error: {}", scheduled.error().message));
        finishTurn();
        return;
    }
    _controller.beginResponse();
}

void Session::finishTurn()
{
    if (!_queue.empty())
    {
        auto next = std::move(_queue.front());
        _queue.pop_front();
        if (next.shell)
            executeShell(std::move(next.text));
        else
            startTurn(std::move(next.text));
        return;
    }
    _controller.responseFinished();
}

auto Session::runSlashCommand(std::string_view text) -> bool
{
    auto const end = text.find_first_of(" \t\n");
    auto const name = text.substr(0, end);

    if (name == "/clear")
    {
        _conversation.clear();
        _allowedTools.clear();
        _conversation.addPrompt(std::string(text));
        _conversation.addCommandOutput("(no content)");
        log::info("Conversation cleared");
        return true;
    }
    if (name == "/help" || name == "/?")
    {
        _conversation.addPrompt(std::string(text));
        _conversation.addCommandOutput(std::string(HelpText));
        return true;
    }
    if (name == "/exit")
    {
        _conversation.addPrompt(std::string(text));
        _conversation.addCommandOutput(std::string(Farewell));
        _queue.clear();
        _exitRequested = true;
        return true;
    }

    // Anything else is answered by the scenario like a normal prompt.
    return false;
}

void Session::executeShell(std::string command)
{
    _conversation.addShellCommand(command);

    // The command runs through the Bash tool, so it asks for consent like any other call
    // before the scenario's answer streams in.
    auto response = _matcher.match(command).rule->response;
    response.toolCalls.insert(response.toolCalls.begin(),
                              ToolCallSpec { .tool = "Bash", .input = { { "command", command } }, .result = std::nullopt });
    log::debug("Running shell command through Bash: {}", command);
    beginResponse(response);
}

auto Session::drain() -> bool
{
    auto delivered = false;
    while (auto event = _scheduler.next(_clock.now()))
    {
        deliver(std::move(*event));
        delivered = true;
    }
    return delivered;
}

void Session::deliver(ResponseEvent event)
{
    if (auto* toolCall = std::get_if<ToolCallEvent>(&event))
    {
        log::trace("Tool call {}: {}", toolCall->index, toolCall->call.tool);
        if (!requestPermission(toolCall->call))
            _conversation.addToolCall(toolCallDisplay(toolCall->call));
    }
    else if (auto* chunk = std::get_if<ChunkEvent>(&event))
    {
        log::trace("Chunk of {} byte(s)", chunk->text.size());
        _preview += chunk->text;
    }
    else if (auto* completed = std::get_if<CompletedEvent>(&event))
    {
        log::trace("Response completed");
        // A response made only of tool calls leaves no text entry behind.
        if (!completed->text.empty())
            _conversation.addResponse(std::move(completed->text));
        _preview.clear();
        finishTurn();
    }
    else if (auto* failed = std::get_if<FailedEvent>(&event))
    {
        log::trace("Response failed with {}", failureTypeName(failed->failure.kind));
        _conversation.addError(conversationText(failed->failure));
        _preview.clear();
        finishTurn();
    }
}

auto Session::requestPermission(ToolCallSpec const& call) -> bool
{
    auto const kind = permissionKindFor(call.tool);
    if (!kind)
        return false;
    if (_permission == PermissionState::Bypass)
        return false;
    if (_permission == PermissionState::AcceptEdits && *kind != tui::PermissionKind::Bash)
        return false;
    if (_allowedTools.contains(call.tool))
        return false;

    log::debug("Asking for permission to run {}", call.tool);
    _pendingTool = call;
    _scheduler.hold(_clock.now());
    _controller.openPermissionDialog(tui::PermissionDialogMode {
        .kind = *kind,
        .subject = toolCallSubject(call),
        .body = permissionBody(call),
        .selected = 0,
    });
    return true;
}

void Session::resolvePermission(PermissionDecision decision)
{
    if (!_pendingTool)
        return;

    auto call = std::move(*_pendingTool);
    _pendingTool.reset();

    switch (decision)
    {
        case PermissionDecision::AllowAlways:
            _allowedTools.insert(call.tool);
            log::debug("{} allowed for the rest of the session", call.tool);
            [[fallthrough]];
        case PermissionDecision::Allow:
            _conversation.addToolCall(toolCallDisplay(call));
            _scheduler.release(_clock.now());
            break;
        case PermissionDecision::Deny:
            log::debug("{} denied", call.tool);
            call.result = std::string(RejectedToolUse);
            _conversation.addToolCall(toolCallDisplay(call));
            _scheduler.cancel();
            _preview.clear();
            finishTurn();
            break;
    }
}

void Session::interrupt()
{
    if (!busy())
        return;

    log::info("Response interrupted");
    _scheduler.cancel();
    _pendingTool.reset();
    _conversation.addResponse(interruptedText(_preview));
    _preview.clear();

    // The input state machine already left ThinkingWait and kept any stash; queued input still runs.
    if (!_queue.empty())
        finishTurn();
}

void Session::abandonResponse()
{
    if (!busy())
        return;

    _scheduler.cancel();
    _pendingTool.reset();
    _conversation.addResponse(interruptedText(_preview));
    _preview.clear();
    if (!_queue.empty())
        log::info("Dropping {} queued prompt(s)", _queue.size());
    _queue.clear();
    _controller.responseInterrupted();
}

} // namespace mimic
