// SPDX-License-Identifier: Apache-2.0
#include <mimic/Session.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace mimic;
using namespace std::chrono_literals;

namespace
{
auto ruleFor(std::string trigger, ResponseSpec response) -> Rule
{
    return Rule { .pattern = makeContains(std::move(trigger)), .response = std::move(response), .maxMatches = std::nullopt };
}

auto bashCall(std::string command, std::string result) -> ToolCallSpec
{
    return ToolCallSpec { .tool = "Bash", .input = { { "command", std::move(command) } }, .result = std::move(result) };
}

auto writeCall(std::string path, std::string content) -> ToolCallSpec
{
    return ToolCallSpec { .tool = "Write",
                          .input = { { "file_path", std::move(path) }, { "content", std::move(content) } },
                          .result = "Wrote 1 line" };
}

/// @brief A session on a manual clock, driven key by key.
struct Harness
{
    Scenario scenario;
    ManualClock clock;
    Session session;

    explicit Harness(Scenario s, SessionOptions options = {}):
        scenario(std::move(s)), session(scenario, clock, std::move(options))
    {
    }

    auto press(tui::KeyEvent const& key) -> SessionRequest { return session.handleKey(key); }

    void type(std::string_view text)
    {
        for (auto const ch: text)
            (void) press(tui::charKey(static_cast<char32_t>(ch)));
    }

    auto submit(std::string_view text) -> SessionRequest
    {
        type(text);
        return press(tui::namedKey(tui::KeyCode::Enter));
    }

    auto ctrl(char32_t ch) -> SessionRequest { return press(tui::charKey(ch, tui::Modifier::Ctrl)); }

    auto advance(Millis delta) -> bool
    {
        clock.advance(delta);
        return session.tick();
    }

    [[nodiscard]] auto entries() const -> std::vector<ConversationEntry>
    {
        return session.conversation().entries();
    }

    [[nodiscard]] auto screen() const -> std::string { return session.render().toText(); }
};

auto prompt(std::string text) -> ConversationEntry
{
    return ConversationEntry { .kind = EntryKind::Prompt, .text = std::move(text) };
}

auto response(std::string text) -> ConversationEntry
{
    return ConversationEntry { .kind = EntryKind::Response, .text = std::move(text) };
}

auto toolCall(std::string text) -> ConversationEntry
{
    return ConversationEntry { .kind = EntryKind::ToolCall, .text = std::move(text) };
}

auto buildScenario() -> Scenario
{
    auto scenario = Scenario {};
    auto build = ResponseSpec { .text = "Built." };
    build.toolCalls.push_back(bashCall("make", "ok"));
    scenario.rules.push_back(ruleFor("build", build));

    auto create = ResponseSpec { .text = "Created." };
    create.toolCalls.push_back(writeCall("hello.py", "print('hi')"));
    scenario.rules.push_back(ruleFor("create", create));
    return scenario;
}
} // namespace

// =============================================================================
// Turns
// =============================================================================

TEST_CASE("Session: a prompt gets its scripted response", "[session]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(ruleFor("hello", ResponseSpec { .text = "Hi there!" }));
    auto harness = Harness(std::move(scenario));

    CHECK(harness.submit("hello") == SessionRequest::None);
    CHECK(harness.entries() == std::vector { prompt("hello"), response("Hi there!") });
    CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));
    CHECK_FALSE(harness.session.responding());
    CHECK(harness.screen().contains("⏺ Hi there!"));
}

TEST_CASE("Session: identical inputs render identical screens", "[session]")
{
    auto const run = [] {
        auto scenario = Scenario {};
        scenario.rules.push_back(ruleFor("a", ResponseSpec { .text = "A", .delay = 200ms }));
        auto harness = Harness(std::move(scenario));
        (void) harness.submit("a");
        (void) harness.advance(100ms);
        auto const midway = harness.screen();
        (void) harness.advance(100ms);
        return midway + "\n---\n" + harness.screen();
    };

    CHECK(run() == run());
}

TEST_CASE("Session: responses wait for their delay", "[session]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(ruleFor("slow", ResponseSpec { .text = "Finally.", .delay = 500ms }));
    auto harness = Harness(std::move(scenario));

    (void) harness.submit("slow");
    CHECK(harness.session.responding());
    CHECK(std::holds_alternative<tui::ThinkingWaitMode>(harness.session.mode()));
    CHECK(harness.session.nextWakeup() == 500ms);
    CHECK(harness.screen().contains("✻ "));

    CHECK_FALSE(harness.advance(499ms));
    CHECK(harness.entries().size() == 1);

    CHECK(harness.advance(1ms));
    CHECK(harness.entries().back() == response("Finally."));
    CHECK_FALSE(harness.session.nextWakeup().has_value());
}

TEST_CASE("Session: the scenario default delay applies", "[session]")
{
    auto scenario = Scenario {};
    scenario.timeouts.responseDelay = 300ms;
    auto harness = Harness(std::move(scenario));

    (void) harness.submit("anything");
    CHECK(harness.session.nextWakeup() == 300ms);
    (void) harness.advance(300ms);
    CHECK(harness.entries().back() == response(std::string(FallbackResponseText)));
}

TEST_CASE("Session: streamed chunks build up the preview", "[session]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(ruleFor(
        "stream", ResponseSpec { .text = "Hello world", .chunks = { "Hello", " world" }, .chunkInterval = 100ms }));
    auto harness = Harness(std::move(scenario));

    (void) harness.submit("stream");
    CHECK(harness.session.preview() == "Hello");
    CHECK(harness.screen().contains("⏺ Hello"));

    (void) harness.advance(100ms);
    CHECK(harness.session.preview().empty());
    CHECK(harness.entries().back() == response("Hello world"));
}

TEST_CASE("Session: failures become error entries", "[session][failure]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(
        ruleFor("limit", ResponseSpec { .failure = FailureSpec { .kind = FailureKind::RateLimit, .retryAfter = 30 } }));
    auto harness = Harness(std::move(scenario));

    (void) harness.submit("limit");
    REQUIRE(harness.entries().size() == 2);
    CHECK(harness.entries()[1]
          == ConversationEntry { .kind = EntryKind::Error, .text = "Error: Rate limited. Retry after 30 seconds." });
    CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));
}

TEST_CASE("Session: prompts submitted while responding run in order", "[session][queue]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(ruleFor("one", ResponseSpec { .text = "first", .delay = 100ms }));
    scenario.rules.push_back(ruleFor("two", ResponseSpec { .text = "second", .delay = 100ms }));
    scenario.rules.push_back(ruleFor("three", ResponseSpec { .text = "third", .delay = 100ms }));
    auto harness = Harness(std::move(scenario));

    (void) harness.submit("one");
    (void) harness.submit("two");
    (void) harness.submit("three");
    CHECK(harness.session.queuedPrompts() == 2);
    CHECK(harness.entries() == std::vector { prompt("one") });

    (void) harness.advance(100ms);
    CHECK(harness.entries() == std::vector { prompt("one"), response("first"), prompt("two") });
    CHECK(harness.session.queuedPrompts() == 1);

    (void) harness.advance(100ms);
    (void) harness.advance(100ms);
    CHECK(harness.entries()
          == std::vector {
              prompt("one"), response("first"), prompt("two"), response("second"), prompt("three"), response("third"),
          });
    CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));
}

TEST_CASE("Session: a stashed prompt returns after the response", "[session][stash]")
{
    auto harness = Harness(Scenario {});
    harness.type("long draft");
    (void) harness.ctrl(U's');
    CHECK(harness.session.inputText().empty());
    CHECK(harness.session.stash() == "long draft");
    CHECK(harness.screen().contains("Stashed (auto-restores after submit)"));

    (void) harness.submit("quick question");
    CHECK(harness.session.inputText() == "long draft");
    CHECK_FALSE(harness.session.stash().has_value());
}

// =============================================================================
// Interrupts
// =============================================================================

TEST_CASE("Session: Escape interrupts and keeps the partial text", "[session][interrupt]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(ruleFor(
        "story", ResponseSpec { .text = "Once upon a time", .chunks = { "Once upon", " a time" }, .chunkInterval = 500ms }));
    auto harness = Harness(std::move(scenario));

    (void) harness.submit("story");
    (void) harness.press(tui::namedKey(tui::KeyCode::Escape));

    CHECK(harness.entries().back() == response("Once upon\n\n[Interrupted]"));
    CHECK_FALSE(harness.session.responding());
    CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));

    (void) harness.advance(1000ms);
    CHECK(harness.entries().size() == 2);
}

TEST_CASE("Session: Ctrl+C before any text shows a bare marker", "[session][interrupt]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(ruleFor("wait", ResponseSpec { .text = "never", .delay = 1000ms }));
    auto harness = Harness(std::move(scenario));

    (void) harness.submit("wait");
    CHECK(harness.ctrl(U'c') == SessionRequest::None);
    CHECK(harness.entries().back() == response("[Interrupted]"));
    CHECK(harness.session.exitCode() == 0);
}

TEST_CASE("Session: an interrupt still runs queued prompts", "[session][interrupt][queue]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(ruleFor("slow", ResponseSpec { .text = "never", .delay = 1000ms }));
    scenario.rules.push_back(ruleFor("fast", ResponseSpec { .text = "quick" }));
    auto harness = Harness(std::move(scenario));

    (void) harness.submit("slow");
    (void) harness.submit("fast");
    (void) harness.ctrl(U'c');
    CHECK(harness.entries()
          == std::vector { prompt("slow"), response("[Interrupted]"), prompt("fast"), response("quick") });
}

TEST_CASE("Session: an interrupt leaves the stash in place", "[session][interrupt][stash]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(ruleFor("slow", ResponseSpec { .text = "done", .delay = 1000ms }));
    scenario.rules.push_back(ruleFor("quick", ResponseSpec { .text = "fast" }));
    auto harness = Harness(std::move(scenario));

    harness.type("long draft");
    (void) harness.ctrl(U's');
    (void) harness.submit("slow");
    (void) harness.press(tui::namedKey(tui::KeyCode::Escape));

    CHECK(harness.entries().back() == response("[Interrupted]"));
    CHECK(harness.session.inputText().empty());
    CHECK(harness.session.stash() == "long draft");

    (void) harness.submit("quick");
    CHECK(harness.session.inputText() == "long draft");
    CHECK_FALSE(harness.session.stash().has_value());
}

TEST_CASE("Session: suspending cancels the response", "[session][suspend]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(ruleFor("slow", ResponseSpec { .text = "never", .delay = 1000ms }));
    auto harness = Harness(std::move(scenario));

    (void) harness.submit("slow");
    (void) harness.submit("queued");
    CHECK(harness.ctrl(U'z') == SessionRequest::Suspend);
    CHECK(std::holds_alternative<tui::SuspendedMode>(harness.session.mode()));
    CHECK(harness.entries().back() == response("[Interrupted]"));
    CHECK(harness.session.queuedPrompts() == 0);

    harness.session.resume();
    CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));
    CHECK_FALSE(harness.session.responding());
}

TEST_CASE("Session: an external stop signal suspends too", "[session][suspend]")
{
    auto harness = Harness(Scenario {});
    (void) harness.press(tui::charKey(U'!'));
    harness.session.suspend();
    CHECK(std::holds_alternative<tui::SuspendedMode>(harness.session.mode()));
    harness.session.resume();
    CHECK(std::holds_alternative<tui::ShellEntryMode>(harness.session.mode()));
}

// =============================================================================
// Exit
// =============================================================================

TEST_CASE("Session: double Ctrl+C exits with 130", "[session][exit]")
{
    auto harness = Harness(Scenario {});
    harness.type("draft");
    CHECK(harness.ctrl(U'c') == SessionRequest::None);
    CHECK(harness.session.inputText().empty());
    CHECK(harness.screen().contains("Press Ctrl-C again to exit"));

    (void) harness.advance(1000ms);
    CHECK(harness.ctrl(U'c') == SessionRequest::Exit);
    CHECK(harness.session.exitCode() == exit_code::Interrupted);
}

TEST_CASE("Session: double Ctrl+D exits cleanly", "[session][exit]")
{
    auto harness = Harness(Scenario {});
    CHECK(harness.ctrl(U'd') == SessionRequest::None);
    CHECK(harness.ctrl(U'd') == SessionRequest::Exit);
    CHECK(harness.session.exitCode() == exit_code::Success);
}

TEST_CASE("Session: the exit hint expires with the scenario timeout", "[session][exit]")
{
    auto scenario = Scenario {};
    scenario.timeouts.exitHint = 500ms;
    auto harness = Harness(std::move(scenario));

    (void) harness.ctrl(U'd');
    CHECK(harness.session.nextWakeup() == 500ms);
    CHECK(harness.advance(500ms));
    CHECK_FALSE(harness.screen().contains("Press Ctrl-D again to exit"));
    CHECK(harness.ctrl(U'd') == SessionRequest::None);
}

// =============================================================================
// Slash and shell commands
// =============================================================================

TEST_CASE("Session: /clear empties the conversation", "[session][commands]")
{
    auto harness = Harness(Scenario {});
    (void) harness.submit("hello");
    REQUIRE(harness.entries().size() == 2);

    (void) harness.submit("/clear");
    CHECK(harness.entries()
          == std::vector { prompt("/clear"), ConversationEntry { .kind = EntryKind::CommandOutput, .text = "(no content)" } });
    CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));
}

TEST_CASE("Session: /help lists the built-in commands", "[session][commands]")
{
    auto harness = Harness(Scenario {});
    (void) harness.submit("/help");
    REQUIRE(harness.entries().size() == 2);
    CHECK(harness.entries()[1].kind == EntryKind::CommandOutput);
    CHECK(harness.entries()[1].text.contains("/clear"));
    CHECK(harness.entries()[1].text.contains("/exit"));
}

TEST_CASE("Session: /exit ends the session", "[session][commands]")
{
    auto harness = Harness(Scenario {});
    CHECK(harness.submit("/exit") == SessionRequest::Exit);
    CHECK(harness.entries().back().text == "Goodbye!");
    CHECK(harness.session.exitCode() == exit_code::Success);
}

TEST_CASE("Session: unknown slash commands go to the scenario", "[session][commands]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(Rule { .pattern = makeExact("/status"), .response = ResponseSpec { .text = "All good." } });
    auto harness = Harness(std::move(scenario));

    (void) harness.submit("/status");
    CHECK(harness.entries() == std::vector { prompt("/status"), response("All good.") });
}

TEST_CASE("Session: shell commands run through the Bash tool", "[session][shell]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(Rule { .pattern = makeExact("ls"), .response = ResponseSpec { .text = "README.md" } });
    scenario.rules.push_back(Rule { .pattern = makeExact("curl api"),
                                    .response = ResponseSpec { .failure = FailureSpec { .kind = FailureKind::NetworkUnreachable } } });
    auto const shellCommand = ConversationEntry { .kind = EntryKind::ShellCommand, .text = "ls" };

    SECTION("the default mode asks before running")
    {
        auto harness = Harness(scenario);
        (void) harness.press(tui::charKey(U'!'));
        (void) harness.submit("ls");

        REQUIRE(std::holds_alternative<tui::PermissionDialogMode>(harness.session.mode()));
        auto const& dialog = std::get<tui::PermissionDialogMode>(harness.session.mode());
        CHECK(dialog.kind == tui::PermissionKind::Bash);
        CHECK(dialog.subject == "ls");
        CHECK(harness.entries() == std::vector { shellCommand });
        CHECK(harness.screen().contains(R"(❯ \!ls)"));
        CHECK(harness.screen().contains("Do you want to proceed?"));

        (void) harness.press(tui::charKey(U'1'));
        CHECK(harness.entries() == std::vector { shellCommand, toolCall("Bash(ls)"), response("README.md") });
        CHECK(harness.screen().contains("⏺ Bash(ls)"));
        CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));
    }

    SECTION("denying records the rejection")
    {
        auto harness = Harness(scenario);
        (void) harness.press(tui::charKey(U'!'));
        (void) harness.submit("ls");
        (void) harness.press(tui::namedKey(tui::KeyCode::Escape));
        CHECK(harness.entries() == std::vector { shellCommand, toolCall("Bash(ls)\n  ⎿  User rejected tool use") });
    }

    SECTION("bypass runs without a dialog")
    {
        auto harness = Harness(scenario, SessionOptions { .permission = PermissionState::Bypass });
        (void) harness.press(tui::charKey(U'!'));
        (void) harness.submit("ls");
        CHECK(harness.entries() == std::vector { shellCommand, toolCall("Bash(ls)"), response("README.md") });
        CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));
    }

    SECTION("unmatched commands get the default response")
    {
        auto harness = Harness(scenario, SessionOptions { .permission = PermissionState::Bypass });
        (void) harness.press(tui::charKey(U'!'));
        (void) harness.submit("pwd");
        CHECK(harness.entries().back() == response(std::string(FallbackResponseText)));
    }

    SECTION("failures")
    {
        auto harness = Harness(scenario);
        (void) harness.press(tui::charKey(U'!'));
        (void) harness.submit("curl api");
        CHECK(harness.entries().back()
              == ConversationEntry { .kind = EntryKind::Error, .text = "Error: Network is unreachable" });
        CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));
    }
}

TEST_CASE("Session: a shell command recalled while waiting runs as a shell command", "[session][shell][queue]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(Rule { .pattern = makeExact("ls"), .response = ResponseSpec { .text = "README.md" } });
    scenario.rules.push_back(ruleFor("slow", ResponseSpec { .text = "done", .delay = 100ms }));
    auto harness = Harness(scenario, SessionOptions { .permission = PermissionState::Bypass });

    (void) harness.press(tui::charKey(U'!'));
    (void) harness.submit("ls");
    (void) harness.submit("slow");
    REQUIRE(harness.session.responding());

    (void) harness.press(tui::namedKey(tui::KeyCode::Up));
    (void) harness.press(tui::namedKey(tui::KeyCode::Up));
    REQUIRE(harness.session.inputText() == "!ls");
    (void) harness.press(tui::namedKey(tui::KeyCode::Enter));
    CHECK(harness.session.queuedPrompts() == 1);

    (void) harness.advance(100ms);
    auto const entries = harness.entries();
    REQUIRE(entries.size() == 8);
    CHECK(entries[4] == response("done"));
    CHECK(entries[5] == ConversationEntry { .kind = EntryKind::ShellCommand, .text = "ls" });
    CHECK(entries[6] == toolCall("Bash(ls)"));
    CHECK(entries[7] == response("README.md"));
}

TEST_CASE("Session: a response made only of tool calls adds no text entry", "[session]")
{
    auto scenario = Scenario {};
    auto silent = ResponseSpec {};
    silent.toolCalls.push_back(bashCall("make", "ok"));
    scenario.rules.push_back(ruleFor("build", silent));
    auto harness = Harness(std::move(scenario), SessionOptions { .permission = PermissionState::Bypass });

    (void) harness.submit("build");
    CHECK(harness.entries() == std::vector { prompt("build"), toolCall("Bash(make)\n  ⎿  ok") });

    auto const grid = harness.session.render();
    for (auto row = 0; row < grid.rows(); ++row)
        CHECK(grid.rowText(row) != "⏺");
}

// =============================================================================
// Permissions
// =============================================================================

TEST_CASE("Session: Bash tool calls ask for permission", "[session][permission]")
{
    auto harness = Harness(buildScenario());
    (void) harness.submit("build it");

    REQUIRE(std::holds_alternative<tui::PermissionDialogMode>(harness.session.mode()));
    auto const& dialog = std::get<tui::PermissionDialogMode>(harness.session.mode());
    CHECK(dialog.kind == tui::PermissionKind::Bash);
    CHECK(dialog.subject == "make");
    CHECK(harness.session.responding());
    CHECK(harness.entries() == std::vector { prompt("build it") });
    CHECK(harness.screen().contains("Do you want to proceed?"));
    CHECK(harness.screen().contains("Running…"));

    SECTION("time does not pass for a held response")
    {
        CHECK_FALSE(harness.session.nextWakeup().has_value());
        CHECK_FALSE(harness.advance(10'000ms));
    }

    SECTION("allow runs the tool and finishes the response")
    {
        (void) harness.press(tui::charKey(U'1'));
        CHECK(harness.entries()
              == std::vector { prompt("build it"), toolCall("Bash(make)\n  ⎿  ok"), response("Built.") });
        CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));
    }

    SECTION("deny records the rejection and ends the turn")
    {
        (void) harness.press(tui::namedKey(tui::KeyCode::Escape));
        CHECK(harness.entries()
              == std::vector { prompt("build it"), toolCall("Bash(make)\n  ⎿  User rejected tool use") });
        CHECK_FALSE(harness.session.responding());
        CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));
    }

    SECTION("allow always skips the dialog next time")
    {
        (void) harness.press(tui::charKey(U'2'));
        (void) harness.submit("build again");
        CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));
        CHECK(harness.entries().back() == response("Built."));
        CHECK(harness.entries().size() == 6);
    }
}

TEST_CASE("Session: Write dialogs preview the file content", "[session][permission]")
{
    auto harness = Harness(buildScenario());
    (void) harness.submit("create a script");

    REQUIRE(std::holds_alternative<tui::PermissionDialogMode>(harness.session.mode()));
    auto const& dialog = std::get<tui::PermissionDialogMode>(harness.session.mode());
    CHECK(dialog.kind == tui::PermissionKind::Write);
    CHECK(dialog.subject == "hello.py");
    CHECK(dialog.body == std::vector<std::string> { "print('hi')" });
    CHECK(harness.screen().contains("Do you want to create hello.py?"));
}

TEST_CASE("Session: permission modes skip dialogs", "[session][permission]")
{
    SECTION("bypass skips every dialog")
    {
        auto harness = Harness(buildScenario(), SessionOptions { .permission = PermissionState::Bypass });
        (void) harness.submit("build it");
        CHECK(harness.entries().back() == response("Built."));
    }

    SECTION("accept edits skips file edits")
    {
        auto harness = Harness(buildScenario(), SessionOptions { .permission = PermissionState::AcceptEdits });
        (void) harness.submit("create a script");
        CHECK(harness.entries()
              == std::vector { prompt("create a script"), toolCall("Write(hello.py)\n  ⎿  Wrote 1 line"),
                               response("Created.") });
    }

    SECTION("accept edits still asks before running commands")
    {
        auto harness = Harness(buildScenario(), SessionOptions { .permission = PermissionState::AcceptEdits });
        (void) harness.submit("build it");
        CHECK(std::holds_alternative<tui::PermissionDialogMode>(harness.session.mode()));
    }
}

TEST_CASE("Session: Shift+Tab cycles the permission mode", "[session][permission]")
{
    auto const shiftTab = tui::namedKey(tui::KeyCode::Tab, tui::Modifier::Shift);

    SECTION("without bypass")
    {
        auto harness = Harness(Scenario {});
        auto seen = std::vector<PermissionState> {};
        for (auto i = 0; i < 3; ++i)
        {
            (void) harness.press(shiftTab);
            seen.push_back(harness.session.permission());
        }
        CHECK(seen == std::vector { PermissionState::AcceptEdits, PermissionState::Plan, PermissionState::Default });
    }

    SECTION("with bypass allowed")
    {
        auto harness = Harness(Scenario {}, SessionOptions { .allowBypass = true });
        auto seen = std::vector<PermissionState> {};
        for (auto i = 0; i < 4; ++i)
        {
            (void) harness.press(shiftTab);
            seen.push_back(harness.session.permission());
        }
        CHECK(seen
              == std::vector {
                  PermissionState::AcceptEdits, PermissionState::Plan, PermissionState::Bypass, PermissionState::Default,
              });
    }

    SECTION("the status line follows")
    {
        auto harness = Harness(Scenario {});
        (void) harness.press(shiftTab);
        (void) harness.press(shiftTab);
        CHECK(harness.screen().contains("⏸ plan mode on (shift+tab to cycle)"));
    }
}

// =============================================================================
// Model and display
// =============================================================================

TEST_CASE("Session: the model picker switches the model", "[session][model]")
{
    auto harness = Harness(Scenario {});
    CHECK(harness.session.model() == "claude-opus-4-5-20251101");
    CHECK(harness.screen().contains("Opus 4.5 · Claude Max"));

    (void) harness.press(tui::charKey(U'p', tui::Modifier::Alt));
    CHECK(harness.screen().contains("Select model"));
    (void) harness.press(tui::charKey(U'3'));

    CHECK(harness.session.model() == tui::ModelChoices[2].id);
    CHECK(harness.screen().contains("Haiku 4.5 · Claude Max"));
}

TEST_CASE("Session: the thinking toggle", "[session][thinking]")
{
    auto scenario = Scenario {};
    scenario.rules.push_back(ruleFor("hi", ResponseSpec { .text = "Hello." }));
    auto harness = Harness(std::move(scenario));
    auto const altT = tui::charKey(U't', tui::Modifier::Alt);

    (void) harness.press(altT);
    REQUIRE(std::holds_alternative<tui::ThinkingToggleMode>(harness.session.mode()));
    CHECK(harness.screen().contains("Toggle thinking mode"));
    CHECK_FALSE(harness.screen().contains("Changing mid-conversation"));

    (void) harness.press(tui::charKey(U'2'));
    CHECK_FALSE(harness.session.thinkingEnabled());
    CHECK(std::holds_alternative<tui::NormalMode>(harness.session.mode()));
    CHECK(harness.screen().contains("Thinking off"));

    SECTION("mid-conversation the dialog warns")
    {
        (void) harness.submit("hi");
        (void) harness.press(altT);
        CHECK(harness.screen().contains("Changing mid-conversation may reduce quality."));
        CHECK(std::get<tui::ThinkingToggleMode>(harness.session.mode()).selected == 1);
    }

    SECTION("Escape leaves the setting alone")
    {
        (void) harness.press(altT);
        (void) harness.press(tui::namedKey(tui::KeyCode::Down));
        (void) harness.press(tui::namedKey(tui::KeyCode::Escape));
        CHECK_FALSE(harness.session.thinkingEnabled());
    }

    SECTION("Enter applies the highlighted option")
    {
        (void) harness.press(altT);
        (void) harness.press(tui::namedKey(tui::KeyCode::Tab));
        (void) harness.press(tui::namedKey(tui::KeyCode::Enter));
        CHECK(harness.session.thinkingEnabled());
        CHECK_FALSE(harness.screen().contains("Thinking off"));
    }
}

TEST_CASE("Session: the slash menu completes commands", "[session][commands]")
{
    auto harness = Harness(Scenario {});
    harness.type("/he");
    CHECK(harness.screen().contains("/help"));
    CHECK(harness.screen().contains("Show help and available commands"));

    (void) harness.press(tui::namedKey(tui::KeyCode::Tab));
    CHECK(harness.session.inputText() == "/help");
    CHECK_FALSE(harness.screen().contains("Show help and available commands"));

    (void) harness.press(tui::namedKey(tui::KeyCode::Enter));
    CHECK(harness.entries().front() == prompt("/help"));
}

TEST_CASE("Session: the --model option overrides the scenario", "[session][model]")
{
    auto harness = Harness(Scenario {}, SessionOptions { .model = "claude-sonnet-4-20250514" });
    CHECK(harness.session.model() == "claude-sonnet-4-20250514");
}

TEST_CASE("Session: Ctrl+L asks for a screen clear", "[session]")
{
    auto harness = Harness(Scenario {});
    CHECK(harness.ctrl(U'l') == SessionRequest::ClearScreen);
}

TEST_CASE("Session: resizing changes the grid", "[session]")
{
    auto harness = Harness(Scenario {}, SessionOptions { .columns = 100, .rows = 30 });
    CHECK(harness.session.render().columns() == 100);
    harness.session.resize(60, 20);
    auto const grid = harness.session.render();
    CHECK(grid.columns() == 60);
    CHECK(grid.rows() == 20);
}
