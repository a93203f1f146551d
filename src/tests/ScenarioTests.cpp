// SPDX-License-Identifier: Apache-2.0
#include <engine/Failure.hpp>
#include <engine/Permission.hpp>
#include <engine/Scenario.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>
#include <fstream>

using namespace mimic;
using namespace std::chrono_literals;

namespace
{
auto parse(std::string_view text, std::filesystem::path const& baseDir = ".") -> Result<Scenario>
{
    return parseScenario(nlohmann::json::parse(text), baseDir);
}

auto parseOk(std::string_view text) -> Scenario
{
    auto result = parse(text);
    if (!result)
        FAIL(std::format("{}", result.error()));
    return std::move(*result);
}

auto failureOf(std::string_view text) -> FailureSpec
{
    auto result = parseFailure(nlohmann::json::parse(text));
    REQUIRE(result.has_value());
    return *result;
}
} // namespace

// =============================================================================
// Scenario documents
// =============================================================================

TEST_CASE("Scenario: an empty document yields the defaults", "[scenario]")
{
    auto const scenario = parseOk("{}");
    CHECK(scenario.name == "default");
    CHECK(scenario.rules.empty());
    CHECK(scenario.defaultResponse.text == FallbackResponseText);
    CHECK(scenario.identity.model == "claude-opus-4-5-20251101");
    CHECK(scenario.identity.product == "Claude Code");
    CHECK(scenario.environment.permissionMode == PermissionState::Default);
    CHECK_FALSE(scenario.environment.allowBypass);
    CHECK(scenario.timeouts.exitHint == 2000ms);
    CHECK(scenario.timeouts.responseDelay == 0ms);
    CHECK_FALSE(scenario.sessionId.has_value());
}

TEST_CASE("Scenario: a complete document", "[scenario]")
{
    auto const scenario = parseOk(R"({
        "name": "demo",
        "default_response": "Try again.",
        "responses": [
            { "pattern": { "type": "exact", "text": "hello" }, "response": "Hi!" },
            {
                "pattern": { "type": "regex", "pattern": "^deploy" },
                "response": {
                    "text": "Deploying now",
                    "delay_ms": 250,
                    "chunks": ["Deploying", " now"],
                    "chunk_interval_ms": 40,
                    "tool_calls": [
                        { "tool": "Bash", "input": { "command": "make deploy" }, "result": "done" }
                    ]
                },
                "max_matches": 1
            },
            { "pattern": { "type": "glob", "pattern": "*fail*" }, "failure": { "type": "rate_limit", "retry_after": 30 } },
            { "pattern": { "type": "any" }, "response": "catch-all" }
        ],
        "identity": { "model": "claude-sonnet-4-20250514", "version": "9.9.9", "user_name": "Tester" },
        "environment": { "working_directory": "/work", "permission_mode": "plan", "allow_bypass": true },
        "timeouts": { "exit_hint_ms": 500, "response_delay_ms": 100 },
        "session_id": "12345678-90ab-cdef-1234-567890abcdef"
    })");

    CHECK(scenario.name == "demo");
    CHECK(scenario.defaultResponse.text == "Try again.");
    REQUIRE(scenario.rules.size() == 4);

    SECTION("rules")
    {
        CHECK(patternKindName(scenario.rules[0].pattern) == "exact");
        CHECK(scenario.rules[0].response.text == "Hi!");
        CHECK_FALSE(scenario.rules[0].response.delay.has_value());

        auto const& deploy = scenario.rules[1];
        CHECK(deploy.response.text == "Deploying now");
        CHECK(deploy.response.delay == 250ms);
        CHECK(deploy.response.chunks == std::vector<std::string> { "Deploying", " now" });
        CHECK(deploy.response.chunkInterval == 40ms);
        REQUIRE(deploy.response.toolCalls.size() == 1);
        CHECK(deploy.response.toolCalls[0].tool == "Bash");
        CHECK(deploy.response.toolCalls[0].input["command"] == "make deploy");
        CHECK(deploy.response.toolCalls[0].result == "done");
        CHECK(deploy.maxMatches == 1u);

        REQUIRE(scenario.rules[2].response.failure.has_value());
        CHECK(scenario.rules[2].response.failure->kind == FailureKind::RateLimit);
        CHECK(scenario.rules[2].response.failure->retryAfter == 30);

        CHECK(patternKindName(scenario.rules[3].pattern) == "any");
    }

    SECTION("identity and environment")
    {
        CHECK(scenario.identity.model == "claude-sonnet-4-20250514");
        CHECK(scenario.identity.version == "9.9.9");
        CHECK(scenario.identity.userName == "Tester");
        CHECK(scenario.identity.provider == "Claude Max");
        CHECK(scenario.environment.workingDirectory == "/work");
        CHECK(scenario.environment.permissionMode == PermissionState::Plan);
        CHECK(scenario.environment.allowBypass);
        CHECK(scenario.timeouts.exitHint == 500ms);
        CHECK(scenario.timeouts.responseDelay == 100ms);
        CHECK(scenario.sessionId == "12345678-90ab-cdef-1234-567890abcdef");
    }
}

TEST_CASE("Scenario: chunks alone provide the text", "[scenario]")
{
    auto const scenario = parseOk(R"({
        "responses": [ { "pattern": { "type": "any" }, "response": { "chunks": ["a", "b"] } } ]
    })");
    CHECK(scenario.rules[0].response.text == "ab");
}

TEST_CASE("Scenario: bypass as the start mode implies allow_bypass", "[scenario]")
{
    auto const scenario = parseOk(R"({ "environment": { "permission_mode": "bypassPermissions" } })");
    CHECK(scenario.environment.permissionMode == PermissionState::Bypass);
    CHECK(scenario.environment.allowBypass);
}

TEST_CASE("Scenario: invalid documents are rejected", "[scenario]")
{
    auto const rejects = [](std::string_view text, std::string_view fragment) {
        auto const result = parse(text);
        REQUIRE_FALSE(result.has_value());
        INFO(result.error().message);
        CHECK(result.error().message.find(fragment) != std::string::npos);
        return result.error().code;
    };

    SECTION("not an object")
    {
        CHECK(rejects("[]", "JSON object") == ErrorCode::ScenarioError);
    }

    SECTION("failure combined with text")
    {
        rejects(R"({ "responses": [ { "pattern": { "type": "any" },
                                       "response": { "text": "hi", "failure": { "type": "auth_error" } } } ] })",
                "cannot be combined");
    }

    SECTION("failure combined with text at rule level")
    {
        rejects(R"({ "responses": [ { "pattern": { "type": "any" }, "response": "hi",
                                       "failure": { "type": "out_of_credits" } } ] })",
                "responses[0]");
    }

    SECTION("rule without response")
    {
        rejects(R"({ "responses": [ { "pattern": { "type": "any" } } ] })", "needs a \"response\" or a \"failure\"");
    }

    SECTION("rule without pattern")
    {
        rejects(R"({ "responses": [ { "response": "x" } ] })", "missing \"pattern\"");
    }

    SECTION("unknown pattern type")
    {
        rejects(R"({ "responses": [ { "pattern": { "type": "fuzzy" }, "response": "x" } ] })", "fuzzy");
    }

    SECTION("invalid regex names the rule")
    {
        auto const code = rejects(R"({ "responses": [ { "pattern": { "type": "any" }, "response": "x" },
                                                       { "pattern": { "type": "regex", "pattern": "(" }, "response": "y" } ] })",
                                  "responses[1]");
        CHECK(code == ErrorCode::PatternError);
    }

    SECTION("chunks that disagree with the text")
    {
        rejects(R"({ "responses": [ { "pattern": { "type": "any" },
                                       "response": { "text": "abc", "chunks": ["a", "b"] } } ] })",
                "do not add up");
    }

    SECTION("negative max_matches")
    {
        rejects(R"({ "responses": [ { "pattern": { "type": "any" }, "response": "x", "max_matches": -1 } ] })",
                "max_matches");
    }

    SECTION("max_matches beyond the counter range")
    {
        rejects(R"({ "responses": [ { "pattern": { "type": "any" }, "response": "x",
                                       "max_matches": 4294967296 } ] })",
                "max_matches");
    }

    SECTION("negative delay")
    {
        rejects(R"({ "responses": [ { "pattern": { "type": "any" },
                                       "response": { "text": "x", "delay_ms": -5 } } ] })",
                "delay_ms");
    }

    SECTION("fractional chunk interval")
    {
        rejects(R"({ "responses": [ { "pattern": { "type": "any" },
                                       "response": { "text": "x", "chunk_interval_ms": 1.5 } } ] })",
                "chunk_interval_ms");
    }

    SECTION("negative timeout")
    {
        rejects(R"({ "timeouts": { "exit_hint_ms": -1 }, "responses": [] })", "exit_hint_ms");
    }

    SECTION("negative retry_after")
    {
        rejects(R"({ "responses": [ { "pattern": { "type": "any" },
                                       "failure": { "type": "rate_limit", "retry_after": -3 } } ] })",
                "retry_after");
    }

    SECTION("unknown failure type")
    {
        rejects(R"({ "responses": [ { "pattern": { "type": "any" }, "failure": { "type": "meteor" } } ] })", "meteor");
    }

    SECTION("bad permission mode")
    {
        rejects(R"({ "environment": { "permission_mode": "yolo" } })", "yolo");
    }

    SECTION("bad session id")
    {
        rejects(R"({ "session_id": "not-a-uuid" })", "not-a-uuid");
    }
}

TEST_CASE("Scenario: $file references are resolved relative to the scenario", "[scenario]")
{
    auto const dir = std::filesystem::temp_directory_path() / "mimic_scenario_refs";
    std::filesystem::create_directories(dir);
    {
        auto file = std::ofstream(dir / "hello.py");
        file << "print('hi')\n";
    }
    {
        auto file = std::ofstream(dir / "scenario.json");
        file << R"({
            "name": "refs",
            "responses": [ {
                "pattern": { "type": "contains", "text": "create" },
                "response": {
                    "text": "Created.",
                    "tool_calls": [ { "tool": "Write", "input": { "file_path": "hello.py", "content": { "$file": "hello.py" } } } ]
                }
            } ]
        })";
    }

    auto const scenario = loadScenarioFromFile((dir / "scenario.json").string());
    REQUIRE(scenario.has_value());
    CHECK(scenario->name == "refs");
    CHECK(scenario->rules[0].response.toolCalls[0].input["content"] == "print('hi')\n");

    SECTION("a missing reference is an I/O error")
    {
        auto const bad = parse(R"({ "responses": [ { "pattern": { "type": "any" }, "response": {
                                       "tool_calls": [ { "tool": "Write", "input": { "content": { "$file": "nope.txt" } } } ] } } ] })",
                               dir);
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == ErrorCode::IoError);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Scenario: a missing file is an I/O error", "[scenario]")
{
    auto const result = loadScenarioFromFile("/nonexistent/scenario.json");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::IoError);
}

TEST_CASE("Scenario: UUID validation", "[scenario]")
{
    CHECK(isValidUuid("12345678-90ab-cdef-1234-567890ABCDEF"));
    CHECK_FALSE(isValidUuid("12345678-90ab-cdef-1234-567890abcde"));
    CHECK_FALSE(isValidUuid("12345678090ab-cdef-1234-567890abcdef"));
    CHECK_FALSE(isValidUuid("g2345678-90ab-cdef-1234-567890abcdef"));
}

// =============================================================================
// Tool call display
// =============================================================================

TEST_CASE("Scenario: tool call summaries", "[scenario][tools]")
{
    auto const bash = ToolCallSpec { .tool = "Bash", .input = { { "command", "npm test" } }, .result = "42 passed" };
    CHECK(toolCallDisplay(bash) == "Bash(npm test)\n  ⎿  42 passed");
    CHECK(pendingToolCallDisplay(bash) == "Bash(npm test)\n  ⎿  Running…");

    auto const edit = ToolCallSpec { .tool = "Edit", .input = { { "file_path", "src/main.rs" } } };
    CHECK(toolCallDisplay(edit) == "Update(src/main.rs)");

    auto const write = ToolCallSpec { .tool = "Write", .input = { { "file_path", "a.txt" } }, .result = "Wrote 1 line" };
    CHECK(toolCallDisplay(write) == "Write(a.txt)\n  ⎿  Wrote 1 line");

    auto const read = ToolCallSpec { .tool = "Read", .input = { { "file_path", "a.txt" } }, .result = "1 file" };
    CHECK(toolCallDisplay(read) == "Read 1 file (ctrl+o to expand)");
    auto const unread = ToolCallSpec { .tool = "Read", .input = { { "file_path", "a.txt" } } };
    CHECK(toolCallDisplay(unread) == "Read (ctrl+o to expand)");

    auto const other = ToolCallSpec { .tool = "WebSearch" };
    CHECK(toolCallDisplay(other) == "WebSearch");
    CHECK(toolCallSubject(other).empty());
}

// =============================================================================
// Failures
// =============================================================================

TEST_CASE("Failure: defaults per type", "[failure]")
{
    CHECK(failureOf(R"({ "type": "connection_timeout" })").afterMs == 5000);
    CHECK(failureOf(R"({ "type": "rate_limit" })").retryAfter == 60);
    CHECK(failureOf(R"({ "type": "auth_error" })").detail == "Invalid API key");
    CHECK(failureOf(R"({ "type": "auth_error", "message": "Key revoked" })").detail == "Key revoked");
}

TEST_CASE("Failure: messages and exit codes", "[failure]")
{
    auto const network = FailureSpec { .kind = FailureKind::NetworkUnreachable };
    CHECK(conversationText(network) == "Error: Network is unreachable");
    CHECK(printText(network) == "Network error: Connection refused");
    CHECK(exitCodeFor(network) == exit_code::Error);
    CHECK(isErrorResult(network));

    auto const timeout = FailureSpec { .kind = FailureKind::ConnectionTimeout, .afterMs = 1500 };
    CHECK(conversationText(timeout) == "Error: Connection timed out after 1500ms");
    CHECK(printText(timeout) == "Network error: Connection timed out after 1500ms");

    auto const rate = FailureSpec { .kind = FailureKind::RateLimit, .retryAfter = 30 };
    CHECK(conversationText(rate) == "Error: Rate limited. Retry after 30 seconds.");
    CHECK(printText(rate) == "Rate limited. Retry after 30 seconds.");

    auto const credits = FailureSpec { .kind = FailureKind::OutOfCredits };
    CHECK(printText(credits) == "Billing error: No credits remaining");

    auto const partial = FailureSpec { .kind = FailureKind::PartialResponse, .detail = "I was going" };
    CHECK(printText(partial) == "I was going");
    CHECK(exitCodeFor(partial) == exit_code::Partial);

    auto const malformed = FailureSpec { .kind = FailureKind::MalformedJson, .detail = "{\"broken" };
    CHECK(exitCodeFor(malformed) == exit_code::Success);
    CHECK_FALSE(isErrorResult(malformed));
}

TEST_CASE("Failure: type names", "[failure]")
{
    CHECK(failureTypeName(FailureKind::MalformedJson) == "malformed_json");
    CHECK(failureTypeName(FailureKind::OutOfCredits) == "out_of_credits");
}

// =============================================================================
// Permission modes
// =============================================================================

TEST_CASE("Permission: the cycle includes bypass only when allowed", "[permission]")
{
    CHECK(nextPermission(PermissionState::Default, false) == PermissionState::AcceptEdits);
    CHECK(nextPermission(PermissionState::AcceptEdits, false) == PermissionState::Plan);
    CHECK(nextPermission(PermissionState::Plan, false) == PermissionState::Default);
    CHECK(nextPermission(PermissionState::Plan, true) == PermissionState::Bypass);
    CHECK(nextPermission(PermissionState::Bypass, true) == PermissionState::Default);
}

TEST_CASE("Permission: CLI spellings", "[permission]")
{
    CHECK(parsePermissionMode("acceptEdits") == PermissionState::AcceptEdits);
    CHECK(parsePermissionMode("accept-edits") == PermissionState::AcceptEdits);
    CHECK(parsePermissionMode("bypass-permissions") == PermissionState::Bypass);
    CHECK(parsePermissionMode("plan") == PermissionState::Plan);
    CHECK_FALSE(parsePermissionMode("auto").has_value());
    CHECK(permissionLabel(PermissionState::AcceptEdits) == "accept edits");
}
