// SPDX-License-Identifier: Apache-2.0
#include "PrintMode.hpp"

#include <core/Clock.hpp>
#include <core/Log.hpp>
#include <engine/Matcher.hpp>
#include <engine/ResponseScheduler.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <functional>
#include <print>
#include <ranges>
#include <thread>

namespace mimic
{

namespace
{
    /// Tools announced in the stream-json init line.
    constexpr auto AnnouncedTools = std::array<std::string_view, 6> { "Bash", "Edit", "Glob", "Grep", "Read", "Write" };

    /// Final state of a print-mode turn.
    struct Outcome
    {
        std::string text;
        std::vector<ToolCallSpec> toolCalls;
        std::optional<FailureSpec> failure;
        Millis duration { 0 };
    };

    /// UUID-shaped text derived from two strings, stable across runs.
    auto stableUuid(std::string_view first, std::string_view second) -> std::string
    {
        auto const high = static_cast<std::uint64_t>(std::hash<std::string_view> {}(first));
        auto const low = static_cast<std::uint64_t>(std::hash<std::string_view> {}(second));
        return std::format("{:08x}-{:04x}-4{:03x}-8{:03x}-{:012x}",
                           high >> 32,
                           (high >> 16) & 0xFFFF,
                           high & 0xFFF,
                           low >> 52,
                           low & 0xFFFFFFFFFFFF);
    }

    auto runSchedule(ResponseSpec const& response, Millis defaultDelay, bool realTime) -> Result<Outcome>
    {
        auto manualClock = ManualClock {};
        auto steadyClock = SteadyClock {};
        Clock const& clock = realTime ? static_cast<Clock const&>(steadyClock) : manualClock;

        auto scheduler = ResponseScheduler(defaultDelay);
        if (auto scheduled = scheduler.schedule(response, clock.now()); !scheduled)
            return std::unexpected(scheduled.error());

        auto outcome = Outcome {};
        while (scheduler.active())
        {
            auto const due = scheduler.nextDue().value_or(clock.now());
            if (auto const now = clock.now(); due > now)
            {
                if (realTime)
                    std::this_thread::sleep_for(due - now);
                else
                    manualClock.set(due);
            }

            while (auto event = scheduler.next(clock.now()))
            {
                if (auto* toolCall = std::get_if<ToolCallEvent>(&*event))
                {
                    log::debug("Tool call {}: {}", toolCall->index, toolCall->call.tool);
                    outcome.toolCalls.push_back(std::move(toolCall->call));
                }
                else if (auto* completed = std::get_if<CompletedEvent>(&*event))
                    outcome.text = std::move(completed->text);
                else if (auto* failed = std::get_if<FailedEvent>(&*event))
                    outcome.failure = std::move(failed->failure);
            }
        }
        outcome.duration = clock.now();
        return outcome;
    }

    auto jsonResult(Outcome const& outcome, std::string const& sessionId) -> nlohmann::ordered_json
    {
        auto const durationMs = static_cast<std::uint64_t>(outcome.duration.count());
        auto result = nlohmann::ordered_json::object();
        result["type"] = "result";

        if (!outcome.failure)
        {
            result["subtype"] = "success";
            result["cost_usd"] = 0.0;
            result["is_error"] = false;
            result["duration_ms"] = durationMs;
            result["duration_api_ms"] = durationMs;
            result["num_turns"] = 1;
            result["result"] = outcome.text;
            result["session_id"] = sessionId;
        }
        else
        {
            result["subtype"] = "error";
            result["cost_usd"] = 0.0;
            result["is_error"] = true;
            result["duration_ms"] = durationMs;
            result["duration_api_ms"] = durationMs;
            result["num_turns"] = 0;
            result["error"] = printText(*outcome.failure);
            result["session_id"] = sessionId;
            if (outcome.failure->kind == FailureKind::RateLimit)
                result["retry_after"] = outcome.failure->retryAfter;
        }
        return result;
    }

    void printJsonResult(std::ostream& out, Outcome const& outcome, std::string const& sessionId)
    {
        std::println(out, "{}", jsonResult(outcome, sessionId).dump());
    }

    auto systemInit(std::string const& sessionId) -> nlohmann::ordered_json
    {
        auto init = nlohmann::ordered_json::object();
        init["type"] = "system";
        init["subtype"] = "init";
        init["session_id"] = sessionId;
        init["tools"] = nlohmann::ordered_json::array();
        for (auto const tool: AnnouncedTools)
            init["tools"].push_back(std::string(tool));
        init["mcp_servers"] = nlohmann::ordered_json::array();
        return init;
    }

    /// The whole response as one condensed assistant message.
    auto assistantMessage(Outcome const& outcome, std::string const& sessionId, std::string_view model)
        -> nlohmann::ordered_json
    {
        auto content = nlohmann::ordered_json::array();
        for (auto const& [index, call]: std::views::enumerate(outcome.toolCalls))
        {
            auto block = nlohmann::ordered_json::object();
            block["type"] = "tool_use";
            block["id"] = std::format("toolu_{:02}", index + 1);
            block["name"] = call.tool;
            block["input"] = call.input;
            content.push_back(std::move(block));
        }
        auto text = nlohmann::ordered_json::object();
        text["type"] = "text";
        text["text"] = outcome.text;
        content.push_back(std::move(text));

        auto usage = nlohmann::ordered_json::object();
        usage["input_tokens"] = 100;
        usage["output_tokens"] = std::max<std::size_t>(outcome.text.size() / 4, 1);

        auto message = nlohmann::ordered_json::object();
        message["id"] = std::format("msg_{:016x}", static_cast<std::uint64_t>(std::hash<std::string> {}(sessionId)));
        message["model"] = std::string(model);
        message["role"] = "assistant";
        message["type"] = "message";
        message["content"] = std::move(content);
        message["stop_reason"] = nullptr;
        message["stop_sequence"] = nullptr;
        message["usage"] = std::move(usage);

        auto event = nlohmann::ordered_json::object();
        event["type"] = "assistant";
        event["message"] = std::move(message);
        event["session_id"] = sessionId;
        event["uuid"] = stableUuid(sessionId, "assistant");
        return event;
    }
} // namespace

auto parseOutputFormat(std::string_view name) -> std::optional<OutputFormat>
{
    if (name == "text")
        return OutputFormat::Text;
    if (name == "json")
        return OutputFormat::Json;
    if (name == "stream-json")
        return OutputFormat::StreamJson;
    return std::nullopt;
}

auto printSessionId(Scenario const& scenario, std::string_view prompt) -> std::string
{
    if (scenario.sessionId)
        return *scenario.sessionId;
    return stableUuid(scenario.name, prompt);
}

auto runPrint(Scenario const& scenario, PrintOptions const& options, std::ostream& out, std::ostream& err) -> int
{
    auto matcher = Matcher(scenario);
    auto const& response = matcher.match(options.prompt).rule->response;

    auto outcome = runSchedule(response, scenario.timeouts.responseDelay, options.realTime);
    if (!outcome)
    {
        log::error("Failed to run response: {}", outcome.error());
        return exit_code::Error;
    }

    auto const sessionId = printSessionId(scenario, options.prompt);
    if (options.format == OutputFormat::StreamJson)
        std::println(out, "{}", systemInit(sessionId).dump());

    if (outcome->failure)
    {
        auto const& failure = *outcome->failure;
        switch (failure.kind)
        {
            case FailureKind::PartialResponse:
                std::print(out, "{}", printText(failure));
                out.flush();
                return exitCodeFor(failure);
            case FailureKind::MalformedJson:
                std::println(out, "{}", printText(failure));
                return exitCodeFor(failure);
            default: break;
        }

        if (options.format == OutputFormat::Text)
            std::println(err, "{}", printText(failure));
        else
            printJsonResult(out, *outcome, sessionId);
        return exitCodeFor(failure);
    }

    switch (options.format)
    {
        case OutputFormat::Text: std::println(out, "{}", outcome->text); break;
        case OutputFormat::Json: printJsonResult(out, *outcome, sessionId); break;
        case OutputFormat::StreamJson:
        {
            auto const model = options.model.empty() ? scenario.identity.model : options.model;
            std::println(out, "{}", assistantMessage(*outcome, sessionId, model).dump());
            printJsonResult(out, *outcome, sessionId);
            break;
        }
    }
    return exit_code::Success;
}

} // namespace mimic
