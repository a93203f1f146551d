// SPDX-License-Identifier: Apache-2.0
#include "Scenario.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cctype>
#include <cstdint>
#include <format>
#include <limits>
#include <fstream>
#include <sstream>

namespace mimic
{

namespace
{
    auto readFile(std::filesystem::path const& path) -> Result<std::string>
    {
        auto file = std::ifstream(path);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", path.string()));

        auto ss = std::stringstream {};
        ss << file.rdbuf();
        return ss.str();
    }

    /// Replaces every {"$file": "relative/path"} object with the referenced file's content.
    /// JSON files are spliced in as JSON, anything else as a string.
    auto resolveFileReferences(nlohmann::json value, std::filesystem::path const& baseDir) -> Result<nlohmann::json>
    {
        if (value.is_object())
        {
            if (value.contains("$file") && value["$file"].is_string())
            {
                auto const relative = value["$file"].get<std::string>();
                auto const fullPath = baseDir / relative;
                auto content = readFile(fullPath);
                if (!content)
                    return makeError(ErrorCode::IoError,
                                     std::format("Failed to resolve file reference '{}': {}",
                                                 relative,
                                                 content.error().message));
                if (fullPath.extension() == ".json")
                    return json::parse(*content);
                return nlohmann::json(std::move(*content));
            }

            for (auto& [key, child]: value.items())
            {
                auto resolved = resolveFileReferences(std::move(child), baseDir);
                if (!resolved)
                    return std::unexpected(resolved.error());
                child = std::move(*resolved);
            }
            return value;
        }

        if (value.is_array())
        {
            for (auto& child: value)
            {
                auto resolved = resolveFileReferences(std::move(child), baseDir);
                if (!resolved)
                    return std::unexpected(resolved.error());
                child = std::move(*resolved);
            }
        }
        return value;
    }

    auto parsePattern(nlohmann::json const& obj) -> Result<Pattern>
    {
        if (!obj.is_object())
            return makeError(ErrorCode::ScenarioError, "pattern must be an object");

        auto const type = json::getStringOr(obj, "type", "");
        if (type == "any")
            return AnyPattern {};

        if (type == "contains" || type == "exact")
        {
            auto text = json::getString(obj, "text");
            if (!text)
                return makeError(ErrorCode::ScenarioError, std::format("{} pattern needs \"text\"", type));
            return type == "contains" ? makeContains(std::move(*text)) : makeExact(std::move(*text));
        }

        if (type == "regex" || type == "glob")
        {
            auto source = json::getString(obj, "pattern");
            if (!source)
                return makeError(ErrorCode::ScenarioError, std::format("{} pattern needs \"pattern\"", type));
            return type == "regex" ? makeRegex(std::move(*source)) : makeGlob(std::move(*source));
        }

        return makeError(ErrorCode::ScenarioError, std::format("Unknown pattern type '{}'", type));
    }

    auto parseToolCall(nlohmann::json const& obj, std::filesystem::path const& baseDir) -> Result<ToolCallSpec>
    {
        if (!obj.is_object())
            return makeError(ErrorCode::ScenarioError, "tool call must be an object");

        auto tool = json::getString(obj, "tool");
        if (!tool)
            return makeError(ErrorCode::ScenarioError, "tool call is missing \"tool\"");

        auto call = ToolCallSpec { .tool = std::move(*tool) };
        if (obj.contains("input"))
        {
            auto input = resolveFileReferences(obj["input"], baseDir);
            if (!input)
                return std::unexpected(input.error());
            call.input = std::move(*input);
        }
        if (obj.contains("result") && obj["result"].is_string())
            call.result = obj["result"].get<std::string>();
        return call;
    }

    auto parseResponse(nlohmann::json const& value, std::filesystem::path const& baseDir) -> Result<ResponseSpec>
    {
        auto response = ResponseSpec {};
        if (value.is_string())
        {
            response.text = value.get<std::string>();
            return response;
        }
        if (!value.is_object())
            return makeError(ErrorCode::ScenarioError, "response must be a string or an object");

        response.text = json::getStringOr(value, "text", "");
        if (value.contains("delay_ms"))
        {
            auto const delay = json::getUInt64Or(value, "delay_ms", 0);
            if (!delay)
                return std::unexpected(delay.error());
            response.delay = Millis { *delay };
        }
        auto const chunkInterval = json::getUInt64Or(value, "chunk_interval_ms", 0);
        if (!chunkInterval)
            return std::unexpected(chunkInterval.error());
        response.chunkInterval = Millis { *chunkInterval };

        if (value.contains("chunks"))
        {
            if (!value["chunks"].is_array())
                return makeError(ErrorCode::ScenarioError, "\"chunks\" must be an array of strings");
            auto joined = std::string {};
            for (auto const& chunk: value["chunks"])
            {
                if (!chunk.is_string())
                    return makeError(ErrorCode::ScenarioError, "\"chunks\" must be an array of strings");
                response.chunks.push_back(chunk.get<std::string>());
                joined += response.chunks.back();
            }
            if (response.text.empty())
                response.text = joined;
            else if (response.text != joined)
                return makeError(ErrorCode::ScenarioError, "\"chunks\" do not add up to \"text\"");
        }

        if (value.contains("tool_calls"))
        {
            if (!value["tool_calls"].is_array())
                return makeError(ErrorCode::ScenarioError, "\"tool_calls\" must be an array");
            for (auto const& entry: value["tool_calls"])
            {
                auto call = parseToolCall(entry, baseDir);
                if (!call)
                    return std::unexpected(call.error());
                response.toolCalls.push_back(std::move(*call));
            }
        }

        if (value.contains("failure"))
        {
            auto failure = parseFailure(value["failure"]);
            if (!failure)
                return std::unexpected(failure.error());
            response.failure = std::move(*failure);
        }

        return response;
    }

    auto validateResponse(ResponseSpec const& response, std::string_view where) -> VoidResult
    {
        if (response.failure && !response.text.empty())
            return makeError(ErrorCode::ScenarioError,
                             std::format("{}: a failure cannot be combined with response text", where));
        return {};
    }

    auto parseRule(nlohmann::json const& obj, std::size_t index, std::filesystem::path const& baseDir)
        -> Result<Rule>
    {
        auto const where = std::format("responses[{}]", index);
        if (!obj.is_object() || !obj.contains("pattern"))
            return makeError(ErrorCode::ScenarioError, std::format("{}: missing \"pattern\"", where));

        auto pattern = parsePattern(obj["pattern"]);
        if (!pattern)
            return makeError(pattern.error().code, std::format("{}: {}", where, pattern.error().message));

        auto rule = Rule { .pattern = std::move(*pattern), .response = {}, .maxMatches = std::nullopt };

        if (!obj.contains("response") && !obj.contains("failure"))
            return makeError(ErrorCode::ScenarioError,
                             std::format("{}: needs a \"response\" or a \"failure\"", where));

        if (obj.contains("response"))
        {
            auto response = parseResponse(obj["response"], baseDir);
            if (!response)
                return makeError(response.error().code, std::format("{}: {}", where, response.error().message));
            rule.response = std::move(*response);
        }

        if (obj.contains("failure"))
        {
            if (rule.response.failure)
                return makeError(ErrorCode::ScenarioError, std::format("{}: failure given twice", where));
            auto failure = parseFailure(obj["failure"]);
            if (!failure)
                return makeError(failure.error().code, std::format("{}: {}", where, failure.error().message));
            rule.response.failure = std::move(*failure);
        }

        if (auto valid = validateResponse(rule.response, where); !valid)
            return std::unexpected(valid.error());

        if (obj.contains("max_matches"))
        {
            auto const& limit = obj["max_matches"];
            if (!limit.is_number_unsigned())
                return makeError(ErrorCode::ScenarioError,
                                 std::format("{}: \"max_matches\" must be a non-negative integer", where));
            if (limit.get<std::uint64_t>() > std::numeric_limits<unsigned>::max())
                return makeError(ErrorCode::ScenarioError,
                                 std::format("{}: \"max_matches\" is larger than {}",
                                             where,
                                             std::numeric_limits<unsigned>::max()));
            rule.maxMatches = limit.get<unsigned>();
        }

        return rule;
    }

    auto stringField(nlohmann::json const& input, std::string_view key) -> std::string
    {
        return json::getStringOr(input, key, "");
    }
} // namespace

auto isValidUuid(std::string_view text) noexcept -> bool
{
    if (text.size() != 36)
        return false;
    for (auto i = std::size_t { 0 }; i < text.size(); ++i)
    {
        auto const ch = static_cast<unsigned char>(text[i]);
        if (i == 8 || i == 13 || i == 18 || i == 23)
        {
            if (ch != '-')
                return false;
        }
        else if (!std::isxdigit(ch))
        {
            return false;
        }
    }
    return true;
}

auto parseScenario(nlohmann::json const& root, std::filesystem::path const& baseDir) -> Result<Scenario>
{
    if (!root.is_object())
        return makeError(ErrorCode::ScenarioError, "scenario must be a JSON object");

    auto scenario = Scenario {};
    scenario.name = json::getStringOr(root, "name", scenario.name);

    if (root.contains("default_response"))
    {
        auto response = parseResponse(root["default_response"], baseDir);
        if (!response)
            return makeError(response.error().code, std::format("default_response: {}", response.error().message));
        if (auto valid = validateResponse(*response, "default_response"); !valid)
            return std::unexpected(valid.error());
        scenario.defaultResponse = std::move(*response);
    }

    if (root.contains("responses"))
    {
        if (!root["responses"].is_array())
            return makeError(ErrorCode::ScenarioError, "\"responses\" must be an array");
        auto index = std::size_t { 0 };
        for (auto const& entry: root["responses"])
        {
            auto rule = parseRule(entry, index++, baseDir);
            if (!rule)
                return std::unexpected(rule.error());
            scenario.rules.push_back(std::move(*rule));
        }
    }

    if (root.contains("identity"))
    {
        auto const& identity = root["identity"];
        auto& out = scenario.identity;
        out.model = json::getStringOr(identity, "model", out.model);
        out.version = json::getStringOr(identity, "version", out.version);
        out.product = json::getStringOr(identity, "product", out.product);
        out.provider = json::getStringOr(identity, "provider", out.provider);
        out.userName = json::getStringOr(identity, "user_name", out.userName);
        out.placeholder = json::getStringOr(identity, "placeholder", out.placeholder);
    }

    if (root.contains("environment"))
    {
        auto const& environment = root["environment"];
        scenario.environment.workingDirectory = json::getStringOr(environment, "working_directory", "");
        scenario.environment.allowBypass = json::getBoolOr(environment, "allow_bypass", false);
        if (environment.contains("permission_mode"))
        {
            auto const text = json::getStringOr(environment, "permission_mode", "");
            auto const mode = parsePermissionMode(text);
            if (!mode)
                return makeError(ErrorCode::ScenarioError, std::format("Invalid permission_mode '{}'", text));
            scenario.environment.permissionMode = *mode;
            if (*mode == PermissionState::Bypass)
                scenario.environment.allowBypass = true;
        }
    }

    if (root.contains("timeouts"))
    {
        auto const& timeouts = root["timeouts"];
        auto const exitHint = json::getUInt64Or(timeouts, "exit_hint_ms", 2000);
        if (!exitHint)
            return makeError(exitHint.error().code, std::format("timeouts: {}", exitHint.error().message));
        auto const responseDelay = json::getUInt64Or(timeouts, "response_delay_ms", 0);
        if (!responseDelay)
            return makeError(responseDelay.error().code, std::format("timeouts: {}", responseDelay.error().message));
        scenario.timeouts.exitHint = Millis { *exitHint };
        scenario.timeouts.responseDelay = Millis { *responseDelay };
    }

    if (root.contains("session_id"))
    {
        auto const id = json::getStringOr(root, "session_id", "");
        if (!isValidUuid(id))
            return makeError(ErrorCode::ScenarioError,
                             std::format("Invalid session_id '{}': must be a valid UUID", id));
        scenario.sessionId = id;
    }

    return scenario;
}

auto loadScenarioFromFile(std::string_view path) -> Result<Scenario>
{
    auto content = readFile(std::filesystem::path(path));
    if (!content)
        return makeError(ErrorCode::IoError, std::format("Cannot open scenario file: {}", path));

    auto parsed = json::parse(*content);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto const baseDir = std::filesystem::path(path).parent_path();
    auto scenario = parseScenario(*parsed, baseDir.empty() ? std::filesystem::path(".") : baseDir);
    if (scenario)
        log::info("Loaded scenario '{}' with {} rule(s) from {}", scenario->name, scenario->rules.size(), path);
    return scenario;
}

auto toolCallSubject(ToolCallSpec const& call) -> std::string
{
    if (call.tool == "Bash")
        return stringField(call.input, "command");
    if (call.tool == "Edit" || call.tool == "Write" || call.tool == "Read")
        return stringField(call.input, "file_path");
    return {};
}

auto pendingToolCallDisplay(ToolCallSpec const& call) -> std::string
{
    if (call.tool == "Bash")
        return std::format("Bash({})\n  ⎿  Running…", toolCallSubject(call));
    if (call.tool == "Edit")
        return std::format("Update({})", toolCallSubject(call));
    if (call.tool == "Write")
        return std::format("Write({})", toolCallSubject(call));
    return call.tool;
}

auto toolCallDisplay(ToolCallSpec const& call) -> std::string
{
    auto const withResult = [&](std::string head) {
        if (call.result)
            head += std::format("\n  ⎿  {}", *call.result);
        return head;
    };

    if (call.tool == "Bash")
        return withResult(std::format("Bash({})", toolCallSubject(call)));
    if (call.tool == "Edit")
        return withResult(std::format("Update({})", toolCallSubject(call)));
    if (call.tool == "Write")
        return withResult(std::format("Write({})", toolCallSubject(call)));
    if (call.tool == "Read")
        return call.result ? std::format("Read {} (ctrl+o to expand)", *call.result) : "Read (ctrl+o to expand)";
    return call.result ? *call.result : call.tool;
}

} // namespace mimic
