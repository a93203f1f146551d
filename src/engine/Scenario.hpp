// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <engine/Failure.hpp>
#include <engine/Pattern.hpp>
#include <engine/Permission.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mimic
{

/// @brief Text used when a response resolves to nothing.
constexpr auto FallbackResponseText = std::string_view { "I'm not sure how to help with that." };

/// @brief A simulated tool invocation shown before the final response text.
struct ToolCallSpec
{
    std::string tool;
    nlohmann::json input = nlohmann::json::object();
    std::optional<std::string> result;
};

/// @brief What a matched rule produces.
struct ResponseSpec
{
    std::string text;
    std::optional<Millis> delay;          ///< Falls back to Timeouts::responseDelay.
    std::vector<std::string> chunks;      ///< Streaming pieces; empty means one chunk of @c text.
    Millis chunkInterval { 0 };
    std::vector<ToolCallSpec> toolCalls;
    std::optional<FailureSpec> failure;   ///< Mutually exclusive with @c text.
};

/// @brief One pattern to response mapping.
struct Rule
{
    Pattern pattern;
    ResponseSpec response;
    std::optional<unsigned> maxMatches;
};

/// @brief Branding shown in the header and print output.
struct Identity
{
    std::string model = "claude-opus-4-5-20251101";
    std::string version = "2.1.12";
    std::string product = "Claude Code";
    std::string provider = "Claude Max";
    std::string userName = "Alfred";
    std::string placeholder = R"(Try "refactor mod.rs")";
};

/// @brief Simulated environment of the session.
struct Environment
{
    std::string workingDirectory; ///< Empty means the process working directory.
    PermissionState permissionMode = PermissionState::Default;
    bool allowBypass = false;
};

struct Timeouts
{
    Millis exitHint { 2000 };
    Millis responseDelay { 0 };
};

/// @brief Declarative description of how the simulator responds. Immutable once loaded.
struct Scenario
{
    std::string name = "default";
    ResponseSpec defaultResponse { .text = std::string(FallbackResponseText) };
    std::vector<Rule> rules;
    Identity identity;
    Environment environment;
    Timeouts timeouts;
    std::optional<std::string> sessionId;
};

/// @brief Builds a Scenario from a parsed JSON document.
/// @param root The scenario document.
/// @param baseDir Directory that "$file" references are resolved against.
/// @return The validated scenario, or a ScenarioError/PatternError/IoError.
[[nodiscard]] auto parseScenario(nlohmann::json const& root, std::filesystem::path const& baseDir)
    -> Result<Scenario>;

/// @brief Reads and parses a scenario file.
[[nodiscard]] auto loadScenarioFromFile(std::string_view path) -> Result<Scenario>;

/// @brief Whether @p text has the 8-4-4-4-12 hexadecimal UUID form.
[[nodiscard]] auto isValidUuid(std::string_view text) noexcept -> bool;

/// @brief Summary line for a tool call, with its result once known ("Bash(make)\n  ⎿  ok").
[[nodiscard]] auto toolCallDisplay(ToolCallSpec const& call) -> std::string;

/// @brief Summary line for a tool call still awaiting permission ("Bash(make)\n  ⎿  Running…").
[[nodiscard]] auto pendingToolCallDisplay(ToolCallSpec const& call) -> std::string;

/// @brief The command or file path a tool call acts on.
[[nodiscard]] auto toolCallSubject(ToolCallSpec const& call) -> std::string;

} // namespace mimic
