// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <engine/Scenario.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace mimic
{

/// @brief Output format of print mode.
enum class OutputFormat
{
    Text,
    Json,
    StreamJson, ///< One JSON object per line: system init, assistant message, result.
};

/// @brief Parses "text", "json" or "stream-json".
[[nodiscard]] auto parseOutputFormat(std::string_view name) -> std::optional<OutputFormat>;

struct PrintOptions
{
    std::string prompt;
    OutputFormat format = OutputFormat::Text;
    std::string model;     ///< Reported in stream-json output. Empty means the scenario's identity model.
    bool realTime = false; ///< Wait out delays on the steady clock instead of jumping the virtual one.
};

/// @brief Runs one non-interactive turn and writes its outcome.
///
/// The prompt is matched against the scenario and its schedule is run to the
/// end. Successful responses go to @p out. Injected failures are written to
/// @p err in text mode and as an error result object in the JSON formats;
/// partial and malformed responses are written raw to @p out.
///
/// @return The process exit status.
[[nodiscard]] auto runPrint(Scenario const& scenario, PrintOptions const& options, std::ostream& out, std::ostream& err)
    -> int;

/// @brief The session id reported in JSON output.
///
/// The scenario's session_id when present, otherwise a UUID-shaped value
/// derived from the scenario name and prompt so that repeated runs agree.
[[nodiscard]] auto printSessionId(Scenario const& scenario, std::string_view prompt) -> std::string;

} // namespace mimic
