// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <engine/Conversation.hpp>
#include <engine/Permission.hpp>
#include <engine/Scenario.hpp>
#include <tui/Grid.hpp>
#include <tui/InputState.hpp>
#include <tui/Mode.hpp>
#include <tui/SlashMenu.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mimic::tui
{

/// @brief Everything one frame depends on.
struct RenderInput
{
    Conversation const& conversation;
    InputState const& input;
    Mode const& mode;
    Identity const& identity;
    PermissionState permission = PermissionState::Default;
    std::optional<ExitHint> exitHint;
    std::string_view model;            ///< Active model id.
    std::string_view workingDirectory; ///< Already abbreviated for display.
    std::string_view preview;          ///< Text streamed so far for the in-flight response.
    std::size_t spinnerSeed = 0;       ///< Picks the thinking verb.
    bool thinkingEnabled = true;
    SlashMenu const* slashMenu = nullptr; ///< The open autocomplete menu, if any.
    int columns = 80;
    int rows = 24;
};

/// @brief Projects the session state onto a character grid.
///
/// Pure: the same input always yields the same grid, and nothing is mutated.
[[nodiscard]] auto render(RenderInput const& input) -> Grid;

/// @brief Human name of a model id, e.g. "claude-opus-4-5-20251101" is "Opus 4.5".
[[nodiscard]] auto modelDisplayName(std::string_view modelId) -> std::string;

/// @brief Replaces a leading @p home with "~".
[[nodiscard]] auto displayPath(std::string_view path, std::string_view home) -> std::string;

/// @brief The verb shown while waiting for a response ("Thinking", "Pondering", ...).
[[nodiscard]] auto spinnerVerb(std::size_t seed) -> std::string_view;

/// @brief Greedy word wrap by display width. Explicit newlines are kept, overlong words are split.
[[nodiscard]] auto wrapText(std::string_view text, int width) -> std::vector<std::string>;

} // namespace mimic::tui
