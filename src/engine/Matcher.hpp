// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <engine/Scenario.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace mimic
{

/// @brief Outcome of matching one input.
struct MatchResult
{
    Rule const* rule = nullptr;              ///< Never null; points at the fallback rule when nothing matched.
    std::optional<std::size_t> ruleIndex;    ///< Index into Scenario::rules, or nullopt for the fallback.
};

/// @brief Resolves user input to the first scenario rule whose pattern accepts it.
///
/// Rules are tried in declaration order. A rule with a match limit stops
/// participating once it has matched that many times in this session. When
/// nothing matches, the scenario's default response is returned, wrapped in a
/// synthetic rule that always succeeds.
class Matcher
{
  public:
    explicit Matcher(Scenario const& scenario);

    [[nodiscard]] auto match(std::string_view input) -> MatchResult;

    /// @brief Forgets how often each rule has matched.
    void resetCounts();

  private:
    Scenario const& _scenario;
    Rule _fallback;
    std::vector<unsigned> _matchCounts;
};

} // namespace mimic
