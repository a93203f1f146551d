// SPDX-License-Identifier: Apache-2.0
#include "Matcher.hpp"

#include <core/Log.hpp>

#include <algorithm>

namespace mimic
{

Matcher::Matcher(Scenario const& scenario):
    _scenario(scenario),
    _fallback { .pattern = AnyPattern {}, .response = scenario.defaultResponse, .maxMatches = std::nullopt },
    _matchCounts(scenario.rules.size(), 0)
{
}

auto Matcher::match(std::string_view input) -> MatchResult
{
    for (auto index = std::size_t { 0 }; index < _scenario.rules.size(); ++index)
    {
        auto const& rule = _scenario.rules[index];
        if (rule.maxMatches && _matchCounts[index] >= *rule.maxMatches)
            continue;

        if (matches(rule.pattern, input))
        {
            ++_matchCounts[index];
            log::debug("Input matched rule #{} ({} pattern)", index, patternKindName(rule.pattern));
            return MatchResult { .rule = &rule, .ruleIndex = index };
        }
    }

    log::debug("No rule matched, using the default response");
    return MatchResult { .rule = &_fallback, .ruleIndex = std::nullopt };
}

void Matcher::resetCounts()
{
    std::ranges::fill(_matchCounts, 0u);
}

} // namespace mimic
