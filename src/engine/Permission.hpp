// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace mimic
{

/// @brief Session-wide permission mode, cycled with Shift+Tab.
enum class PermissionState : std::uint8_t
{
    Default,
    AcceptEdits,
    Plan,
    Bypass,
};

/// @brief Returns the mode following @p state in the cycle.
///
/// Default, AcceptEdits and Plan form the cycle. Bypass joins it between Plan
/// and Default only when @p allowBypass is set.
[[nodiscard]] constexpr auto nextPermission(PermissionState state, bool allowBypass) noexcept -> PermissionState
{
    switch (state)
    {
        case PermissionState::Default: return PermissionState::AcceptEdits;
        case PermissionState::AcceptEdits: return PermissionState::Plan;
        case PermissionState::Plan: return allowBypass ? PermissionState::Bypass : PermissionState::Default;
        case PermissionState::Bypass: return PermissionState::Default;
    }
    return PermissionState::Default;
}

/// @brief Human-readable label ("default", "accept edits", ...).
[[nodiscard]] auto permissionLabel(PermissionState state) noexcept -> std::string_view;

/// @brief Parses a CLI or scenario spelling such as "acceptEdits" or "bypass-permissions".
[[nodiscard]] auto parsePermissionMode(std::string_view text) -> std::optional<PermissionState>;

/// @brief Decision taken in a permission dialog.
enum class PermissionDecision : std::uint8_t
{
    Allow,
    AllowAlways,
    Deny,
};

} // namespace mimic
