// SPDX-License-Identifier: Apache-2.0
#include "Permission.hpp"

namespace mimic
{

auto permissionLabel(PermissionState state) noexcept -> std::string_view
{
    switch (state)
    {
        case PermissionState::Default: return "default";
        case PermissionState::AcceptEdits: return "accept edits";
        case PermissionState::Plan: return "plan";
        case PermissionState::Bypass: return "bypass permissions";
    }
    return "default";
}

auto parsePermissionMode(std::string_view text) -> std::optional<PermissionState>
{
    if (text == "default")
        return PermissionState::Default;
    if (text == "accept-edits" || text == "acceptEdits")
        return PermissionState::AcceptEdits;
    if (text == "plan")
        return PermissionState::Plan;
    if (text == "bypass-permissions" || text == "bypassPermissions")
        return PermissionState::Bypass;
    return std::nullopt;
}

} // namespace mimic
