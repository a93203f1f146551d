// SPDX-License-Identifier: Apache-2.0
#include <tui/Mode.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace mimic::tui
{

namespace
{
    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };
} // namespace

auto modeName(Mode const& mode) noexcept -> std::string_view
{
    return std::visit(Overloaded {
                          [](NormalMode const&) { return std::string_view { "normal" }; },
                          [](ShellEntryMode const&) { return std::string_view { "shell" }; },
                          [](ThinkingWaitMode const&) { return std::string_view { "thinking" }; },
                          [](PermissionDialogMode const&) { return std::string_view { "permission" }; },
                          [](ShortcutsPanelMode const&) { return std::string_view { "shortcuts" }; },
                          [](ModelPickerMode const&) { return std::string_view { "model-picker" }; },
                          [](ThinkingToggleMode const&) { return std::string_view { "thinking-toggle" }; },
                          [](SuspendedMode const&) { return std::string_view { "suspended" }; },
                      },
                      mode);
}

auto modelChoiceIndex(std::string_view modelId) -> std::size_t
{
    auto lower = std::string(modelId);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower.contains("haiku"))
        return 2;
    if (lower.contains("opus"))
        return 1;
    return 0;
}

} // namespace mimic::tui
