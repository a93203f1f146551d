// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <engine/Permission.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mimic::tui
{

// Modes

/// @brief Line editing with the conversation prompt.
struct NormalMode
{
    auto operator==(NormalMode const&) const -> bool = default;
};

/// @brief Line editing of a simulated shell command, entered with '!'.
struct ShellEntryMode
{
    auto operator==(ShellEntryMode const&) const -> bool = default;
};

/// @brief A response is in flight. Editing continues; Enter queues.
struct ThinkingWaitMode
{
    auto operator==(ThinkingWaitMode const&) const -> bool = default;
};

/// @brief Which tool a permission dialog asks about.
enum class PermissionKind : std::uint8_t
{
    Bash,
    Edit,
    Write,
};

/// @brief Modal tool-use confirmation.
struct PermissionDialogMode
{
    PermissionKind kind = PermissionKind::Bash;
    std::string subject;            ///< Command or file path.
    std::vector<std::string> body;  ///< Content preview lines (Edit, Write).
    std::size_t selected = 0;       ///< 0 Yes, 1 Yes-always, 2 No.

    auto operator==(PermissionDialogMode const&) const -> bool = default;
};

/// @brief The keyboard shortcuts panel below the input line.
struct ShortcutsPanelMode
{
    auto operator==(ShortcutsPanelMode const&) const -> bool = default;
};

/// @brief Modal model selection, opened with Alt+P.
struct ModelPickerMode
{
    std::size_t selected = 0;

    auto operator==(ModelPickerMode const&) const -> bool = default;
};

/// @brief Modal thinking on/off selection, opened with Alt+T.
struct ThinkingToggleMode
{
    std::size_t selected = 0; ///< 0 Enabled, 1 Disabled.

    auto operator==(ThinkingToggleMode const&) const -> bool = default;
};

/// @brief The process is stopped (Ctrl+Z or SIGTSTP).
struct SuspendedMode
{
    auto operator==(SuspendedMode const&) const -> bool = default;
};

/// @brief The UI mode. Exactly one is active at any time.
using Mode = std::variant<NormalMode,
                          ShellEntryMode,
                          ThinkingWaitMode,
                          PermissionDialogMode,
                          ShortcutsPanelMode,
                          ModelPickerMode,
                          ThinkingToggleMode,
                          SuspendedMode>;

/// @brief Short name of a mode for logs ("normal", "shell", ...).
[[nodiscard]] auto modeName(Mode const& mode) noexcept -> std::string_view;

// Exit hints

enum class ExitHintKind : std::uint8_t
{
    CtrlC,
    CtrlD,
    Escape,
};

/// @brief The ephemeral "press again" affordance.
struct ExitHint
{
    ExitHintKind kind = ExitHintKind::CtrlC;
    Millis shownAt { 0 };

    auto operator==(ExitHint const&) const -> bool = default;
};

// Commands

struct SubmitCommand
{
    std::string text;
    auto operator==(SubmitCommand const&) const -> bool = default;
};

struct ExecuteShellCommand
{
    std::string command;
    auto operator==(ExecuteShellCommand const&) const -> bool = default;
};

struct CyclePermissionCommand
{
    auto operator==(CyclePermissionCommand const&) const -> bool = default;
};

struct TogglePanelCommand
{
    auto operator==(TogglePanelCommand const&) const -> bool = default;
};

struct SuspendCommand
{
    auto operator==(SuspendCommand const&) const -> bool = default;
};

struct ExitCommand
{
    auto operator==(ExitCommand const&) const -> bool = default;
};

struct InterruptCommand
{
    auto operator==(InterruptCommand const&) const -> bool = default;
};

struct ClearScreenCommand
{
    auto operator==(ClearScreenCommand const&) const -> bool = default;
};

struct SetThinkingCommand
{
    bool enabled = true;
    auto operator==(SetThinkingCommand const&) const -> bool = default;
};

struct SelectModelCommand
{
    std::string id;
    auto operator==(SelectModelCommand const&) const -> bool = default;
};

struct ResolvePermissionCommand
{
    PermissionDecision decision = PermissionDecision::Allow;
    auto operator==(ResolvePermissionCommand const&) const -> bool = default;
};

/// @brief Side effect requested by the input state machine, executed by the Session.
using Command = std::variant<SubmitCommand,
                             ExecuteShellCommand,
                             CyclePermissionCommand,
                             TogglePanelCommand,
                             SuspendCommand,
                             ExitCommand,
                             InterruptCommand,
                             ClearScreenCommand,
                             SetThinkingCommand,
                             SelectModelCommand,
                             ResolvePermissionCommand>;

// Model choices

/// @brief One entry of the model picker.
struct ModelChoice
{
    std::string_view id;
    std::string_view label;
    std::string_view displayName;
    std::string_view description;
};

constexpr auto ModelChoices = std::array {
    ModelChoice { .id = "claude-sonnet-4-20250514",
                  .label = "Default (recommended)",
                  .displayName = "Sonnet 4.5",
                  .description = "Best for everyday tasks" },
    ModelChoice { .id = "claude-opus-4-5-20251101",
                  .label = "Opus",
                  .displayName = "Opus 4.5",
                  .description = "Most capable for complex work" },
    ModelChoice { .id = "claude-haiku-4-5-20251101",
                  .label = "Haiku",
                  .displayName = "Haiku 4.5",
                  .description = "Fastest for quick answers" },
};

/// @brief Index into ModelChoices of the entry a model id belongs to.
///
/// Ids mentioning haiku or opus pick those entries; everything else is the default.
[[nodiscard]] auto modelChoiceIndex(std::string_view modelId) -> std::size_t;

} // namespace mimic::tui
