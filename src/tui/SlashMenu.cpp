// SPDX-License-Identifier: Apache-2.0
#include <core/Utf8.hpp>
#include <tui/SlashMenu.hpp>

#include <algorithm>
#include <cwctype>
#include <ranges>

namespace mimic::tui
{

namespace
{
    auto lowered(std::string_view text) -> std::u32string
    {
        auto result = utf8::decode(text);
        std::ranges::transform(result, result.begin(), [](char32_t c) {
            return static_cast<char32_t>(std::towlower(static_cast<std::wint_t>(c)));
        });
        return result;
    }
} // namespace

auto slashCommands() noexcept -> std::vector<SlashCommandInfo> const&
{
    static auto const commands = std::vector<SlashCommandInfo> {
        { .name = "add-dir", .description = "Add a new working directory", .argumentHint = "<path>" },
        { .name = "agents", .description = "Manage agent configurations", .argumentHint = {} },
        { .name = "bug", .description = "Report a bug or issue", .argumentHint = {} },
        { .name = "clear", .description = "Clear conversation history", .argumentHint = {} },
        { .name = "compact", .description = "Compact conversation (keep a summary in context)", .argumentHint = {} },
        { .name = "config", .description = "Open configuration settings", .argumentHint = {} },
        { .name = "context", .description = "View current context usage", .argumentHint = {} },
        { .name = "cost", .description = "Show session cost summary", .argumentHint = {} },
        { .name = "doctor", .description = "Run diagnostics and check system health", .argumentHint = {} },
        { .name = "fork",
          .description = "Create a fork of the current conversation at this point",
          .argumentHint = {} },
        { .name = "help", .description = "Show help and available commands", .argumentHint = {} },
        { .name = "hooks", .description = "Manage hook configurations for tool events", .argumentHint = {} },
        { .name = "init", .description = "Initialize a new project or configuration", .argumentHint = {} },
        { .name = "login", .description = "Log in to your account", .argumentHint = {} },
        { .name = "logout", .description = "Log out of your account", .argumentHint = {} },
        { .name = "mcp", .description = "Manage MCP server connections", .argumentHint = {} },
        { .name = "memory", .description = "View or manage conversation memory", .argumentHint = {} },
        { .name = "model", .description = "Switch the active model", .argumentHint = "<model>" },
        { .name = "permissions", .description = "View or manage permissions", .argumentHint = {} },
        { .name = "pr-comments", .description = "View pull request comments", .argumentHint = {} },
        { .name = "review", .description = "Review code changes", .argumentHint = {} },
        { .name = "status", .description = "Show current session status", .argumentHint = {} },
        { .name = "tasks", .description = "List and manage background tasks", .argumentHint = {} },
        { .name = "terminal-setup", .description = "Configure terminal settings", .argumentHint = {} },
        { .name = "todos", .description = "Show the current todo list", .argumentHint = {} },
        { .name = "vim", .description = "Toggle vim keybindings mode", .argumentHint = {} },
    };
    return commands;
}

auto findSlashCommand(std::string_view name) -> std::optional<SlashCommandInfo>
{
    auto const& commands = slashCommands();
    auto const i = std::ranges::find(commands, name, &SlashCommandInfo::name);
    if (i == commands.end())
        return std::nullopt;
    return *i;
}

auto fuzzyMatches(std::string_view query, std::string_view text) -> bool
{
    auto const needle = lowered(query);
    auto const haystack = lowered(text);

    auto pending = needle.begin();
    for (auto const c: haystack)
        if (pending != needle.end() && c == *pending)
            ++pending;
    return pending == needle.end();
}

auto filterSlashCommands(std::string_view query) -> std::vector<SlashCommandInfo>
{
    auto result = std::vector<SlashCommandInfo> {};
    for (auto const& command: slashCommands())
        if (fuzzyMatches(query, command.name))
            result.push_back(command);
    return result;
}

void SlashMenu::setFilter(std::string_view filter)
{
    _filter = std::string(filter);
    _entries = filterSlashCommands(filter);
    if (_selected >= _entries.size())
        _selected = 0;
}

void SlashMenu::selectNext() noexcept
{
    if (!_entries.empty())
        _selected = (_selected + 1) % _entries.size();
}

void SlashMenu::selectPrevious() noexcept
{
    if (!_entries.empty())
        _selected = (_selected + _entries.size() - 1) % _entries.size();
}

auto SlashMenu::selectedCommand() const -> std::optional<SlashCommandInfo>
{
    if (_selected >= _entries.size())
        return std::nullopt;
    return _entries[_selected];
}

} // namespace mimic::tui
