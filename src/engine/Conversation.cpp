// SPDX-License-Identifier: Apache-2.0
#include "Conversation.hpp"

#include <ranges>
#include <utility>

namespace mimic
{

void Conversation::append(ConversationEntry entry)
{
    _entries.push_back(std::move(entry));
}

void Conversation::addPrompt(std::string text)
{
    append(ConversationEntry { .kind = EntryKind::Prompt, .text = std::move(text) });
}

void Conversation::addShellCommand(std::string command)
{
    append(ConversationEntry { .kind = EntryKind::ShellCommand, .text = std::move(command) });
}

void Conversation::addResponse(std::string text)
{
    append(ConversationEntry { .kind = EntryKind::Response, .text = std::move(text) });
}

void Conversation::addToolCall(std::string display)
{
    append(ConversationEntry { .kind = EntryKind::ToolCall, .text = std::move(display) });
}

void Conversation::addError(std::string text)
{
    append(ConversationEntry { .kind = EntryKind::Error, .text = std::move(text) });
}

void Conversation::addCommandOutput(std::string text)
{
    append(ConversationEntry { .kind = EntryKind::CommandOutput, .text = std::move(text) });
}

auto Conversation::lastOf(EntryKind kind) const -> std::string_view
{
    for (auto const& entry: _entries | std::views::reverse)
        if (entry.kind == kind)
            return entry.text;
    return {};
}

void Conversation::clear()
{
    _entries.clear();
}

} // namespace mimic
