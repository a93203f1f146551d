// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mimic
{

/// @brief Kind of a transcript entry. Decides the prefix glyph it renders with.
enum class EntryKind : std::uint8_t
{
    Prompt,        ///< "❯ text"
    ShellCommand,  ///< "❯ \!command"
    Response,      ///< "⏺ text"
    ToolCall,      ///< "⏺ Bash(...)"
    Error,         ///< "⏺ Error: ..."
    CommandOutput, ///< "  ⎿  line"
};

/// @brief One immutable transcript entry.
struct ConversationEntry
{
    EntryKind kind = EntryKind::Prompt;
    std::string text;

    auto operator==(ConversationEntry const&) const -> bool = default;
};

/// @brief Ordered, append-only transcript of a session.
///
/// Entries are never edited after being appended; the only other mutation is
/// clearing the whole transcript.
class Conversation
{
  public:
    void addPrompt(std::string text);
    void addShellCommand(std::string command);
    void addResponse(std::string text);
    void addToolCall(std::string display);
    void addError(std::string text);
    void addCommandOutput(std::string text);

    void append(ConversationEntry entry);

    [[nodiscard]] auto entries() const noexcept -> std::vector<ConversationEntry> const& { return _entries; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return _entries.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return _entries.empty(); }

    /// @brief Text of the last entry of @p kind, or empty.
    [[nodiscard]] auto lastOf(EntryKind kind) const -> std::string_view;

    void clear();

  private:
    std::vector<ConversationEntry> _entries;
};

} // namespace mimic
