// SPDX-License-Identifier: Apache-2.0
#include <core/Utf8.hpp>
#include <tui/Renderer.hpp>
#include <tui/Style.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <ranges>
#include <utility>

namespace mimic::tui
{

namespace
{
    struct Segment
    {
        std::string text;
        Style style;
    };

    using Line = std::vector<Segment>;

    constexpr auto SpinnerVerbs = std::array<std::string_view, 8> {
        "Thinking",     "Computing",  "Pondering",    "Processing",
        "Contemplating", "Cogitating", "Deliberating", "Musing",
    };

    constexpr auto ShortcutsLeftWidth = std::size_t { 24 };
    constexpr auto ShortcutsCenterWidth = std::size_t { 35 };

    constexpr auto ShortcutColumns = std::array<std::array<std::string_view, 6>, 3> { {
        { "! for bash mode", "/ for commands", "@ for file paths", "& for background", "", "" },
        { "double tap esc to clear input",
          "shift + tab to auto-accept edits",
          "ctrl + o for verbose output",
          "ctrl + t to show todos",
          "backslash (\\) + return (⏎) for",
          "newline" },
        { "ctrl + _ to undo",
          "ctrl + z to suspend",
          "cmd + v to paste images",
          "meta + p to switch model",
          "ctrl + s to stash prompt",
          "" },
    } };

    /// Splits at every @p separator. Always yields at least one piece.
    auto splitOn(std::string_view text, char separator) -> std::vector<std::string_view>
    {
        auto pieces = std::vector<std::string_view> {};
        auto start = std::size_t { 0 };
        while (true)
        {
            auto const end = text.find(separator, start);
            if (end == std::string_view::npos)
            {
                pieces.push_back(text.substr(start));
                return pieces;
            }
            pieces.push_back(text.substr(start, end - start));
            start = end + 1;
        }
    }

    auto withFg(RgbColor color) -> Style
    {
        return Style { .fg = color };
    }

    auto line(std::string text, Style style = {}) -> Line
    {
        auto result = Line {};
        result.push_back(Segment { .text = std::move(text), .style = style });
        return result;
    }

    auto isShell(Mode const& mode) noexcept -> bool
    {
        return std::holds_alternative<ShellEntryMode>(mode);
    }

    auto isWaiting(Mode const& mode) noexcept -> bool
    {
        return std::holds_alternative<ThinkingWaitMode>(mode) || std::holds_alternative<PermissionDialogMode>(mode);
    }

    /// Pads @p text with spaces to @p width code points, as the panel columns are ASCII plus a few symbols.
    auto padRight(std::string_view text, std::size_t width) -> std::string
    {
        auto result = std::string(text);
        auto const length = utf8::decode(text).size();
        if (length < width)
            result.append(width - length, ' ');
        return result;
    }

    // Header

    void appendHeader(std::vector<Line>& out, RenderInput const& in)
    {
        auto const orange = withFg(palette::LogoOrange);
        auto const logoBlock = Style { .fg = palette::LogoOrange, .bg = palette::LogoBackground };
        auto const gray = withFg(palette::Gray);

        out.emplace_back();
        out.push_back(Line {
            { .text = " ▐", .style = orange },
            { .text = "▛███▜", .style = logoBlock },
            { .text = "▌", .style = orange },
            { .text = "   ", .style = {} },
            { .text = in.identity.product, .style = Style { .bold = true } },
            { .text = " ", .style = {} },
            { .text = std::format("v{}", in.identity.version), .style = gray },
        });
        out.push_back(Line {
            { .text = "▝▜", .style = orange },
            { .text = "█████", .style = logoBlock },
            { .text = "▛▘", .style = orange },
            { .text = "  ", .style = {} },
            { .text = std::format("{} · {}", modelDisplayName(in.model), in.identity.provider), .style = gray },
        });
        out.push_back(Line {
            { .text = "  ▘▘ ▝▝  ", .style = orange },
            { .text = "  ", .style = {} },
            { .text = std::string(in.workingDirectory), .style = gray },
        });
        out.emplace_back();
    }

    // Conversation

    /// Writes @p text after a two-column marker, wrapping with a two-space hanging indent.
    void appendMarked(std::vector<Line>& out, std::string_view marker, Style markerStyle, std::string_view text,
                      Style textStyle, int width)
    {
        auto const wrapped = wrapText(text, std::max(width - 2, 1));
        for (auto const& [index, piece]: std::views::enumerate(wrapped))
        {
            auto row = Line {};
            if (index == 0)
                row.push_back(Segment { .text = std::format("{} ", marker), .style = markerStyle });
            else
                row.push_back(Segment { .text = "  ", .style = {} });
            row.push_back(Segment { .text = piece, .style = textStyle });
            out.push_back(std::move(row));
        }
    }

    void appendVerbatim(std::vector<Line>& out, std::string_view marker, Style markerStyle, std::string_view text)
    {
        auto first = true;
        for (auto const piece: splitOn(text, '\n'))
        {
            auto row = Line {};
            if (first)
                row.push_back(Segment { .text = std::format("{} ", marker), .style = markerStyle });
            row.push_back(Segment { .text = std::string(piece), .style = {} });
            out.push_back(std::move(row));
            first = false;
        }
    }

    void appendCommandOutput(std::vector<Line>& out, std::string_view text)
    {
        auto const gray = withFg(palette::Gray);
        auto first = true;
        for (auto const piece: splitOn(text, '\n'))
        {
            out.push_back(line(std::format("{}{}", first ? "  ⎿  " : "     ", piece), gray));
            first = false;
        }
    }

    void appendEntry(std::vector<Line>& out, ConversationEntry const& entry, int width)
    {
        switch (entry.kind)
        {
            case EntryKind::Prompt: appendMarked(out, "❯", {}, entry.text, {}, width); break;
            case EntryKind::ShellCommand:
                appendMarked(out, "❯", {}, std::format("\\!{}", entry.text), {}, width);
                break;
            case EntryKind::Response: appendMarked(out, "⏺", {}, entry.text, {}, width); break;
            case EntryKind::ToolCall: appendVerbatim(out, "⏺", withFg(palette::AcceptPurple), entry.text); break;
            case EntryKind::Error:
                appendMarked(out, "⏺", withFg(palette::BypassRed), entry.text, withFg(palette::BypassRed), width);
                break;
            case EntryKind::CommandOutput: appendCommandOutput(out, entry.text); break;
        }
    }

    void appendConversation(std::vector<Line>& out, RenderInput const& in)
    {
        auto const width = in.columns;
        auto any = false;

        for (auto const& entry: in.conversation.entries())
        {
            // Command output hangs directly below its command.
            if (any && entry.kind != EntryKind::CommandOutput)
                out.emplace_back();
            appendEntry(out, entry, width);
            any = true;
        }

        if (isWaiting(in.mode))
        {
            if (any)
                out.emplace_back();
            if (!in.preview.empty())
                appendMarked(out, "⏺", {}, in.preview, {}, width);
            else
                out.push_back(line(std::format("✻ {}…", spinnerVerb(in.spinnerSeed)),
                                   withFg(palette::LogoOrange)));
            any = true;
        }

        if (any)
            out.emplace_back();
    }

    // Input area

    auto separatorLine(int width, bool shell) -> Line
    {
        auto const style = shell ? withFg(palette::ShellPink) : Style { .fg = palette::SeparatorGray, .dim = true };
        auto text = std::string {};
        for (auto i = 0; i < width; ++i)
            text += "─";
        return line(std::move(text), style);
    }

    /// Appends the prompt line(s) and returns the cursor relative to the first of them.
    auto appendInputLines(std::vector<Line>& out, RenderInput const& in) -> CellPosition
    {
        auto const shell = isShell(in.mode);
        auto const text = in.input.text();

        if (text.empty())
        {
            if (shell)
                out.push_back(Line {
                    { .text = "! ", .style = withFg(palette::ShellPink) },
                    { .text = "Try \"fix lint errors\"", .style = Style { .dim = true } },
                });
            else if (in.conversation.empty() && std::holds_alternative<NormalMode>(in.mode))
                out.push_back(Line {
                    { .text = "❯ ", .style = {} },
                    { .text = in.identity.placeholder, .style = Style { .dim = true } },
                });
            else
                out.push_back(line("❯"));
            return CellPosition { .row = 0, .column = 2 };
        }

        auto const prefix = std::string_view { shell ? "! " : "❯ " };
        auto const style = shell ? withFg(palette::ShellPink) : Style {};
        auto const before = text.substr(0, in.input.cursor());
        auto const cursorRow = static_cast<int>(std::ranges::count(before, '\n'));
        auto const lineStart = before.rfind('\n');
        auto const cursorColumn =
            2 + utf8::displayWidth(lineStart == std::string_view::npos ? before : before.substr(lineStart + 1));

        auto first = true;
        for (auto const piece: splitOn(text, '\n'))
        {
            out.push_back(Line {
                { .text = first ? std::string(prefix) : std::string("  "), .style = style },
                { .text = std::string(piece), .style = style },
            });
            first = false;
        }
        return CellPosition { .row = cursorRow, .column = cursorColumn };
    }

    auto statusLine(RenderInput const& in) -> Line
    {
        if (in.exitHint)
        {
            switch (in.exitHint->kind)
            {
                case ExitHintKind::CtrlC: return line("  Press Ctrl-C again to exit");
                case ExitHintKind::CtrlD: return line("  Press Ctrl-D again to exit");
                case ExitHintKind::Escape: return line("  Esc to clear again");
            }
        }

        if (isShell(in.mode))
            return line("  ! for bash mode", withFg(palette::ShellPink));

        auto label = std::string {};
        auto style = Style {};
        switch (in.permission)
        {
            case PermissionState::Default:
                label = "  ? for shortcuts";
                style = withFg(palette::Gray);
                break;
            case PermissionState::Plan:
                label = "  ⏸ plan mode on (shift+tab to cycle)";
                style = withFg(palette::PlanTeal);
                break;
            case PermissionState::AcceptEdits:
                label = "  ⏵⏵ accept edits on (shift+tab to cycle)";
                style = withFg(palette::AcceptPurple);
                break;
            case PermissionState::Bypass:
                label = "  ⏵⏵ bypass permissions on (shift+tab to cycle)";
                style = withFg(palette::BypassRed);
                break;
        }

        auto right = std::string_view {};
        if (in.permission != PermissionState::Default)
            right = "Use meta+t to toggle thinking";
        else if (!in.thinkingEnabled)
            right = "Thinking off";

        auto result = line(label, style);
        if (!right.empty())
        {
            auto const used = utf8::displayWidth(label) + utf8::displayWidth(right);
            auto const padding = std::max(in.columns - used, 1);
            result.push_back(Segment { .text = std::string(static_cast<std::size_t>(padding), ' ') });
            result.push_back(Segment { .text = std::string(right), .style = withFg(palette::Gray) });
        }
        return result;
    }

    void appendShortcuts(std::vector<Line>& out)
    {
        auto const gray = withFg(palette::Gray);
        for (auto row = std::size_t { 0 }; row < ShortcutColumns[1].size(); ++row)
        {
            auto const text = std::format("  {}{}{}",
                                          padRight(ShortcutColumns[0][row], ShortcutsLeftWidth),
                                          padRight(ShortcutColumns[1][row], ShortcutsCenterWidth),
                                          ShortcutColumns[2][row]);
            out.push_back(line(text, gray));
        }
    }

    // Dialogs

    auto bashCommandName(std::string_view command) -> std::string
    {
        auto const start = command.find_first_not_of(" \t");
        if (start == std::string_view::npos)
            return {};
        auto word = command.substr(start, command.find_first_of(" \t", start) - start);
        if (auto const slash = word.rfind('/'); slash != std::string_view::npos)
            word = word.substr(slash + 1);
        return std::string(word);
    }

    auto permissionSecondOption(PermissionDialogMode const& dialog) -> std::string
    {
        if (dialog.kind != PermissionKind::Bash)
            return "Yes, allow all edits during this session (shift+tab)";
        if (dialog.subject.contains("/etc/"))
            return "Yes, allow reading from etc/ from this project";
        auto const name = bashCommandName(dialog.subject);
        if (name.empty())
            return "Yes, allow this command from this project";
        return std::format("Yes, allow {} commands from this project", name);
    }

    void appendPermissionDialog(std::vector<Line>& out, PermissionDialogMode const& dialog, int width)
    {
        auto dashed = std::string {};
        for (auto i = 0; i < width; ++i)
            dashed += "╌";

        out.push_back(separatorLine(width, false));
        switch (dialog.kind)
        {
            case PermissionKind::Bash:
                out.push_back(line(" Bash command", Style { .bold = true }));
                out.emplace_back();
                out.push_back(line(std::format("   {}", dialog.subject)));
                for (auto const& extra: dialog.body)
                    out.push_back(line(std::format("   {}", extra), withFg(palette::Gray)));
                out.emplace_back();
                out.push_back(line(" Do you want to proceed?"));
                break;
            case PermissionKind::Edit:
                out.push_back(line(std::format(" Edit file {}", dialog.subject), Style { .bold = true }));
                out.push_back(line(dashed, withFg(palette::SeparatorGray)));
                for (auto const& content: dialog.body)
                    out.push_back(line(std::format("    {}", content)));
                out.push_back(line(dashed, withFg(palette::SeparatorGray)));
                out.push_back(line(std::format(" Do you want to make this edit to {}?", dialog.subject)));
                break;
            case PermissionKind::Write:
                out.push_back(line(std::format(" Create file {}", dialog.subject), Style { .bold = true }));
                out.push_back(line(dashed, withFg(palette::SeparatorGray)));
                for (auto const& [index, content]: std::views::enumerate(dialog.body))
                    out.push_back(line(std::format(" {:2} {}", index + 1, content)));
                out.push_back(line(dashed, withFg(palette::SeparatorGray)));
                out.push_back(line(std::format(" Do you want to create {}?", dialog.subject)));
                break;
        }

        auto const options = std::array<std::string, 3> { "Yes", permissionSecondOption(dialog), "No" };
        for (auto const& [index, option]: std::views::enumerate(options))
        {
            auto const selected = static_cast<std::size_t>(index) == dialog.selected;
            out.push_back(line(std::format("{}{}. {}", selected ? " ❯ " : "   ", index + 1, option),
                               selected ? withFg(palette::AcceptPurple) : Style {}));
        }
        out.emplace_back();
        out.push_back(line(" Esc to cancel · Tab to add additional instructions", withFg(palette::Gray)));
    }

    void appendModelPicker(std::vector<Line>& out, ModelPickerMode const& picker, std::string_view model, int width)
    {
        auto const current = modelChoiceIndex(model);

        out.push_back(separatorLine(width, false));
        out.push_back(line(" Select model", Style { .bold = true }));
        out.push_back(line(" Switch between Claude models. Applies to this session and future Claude Code sessions. "
                           "For other/previous model names,",
                           withFg(palette::Gray)));
        out.push_back(line("  specify with --model.", withFg(palette::Gray)));
        out.emplace_back();

        for (auto const& [index, choice]: std::views::enumerate(ModelChoices))
        {
            auto const i = static_cast<std::size_t>(index);
            auto const selected = i == picker.selected;
            auto const label = std::format("{}{}", choice.label, i == current ? " ✔" : "");
            out.push_back(line(std::format(" {} {}. {}{} · {}",
                                           selected ? "❯" : " ",
                                           i + 1,
                                           padRight(label, 23),
                                           choice.displayName,
                                           choice.description),
                               selected ? withFg(palette::AcceptPurple) : Style {}));
        }

        out.emplace_back();
        out.push_back(line(" Enter to confirm · Esc to exit", withFg(palette::Gray)));
    }

    void appendThinkingToggle(std::vector<Line>& out, ThinkingToggleMode const& dialog, RenderInput const& in,
                              int width)
    {
        auto const current = in.thinkingEnabled ? std::size_t { 0 } : std::size_t { 1 };
        auto const marker = [&](std::size_t option) {
            return std::pair { option == dialog.selected ? " ❯ " : "   ", option == current ? " ✔" : "" };
        };
        auto const style = [&](std::size_t option) {
            return option == dialog.selected ? withFg(palette::AcceptPurple) : Style {};
        };

        out.push_back(separatorLine(width, false));
        out.push_back(line(" Toggle thinking mode", Style { .bold = true }));
        out.push_back(line(" Enable or disable thinking for this session.", withFg(palette::Gray)));
        if (!in.conversation.empty())
            out.push_back(line(" Changing mid-conversation may reduce quality. For best results, set this at the start "
                               "of a session.",
                               withFg(palette::Gray)));
        out.emplace_back();

        auto const [enabledIndicator, enabledCheck] = marker(0);
        out.push_back(
            line(std::format("{}1. Enabled{}  Claude will think before responding", enabledIndicator, enabledCheck),
                 style(0)));
        auto const [disabledIndicator, disabledCheck] = marker(1);
        out.push_back(line(std::format("{}2. Disabled{}   Claude will respond without extended thinking",
                                       disabledIndicator,
                                       disabledCheck),
                           style(1)));

        out.emplace_back();
        out.push_back(line(" Enter to confirm · escape to exit", withFg(palette::Gray)));
    }

    // Slash commands

    void appendSlashMenu(std::vector<Line>& out, SlashMenu const& menu)
    {
        if (menu.entries().empty())
            return;

        auto const visible = menu.entries() | std::views::take(SlashMenu::VisibleRows);
        for (auto const& [index, command]: std::views::enumerate(visible))
        {
            auto const selected = static_cast<std::size_t>(index) == menu.selected();
            out.push_back(
                line(std::format("{}{:<14}  {}", selected ? " ❯ " : "   ", command.fullName(), command.description),
                     selected ? withFg(palette::AcceptPurple) : Style {}));
        }
        out.emplace_back();
    }

    /// The argument hint below a fully typed command, e.g. "/add-dir" hints "<path>".
    auto argumentHint(RenderInput const& in) -> std::optional<Line>
    {
        auto const text = in.input.text();
        if (in.slashMenu || !std::holds_alternative<NormalMode>(in.mode) || !text.starts_with('/'))
            return std::nullopt;

        auto const name = text.substr(1);
        auto const command = findSlashCommand(name);
        if (!command || command->argumentHint.empty())
            return std::nullopt;
        return line(std::format("     {}  {}", std::string(name.size(), ' '), command->argumentHint),
                    withFg(palette::Gray));
    }

    void writeLine(Grid& grid, int row, Line const& content)
    {
        auto column = 0;
        for (auto const& segment: content)
            column = grid.write(row, column, segment.text, segment.style);
    }

} // namespace

auto render(RenderInput const& in) -> Grid
{
    auto grid = Grid(in.columns, in.rows);
    auto const width = grid.columns();

    auto scrolling = std::vector<Line> {};
    appendHeader(scrolling, in);
    appendConversation(scrolling, in);

    // The input area and footer, or a modal dialog in their place.
    auto bottom = std::vector<Line> {};
    auto cursor = std::optional<CellPosition> {};

    if (auto const* dialog = std::get_if<PermissionDialogMode>(&in.mode))
        appendPermissionDialog(bottom, *dialog, width);
    else if (auto const* picker = std::get_if<ModelPickerMode>(&in.mode))
        appendModelPicker(bottom, *picker, in.model, width);
    else if (auto const* thinking = std::get_if<ThinkingToggleMode>(&in.mode))
        appendThinkingToggle(bottom, *thinking, in, width);
    else
    {
        auto const shell = isShell(in.mode);
        if (in.slashMenu)
            appendSlashMenu(bottom, *in.slashMenu);
        bottom.push_back(separatorLine(width, shell));
        if (in.input.stash())
            bottom.push_back(Line {
                { .text = "  ", .style = {} },
                { .text = "›", .style = withFg(palette::LogoOrange) },
                { .text = " Stashed (auto-restores after submit)", .style = {} },
            });

        auto const inputTop = static_cast<int>(bottom.size());
        auto const relative = appendInputLines(bottom, in);
        if (!std::holds_alternative<SuspendedMode>(in.mode))
            cursor = CellPosition { .row = inputTop + relative.row, .column = relative.column };
        if (auto hint = argumentHint(in); hint)
            bottom.push_back(std::move(*hint));

        bottom.push_back(separatorLine(width, shell));
        if (std::holds_alternative<ShortcutsPanelMode>(in.mode))
            appendShortcuts(bottom);
        else
            bottom.push_back(statusLine(in));
    }

    // Bottom-anchored scrolling: the oldest lines leave first.
    auto const bottomRows = std::min(static_cast<int>(bottom.size()), grid.rows());
    auto const available = grid.rows() - bottomRows;
    auto const skip = std::max(static_cast<int>(scrolling.size()) - available, 0);

    auto row = 0;
    for (auto i = static_cast<std::size_t>(skip); i < scrolling.size(); ++i)
        writeLine(grid, row++, scrolling[i]);

    auto const bottomStart = row;
    for (auto i = 0; i < bottomRows; ++i)
        writeLine(grid, row++, bottom[static_cast<std::size_t>(i)]);

    if (cursor && bottomStart + cursor->row < grid.rows())
        grid.setCursor(CellPosition { .row = bottomStart + cursor->row,
                                      .column = std::min(cursor->column, width - 1) });
    return grid;
}

auto modelDisplayName(std::string_view modelId) -> std::string
{
    auto lower = std::string(modelId);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "haiku" || lower == "claude-haiku")
        return "Haiku 4.5";
    if (lower == "sonnet" || lower == "claude-sonnet")
        return "Sonnet 4.5";
    if (lower == "opus" || lower == "claude-opus")
        return "Opus 4.5";

    auto base = std::string_view {};
    if (lower.contains("haiku"))
        base = "Haiku";
    else if (lower.contains("opus"))
        base = "Opus";
    else if (lower.contains("sonnet"))
        base = "Sonnet";
    else
        return std::string(modelId);

    // claude-{family}-{major}[-{minor}]-{date}
    auto const parts = splitOn(modelId, '-');

    auto const isNumber = [](std::string_view s) {
        return !s.empty() && std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c) != 0; });
    };

    if (parts.size() >= 4 && parts[0] == "claude" && isNumber(parts[2]))
    {
        if (isNumber(parts[3]) && parts[3].size() <= 2)
            return std::format("{} {}.{}", base, parts[2], parts[3]);
        return std::format("{} {}", base, parts[2]);
    }
    return std::string(base);
}

auto displayPath(std::string_view path, std::string_view home) -> std::string
{
    if (home.empty() || home == "/")
        return std::string(path);
    if (path == home)
        return "~";
    if (path.starts_with(home) && path.size() > home.size() && path[home.size()] == '/')
        return std::format("~{}", path.substr(home.size()));
    return std::string(path);
}

auto spinnerVerb(std::size_t seed) -> std::string_view
{
    return SpinnerVerbs[seed % SpinnerVerbs.size()];
}

auto wrapText(std::string_view text, int width) -> std::vector<std::string>
{
    auto lines = std::vector<std::string> {};
    width = std::max(width, 1);

    for (auto const paragraph: splitOn(text, '\n'))
    {
        auto current = std::string {};
        auto currentWidth = 0;
        auto const flush = [&]() {
            lines.push_back(std::exchange(current, std::string {}));
            currentWidth = 0;
        };

        auto first = true;
        for (auto word: splitOn(paragraph, ' '))
        {
            auto wordWidth = utf8::displayWidth(word);
            if (!first)
            {
                if (currentWidth + 1 + wordWidth <= width)
                {
                    current += ' ';
                    ++currentWidth;
                }
                else
                    flush();
            }
            first = false;

            // Words wider than the line are split at grapheme boundaries.
            while (currentWidth + wordWidth > width)
            {
                auto taken = std::size_t { 0 };
                auto takenWidth = 0;
                for (auto const cluster: utf8::graphemes(word))
                {
                    auto const w = utf8::clusterWidth(cluster);
                    if (currentWidth + takenWidth + w > width)
                        break;
                    taken += cluster.size();
                    takenWidth += w;
                }
                if (taken == 0 && currentWidth > 0)
                {
                    flush();
                    continue;
                }
                if (taken == 0)
                    taken = utf8::nextGrapheme(word, 0);
                current += word.substr(0, taken);
                word.remove_prefix(taken);
                wordWidth = utf8::displayWidth(word);
                flush();
            }

            current += word;
            currentWidth += wordWidth;
        }
        lines.push_back(std::move(current));
    }
    return lines;
}

} // namespace mimic::tui
