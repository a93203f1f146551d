// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace mimic::tui
{

/// @brief Key codes for keyboard events.
///
/// Printable characters use their Unicode codepoint directly. Named keys live
/// above the Unicode range so they never collide with a codepoint.
enum class KeyCode : std::uint32_t
{
    Enter = 0x110000,
    Tab,
    Backspace,
    Delete,
    Escape,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    Insert,
};

/// @brief Bitmask of modifier keys held during a key press.
enum class Modifier : std::uint8_t
{
    None = 0,
    Shift = 1 << 0,
    Alt = 1 << 1, ///< Also reported as Meta.
    Ctrl = 1 << 2,
    Super = 1 << 3,
};

[[nodiscard]] constexpr auto operator|(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) & static_cast<std::uint8_t>(rhs));
}

constexpr auto operator|=(Modifier& lhs, Modifier rhs) noexcept -> Modifier&
{
    lhs = lhs | rhs;
    return lhs;
}

[[nodiscard]] constexpr auto hasModifier(Modifier mods, Modifier flag) noexcept -> bool
{
    return (mods & flag) != Modifier::None;
}

/// @brief Whether a key code is a printable codepoint.
[[nodiscard]] constexpr auto isPrintable(KeyCode key) noexcept -> bool
{
    auto const value = static_cast<std::uint32_t>(key);
    return value >= 32 && value < 0x110000 && value != 0x7F;
}

/// @brief A normalized key press.
///
/// Ctrl and Alt combinations carry the lowercase base character in @c key,
/// so Ctrl+C is {key 'c', Ctrl} regardless of how the terminal encoded it.
struct KeyEvent
{
    KeyCode key {};
    Modifier modifiers = Modifier::None;
    char32_t codepoint = 0; ///< 0 for named keys.

    [[nodiscard]] auto is(KeyCode k, Modifier mods = Modifier::None) const noexcept -> bool
    {
        return key == k && modifiers == mods;
    }

    [[nodiscard]] auto isChar(char32_t ch, Modifier mods = Modifier::None) const noexcept -> bool
    {
        return key == static_cast<KeyCode>(ch) && modifiers == mods;
    }

    [[nodiscard]] auto isCtrl(char32_t ch) const noexcept -> bool { return isChar(ch, Modifier::Ctrl); }
    [[nodiscard]] auto isAlt(char32_t ch) const noexcept -> bool { return isChar(ch, Modifier::Alt); }
};

/// @brief Builds the event for an unmodified character.
[[nodiscard]] constexpr auto charKey(char32_t ch, Modifier mods = Modifier::None) noexcept -> KeyEvent
{
    return KeyEvent { .key = static_cast<KeyCode>(ch), .modifiers = mods, .codepoint = ch };
}

/// @brief Builds the event for a named key.
[[nodiscard]] constexpr auto namedKey(KeyCode key, Modifier mods = Modifier::None) noexcept -> KeyEvent
{
    return KeyEvent { .key = key, .modifiers = mods, .codepoint = 0 };
}

/// @brief Describes a key for logs, e.g. "Ctrl+c" or "Shift+Tab".
[[nodiscard]] auto describeKey(KeyEvent const& event) -> std::string;

/// @brief Terminal resize event.
struct ResizeEvent
{
    int columns;
    int rows;
};

/// @brief Bracketed paste event.
struct PasteEvent
{
    std::string text;
};

/// @brief SIGTSTP arrived from outside the process (e.g. `kill -TSTP`).
struct SuspendEvent
{
};

/// @brief Everything the terminal input layer can produce.
using InputEvent = std::variant<KeyEvent, ResizeEvent, PasteEvent, SuspendEvent>;

} // namespace mimic::tui
