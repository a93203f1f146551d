// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <variant>

namespace mimic::tui
{

/// @brief RGB color representation.
struct RgbColor
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    auto operator==(RgbColor const&) const -> bool = default;
};

/// @brief Color representation: default, 256-color index, or true color (RGB).
using Color = std::variant<std::monostate, std::uint8_t, RgbColor>;

/// @brief Text styling attributes of one grid cell.
struct Style
{
    Color fg;                   ///< Foreground color.
    Color bg;                   ///< Background color.
    bool bold = false;          ///< Bold text.
    bool italic = false;        ///< Italic text.
    bool underline = false;     ///< Underlined text.
    bool dim = false;           ///< Dim/faint text.
    bool inverse = false;       ///< Inverse/reverse video.

    auto operator==(Style const&) const -> bool = default;

    [[nodiscard]] auto isDefault() const noexcept -> bool { return *this == Style {}; }
};

/// @brief Fixed palette of the simulated CLI.
namespace palette
{
    constexpr auto LogoOrange = RgbColor { .r = 215, .g = 119, .b = 87 };
    constexpr auto LogoBackground = RgbColor { .r = 0, .g = 0, .b = 0 };
    constexpr auto Gray = RgbColor { .r = 153, .g = 153, .b = 153 };
    constexpr auto SeparatorGray = RgbColor { .r = 136, .g = 136, .b = 136 };
    constexpr auto ShellPink = RgbColor { .r = 253, .g = 93, .b = 177 };
    constexpr auto PlanTeal = RgbColor { .r = 72, .g = 150, .b = 140 };
    constexpr auto AcceptPurple = RgbColor { .r = 175, .g = 135, .b = 255 };
    constexpr auto BypassRed = RgbColor { .r = 255, .g = 107, .b = 128 };
} // namespace palette

} // namespace mimic::tui
