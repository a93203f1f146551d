// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tui/InputEvent.hpp>

namespace mimic::tui
{

/// @brief Incremental decoder turning raw terminal bytes into normalized key events.
///
/// Understands legacy control bytes, CSI and SS3 cursor/function keys,
/// CSI-u (Kitty keyboard protocol), Shift+Tab (CSI Z), Alt-prefixed keys,
/// bracketed paste and UTF-8 text. A lone ESC stays pending until more input
/// arrives or timeout() is called.
class KeyDecoder
{
  public:
    [[nodiscard]] auto feed(std::string_view data) -> std::vector<InputEvent>;

    /// @brief Resolves a pending bare ESC once no further bytes arrived.
    [[nodiscard]] auto timeout() -> std::vector<InputEvent>;

  private:
    enum class State : std::uint8_t
    {
        Ground,
        Escape,
        Csi,
        Ss3,
        PasteBody,
        Utf8Sequence,
    };

    State _state = State::Ground;
    std::string _paramBuf;
    std::string _utf8Buf;
    std::string _pasteBuf;
    int _utf8Remaining = 0;
    bool _altPending = false; ///< ESC prefix seen before a UTF-8 sequence.

    void processGround(std::uint8_t byte, std::vector<InputEvent>& events);
    void processEscape(std::uint8_t byte, std::vector<InputEvent>& events);
    void processCsi(std::uint8_t byte, std::vector<InputEvent>& events);
    void processSs3(std::uint8_t byte, std::vector<InputEvent>& events);
    void processPaste(std::uint8_t byte, std::vector<InputEvent>& events);
    void processUtf8(std::uint8_t byte, std::vector<InputEvent>& events);
    void dispatchCsi(char finalByte, std::vector<InputEvent>& events);
};

} // namespace mimic::tui
