// SPDX-License-Identifier: Apache-2.0
#include <charconv>
#include <format>
#include <optional>
#include <ranges>

#include <core/Utf8.hpp>
#include <tui/KeyDecoder.hpp>

namespace mimic::tui
{

namespace
{
    auto parseCsiParams(std::string_view buf) -> std::vector<int>
    {
        auto result = std::vector<int> {};
        for (auto const part: buf | std::views::split(';'))
        {
            auto sv = std::string_view(part.begin(), part.end());
            // Kitty may append ":alternate" sub-parameters; only the first value matters.
            sv = sv.substr(0, sv.find(':'));
            auto value = 0;
            if (auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value); ec == std::errc {})
                result.push_back(value);
            else
                result.push_back(0);
        }
        return result;
    }

    /// CSI modifier parameters encode 1 + shift + 2*alt + 4*ctrl + 8*super.
    constexpr auto decodeModifiers(int param) -> Modifier
    {
        if (param <= 1)
            return Modifier::None;
        auto const bits = param - 1;
        auto mods = Modifier::None;
        if (bits & 1)
            mods |= Modifier::Shift;
        if (bits & 2)
            mods |= Modifier::Alt;
        if (bits & 4)
            mods |= Modifier::Ctrl;
        if (bits & 8)
            mods |= Modifier::Super;
        return mods;
    }

    /// Maps a C0 control byte to the key a user pressed to produce it.
    auto controlKey(std::uint8_t byte) -> KeyEvent
    {
        switch (byte)
        {
            case '\r':
            case '\n': return namedKey(KeyCode::Enter);
            case '\t': return namedKey(KeyCode::Tab);
            case 0x08: return namedKey(KeyCode::Backspace);
            case 0x00: return charKey(U' ', Modifier::Ctrl);
            default: break;
        }
        if (byte <= 0x1A)
            return charKey(static_cast<char32_t>(byte - 1 + 'a'), Modifier::Ctrl);
        // 0x1C..0x1F are Ctrl+\ Ctrl+] Ctrl+^ Ctrl+_
        return charKey(static_cast<char32_t>(byte + 0x40), Modifier::Ctrl);
    }

    auto mapCsiKey(char finalByte, std::vector<int> const& params) -> std::optional<KeyEvent>
    {
        auto const modifier = (params.size() >= 2) ? decodeModifiers(params[1]) : Modifier::None;

        switch (finalByte)
        {
            case 'A': return namedKey(KeyCode::Up, modifier);
            case 'B': return namedKey(KeyCode::Down, modifier);
            case 'C': return namedKey(KeyCode::Right, modifier);
            case 'D': return namedKey(KeyCode::Left, modifier);
            case 'H': return namedKey(KeyCode::Home, modifier);
            case 'F': return namedKey(KeyCode::End, modifier);
            case 'Z': return namedKey(KeyCode::Tab, modifier | Modifier::Shift);
            case '~': {
                if (params.empty())
                    return std::nullopt;
                switch (params[0])
                {
                    case 1:
                    case 7: return namedKey(KeyCode::Home, modifier);
                    case 2: return namedKey(KeyCode::Insert, modifier);
                    case 3: return namedKey(KeyCode::Delete, modifier);
                    case 4:
                    case 8: return namedKey(KeyCode::End, modifier);
                    case 5: return namedKey(KeyCode::PageUp, modifier);
                    case 6: return namedKey(KeyCode::PageDown, modifier);
                    default: return std::nullopt;
                }
            }
            default: return std::nullopt;
        }
    }
} // namespace

auto describeKey(KeyEvent const& event) -> std::string
{
    auto result = std::string {};
    if (hasModifier(event.modifiers, Modifier::Ctrl))
        result += "Ctrl+";
    if (hasModifier(event.modifiers, Modifier::Alt))
        result += "Alt+";
    if (hasModifier(event.modifiers, Modifier::Shift))
        result += "Shift+";
    if (hasModifier(event.modifiers, Modifier::Super))
        result += "Super+";

    switch (event.key)
    {
        case KeyCode::Enter: return result + "Enter";
        case KeyCode::Tab: return result + "Tab";
        case KeyCode::Backspace: return result + "Backspace";
        case KeyCode::Delete: return result + "Delete";
        case KeyCode::Escape: return result + "Escape";
        case KeyCode::Up: return result + "Up";
        case KeyCode::Down: return result + "Down";
        case KeyCode::Left: return result + "Left";
        case KeyCode::Right: return result + "Right";
        case KeyCode::Home: return result + "Home";
        case KeyCode::End: return result + "End";
        case KeyCode::PageUp: return result + "PageUp";
        case KeyCode::PageDown: return result + "PageDown";
        case KeyCode::Insert: return result + "Insert";
        default: break;
    }
    return result + utf8::encode(static_cast<char32_t>(event.key));
}

auto KeyDecoder::feed(std::string_view data) -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    for (auto const ch: data)
    {
        auto const byte = static_cast<std::uint8_t>(ch);
        switch (_state)
        {
            case State::Ground: processGround(byte, events); break;
            case State::Escape: processEscape(byte, events); break;
            case State::Csi: processCsi(byte, events); break;
            case State::Ss3: processSs3(byte, events); break;
            case State::PasteBody: processPaste(byte, events); break;
            case State::Utf8Sequence: processUtf8(byte, events); break;
        }
    }
    return events;
}

auto KeyDecoder::timeout() -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    if (_state == State::Escape)
    {
        events.emplace_back(namedKey(KeyCode::Escape));
        _state = State::Ground;
    }
    return events;
}

void KeyDecoder::processGround(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if (byte == 0x1B)
    {
        _state = State::Escape;
        return;
    }

    if (byte == 0x7F)
    {
        events.emplace_back(namedKey(KeyCode::Backspace));
        return;
    }

    if (byte < 0x20)
    {
        events.emplace_back(controlKey(byte));
        return;
    }

    if ((byte & 0x80) != 0)
    {
        _utf8Buf.assign(1, static_cast<char>(byte));
        if ((byte & 0xE0) == 0xC0)
            _utf8Remaining = 1;
        else if ((byte & 0xF0) == 0xE0)
            _utf8Remaining = 2;
        else if ((byte & 0xF8) == 0xF0)
            _utf8Remaining = 3;
        else
            return; // stray continuation or invalid lead byte
        _state = State::Utf8Sequence;
        return;
    }

    events.emplace_back(charKey(static_cast<char32_t>(byte)));
}

void KeyDecoder::processEscape(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _state = State::Ground;

    if (byte == '[')
    {
        _paramBuf.clear();
        _state = State::Csi;
        return;
    }

    if (byte == 'O')
    {
        _state = State::Ss3;
        return;
    }

    if (byte == 0x1B)
    {
        // ESC ESC: the first one was a real Escape press, the second may start a sequence.
        events.emplace_back(namedKey(KeyCode::Escape));
        _state = State::Escape;
        return;
    }

    if (byte == 0x7F)
    {
        events.emplace_back(namedKey(KeyCode::Backspace, Modifier::Alt));
        return;
    }

    if (byte < 0x20)
    {
        auto key = controlKey(byte);
        key.modifiers |= Modifier::Alt;
        events.emplace_back(key);
        return;
    }

    if ((byte & 0x80) != 0)
    {
        _altPending = true;
        processGround(byte, events);
        return;
    }

    events.emplace_back(charKey(static_cast<char32_t>(byte), Modifier::Alt));
}

void KeyDecoder::processCsi(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if ((byte >= '0' && byte <= '9') || byte == ';' || byte == ':' || byte == '<' || byte == '>' || byte == '?')
    {
        _paramBuf += static_cast<char>(byte);
        return;
    }

    if (byte >= 0x40 && byte <= 0x7E)
    {
        _state = State::Ground;
        dispatchCsi(static_cast<char>(byte), events);
        return;
    }

    if (byte >= 0x20 && byte <= 0x2F)
    {
        _paramBuf += static_cast<char>(byte);
        return;
    }

    _state = State::Ground;
}

void KeyDecoder::processSs3(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _state = State::Ground;
    switch (static_cast<char>(byte))
    {
        case 'A': events.emplace_back(namedKey(KeyCode::Up)); break;
        case 'B': events.emplace_back(namedKey(KeyCode::Down)); break;
        case 'C': events.emplace_back(namedKey(KeyCode::Right)); break;
        case 'D': events.emplace_back(namedKey(KeyCode::Left)); break;
        case 'H': events.emplace_back(namedKey(KeyCode::Home)); break;
        case 'F': events.emplace_back(namedKey(KeyCode::End)); break;
        case 'M': events.emplace_back(namedKey(KeyCode::Enter)); break;
        default: break;
    }
}

void KeyDecoder::processPaste(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _pasteBuf += static_cast<char>(byte);

    static constexpr auto PasteEnd = std::string_view { "\033[201~" };
    if (_pasteBuf.ends_with(PasteEnd))
    {
        _pasteBuf.resize(_pasteBuf.size() - PasteEnd.size());
        events.emplace_back(PasteEvent { .text = std::move(_pasteBuf) });
        _pasteBuf.clear();
        _state = State::Ground;
    }
}

void KeyDecoder::processUtf8(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if ((byte & 0xC0) != 0x80)
    {
        _utf8Buf.clear();
        _altPending = false;
        _state = State::Ground;
        processGround(byte, events);
        return;
    }

    _utf8Buf += static_cast<char>(byte);
    if (--_utf8Remaining > 0)
        return;

    auto const decoded = utf8::decode(_utf8Buf);
    if (!decoded.empty())
        events.emplace_back(charKey(decoded.front(), _altPending ? Modifier::Alt : Modifier::None));
    _utf8Buf.clear();
    _altPending = false;
    _state = State::Ground;
}

void KeyDecoder::dispatchCsi(char finalByte, std::vector<InputEvent>& events)
{
    if (finalByte == '~' && _paramBuf == "200")
    {
        _pasteBuf.clear();
        _state = State::PasteBody;
        return;
    }

    // Mouse reports and private-mode replies carry no key.
    if (!_paramBuf.empty() && (_paramBuf[0] == '<' || _paramBuf[0] == '>' || _paramBuf[0] == '?'))
        return;

    auto const params = parseCsiParams(_paramBuf);

    // CSI-u: ESC [ keycode ; modifiers u
    if (finalByte == 'u')
    {
        auto const keycode = params.empty() ? 0 : params[0];
        auto const modifier = (params.size() >= 2) ? decodeModifiers(params[1]) : Modifier::None;

        switch (keycode)
        {
            case 13: events.emplace_back(namedKey(KeyCode::Enter, modifier)); return;
            case 9: events.emplace_back(namedKey(KeyCode::Tab, modifier)); return;
            case 127: events.emplace_back(namedKey(KeyCode::Backspace, modifier)); return;
            case 27: events.emplace_back(namedKey(KeyCode::Escape, modifier)); return;
            default: break;
        }

        if (keycode >= 32 && keycode < 0x110000)
        {
            auto cp = static_cast<char32_t>(keycode);
            if (hasModifier(modifier, Modifier::Ctrl) && cp >= U'A' && cp <= U'Z')
                cp = cp - U'A' + U'a';
            events.emplace_back(charKey(cp, modifier));
        }
        return;
    }

    if (auto key = mapCsiKey(finalByte, params))
        events.emplace_back(*key);
}

} // namespace mimic::tui
