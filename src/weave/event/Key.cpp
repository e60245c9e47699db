#include <weave/event/Key.hpp>

namespace WV {

auto Key::FromCharacter(char32_t ch) -> Key {
    switch (ch) {
    case U'\b':
        return Key{KeyCode::Backspace};
    case U'\r':
    case U'\n':
        return Key{KeyCode::Enter};
    case U'\t':
        return Key{KeyCode::Tab};
    case U'\x1b':
        return Key{KeyCode::Escape};
    case U'\x7f':
        return Key{KeyCode::Delete};
    default:
        break;
    }
    return Key{KeyCode::Character, ch};
}

auto Key::printable() const -> std::optional<char32_t> {
    if (code != KeyCode::Character)
        return std::nullopt;
    if (character < 0x20 || character == 0x7f)
        return std::nullopt;
    if (character > 0x10FFFF || (character >= 0xD800 && character <= 0xDFFF))
        return std::nullopt;
    return character;
}

auto keyCodeToString(KeyCode code) -> std::string_view {
    switch (code) {
    case KeyCode::Unknown:
        return "unknown";
    case KeyCode::Character:
        return "character";
    case KeyCode::Backspace:
        return "backspace";
    case KeyCode::Delete:
        return "delete";
    case KeyCode::Enter:
        return "enter";
    case KeyCode::Escape:
        return "escape";
    case KeyCode::Tab:
        return "tab";
    case KeyCode::Left:
        return "left";
    case KeyCode::Right:
        return "right";
    case KeyCode::Up:
        return "up";
    case KeyCode::Down:
        return "down";
    case KeyCode::Home:
        return "home";
    case KeyCode::End:
        return "end";
    }
    return "unknown";
}

auto utf32ToUtf8(char32_t ch) -> std::string {
    std::string out;
    if (ch <= 0x7F) {
        out.push_back(static_cast<char>(ch));
        return out;
    }
    if (ch <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((ch >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
        return out;
    }
    if (ch <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((ch >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
        return out;
    }
    out.push_back(static_cast<char>(0xF0 | ((ch >> 18) & 0x07)));
    out.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    return out;
}

auto popLastCodepoint(std::string& text) -> bool {
    if (text.empty())
        return false;

    auto is_continuation = [](unsigned char byte) { return (byte & 0xC0) == 0x80; };
    auto sequence_length = [](unsigned char byte) -> std::size_t {
        if (byte < 0x80)
            return 1;
        if ((byte & 0xE0) == 0xC0)
            return 2;
        if ((byte & 0xF0) == 0xE0)
            return 3;
        if ((byte & 0xF8) == 0xF0)
            return 4;
        return 0;
    };

    // A code point has at most three continuation bytes after its lead byte.
    auto start = text.size() - 1;
    while (start > 0 && text.size() - start < 4 && is_continuation(static_cast<unsigned char>(text[start])))
        --start;

    auto lead = static_cast<unsigned char>(text[start]);
    if (!is_continuation(lead) && sequence_length(lead) == text.size() - start) {
        text.resize(start);
    } else {
        // Malformed tail: drop a single byte.
        text.pop_back();
    }
    return true;
}

} // namespace WV
