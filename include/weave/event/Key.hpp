#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace WV {

enum class KeyCode : std::uint16_t {
    Unknown = 0,
    Character,
    Backspace,
    Delete,
    Enter,
    Escape,
    Tab,
    Left,
    Right,
    Up,
    Down,
    Home,
    End
};

struct Key {
    KeyCode  code      = KeyCode::Unknown;
    char32_t character = U'\0'; // only meaningful for KeyCode::Character

    // Maps a raw code point to a key; control characters map to their key codes.
    [[nodiscard]] static auto FromCharacter(char32_t ch) -> Key;

    // Code point to insert into text, if this key produces one.
    [[nodiscard]] auto printable() const -> std::optional<char32_t>;

    auto operator==(Key const&) const -> bool = default;
};

[[nodiscard]] auto keyCodeToString(KeyCode code) -> std::string_view;

[[nodiscard]] auto utf32ToUtf8(char32_t ch) -> std::string;

// Removes the trailing UTF-8 code point. Returns false when text is empty.
auto popLastCodepoint(std::string& text) -> bool;

} // namespace WV
