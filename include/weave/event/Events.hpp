#pragma once

#include <weave/event/Key.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

namespace WV {

// Keyboard modifier bitmask
enum KeyModifier : std::uint32_t {
    Mod_None  = 0,
    Mod_Shift = 1u << 0,
    Mod_Ctrl  = 1u << 1,
    Mod_Alt   = 1u << 2,
    Mod_Meta  = 1u << 3,
};

enum class KeyEventType {
    KeyDown,
    KeyUp
};

struct KeyEvent {
    KeyEventType  type      = KeyEventType::KeyDown;
    Key           key{};
    std::uint32_t modifiers = Mod_None;

    friend std::ostream& operator<<(std::ostream& os, KeyEvent const& e) {
        os << (e.type == KeyEventType::KeyDown ? "[key] down " : "[key] up ") << keyCodeToString(e.key.code);
        if (e.key.code == KeyCode::Character)
            os << " '" << utf32ToUtf8(e.key.character) << '\'';
        return os << " mods=" << e.modifiers;
    }
};

enum class MouseButton : int {
    Left   = 1,
    Right  = 2,
    Middle = 3
};

enum class MouseEventType {
    Move,
    ButtonDown,
    ButtonUp
};

struct MouseEvent {
    MouseEventType type   = MouseEventType::Move;
    MouseButton    button = MouseButton::Left;
    int            x      = 0;
    int            y      = 0;

    friend std::ostream& operator<<(std::ostream& os, MouseEvent const& e) {
        switch (e.type) {
            case MouseEventType::Move:
                return os << "[mouse] move (" << e.x << ", " << e.y << ")";
            case MouseEventType::ButtonDown:
                return os << "[mouse] down button=" << static_cast<int>(e.button) << " (" << e.x << ", " << e.y << ")";
            case MouseEventType::ButtonUp:
                return os << "[mouse] up button=" << static_cast<int>(e.button) << " (" << e.x << ", " << e.y << ")";
        }
        return os;
    }
};

using Event = std::variant<KeyEvent, MouseEvent>;

[[nodiscard]] auto KeyDown(Key key, std::uint32_t modifiers = Mod_None) -> Event;
[[nodiscard]] auto KeyUp(Key key, std::uint32_t modifiers = Mod_None) -> Event;
[[nodiscard]] auto describeEvent(Event const& event) -> std::string;

} // namespace WV
