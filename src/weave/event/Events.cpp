#include <weave/event/Events.hpp>

#include <sstream>

namespace WV {

auto KeyDown(Key key, std::uint32_t modifiers) -> Event {
    return KeyEvent{KeyEventType::KeyDown, key, modifiers};
}

auto KeyUp(Key key, std::uint32_t modifiers) -> Event {
    return KeyEvent{KeyEventType::KeyUp, key, modifiers};
}

auto describeEvent(Event const& event) -> std::string {
    std::ostringstream oss;
    std::visit([&oss](auto const& e) { oss << e; }, event);
    return oss.str();
}

} // namespace WV
