#include <weave/event/EventHandler.hpp>

#include <utility>

namespace WV {

namespace {

// Registration order; the first callback that returns true wins.
template <typename Callbacks, typename Arg>
auto run_until_consumed(Callbacks const& callbacks, Arg const& arg, WidgetContainer& widget) -> bool {
    for (auto const& callback : callbacks) {
        if (callback && callback(arg, widget))
            return true;
    }
    return false;
}

auto key_only(KeyCallback callback) -> KeyEventCallback {
    if (!callback)
        return {};
    return [callback = std::move(callback)](KeyEvent const& event, WidgetContainer& widget) {
        return callback(event.key, widget);
    };
}

} // namespace

auto KeyEventHandler::on_key_down(KeyCallback callback) & -> KeyEventHandler& {
    return on_key_down(key_only(std::move(callback)));
}

auto KeyEventHandler::on_key_down(KeyCallback callback) && -> KeyEventHandler&& {
    return std::move(on_key_down(key_only(std::move(callback))));
}

auto KeyEventHandler::on_key_down(KeyEventCallback callback) & -> KeyEventHandler& {
    key_down_.push_back(std::move(callback));
    return *this;
}

auto KeyEventHandler::on_key_down(KeyEventCallback callback) && -> KeyEventHandler&& {
    key_down_.push_back(std::move(callback));
    return std::move(*this);
}

auto KeyEventHandler::on_key_up(KeyCallback callback) & -> KeyEventHandler& {
    return on_key_up(key_only(std::move(callback)));
}

auto KeyEventHandler::on_key_up(KeyCallback callback) && -> KeyEventHandler&& {
    return std::move(on_key_up(key_only(std::move(callback))));
}

auto KeyEventHandler::on_key_up(KeyEventCallback callback) & -> KeyEventHandler& {
    key_up_.push_back(std::move(callback));
    return *this;
}

auto KeyEventHandler::on_key_up(KeyEventCallback callback) && -> KeyEventHandler&& {
    key_up_.push_back(std::move(callback));
    return std::move(*this);
}

auto KeyEventHandler::handles(Event const& event) const -> bool {
    return std::holds_alternative<KeyEvent>(event);
}

auto KeyEventHandler::handle_event(Event const& event, WidgetContainer& widget) -> bool {
    auto const* key_event = std::get_if<KeyEvent>(&event);
    if (!key_event)
        return false;
    switch (key_event->type) {
    case KeyEventType::KeyDown:
        return run_until_consumed(key_down_, *key_event, widget);
    case KeyEventType::KeyUp:
        return run_until_consumed(key_up_, *key_event, widget);
    }
    return false;
}

auto MouseEventHandler::on_mouse_down(MouseCallback callback) & -> MouseEventHandler& {
    mouse_down_.push_back(std::move(callback));
    return *this;
}

auto MouseEventHandler::on_mouse_down(MouseCallback callback) && -> MouseEventHandler&& {
    mouse_down_.push_back(std::move(callback));
    return std::move(*this);
}

auto MouseEventHandler::on_mouse_up(MouseCallback callback) & -> MouseEventHandler& {
    mouse_up_.push_back(std::move(callback));
    return *this;
}

auto MouseEventHandler::on_mouse_up(MouseCallback callback) && -> MouseEventHandler&& {
    mouse_up_.push_back(std::move(callback));
    return std::move(*this);
}

auto MouseEventHandler::on_mouse_move(MouseCallback callback) & -> MouseEventHandler& {
    mouse_move_.push_back(std::move(callback));
    return *this;
}

auto MouseEventHandler::on_mouse_move(MouseCallback callback) && -> MouseEventHandler&& {
    mouse_move_.push_back(std::move(callback));
    return std::move(*this);
}

auto MouseEventHandler::handles(Event const& event) const -> bool {
    return std::holds_alternative<MouseEvent>(event);
}

auto MouseEventHandler::handle_event(Event const& event, WidgetContainer& widget) -> bool {
    auto const* mouse_event = std::get_if<MouseEvent>(&event);
    if (!mouse_event)
        return false;
    switch (mouse_event->type) {
    case MouseEventType::ButtonDown:
        return run_until_consumed(mouse_down_, *mouse_event, widget);
    case MouseEventType::ButtonUp:
        return run_until_consumed(mouse_up_, *mouse_event, widget);
    case MouseEventType::Move:
        return run_until_consumed(mouse_move_, *mouse_event, widget);
    }
    return false;
}

} // namespace WV
