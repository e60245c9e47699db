#pragma once

#include <weave/event/Events.hpp>

#include <cstddef>
#include <functional>
#include <vector>

namespace WV {

class WidgetContainer;

/**
 * Per-widget input capability.
 *
 * handle_event returns true when the event was consumed; dispatch then stops
 * for that event instance. Callbacks run to completion before dispatch
 * continues, and may mutate the widget's properties.
 */
class EventHandler {
public:
    virtual ~EventHandler() = default;

    [[nodiscard]] virtual auto handles(Event const& event) const -> bool = 0;
    virtual auto handle_event(Event const& event, WidgetContainer& widget) -> bool = 0;
};

using KeyCallback      = std::function<bool(Key, WidgetContainer&)>;
using KeyEventCallback = std::function<bool(KeyEvent const&, WidgetContainer&)>;
using MouseCallback    = std::function<bool(MouseEvent const&, WidgetContainer&)>;

// KeyCallback sees the key only; KeyEventCallback also sees the modifiers.
class KeyEventHandler final : public EventHandler {
public:
    auto on_key_down(KeyCallback callback) & -> KeyEventHandler&;
    auto on_key_down(KeyCallback callback) && -> KeyEventHandler&&;
    auto on_key_down(KeyEventCallback callback) & -> KeyEventHandler&;
    auto on_key_down(KeyEventCallback callback) && -> KeyEventHandler&&;
    auto on_key_up(KeyCallback callback) & -> KeyEventHandler&;
    auto on_key_up(KeyCallback callback) && -> KeyEventHandler&&;
    auto on_key_up(KeyEventCallback callback) & -> KeyEventHandler&;
    auto on_key_up(KeyEventCallback callback) && -> KeyEventHandler&&;

    [[nodiscard]] auto handles(Event const& event) const -> bool override;
    auto handle_event(Event const& event, WidgetContainer& widget) -> bool override;

    [[nodiscard]] auto key_down_callbacks() const -> std::size_t { return key_down_.size(); }
    [[nodiscard]] auto key_up_callbacks() const -> std::size_t { return key_up_.size(); }

private:
    std::vector<KeyEventCallback> key_down_;
    std::vector<KeyEventCallback> key_up_;
};

class MouseEventHandler final : public EventHandler {
public:
    auto on_mouse_down(MouseCallback callback) & -> MouseEventHandler&;
    auto on_mouse_down(MouseCallback callback) && -> MouseEventHandler&&;
    auto on_mouse_up(MouseCallback callback) & -> MouseEventHandler&;
    auto on_mouse_up(MouseCallback callback) && -> MouseEventHandler&&;
    auto on_mouse_move(MouseCallback callback) & -> MouseEventHandler&;
    auto on_mouse_move(MouseCallback callback) && -> MouseEventHandler&&;

    [[nodiscard]] auto handles(Event const& event) const -> bool override;
    auto handle_event(Event const& event, WidgetContainer& widget) -> bool override;

private:
    std::vector<MouseCallback> mouse_down_;
    std::vector<MouseCallback> mouse_up_;
    std::vector<MouseCallback> mouse_move_;
};

} // namespace WV
