#include <weave/runtime/EventDispatch.hpp>

#include "log/TaggedLogger.hpp"

#include <vector>

namespace WV {

namespace {

auto offer(Event const& event, WidgetContainer& widget, DispatchResult& result) -> bool {
    ++result.widgets_visited;
    if (widget.event_handlers().empty())
        return false;
    if (!widget.handle_event(event))
        return false;
    result.consumed    = true;
    result.consumed_by = widget.id();
    return true;
}

auto dispatch_top_down(Event const& event, WidgetContainer& root, DispatchResult& result) -> void {
    // Explicit stack keeps pre-order without recursing through deep trees.
    std::vector<WidgetContainer*> pending{&root};
    while (!pending.empty()) {
        auto* widget = pending.back();
        pending.pop_back();
        if (offer(event, *widget, result))
            return;
        auto const& children = widget->children();
        for (auto it = children.rbegin(); it != children.rend(); ++it)
            pending.push_back(it->get());
    }
}

} // namespace

auto dispatchStrategyToString(DispatchStrategy strategy) -> std::string_view {
    switch (strategy) {
    case DispatchStrategy::Direct:
        return "direct";
    case DispatchStrategy::BubbleUp:
        return "bubble_up";
    case DispatchStrategy::TopDown:
        return "top_down";
    }
    return "direct";
}

auto DispatchEvent(Event const& event, WidgetContainer& target, DispatchStrategy strategy) -> DispatchResult {
    DispatchResult result{};
    switch (strategy) {
    case DispatchStrategy::Direct:
        (void)offer(event, target, result);
        break;
    case DispatchStrategy::BubbleUp:
        for (auto* widget = &target; widget != nullptr; widget = widget->parent()) {
            if (offer(event, *widget, result))
                break;
        }
        break;
    case DispatchStrategy::TopDown:
        dispatch_top_down(event, target, result);
        break;
    }

    if (result.consumed) {
        wv_log(describeEvent(event) + " consumed by #" + std::to_string(*result.consumed_by), "Dispatch");
    } else {
        wv_log(describeEvent(event) + " not consumed (" + std::string(dispatchStrategyToString(strategy)) + ")",
               "Dispatch");
    }
    return result;
}

} // namespace WV
