#pragma once

#include <weave/event/Events.hpp>
#include <weave/widget/WidgetContainer.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace WV {

// Where an event travels after reaching its target.
enum class DispatchStrategy : std::uint8_t {
    Direct,   // the target only
    BubbleUp, // the target, then each ancestor up to the root
    TopDown   // the target's subtree in pre-order
};

[[nodiscard]] auto dispatchStrategyToString(DispatchStrategy strategy) -> std::string_view;

struct DispatchResult {
    bool                    consumed = false;
    std::optional<WidgetId> consumed_by;
    std::size_t             widgets_visited = 0;
};

// Delivers one event. Stops at the first widget whose handlers consume it.
auto DispatchEvent(Event const& event, WidgetContainer& target, DispatchStrategy strategy) -> DispatchResult;

} // namespace WV
