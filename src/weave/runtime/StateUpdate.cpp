#include <weave/runtime/StateUpdate.hpp>

#include "log/TaggedLogger.hpp"

namespace WV {

auto UpdateStates(WidgetContainer& root) -> StateUpdateReport {
    StateUpdateReport report{};
    root.visit([&report](WidgetContainer& widget) {
        // Copy the handle so the state outlives the call even if it is the last holder.
        auto state = widget.state();
        if (!state)
            return;
        ++report.states_updated;
        auto status = state->update(widget);
        if (!status) {
            wv_log("State update failed for '" + widget.debug_name() + "': " + describeError(status.error()),
                   "State", "ERROR");
            report.failures.push_back(StateUpdateFailure{widget.id(), widget.debug_name(), status.error()});
        }
    });
    return report;
}

} // namespace WV
