#pragma once

#include <weave/core/Error.hpp>
#include <weave/widget/WidgetContainer.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace WV {

struct StateUpdateFailure {
    WidgetId    widget = 0;
    std::string debug_name;
    Error       error;
};

struct StateUpdateReport {
    std::size_t                     states_updated = 0;
    std::vector<StateUpdateFailure> failures;
};

/**
 * Runs State::update for every widget under root that has a State, in
 * pre-order (parent before children, children in declaration order).
 * A failing update is recorded and does not stop the remaining updates.
 */
auto UpdateStates(WidgetContainer& root) -> StateUpdateReport;

} // namespace WV
