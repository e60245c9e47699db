#pragma once

#include <weave/core/Error.hpp>

namespace WV {

class WidgetContainer;

/**
 * Per-widget behaviour run once per tick after event dispatch.
 *
 * Implementations reconcile their private data with the widget's externally
 * visible properties. update must be idempotent: calling it again in the same
 * tick must not change anything. Errors are reported to the runtime, which
 * records them and continues with the remaining widgets.
 */
class State {
public:
    virtual ~State() = default;

    virtual auto update(WidgetContainer& widget) -> Expected<void> = 0;
};

} // namespace WV
