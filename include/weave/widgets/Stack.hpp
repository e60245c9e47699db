#pragma once

#include <weave/widget/Template.hpp>

namespace WV::Widgets {

/**
 * Layout node stacking its children on the z-axis.
 *
 * Multi parent, StretchLayoutObject, no state and no properties of its own.
 */
struct Stack {
    static auto Create() -> Template;
};

} // namespace WV::Widgets
