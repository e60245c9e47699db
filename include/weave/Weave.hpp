#pragma once

#include <weave/core/Error.hpp>
#include <weave/event/EventHandler.hpp>
#include <weave/event/Events.hpp>
#include <weave/event/Key.hpp>
#include <weave/layout/LayoutObject.hpp>
#include <weave/runtime/EventDispatch.hpp>
#include <weave/runtime/Runtime.hpp>
#include <weave/runtime/StateUpdate.hpp>
#include <weave/runtime/TreeBuilder.hpp>
#include <weave/runtime/TreeDump.hpp>
#include <weave/theme/Selector.hpp>
#include <weave/widget/Properties.hpp>
#include <weave/widget/Property.hpp>
#include <weave/widget/SharedProperty.hpp>
#include <weave/widget/State.hpp>
#include <weave/widget/Template.hpp>
#include <weave/widget/Widget.hpp>
#include <weave/widget/WidgetContainer.hpp>
#include <weave/widgets/Primitives.hpp>
#include <weave/widgets/Stack.hpp>
#include <weave/widgets/TextBox.hpp>
