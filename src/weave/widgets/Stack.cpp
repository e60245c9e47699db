#include <weave/widgets/Stack.hpp>

namespace WV::Widgets {

auto Stack::Create() -> Template {
    return Template{}
        .with_debug_name("Stack")
        .as_parent_type(ParentType::Multi)
        .with_layout_object(Layout::StretchLayoutObject{});
}

} // namespace WV::Widgets
