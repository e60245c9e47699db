#include <weave/widgets/Primitives.hpp>

#include <weave/widget/Properties.hpp>

namespace WV::Widgets {

auto Container::Create() -> Template {
    return Template{}
        .with_debug_name("Container")
        .as_parent_type(ParentType::Single)
        .with_layout_object(Layout::PaddingLayoutObject{})
        .with_property(Selector("container"));
}

auto ScrollViewer::Create() -> Template {
    return Template{}
        .with_debug_name("ScrollViewer")
        .as_parent_type(ParentType::Single)
        .with_layout_object(Layout::ScrollLayoutObject{});
}

auto TextBlock::Create() -> Template {
    return Template{}
        .with_debug_name("TextBlock")
        .with_property(Label{})
        .with_property(Selector("textblock"));
}

auto WaterMarkTextBlock::Create() -> Template {
    return Template{}
        .with_debug_name("WaterMarkTextBlock")
        .with_property(Label{})
        .with_property(WaterMark{})
        .with_property(Selector("watermark"));
}

auto Cursor::Create() -> Template {
    return Template{}
        .with_debug_name("Cursor")
        .with_property(Selector("cursor"));
}

} // namespace WV::Widgets
