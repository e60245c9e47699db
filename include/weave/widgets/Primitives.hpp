#pragma once

#include <weave/widget/Template.hpp>

namespace WV::Widgets {

// Single child wrapped in padding. Selector "container".
struct Container {
    static auto Create() -> Template;
};

// Single child that may be larger than the viewport.
struct ScrollViewer {
    static auto Create() -> Template;
};

// Leaf displaying its Label. Selector "textblock".
struct TextBlock {
    static auto Create() -> Template;
};

// Leaf displaying its Label, or its WaterMark while the Label is empty. Selector "watermark".
struct WaterMarkTextBlock {
    static auto Create() -> Template;
};

// Text insertion caret. Selector "cursor".
struct Cursor {
    static auto Create() -> Template;
};

} // namespace WV::Widgets
