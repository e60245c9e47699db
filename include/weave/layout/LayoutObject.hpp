#pragma once

#include <string_view>
#include <type_traits>
#include <variant>

namespace WV::Layout {

struct Thickness {
    float left   = 0.0f;
    float top    = 0.0f;
    float right  = 0.0f;
    float bottom = 0.0f;

    auto operator==(Thickness const&) const -> bool = default;
};

// Descriptors handed to the layout engine. Geometry is computed there, never here.

struct DefaultLayoutObject {
    static constexpr std::string_view kKind = "default";
    auto operator==(DefaultLayoutObject const&) const -> bool = default;
};

// Children fill the parent and are stacked on the z-axis.
struct StretchLayoutObject {
    static constexpr std::string_view kKind = "stretch";
    auto operator==(StretchLayoutObject const&) const -> bool = default;
};

struct PaddingLayoutObject {
    static constexpr std::string_view kKind = "padding";
    Thickness padding{};
    auto operator==(PaddingLayoutObject const&) const -> bool = default;
};

struct ScrollLayoutObject {
    static constexpr std::string_view kKind = "scroll";
    float offset_x = 0.0f;
    float offset_y = 0.0f;
    auto operator==(ScrollLayoutObject const&) const -> bool = default;
};

using LayoutObject = std::variant<DefaultLayoutObject,
                                  StretchLayoutObject,
                                  PaddingLayoutObject,
                                  ScrollLayoutObject>;

[[nodiscard]] inline auto LayoutObjectKind(LayoutObject const& layout) -> std::string_view {
    return std::visit([](auto const& object) -> std::string_view {
        return std::decay_t<decltype(object)>::kKind;
    }, layout);
}

} // namespace WV::Layout
