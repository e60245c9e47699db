#pragma once

#include <weave/theme/Selector.hpp>

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace WV {

// Text displayed by a widget (text box content, text block text).
struct Label {
    static constexpr std::string_view kName = "label";

    std::string text;

    auto operator==(Label const&) const -> bool = default;
};

// Placeholder shown while the Label is empty.
struct WaterMark {
    static constexpr std::string_view kName = "water_mark";

    std::string text;

    auto operator==(WaterMark const&) const -> bool = default;
};

// Set by the focus owner; text input only edits while focused.
struct Focused {
    static constexpr std::string_view kName = "focused";

    bool value = false;

    auto operator==(Focused const&) const -> bool = default;
};

using Selector = Theme::Selector;

inline void to_json(nlohmann::json& j, Label const& label) {
    j = label.text;
}

inline void to_json(nlohmann::json& j, WaterMark const& water_mark) {
    j = water_mark.text;
}

inline void to_json(nlohmann::json& j, Focused const& focused) {
    j = focused.value;
}

} // namespace WV
