#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace WV::Theme {

/**
 * CSS-style selector a widget publishes so the theme engine can resolve its
 * paint attributes, e.g. `textbox#search.primary:focus`.
 *
 * Only stored and shared here; matching against a style sheet belongs to the
 * theme engine.
 */
class Selector {
public:
    static constexpr std::string_view kName = "selector";

    Selector() = default;
    explicit Selector(std::string element);

    [[nodiscard]] auto with(std::string element) const -> Selector;
    [[nodiscard]] auto with_id(std::string id) const -> Selector;
    [[nodiscard]] auto with_class(std::string class_name) const -> Selector;
    [[nodiscard]] auto with_pseudo_class(std::string pseudo_class) const -> Selector;

    auto set_pseudo_class(std::string const& pseudo_class, bool enabled) -> bool;

    [[nodiscard]] auto element() const -> std::optional<std::string> const& { return element_; }
    [[nodiscard]] auto id() const -> std::optional<std::string> const& { return id_; }
    [[nodiscard]] auto classes() const -> std::set<std::string> const& { return classes_; }
    [[nodiscard]] auto pseudo_classes() const -> std::set<std::string> const& { return pseudo_classes_; }

    [[nodiscard]] auto has_class(std::string const& class_name) const -> bool;
    [[nodiscard]] auto has_pseudo_class(std::string const& pseudo_class) const -> bool;
    [[nodiscard]] auto empty() const -> bool;

    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(Selector const&) const -> bool = default;

private:
    std::optional<std::string> element_;
    std::optional<std::string> id_;
    std::set<std::string>      classes_;
    std::set<std::string>      pseudo_classes_;
};

inline void to_json(nlohmann::json& j, Selector const& selector) {
    j = selector.to_string();
}

} // namespace WV::Theme
