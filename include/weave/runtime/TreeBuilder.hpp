#pragma once

#include <weave/core/Error.hpp>
#include <weave/widget/Template.hpp>
#include <weave/widget/Widget.hpp>
#include <weave/widget/WidgetContainer.hpp>

#include <memory>

namespace WV {

/**
 * Instantiates Templates into WidgetContainer trees.
 *
 * Ids are handed out in pre-order and never reused by the same builder, so a
 * builder kept alive next to a tree can mount further subtrees without
 * clashing ids.
 */
class TreeBuilder {
public:
    explicit TreeBuilder(WidgetId first_id = 1)
        : next_id_(first_id) {}

    // Validates the whole template first; nothing is instantiated on failure.
    [[nodiscard]] auto build(Template root) -> Expected<std::unique_ptr<WidgetContainer>>;

    // Instantiates tmpl as the last child of parent, respecting parent's arity.
    [[nodiscard]] auto attach(WidgetContainer& parent, Template tmpl) -> Expected<WidgetContainer*>;

    // Links a subtree built earlier (by build) as the last child of parent.
    [[nodiscard]] static auto Adopt(WidgetContainer& parent, std::unique_ptr<WidgetContainer> subtree)
        -> Expected<WidgetContainer*>;

    // Unlinks widget from its parent and hands the subtree to the caller.
    [[nodiscard]] static auto Detach(WidgetContainer& widget) -> Expected<std::unique_ptr<WidgetContainer>>;

    [[nodiscard]] auto next_id() const -> WidgetId { return next_id_; }

private:
    auto instantiate(Template&& tmpl, WidgetContainer* parent) -> std::unique_ptr<WidgetContainer>;
    [[nodiscard]] static auto check_capacity(WidgetContainer const& parent) -> Expected<void>;

    WidgetId next_id_;
};

template <Widget W>
[[nodiscard]] auto Instantiate() -> Expected<std::unique_ptr<WidgetContainer>> {
    TreeBuilder builder;
    return builder.build(W::Create());
}

} // namespace WV
