#include <weave/runtime/TreeBuilder.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace WV {

auto TreeBuilder::build(Template root) -> Expected<std::unique_ptr<WidgetContainer>> {
    if (auto status = root.validate(); !status) {
        wv_log("TreeBuilder rejected template: " + describeError(status.error()), "Template", "ERROR");
        return std::unexpected(status.error());
    }
    return instantiate(std::move(root), nullptr);
}

auto TreeBuilder::attach(WidgetContainer& parent, Template tmpl) -> Expected<WidgetContainer*> {
    if (auto capacity = check_capacity(parent); !capacity)
        return std::unexpected(capacity.error());
    if (auto status = tmpl.validate(); !status)
        return std::unexpected(status.error());
    auto child = instantiate(std::move(tmpl), &parent);
    auto* raw  = child.get();
    parent.children_.push_back(std::move(child));
    return raw;
}

auto TreeBuilder::Adopt(WidgetContainer& parent, std::unique_ptr<WidgetContainer> subtree) -> Expected<WidgetContainer*> {
    if (!subtree || subtree->parent_) {
        return std::unexpected(Error{Error::Code::InvalidTemplate, "only a detached root can be adopted"});
    }
    for (auto const* node = &parent; node != nullptr; node = node->parent_) {
        if (node == subtree.get())
            return std::unexpected(Error{Error::Code::InvalidTemplate, "a subtree cannot adopt itself"});
    }
    if (auto capacity = check_capacity(parent); !capacity)
        return std::unexpected(capacity.error());
    subtree->parent_ = &parent;
    auto* raw        = subtree.get();
    parent.children_.push_back(std::move(subtree));
    return raw;
}

auto TreeBuilder::Detach(WidgetContainer& widget) -> Expected<std::unique_ptr<WidgetContainer>> {
    auto* parent = widget.parent_;
    if (!parent) {
        return std::unexpected(Error{Error::Code::NotSupported,
                                     "widget '" + widget.debug_name_ + "' is a root and cannot be detached"});
    }
    auto& siblings = parent->children_;
    auto  it = std::find_if(siblings.begin(), siblings.end(), [&widget](auto const& child) {
        return child.get() == &widget;
    });
    if (it == siblings.end()) {
        return std::unexpected(Error{Error::Code::WidgetNotFound,
                                     "widget '" + widget.debug_name_ + "' is not a child of its parent"});
    }
    auto detached = std::move(*it);
    siblings.erase(it);
    detached->parent_ = nullptr;
    return detached;
}

auto TreeBuilder::check_capacity(WidgetContainer const& parent) -> Expected<void> {
    auto capacity = parentTypeCapacity(parent.parent_type_);
    if (capacity && parent.children_.size() >= *capacity) {
        return std::unexpected(Error{Error::Code::ArityViolation,
                                     "widget '" + parent.debug_name_ + "' ("
                                         + std::string(parentTypeToString(parent.parent_type_))
                                         + ") cannot take another child"});
    }
    return {};
}

auto TreeBuilder::instantiate(Template&& tmpl, WidgetContainer* parent) -> std::unique_ptr<WidgetContainer> {
    std::unique_ptr<WidgetContainer> widget{new WidgetContainer(next_id_++, parent)};
    widget->parent_type_ = tmpl.parent_type_;
    widget->properties_  = std::move(tmpl.properties_);
    widget->layout_      = std::move(tmpl.layout_);
    widget->state_       = std::move(tmpl.state_);
    widget->handlers_    = std::move(tmpl.handlers_);
    widget->debug_name_  = std::move(tmpl.debug_name_);

    widget->children_.reserve(tmpl.children_.size());
    for (auto& child : tmpl.children_)
        widget->children_.push_back(instantiate(std::move(child), widget.get()));
    tmpl.children_.clear();

    wv_log("Instantiated '" + widget->debug_name_ + "' as #" + std::to_string(widget->id_), "Template");
    return widget;
}

} // namespace WV
