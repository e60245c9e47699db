#include <weave/widget/Template.hpp>

#include "log/TaggedLogger.hpp"

namespace WV {

auto parentTypeToString(ParentType type) -> std::string_view {
    switch (type) {
    case ParentType::None:
        return "none";
    case ParentType::Single:
        return "single";
    case ParentType::Multi:
        return "multi";
    }
    return "none";
}

auto parentTypeCapacity(ParentType type) -> std::optional<std::size_t> {
    switch (type) {
    case ParentType::None:
        return 0;
    case ParentType::Single:
        return 1;
    case ParentType::Multi:
        return std::nullopt;
    }
    return 0;
}

auto Template::as_parent_type(ParentType type) & -> Template& {
    parent_type_ = type;
    return *this;
}

auto Template::as_parent_type(ParentType type) && -> Template&& {
    parent_type_ = type;
    return std::move(*this);
}

auto Template::with_child(Template child) & -> Template& {
    append_child(std::move(child));
    return *this;
}

auto Template::with_child(Template child) && -> Template&& {
    append_child(std::move(child));
    return std::move(*this);
}

auto Template::with_layout_object(Layout::LayoutObject layout) & -> Template& {
    layout_ = std::move(layout);
    return *this;
}

auto Template::with_layout_object(Layout::LayoutObject layout) && -> Template&& {
    layout_ = std::move(layout);
    return std::move(*this);
}

auto Template::with_state(std::shared_ptr<State> state) & -> Template& {
    state_ = std::move(state);
    return *this;
}

auto Template::with_state(std::shared_ptr<State> state) && -> Template&& {
    state_ = std::move(state);
    return std::move(*this);
}

auto Template::with_event_handler(std::shared_ptr<EventHandler> handler) & -> Template& {
    if (handler)
        handlers_.push_back(std::move(handler));
    return *this;
}

auto Template::with_event_handler(std::shared_ptr<EventHandler> handler) && -> Template&& {
    if (handler)
        handlers_.push_back(std::move(handler));
    return std::move(*this);
}

auto Template::with_debug_name(std::string name) & -> Template& {
    debug_name_ = std::move(name);
    return *this;
}

auto Template::with_debug_name(std::string name) && -> Template&& {
    debug_name_ = std::move(name);
    return std::move(*this);
}

auto Template::validate() const -> Expected<void> {
    if (defect_)
        return std::unexpected(*defect_);
    auto capacity = parentTypeCapacity(parent_type_);
    if (capacity && children_.size() > *capacity) {
        return std::unexpected(Error{Error::Code::ArityViolation,
                                     label() + " declares parent type "
                                         + std::string(parentTypeToString(parent_type_)) + " but holds "
                                         + std::to_string(children_.size()) + " children"});
    }
    for (auto const& child : children_) {
        if (auto status = child.validate(); !status)
            return status;
    }
    return {};
}

auto Template::set_slot(std::type_index type, Detail::PropertySlot slot) -> void {
    properties_.insert_or_assign(type, std::move(slot));
}

auto Template::append_child(Template child) -> void {
    auto capacity = parentTypeCapacity(parent_type_);
    if (capacity && children_.size() >= *capacity) {
        record_defect(Error{Error::Code::ArityViolation,
                            label() + " (" + std::string(parentTypeToString(parent_type_)) + ") rejected child "
                                + child.label() + " at index " + std::to_string(children_.size())});
        return;
    }
    children_.push_back(std::move(child));
}

auto Template::label() const -> std::string {
    if (debug_name_.empty())
        return "unnamed " + std::string(parentTypeToString(parent_type_)) + " template";
    return "'" + debug_name_ + "'";
}

auto Template::record_defect(Error error) -> void {
    wv_log("Template defect: " + describeError(error), "Template", "ERROR");
    if (!defect_)
        defect_ = std::move(error);
}

} // namespace WV
