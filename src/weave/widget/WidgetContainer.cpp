#include <weave/widget/WidgetContainer.hpp>

namespace WV {

WidgetContainer::WidgetContainer(WidgetId id, WidgetContainer* parent)
    : id_(id)
    , parent_(parent) {}

auto WidgetContainer::child(std::size_t index) const -> WidgetContainer* {
    if (index >= children_.size())
        return nullptr;
    return children_[index].get();
}

auto WidgetContainer::handle_event(Event const& event) -> bool {
    for (auto const& handler : handlers_) {
        if (!handler->handles(event))
            continue;
        if (handler->handle_event(event, *this))
            return true;
    }
    return false;
}

auto WidgetContainer::find_slot(std::type_index type) const -> Detail::PropertySlot const* {
    auto it = properties_.find(type);
    if (it == properties_.end())
        return nullptr;
    return &it->second;
}

auto WidgetContainer::not_found(std::string_view property) const -> Error {
    std::string message{"widget '"};
    message.append(debug_name_);
    message.append("' (#");
    message.append(std::to_string(id_));
    message.append(") has no property '");
    message.append(property);
    message.push_back('\'');
    return Error{Error::Code::PropertyNotFound, std::move(message)};
}

} // namespace WV
