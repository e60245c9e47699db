#include <weave/theme/Selector.hpp>

#include <utility>

namespace WV::Theme {

Selector::Selector(std::string element)
    : element_(std::move(element)) {}

auto Selector::with(std::string element) const -> Selector {
    Selector copy = *this;
    copy.element_ = std::move(element);
    return copy;
}

auto Selector::with_id(std::string id) const -> Selector {
    Selector copy = *this;
    copy.id_      = std::move(id);
    return copy;
}

auto Selector::with_class(std::string class_name) const -> Selector {
    Selector copy = *this;
    copy.classes_.insert(std::move(class_name));
    return copy;
}

auto Selector::with_pseudo_class(std::string pseudo_class) const -> Selector {
    Selector copy = *this;
    copy.pseudo_classes_.insert(std::move(pseudo_class));
    return copy;
}

// Returns true when the pseudo class set changed.
auto Selector::set_pseudo_class(std::string const& pseudo_class, bool enabled) -> bool {
    if (enabled)
        return pseudo_classes_.insert(pseudo_class).second;
    return pseudo_classes_.erase(pseudo_class) > 0;
}

auto Selector::has_class(std::string const& class_name) const -> bool {
    return classes_.contains(class_name);
}

auto Selector::has_pseudo_class(std::string const& pseudo_class) const -> bool {
    return pseudo_classes_.contains(pseudo_class);
}

auto Selector::empty() const -> bool {
    return !element_ && !id_ && classes_.empty() && pseudo_classes_.empty();
}

auto Selector::to_string() const -> std::string {
    std::string out;
    if (element_)
        out.append(*element_);
    else if (!empty())
        out.push_back('*');
    if (id_) {
        out.push_back('#');
        out.append(*id_);
    }
    for (auto const& class_name : classes_) {
        out.push_back('.');
        out.append(class_name);
    }
    for (auto const& pseudo_class : pseudo_classes_) {
        out.push_back(':');
        out.append(pseudo_class);
    }
    return out;
}

} // namespace WV::Theme
