#pragma once

#include <weave/core/Error.hpp>
#include <weave/event/EventHandler.hpp>
#include <weave/layout/LayoutObject.hpp>
#include <weave/widget/Property.hpp>
#include <weave/widget/SharedProperty.hpp>
#include <weave/widget/State.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace WV {

// Declared limit on the number of children a widget accepts.
enum class ParentType : std::uint8_t {
    None,   // leaf, no children
    Single, // at most one child
    Multi   // ordered sequence of children
};

[[nodiscard]] auto parentTypeToString(ParentType type) -> std::string_view;

// Maximum child count, std::nullopt when unbounded.
[[nodiscard]] auto parentTypeCapacity(ParentType type) -> std::optional<std::size_t>;

namespace Detail {

struct PropertySlot {
    std::shared_ptr<PropertyCellBase> cell;
    bool                              shared = false;
};

using PropertyTable = phmap::flat_hash_map<std::type_index, PropertySlot>;

} // namespace Detail

class TreeBuilder;

/**
 * Describes one widget and, through its children, the subtree below it.
 *
 * Builder calls are available on temporaries (returning Template&&) so that
 * Create() functions can chain them, and on named templates (returning
 * Template&). A template is move-only; its property cells are handed over to
 * exactly one WidgetContainer by TreeBuilder.
 *
 * Declare the parent type before adding children: with_child rejects a child
 * that exceeds the declared arity and records an ArityViolation, which makes
 * validate() and TreeBuilder::build fail.
 */
class Template {
public:
    Template() = default;

    Template(Template&&) noexcept            = default;
    Template& operator=(Template&&) noexcept = default;
    Template(Template const&)                = delete;
    Template& operator=(Template const&)     = delete;

    auto as_parent_type(ParentType type) & -> Template&;
    auto as_parent_type(ParentType type) && -> Template&&;

    auto with_child(Template child) & -> Template&;
    auto with_child(Template child) && -> Template&&;

    // A later call for the same property type overwrites the earlier value.
    template <typename T>
    auto with_property(T value) & -> Template& {
        set_slot(std::type_index(typeid(T)),
                 Detail::PropertySlot{std::make_shared<Detail::PropertyCell<T>>(std::move(value)), false});
        return *this;
    }

    template <typename T>
    auto with_property(T value) && -> Template&& {
        return std::move(with_property(std::move(value)));
    }

    // A handle without a cell (moved from) records an InvalidTemplate defect.
    template <typename T>
    auto with_shared_property(SharedProperty<T> const& property) & -> Template& {
        if (!property.cell()) {
            record_defect(Error{Error::Code::InvalidTemplate,
                                label() + " received an empty shared '" + std::string(PropertyName<T>()) + "'"});
            return *this;
        }
        set_slot(std::type_index(typeid(T)), Detail::PropertySlot{property.cell(), true});
        return *this;
    }

    template <typename T>
    auto with_shared_property(SharedProperty<T> const& property) && -> Template&& {
        return std::move(with_shared_property(property));
    }

    auto with_layout_object(Layout::LayoutObject layout) & -> Template&;
    auto with_layout_object(Layout::LayoutObject layout) && -> Template&&;

    auto with_state(std::shared_ptr<State> state) & -> Template&;
    auto with_state(std::shared_ptr<State> state) && -> Template&&;

    // Handlers are consulted in the order they were added.
    auto with_event_handler(std::shared_ptr<EventHandler> handler) & -> Template&;
    auto with_event_handler(std::shared_ptr<EventHandler> handler) && -> Template&&;

    template <std::derived_from<EventHandler> Handler>
    auto with_event_handler(Handler handler) & -> Template& {
        return with_event_handler(std::shared_ptr<EventHandler>(std::make_shared<Handler>(std::move(handler))));
    }

    template <std::derived_from<EventHandler> Handler>
    auto with_event_handler(Handler handler) && -> Template&& {
        return std::move(with_event_handler(std::move(handler)));
    }

    auto with_debug_name(std::string name) & -> Template&;
    auto with_debug_name(std::string name) && -> Template&&;

    [[nodiscard]] auto parent_type() const -> ParentType { return parent_type_; }
    [[nodiscard]] auto children() const -> std::vector<Template> const& { return children_; }
    [[nodiscard]] auto debug_name() const -> std::string const& { return debug_name_; }
    [[nodiscard]] auto layout_object() const -> Layout::LayoutObject const& { return layout_; }
    [[nodiscard]] auto state() const -> std::shared_ptr<State> const& { return state_; }
    [[nodiscard]] auto event_handlers() const -> std::vector<std::shared_ptr<EventHandler>> const& { return handlers_; }
    [[nodiscard]] auto property_count() const -> std::size_t { return properties_.size(); }

    template <typename T>
    [[nodiscard]] auto has_property() const -> bool {
        return properties_.contains(std::type_index(typeid(T)));
    }

    template <typename T>
    [[nodiscard]] auto has_shared_property() const -> bool {
        auto it = properties_.find(std::type_index(typeid(T)));
        return it != properties_.end() && it->second.shared;
    }

    // Checks this template and its whole subtree for arity defects.
    [[nodiscard]] auto validate() const -> Expected<void>;

private:
    friend class TreeBuilder;

    auto set_slot(std::type_index type, Detail::PropertySlot slot) -> void;
    auto append_child(Template child) -> void;
    auto record_defect(Error error) -> void;
    // Quoted debug name, or a description of the template when it has none.
    [[nodiscard]] auto label() const -> std::string;

    ParentType                                 parent_type_ = ParentType::None;
    std::vector<Template>                      children_;
    Detail::PropertyTable                      properties_;
    Layout::LayoutObject                       layout_{};
    std::shared_ptr<State>                     state_;
    std::vector<std::shared_ptr<EventHandler>> handlers_;
    std::string                                debug_name_;
    std::optional<Error>                       defect_;
};

} // namespace WV
