#pragma once

#include <weave/core/Error.hpp>
#include <weave/event/EventHandler.hpp>
#include <weave/layout/LayoutObject.hpp>
#include <weave/widget/Property.hpp>
#include <weave/widget/SharedProperty.hpp>
#include <weave/widget/State.hpp>
#include <weave/widget/Template.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace WV {

using WidgetId = std::uint64_t;

/**
 * Runtime node instantiated from one Template.
 *
 * Owns its children; the parent pointer is non-owning. Every property lives in
 * a cell: by-value properties get a cell of their own, shared properties use the
 * cell of the SharedProperty the template received, so a write through any
 * holder is visible to all of them.
 *
 * Access goes through borrow guards:
 * - borrow_property<T>()     shared access, fails while a mutable borrow is alive
 * - borrow_mut_property<T>() exclusive access, fails while any borrow is alive
 * Both fail with PropertyNotFound when the template never declared T.
 */
class WidgetContainer {
public:
    ~WidgetContainer() = default;

    WidgetContainer(WidgetContainer const&)            = delete;
    WidgetContainer& operator=(WidgetContainer const&) = delete;
    WidgetContainer(WidgetContainer&&)                 = delete;
    WidgetContainer& operator=(WidgetContainer&&)      = delete;

    [[nodiscard]] auto id() const -> WidgetId { return id_; }
    [[nodiscard]] auto debug_name() const -> std::string const& { return debug_name_; }
    [[nodiscard]] auto parent_type() const -> ParentType { return parent_type_; }
    [[nodiscard]] auto parent() const -> WidgetContainer* { return parent_; }
    [[nodiscard]] auto children() const -> std::vector<std::unique_ptr<WidgetContainer>> const& { return children_; }
    [[nodiscard]] auto child_count() const -> std::size_t { return children_.size(); }
    [[nodiscard]] auto child(std::size_t index) const -> WidgetContainer*;
    [[nodiscard]] auto layout_object() const -> Layout::LayoutObject const& { return layout_; }
    [[nodiscard]] auto state() const -> std::shared_ptr<State> const& { return state_; }
    [[nodiscard]] auto event_handlers() const -> std::vector<std::shared_ptr<EventHandler>> const& { return handlers_; }
    [[nodiscard]] auto properties() const -> Detail::PropertyTable const& { return properties_; }

    template <typename T>
    [[nodiscard]] auto has_property() const -> bool {
        return properties_.contains(std::type_index(typeid(T)));
    }

    template <typename T>
    [[nodiscard]] auto is_shared_property() const -> bool {
        auto const* slot = find_slot(std::type_index(typeid(T)));
        return slot && slot->shared;
    }

    template <typename T>
    [[nodiscard]] auto borrow_property() const -> Expected<PropertyRef<T>> {
        auto cell = typed_cell<T>();
        if (!cell)
            return std::unexpected(cell.error());
        return PropertyRef<T>::Acquire(std::move(*cell));
    }

    template <typename T>
    [[nodiscard]] auto borrow_mut_property() -> Expected<PropertyRefMut<T>> {
        auto cell = typed_cell<T>();
        if (!cell)
            return std::unexpected(cell.error());
        return PropertyRefMut<T>::Acquire(std::move(*cell));
    }

    template <typename T>
    [[nodiscard]] auto get_property() const -> Expected<T> {
        auto ref = borrow_property<T>();
        if (!ref)
            return std::unexpected(ref.error());
        return **ref;
    }

    // Only properties the template declared can be set.
    template <typename T>
    auto set_property(T value) -> Expected<void> {
        auto ref = borrow_mut_property<T>();
        if (!ref)
            return std::unexpected(ref.error());
        **ref = std::move(value);
        return {};
    }

    // Handle onto the cell backing T, shared or not. Writes through it are seen by this widget.
    template <typename T>
    [[nodiscard]] auto shared_property() const -> Expected<SharedProperty<T>> {
        auto cell = typed_cell<T>();
        if (!cell)
            return std::unexpected(cell.error());
        return SharedProperty<T>{std::move(*cell)};
    }

    // Offers the event to the handlers in registration order; true when one consumed it.
    auto handle_event(Event const& event) -> bool;

    // Pre-order walk: this widget, then each child subtree in declaration order.
    template <typename Fn>
    auto visit(Fn&& fn) -> void {
        fn(*this);
        for (auto& child : children_)
            child->visit(fn);
    }

    template <typename Fn>
    auto visit(Fn&& fn) const -> void {
        fn(static_cast<WidgetContainer const&>(*this));
        for (auto const& child : children_)
            static_cast<WidgetContainer const&>(*child).visit(fn);
    }

private:
    friend class TreeBuilder;

    WidgetContainer(WidgetId id, WidgetContainer* parent);

    [[nodiscard]] auto find_slot(std::type_index type) const -> Detail::PropertySlot const*;
    [[nodiscard]] auto not_found(std::string_view property) const -> Error;

    template <typename T>
    [[nodiscard]] auto typed_cell() const -> Expected<std::shared_ptr<Detail::PropertyCell<T>>> {
        auto const* slot = find_slot(std::type_index(typeid(T)));
        if (!slot)
            return std::unexpected(not_found(PropertyName<T>()));
        return std::static_pointer_cast<Detail::PropertyCell<T>>(slot->cell);
    }

    WidgetId                                      id_     = 0;
    WidgetContainer*                              parent_ = nullptr;
    ParentType                                    parent_type_ = ParentType::None;
    std::vector<std::unique_ptr<WidgetContainer>> children_;
    Detail::PropertyTable                         properties_;
    Layout::LayoutObject                          layout_{};
    std::shared_ptr<State>                        state_;
    std::vector<std::shared_ptr<EventHandler>>    handlers_;
    std::string                                   debug_name_;
};

} // namespace WV
