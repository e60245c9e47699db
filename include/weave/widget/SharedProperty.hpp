#pragma once

#include <weave/widget/Property.hpp>

#include <memory>
#include <utility>

namespace WV {

/**
 * Handle to a property cell aliased by several widgets.
 *
 * Copying the handle aliases the cell; it never copies the value. A write
 * through any handle (or through any container that received the handle) is
 * visible to every other holder immediately.
 */
template <typename T>
class SharedProperty {
public:
    SharedProperty()
        : SharedProperty(T{}) {}

    explicit SharedProperty(T value)
        : cell_(std::make_shared<Detail::PropertyCell<T>>(std::move(value))) {}

    explicit SharedProperty(std::shared_ptr<Detail::PropertyCell<T>> cell)
        : cell_(std::move(cell)) {}

    [[nodiscard]] auto borrow() const -> Expected<PropertyRef<T>> {
        return PropertyRef<T>::Acquire(cell_);
    }

    [[nodiscard]] auto borrow_mut() const -> Expected<PropertyRefMut<T>> {
        return PropertyRefMut<T>::Acquire(cell_);
    }

    [[nodiscard]] auto get() const -> Expected<T> {
        auto ref = borrow();
        if (!ref)
            return std::unexpected(ref.error());
        return **ref;
    }

    auto set(T value) const -> Expected<void> {
        auto ref = borrow_mut();
        if (!ref)
            return std::unexpected(ref.error());
        **ref = std::move(value);
        return {};
    }

    // Number of holders (handles, templates and containers) of the cell.
    [[nodiscard]] auto holders() const -> long { return cell_.use_count(); }

    [[nodiscard]] auto aliases(SharedProperty const& other) const -> bool { return cell_ == other.cell_; }

    [[nodiscard]] auto cell() const -> std::shared_ptr<Detail::PropertyCell<T>> const& { return cell_; }

private:
    std::shared_ptr<Detail::PropertyCell<T>> cell_;
};

} // namespace WV
