#pragma once

#include <weave/core/Error.hpp>

#include <concepts>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include <nlohmann/json.hpp>

namespace WV {

template <typename T>
concept NamedProperty = requires {
    { T::kName } -> std::convertible_to<std::string_view>;
};

template <typename T>
[[nodiscard]] auto PropertyName() -> std::string_view {
    if constexpr (NamedProperty<T>) {
        return T::kName;
    } else {
        return typeid(T).name();
    }
}

namespace Detail {

/**
 * Type-erased storage for one property value.
 *
 * A cell is owned through std::shared_ptr by every template/container that
 * declared it. Cells never reference widgets, so holders cannot form cycles.
 *
 * Borrow accounting (single threaded):
 * - borrows_ > 0  : that many shared borrows are alive
 * - borrows_ == -1: one exclusive borrow is alive
 */
class PropertyCellBase {
public:
    virtual ~PropertyCellBase() = default;

    [[nodiscard]] virtual auto type() const -> std::type_index = 0;
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
    [[nodiscard]] virtual auto to_json() const -> nlohmann::json = 0;

    [[nodiscard]] auto acquire_shared() const -> bool {
        if (borrows_ < 0)
            return false;
        ++borrows_;
        return true;
    }

    [[nodiscard]] auto acquire_exclusive() const -> bool {
        if (borrows_ != 0)
            return false;
        borrows_ = -1;
        return true;
    }

    auto release_shared() const -> void { --borrows_; }
    auto release_exclusive() const -> void { borrows_ = 0; }

    [[nodiscard]] auto borrowed() const -> bool { return borrows_ != 0; }
    [[nodiscard]] auto exclusively_borrowed() const -> bool { return borrows_ < 0; }

private:
    mutable int borrows_ = 0;
};

template <typename T>
class PropertyCell final : public PropertyCellBase {
public:
    explicit PropertyCell(T initial)
        : value(std::move(initial)) {}

    [[nodiscard]] auto type() const -> std::type_index override { return std::type_index(typeid(T)); }
    [[nodiscard]] auto name() const -> std::string_view override { return PropertyName<T>(); }

    [[nodiscard]] auto to_json() const -> nlohmann::json override {
        if constexpr (std::is_constructible_v<nlohmann::json, T const&>) {
            return nlohmann::json(value);
        } else {
            return nullptr;
        }
    }

    T value;
};

template <typename T>
[[nodiscard]] auto borrowConflict(std::string_view detail) -> Error {
    std::string message{"property '"};
    message.append(PropertyName<T>());
    message.append("' ");
    message.append(detail);
    return Error{Error::Code::BorrowConflict, std::move(message)};
}

} // namespace Detail

// Shared (read-only) access guard. Releases the borrow when destroyed.
template <typename T>
class PropertyRef {
public:
    PropertyRef(PropertyRef const&)            = delete;
    PropertyRef& operator=(PropertyRef const&) = delete;
    PropertyRef& operator=(PropertyRef&&)      = delete;

    PropertyRef(PropertyRef&& other) noexcept
        : cell_(std::move(other.cell_)) {}

    ~PropertyRef() {
        if (cell_)
            cell_->release_shared();
    }

    [[nodiscard]] static auto Acquire(std::shared_ptr<Detail::PropertyCell<T>> cell) -> Expected<PropertyRef<T>> {
        if (!cell->acquire_shared())
            return std::unexpected(Detail::borrowConflict<T>("is mutably borrowed"));
        return PropertyRef<T>{std::move(cell)};
    }

    auto operator*() const -> T const& { return cell_->value; }
    auto operator->() const -> T const* { return &cell_->value; }
    [[nodiscard]] auto get() const -> T const& { return cell_->value; }

private:
    explicit PropertyRef(std::shared_ptr<Detail::PropertyCell<T>> cell)
        : cell_(std::move(cell)) {}

    std::shared_ptr<Detail::PropertyCell<T>> cell_;
};

// Exclusive (read/write) access guard. At most one may exist per cell.
template <typename T>
class PropertyRefMut {
public:
    PropertyRefMut(PropertyRefMut const&)            = delete;
    PropertyRefMut& operator=(PropertyRefMut const&) = delete;
    PropertyRefMut& operator=(PropertyRefMut&&)      = delete;

    PropertyRefMut(PropertyRefMut&& other) noexcept
        : cell_(std::move(other.cell_)) {}

    ~PropertyRefMut() {
        if (cell_)
            cell_->release_exclusive();
    }

    [[nodiscard]] static auto Acquire(std::shared_ptr<Detail::PropertyCell<T>> cell) -> Expected<PropertyRefMut<T>> {
        if (!cell->acquire_exclusive())
            return std::unexpected(Detail::borrowConflict<T>("is already borrowed"));
        return PropertyRefMut<T>{std::move(cell)};
    }

    auto operator*() const -> T& { return cell_->value; }
    auto operator->() const -> T* { return &cell_->value; }
    [[nodiscard]] auto get() const -> T& { return cell_->value; }

private:
    explicit PropertyRefMut(std::shared_ptr<Detail::PropertyCell<T>> cell)
        : cell_(std::move(cell)) {}

    std::shared_ptr<Detail::PropertyCell<T>> cell_;
};

} // namespace WV
