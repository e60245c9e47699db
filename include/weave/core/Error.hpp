#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace WV {

struct Error {
    enum class Code {
        UnknownError = 0,
        PropertyNotFound,
        ArityViolation,
        BorrowConflict,
        WidgetNotFound,
        InvalidTemplate,
        NotSupported
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::PropertyNotFound:
        return "property_not_found";
    case Error::Code::ArityViolation:
        return "arity_violation";
    case Error::Code::BorrowConflict:
        return "borrow_conflict";
    case Error::Code::WidgetNotFound:
        return "widget_not_found";
    case Error::Code::InvalidTemplate:
        return "invalid_template";
    case Error::Code::NotSupported:
        return "not_supported";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace WV
