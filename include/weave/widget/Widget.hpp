#pragma once

#include <weave/widget/Template.hpp>

#include <concepts>

namespace WV {

/**
 * A widget kind is any type whose static Create() describes it as a Template.
 *
 * Create() must not have side effects beyond allocating the SharedProperty and
 * State instances the widget introduces.
 */
template <typename W>
concept Widget = requires {
    { W::Create() } -> std::same_as<Template>;
};

} // namespace WV
