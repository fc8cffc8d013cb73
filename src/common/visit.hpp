#ifndef SURFDOC_VISIT_HPP
#define SURFDOC_VISIT_HPP

#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

#include "common/assert.hpp"
#include "common/config.hpp"

/*
This header contains a drop-in replacement for std::visit for a single variant.
It also works for classes which merely derive from std::variant, such as the block type of the
document tree, and dispatches through a single table lookup.
*/

namespace surfdoc {

namespace detail {

template <typename T>
inline constexpr Size variant_like_size_v
    = decltype([]<typename... Ts>(std::variant<Ts...>&)
                   -> std::integral_constant<std::size_t, sizeof...(Ts)> {}(
                       std::declval<T&>()))::value;

template <Size I, typename F, typename V>
decltype(auto) visit_alternative(F&& f, V&& v)
{
    return std::invoke(static_cast<F&&>(f), std::get<I>(static_cast<V&&>(v)));
}

} // namespace detail

template <typename F, typename V>
decltype(auto) fast_visit(F&& f, V&& v)
{
    if (v.valueless_by_exception()) {
        throw std::bad_variant_access();
    }
    constexpr Size size = detail::variant_like_size_v<std::remove_cvref_t<V>>;
    return [&]<Size... I>(std::index_sequence<I...>) -> decltype(auto) {
        using Result = decltype(detail::visit_alternative<0>(static_cast<F&&>(f),
                                                             static_cast<V&&>(v)));
        static_assert(
            (std::is_same_v<Result,
                            decltype(detail::visit_alternative<I>(static_cast<F&&>(f),
                                                                  static_cast<V&&>(v)))>
             && ...),
            "All alternatives must be visited with the same result type.");
        constexpr Result (*table[])(F&&, V&&) = { &detail::visit_alternative<I, F, V>... };
        SURFDOC_ASSERT(v.index() < size);
        return table[v.index()](static_cast<F&&>(f), static_cast<V&&>(v));
    }(std::make_index_sequence<size> {});
}

} // namespace surfdoc

#endif
