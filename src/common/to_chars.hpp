#ifndef SURFDOC_TO_CHARS_HPP
#define SURFDOC_TO_CHARS_HPP

#include <array>
#include <charconv>
#include <concepts>
#include <limits>
#include <string_view>
#include <type_traits>

#include "common/assert.hpp"
#include "common/config.hpp"

namespace surfdoc {

template <typename T>
constexpr int approximate_to_chars_decimal_digits_v
    = (std::numeric_limits<T>::digits * 100 / 310) + 1 + std::is_signed_v<T>;

template <Size N>
struct Characters {
    std::array<char, N> buffer;
    Size length;

    [[nodiscard]] std::string_view as_string() const
    {
        return { buffer.data(), length };
    }
};

/// @brief Converts an integer to its decimal representation without allocating.
template <std::integral T>
[[nodiscard]] constexpr Characters<approximate_to_chars_decimal_digits_v<T>> to_characters(T x)
{
    Characters<approximate_to_chars_decimal_digits_v<T>> chars {};
    auto result = std::to_chars(chars.buffer.data(), chars.buffer.data() + chars.buffer.size(), x);
    SURFDOC_ASSERT(result.ec == std::errc {});
    chars.length = Size(result.ptr - chars.buffer.data());
    return chars;
}

} // namespace surfdoc

#endif
