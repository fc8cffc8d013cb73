#ifndef SURFDOC_CONFIG_HPP
#define SURFDOC_CONFIG_HPP

#include <cstddef>
#include <cstdint>

#define SURFDOC_UNREACHABLE() __builtin_unreachable()

#define SURFDOC_ENUM_STRING_CASE(...)                                                              \
    case __VA_ARGS__: return #__VA_ARGS__

namespace surfdoc {

/// @brief Byte offsets, line numbers, counts.
using Size = std::size_t;

/// @brief The integer type of attribute values such as a page `order`.
using Int = std::int64_t;

using Default_Underlying = unsigned char;

} // namespace surfdoc

#endif
