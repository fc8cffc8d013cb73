#ifndef SURFDOC_PARSE_HPP
#define SURFDOC_PARSE_HPP

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

#include "common/config.hpp"

namespace surfdoc {

/// @brief Returns `true` if the given character is a decimal digit (`0` through `9`).
/// @param c the character
/// @return `true` if `c` is a decimal digit, `false` otherwise.
constexpr bool is_decimal_digit(char c)
{
    return c >= '0' && c <= '9';
}

/// @brief Returns `true` if the given character is a Latin letter (`a-z`, `A-Z`).
constexpr bool is_ascii_alpha(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr bool is_ascii_alphanumeric(char c)
{
    return is_ascii_alpha(c) || is_decimal_digit(c);
}

/// @brief Returns true if the given character is whitespace.
/// @param c the character
/// @return `true` if `c` is whitespace, `false` otherwise.
constexpr bool is_space(char c)
{
    return c == ' ' || c == '\n' || c == '\t' || c == '\r';
}

constexpr char to_ascii_lower(char c)
{
    return c >= 'A' && c <= 'Z' ? char(c - 'A' + 'a') : c;
}

/// @brief Matches leading whitespace.
/// @param str the string
/// @return The number of leading whitespace characters.
inline Size match_whitespace(std::string_view str) noexcept
{
    return std::min(str.find_first_not_of(" \t\r\n"), str.length());
}

/// @brief Returns `str` without leading and trailing whitespace.
[[nodiscard]] std::string_view trim(std::string_view str) noexcept;

/// @brief Returns `str` without leading whitespace.
[[nodiscard]] std::string_view trim_left(std::string_view str) noexcept;

/// @brief Returns `str` without trailing whitespace.
[[nodiscard]] std::string_view trim_right(std::string_view str) noexcept;

/// @brief Returns `true` if `str` is empty or consists only of whitespace.
[[nodiscard]] bool is_blank(std::string_view str) noexcept;

/// @brief Compares two strings, treating Latin letters case-insensitively.
[[nodiscard]] bool equals_ignore_case(std::string_view a, std::string_view b) noexcept;

/// @brief Returns a copy of `str` where every Latin letter is lower case.
[[nodiscard]] std::string to_lower(std::string_view str);

/// @brief Matches a name such as a directive tag or attribute key.
/// This function matches the regex /[_a-zA-Z][_a-zA-Z0-9-]*/
/// @param str the string, possibly containing a name at the start
/// @return The length of the name if it could be matched, zero otherwise.
[[nodiscard]] Size match_name(std::string_view str) noexcept;

/// @brief Returns `true` if `str` can be used as an HTML tag name or attribute key.
/// This is the case for strings matching the regex /[a-zA-Z][a-zA-Z0-9-]*/
[[nodiscard]] bool is_html_identifier(std::string_view str) noexcept;

/// @brief Matches a numeric literal at the beginning of the given string.
/// This function matches the regex /[+-]?[0-9]+(\.[0-9]+)?/
/// @return The length of the literal, or zero if there is none.
[[nodiscard]] Size match_number(std::string_view str) noexcept;

/// @brief Converts a string which consists entirely of a numeric literal
/// (see `match_number`) to a floating-point value.
[[nodiscard]] std::optional<double> parse_number(std::string_view str) noexcept;

/// @brief Converts a string which consists entirely of an optionally signed decimal integer.
[[nodiscard]] std::optional<Int> parse_integer(std::string_view str) noexcept;

/// @brief Returns a URL-friendly version of `text`: lower case letters and digits,
/// where every other run of characters becomes a single `-`.
/// Leading and trailing dashes are removed.
[[nodiscard]] std::string slugify(std::string_view text);

} // namespace surfdoc

#endif
