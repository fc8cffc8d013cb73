#include <algorithm>
#include <charconv>
#include <system_error>

#include "common/assert.hpp"
#include "common/parse.hpp"

namespace surfdoc {

std::string_view trim_left(std::string_view str) noexcept
{
    return str.substr(match_whitespace(str));
}

std::string_view trim_right(std::string_view str) noexcept
{
    const Size last = str.find_last_not_of(" \t\r\n");
    return last == std::string_view::npos ? std::string_view {} : str.substr(0, last + 1);
}

std::string_view trim(std::string_view str) noexcept
{
    return trim_right(trim_left(str));
}

bool is_blank(std::string_view str) noexcept
{
    return match_whitespace(str) == str.length();
}

bool equals_ignore_case(std::string_view a, std::string_view b) noexcept
{
    return std::ranges::equal(
        a, b, [](char x, char y) { return to_ascii_lower(x) == to_ascii_lower(y); });
}

std::string to_lower(std::string_view str)
{
    std::string result(str);
    for (char& c : result) {
        c = to_ascii_lower(c);
    }
    return result;
}

Size match_name(std::string_view str) noexcept
{
    if (str.empty() || !(is_ascii_alpha(str[0]) || str[0] == '_')) {
        return 0;
    }
    Size length = 1;
    while (length < str.length()
           && (is_ascii_alphanumeric(str[length]) || str[length] == '_' || str[length] == '-')) {
        ++length;
    }
    return length;
}

bool is_html_identifier(std::string_view str) noexcept
{
    return !str.empty() && is_ascii_alpha(str[0])
        && std::ranges::all_of(str, [](char c) { return is_ascii_alphanumeric(c) || c == '-'; });
}

Size match_number(std::string_view str) noexcept
{
    Size i = 0;
    if (i < str.length() && (str[i] == '+' || str[i] == '-')) {
        ++i;
    }
    const Size integer_begin = i;
    while (i < str.length() && is_decimal_digit(str[i])) {
        ++i;
    }
    if (i == integer_begin) {
        return 0;
    }
    if (i + 1 < str.length() && str[i] == '.' && is_decimal_digit(str[i + 1])) {
        i += 2;
        while (i < str.length() && is_decimal_digit(str[i])) {
            ++i;
        }
    }
    return i;
}

std::optional<double> parse_number(std::string_view str) noexcept
{
    if (str.empty() || match_number(str) != str.length()) {
        return {};
    }
    // std::from_chars does not accept a leading '+'.
    if (str[0] == '+') {
        str.remove_prefix(1);
    }
    double result {};
    const auto [p, ec] = std::from_chars(str.data(), str.data() + str.size(), result);
    if (ec != std::errc {} || p != str.data() + str.size()) {
        return {};
    }
    return result;
}

std::optional<Int> parse_integer(std::string_view str) noexcept
{
    if (str.starts_with('+')) {
        str.remove_prefix(1);
        if (str.starts_with('-')) {
            return {};
        }
    }
    Int result {};
    const auto [p, ec] = std::from_chars(str.data(), str.data() + str.size(), result);
    if (str.empty() || ec != std::errc {} || p != str.data() + str.size()) {
        return {};
    }
    return result;
}

std::string slugify(std::string_view text)
{
    std::string result;
    bool pending_dash = false;
    for (char c : text) {
        if (is_ascii_alphanumeric(c)) {
            if (pending_dash && !result.empty()) {
                result.push_back('-');
            }
            pending_dash = false;
            result.push_back(to_ascii_lower(c));
        }
        else {
            pending_dash = true;
        }
    }
    return result;
}

} // namespace surfdoc
