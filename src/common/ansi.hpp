#ifndef SURFDOC_ANSI_HPP
#define SURFDOC_ANSI_HPP

#include <string_view>

// SGR escape sequences used when printing a Code_String with colors.
namespace surfdoc::ansi {

constexpr std::string_view reset = "\x1B[0m";

constexpr std::string_view bold = "\x1B[1m";
constexpr std::string_view dim = "\x1B[2m";
constexpr std::string_view underline = "\x1B[4m";

constexpr std::string_view black = "\x1B[30m";
constexpr std::string_view yellow = "\x1B[33m";
constexpr std::string_view cyan = "\x1B[36m";

// Bright variants.
constexpr std::string_view h_black = "\x1B[0;90m";
constexpr std::string_view h_red = "\x1B[0;91m";
constexpr std::string_view h_green = "\x1B[0;92m";
constexpr std::string_view h_yellow = "\x1B[0;93m";
constexpr std::string_view h_blue = "\x1B[0;94m";
constexpr std::string_view h_magenta = "\x1B[0;95m";
constexpr std::string_view h_cyan = "\x1B[0;96m";
constexpr std::string_view h_white = "\x1B[0;97m";

} // namespace surfdoc::ansi

#endif
