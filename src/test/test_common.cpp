#include <cstdint>
#include <limits>

#include <gtest/gtest.h>

#include "common/parse.hpp"
#include "common/to_chars.hpp"

namespace surfdoc {
namespace {

TEST(To_Chars, digits)
{
    for (int x = 0; x <= 9; ++x) {
        const char c = char(x + '0');
        EXPECT_EQ(to_characters(x).as_string(), std::string_view(&c, 1));
        EXPECT_EQ(to_characters(Size(x)).as_string(), std::string_view(&c, 1));
    }
    EXPECT_EQ(to_characters(-7).as_string(), "-7");
}

TEST(To_Chars, limits)
{
    EXPECT_EQ(to_characters(std::numeric_limits<Int>::min()).as_string(), "-9223372036854775808");
    EXPECT_EQ(to_characters(std::numeric_limits<std::uint64_t>::max()).as_string(),
              "18446744073709551615");
}

TEST(Parse_Utilities, trim)
{
    EXPECT_EQ(trim("  a b \t"), "a b");
    EXPECT_EQ(trim_left("  a "), "a ");
    EXPECT_EQ(trim_right("  a "), "  a");
    EXPECT_TRUE(is_blank(" \t\r\n"));
    EXPECT_FALSE(is_blank(" x "));
}

TEST(Parse_Utilities, case_folding)
{
    EXPECT_TRUE(equals_ignore_case("Pricing-Table", "pricing-table"));
    EXPECT_FALSE(equals_ignore_case("tab", "tabs"));
    EXPECT_EQ(to_lower("HeLLo-1"), "hello-1");
}

TEST(Parse_Utilities, names)
{
    EXPECT_EQ(match_name("hero-image]"), 10);
    EXPECT_EQ(match_name("a_b=1"), 3);
    EXPECT_EQ(match_name("=x"), 0);
    EXPECT_TRUE(is_html_identifier("data-sortable"));
    EXPECT_FALSE(is_html_identifier("1st"));
    EXPECT_FALSE(is_html_identifier(""));
}

TEST(Parse_Utilities, numbers)
{
    EXPECT_EQ(match_number("12.5kg"), 4);
    EXPECT_EQ(match_number("-3"), 2);
    EXPECT_EQ(match_number("1."), 1);
    EXPECT_EQ(match_number("x1"), 0);

    EXPECT_EQ(parse_number("+2.5"), 2.5);
    EXPECT_EQ(parse_number("2.5.1"), std::nullopt);
    EXPECT_EQ(parse_integer("-42"), -42);
    EXPECT_EQ(parse_integer("+42"), 42);
    EXPECT_EQ(parse_integer("+-1"), std::nullopt);
    EXPECT_EQ(parse_integer("4.0"), std::nullopt);
    EXPECT_EQ(parse_integer(""), std::nullopt);
}

TEST(Parse_Utilities, slugify)
{
    EXPECT_EQ(slugify("Getting Started"), "getting-started");
    EXPECT_EQ(slugify("  What's new?  "), "what-s-new");
    EXPECT_EQ(slugify("C++ & Rust"), "c-rust");
    EXPECT_EQ(slugify("!!!"), "");
}

} // namespace
} // namespace surfdoc
