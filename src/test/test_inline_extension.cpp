#include <gtest/gtest.h>

#include "surf/ast.hpp"
#include "surf/parsing/inline_extension.hpp"

namespace surfdoc {
namespace {

TEST(Inline_Extension, none)
{
    EXPECT_TRUE(scan_inline_extensions("").empty());
    EXPECT_TRUE(scan_inline_extensions("Plain text: nothing to see.").empty());
}

TEST(Inline_Extension, evidence)
{
    constexpr std::string_view text = "Revenue grew :evidence[tier=1 source=\"Q3 report\"] last year.";
    const std::vector<ast::Inline_Extension> extensions = scan_inline_extensions(text);
    ASSERT_EQ(extensions.size(), 1);

    const ast::Inline_Extension& evidence = extensions[0];
    EXPECT_EQ(evidence.type, ast::Inline_Extension_Type::evidence);
    EXPECT_EQ(text.substr(evidence.begin, evidence.length),
              ":evidence[tier=1 source=\"Q3 report\"]");
    EXPECT_EQ(evidence.tier, 1);
    EXPECT_EQ(evidence.source, "Q3 report");
    EXPECT_EQ(inline_extension_label(evidence), "Q3 report, tier 1");
}

TEST(Inline_Extension, status)
{
    const std::vector<ast::Inline_Extension> extensions
        = scan_inline_extensions("Migration :status[value=shipped]");
    ASSERT_EQ(extensions.size(), 1);
    EXPECT_EQ(extensions[0].type, ast::Inline_Extension_Type::status);
    EXPECT_EQ(extensions[0].begin, 10);
    EXPECT_EQ(extensions[0].text, "shipped");
    EXPECT_EQ(inline_extension_label(extensions[0]), "shipped");
}

TEST(Inline_Extension, several_on_one_line)
{
    const std::vector<ast::Inline_Extension> extensions
        = scan_inline_extensions(":status[value=a] and :evidence[tier=2] and :status[value=b]");
    ASSERT_EQ(extensions.size(), 3);
    EXPECT_EQ(extensions[0].text, "a");
    EXPECT_EQ(inline_extension_label(extensions[1]), "tier 2");
    EXPECT_EQ(extensions[2].text, "b");
    EXPECT_LT(extensions[0].end(), extensions[1].begin);
    EXPECT_LT(extensions[1].end(), extensions[2].begin);
}

TEST(Inline_Extension, evidence_label_falls_back_to_raw_text)
{
    const std::vector<ast::Inline_Extension> extensions
        = scan_inline_extensions(":evidence[internal]");
    ASSERT_EQ(extensions.size(), 1);
    EXPECT_FALSE(extensions[0].tier);
    EXPECT_FALSE(extensions[0].source);
    EXPECT_EQ(inline_extension_label(extensions[0]), "internal");
}

TEST(Inline_Extension, double_colon_is_ignored)
{
    EXPECT_TRUE(scan_inline_extensions("::status[value=x]").empty());
    EXPECT_TRUE(scan_inline_extensions("a :::evidence[tier=1] b").empty());
}

TEST(Inline_Extension, code_is_ignored)
{
    EXPECT_TRUE(scan_inline_extensions("Write `:status[value=x]` for a badge.").empty());
    EXPECT_TRUE(scan_inline_extensions("``a ` :status[value=x] ``").empty());
    EXPECT_TRUE(scan_inline_extensions("```\n:status[value=x]\n```").empty());

    const std::vector<ast::Inline_Extension> after_fence
        = scan_inline_extensions("~~~\n:status[value=x]\n~~~\n:status[value=y]");
    ASSERT_EQ(after_fence.size(), 1);
    EXPECT_EQ(after_fence[0].text, "y");
}

TEST(Inline_Extension, malformed_is_left_as_text)
{
    EXPECT_TRUE(scan_inline_extensions(":status[value=x").empty());
    EXPECT_TRUE(scan_inline_extensions(":status[value=x\n]").empty());
    EXPECT_TRUE(scan_inline_extensions(":status[value=\"x]").empty());
    EXPECT_TRUE(scan_inline_extensions(":statuses[value=x]").empty());
}

} // namespace
} // namespace surfdoc
