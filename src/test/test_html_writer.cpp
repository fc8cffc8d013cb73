#include <gtest/gtest.h>

#include "common/assert.hpp"
#include "common/code_string.hpp"

#include "surf/render/html_writer.hpp"

namespace surfdoc {
namespace {

TEST(HTML_Writer, escape_html)
{
    EXPECT_EQ(escape_html(""), "");
    EXPECT_EQ(escape_html("plain"), "plain");
    EXPECT_EQ(escape_html("a < b && \"c\" > d"), "a &lt; b &amp;&amp; &quot;c&quot; &gt; d");
    EXPECT_EQ(escape_html("it's"), "it's");
}

TEST(HTML_Writer, nested_tags)
{
    Code_String out;
    HTML_Writer writer { out };
    writer.open_tag("div");
    EXPECT_FALSE(writer.is_done());
    writer.open_tag_with_attributes("a")
        .write_attribute("href", "/x?a=1&b=\"2\"")
        .write_flag("download")
        .end();
    writer.write_inner_text("<link>");
    writer.close_tag("a");
    writer.write_empty_tag("br");
    writer.open_tag_with_attributes("img").write_attribute("alt", "").end_empty();
    writer.close_tag("div");
    EXPECT_TRUE(writer.is_done());
    EXPECT_EQ(out.get_text(),
              "<div><a href=\"/x?a=1&amp;b=&quot;2&quot;\" download>&lt;link&gt;</a><br/>"
              "<img alt=\"\"/></div>");
}

TEST(HTML_Writer, inner_html_is_not_escaped)
{
    Code_String out;
    HTML_Writer writer { out };
    writer.write_preamble();
    writer.open_tag("p");
    writer.write_inner_html("<em>x</em>");
    writer.close_tag("p");
    writer.write_line_break();
    EXPECT_EQ(out.get_text(), "<!DOCTYPE html>\n<p><em>x</em></p>\n");
}

TEST(HTML_Writer, comment)
{
    Code_String out;
    HTML_Writer writer { out };
    writer.write_comment("a--b");
    EXPECT_EQ(out.get_text(), "<!-- a- -b -->");
}

TEST(HTML_Writer, misuse_is_detected)
{
    Code_String out;
    HTML_Writer writer { out };
    EXPECT_THROW(writer.close_tag("div"), Assertion_Error);
    EXPECT_THROW(writer.open_tag("not a tag"), Assertion_Error);
}

} // namespace
} // namespace surfdoc
