#include <algorithm>

#include "common/code_string.hpp"
#include "common/parse.hpp"

#include "surf/render/html_writer.hpp"

namespace surfdoc {
namespace {

template <typename Out>
void append_escaped_text(Out& out, std::string_view text)
{
    while (!text.empty()) {
        const Size special_pos = text.find_first_of("&<>\"");
        const std::string_view snippet = text.substr(0, std::min(text.length(), special_pos));
        out.append(snippet);
        if (special_pos == std::string_view::npos) {
            break;
        }
        switch (text[special_pos]) {
        case '&': out.append("&amp;"); break;
        case '<': out.append("&lt;"); break;
        case '>': out.append("&gt;"); break;
        case '"': out.append("&quot;"); break;
        default: SURFDOC_ASSERT_UNREACHABLE("Logical mistake.");
        }
        text = text.substr(special_pos + 1);
    }
}

} // namespace

std::string escape_html(std::string_view text)
{
    std::string result;
    result.reserve(text.length());
    append_escaped_text(result, text);
    return result;
}

HTML_Writer::HTML_Writer(Code_String& out)
    : m_out(out)
{
}

auto HTML_Writer::write_inner_text(std::string_view text) -> Self&
{
    SURFDOC_ASSERT(!m_in_attributes);

    auto builder = m_out.build(Code_Span_Type::html_inner_text);
    append_escaped_text(builder, text);
    return *this;
}

auto HTML_Writer::write_inner_html(std::string_view text) -> Self&
{
    SURFDOC_ASSERT(!m_in_attributes);
    m_out.append(text, Code_Span_Type::html_inner_text);
    return *this;
}

auto HTML_Writer::write_line_break() -> Self&
{
    SURFDOC_ASSERT(!m_in_attributes);
    m_out.append('\n');
    return *this;
}

auto HTML_Writer::write_preamble() -> Self&
{
    SURFDOC_ASSERT(!m_in_attributes);

    m_out.append("<!", Code_Span_Type::html_tag_bracket);
    m_out.append("DOCTYPE html", Code_Span_Type::html_preamble);
    m_out.append(">", Code_Span_Type::html_tag_bracket);
    m_out.append('\n');

    return *this;
}

auto HTML_Writer::write_empty_tag(std::string_view id) -> Self&
{
    SURFDOC_ASSERT(!m_in_attributes);
    SURFDOC_ASSERT(is_html_identifier(id));

    m_out.append('<', Code_Span_Type::html_tag_bracket);
    m_out.append(id, Code_Span_Type::html_tag_identifier);
    m_out.append("/>", Code_Span_Type::html_tag_bracket);

    return *this;
}

auto HTML_Writer::open_tag(std::string_view id) -> Self&
{
    SURFDOC_ASSERT(!m_in_attributes);
    SURFDOC_ASSERT(is_html_identifier(id));

    m_out.append('<', Code_Span_Type::html_tag_bracket);
    m_out.append(id, Code_Span_Type::html_tag_identifier);
    m_out.append('>', Code_Span_Type::html_tag_bracket);
    ++m_depth;

    return *this;
}

Attribute_Writer HTML_Writer::open_tag_with_attributes(std::string_view id)
{
    SURFDOC_ASSERT(!m_in_attributes);
    SURFDOC_ASSERT(is_html_identifier(id));

    m_out.append('<', Code_Span_Type::html_tag_bracket);
    m_out.append(id, Code_Span_Type::html_tag_identifier);
    m_in_attributes = true;

    return Attribute_Writer { *this };
}

auto HTML_Writer::close_tag(std::string_view id) -> Self&
{
    SURFDOC_ASSERT(!m_in_attributes);
    SURFDOC_ASSERT(is_html_identifier(id));
    SURFDOC_ASSERT(m_depth != 0);

    --m_depth;

    m_out.append("</", Code_Span_Type::html_tag_bracket);
    m_out.append(id, Code_Span_Type::html_tag_identifier);
    m_out.append('>', Code_Span_Type::html_tag_bracket);

    return *this;
}

auto HTML_Writer::write_comment(std::string_view comment) -> Self&
{
    SURFDOC_ASSERT(!m_in_attributes);

    auto builder = m_out.build(Code_Span_Type::html_comment);
    builder.append("<!-- ");
    // "--" must not appear within comments.
    for (Size i = 0; i < comment.length(); ++i) {
        const bool double_dash = comment[i] == '-' && i + 1 < comment.length() && comment[i + 1] == '-';
        builder.append(double_dash ? "- " : comment.substr(i, 1));
    }
    builder.append(" -->");
    return *this;
}

auto HTML_Writer::write_attribute(std::string_view key, std::string_view value, bool has_value)
    -> Self&
{
    SURFDOC_ASSERT(m_in_attributes);
    SURFDOC_ASSERT(is_html_identifier(key));

    m_out.append(' ');
    m_out.append(key, Code_Span_Type::html_attribute_key);

    if (has_value) {
        m_out.append('=', Code_Span_Type::html_attribute_equal);
        auto builder = m_out.build(Code_Span_Type::html_attribute_value);
        builder.append('"');
        append_escaped_text(builder, value);
        builder.append('"');
    }

    return *this;
}

auto HTML_Writer::end_attributes() -> Self&
{
    SURFDOC_ASSERT(m_in_attributes);

    m_out.append('>', Code_Span_Type::html_tag_bracket);
    m_in_attributes = false;
    ++m_depth;

    return *this;
}

auto HTML_Writer::end_empty_tag_attributes() -> Self&
{
    SURFDOC_ASSERT(m_in_attributes);

    m_out.append("/>", Code_Span_Type::html_tag_bracket);
    m_in_attributes = false;

    return *this;
}

} // namespace surfdoc
