#include <md4c-html.h>
#include <md4c.h>

#include "common/code_string.hpp"

#include "surf/render/html_writer.hpp"

#include "md4c/md4c_engine.hpp"

namespace surfdoc {

namespace {

void append_output(const MD_CHAR* text, MD_SIZE size, void* user_data)
{
    static_cast<Code_String*>(user_data)->append(std::string_view { text, size });
}

} // namespace

void MD4C_Markdown_Engine::to_html(Code_String& out, std::string_view markdown) const
{
    constexpr unsigned parser_flags
        = MD_FLAG_TABLES | MD_FLAG_STRIKETHROUGH | MD_FLAG_TASKLISTS | MD_FLAG_PERMISSIVEAUTOLINKS;

    Code_String converted;
    const int status = md_html(markdown.data(), MD_SIZE(markdown.size()), &append_output,
                               &converted, parser_flags, 0);
    if (status == 0) {
        out.append(converted.get_text(), Code_Span_Type::html_inner_text);
        return;
    }
    // md4c only fails when it runs out of memory; the prose is then shown as escaped text.
    HTML_Writer writer { out };
    writer.open_tag("pre");
    writer.write_inner_text(markdown);
    writer.close_tag("pre");
}

} // namespace surfdoc
