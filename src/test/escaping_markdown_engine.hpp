#ifndef SURFDOC_TEST_ESCAPING_MARKDOWN_ENGINE_HPP
#define SURFDOC_TEST_ESCAPING_MARKDOWN_ENGINE_HPP

#include "common/code_string.hpp"

#include "surf/render/html_writer.hpp"
#include "surf/render/markdown_engine.hpp"

namespace surfdoc {

/// @brief A markdown engine which wraps the escaped prose in a paragraph, without interpreting
/// any markdown.
/// This keeps renderer tests independent of a real markdown implementation.
struct Escaping_Markdown_Engine final : Markdown_Engine {
    void to_html(Code_String& out, std::string_view markdown) const override
    {
        HTML_Writer writer { out };
        writer.open_tag("p");
        writer.write_inner_text(markdown);
        writer.close_tag("p");
    }
};

} // namespace surfdoc

#endif
