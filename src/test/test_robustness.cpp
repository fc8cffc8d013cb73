#include <algorithm>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "common/code_string.hpp"

#include "surf/ast.hpp"

#include "surf/parsing/parse.hpp"
#include "surf/render/html.hpp"
#include "surf/render/markdown.hpp"
#include "surf/render/render_config.hpp"
#include "surf/render/terminal.hpp"
#include "surf/site/site.hpp"
#include "surf/validate.hpp"

#include "test/escaping_markdown_engine.hpp"

namespace surfdoc {
namespace {

constexpr std::string_view malformed_sources[] {
    "::",
    ":::::",
    "::[",
    "::callout[",
    "::callout[type=\"",
    "::callout[type=[\"a\"",
    "::callout[=]",
    "::callout[,,,]\n::",
    "::tabs\n:::tab\n::::tab\n",
    "::columns\n---\n---\n---\n::",
    "::site\n:::page[order=99999999999999999999]\n:::\n::",
    "::site\n:::page\n:::\n:::page\n:::\n::\n::page\n::",
    "::faq\n###\n##\n::",
    "::pricing-table\n|\n||\n|-|\n::",
    "::data[format=csv]\n\"unterminated\n::",
    "::data[format=json]\n{\n::",
    "::decision[options=\"\" outcome=\"\"]\n::",
    "::metric[value=]\n",
    "::code\n::::\n::",
    "\r\n\r\n::summary\r\n\r\n",
    "\n::hero-image[src=x]\n\n\n::\n::\n",
    "::UNKNOWN-THING[a=b c d=\"e\"]\nbody\n",
    "\xff\xfe::callout\n\xc3\n::",
};

TEST(Robustness, malformed_input_never_throws)
{
    const Escaping_Markdown_Engine engine;
    for (const std::string_view source : malformed_sources) {
        SCOPED_TRACE(source);
        EXPECT_NO_THROW({
            const Parsed_Document parsed = parse(source);
            Code_String html;
            render_html(html, parsed.document, { .full_page = true }, engine);
            static_cast<void>(render_markdown(parsed.document, {}));
            static_cast<void>(render_terminal(parsed.document, { .colors = true }));
            static_cast<void>(render_site(parsed.document, { .worker_count = 2 }, engine));
        });
    }
}

TEST(Robustness, parsing_is_deterministic)
{
    for (const std::string_view source : malformed_sources) {
        SCOPED_TRACE(source);
        const Parsed_Document first = parse(source);
        const Parsed_Document second = parse(source);
        EXPECT_EQ(first.diagnostics, second.diagnostics);
        EXPECT_EQ(render_markdown(first.document, {}), render_markdown(second.document, {}));
        EXPECT_EQ(validate(first.document), first.diagnostics);
    }
}

TEST(Robustness, diagnostics_are_sorted)
{
    for (const std::string_view source : malformed_sources) {
        SCOPED_TRACE(source);
        const std::vector<Diagnostic> diagnostics = parse(source).diagnostics;
        for (Size i = 1; i < diagnostics.size(); ++i) {
            EXPECT_LE(diagnostics[i - 1].pos.begin, diagnostics[i].pos.begin);
        }
    }
}

[[nodiscard]] Size tree_depth(const ast::Block& block)
{
    Size result = 0;
    ast::for_each_child(block, [&](const ast::Block& child) {
        result = std::max(result, tree_depth(child));
    });
    return result + 1;
}

[[nodiscard]] std::string nested_columns(Size depth)
{
    std::string result;
    for (Size i = 0; i < depth; ++i) {
        result += "::columns\n";
    }
    result += "innermost\n";
    for (Size i = 0; i < depth; ++i) {
        result += "::\n";
    }
    return result;
}

TEST(Robustness, deep_nesting_is_bounded)
{
    const std::string source = nested_columns(10'000);
    const Parsed_Document parsed = parse(source);

    const auto too_deep = std::ranges::count_if(parsed.diagnostics, [](const Diagnostic& d) {
        return d.code == Diagnostic_Code::nesting_too_deep;
    });
    EXPECT_EQ(too_deep, 1);

    ASSERT_EQ(parsed.document.blocks.size(), 1);
    EXPECT_LE(tree_depth(parsed.document.blocks[0]), 2 * (max_nesting_depth + 2));

    const Escaping_Markdown_Engine engine;
    Code_String html;
    render_html(html, parsed.document, {}, engine);
    EXPECT_NE(html.get_text().find("innermost"), std::string_view::npos);
    EXPECT_NE(render_markdown(parsed.document, {}).find("innermost"), std::string::npos);
    EXPECT_NE(render_terminal(parsed.document, { .colors = false }).find("innermost"),
              std::string::npos);
}

TEST(Robustness, deep_unterminated_nesting_is_bounded)
{
    std::string source;
    for (Size i = 0; i < 10'000; ++i) {
        source += i % 2 == 0 ? "::tabs\n" : "::site\n";
    }
    const Parsed_Document parsed = parse(source);
    ASSERT_EQ(parsed.document.blocks.size(), 1);
    EXPECT_TRUE(has_errors(parsed.diagnostics));
    EXPECT_NO_THROW(static_cast<void>(render_terminal(parsed.document, {})));
}

} // namespace
} // namespace surfdoc
