#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "common/code_string.hpp"

#include "surf/ast.hpp"
#include "surf/diagnostic.hpp"
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

struct Minimal_Directive {
    Block_Type type;
    std::string_view source;
};

// clang-format off
constexpr Minimal_Directive minimal_directives[] {
    { Block_Type::callout, "::callout[type=tip]\nText\n::\n" },
    { Block_Type::data, "::data\n| a | b |\n|---|---|\n| 1 | 2 |\n::\n" },
    { Block_Type::code, "::code[lang=cpp]\nint x;\n::\n" },
    { Block_Type::tasks, "::tasks\n- [ ] a\n- [x] b @sam\n::\n" },
    { Block_Type::decision, "::decision[status=accepted]\nWe chose X.\n::\n" },
    { Block_Type::metric, "::metric[label=Users, value=42]\n" },
    { Block_Type::summary, "::summary\nShort.\n::\n" },
    { Block_Type::figure, "::figure[src=a.png, alt=\"A chart\"]\n" },
    { Block_Type::tabs, "::tabs\n## One\nA\n## Two\nB\n::\n" },
    { Block_Type::columns, "::columns\nLeft\n---\nRight\n::\n" },
    { Block_Type::quote, "::quote[by=Ada]\nWords.\n::\n" },
    { Block_Type::cta, "::cta[label=Go, href=\"/go\"]\n" },
    { Block_Type::nav, "::nav[logo=Acme]\n- [Home](/)\n::\n" },
    { Block_Type::hero_image, "::hero-image[src=h.png, alt=Hero]\n" },
    { Block_Type::testimonial, "::testimonial[author=Sam]\nGreat.\n::\n" },
    { Block_Type::style, "::style\naccent: #ff0000\n::\n" },
    { Block_Type::faq, "::faq\n### Why?\nBecause.\n::\n" },
    { Block_Type::pricing_table, "::pricing-table\n| Feature | Free | Pro |\n|---|---|---|\n| Seats | 1 | 10 |\n::\n" },
    { Block_Type::site, "::site\n:::page[title=Home]\nHi\n:::\n::\n" },
};
// clang-format on

TEST(Surf_Properties, minimal_directives_are_valid)
{
    for (const Minimal_Directive& directive : minimal_directives) {
        SCOPED_TRACE(directive.source);
        const Parsed_Document parsed = parse(directive.source);
        EXPECT_FALSE(has_errors(parsed.diagnostics));
        ASSERT_EQ(parsed.document.blocks.size(), 1);
        EXPECT_EQ(parsed.document.blocks[0].get_type(), directive.type);
    }
}

TEST(Surf_Properties, page_in_site_is_valid)
{
    const Parsed_Document parsed = parse("::site\n::page[title=Home]\nHi\n::\n::\n");
    EXPECT_FALSE(has_errors(parsed.diagnostics));
    ASSERT_EQ(parsed.document.blocks.size(), 1);
    const auto& site = std::get<ast::Site>(parsed.document.blocks[0]);
    ASSERT_EQ(site.children.size(), 1);
    EXPECT_EQ(site.children[0].get_type(), Block_Type::page);
}

TEST(Surf_Properties, duplicate_attribute_keeps_first)
{
    const Parsed_Document parsed = parse("::callout[type=tip,type=warning]\nX\n::");
    ASSERT_EQ(parsed.diagnostics.size(), 1);
    EXPECT_EQ(parsed.diagnostics[0].code, Diagnostic_Code::duplicate_attribute);
    ASSERT_EQ(parsed.document.blocks.size(), 1);
    EXPECT_EQ(std::get<ast::Callout>(parsed.document.blocks[0]).type, Callout_Type::tip);
}

TEST(Surf_Properties, unterminated_directive_keeps_body)
{
    const Parsed_Document parsed = parse("::callout[type=tip]\nX\n");
    ASSERT_EQ(parsed.diagnostics.size(), 1);
    EXPECT_EQ(parsed.diagnostics[0].code, Diagnostic_Code::unterminated_directive);
    ASSERT_EQ(parsed.document.blocks.size(), 1);
    EXPECT_EQ(std::get<ast::Callout>(parsed.document.blocks[0]).text, "X");
}

TEST(Surf_Properties, explicit_order_wins)
{
    const Parsed_Document parsed = parse("::site\n"
                                         "::page[route=/b order=2]\nB\n::\n"
                                         "::page[route=/a order=1]\nA\n::\n"
                                         "::page[route=/c order=3]\nC\n::\n"
                                         "::\n");
    EXPECT_TRUE(parsed.diagnostics.empty());

    const Extracted_Site site = extract_site(parsed.document);
    ASSERT_EQ(site.navigation.size(), 3);
    EXPECT_EQ(site.navigation[0].route, "/a");
    EXPECT_EQ(site.navigation[1].route, "/b");
    EXPECT_EQ(site.navigation[2].route, "/c");
}

TEST(Surf_Properties, orphan_page_is_retained)
{
    const Parsed_Document parsed = parse("::page[title=A]\nx\n::\n");
    ASSERT_EQ(parsed.diagnostics.size(), 1);
    EXPECT_EQ(parsed.diagnostics[0].code, Diagnostic_Code::orphan_page);
    EXPECT_EQ(parsed.diagnostics[0].severity(), Severity::error);
    ASSERT_EQ(parsed.document.blocks.size(), 1);
    EXPECT_EQ(parsed.document.blocks[0].get_type(), Block_Type::page);
}

TEST(Surf_Properties, unknown_directive_survives_markdown)
{
    constexpr std::string_view source = "::Widget[size=\"xl\", on]\nraw *body*\n::\n";
    const Parsed_Document parsed = parse(source);
    ASSERT_EQ(parsed.document.blocks.size(), 1);
    EXPECT_EQ(parsed.document.blocks[0].get_type(), Block_Type::unknown);
    EXPECT_EQ(render_markdown(parsed.document, {}), source);
}

TEST(Surf_Properties, renderers_keep_primary_content)
{
    const Parsed_Document parsed = parse("::metric[label=Uptime, value=\"99.9\", unit=\"%\"]\n");
    ASSERT_FALSE(has_errors(parsed.diagnostics));

    const Escaping_Markdown_Engine engine;
    Code_String html;
    render_html(html, parsed.document, {}, engine);
    const std::string markdown = render_markdown(parsed.document, {});
    const std::string terminal = render_terminal(parsed.document, { .colors = false });

    for (const std::string_view output : { html.get_text(), std::string_view(markdown),
                                           std::string_view(terminal) }) {
        SCOPED_TRACE(output);
        EXPECT_NE(output.find("99.9"), std::string_view::npos);
        EXPECT_NE(output.find("Uptime"), std::string_view::npos);
    }
}

TEST(Surf_Properties, renderers_never_produce_empty_output)
{
    const Escaping_Markdown_Engine engine;
    for (const Minimal_Directive& directive : minimal_directives) {
        SCOPED_TRACE(directive.source);
        const Parsed_Document parsed = parse(directive.source);
        Code_String html;
        render_html(html, parsed.document, { .stylesheet = Stylesheet_Mode::omit }, engine);
        EXPECT_FALSE(html.empty());
        EXPECT_FALSE(render_markdown(parsed.document, {}).empty());
        EXPECT_FALSE(render_terminal(parsed.document, {}).empty());
    }
}

TEST(Surf_Properties, validation_is_idempotent)
{
    for (const Minimal_Directive& directive : minimal_directives) {
        const Parsed_Document parsed = parse(directive.source);
        EXPECT_EQ(validate(parsed.document), validate(parsed.document));
    }
}

} // namespace
} // namespace surfdoc
