#include <string>

#include <gtest/gtest.h>

#include "common/code_string.hpp"

#include "surf/ast.hpp"
#include "surf/parsing/parse.hpp"
#include "surf/render/html.hpp"
#include "surf/render/render_config.hpp"

#include "test/escaping_markdown_engine.hpp"

namespace surfdoc {
namespace {

const Render_Config bare_fragment { .stylesheet = Stylesheet_Mode::omit };

std::string render(std::string_view source,
                   const Render_Config& config = bare_fragment,
                   Front_Matter front_matter = {})
{
    const Parsed_Document parsed = parse(source, std::move(front_matter));
    const Escaping_Markdown_Engine engine;
    Code_String out;
    render_html(out, parsed.document, config, engine);
    return std::string(out.get_text());
}

Size count_occurrences(std::string_view haystack, std::string_view needle)
{
    Size result = 0;
    for (Size pos = haystack.find(needle); pos != std::string_view::npos;
         pos = haystack.find(needle, pos + needle.length())) {
        ++result;
    }
    return result;
}

bool contains(std::string_view haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string_view::npos;
}

TEST(Render_HTML, exact_summary)
{
    EXPECT_EQ(render("::summary\nShort.\n::\n"),
              "<div class=\"surfdoc-summary\" role=\"doc-abstract\"><p>Short.</p></div>\n");
}

TEST(Render_HTML, prose_goes_through_engine)
{
    EXPECT_EQ(render("Hello *world* & more"), "<p>Hello *world* &amp; more</p>\n");
}

TEST(Render_HTML, callout)
{
    const std::string html = render("::callout[type=warning title=\"Heads up\"]\nBe careful.\n::\n");
    EXPECT_TRUE(contains(html,
                         "<div class=\"surfdoc-callout surfdoc-callout-warning\" role=\"note\">"
                         "<strong>Warning: Heads up</strong><p>Be careful.</p></div>"));

    EXPECT_TRUE(contains(render("::callout[type=danger]\nNo.\n::\n"), "role=\"alert\""));
}

TEST(Render_HTML, escapes_user_text)
{
    const std::string html
        = render("::callout[type=info title=\"<b>&\"]\n<script>alert(1)</script>\n::\n");
    EXPECT_TRUE(contains(html, "Info: &lt;b&gt;&amp;"));
    EXPECT_TRUE(contains(html, "&lt;script&gt;alert(1)&lt;/script&gt;"));
    EXPECT_FALSE(contains(html, "<script>"));
}

TEST(Render_HTML, escapes_attribute_values)
{
    const std::string html = render("::cta[label=Go href=\"/a?x=1&y=\\\"2\\\"\"]\n");
    EXPECT_TRUE(contains(html, "href=\"/a?x=1&amp;y=&quot;2&quot;\""));
}

TEST(Render_HTML, data_table)
{
    const std::string html = render("::data[id=plans sortable]\n"
                                    "| Plan | Price |\n"
                                    "|------|-------|\n"
                                    "| Free | $0 |\n"
                                    "::\n");
    EXPECT_TRUE(contains(html, "<table class=\"surfdoc-data\" id=\"plans\" data-sortable>"));
    EXPECT_TRUE(contains(html, "<th scope=\"col\">Plan</th>"));
    EXPECT_TRUE(contains(html, "<td>$0</td>"));
}

TEST(Render_HTML, code)
{
    const std::string html = render("::code[lang=cpp file=\"a.cpp\"]\nint x = a < b;\n::\n");
    EXPECT_TRUE(contains(html,
                         "<pre class=\"surfdoc-code\" aria-label=\"cpp code\" data-file=\"a.cpp\">"
                         "<code class=\"language-cpp\">int x = a &lt; b;</code></pre>"));
}

TEST(Render_HTML, tasks)
{
    const std::string html = render("::tasks\n- [x] Done\n- [ ] Open\n::\n");
    EXPECT_TRUE(contains(html, "<input type=\"checkbox\" checked disabled/> Done"));
    EXPECT_TRUE(contains(html, "<input type=\"checkbox\" disabled/> Open"));
}

TEST(Render_HTML, decision_marks_chosen_option)
{
    const std::string html
        = render("::decision[status=accepted options=[\"A\", \"B\"] outcome=B]\nWhy.\n::\n");
    EXPECT_TRUE(contains(html, "surfdoc-decision-accepted"));
    EXPECT_TRUE(contains(html, "<span class=\"status\">Accepted</span>"));
    EXPECT_TRUE(contains(html, "<li>A</li><li class=\"chosen\">B</li>"));
    EXPECT_TRUE(contains(html, "<strong>Outcome:</strong> B"));
}

TEST(Render_HTML, metric)
{
    const std::string html = render("::metric[label=Revenue value=\"$1.2M\" trend=flat]\n");
    EXPECT_TRUE(contains(html, "aria-label=\"Revenue: $1.2M, flat\""));
    EXPECT_TRUE(contains(html, "<span class=\"value\">$1.2M</span>"));
    EXPECT_TRUE(contains(html, "<span class=\"trend flat\">→</span>"));
}

TEST(Render_HTML, unknown_directive)
{
    const std::string html = render("::custom-widget[x=1]\nKept <as> written.\n::\n");
    EXPECT_TRUE(contains(html, "<div class=\"surfdoc-unknown\" role=\"note\" data-name=\"custom-widget\">"));
    EXPECT_TRUE(contains(html, "Kept &lt;as&gt; written."));
}

TEST(Render_HTML, tabs_ids_and_script)
{
    const std::string html = render("::tabs\n## One\nA\n## Two\nB\n::\n\n::tabs\n## Three\nC\n::\n");
    EXPECT_TRUE(contains(html, "id=\"surfdoc-0-tab-0\""));
    EXPECT_TRUE(contains(html, "id=\"surfdoc-1-tab-0\""));
    EXPECT_TRUE(contains(html, "aria-labelledby=\"surfdoc-0-tab-1\" tabindex=\"0\" hidden>"));
    EXPECT_TRUE(contains(html, ">Two</button>"));
    EXPECT_EQ(count_occurrences(html, "<script>"), 1);

    EXPECT_FALSE(contains(render("Plain."), "<script>"));
}

TEST(Render_HTML, fragment_stylesheet)
{
    const std::string with_css = render("Text.", {});
    EXPECT_TRUE(with_css.starts_with("<style>:root {"));
    EXPECT_TRUE(contains(with_css, ".surfdoc-callout"));
    EXPECT_FALSE(contains(with_css, "<!DOCTYPE"));

    EXPECT_FALSE(contains(render("Text."), "<style>"));
}

TEST(Render_HTML, themes)
{
    EXPECT_TRUE(contains(html_stylesheet(Theme::dark), "--bg: #0a0a0f;"));
    EXPECT_TRUE(contains(html_stylesheet(Theme::light), "--bg: #ffffff;"));
}

TEST(Render_HTML, full_page)
{
    const std::string html = render("Body.",
                                    { .full_page = true, .source_path = "docs/intro.surf" },
                                    { { "title", "Product <Tour>" } });
    EXPECT_TRUE(html.starts_with("<!-- Built with SurfDoc, source: docs/intro.surf -->\n"
                                 "<!DOCTYPE html>\n"
                                 "<html lang=\"en\">"));
    EXPECT_TRUE(contains(html, "<meta charset=\"utf-8\"/>"));
    EXPECT_TRUE(contains(html, "<meta name=\"generator\" content=\"SurfDoc v0.1\"/>"));
    EXPECT_TRUE(contains(html, "<title>Product &lt;Tour&gt;</title>"));
    EXPECT_TRUE(contains(html, "<style>:root {"));
    EXPECT_TRUE(contains(html, "<article class=\"surfdoc\">\n<p>Body.</p>\n</article>"));
    EXPECT_TRUE(html.ends_with("</body>\n</html>\n"));
}

TEST(Render_HTML, full_page_title_and_meta)
{
    const std::string html = render("Body.",
                                    { .stylesheet = Stylesheet_Mode::omit,
                                      .full_page = true,
                                      .lang = "de",
                                      .title = "Explicit",
                                      .canonical_url = "https://example.com/",
                                      .description = "About us" },
                                    { { "title", "Ignored" } });
    EXPECT_TRUE(contains(html, "<html lang=\"de\">"));
    EXPECT_TRUE(contains(html, "<title>Explicit</title>"));
    EXPECT_TRUE(contains(html, "<link rel=\"canonical\" href=\"https://example.com/\"/>"));
    EXPECT_TRUE(contains(html, "<meta name=\"description\" content=\"About us\"/>"));
    EXPECT_FALSE(contains(html, "<style>"));

    EXPECT_TRUE(contains(render("x", { .full_page = true }), "<title>SurfDoc</title>"));
}

TEST(Render_HTML, comment_cannot_be_closed_early)
{
    const std::string html = render("x", { .full_page = true, .source_path = "a-->b" });
    EXPECT_TRUE(html.starts_with("<!-- Built with SurfDoc, source: a- ->b -->"));
}

TEST(Render_HTML, style_overrides)
{
    const std::string html = render("::style\naccent: #ff8800\nfont: inter\n::\n");
    EXPECT_TRUE(contains(html, "@import url('https://fonts.googleapis.com/css2?family=Inter"));
    EXPECT_TRUE(contains(html, "<style>:root { --accent: #ff8800;--font-heading: 'Inter'"));
    EXPECT_TRUE(contains(html, "data-properties=\"accent=#ff8800;font=inter\""));
}

TEST(Render_HTML, unsafe_accent_is_ignored)
{
    const std::string html = render("::style\naccent: red;}</style><script>x()</script>\n::\n");
    EXPECT_FALSE(contains(html, "--accent"));
    EXPECT_FALSE(contains(html, "<script>"));
}

TEST(Render_HTML, unknown_font_is_ignored)
{
    Style_Overrides overrides;
    const ast::Property properties[] { { .key = "font", .value = "comic-sans" },
                                       { .key = "heading-font", .value = "Serif" } };
    collect_style_overrides(overrides, properties);
    EXPECT_TRUE(overrides.font_imports.empty());
    EXPECT_TRUE(overrides.declarations.starts_with("--font-heading: Georgia"));
    EXPECT_FALSE(contains(overrides.declarations, "--font-body"));
}

TEST(Render_HTML, nav)
{
    EXPECT_EQ(render("::nav[logo=Acme]\n- [Home](/)\n- [Docs](/docs) [icon=book]\n::\n"),
              "<nav class=\"surfdoc-nav\" role=\"navigation\" aria-label=\"Page navigation\">"
              "<span class=\"surfdoc-nav-logo\">Acme</span>"
              "<div class=\"surfdoc-nav-links\">"
              "<a href=\"/\">Home</a>"
              "<a href=\"/docs\" data-icon=\"book\">Docs</a>"
              "</div></nav>\n");
}

TEST(Render_HTML, inline_status)
{
    EXPECT_EQ(render("Build :status[value=passing] & green"),
              "<p>Build <span class=\"surfdoc-status\" data-status=\"passing\">passing</span>"
              " &amp; green</p>\n");
}

TEST(Render_HTML, inline_evidence)
{
    const std::string html = render("Fast:evidence[tier=2 source=\"<bench>\"]. Done :status[value=ok]");
    EXPECT_TRUE(contains(html,
                         "<p>Fast<span class=\"surfdoc-evidence\" data-tier=\"2\" "
                         "data-source=\"&lt;bench&gt;\">&lt;bench&gt;, tier 2</span>. Done "));
    EXPECT_TRUE(contains(html, "data-status=\"ok\">ok</span></p>"));
    EXPECT_FALSE(contains(html, ":evidence"));
    EXPECT_FALSE(contains(html, "\xEE\x80"));
}

TEST(Render_HTML, inline_extension_in_code_is_kept)
{
    EXPECT_EQ(render("Write `:status[value=x]`"), "<p>Write `:status[value=x]`</p>\n");
}

} // namespace
} // namespace surfdoc
