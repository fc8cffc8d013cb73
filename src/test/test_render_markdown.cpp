#include <string>

#include <gtest/gtest.h>

#include "surf/parsing/parse.hpp"
#include "surf/render/markdown.hpp"

namespace surfdoc {
namespace {

std::string to_markdown(std::string_view source, Front_Matter front_matter = {})
{
    return render_markdown(parse(source, std::move(front_matter)).document, {});
}

TEST(Render_Markdown, empty)
{
    EXPECT_EQ(to_markdown(""), "");
}

TEST(Render_Markdown, prose_is_kept)
{
    EXPECT_EQ(to_markdown("# Title\n\nSome *text*."), "# Title\n\nSome *text*.\n");
}

TEST(Render_Markdown, front_matter)
{
    EXPECT_EQ(to_markdown("Text", { { "title", "T" }, { "author", "A" } }),
              "---\nauthor: A\ntitle: T\n---\n\nText\n");
}

TEST(Render_Markdown, callout)
{
    EXPECT_EQ(to_markdown("::callout[type=warning title=\"Heads up\"]\nBe careful.\n::\n"),
              "> **Warning**: Heads up\n> Be careful.\n");
    EXPECT_EQ(to_markdown("# T\n\n::callout[type=info]\nA\n\nB\n::\n"),
              "# T\n\n> **Info**\n> A\n>\n> B\n");
}

TEST(Render_Markdown, code)
{
    EXPECT_EQ(to_markdown("::code[lang=rust file=\"main.rs\"]\nfn main() {}\n::\n"),
              "`main.rs`\n\n```rust\nfn main() {}\n```\n");
    EXPECT_EQ(to_markdown("::code\n```\n::\n"), "````\n```\n````\n");
}

TEST(Render_Markdown, data_table)
{
    EXPECT_EQ(to_markdown("::data\n| Plan | Price |\n|---|---|\n| Free | $0 |\n::\n"),
              "| Plan | Price |\n| --- | --- |\n| Free | $0 |\n");
}

TEST(Render_Markdown, tasks)
{
    EXPECT_EQ(to_markdown("::tasks\n- [x] Write parser @alice\n- [ ] Ship\n::\n"),
              "- [x] Write parser @alice\n- [ ] Ship\n");
}

TEST(Render_Markdown, decision)
{
    EXPECT_EQ(to_markdown("::decision[status=accepted date=\"2024-05-01\" options=[\"A\", \"B\"] "
                          "outcome=B]\nWhy.\n::\n"),
              "> **Decision** (accepted) (2024-05-01)\n> Why.\n> Options: A, B\n> Outcome: B\n");
}

TEST(Render_Markdown, metric_and_figure)
{
    EXPECT_EQ(to_markdown("::metric[label=Users value=12000 unit=users trend=up]\n"),
              "**Users**: 12000 users ↑\n");
    EXPECT_EQ(to_markdown("::figure[src=d.png alt=Diagram caption=Overview]\n"),
              "![Diagram](d.png)\n*Overview*\n");
    EXPECT_EQ(to_markdown("::hero-image[src=h.png]\n"), "![Hero image](h.png)\n");
}

TEST(Render_Markdown, containers)
{
    EXPECT_EQ(to_markdown("::tabs\n## One\nA\n## Two\nB\n::\n"), "### One\n\nA\n\n### Two\n\nB\n");
    EXPECT_EQ(to_markdown("::columns\nLeft\n---\nRight\n::\n"), "Left\n\n---\n\nRight\n");
}

TEST(Render_Markdown, quote_and_cta)
{
    EXPECT_EQ(to_markdown("::quote[by=Grace cite=Interview]\nText\n::\n"),
              "> Text\n>\n> — Grace, *Interview*\n");
    EXPECT_EQ(to_markdown("::cta[label=Start href=\"/start\"]\n"), "[Start](/start)\n");
}

TEST(Render_Markdown, style_becomes_comment)
{
    EXPECT_EQ(to_markdown("::style\naccent: #fff\n::\n"), "<!-- style: accent=#fff; -->\n");
}

TEST(Render_Markdown, style_comment_cannot_be_closed_early)
{
    const std::string markdown = to_markdown("::style\naccent: a-->b\nfont--x: --\n::\n");
    EXPECT_EQ(markdown, "<!-- style: accent=a- ->b; font- -x=- -; -->\n");
    EXPECT_EQ(markdown.find("-->"), markdown.length() - 4);
}

TEST(Render_Markdown, faq)
{
    EXPECT_EQ(to_markdown("::faq\n### Free?\nYes.\n::\n"), "### Free?\n\nYes.\n");
}

TEST(Render_Markdown, site_and_pages)
{
    EXPECT_EQ(to_markdown("::site[domain=\"example.com\"]\n"
                          "name: X\n"
                          ":::page[route=\"/\" title=Home]\n"
                          "Welcome\n"
                          ":::\n"
                          "::\n"),
              "**Site Configuration**\n- domain: example.com\n- name: X\n\n## Home\n\nWelcome\n");
}

TEST(Render_Markdown, unknown_is_reproduced)
{
    constexpr std::string_view source = "::custom-widget[x=1]\nKept as written.\n::\n";
    EXPECT_EQ(to_markdown(source), source);
}

TEST(Render_Markdown, nav)
{
    EXPECT_EQ(to_markdown("::nav[logo=Acme]\n- [Home](/)\n- [Docs](/docs) [icon=book]\n::\n"),
              "- [Home](/)\n- [Docs](/docs)\n");
}

TEST(Render_Markdown, inline_extensions)
{
    EXPECT_EQ(to_markdown("Ready :status[value=shipped] per :evidence[tier=1 source=QA]."),
              "Ready **shipped** per *(QA, tier 1)*.\n");
    EXPECT_EQ(to_markdown("Gone :status[] here"), "Gone  here\n");
}

} // namespace
} // namespace surfdoc
