#include <string>

#include <gtest/gtest.h>

#include "surf/parsing/parse.hpp"
#include "surf/render/render_config.hpp"
#include "surf/render/terminal.hpp"

namespace surfdoc {
namespace {

std::string to_terminal(std::string_view source,
                        const Render_Config& config = {},
                        Front_Matter front_matter = {})
{
    return render_terminal(parse(source, std::move(front_matter)).document, config);
}

TEST(Render_Terminal, empty)
{
    EXPECT_EQ(to_terminal(""), "");
}

TEST(Render_Terminal, prose_headings)
{
    EXPECT_EQ(to_terminal("# Title\nText"), "Title\nText\n");
}

TEST(Render_Terminal, front_matter_title)
{
    EXPECT_EQ(to_terminal("Text", {}, { { "title", "T" } }), "T\n\nText\n");
}

TEST(Render_Terminal, callout)
{
    EXPECT_EQ(to_terminal("::callout[type=warning title=\"Heads up\"]\nBe careful.\n::\n"),
              "│ Warning: Heads up\n│ Be careful.\n");
}

TEST(Render_Terminal, colors_only_when_enabled)
{
    constexpr std::string_view source = "::callout[type=danger]\nStop.\n::\n";
    EXPECT_EQ(to_terminal(source).find('\x1b'), std::string::npos);
    const std::string colored = to_terminal(source, { .colors = true });
    EXPECT_NE(colored.find("\x1b["), std::string::npos);
    EXPECT_NE(colored.find("Stop."), std::string::npos);
}

TEST(Render_Terminal, code)
{
    EXPECT_EQ(to_terminal("::code[lang=rust]\nfn main() {}\n::\n"),
              "─── rust\n  fn main() {}\n───\n");
}

TEST(Render_Terminal, tasks)
{
    EXPECT_EQ(to_terminal("::tasks\n- [x] Done\n- [ ] Open @bob\n::\n"), "✓ Done\n☐ Open @bob\n");
}

TEST(Render_Terminal, decision)
{
    EXPECT_EQ(to_terminal("::decision[status=accepted options=[\"A\", \"B\"] outcome=B]\nWhy.\n::\n"),
              "[ACCEPTED] Decision\nWhy.\nOptions: A, B\nOutcome: B\n");
}

TEST(Render_Terminal, table_columns_are_aligned)
{
    EXPECT_EQ(to_terminal("::data\n| A | Long |\n|---|---|\n| x | y |\n::\n"),
              "│ A │ Long │\n"
              "│───┼──────│\n"
              "│ x │ y    │\n");
}

TEST(Render_Terminal, metric)
{
    EXPECT_EQ(to_terminal("::metric[label=Latency value=120 unit=ms trend=down]\n"),
              "Latency: 120 ms ↓\n");
}

TEST(Render_Terminal, faq)
{
    EXPECT_EQ(to_terminal("::faq\n### Free?\nYes.\n::\n"), "Q1: Free?\nA: Yes.\n");
}

TEST(Render_Terminal, page_rule_uses_width)
{
    EXPECT_EQ(to_terminal("::site\n:::page[route=\"/about\" title=About]\nHi\n:::\n::\n",
                          { .terminal_width = 10 }),
              "[Site Config]\n[Page /about] About\n──────────\nHi\n");
}

TEST(Render_Terminal, unknown)
{
    EXPECT_EQ(to_terminal("::custom-widget\nBody\n::\n"), "[custom-widget]\nBody\n");
}

TEST(Render_Terminal, control_characters_are_removed)
{
    EXPECT_EQ(to_terminal("# Ti\x1b[31mtle\nA\aB\tC"), "Ti[31mtle\nAB\tC\n");
    EXPECT_EQ(to_terminal("::callout[type=note title=\"Hi\x07there\"]\nx\x1b[2J\n::\n"),
              "│ Note: Hithere\n│ x[2J\n");
    EXPECT_EQ(to_terminal("::data\n| \x1b[1mA | B\x08 |\n|---|---|\n::\n").find('\x1b'),
              std::string::npos);
    EXPECT_EQ(to_terminal("Text", {}, { { "title", "T\x1b[5m" } }), "T[5m\n\nText\n");

    const std::string colored = to_terminal("::callout[type=danger]\nSto\x1bp.\n::\n",
                                            { .colors = true });
    EXPECT_NE(colored.find("Stop."), std::string::npos);
}

TEST(Render_Terminal, nav)
{
    EXPECT_EQ(to_terminal("::nav[logo=Acme]\n- [Home](/)\n- [Docs](/docs)\n::\n"),
              "Acme │ Home (/) │ Docs (/docs)\n");
    EXPECT_EQ(to_terminal("::nav\n- [Home](/)\n::\n"), "Home (/)\n");
}

TEST(Render_Terminal, inline_extensions)
{
    EXPECT_EQ(to_terminal("Ready :status[value=shipped] per :evidence[tier=1 source=QA]."),
              "Ready [shipped] per (QA, tier 1).\n");
    EXPECT_EQ(to_terminal("# Plan :status[value=draft]"), "Plan [draft]\n");
}

} // namespace
} // namespace surfdoc
