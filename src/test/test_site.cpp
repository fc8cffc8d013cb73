#include <algorithm>
#include <stop_token>
#include <string>

#include <gtest/gtest.h>

#include "surf/diagnostic.hpp"
#include "surf/parsing/parse.hpp"
#include "surf/render/render_config.hpp"
#include "surf/site/site.hpp"

#include "test/escaping_markdown_engine.hpp"

namespace surfdoc {
namespace {

constexpr std::string_view three_page_site = "Loose prose.\n"
                                             "\n"
                                             "::site[domain=\"example.com\"]\n"
                                             "name: Acme\n"
                                             "tagline: Docs that surf\n"
                                             "theme: dark\n"
                                             "accent: #0ea5e9\n"
                                             ":::page[route=\"/docs/intro\" order=2]\n"
                                             "Intro <text>.\n"
                                             ":::\n"
                                             ":::page[route=\"/\" title=Home order=1]\n"
                                             "Welcome.\n"
                                             ":::\n"
                                             ":::page[route=\"/about\" title=About id=about-us order=3]\n"
                                             "About us.\n"
                                             ":::\n"
                                             "::\n";

bool contains(std::string_view haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string_view::npos;
}

TEST(Site, output_paths)
{
    EXPECT_EQ(output_path_of_route("/"), "index.html");
    EXPECT_EQ(output_path_of_route(""), "index.html");
    EXPECT_EQ(output_path_of_route("/about"), "about/index.html");
    EXPECT_EQ(output_path_of_route("/docs/intro/"), "docs/intro/index.html");
    EXPECT_EQ(output_path_of_route("/../../etc//./passwd"), "etc/passwd/index.html");
    EXPECT_EQ(href_of_route("/about"), "/about/index.html");
    EXPECT_EQ(href_of_route("/"), "/index.html");
}

TEST(Site, extract)
{
    const Parsed_Document parsed = parse(three_page_site);
    const Extracted_Site site = extract_site(parsed.document);
    ASSERT_TRUE(site.config);
    EXPECT_EQ(site.config->domain, "example.com");
    EXPECT_EQ(site.config->name, "Acme");
    EXPECT_EQ(site.config->tagline, "Docs that surf");
    EXPECT_EQ(site.config->theme, "dark");
    EXPECT_EQ(site.config->accent, "#0ea5e9");
    EXPECT_FALSE(site.config->font);
    EXPECT_EQ(site.config->properties.size(), 4);
    EXPECT_EQ(site.loose_blocks.size(), 1);

    ASSERT_EQ(site.pages.size(), 3);
    EXPECT_EQ(site.pages[0]->route, "/");
    EXPECT_EQ(site.pages[1]->route, "/docs/intro");
    EXPECT_EQ(site.pages[2]->route, "/about");

    ASSERT_EQ(site.navigation.size(), 3);
    EXPECT_EQ(site.navigation[0],
              (Navigation_Entry { .id = "/", .title = "Home", .route = "/", .position = 0 }));
    EXPECT_EQ(site.navigation[1].title, "docs/intro");
    EXPECT_EQ(site.navigation[2].id, "about-us");
    EXPECT_EQ(site.navigation[2].position, 2);
}

TEST(Site, extract_without_site)
{
    const Parsed_Document parsed = parse("# Just a page\n");
    const Extracted_Site site = extract_site(parsed.document);
    EXPECT_FALSE(site.config);
    EXPECT_TRUE(site.pages.empty());
    EXPECT_TRUE(site.navigation.empty());
    EXPECT_EQ(site.loose_blocks.size(), 1);
}

TEST(Site, default_name)
{
    const Parsed_Document parsed = parse("::site\n:::page\nx\n:::\n::\n");
    const Extracted_Site site = extract_site(parsed.document);
    ASSERT_TRUE(site.config);
    EXPECT_EQ(site.config->name, default_site_name);
    ASSERT_EQ(site.navigation.size(), 1);
    EXPECT_EQ(site.navigation[0].title, "SurfDoc Site");
}

TEST(Site, render_pages)
{
    const Parsed_Document parsed = parse(three_page_site);
    const Escaping_Markdown_Engine engine;
    const Rendered_Site site = render_site(parsed.document, { .worker_count = 1 }, engine);

    ASSERT_EQ(site.pages.size(), 3);
    EXPECT_EQ(site.cancelled_count(), 0);
    EXPECT_EQ(site.navigation.size(), 3);

    const Rendered_Page& home = site.pages[0];
    EXPECT_EQ(home.route, "/");
    EXPECT_EQ(home.path, "index.html");
    EXPECT_EQ(home.title, "Home - Acme");
    EXPECT_EQ(home.status, Page_Status::rendered);
    EXPECT_TRUE(home.html.starts_with("<!-- Built with SurfDoc"));
    EXPECT_TRUE(contains(home.html, "<title>Home - Acme</title>"));
    EXPECT_TRUE(contains(home.html, "--bg: #0a0a0f;"));
    EXPECT_TRUE(contains(home.html, "--accent: #0ea5e9;"));
    EXPECT_TRUE(contains(home.html, "<a href=\"/index.html\" class=\"site-name\">Acme</a>"));
    EXPECT_TRUE(
        contains(home.html, "<a href=\"/index.html\" class=\"active\" aria-current=\"page\">Home</a>"));
    EXPECT_TRUE(contains(home.html, "<a href=\"/about/index.html\">About</a>"));
    EXPECT_TRUE(contains(home.html, "<p>Welcome.</p>"));
    EXPECT_FALSE(contains(home.html, "About us."));
    EXPECT_FALSE(contains(home.html, "Loose prose."));
    EXPECT_TRUE(contains(home.html,
                         "<footer class=\"surfdoc-site-footer\">Acme - Docs that surf</footer>"));

    const Rendered_Page& intro = site.pages[1];
    EXPECT_EQ(intro.path, "docs/intro/index.html");
    EXPECT_EQ(intro.title, "docs/intro - Acme");
    EXPECT_TRUE(contains(intro.html, "<p>Intro &lt;text&gt;.</p>"));
    EXPECT_TRUE(contains(intro.html,
                         "<a href=\"/docs/intro/index.html\" class=\"active\" aria-current=\"page\">"));
}

TEST(Site, worker_count_does_not_change_output)
{
    const Parsed_Document parsed = parse(three_page_site);
    const Escaping_Markdown_Engine engine;
    const Rendered_Site sequential = render_site(parsed.document, { .worker_count = 1 }, engine);
    const Rendered_Site parallel = render_site(parsed.document, { .worker_count = 4 }, engine);

    ASSERT_EQ(sequential.pages.size(), parallel.pages.size());
    for (Size i = 0; i < sequential.pages.size(); ++i) {
        EXPECT_EQ(sequential.pages[i].path, parallel.pages[i].path);
        EXPECT_EQ(sequential.pages[i].html, parallel.pages[i].html);
    }
    EXPECT_EQ(sequential.navigation, parallel.navigation);
}

TEST(Site, max_pages)
{
    const Parsed_Document parsed = parse(three_page_site);
    const Escaping_Markdown_Engine engine;
    const Rendered_Site site = render_site(parsed.document, { .max_pages = 2 }, engine);
    ASSERT_EQ(site.pages.size(), 2);
    EXPECT_EQ(site.navigation.size(), 2);
    EXPECT_FALSE(contains(site.pages[0].html, "/about/index.html"));
}

TEST(Site, cancellation)
{
    const Parsed_Document parsed = parse(three_page_site);
    const Escaping_Markdown_Engine engine;
    std::stop_source stop;
    stop.request_stop();

    const Rendered_Site site
        = render_site(parsed.document, { .worker_count = 2 }, engine, stop.get_token());
    ASSERT_EQ(site.pages.size(), 3);
    EXPECT_EQ(site.cancelled_count(), 3);
    for (const Rendered_Page& page : site.pages) {
        EXPECT_EQ(page.status, Page_Status::cancelled);
        EXPECT_TRUE(page.html.empty());
        EXPECT_FALSE(page.path.empty());
    }
}

TEST(Site, colliding_routes_are_errors)
{
    // Both untitled pages default to the route "/".
    const Parsed_Document parsed = parse("::site\n"
                                         ":::page\nFirst.\n:::\n"
                                         ":::page\nSecond.\n:::\n"
                                         ":::page[title=Home route=\"/\"]\nThird.\n:::\n"
                                         "::\n");
    const auto duplicates = std::ranges::count_if(parsed.diagnostics, [](const Diagnostic& d) {
        return d.code == Diagnostic_Code::duplicate_id;
    });
    EXPECT_EQ(duplicates, 2);
    EXPECT_TRUE(has_errors(parsed.diagnostics));
    for (const Diagnostic& d : parsed.diagnostics) {
        if (d.code == Diagnostic_Code::duplicate_id) {
            ASSERT_TRUE(d.related);
            EXPECT_EQ(d.related->line, 1);
        }
    }

    const Escaping_Markdown_Engine engine;
    const Rendered_Site site = render_site(parsed.document, {}, engine);
    ASSERT_EQ(site.pages.size(), 3);
    EXPECT_EQ(site.pages[0].path, site.pages[1].path);
}

TEST(Site, no_site_renders_nothing)
{
    const Parsed_Document parsed = parse("# Title\n\n::callout[type=info]\nx\n::\n");
    const Escaping_Markdown_Engine engine;
    const Rendered_Site site = render_site(parsed.document, {}, engine);
    EXPECT_TRUE(site.pages.empty());
    EXPECT_TRUE(site.navigation.empty());
    EXPECT_EQ(site.cancelled_count(), 0);
}

} // namespace
} // namespace surfdoc
