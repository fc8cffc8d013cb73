#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

#include "common/assert.hpp"
#include "common/code_string.hpp"

#include "surf/render/html.hpp"
#include "surf/render/html_writer.hpp"
#include "surf/render/render_config.hpp"
#include "surf/site/site.hpp"
#include "surf/validate.hpp"

namespace surfdoc {

namespace {

Site_Config make_site_config(const ast::Site& site)
{
    Site_Config result;
    result.domain = site.domain;
    result.properties = site.properties;
    for (const ast::Property& property : site.properties) {
        if (property.key == "name") {
            result.name = property.value;
        }
        else if (property.key == "tagline") {
            result.tagline = property.value;
        }
        else if (property.key == "theme") {
            result.theme = property.value;
        }
        else if (property.key == "accent") {
            result.accent = property.value;
        }
        else if (property.key == "font") {
            result.font = property.value;
        }
    }
    return result;
}

std::string_view route_without_slash(std::string_view route)
{
    while (route.starts_with('/')) {
        route.remove_prefix(1);
    }
    return route;
}

std::string navigation_title(const ast::Page& page, const Site_Config& site)
{
    if (page.title) {
        return *page.title;
    }
    const std::string_view name = route_without_slash(page.route);
    return name.empty() ? site.name : std::string(name);
}

std::string page_title(const ast::Page& page, const Site_Config& site)
{
    if (page.title) {
        return *page.title + " - " + site.name;
    }
    const std::string_view name = route_without_slash(page.route);
    return name.empty() ? site.name : std::string(name) + " - " + site.name;
}

/// @brief State shared by all pages of one site render.
struct Site_Renderer {
    const Render_Config& m_config;
    const Markdown_Engine& m_engine;
    const Site_Config& m_site;
    std::span<const Navigation_Entry> m_navigation;
    Style_Overrides m_overrides;

    void render_page(Rendered_Page& out, const ast::Page& page) const
    {
        Code_String html;
        HTML_Writer writer { html };

        open_html_page(writer, m_config, out.title);
        write_style_overrides(writer, m_overrides);

        write_navigation(writer, page);
        writer.write_line_break();

        writer.open_tag_with_attributes("article").write_attribute("class", "surfdoc").end();
        writer.write_line_break();
        render_html_blocks(writer, page.children, m_engine);
        writer.close_tag("article");
        writer.write_line_break();

        writer.open_tag_with_attributes("footer")
            .write_attribute("class", "surfdoc-site-footer")
            .end();
        writer.write_inner_text(m_site.name);
        if (m_site.tagline) {
            writer.write_inner_text(" - ");
            writer.write_inner_text(*m_site.tagline);
        }
        writer.close_tag("footer");
        writer.write_line_break();

        close_html_page(writer);
        SURFDOC_ASSERT(writer.is_done());

        out.html = std::string(html.get_text());
        out.status = Page_Status::rendered;
    }

private:
    void write_navigation(HTML_Writer& writer, const ast::Page& current) const
    {
        writer.open_tag_with_attributes("nav")
            .write_attribute("class", "surfdoc-site-nav")
            .write_attribute("role", "navigation")
            .write_attribute("aria-label", "Site navigation")
            .end();
        writer.open_tag_with_attributes("a")
            .write_attribute("href", "/index.html")
            .write_attribute("class", "site-name")
            .end();
        writer.write_inner_text(m_site.name);
        writer.close_tag("a");

        for (const Navigation_Entry& entry : m_navigation) {
            auto attributes = writer.open_tag_with_attributes("a");
            attributes.write_attribute("href", href_of_route(entry.route));
            if (entry.route == current.route) {
                attributes.write_attribute("class", "active");
                attributes.write_attribute("aria-current", "page");
            }
            attributes.end();
            writer.write_inner_text(entry.title);
            writer.close_tag("a");
        }
        writer.close_tag("nav");
    }
};

} // namespace

Extracted_Site extract_site(const Document& document)
{
    Extracted_Site result;
    for (const ast::Block& block : document.blocks) {
        const auto* const site = std::get_if<ast::Site>(&block);
        if (!site || result.config) {
            result.loose_blocks.push_back(&block);
            continue;
        }
        result.config = make_site_config(*site);
        result.pages = order_pages(*site);
    }

    if (!result.config) {
        return result;
    }
    for (Size i = 0; i < result.pages.size(); ++i) {
        const ast::Page& page = *result.pages[i];
        result.navigation.push_back({
            .id = page.attributes.get_text("id").value_or(page.route),
            .title = navigation_title(page, *result.config),
            .route = page.route,
            .position = i,
        });
    }
    return result;
}

std::string output_path_of_route(std::string_view route)
{
    std::string result;
    while (!route.empty()) {
        const Size slash = route.find('/');
        const std::string_view segment = route.substr(0, slash);
        route = slash == std::string_view::npos ? std::string_view {} : route.substr(slash + 1);
        if (segment.empty() || segment == "." || segment == "..") {
            continue;
        }
        result += segment;
        result += '/';
    }
    result += "index.html";
    return result;
}

std::string href_of_route(std::string_view route)
{
    return "/" + output_path_of_route(route);
}

Size Rendered_Site::cancelled_count() const noexcept
{
    return Size(std::ranges::count(pages, Page_Status::cancelled, &Rendered_Page::status));
}

Rendered_Site render_site(const Document& document,
                          const Render_Config& config,
                          const Markdown_Engine& engine,
                          std::stop_token stop_token)
{
    Extracted_Site site = extract_site(document);
    if (!site.config) {
        return {};
    }
    if (config.max_pages != 0 && site.pages.size() > config.max_pages) {
        site.pages.resize(config.max_pages);
        site.navigation.resize(config.max_pages);
    }

    Render_Config page_config = config;
    page_config.full_page = true;
    if (site.config->theme) {
        page_config.theme = theme_by_name(*site.config->theme).value_or(config.theme);
    }

    Site_Renderer renderer { .m_config = page_config,
                             .m_engine = engine,
                             .m_site = *site.config,
                             .m_navigation = site.navigation,
                             .m_overrides = {} };
    collect_style_overrides(renderer.m_overrides, site.config->properties);
    for (const ast::Block* block : site.loose_blocks) {
        if (const auto* const style = std::get_if<ast::Style>(block)) {
            collect_style_overrides(renderer.m_overrides, style->properties);
        }
    }

    Rendered_Site result;
    result.pages.resize(site.pages.size());
    for (Size i = 0; i < site.pages.size(); ++i) {
        result.pages[i].route = site.pages[i]->route;
        result.pages[i].path = output_path_of_route(site.pages[i]->route);
        result.pages[i].title = page_title(*site.pages[i], *site.config);
    }

    // Every worker claims the next page until all pages are claimed or a stop is requested.
    // Each page is written by exactly one worker, so the results need no synchronization.
    std::atomic<Size> next_page = 0;
    std::vector<std::exception_ptr> errors(site.pages.size());
    const auto work = [&] {
        while (!stop_token.stop_requested()) {
            const Size i = next_page.fetch_add(1, std::memory_order_relaxed);
            if (i >= site.pages.size()) {
                return;
            }
            try {
                renderer.render_page(result.pages[i], *site.pages[i]);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        }
    };

    Size worker_count = config.worker_count != 0
        ? config.worker_count
        : std::max(Size(std::thread::hardware_concurrency()), Size(1));
    worker_count = std::min(worker_count, site.pages.size());

    if (worker_count <= 1) {
        work();
    }
    else {
        std::vector<std::jthread> workers;
        workers.reserve(worker_count);
        for (Size i = 0; i < worker_count; ++i) {
            workers.emplace_back(work);
        }
    }

    for (const std::exception_ptr& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    result.navigation = std::move(site.navigation);
    return result;
}

} // namespace surfdoc
