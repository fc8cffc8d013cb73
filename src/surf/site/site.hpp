#ifndef SURFDOC_SURF_SITE_SITE_HPP
#define SURFDOC_SURF_SITE_SITE_HPP

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "surf/ast.hpp"
#include "surf/fwd.hpp"

namespace surfdoc {

inline constexpr std::string_view default_site_name = "SurfDoc Site";

/// @brief Site-wide settings taken from the properties of a `site` block.
struct Site_Config {
    std::optional<std::string> domain;
    std::string name { default_site_name };
    std::optional<std::string> tagline;
    std::optional<std::string> theme;
    std::optional<std::string> accent;
    std::optional<std::string> font;
    std::vector<ast::Property> properties;
};

/// @brief One entry of the navigation index of a site.
struct Navigation_Entry {
    /// @brief The `id` attribute of the page, or its route.
    std::string id;
    /// @brief The `title` attribute of the page, or a title derived from its route.
    std::string title;
    std::string route;
    /// @brief The zero-based position in navigation order.
    Size position;

    [[nodiscard]] friend bool operator==(const Navigation_Entry&, const Navigation_Entry&)
        = default;
};

/// @brief The parts of a document which make up a site.
/// The pointers refer into the document which was passed to `extract_site`.
struct Extracted_Site {
    /// @brief The settings of the first top-level `site` block, or `std::nullopt` if there is none.
    std::optional<Site_Config> config;
    /// @brief The direct pages of the site, in navigation order.
    std::vector<const ast::Page*> pages;
    /// @brief Top-level blocks other than the `site` block.
    std::vector<const ast::Block*> loose_blocks;
    /// @brief One entry per element of `pages`.
    std::vector<Navigation_Entry> navigation;
};

[[nodiscard]] Extracted_Site extract_site(const Document& document);

/// @brief Returns the path of the file for a page route, relative to the output directory.
/// For example, `/` maps to `index.html` and `/docs/intro` to `docs/intro/index.html`.
/// Empty, `.` and `..` segments are dropped so that pages always stay within the output
/// directory.
[[nodiscard]] std::string output_path_of_route(std::string_view route);

/// @brief Returns the link target of a route, such as `/about/index.html`.
[[nodiscard]] std::string href_of_route(std::string_view route);

enum struct Page_Status : Default_Underlying {
    rendered,
    /// @brief Rendering was cancelled before this page was started.
    cancelled
};

struct Rendered_Page {
    std::string route;
    /// @brief See `output_path_of_route`.
    std::string path;
    std::string title;
    Page_Status status = Page_Status::cancelled;
    /// @brief The complete HTML document, or an empty string if the page was cancelled.
    std::string html;
};

struct Rendered_Site {
    /// @brief The pages in navigation order.
    std::vector<Rendered_Page> pages;
    std::vector<Navigation_Entry> navigation;

    [[nodiscard]] Size cancelled_count() const noexcept;
};

/// @brief Renders every page of the site in `document` as a complete HTML document with
/// shared navigation and footer.
/// Pages are rendered on `config.worker_count` threads.
/// Cancellation is checked before each page starts; pages which were not started are reported as
/// cancelled, and pages in progress are finished.
/// If the document contains no site, the result is empty.
/// @param config the shared configuration; `max_pages` limits the number of pages
/// @param engine the markdown engine, which is used from multiple threads at once
[[nodiscard]] Rendered_Site render_site(const Document& document,
                                        const Render_Config& config,
                                        const Markdown_Engine& engine,
                                        std::stop_token stop_token = {});

} // namespace surfdoc

#endif
