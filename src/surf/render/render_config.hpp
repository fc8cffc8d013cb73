#ifndef SURFDOC_SURF_RENDER_RENDER_CONFIG_HPP
#define SURFDOC_SURF_RENDER_RENDER_CONFIG_HPP

#include <optional>
#include <string>
#include <string_view>

#include "common/config.hpp"

namespace surfdoc {

enum struct Theme : Default_Underlying { light, dark };

enum struct Stylesheet_Mode : Default_Underlying {
    /// @brief The stylesheet is embedded in a `<style>` element.
    inline_css,
    /// @brief No stylesheet is emitted; the caller supplies one.
    omit
};

[[nodiscard]] std::optional<Theme> theme_by_name(std::string_view name) noexcept;

[[nodiscard]] std::string_view theme_name(Theme theme) noexcept;

/// @brief Options which affect rendering.
/// The defaults produce an HTML fragment with embedded stylesheet, and plain terminal output.
struct Render_Config {
    Theme theme = Theme::light;
    /// @brief If `true`, terminal output contains ANSI escape sequences.
    bool colors = false;
    Stylesheet_Mode stylesheet = Stylesheet_Mode::inline_css;
    /// @brief If `true`, HTML output is a complete document rather than a fragment.
    bool full_page = false;

    std::string lang = "en";
    /// @brief The page title; if empty, the `title` of the front matter is used.
    std::string title;
    /// @brief The path of the source document, referenced from a full page.
    std::string source_path;
    std::string canonical_url;
    std::string description;

    /// @brief The width of terminal output, in columns.
    Size terminal_width = 80;
    /// @brief The maximum number of pages which are rendered for a site, or zero for no limit.
    Size max_pages = 0;
    /// @brief The number of threads used for rendering a site; zero means one per hardware
    /// thread.
    Size worker_count = 0;
};

} // namespace surfdoc

#endif
