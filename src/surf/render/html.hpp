#ifndef SURFDOC_SURF_RENDER_HTML_HPP
#define SURFDOC_SURF_RENDER_HTML_HPP

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "common/fwd.hpp"

#include "surf/fwd.hpp"
#include "surf/render/render_config.hpp"

namespace surfdoc {

namespace ast {

struct Property;

} // namespace ast

struct HTML_Writer;

/// @brief CSS custom-property overrides collected from `style` and `site` properties.
struct Style_Overrides {
    /// @brief Declarations such as `--accent: #ff0000;`, without surrounding `:root { }`.
    std::string declarations;
    /// @brief URLs of web fonts which the selected font presets require, without duplicates.
    std::vector<std::string_view> font_imports;

    [[nodiscard]] bool empty() const noexcept
    {
        return declarations.empty() && font_imports.empty();
    }
};

/// @brief Adds the overrides for `accent`, `font`, `heading-font` and `body-font` among
/// `properties` to `out`.
/// Values which are not safe to embed in a stylesheet and unknown font presets are ignored.
void collect_style_overrides(Style_Overrides& out, std::span<const ast::Property> properties);

/// @brief Writes the overrides as `<style>` elements, or nothing if `overrides` is empty.
void write_style_overrides(HTML_Writer& writer, const Style_Overrides& overrides);

/// @brief Returns the embedded stylesheet for the given theme.
[[nodiscard]] std::string html_stylesheet(Theme theme);

/// @brief Writes everything of a full page up to and including the opening `<body>` tag.
/// @param title the contents of the `<title>` element
/// @param extra_css CSS which is appended to the embedded stylesheet
void open_html_page(HTML_Writer& writer,
                    const Render_Config& config,
                    std::string_view title,
                    std::string_view extra_css = {});

/// @brief Closes the `<body>` and `<html>` tags opened by `open_html_page`.
void close_html_page(HTML_Writer& writer);

/// @brief Renders a sequence of blocks as HTML, without any surrounding markup.
void render_html_blocks(HTML_Writer& writer,
                        std::span<const ast::Block> blocks,
                        const Markdown_Engine& engine);

/// @brief Renders `document` as an HTML fragment or, if `config.full_page` is set, as a complete
/// HTML document.
/// All user text is escaped; prose is converted by `engine`.
void render_html(Code_String& out,
                 const Document& document,
                 const Render_Config& config,
                 const Markdown_Engine& engine);

} // namespace surfdoc

#endif
