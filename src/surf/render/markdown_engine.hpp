#ifndef SURFDOC_SURF_RENDER_MARKDOWN_ENGINE_HPP
#define SURFDOC_SURF_RENDER_MARKDOWN_ENGINE_HPP

#include <string_view>

#include "common/fwd.hpp"

namespace surfdoc {

/// @brief Converts CommonMark prose to HTML.
/// Prose between directives is opaque to the document tree; only an engine knows how to turn it
/// into markup.
/// Implementations shall be safe to use from multiple threads at once.
struct Markdown_Engine {
    virtual ~Markdown_Engine() = default;

    /// @brief Appends the HTML for `markdown` to `out`.
    virtual void to_html(Code_String& out, std::string_view markdown) const = 0;
};

} // namespace surfdoc

#endif
