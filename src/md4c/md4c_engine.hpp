#ifndef SURFDOC_MD4C_MD4C_ENGINE_HPP
#define SURFDOC_MD4C_MD4C_ENGINE_HPP

#include "surf/render/markdown_engine.hpp"

namespace surfdoc {

/// @brief A `Markdown_Engine` which converts prose with md4c.
/// Tables, strikethrough and task lists are enabled in addition to CommonMark.
/// Raw HTML in the prose is passed through, like in any CommonMark renderer.
struct MD4C_Markdown_Engine final : Markdown_Engine {
    void to_html(Code_String& out, std::string_view markdown) const override;
};

} // namespace surfdoc

#endif
