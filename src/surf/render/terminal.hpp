#ifndef SURFDOC_SURF_RENDER_TERMINAL_HPP
#define SURFDOC_SURF_RENDER_TERMINAL_HPP

#include <span>
#include <string>

#include "common/fwd.hpp"

#include "surf/fwd.hpp"

namespace surfdoc {

/// @brief Renders blocks for display in a terminal.
/// The output uses box drawing characters and tags styled parts with `terminal_*` spans;
/// whether these turn into ANSI colors is decided when the string is printed.
void render_terminal_blocks(Code_String& out,
                            std::span<const ast::Block> blocks,
                            const Render_Config& config);

void render_terminal(Code_String& out, const Document& document, const Render_Config& config);

/// @brief Renders `document` for a terminal and converts the result to text, containing ANSI
/// escape sequences if and only if `config.colors` is set.
[[nodiscard]] std::string render_terminal(const Document& document, const Render_Config& config);

} // namespace surfdoc

#endif
