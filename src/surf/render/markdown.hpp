#ifndef SURFDOC_SURF_RENDER_MARKDOWN_HPP
#define SURFDOC_SURF_RENDER_MARKDOWN_HPP

#include <span>
#include <string>

#include "surf/fwd.hpp"
#include "surf/render/render_config.hpp"

namespace surfdoc {

/// @brief Degrades a sequence of blocks into plain CommonMark.
/// Blocks are separated by a blank line; there is no trailing line break.
void render_markdown_blocks(std::string& out, std::span<const ast::Block> blocks);

/// @brief Degrades `document` into plain CommonMark which can be read without SurfDoc tooling.
/// Front matter, if any, is re-emitted as a leading `---` block.
/// Directives with unrecognized tags are reproduced exactly as written.
/// Markdown output currently has no options, so `config` only keeps the interface of all
/// renderers alike.
[[nodiscard]] std::string render_markdown(const Document& document, const Render_Config& config);

} // namespace surfdoc

#endif
