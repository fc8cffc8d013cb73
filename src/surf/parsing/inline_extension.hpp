#ifndef SURFDOC_SURF_PARSING_INLINE_EXTENSION_HPP
#define SURFDOC_SURF_PARSING_INLINE_EXTENSION_HPP

#include <string>
#include <string_view>
#include <vector>

#include "surf/ast.hpp"

namespace surfdoc {

/// @brief Finds the inline extensions `:evidence[...]` and `:status[...]` within prose.
/// The brackets hold an attribute list, and an extension must end on the line where it starts.
/// Colons which are part of `::` never start an extension, and neither do colons within fenced
/// code blocks or code spans.
/// Extensions whose attribute list is malformed are left as plain text.
[[nodiscard]] std::vector<ast::Inline_Extension> scan_inline_extensions(std::string_view text);

/// @brief Returns the plain-text form of `extension`, such as `shipped` for a status or
/// `Gartner, tier 1` for evidence.
[[nodiscard]] std::string inline_extension_label(const ast::Inline_Extension& extension);

} // namespace surfdoc

#endif
