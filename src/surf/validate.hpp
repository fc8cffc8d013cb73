#ifndef SURFDOC_SURF_VALIDATE_HPP
#define SURFDOC_SURF_VALIDATE_HPP

#include <vector>

#include "surf/ast.hpp"
#include "surf/diagnostic.hpp"

namespace surfdoc {

/// @brief The maximum number of nested containers (tabs, columns, site, page).
inline constexpr Size max_nesting_depth = 6;

/// @brief Checks a document against the rules of all block types.
/// Validation does not modify the document, so it can be repeated with identical results.
/// @return the parse diagnostics of `document` followed by the semantic ones, all in canonical
/// order
[[nodiscard]] std::vector<Diagnostic> validate(const Document& document);

/// @brief Returns the pages which are direct children of `site` in navigation order.
/// Pages with an integer `order` come first in ascending order, followed by the pages without
/// one. Ties are broken by document order.
[[nodiscard]] std::vector<const ast::Page*> order_pages(const ast::Site& site);

} // namespace surfdoc

#endif
