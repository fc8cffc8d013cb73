#ifndef SURFDOC_SURF_PARSING_BUILD_HPP
#define SURFDOC_SURF_PARSING_BUILD_HPP

#include <string_view>
#include <vector>

#include "common/source_position.hpp"

#include "surf/ast.hpp"
#include "surf/diagnostic.hpp"

namespace surfdoc {

/// @brief Builds the blocks of a document or of a directive body.
/// `text` is scanned, the attributes of each directive are parsed, and each directive is
/// turned into the block of its type.
/// Bodies of container directives are built recursively.
///
/// Building never fails: missing or invalid attributes fall back to defaults, and checking them
/// is left to `validate`.
/// Only lexical problems (unterminated directives, malformed or duplicate attributes) are
/// appended to `diagnostics`.
/// @param text the text to build from
/// @param base the position of `text` within the document
/// @param diagnostics the list to which diagnostics are appended
[[nodiscard]] std::vector<ast::Block>
build_blocks(std::string_view text, Local_Source_Position base, std::vector<Diagnostic>& diagnostics);

/// @brief Parses a pipe table such as `| a | b |`.
/// Blank lines and separator rows (`|---|:--:|`) are skipped and the first row is the header.
/// `\|` denotes a literal pipe within a cell.
[[nodiscard]] ast::Table parse_pipe_table(std::string_view text, Local_Source_Position base);

/// @brief Parses comma-separated values, where the first row is the header.
/// Fields may be quoted with `"`, and `""` within a quoted field denotes a quote.
[[nodiscard]] ast::Table parse_csv_table(std::string_view text, Local_Source_Position base);

} // namespace surfdoc

#endif
