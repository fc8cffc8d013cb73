#ifndef SURFDOC_SURF_PARSING_ATTRIBUTE_PARSER_HPP
#define SURFDOC_SURF_PARSING_ATTRIBUTE_PARSER_HPP

#include <string_view>
#include <vector>

#include "surf/attribute.hpp"
#include "surf/diagnostic.hpp"

namespace surfdoc {

/// @brief Parses the text between the brackets of a directive header.
/// The grammar is a sequence of `key=value` pairs, separated by commas and/or whitespace.
/// A key without `=` is a flag which is `true`.
/// Values are quoted strings (with `\"` and `\\` escapes), numbers, `true` or `false`,
/// identifiers, lists of quoted strings such as `["a", "b"]`, or any other run of
/// non-separator characters, which is taken as a string.
///
/// This function never fails.
/// Syntax errors produce `malformed_attribute` diagnostics and parsing resumes at the next
/// separator; repeated keys produce `duplicate_attribute` diagnostics and the first occurrence is
/// kept.
/// @param text the text between `[` and `]`
/// @param pos the position of the first character of `text` in the document;
/// `text` is assumed not to contain line breaks
/// @param diagnostics the list to which diagnostics are appended
[[nodiscard]] Attribute_List parse_attributes(std::string_view text,
                                              Local_Source_Position pos,
                                              std::vector<Diagnostic>& diagnostics);

} // namespace surfdoc

#endif
