#ifndef SURFDOC_DIAGNOSTICS_HPP
#define SURFDOC_DIAGNOSTICS_HPP

#include <iosfwd>
#include <span>
#include <string_view>

#include "common/assert.hpp"
#include "common/fwd.hpp"

#include "surf/fwd.hpp"

namespace surfdoc {

/// @brief Returns the line that contains the given index.
/// @param source the source string
/// @param index the index within the source string, in range `[0, source.size()]`
/// @return A line which contains the given `index`, without line terminator.
[[nodiscard]] std::string_view find_line(std::string_view source, Size index);

/// @brief Prints the location of the file nicely formatted.
/// @param out the string to write to
/// @param file the file
void print_location_of_file(Code_String& out, std::string_view file);

/// @brief Prints a position within a file, consisting of the file name and line/column.
/// @param out the string to write to
/// @param file the file
/// @param pos the position within the file
/// @param colon_suffix if `true`, appends a `:` to the string as part of the same token
void print_file_position(Code_String& out,
                         std::string_view file,
                         const Local_Source_Position& pos,
                         bool colon_suffix = true);

/// @brief Prints the contents of the affected line within `source` as well as position indicators
/// which show the span which is affected by some diagnostic.
/// @param out the string to write to
/// @param source the document source
/// @param pos the affected span; only the part on its first line is indicated
void print_affected_line(Code_String& out, std::string_view source, const Local_Source_Span& pos);

/// @brief Prints a diagnostic, such as
/// ```
/// doc.surf:3:1: error: Directive 'metric' requires the attribute 'value'. [SD004]
///      3 | ::metric[label=Users]
///        | ^~~~~~~~~~~~~~~~~~~~~
/// ```
/// followed by a note for the related span, if any.
void print_diagnostic(Code_String& out,
                      std::string_view file,
                      std::string_view source,
                      const Diagnostic& diagnostic);

/// @brief Prints a summary line such as `2 errors, 1 warning`.
void print_diagnostic_summary(Code_String& out, std::span<const Diagnostic> diagnostics);

void print_assertion_error(Code_String& out, const Assertion_Error& error);

void print_io_error(Code_String& out, std::string_view file, IO_Error_Code error);

struct AST_Formatting_Options {
    int indent_width;
    int max_node_text_length;
};

/// @brief Prints the block tree of `document`, one node per line, with attributes below each
/// directive.
void print_ast(Code_String& out, const Document& document, AST_Formatting_Options options);

void print_internal_error_notice(Code_String& out);

std::ostream& print_code_string(std::ostream& out, const Code_String& string, bool colors);

} // namespace surfdoc

#endif
