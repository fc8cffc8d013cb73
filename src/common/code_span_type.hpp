#ifndef SURFDOC_CODE_SPAN_TYPE_HPP
#define SURFDOC_CODE_SPAN_TYPE_HPP

#include "common/fwd.hpp"

namespace surfdoc {

/// @brief The type of a span in highlighted output.
/// Diagnostics, the HTML writer and the terminal renderer all produce `Code_String`s, and
/// their spans fall into the categories listed here.
enum struct Code_Span_Type : Default_Underlying {
    text,

    diagnostic_text,
    diagnostic_error_text,
    diagnostic_code_position,
    diagnostic_error,
    diagnostic_warning,
    diagnostic_note,
    diagnostic_line_number,
    diagnostic_punctuation,
    diagnostic_position_indicator,
    diagnostic_code_citation,
    diagnostic_internal_error_notice,
    diagnostic_diagnostic_id,
    diagnostic_tag,
    diagnostic_attribute,
    diagnostic_escape,

    html_preamble,
    html_comment,
    html_tag_bracket,
    html_tag_identifier,
    html_attribute_key,
    html_attribute_equal,
    html_attribute_value,
    html_inner_text,

    terminal_heading,
    terminal_border,
    terminal_label,
    terminal_emphasis,
    terminal_dim,
    terminal_code,
    terminal_link,
    terminal_positive,
    terminal_negative,
    terminal_warning,
    terminal_info,
};

} // namespace surfdoc

#endif
