#ifndef SURFDOC_SURF_PARSING_SCAN_HPP
#define SURFDOC_SURF_PARSING_SCAN_HPP

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "common/source_position.hpp"

#include "surf/diagnostic.hpp"

namespace surfdoc {

/// @brief A run of lines between directives.
/// Leading and trailing blank lines are not part of the span.
struct Prose_Span {
    std::string_view text;
    Local_Source_Span pos;
};

/// @brief A directive from its opening fence to its closing fence.
/// All views point into the scanned text.
struct Directive_Span {
    /// @brief The tag as written, e.g. `Callout`.
    std::string_view tag;
    Size colon_count;
    /// @brief The opening line, without line terminator.
    std::string_view opening_line;
    /// @brief The closing line, or an empty string if there is none.
    std::string_view closing_line;
    /// @brief The text between `[` and `]`, or `std::nullopt` if there are no brackets.
    std::optional<std::string_view> attribute_text;
    Local_Source_Position attribute_pos;
    /// @brief The lines between the opening and closing fence.
    std::string_view body;
    Local_Source_Position body_pos;
    /// @brief The span of the opening line.
    Local_Source_Span header_pos;
    /// @brief The span from the opening fence to the end of the closing fence.
    Local_Source_Span pos;
    /// @brief `false` if the directive ran to the end of the text without closing fence.
    bool is_terminated;
};

using Scanned_Span = std::variant<Prose_Span, Directive_Span>;

/// @brief Splits `text` into prose and directive spans.
///
/// A directive opens at a line `::tag[attributes]` (two or more colons) and closes at a line
/// consisting of the same number of colons.
/// Directives whose body holds nested blocks track nested directives, so that inner
/// closing fences are not mistaken for their own; text-only directives close at the first
/// matching fence; attribute-only directives such as `metric` may stand on a single line.
/// Nested directives are not returned separately; they are part of the body of their
/// outermost directive, which is meant to be scanned again by the caller.
///
/// Unterminated directives are diagnosed and extend to the end of `text`.
/// @param text the text to scan
/// @param base the position of `text` within the document
/// @param diagnostics the list to which diagnostics are appended
[[nodiscard]] std::vector<Scanned_Span>
scan(std::string_view text, Local_Source_Position base, std::vector<Diagnostic>& diagnostics);

} // namespace surfdoc

#endif
