#ifndef SURFDOC_SOURCE_POSITION_HPP
#define SURFDOC_SOURCE_POSITION_HPP

#include "common/config.hpp"

namespace surfdoc {

/// Represents a position in a source file.
/// Lines and columns are zero-based; columns count bytes, not code points.
struct Local_Source_Position {
    /// Line number.
    Size line;
    /// Column number.
    Size column;
    /// First index in the source file that is part of the syntactical element.
    Size begin;

    [[nodiscard]] friend constexpr auto operator<=>(Local_Source_Position, Local_Source_Position)
        = default;

    [[nodiscard]] constexpr Local_Source_Position to_right(Size offset) const
    {
        return { .line = line, .column = column + offset, .begin = begin + offset };
    }

    /// @brief Returns this position relative to `base`.
    /// This is used when a directive body is scanned as if it was a document of its own:
    /// positions within the body are then translated back into the enclosing document.
    [[nodiscard]] constexpr Local_Source_Position relative_to(Local_Source_Position base) const
    {
        return { .line = base.line + line,
                 .column = line == 0 ? base.column + column : column,
                 .begin = base.begin + begin };
    }
};

/// Represents a range of bytes in a source file, starting at some position.
/// The range may span multiple lines, in which case `line` and `column` refer to its start.
struct Local_Source_Span : Local_Source_Position {
    Size length;

    [[nodiscard]] friend constexpr auto operator<=>(Local_Source_Span, Local_Source_Span) = default;

    /// @brief Returns a span with the same properties except that the length is `l`.
    [[nodiscard]] constexpr Local_Source_Span with_length(Size l) const
    {
        return { Local_Source_Position { *this }, l };
    }

    [[nodiscard]] constexpr Local_Source_Span relative_to(Local_Source_Position base) const
    {
        return { Local_Source_Position::relative_to(base), length };
    }

    [[nodiscard]] constexpr bool empty() const
    {
        return length == 0;
    }

    /// @brief Returns the one-past-the-end position in the source.
    [[nodiscard]] constexpr Size end() const
    {
        return begin + length;
    }
};

} // namespace surfdoc

#endif
