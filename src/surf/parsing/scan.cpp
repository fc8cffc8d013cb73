#include <algorithm>
#include <string>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "surf/block_type.hpp"
#include "surf/parsing/scan.hpp"

namespace surfdoc {

namespace {

struct Line {
    /// @brief The contents of the line, without `\n` or a trailing `\r`.
    std::string_view text;
    Size begin;

    [[nodiscard]] Size end() const
    {
        return begin + text.length();
    }
};

[[nodiscard]] std::vector<Line> split_lines(std::string_view text)
{
    std::vector<Line> result;
    Size begin = 0;
    while (begin < text.length()) {
        const Size newline = text.find('\n', begin);
        const Size end = newline == std::string_view::npos ? text.length() : newline;
        std::string_view line = text.substr(begin, end - begin);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        result.push_back({ line, begin });
        begin = end + 1;
    }
    return result;
}

/// @brief Returns the number of colons if `line` is a closing fence, i.e. only colons.
[[nodiscard]] Size match_closing_fence(std::string_view line)
{
    line = trim(line);
    if (line.length() < 2 || line.find_first_not_of(':') != std::string_view::npos) {
        return 0;
    }
    return line.length();
}

struct Opening_Fence {
    Size colon_count;
    std::string_view tag;
    std::optional<std::string_view> attribute_text;
    /// @brief Offset of the attribute text within the line, or of the end of the tag.
    Size attribute_offset;
    bool is_bracket_closed;
};

/// @brief Returns the end of an attribute list which starts right after `[`.
/// Brackets inside quoted strings and list values do not end the attribute list.
[[nodiscard]] Size find_attribute_list_end(std::string_view text)
{
    bool in_string = false;
    int depth = 0;
    for (Size i = 0; i < text.length(); ++i) {
        const char c = text[i];
        if (in_string) {
            if (c == '\\') {
                ++i;
            }
            else if (c == '"') {
                in_string = false;
            }
        }
        else if (c == '"') {
            in_string = true;
        }
        else if (c == '[') {
            ++depth;
        }
        else if (c == ']') {
            if (depth == 0) {
                return i;
            }
            --depth;
        }
    }
    return std::string_view::npos;
}

[[nodiscard]] std::optional<Opening_Fence> match_opening_fence(std::string_view line)
{
    const Size indent = std::min(line.find_first_not_of(" \t"), line.length());
    const std::string_view rest = line.substr(indent);
    const Size colons = std::min(rest.find_first_not_of(':'), rest.length());
    if (colons < 2 || colons == rest.length() || !is_ascii_alpha(rest[colons])) {
        return {};
    }
    const Size tag_length = match_name(rest.substr(colons));
    SURFDOC_ASSERT(tag_length != 0);

    const Size after_tag = indent + colons + tag_length;
    Opening_Fence result { .colon_count = colons,
                           .tag = rest.substr(colons, tag_length),
                           .attribute_text = {},
                           .attribute_offset = after_tag,
                           .is_bracket_closed = true };

    if (after_tag < line.length() && line[after_tag] == '[') {
        const std::string_view inside = line.substr(after_tag + 1);
        const Size end = find_attribute_list_end(inside);
        result.attribute_offset = after_tag + 1;
        if (end == std::string_view::npos) {
            result.attribute_text = trim_right(inside);
            result.is_bracket_closed = false;
        }
        else {
            result.attribute_text = inside.substr(0, end);
        }
    }
    return result;
}

struct Open_Directive {
    Size line;
    Opening_Fence fence;
    Directive_Content_Type content;
};

[[nodiscard]] Directive_Content_Type content_type_of_tag(std::string_view tag)
{
    const std::optional<Block_Type> type = block_type_by_tag(tag);
    return type ? block_type_content_type(*type) : Directive_Content_Type::blocks;
}

struct [[nodiscard]] Scanner {
private:
    std::string_view m_text;
    Local_Source_Position m_base;
    std::vector<Diagnostic>& m_diagnostics;
    std::vector<Line> m_lines;
    std::vector<Scanned_Span> m_result;

    std::vector<Open_Directive> m_stack;
    /// @brief First and last non-blank line of the prose which is currently being accumulated.
    std::optional<Size> m_prose_first;
    Size m_prose_last = 0;

public:
    Scanner(std::string_view text, Local_Source_Position base, std::vector<Diagnostic>& diagnostics)
        : m_text(text)
        , m_base(base)
        , m_diagnostics(diagnostics)
        , m_lines(split_lines(text))
    {
    }

    std::vector<Scanned_Span> operator()() &&
    {
        for (Size i = 0; i < m_lines.size(); ++i) {
            i = scan_line(i);
        }
        flush_prose();
        if (!m_stack.empty()) {
            emit_unterminated();
        }
        return std::move(m_result);
    }

private:
    // UTILITIES ===================================================================================

    [[nodiscard]] Local_Source_Position position_of_offset(Size line, Size offset) const
    {
        const Local_Source_Position local { .line = line,
                                            .column = offset - m_lines[line].begin,
                                            .begin = offset };
        return local.relative_to(m_base);
    }

    [[nodiscard]] Local_Source_Span span_of_lines(Size first, Size last) const
    {
        return { position_of_offset(first, m_lines[first].begin),
                 m_lines[last].end() - m_lines[first].begin };
    }

    /// @brief Returns the text of the lines in `[first, last)`, without the final line break.
    [[nodiscard]] std::string_view text_of_lines(Size first, Size last) const
    {
        if (first >= last) {
            return first < m_lines.size() ? m_text.substr(m_lines[first].begin, 0)
                                          : m_text.substr(m_text.length());
        }
        return m_text.substr(m_lines[first].begin, m_lines[last - 1].end() - m_lines[first].begin);
    }

    [[nodiscard]] Local_Source_Position body_position(Size first) const
    {
        if (first < m_lines.size()) {
            return position_of_offset(first, m_lines[first].begin);
        }
        // An empty body at the end of the text starts on the line after the opening fence.
        const Local_Source_Position local { .line = m_lines.size(),
                                            .column = 0,
                                            .begin = m_text.length() };
        return local.relative_to(m_base);
    }

    // SCANNING ====================================================================================

    /// @brief Processes the line at index `i`.
    /// @return the index of the last line which was consumed
    Size scan_line(Size i)
    {
        const std::string_view line = m_lines[i].text;

        if (const Size colons = match_closing_fence(line)) {
            if (try_close(i, colons)) {
                return i;
            }
        }
        else if (std::optional<Opening_Fence> fence = match_opening_fence(line)) {
            if (m_stack.empty() || m_stack.back().content == Directive_Content_Type::blocks) {
                return open(i, *fence);
            }
            return i;
        }

        if (m_stack.empty() && !is_blank(line)) {
            if (!m_prose_first) {
                m_prose_first = i;
            }
            m_prose_last = i;
        }
        return i;
    }

    /// @brief Attempts to close an open directive with a fence of `colons` colons.
    /// @return `true` if the line was consumed as a closing fence
    bool try_close(Size i, Size colons)
    {
        if (m_stack.empty()) {
            return false;
        }
        // Text-only directives cannot contain other directives, so only their own fence matters.
        if (m_stack.back().content != Directive_Content_Type::blocks) {
            if (m_stack.back().fence.colon_count != colons) {
                return true;
            }
            close(m_stack.size() - 1, i);
            return true;
        }
        for (Size k = m_stack.size(); k-- > 0;) {
            if (m_stack[k].fence.colon_count == colons) {
                close(k, i);
                return true;
            }
        }
        // A stray fence inside an open directive is part of its body.
        return true;
    }

    void close(Size stack_index, Size closing_line)
    {
        if (stack_index != 0) {
            // Inner directives are emitted when the body of the outermost one is scanned again.
            m_stack.resize(stack_index);
            return;
        }
        const Open_Directive directive = m_stack.front();
        m_stack.clear();
        emit(directive, directive.line + 1, closing_line, closing_line);
    }

    Size open(Size i, const Opening_Fence& fence)
    {
        const Directive_Content_Type content = content_type_of_tag(fence.tag);

        if (content == Directive_Content_Type::nothing) {
            if (!m_stack.empty()) {
                return i;
            }
            flush_prose();
            // An attribute-only directive claims a closing fence only if it directly follows.
            Size next = i + 1;
            while (next < m_lines.size() && is_blank(m_lines[next].text)) {
                ++next;
            }
            const bool has_fence
                = next < m_lines.size() && match_closing_fence(m_lines[next].text) == fence.colon_count;
            const Open_Directive directive { i, fence, content };
            if (has_fence) {
                emit(directive, i + 1, i + 1, next);
                return next;
            }
            emit(directive, i + 1, i + 1, std::nullopt);
            return i;
        }

        if (m_stack.empty()) {
            flush_prose();
        }
        m_stack.push_back({ i, fence, content });
        return i;
    }

    void flush_prose()
    {
        if (!m_prose_first) {
            return;
        }
        const Size first = *m_prose_first;
        m_result.push_back(Prose_Span { .text = text_of_lines(first, m_prose_last + 1),
                                        .pos = span_of_lines(first, m_prose_last) });
        m_prose_first.reset();
    }

    /// @brief Emits a directive.
    /// @param body_first the first line of the body
    /// @param body_last one past the last line of the body
    /// @param closing_line the closing fence, if any
    void emit(const Open_Directive& open,
              Size body_first,
              Size body_last,
              std::optional<Size> closing_line)
    {
        const Line& opening = m_lines[open.line];
        const Local_Source_Span header_pos = span_of_lines(open.line, open.line);
        const Size last_line = closing_line ? *closing_line : std::max(open.line, body_last - 1);

        Directive_Span result {
            .tag = open.fence.tag,
            .colon_count = open.fence.colon_count,
            .opening_line = opening.text,
            .closing_line = closing_line ? m_lines[*closing_line].text : std::string_view {},
            .attribute_text = open.fence.attribute_text,
            .attribute_pos = position_of_offset(open.line,
                                                opening.begin + open.fence.attribute_offset),
            .body = text_of_lines(body_first, body_last),
            .body_pos = body_position(body_first),
            .header_pos = header_pos,
            .pos = span_of_lines(open.line, last_line),
            .is_terminated = closing_line.has_value()
                || open.content == Directive_Content_Type::nothing,
        };

        if (!open.fence.is_bracket_closed) {
            m_diagnostics.push_back(
                { .code = Diagnostic_Code::malformed_attribute,
                  .message = "Missing ']' at the end of the attribute list of '"
                      + std::string(open.fence.tag) + "'.",
                  .pos = { position_of_offset(open.line, opening.end()), 0 } });
        }
        m_result.push_back(std::move(result));
    }

    void emit_unterminated()
    {
        const Open_Directive directive = m_stack.front();
        m_stack.clear();
        m_diagnostics.push_back(
            { .code = Diagnostic_Code::unterminated_directive,
              .message = "Directive '" + std::string(directive.fence.tag)
                  + "' is never closed. Expected a line '"
                  + std::string(directive.fence.colon_count, ':')
                  + "'; the rest of the document is treated as its body.",
              .pos = span_of_lines(directive.line, directive.line) });
        emit(directive, directive.line + 1, m_lines.size(), std::nullopt);
    }
};

} // namespace

std::vector<Scanned_Span>
scan(std::string_view text, Local_Source_Position base, std::vector<Diagnostic>& diagnostics)
{
    return Scanner { text, base, diagnostics }();
}

} // namespace surfdoc
