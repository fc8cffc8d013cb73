#include <algorithm>
#include <ostream>
#include <span>
#include <string>

#include "common/ansi.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/io_error.hpp"
#include "common/to_chars.hpp"

#include "surf/ast.hpp"
#include "surf/diagnostic.hpp"

namespace surfdoc {

namespace {

[[nodiscard]] std::string_view highlight_color_of(Code_Span_Type type)
{
    using enum Code_Span_Type;
    switch (type) {
    case text: return ansi::reset;

    case diagnostic_text:
    case diagnostic_code_citation:
    case diagnostic_punctuation: return ansi::reset;

    case diagnostic_code_position: return ansi::h_black;

    case diagnostic_error_text:
    case diagnostic_error: return ansi::h_red;

    case diagnostic_warning:
    case diagnostic_line_number: return ansi::h_yellow;

    case diagnostic_note: return ansi::h_white;

    case diagnostic_position_indicator: return ansi::h_green;

    case diagnostic_internal_error_notice: return ansi::h_yellow;

    case diagnostic_diagnostic_id: return ansi::h_black;

    case diagnostic_tag: return ansi::h_blue;

    case diagnostic_attribute: return ansi::h_magenta;

    case diagnostic_escape: return ansi::h_yellow;

    case html_preamble:
    case html_comment: return ansi::h_black;

    case html_tag_bracket: return ansi::black;

    case html_tag_identifier: return ansi::h_blue;

    case html_attribute_key: return ansi::h_cyan;

    case html_attribute_equal: return ansi::h_black;

    case html_attribute_value: return ansi::h_green;

    case html_inner_text: return ansi::reset;

    case terminal_heading: return ansi::bold;

    case terminal_border:
    case terminal_dim: return ansi::dim;

    case terminal_label: return ansi::h_white;

    case terminal_emphasis: return ansi::underline;

    case terminal_code: return ansi::cyan;

    case terminal_link: return ansi::h_blue;

    case terminal_positive: return ansi::h_green;

    case terminal_negative: return ansi::h_red;

    case terminal_warning: return ansi::h_yellow;

    case terminal_info: return ansi::h_cyan;
    }
    SURFDOC_ASSERT_UNREACHABLE("Unknown code span type.");
}

[[nodiscard]] std::string_view to_prose(IO_Error_Code e)
{
    using enum IO_Error_Code;
    switch (e) {
    case cannot_open: return "Failed to open file.";
    case read_error: return "I/O error occurred when reading from file.";
    case write_error: return "I/O error occurred when writing to file.";
    }
    SURFDOC_ASSERT_UNREACHABLE("Invalid error code.");
}

constexpr std::string_view error_prefix = "error:";
constexpr std::string_view warning_prefix = "warning:";
constexpr std::string_view note_prefix = "note:";

} // namespace

void print_file_position(Code_String& out,
                         std::string_view file,
                         const Local_Source_Position& pos,
                         bool suffix_colon)
{
    auto builder = out.build(Code_Span_Type::diagnostic_code_position);
    builder.append(file)
        .append(':')
        .append_integer(pos.line + 1)
        .append(':')
        .append_integer(pos.column + 1);
    if (suffix_colon) {
        builder.append(':');
    }
}

std::string_view find_line(std::string_view source, Size index)
{
    SURFDOC_ASSERT(index <= source.size());

    if (index == source.size() || source[index] == '\n') {
        // Special case for EOF positions, which may be past the end of a line,
        // and even past the end of the whole source, but only by a single character.
        // For such positions, we yield the currently ended line.
        if (index == 0 || source[index - 1] == '\n') {
            return {};
        }
        --index;
    }

    Size begin = source.rfind('\n', index);
    begin = begin != std::string_view::npos ? begin + 1 : 0;

    const Size end = std::min(source.find('\n', index), source.size());
    std::string_view line = source.substr(begin, end - begin);
    if (line.ends_with('\r')) {
        line.remove_suffix(1);
    }
    return line;
}

void print_location_of_file(Code_String& out, std::string_view file)
{
    out.build(Code_Span_Type::diagnostic_code_position).append(file).append(':');
}

void print_affected_line(Code_String& out, std::string_view source, const Local_Source_Span& pos)
{
    const std::string_view line = find_line(source, std::min(pos.begin, source.size()));

    const Characters line_chars = to_characters(pos.line + 1);
    constexpr Size pad_max = 6;
    const Size pad_length = pad_max - std::min(line_chars.length, Size { pad_max - 1 });
    out.append(pad_length, ' ');
    out.append_integer(pos.line + 1, Code_Span_Type::diagnostic_line_number);
    out.append(' ');
    out.append('|', Code_Span_Type::diagnostic_punctuation);
    out.append(' ');
    out.append(line, Code_Span_Type::diagnostic_code_citation);
    out.append('\n');

    const Size align_length = std::max(pad_max, line_chars.length + 1);
    out.append(align_length, ' ');
    out.append(' ');
    out.append('|', Code_Span_Type::diagnostic_punctuation);
    out.append(' ');
    const Size column = std::min(pos.column, line.length());
    out.append(column, ' ');
    // The indicator underlines the span, but never beyond the end of the line.
    const Size underline = std::min(pos.length, line.length() - column);
    {
        auto builder = out.build(Code_Span_Type::diagnostic_position_indicator);
        builder.append('^');
        if (underline > 1) {
            builder.append(std::string(underline - 1, '~'));
        }
    }
    out.append('\n');
}

void print_diagnostic(Code_String& out,
                      std::string_view file,
                      std::string_view source,
                      const Diagnostic& diagnostic)
{
    print_file_position(out, file, diagnostic.pos);
    out.append(' ');
    switch (diagnostic.severity()) {
    case Severity::error: out.append(error_prefix, Code_Span_Type::diagnostic_error); break;
    case Severity::warning: out.append(warning_prefix, Code_Span_Type::diagnostic_warning); break;
    }
    out.append(' ');
    out.append(diagnostic.message, Code_Span_Type::diagnostic_text);
    out.append(' ');
    out.build(Code_Span_Type::diagnostic_diagnostic_id)
        .append('[')
        .append(diagnostic_id(diagnostic.code))
        .append(']');
    out.append('\n');
    print_affected_line(out, source, diagnostic.pos);

    if (diagnostic.related) {
        print_file_position(out, file, *diagnostic.related);
        out.append(' ');
        out.append(note_prefix, Code_Span_Type::diagnostic_note);
        out.append(' ');
        out.append("Related location:", Code_Span_Type::diagnostic_text);
        out.append('\n');
        print_affected_line(out, source, *diagnostic.related);
    }
}

void print_diagnostic_summary(Code_String& out, std::span<const Diagnostic> diagnostics)
{
    const auto errors = Size(std::ranges::count_if(
        diagnostics, [](const Diagnostic& d) { return d.severity() == Severity::error; }));
    const Size warnings = diagnostics.size() - errors;

    out.append_integer(errors,
                       errors == 0 ? Code_Span_Type::diagnostic_text
                                   : Code_Span_Type::diagnostic_error);
    out.append(errors == 1 ? " error, " : " errors, ", Code_Span_Type::diagnostic_text);
    out.append_integer(warnings,
                       warnings == 0 ? Code_Span_Type::diagnostic_text
                                     : Code_Span_Type::diagnostic_warning);
    out.append(warnings == 1 ? " warning\n" : " warnings\n", Code_Span_Type::diagnostic_text);
}

void print_assertion_error(Code_String& out, const Assertion_Error& error)
{
    out.append("Assertion failed! ", Code_Span_Type::diagnostic_error);

    const std::string_view message = error.type == Assertion_Error_Type::expression
        ? "The following expression evaluated to 'false', but was expected to be 'true':"
        : "Code which must be unreachable has been reached.";
    out.append(message, Code_Span_Type::diagnostic_text);
    out.append("\n\n");

    const Local_Source_Position pos { .line = error.location.line(),
                                      .column = error.location.column(),
                                      .begin = {} };
    print_file_position(out, error.location.file_name(), pos);
    out.append(' ');
    out.append(error.message, Code_Span_Type::diagnostic_error_text);
    out.append("\n\n");
    print_internal_error_notice(out);
}

void print_io_error(Code_String& out, std::string_view file, IO_Error_Code error)
{
    print_location_of_file(out, file);
    out.append(' ');
    out.append(to_prose(error), Code_Span_Type::diagnostic_text);
    out.append('\n');
}

namespace {

struct AST_Printer {
    Code_String& out;
    const Document& document;
    const AST_Formatting_Options options;

    void print(const ast::Block& block, int level = 0)
    {
        SURFDOC_ASSERT(level >= 0);
        SURFDOC_ASSERT(options.indent_width >= 0);

        const auto* const unknown = std::get_if<ast::Unknown>(&block);
        const std::string_view name
            = unknown ? std::string_view(unknown->tag) : block_type_tag(block.get_type());

        print_node_line(name, unknown != nullptr, ast::get_source_span(block), level);

        if (const Attribute_List* const attributes = ast::get_attributes(block)) {
            for (const Attribute& attribute : attributes->entries) {
                out.append(indent_of(level + 1), ' ');
                out.build(Code_Span_Type::diagnostic_attribute).append(attribute.key).append('=');
                out.append(attribute.value.to_source(), Code_Span_Type::diagnostic_code_citation);
                out.append('\n');
            }
        }

        if (const auto* const tabs = std::get_if<ast::Tabs>(&block)) {
            for (const ast::Tab_Panel& panel : tabs->panels) {
                out.append(indent_of(level + 1), ' ');
                out.append("panel", Code_Span_Type::diagnostic_tag);
                out.append('(', Code_Span_Type::diagnostic_punctuation);
                out.append(panel.label, Code_Span_Type::diagnostic_code_citation);
                out.append(')', Code_Span_Type::diagnostic_punctuation);
                out.append('\n');
                for (const ast::Block& child : panel.children) {
                    print(child, level + 2);
                }
            }
            return;
        }
        if (const auto* const columns = std::get_if<ast::Columns>(&block)) {
            for (const ast::Column& column : columns->columns) {
                print_node_line("column", false, column.get_source_position(), level + 1);
                for (const ast::Block& child : column.children) {
                    print(child, level + 2);
                }
            }
            return;
        }
        ast::for_each_child(block, [&](const ast::Block& child) { print(child, level + 1); });
    }

private:
    [[nodiscard]] Size indent_of(int level) const
    {
        return Size(options.indent_width * level);
    }

    void print_node_line(std::string_view name, bool is_unknown, Local_Source_Span pos, int level)
    {
        out.append(indent_of(level), ' ');
        if (is_unknown) {
            out.build(Code_Span_Type::diagnostic_tag).append('?').append(name);
        }
        else {
            out.append(name, Code_Span_Type::diagnostic_tag);
        }
        out.append(' ');
        out.build(Code_Span_Type::diagnostic_code_position)
            .append_integer(pos.line + 1)
            .append(':')
            .append_integer(pos.column + 1);
        out.append(' ');
        out.append('(', Code_Span_Type::diagnostic_punctuation);
        const std::string_view source = document.source;
        print_cut_off(source.substr(std::min(pos.begin, source.size()), pos.length));
        out.append(')', Code_Span_Type::diagnostic_punctuation);
        out.append('\n');
    }

    /// @brief Prints text which is cut off at some point.
    /// Blocks often span many lines, making it impractical to print everything.
    /// @param v the text to print
    void print_cut_off(std::string_view v)
    {
        SURFDOC_ASSERT(options.max_node_text_length >= 0);

        int visual_length = 0;

        for (Size i = 0; i < v.length();) {
            if (visual_length >= options.max_node_text_length) {
                out.append("...", Code_Span_Type::diagnostic_punctuation);
                break;
            }

            if (v[i] == '\r') {
                out.append("\\r", Code_Span_Type::diagnostic_escape);
                visual_length += 2;
                ++i;
            }
            else if (v[i] == '\t') {
                out.append("\\t", Code_Span_Type::diagnostic_escape);
                visual_length += 2;
                ++i;
            }
            else if (v[i] == '\n') {
                out.append("\\n", Code_Span_Type::diagnostic_escape);
                visual_length += 2;
                ++i;
            }
            else {
                const auto remainder
                    = v.substr(i, Size(options.max_node_text_length - visual_length));
                const auto part = remainder.substr(0, remainder.find_first_of("\r\t\n"));
                out.append(part, Code_Span_Type::diagnostic_code_citation);
                visual_length += int(part.size());
                i += part.size();
            }
        }
    }
};

} // namespace

void print_ast(Code_String& out, const Document& document, AST_Formatting_Options options)
{
    AST_Printer printer { out, document, options };
    for (const ast::Block& block : document.blocks) {
        printer.print(block);
    }
}

void print_internal_error_notice(Code_String& out)
{
    constexpr std::string_view notice
        = "This is an internal error. Please report this bug to the maintainers of surfdoc.\n";
    out.append(notice, Code_Span_Type::diagnostic_internal_error_notice);
}

std::ostream& print_code_string(std::ostream& out, const Code_String& string, bool colors)
{
    const std::string_view text = string.get_text();
    if (!colors) {
        return out << text;
    }

    Code_String_Span previous {};
    for (const Code_String_Span& span : string.get_spans()) {
        const Size previous_end = previous.begin + previous.length;
        SURFDOC_ASSERT(span.begin >= previous_end);
        if (previous_end != span.begin) {
            out << text.substr(previous_end, span.begin - previous_end);
        }
        out << highlight_color_of(span.type) << text.substr(span.begin, span.length) << ansi::reset;
        previous = span;
    }
    const Size last_span_end = previous.begin + previous.length;
    if (last_span_end != text.size()) {
        out << text.substr(last_span_end);
    }

    return out;
}

} // namespace surfdoc
