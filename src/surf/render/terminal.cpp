#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include "common/assert.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/parse.hpp"
#include "common/visit.hpp"

#include "surf/ast.hpp"
#include "surf/block_type.hpp"
#include "surf/parsing/inline_extension.hpp"
#include "surf/render/render_config.hpp"
#include "surf/render/terminal.hpp"

namespace surfdoc {

namespace {

using enum Code_Span_Type;

constexpr std::string_view gutter = "│";
constexpr std::string_view horizontal_line = "─";
constexpr std::string_view crossing = "┼";

/// @brief Returns the number of code points in the UTF-8 string `text`, which approximates its
/// width in a terminal.
Size display_width(std::string_view text)
{
    return Size(std::ranges::count_if(text, [](char c) { return (c & 0xc0) != 0x80; }));
}

template <typename F>
void for_each_line(std::string_view text, F f)
{
    while (true) {
        const Size end = text.find('\n');
        std::string_view line = text.substr(0, end);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        f(line);
        if (end == std::string_view::npos) {
            break;
        }
        text = text.substr(end + 1);
    }
}

Code_Span_Type callout_span_type(Callout_Type type)
{
    switch (type) {
    case Callout_Type::info: return terminal_info;
    case Callout_Type::warning: return terminal_warning;
    case Callout_Type::danger: return terminal_negative;
    case Callout_Type::tip:
    case Callout_Type::success: return terminal_positive;
    case Callout_Type::note: return terminal_label;
    }
    SURFDOC_ASSERT_UNREACHABLE("Invalid callout type.");
}

Code_Span_Type decision_span_type(Decision_Status status)
{
    switch (status) {
    case Decision_Status::proposed: return terminal_warning;
    case Decision_Status::accepted: return terminal_positive;
    case Decision_Status::rejected: return terminal_negative;
    case Decision_Status::superseded: return terminal_dim;
    }
    SURFDOC_ASSERT_UNREACHABLE("Invalid decision status.");
}

struct Terminal_Renderer {
private:
    Code_String& m_out;
    const Render_Config& m_config;

public:
    explicit Terminal_Renderer(Code_String& out, const Render_Config& config)
        : m_out(out)
        , m_config(config)
    {
    }

    void render_blocks(std::span<const ast::Block> blocks)
    {
        bool first = true;
        for (const ast::Block& block : blocks) {
            if (!first) {
                m_out.append("\n\n");
            }
            first = false;
            render(block);
        }
    }

private:
    void render(const ast::Block& block)
    {
        fast_visit([this](const auto& b) { render_block(b); }, block);
    }

    void render_block(const ast::Markdown& block)
    {
        bool first = true;
        bool in_fence = false;
        for_each_line(block.text, [&](std::string_view line) {
            if (!first) {
                m_out.append('\n');
            }
            first = false;
            const std::string_view trimmed = trim_left(line);
            if (trimmed.starts_with("```") || trimmed.starts_with("~~~")) {
                in_fence = !in_fence;
                m_out.append(line, terminal_dim);
            }
            else if (in_fence) {
                m_out.append(line, terminal_code);
            }
            else if (trimmed.starts_with('#')) {
                const Size marks = std::min(trimmed.find_first_not_of('#'), trimmed.length());
                write_prose(block, trim(trimmed.substr(marks)), terminal_heading);
            }
            else {
                write_prose(block, line, text);
            }
        });
    }

    /// @brief Writes `part`, which is a substring of the text of `block`, with its inline
    /// extensions replaced by labels.
    void write_prose(const ast::Markdown& block, std::string_view part, Code_Span_Type type)
    {
        const auto part_begin = Size(part.data() - block.text.data());
        const Size part_end = part_begin + part.length();
        Size pos = part_begin;
        for (const ast::Inline_Extension& extension : block.extensions) {
            if (extension.begin < part_begin || extension.end() > part_end) {
                continue;
            }
            m_out.append(std::string_view(block.text).substr(pos, extension.begin - pos), type);
            pos = extension.end();
            const std::string label = inline_extension_label(extension);
            if (label.empty()) {
                continue;
            }
            switch (extension.type) {
            case ast::Inline_Extension_Type::status:
                m_out.build(terminal_label).append('[').append(label).append(']');
                break;
            case ast::Inline_Extension_Type::evidence:
                m_out.build(terminal_dim).append('(').append(label).append(')');
                break;
            }
        }
        m_out.append(std::string_view(block.text).substr(pos, part_end - pos), type);
    }

    void render_block(const ast::Callout& block)
    {
        const Code_Span_Type border = callout_span_type(block.type);
        m_out.append(gutter, border);
        m_out.append(' ');
        m_out.append(callout_type_label(block.type), terminal_heading);
        if (block.title) {
            m_out.append(": ");
            m_out.append(*block.title);
        }
        write_with_gutter(block.text, border, text);
    }

    void render_block(const ast::Data& block)
    {
        if (block.format == Data_Format::json || block.table.headers.empty()) {
            write_lines(block.raw, terminal_code);
            return;
        }
        write_table(block.table);
    }

    void render_block(const ast::Code& block)
    {
        m_out.append("───", terminal_border);
        if (block.lang) {
            m_out.append(' ');
            m_out.append(*block.lang, terminal_dim);
        }
        if (block.file) {
            m_out.append(' ');
            m_out.append(*block.file, terminal_label);
        }
        for_each_line(block.text, [&](std::string_view line) {
            m_out.append("\n  ");
            m_out.append(line, terminal_code);
        });
        m_out.append('\n');
        m_out.append("───", terminal_border);
    }

    void render_block(const ast::Tasks& block)
    {
        bool first = true;
        for (const ast::Task_Item& item : block.items) {
            if (!first) {
                m_out.append('\n');
            }
            first = false;
            if (item.done) {
                m_out.append("✓", terminal_positive);
                m_out.append(' ');
                m_out.append(item.text, terminal_positive);
            }
            else {
                m_out.append("☐ ");
                m_out.append(item.text);
            }
            if (item.assignee) {
                m_out.append(' ');
                m_out.build(terminal_dim).append('@').append(*item.assignee);
            }
        }
    }

    void render_block(const ast::Decision& block)
    {
        {
            auto builder = m_out.build(decision_span_type(block.status));
            builder.append('[');
            for (const char c : decision_status_name(block.status)) {
                builder.append(char(c - 'a' + 'A'));
            }
            builder.append(']');
        }
        m_out.append(' ');
        m_out.append("Decision", terminal_heading);
        if (block.date) {
            m_out.append(" (");
            m_out.append(*block.date);
            m_out.append(')');
        }
        if (!block.deciders.empty()) {
            m_out.append('\n');
            m_out.append("Deciders: ", terminal_dim);
            write_joined(block.deciders);
        }
        if (!block.text.empty()) {
            m_out.append('\n');
            write_lines(block.text, text);
        }
        if (!block.options.empty()) {
            m_out.append('\n');
            m_out.append("Options: ", terminal_dim);
            write_joined(block.options);
        }
        if (block.outcome) {
            m_out.append('\n');
            m_out.append("Outcome: ", terminal_dim);
            m_out.append(*block.outcome, terminal_heading);
        }
    }

    void render_block(const ast::Metric& block)
    {
        m_out.append(block.label, terminal_heading);
        m_out.append(": ");
        m_out.append(block.value, terminal_heading);
        if (block.unit) {
            m_out.append(' ');
            m_out.append(*block.unit);
        }
        if (block.trend) {
            m_out.append(' ');
            switch (*block.trend) {
            case Trend::up: m_out.append("↑", terminal_positive); break;
            case Trend::down: m_out.append("↓", terminal_negative); break;
            case Trend::flat: m_out.append("→", terminal_dim); break;
            }
        }
    }

    void render_block(const ast::Summary& block)
    {
        bool first = true;
        for_each_line(block.text, [&](std::string_view line) {
            if (!first) {
                m_out.append('\n');
            }
            first = false;
            m_out.append(gutter, terminal_info);
            m_out.append(' ');
            m_out.append(line, terminal_emphasis);
        });
    }

    void render_block(const ast::Figure& block)
    {
        auto builder = m_out.build(terminal_dim);
        builder.append("[Figure: ");
        builder.append(block.caption ? *block.caption : block.alt ? *block.alt : "Image");
        builder.append("] (").append(block.src).append(')');
    }

    void render_block(const ast::Tabs& block)
    {
        for (Size i = 0; i < block.panels.size(); ++i) {
            if (i != 0) {
                m_out.append("\n\n");
            }
            {
                auto builder = m_out.build(terminal_heading);
                builder.append("[Tab ").append_integer(i + 1).append(": ");
                builder.append(block.panels[i].label).append(']');
            }
            write_children(block.panels[i].children);
        }
    }

    void render_block(const ast::Columns& block)
    {
        for (Size i = 0; i < block.columns.size(); ++i) {
            if (i != 0) {
                m_out.append("\n\n");
            }
            m_out.build(terminal_dim).append("[Col ").append_integer(i + 1).append(']');
            write_children(block.columns[i].children);
        }
    }

    void render_block(const ast::Quote& block)
    {
        write_quoted(block.text);
        if (block.attribution || block.cite) {
            m_out.append('\n');
            m_out.append(gutter, terminal_border);
            m_out.append(' ');
            auto builder = m_out.build(terminal_dim);
            builder.append("— ");
            if (block.attribution) {
                builder.append(*block.attribution);
            }
            if (block.cite) {
                builder.append(block.attribution ? ", " : "").append(*block.cite);
            }
        }
    }

    void render_block(const ast::Cta& block)
    {
        m_out.append("[CTA]", block.primary ? terminal_link : terminal_dim);
        m_out.append(' ');
        m_out.append(block.label, terminal_heading);
        m_out.append(" (");
        m_out.append(block.href, terminal_link);
        m_out.append(')');
    }

    void render_block(const ast::Nav& block)
    {
        if (block.logo) {
            m_out.append(*block.logo, terminal_heading);
        }
        for (Size i = 0; i < block.items.size(); ++i) {
            if (i != 0 || block.logo) {
                m_out.append(" │ ", terminal_dim);
            }
            m_out.append(block.items[i].label);
            m_out.append(" (");
            m_out.append(block.items[i].href, terminal_link);
            m_out.append(')');
        }
    }

    void render_block(const ast::Hero_Image& block)
    {
        m_out.build(terminal_dim)
            .append("[Hero: ")
            .append(block.alt ? *block.alt : "Hero image")
            .append("] (")
            .append(block.src)
            .append(')');
    }

    void render_block(const ast::Testimonial& block)
    {
        write_quoted(block.text);
        std::vector<std::string_view> details;
        for (const std::optional<std::string>* part : { &block.author, &block.role, &block.company }) {
            if (*part) {
                details.push_back(**part);
            }
        }
        if (!details.empty()) {
            m_out.append('\n');
            m_out.append(gutter, terminal_border);
            m_out.append(' ');
            auto builder = m_out.build(terminal_dim);
            builder.append("— ");
            for (Size i = 0; i < details.size(); ++i) {
                builder.append(i == 0 ? "" : ", ").append(details[i]);
            }
        }
    }

    void render_block(const ast::Style& block)
    {
        m_out.append(block.properties.empty() ? "[Style: empty]" : "[Style]", terminal_dim);
        write_properties(block.properties);
    }

    void render_block(const ast::Faq& block)
    {
        for (Size i = 0; i < block.items.size(); ++i) {
            if (i != 0) {
                m_out.append("\n\n");
            }
            {
                auto builder = m_out.build(terminal_heading);
                builder.append('Q').append_integer(i + 1).append(": ").append(block.items[i].question);
            }
            m_out.append('\n');
            m_out.append("A: ", terminal_label);
            m_out.append(block.items[i].answer);
        }
    }

    void render_block(const ast::Pricing_Table& block)
    {
        m_out.append("[Pricing]", terminal_info);
        if (!block.table.headers.empty()) {
            m_out.append('\n');
            write_table(block.table);
        }
    }

    void render_block(const ast::Site& block)
    {
        m_out.append("[Site Config]", terminal_info);
        if (block.domain) {
            m_out.append("\n  ");
            m_out.append("domain", terminal_heading);
            m_out.append(": ");
            m_out.append(*block.domain);
        }
        write_properties(block.properties);
        write_children(block.children);
    }

    void render_block(const ast::Page& block)
    {
        {
            auto builder = m_out.build(terminal_info);
            builder.append("[Page ").append(block.route);
            if (block.layout) {
                builder.append(" layout=").append(*block.layout);
            }
            builder.append(']');
        }
        if (block.title) {
            m_out.append(' ');
            m_out.append(*block.title, terminal_heading);
        }
        m_out.append('\n');
        {
            auto builder = m_out.build(terminal_border);
            for (Size i = 0; i < m_config.terminal_width; ++i) {
                builder.append(horizontal_line);
            }
        }
        write_children(block.children);
    }

    void render_block(const ast::Unknown& block)
    {
        m_out.build(terminal_dim).append('[').append(block.tag).append(']');
        if (!block.body.empty()) {
            m_out.append('\n');
            write_lines(block.body, text);
        }
    }

    // UTILITIES ===================================================================================

    void write_children(std::span<const ast::Block> children)
    {
        if (!children.empty()) {
            m_out.append('\n');
            render_blocks(children);
        }
    }

    void write_lines(std::string_view content, Code_Span_Type type)
    {
        bool first = true;
        for_each_line(content, [&](std::string_view line) {
            if (!first) {
                m_out.append('\n');
            }
            first = false;
            m_out.append(line, type);
        });
    }

    /// @brief Writes every line of `content` on a new line, prefixed with a gutter.
    void write_with_gutter(std::string_view content, Code_Span_Type border, Code_Span_Type type)
    {
        if (content.empty()) {
            return;
        }
        for_each_line(content, [&](std::string_view line) {
            m_out.append('\n');
            m_out.append(gutter, border);
            m_out.append(' ');
            m_out.append(line, type);
        });
    }

    void write_quoted(std::string_view content)
    {
        bool first = true;
        for_each_line(content, [&](std::string_view line) {
            if (!first) {
                m_out.append('\n');
            }
            first = false;
            m_out.append(gutter, terminal_border);
            m_out.append(' ');
            m_out.append(line, terminal_emphasis);
        });
    }

    void write_joined(std::span<const std::string> parts)
    {
        for (Size i = 0; i < parts.size(); ++i) {
            if (i != 0) {
                m_out.append(", ");
            }
            m_out.append(parts[i]);
        }
    }

    void write_properties(std::span<const ast::Property> properties)
    {
        for (const ast::Property& property : properties) {
            m_out.append("\n  ");
            m_out.append(property.key, terminal_heading);
            m_out.append(": ");
            m_out.append(property.value);
        }
    }

    void write_table_row(std::span<const std::string> cells,
                         std::span<const Size> widths,
                         Code_Span_Type type)
    {
        m_out.append(gutter, terminal_border);
        for (Size i = 0; i < widths.size(); ++i) {
            const std::string_view cell = i < cells.size() ? std::string_view { cells[i] } : "";
            m_out.append(' ');
            m_out.append(cell, type);
            m_out.append(widths[i] - display_width(cell) + 1, ' ');
            m_out.append(gutter, terminal_border);
        }
    }

    void write_table(const ast::Table& table)
    {
        std::vector<Size> widths;
        const auto widen = [&widths](std::span<const std::string> cells) {
            if (widths.size() < cells.size()) {
                widths.resize(cells.size());
            }
            for (Size i = 0; i < cells.size(); ++i) {
                widths[i] = std::max(widths[i], display_width(cells[i]));
            }
        };
        widen(table.headers);
        for (const ast::Table_Row& row : table.rows) {
            widen(row.cells);
        }

        write_table_row(table.headers, widths, terminal_heading);
        m_out.append('\n');
        {
            auto builder = m_out.build(terminal_border);
            builder.append(gutter);
            for (Size i = 0; i < widths.size(); ++i) {
                if (i != 0) {
                    builder.append(crossing);
                }
                for (Size j = 0; j < widths[i] + 2; ++j) {
                    builder.append(horizontal_line);
                }
            }
            builder.append(gutter);
        }
        for (const ast::Table_Row& row : table.rows) {
            m_out.append('\n');
            write_table_row(row.cells, widths, text);
        }
    }
};

[[nodiscard]] bool is_control_character(char c)
{
    return (static_cast<unsigned char>(c) < 0x20 && c != '\n' && c != '\t') || c == '\x7f';
}

/// @brief Invokes `f` for each maximal run of `text` without control characters.
template <typename F>
void for_each_printable_run(std::string_view text, F f)
{
    while (!text.empty()) {
        const auto control = std::ranges::find_if(text, is_control_character);
        const auto length = Size(control - text.begin());
        f(text.substr(0, length));
        text.remove_prefix(std::min(length + 1, text.length()));
    }
}

/// @brief Appends `in` to `out` without control characters other than line feeds and tabs,
/// so that escape sequences written in the document never reach the terminal.
/// Spans are kept and shrink by the removed characters.
void append_printable(Code_String& out, const Code_String& in)
{
    const std::string_view text = in.get_text();
    const auto append_untagged = [&out](std::string_view run) { out.append(run); };
    Size pos = 0;
    for (const Code_String_Span& span : in.get_spans()) {
        for_each_printable_run(text.substr(pos, span.begin - pos), append_untagged);
        auto builder = out.build(span.type);
        for_each_printable_run(text.substr(span.begin, span.length),
                               [&builder](std::string_view run) { builder.append(run); });
        pos = span.begin + span.length;
    }
    for_each_printable_run(text.substr(pos), append_untagged);
}

} // namespace

void render_terminal_blocks(Code_String& out,
                            std::span<const ast::Block> blocks,
                            const Render_Config& config)
{
    Code_String rendered;
    Terminal_Renderer { rendered, config }.render_blocks(blocks);
    append_printable(out, rendered);
}

void render_terminal(Code_String& out, const Document& document, const Render_Config& config)
{
    Code_String rendered;
    if (const auto it = document.front_matter.find("title"); it != document.front_matter.end()) {
        rendered.append(it->second, terminal_heading);
        rendered.append("\n\n");
    }
    Terminal_Renderer { rendered, config }.render_blocks(document.blocks);
    if (!rendered.empty()) {
        rendered.append('\n');
    }
    append_printable(out, rendered);
}

std::string render_terminal(const Document& document, const Render_Config& config)
{
    Code_String out;
    render_terminal(out, document, config);
    std::ostringstream stream;
    print_code_string(stream, out, config.colors);
    return std::move(stream).str();
}

} // namespace surfdoc
