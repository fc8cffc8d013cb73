#include <algorithm>
#include <string>
#include <vector>

#include "common/assert.hpp"
#include "common/visit.hpp"

#include "surf/ast.hpp"
#include "surf/block_type.hpp"
#include "surf/parsing/inline_extension.hpp"
#include "surf/render/markdown.hpp"

namespace surfdoc {

namespace {

/// @brief Invokes `f` for every line of `text`, without line terminators.
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

std::string_view trend_arrow(Trend trend)
{
    switch (trend) {
    case Trend::up: return "↑";
    case Trend::down: return "↓";
    case Trend::flat: return "→";
    }
    SURFDOC_ASSERT_UNREACHABLE("Invalid trend.");
}

/// @brief Returns the length of the longest run of backticks in `text`.
Size longest_backtick_run(std::string_view text)
{
    Size longest = 0;
    Size current = 0;
    for (const char c : text) {
        current = c == '`' ? current + 1 : 0;
        longest = std::max(longest, current);
    }
    return longest;
}

struct Markdown_Renderer {
private:
    std::string& m_out;

public:
    explicit Markdown_Renderer(std::string& out)
        : m_out(out)
    {
    }

    void render_blocks(std::span<const ast::Block> blocks)
    {
        bool first = true;
        for (const ast::Block& block : blocks) {
            const Size separator_pos = m_out.length();
            if (!first) {
                m_out += "\n\n";
            }
            const Size content_pos = m_out.length();
            render(block);
            if (m_out.length() == content_pos) {
                // Nothing to show, so the separator is not needed either.
                m_out.resize(separator_pos);
                continue;
            }
            first = false;
        }
    }

private:
    void render(const ast::Block& block)
    {
        fast_visit([this](const auto& b) { render_block(b); }, block);
    }

    void render_block(const ast::Markdown& block)
    {
        Size pos = 0;
        for (const ast::Inline_Extension& extension : block.extensions) {
            m_out += std::string_view(block.text).substr(pos, extension.begin - pos);
            write_inline_extension(extension);
            pos = extension.end();
        }
        m_out += std::string_view(block.text).substr(pos);
    }

    /// @brief Writes a status as strong text and evidence as an emphasized parenthetical.
    void write_inline_extension(const ast::Inline_Extension& extension)
    {
        const std::string label = inline_extension_label(extension);
        if (label.empty()) {
            return;
        }
        switch (extension.type) {
        case ast::Inline_Extension_Type::status:
            m_out += "**";
            m_out += label;
            m_out += "**";
            return;
        case ast::Inline_Extension_Type::evidence:
            m_out += "*(";
            m_out += label;
            m_out += ")*";
            return;
        }
        SURFDOC_ASSERT_UNREACHABLE("Invalid inline extension type.");
    }

    void render_block(const ast::Callout& block)
    {
        m_out += "> **";
        m_out += callout_type_label(block.type);
        m_out += "**";
        if (block.title) {
            m_out += ": ";
            m_out += *block.title;
        }
        if (!block.text.empty()) {
            m_out += '\n';
            write_quoted(block.text);
        }
    }

    void render_block(const ast::Data& block)
    {
        if (block.format == Data_Format::json || block.table.headers.empty()) {
            if (!block.raw.empty()) {
                write_fenced(block.raw, block.format == Data_Format::json ? "json" : "");
            }
            return;
        }
        write_table(block.table);
    }

    void render_block(const ast::Code& block)
    {
        if (block.file) {
            m_out += '`';
            m_out += *block.file;
            m_out += "`\n\n";
        }
        write_fenced(block.text, block.lang ? std::string_view { *block.lang } : "");
    }

    void render_block(const ast::Tasks& block)
    {
        bool first = true;
        for (const ast::Task_Item& item : block.items) {
            if (!first) {
                m_out += '\n';
            }
            first = false;
            m_out += item.done ? "- [x] " : "- [ ] ";
            m_out += item.text;
            if (item.assignee) {
                m_out += " @";
                m_out += *item.assignee;
            }
        }
    }

    void render_block(const ast::Decision& block)
    {
        m_out += "> **Decision** (";
        m_out += decision_status_name(block.status);
        m_out += ')';
        if (block.date) {
            m_out += " (";
            m_out += *block.date;
            m_out += ')';
        }
        if (!block.deciders.empty()) {
            m_out += "\n> Deciders: ";
            write_joined(block.deciders, ", ");
        }
        if (!block.text.empty()) {
            m_out += '\n';
            write_quoted(block.text);
        }
        if (!block.options.empty()) {
            m_out += "\n> Options: ";
            write_joined(block.options, ", ");
        }
        if (block.outcome) {
            m_out += "\n> Outcome: ";
            m_out += *block.outcome;
        }
    }

    void render_block(const ast::Metric& block)
    {
        m_out += "**";
        m_out += block.label;
        m_out += "**: ";
        m_out += block.value;
        if (block.unit) {
            m_out += ' ';
            m_out += *block.unit;
        }
        if (block.trend) {
            m_out += ' ';
            m_out += trend_arrow(*block.trend);
        }
    }

    void render_block(const ast::Summary& block)
    {
        bool first = true;
        for_each_line(block.text, [&](std::string_view line) {
            if (!first) {
                m_out += '\n';
            }
            first = false;
            if (line.empty()) {
                m_out += '>';
                return;
            }
            m_out += "> *";
            m_out += line;
            m_out += '*';
        });
    }

    void render_block(const ast::Figure& block)
    {
        write_image(block.alt.value_or(""), block.src);
        if (block.caption) {
            m_out += "\n*";
            m_out += *block.caption;
            m_out += '*';
        }
    }

    void render_block(const ast::Tabs& block)
    {
        bool first = true;
        for (const ast::Tab_Panel& panel : block.panels) {
            if (!first) {
                m_out += "\n\n";
            }
            first = false;
            m_out += "### ";
            m_out += panel.label;
            write_children(panel.children);
        }
    }

    void render_block(const ast::Columns& block)
    {
        bool first = true;
        for (const ast::Column& column : block.columns) {
            if (!first) {
                m_out += "\n\n---\n\n";
            }
            first = false;
            render_blocks(column.children);
        }
    }

    void render_block(const ast::Quote& block)
    {
        write_quoted(block.text);
        if (block.attribution || block.cite) {
            m_out += "\n>\n> — ";
            if (block.attribution) {
                m_out += *block.attribution;
            }
            if (block.cite) {
                if (block.attribution) {
                    m_out += ", ";
                }
                m_out += '*';
                m_out += *block.cite;
                m_out += '*';
            }
        }
    }

    void render_block(const ast::Cta& block)
    {
        m_out += '[';
        m_out += block.label;
        m_out += "](";
        m_out += block.href;
        m_out += ')';
    }

    void render_block(const ast::Nav& block)
    {
        bool first = true;
        for (const ast::Nav_Item& item : block.items) {
            if (!first) {
                m_out += '\n';
            }
            first = false;
            m_out += "- [";
            m_out += item.label;
            m_out += "](";
            m_out += item.href;
            m_out += ')';
        }
    }

    void render_block(const ast::Hero_Image& block)
    {
        write_image(block.alt.value_or("Hero image"), block.src);
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
            m_out += "\n>\n> — ";
            write_joined(details, ", ");
        }
    }

    void render_block(const ast::Style& block)
    {
        // Plain markdown has no styling, but the properties must not vanish.
        m_out += "<!-- style:";
        for (const ast::Property& property : block.properties) {
            m_out += ' ';
            write_comment_text(property.key);
            m_out += '=';
            write_comment_text(property.value);
            m_out += ';';
        }
        m_out += " -->";
    }

    void render_block(const ast::Faq& block)
    {
        bool first = true;
        for (const ast::Faq_Item& item : block.items) {
            if (!first) {
                m_out += "\n\n";
            }
            first = false;
            m_out += "### ";
            m_out += item.question;
            if (!item.answer.empty()) {
                m_out += "\n\n";
                m_out += item.answer;
            }
        }
    }

    void render_block(const ast::Pricing_Table& block)
    {
        if (!block.table.headers.empty()) {
            write_table(block.table);
        }
    }

    void render_block(const ast::Site& block)
    {
        m_out += "**Site Configuration**";
        if (block.domain) {
            m_out += "\n- domain: ";
            m_out += *block.domain;
        }
        for (const ast::Property& property : block.properties) {
            m_out += "\n- ";
            m_out += property.key;
            m_out += ": ";
            m_out += property.value;
        }
        write_children(block.children);
    }

    void render_block(const ast::Page& block)
    {
        if (block.title) {
            m_out += "## ";
            m_out += *block.title;
            write_children(block.children);
        }
        else {
            render_blocks(block.children);
        }
    }

    void render_block(const ast::Unknown& block)
    {
        m_out += block.opening_line;
        if (!block.body.empty()) {
            m_out += '\n';
            m_out += block.body;
        }
        if (!block.closing_line.empty()) {
            m_out += '\n';
            m_out += block.closing_line;
        }
    }

    // UTILITIES ===================================================================================

    /// @brief Renders `children` after a blank line, unless there are none.
    void write_children(std::span<const ast::Block> children)
    {
        const Size pos = m_out.length();
        m_out += "\n\n";
        const Size content_pos = m_out.length();
        render_blocks(children);
        if (m_out.length() == content_pos) {
            m_out.resize(pos);
        }
    }

    void write_quoted(std::string_view text)
    {
        bool first = true;
        for_each_line(text, [&](std::string_view line) {
            if (!first) {
                m_out += '\n';
            }
            first = false;
            m_out += line.empty() ? ">" : "> ";
            m_out += line;
        });
    }

    void write_fenced(std::string_view text, std::string_view info)
    {
        const std::string fence(std::max(Size(3), longest_backtick_run(text) + 1), '`');
        m_out += fence;
        m_out += info;
        m_out += '\n';
        m_out += text;
        if (!text.empty() && !text.ends_with('\n')) {
            m_out += '\n';
        }
        m_out += fence;
    }

    void write_image(std::string_view alt, std::string_view src)
    {
        m_out += "![";
        m_out += alt;
        m_out += "](";
        m_out += src;
        m_out += ')';
    }

    template <typename Range>
    void write_joined(const Range& parts, std::string_view separator)
    {
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                m_out += separator;
            }
            first = false;
            m_out += part;
        }
    }

    void write_table_row(std::span<const std::string> cells, Size column_count)
    {
        m_out += '|';
        for (Size i = 0; i < column_count; ++i) {
            m_out += ' ';
            if (i < cells.size()) {
                write_table_cell(cells[i]);
            }
            m_out += " |";
        }
    }

    /// @brief Writes text into an HTML comment, where `--` must not appear.
    void write_comment_text(std::string_view text)
    {
        for (Size i = 0; i < text.length(); ++i) {
            m_out += text[i];
            if (text[i] == '-' && i + 1 < text.length() && text[i + 1] == '-') {
                m_out += ' ';
            }
        }
    }

    void write_table_cell(std::string_view cell)
    {
        for (const char c : cell) {
            if (c == '|') {
                m_out += '\\';
            }
            m_out += c;
        }
    }

    void write_table(const ast::Table& table)
    {
        Size column_count = table.headers.size();
        for (const ast::Table_Row& row : table.rows) {
            column_count = std::max(column_count, row.cells.size());
        }
        write_table_row(table.headers, column_count);
        m_out += "\n|";
        for (Size i = 0; i < column_count; ++i) {
            m_out += " --- |";
        }
        for (const ast::Table_Row& row : table.rows) {
            m_out += '\n';
            write_table_row(row.cells, column_count);
        }
    }
};

} // namespace

void render_markdown_blocks(std::string& out, std::span<const ast::Block> blocks)
{
    Markdown_Renderer { out }.render_blocks(blocks);
}

std::string render_markdown(const Document& document, const Render_Config&)
{
    std::string result;
    if (!document.front_matter.empty()) {
        result += "---\n";
        for (const auto& [key, value] : document.front_matter) {
            result += key;
            result += ": ";
            result += value;
            result += '\n';
        }
        result += "---\n\n";
    }
    render_markdown_blocks(result, document.blocks);
    if (!result.empty() && !result.ends_with('\n')) {
        result += '\n';
    }
    return result;
}

} // namespace surfdoc
