#include <algorithm>
#include <optional>
#include <string>

#include "common/assert.hpp"
#include "common/code_string.hpp"
#include "common/parse.hpp"
#include "common/to_chars.hpp"
#include "common/visit.hpp"

#include "surf/ast.hpp"
#include "surf/block_type.hpp"
#include "surf/parsing/inline_extension.hpp"
#include "surf/render/html.hpp"
#include "surf/render/html_writer.hpp"
#include "surf/render/markdown_engine.hpp"

namespace surfdoc {

namespace {

/// Private-use characters delimiting the index of an inline extension in the prose passed to the
/// Markdown engine. Neither is escaped in HTML.
constexpr std::string_view placeholder_open = "\xEE\x80\x80";
constexpr std::string_view placeholder_close = "\xEE\x80\x81";

constexpr std::string_view dark_palette = R"css(:root {
  --bg: #0a0a0f; --bg-card: #12121a; --bg-hover: #1a1a26; --bg-code: #0d1117;
  --border: #2a2a3a; --border-subtle: #1e1e2e;
  --text: #e8e8f0; --text-strong: #ffffff; --text-dim: #8888a0; --text-muted: #5a5a72;
  --accent: #3b82f6;
  --info: #3b82f6; --warning: #f59e0b; --danger: #ef4444; --tip: #10b981; --note: #8b5cf6; --success: #22c55e;
)css";

constexpr std::string_view light_palette = R"css(:root {
  --bg: #ffffff; --bg-card: #f7f7fa; --bg-hover: #eeeef4; --bg-code: #f6f8fa;
  --border: #d4d4de; --border-subtle: #e6e6ee;
  --text: #1c1c28; --text-strong: #000000; --text-dim: #55556a; --text-muted: #8a8aa0;
  --accent: #2563eb;
  --info: #2563eb; --warning: #d97706; --danger: #dc2626; --tip: #059669; --note: #7c3aed; --success: #16a34a;
)css";

constexpr std::string_view font_variables = R"css(  --font-heading: -apple-system, BlinkMacSystemFont, "Segoe UI", Roboto, Oxygen, sans-serif;
  --font-body: -apple-system, BlinkMacSystemFont, "Segoe UI", Roboto, Oxygen, sans-serif;
  --font-mono: "SF Mono", "Fira Code", "Cascadia Code", Menlo, Consolas, monospace;
}
)css";

constexpr std::string_view stylesheet_rules = R"css(* { box-sizing: border-box; }
body { margin: 0; background: var(--bg); color: var(--text); font-family: var(--font-body); -webkit-font-smoothing: antialiased; }
.surfdoc { max-width: 48rem; margin: 0 auto; padding: 2rem 1.5rem; line-height: 1.7; }
.surfdoc h1, .surfdoc h2, .surfdoc h3, .surfdoc h4 { font-family: var(--font-heading); }
.surfdoc h2 { padding-bottom: 0.5rem; border-bottom: 1px solid var(--border-subtle); }
.surfdoc a { color: var(--accent); }
.surfdoc strong { color: var(--text-strong); }
.surfdoc code { font-family: var(--font-mono); font-size: 0.85em; background: var(--bg-hover); padding: 0.15em 0.4em; border-radius: 4px; }
.surfdoc table { width: 100%; border-collapse: collapse; margin: 1rem 0; font-size: 0.875rem; }
.surfdoc th { text-align: left; padding: 0.5rem 0.75rem; border-bottom: 2px solid var(--border); color: var(--text-dim); }
.surfdoc td { padding: 0.5rem 0.75rem; border-bottom: 1px solid var(--border-subtle); }
.surfdoc-callout { padding: 0.75rem 1rem; margin: 1rem 0; border-left: 3px solid var(--info); background: var(--bg-card); border-radius: 0 8px 8px 0; }
.surfdoc-callout strong { display: block; margin-bottom: 0.25rem; font-size: 0.85rem; text-transform: uppercase; letter-spacing: 0.04em; }
.surfdoc-callout p { margin: 0; }
.surfdoc-callout-warning { border-left-color: var(--warning); }
.surfdoc-callout-danger { border-left-color: var(--danger); }
.surfdoc-callout-tip { border-left-color: var(--tip); }
.surfdoc-callout-note { border-left-color: var(--note); }
.surfdoc-callout-success { border-left-color: var(--success); }
.surfdoc-data, .surfdoc-pricing { border: 1px solid var(--border-subtle); }
.surfdoc-code { background: var(--bg-code); border: 1px solid var(--border-subtle); border-radius: 8px; padding: 1rem; overflow-x: auto; margin: 1rem 0; font-size: 0.8rem; line-height: 1.6; }
.surfdoc-code code { background: transparent; padding: 0; }
.surfdoc-tasks { list-style: none; padding: 0; margin: 1rem 0; }
.surfdoc-tasks li { display: flex; align-items: center; gap: 0.5rem; padding: 0.375rem 0.75rem; }
.surfdoc-tasks .assignee { color: var(--accent); font-size: 0.8rem; margin-left: auto; }
.surfdoc-decision { padding: 1rem; margin: 1rem 0; background: var(--bg-card); border: 1px solid var(--border-subtle); border-radius: 8px; }
.surfdoc-decision .status { display: inline-block; padding: 0.15rem 0.5rem; border-radius: 4px; font-size: 0.75rem; font-weight: 600; text-transform: uppercase; margin-right: 0.5rem; background: var(--bg-hover); }
.surfdoc-decision-accepted .status { color: var(--success); }
.surfdoc-decision-rejected .status { color: var(--danger); }
.surfdoc-decision-superseded .status { color: var(--text-muted); }
.surfdoc-decision .date, .surfdoc-decision .deciders { color: var(--text-muted); font-size: 0.8rem; margin-right: 0.5rem; }
.surfdoc-decision .options .chosen { font-weight: 600; }
.surfdoc-metric { display: inline-flex; flex-direction: column; gap: 0.125rem; padding: 0.75rem 1rem; margin: 0.5rem 0.5rem 0.5rem 0; background: var(--bg-card); border: 1px solid var(--border-subtle); border-radius: 8px; min-width: 8rem; }
.surfdoc-metric .label { color: var(--text-dim); font-size: 0.8rem; }
.surfdoc-metric .value { font-size: 1.25rem; font-weight: 700; color: var(--text-strong); }
.surfdoc-metric .unit { color: var(--text-muted); font-size: 0.8rem; }
.surfdoc-metric .trend.up { color: var(--success); }
.surfdoc-metric .trend.down { color: var(--danger); }
.surfdoc-metric .trend.flat { color: var(--text-muted); }
.surfdoc-summary { border-left: 3px solid var(--accent); padding: 0.75rem 1rem; margin: 1rem 0; background: var(--bg-card); font-style: italic; color: var(--text-dim); }
.surfdoc-figure { margin: 1.5rem 0; text-align: center; }
.surfdoc-figure img, .surfdoc-hero-image img { max-width: 100%; border-radius: 8px; }
.surfdoc-figure figcaption { margin-top: 0.5rem; font-size: 0.85rem; color: var(--text-muted); font-style: italic; }
.surfdoc-unknown { padding: 0.75rem 1rem; margin: 1rem 0; background: var(--bg-card); border: 1px dashed var(--border); border-radius: 8px; color: var(--text-dim); white-space: pre-wrap; }
.surfdoc-tabs { margin: 1rem 0; border: 1px solid var(--border-subtle); border-radius: 8px; }
.surfdoc-tabs nav { display: flex; border-bottom: 1px solid var(--border-subtle); }
.surfdoc-tabs nav button { padding: 0.5rem 1rem; background: none; border: none; color: var(--text-muted); cursor: pointer; border-bottom: 2px solid transparent; }
.surfdoc-tabs nav button.active { color: var(--accent); border-bottom-color: var(--accent); }
.surfdoc-tabs .tab-panel { padding: 1rem; }
.surfdoc-columns { display: grid; grid-template-columns: repeat(var(--cols, 2), 1fr); gap: 1.5rem; margin: 1rem 0; }
.surfdoc-columns[data-cols="3"] { --cols: 3; }
.surfdoc-columns[data-cols="4"] { --cols: 4; }
.surfdoc-quote { margin: 1.5rem 0; padding: 1rem 1.5rem; border-left: 3px solid var(--accent); }
.surfdoc-quote blockquote { margin: 0; font-size: 1.1rem; font-style: italic; color: var(--text-dim); }
.surfdoc-quote .attribution { margin-top: 0.5rem; font-size: 0.85rem; color: var(--text-muted); }
a.surfdoc-cta { display: inline-block; padding: 0.625rem 1.5rem; margin: 0.5rem 0.5rem 0.5rem 0; border-radius: 8px; font-weight: 600; text-decoration: none; }
a.surfdoc-cta-primary { background: var(--accent); color: #ffffff; }
a.surfdoc-cta-secondary { border: 1px solid var(--border); color: var(--text); }
.surfdoc-nav { display: flex; align-items: center; gap: 1rem; padding: 0.75rem 1.5rem; margin-bottom: 1rem; background: var(--bg-card); border-bottom: 1px solid var(--border-subtle); }
.surfdoc-nav-logo { font-weight: 700; margin-right: auto; white-space: nowrap; }
.surfdoc-nav-links { display: flex; align-items: center; gap: 0.25rem; flex-wrap: wrap; }
.surfdoc-nav-links a { color: var(--text-dim); text-decoration: none; font-size: 0.875rem; padding: 0.25rem 0.625rem; border-radius: 6px; }
.surfdoc-nav-links a:hover { color: var(--text); background: var(--bg-hover); }
.surfdoc-status { display: inline-block; padding: 0 0.5rem; border-radius: 999px; font-size: 0.75rem; font-weight: 600; text-transform: uppercase; background: var(--bg-hover); color: var(--accent); }
.surfdoc-evidence { font-size: 0.8125rem; color: var(--text-dim); }
.surfdoc-evidence::before { content: "("; }
.surfdoc-evidence::after { content: ")"; }
.surfdoc-hero-image { margin: 1.5rem 0; }
.surfdoc-testimonial { margin: 1.5rem 0; padding: 1.25rem 1.5rem; background: var(--bg-card); border: 1px solid var(--border-subtle); border-radius: 8px; }
.surfdoc-testimonial blockquote { margin: 0 0 0.75rem; font-style: italic; color: var(--text-dim); }
.surfdoc-testimonial .author { font-weight: 600; }
.surfdoc-testimonial .role { color: var(--text-muted); font-size: 0.8rem; font-weight: normal; }
.surfdoc-faq details { border: 1px solid var(--border-subtle); border-radius: 8px; margin: 0.5rem 0; overflow: hidden; }
.surfdoc-faq summary { padding: 0.75rem 1rem; font-weight: 600; cursor: pointer; background: var(--bg-card); }
.surfdoc-faq .faq-answer { padding: 0.75rem 1rem; color: var(--text-dim); }
.surfdoc-pricing th { text-align: center; color: var(--text); }
.surfdoc-pricing td { text-align: center; }
.surfdoc-pricing th:first-child, .surfdoc-pricing td:first-child { text-align: left; }
.surfdoc-page { margin: 2rem 0; }
.surfdoc-page[data-layout="hero"] { text-align: center; padding: 3rem 0; }
)css";

constexpr std::string_view site_navigation_rules = R"css(.surfdoc-site-nav { display: flex; align-items: center; gap: 1.5rem; padding: 0.75rem 1.5rem; background: var(--bg-card); border-bottom: 1px solid var(--border-subtle); position: sticky; top: 0; z-index: 100; }
.surfdoc-site-nav .site-name { font-weight: 700; color: var(--text-strong); text-decoration: none; margin-right: auto; }
.surfdoc-site-nav a { color: var(--text-dim); text-decoration: none; font-size: 0.875rem; padding: 0.25rem 0.5rem; border-radius: 4px; }
.surfdoc-site-nav a:hover { color: var(--text); background: var(--bg-hover); }
.surfdoc-site-nav a.active { color: var(--accent); font-weight: 600; }
.surfdoc-site-footer { margin-top: 4rem; padding: 1.5rem; border-top: 1px solid var(--border-subtle); text-align: center; color: var(--text-muted); font-size: 0.8rem; }
)css";

constexpr std::string_view tabs_script
    = "document.querySelectorAll('.surfdoc-tabs').forEach(t=>{"
      "t.querySelectorAll('[role=\"tab\"]').forEach(b=>{b.onclick=()=>{"
      "t.querySelectorAll('[role=\"tab\"]').forEach(e=>{e.classList.remove('active');"
      "e.setAttribute('aria-selected','false');e.tabIndex=-1});"
      "b.classList.add('active');b.setAttribute('aria-selected','true');b.tabIndex=0;"
      "t.querySelectorAll('[role=\"tabpanel\"]').forEach(p=>{p.classList.remove('active');"
      "p.hidden=true});var panel=document.getElementById(b.getAttribute('aria-controls'));"
      "if(panel){panel.classList.add('active');panel.hidden=false}}})})";

struct Font_Preset {
    std::string_view stack;
    std::string_view import_url;
};

std::optional<Font_Preset> font_preset_by_name(std::string_view name)
{
    static constexpr std::string_view system_stack
        = R"(-apple-system, BlinkMacSystemFont, "Segoe UI", Roboto, Oxygen, sans-serif)";
    static constexpr std::string_view serif_stack
        = R"(Georgia, "Palatino Linotype", "Book Antiqua", Palatino, serif)";
    static constexpr std::string_view mono_stack
        = R"("SF Mono", "Fira Code", "Cascadia Code", Menlo, Consolas, monospace)";

    static constexpr struct Entry {
        std::string_view name;
        Font_Preset preset;
    } lookup[] {
        { "editorial", { serif_stack, {} } },
        { "inter",
          { "'Inter', -apple-system, BlinkMacSystemFont, sans-serif",
            "https://fonts.googleapis.com/css2?family=Inter:wght@400;500;600;700&display=swap" } },
        { "jetbrains", { "'JetBrains Mono', monospace", "https://fonts.googleapis.com/css2?family=JetBrains+Mono:wght@400;500&display=swap" } },
        { "jetbrains-mono", { "'JetBrains Mono', monospace", "https://fonts.googleapis.com/css2?family=JetBrains+Mono:wght@400;500&display=swap" } },
        { "mono", { mono_stack, {} } },
        { "monospace", { mono_stack, {} } },
        { "montserrat",
          { "'Montserrat', sans-serif",
            "https://fonts.googleapis.com/css2?family=Montserrat:wght@400;600;700;800&display=swap" } },
        { "sans", { system_stack, {} } },
        { "serif", { serif_stack, {} } },
        { "system", { system_stack, {} } },
        { "technical", { mono_stack, {} } },
    };

    static_assert(std::ranges::is_sorted(lookup, {}, &Entry::name));

    const std::string lower = to_lower(trim(name));

    const auto it = std::ranges::lower_bound(lookup, std::string_view { lower }, {}, &Entry::name);
    if (it == std::ranges::end(lookup) || it->name != lower) {
        return {};
    }
    return it->preset;
}

/// @brief Returns `true` if `value` can be placed into a CSS declaration without escaping.
/// This admits colors such as `#ff8800` or `rgb(10, 20, 30)`, but nothing that could close the
/// declaration or the `<style>` element.
bool is_css_safe_value(std::string_view value)
{
    return !value.empty() && std::ranges::all_of(value, [](char c) {
        return is_ascii_alphanumeric(c) || c == '#' || c == '(' || c == ')' || c == ','
            || c == '.' || c == '%' || c == ' ' || c == '-';
    });
}

void add_font_import(Style_Overrides& out, std::string_view url)
{
    if (!url.empty() && std::ranges::find(out.font_imports, url) == out.font_imports.end()) {
        out.font_imports.push_back(url);
    }
}

std::string to_string(Size x)
{
    return std::string(to_characters(x).as_string());
}

std::string join(std::span<const std::string> parts, std::string_view separator)
{
    std::string result;
    for (Size i = 0; i < parts.size(); ++i) {
        if (i != 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::string properties_to_data(std::span<const ast::Property> properties)
{
    std::string result;
    for (const ast::Property& property : properties) {
        if (!result.empty()) {
            result += ';';
        }
        result += property.key;
        result += '=';
        result += property.value;
    }
    return result;
}

std::string_view capitalized_status(Decision_Status status)
{
    switch (status) {
    case Decision_Status::proposed: return "Proposed";
    case Decision_Status::accepted: return "Accepted";
    case Decision_Status::rejected: return "Rejected";
    case Decision_Status::superseded: return "Superseded";
    }
    SURFDOC_ASSERT_UNREACHABLE("Invalid decision status.");
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

std::string_view trend_description(Trend trend)
{
    switch (trend) {
    case Trend::up: return ", trending up";
    case Trend::down: return ", trending down";
    case Trend::flat: return ", flat";
    }
    SURFDOC_ASSERT_UNREACHABLE("Invalid trend.");
}

struct HTML_Renderer {
private:
    HTML_Writer& m_writer;
    const Markdown_Engine& m_engine;
    /// @brief The number of `tabs` blocks rendered so far, used to make element ids unique.
    Size m_tabs_count = 0;

public:
    explicit HTML_Renderer(HTML_Writer& writer, const Markdown_Engine& engine)
        : m_writer(writer)
        , m_engine(engine)
    {
    }

    void render_blocks(std::span<const ast::Block> blocks)
    {
        for (const ast::Block& block : blocks) {
            render(block);
            m_writer.write_line_break();
        }
    }

    /// @brief Writes the script which makes tab buttons switch panels, if the rendered content
    /// contained any tabs.
    void finish()
    {
        if (m_tabs_count != 0) {
            m_writer.open_tag("script");
            m_writer.write_inner_html(tabs_script);
            m_writer.close_tag("script");
            m_writer.write_line_break();
        }
    }

private:
    void render(const ast::Block& block)
    {
        fast_visit([this](const auto& b) { render_block(b); }, block);
    }

    void render_block(const ast::Markdown& block)
    {
        if (block.extensions.empty()) {
            m_engine.to_html(m_writer.get_output(), block.text);
            return;
        }
        // The engine sees a placeholder for each extension, which is substituted in its output.
        std::string prose;
        Size pos = 0;
        for (Size i = 0; i < block.extensions.size(); ++i) {
            const ast::Inline_Extension& extension = block.extensions[i];
            prose.append(block.text, pos, extension.begin - pos);
            prose += placeholder_open;
            prose += std::to_string(i);
            prose += placeholder_close;
            pos = extension.end();
        }
        prose.append(block.text, pos);

        Code_String converted;
        m_engine.to_html(converted, prose);

        const std::string_view text = converted.get_text();
        Size text_pos = 0;
        for (const Code_String_Span& span : converted.get_spans()) {
            write_substituted(block, text.substr(text_pos, span.begin - text_pos), std::nullopt);
            write_substituted(block, text.substr(span.begin, span.length), span.type);
            text_pos = span.begin + span.length;
        }
        write_substituted(block, text.substr(text_pos), std::nullopt);
    }

    /// @brief Writes engine output, replacing placeholders with the extensions of `block`.
    void write_substituted(const ast::Markdown& block,
                           std::string_view html,
                           std::optional<Code_Span_Type> type)
    {
        Code_String& out = m_writer.get_output();
        const auto write_html = [&](std::string_view part) {
            if (type) {
                out.append(part, *type);
            }
            else {
                out.append(part);
            }
        };
        while (!html.empty()) {
            const Size open = html.find(placeholder_open);
            const Size close = open == std::string_view::npos
                ? std::string_view::npos
                : html.find(placeholder_close, open + placeholder_open.length());
            if (close == std::string_view::npos) {
                break;
            }
            const Size digits_begin = open + placeholder_open.length();
            const std::optional<Int> index
                = parse_integer(html.substr(digits_begin, close - digits_begin));
            const Size after = close + placeholder_close.length();
            if (!index || *index < 0 || Size(*index) >= block.extensions.size()) {
                write_html(html.substr(0, after));
            }
            else {
                write_html(html.substr(0, open));
                write_inline_extension(block.extensions[Size(*index)]);
            }
            html.remove_prefix(after);
        }
        write_html(html);
    }

    void write_inline_extension(const ast::Inline_Extension& extension)
    {
        auto attributes = m_writer.open_tag_with_attributes("span");
        switch (extension.type) {
        case ast::Inline_Extension_Type::status:
            attributes.write_attribute("class", "surfdoc-status")
                .write_attribute("data-status", extension.text);
            break;
        case ast::Inline_Extension_Type::evidence:
            attributes.write_attribute("class", "surfdoc-evidence");
            if (extension.tier) {
                attributes.write_attribute("data-tier", std::to_string(*extension.tier));
            }
            if (extension.source) {
                attributes.write_attribute("data-source", *extension.source);
            }
            break;
        }
        attributes.end();
        m_writer.write_inner_text(inline_extension_label(extension));
        m_writer.close_tag("span");
    }

    void render_block(const ast::Callout& block)
    {
        const std::string_view type = callout_type_name(block.type);
        m_writer.open_tag_with_attributes("div")
            .write_attribute("class", "surfdoc-callout surfdoc-callout-" + std::string(type))
            .write_attribute("role", block.type == Callout_Type::danger ? "alert" : "note")
            .end();
        m_writer.open_tag("strong");
        m_writer.write_inner_text(callout_type_label(block.type));
        if (block.title) {
            m_writer.write_inner_text(": ");
            m_writer.write_inner_text(*block.title);
        }
        m_writer.close_tag("strong");
        write_paragraph(block.text);
        m_writer.close_tag("div");
    }

    void render_block(const ast::Data& block)
    {
        if (block.format == Data_Format::json) {
            auto attributes = m_writer.open_tag_with_attributes("pre");
            attributes.write_attribute("class", "surfdoc-data surfdoc-data-json");
            if (block.id) {
                attributes.write_attribute("id", *block.id);
            }
            attributes.end();
            m_writer.open_tag_with_attributes("code")
                .write_attribute("class", "language-json")
                .end();
            m_writer.write_inner_text(block.raw);
            m_writer.close_tag("code");
            m_writer.close_tag("pre");
            return;
        }
        auto attributes = m_writer.open_tag_with_attributes("table");
        attributes.write_attribute("class", "surfdoc-data");
        if (block.id) {
            attributes.write_attribute("id", *block.id);
        }
        if (block.sortable) {
            attributes.write_flag("data-sortable");
        }
        attributes.end();
        write_table_content(block.table);
        m_writer.close_tag("table");
    }

    void render_block(const ast::Code& block)
    {
        auto attributes = m_writer.open_tag_with_attributes("pre");
        attributes.write_attribute("class", "surfdoc-code");
        if (block.lang) {
            attributes.write_attribute("aria-label", *block.lang + " code");
        }
        if (block.file) {
            attributes.write_attribute("data-file", *block.file);
        }
        if (!block.highlight.empty()) {
            attributes.write_attribute("data-highlight", join(block.highlight, ","));
        }
        attributes.end();

        if (block.lang) {
            m_writer.open_tag_with_attributes("code")
                .write_attribute("class", "language-" + *block.lang)
                .end();
        }
        else {
            m_writer.open_tag("code");
        }
        m_writer.write_inner_text(block.text);
        m_writer.close_tag("code");
        m_writer.close_tag("pre");
    }

    void render_block(const ast::Tasks& block)
    {
        m_writer.open_tag_with_attributes("ul").write_attribute("class", "surfdoc-tasks").end();
        for (const ast::Task_Item& item : block.items) {
            m_writer.open_tag("li");
            m_writer.open_tag("label");
            {
                auto input = m_writer.open_tag_with_attributes("input");
                input.write_attribute("type", "checkbox");
                if (item.done) {
                    input.write_flag("checked");
                }
                input.write_flag("disabled").end_empty();
            }
            m_writer.write_inner_text(" ");
            m_writer.write_inner_text(item.text);
            m_writer.close_tag("label");
            if (item.assignee) {
                m_writer.write_inner_text(" ");
                m_writer.open_tag_with_attributes("span").write_attribute("class", "assignee").end();
                m_writer.write_inner_text("@");
                m_writer.write_inner_text(*item.assignee);
                m_writer.close_tag("span");
            }
            m_writer.close_tag("li");
        }
        m_writer.close_tag("ul");
    }

    void render_block(const ast::Decision& block)
    {
        const std::string_view status = decision_status_name(block.status);
        m_writer.open_tag_with_attributes("div")
            .write_attribute("class", "surfdoc-decision surfdoc-decision-" + std::string(status))
            .write_attribute("role", "note")
            .write_attribute("aria-label", "Decision: " + std::string(status))
            .end();
        write_span("status", capitalized_status(block.status));
        if (block.date) {
            write_span("date", *block.date);
        }
        if (!block.deciders.empty()) {
            write_span("deciders", join(block.deciders, ", "));
        }
        if (!block.text.empty()) {
            write_paragraph(block.text);
        }
        if (!block.options.empty()) {
            m_writer.open_tag_with_attributes("ul").write_attribute("class", "options").end();
            for (const std::string& option : block.options) {
                if (block.outcome == option) {
                    m_writer.open_tag_with_attributes("li").write_attribute("class", "chosen").end();
                }
                else {
                    m_writer.open_tag("li");
                }
                m_writer.write_inner_text(option);
                m_writer.close_tag("li");
            }
            m_writer.close_tag("ul");
        }
        if (block.outcome) {
            m_writer.open_tag_with_attributes("p").write_attribute("class", "outcome").end();
            m_writer.open_tag("strong");
            m_writer.write_inner_text("Outcome:");
            m_writer.close_tag("strong");
            m_writer.write_inner_text(" ");
            m_writer.write_inner_text(*block.outcome);
            m_writer.close_tag("p");
        }
        m_writer.close_tag("div");
    }

    void render_block(const ast::Metric& block)
    {
        std::string label = block.label + ": " + block.value;
        if (block.unit) {
            label += ' ';
            label += *block.unit;
        }
        if (block.trend) {
            label += trend_description(*block.trend);
        }
        m_writer.open_tag_with_attributes("div")
            .write_attribute("class", "surfdoc-metric")
            .write_attribute("role", "group")
            .write_attribute("aria-label", label)
            .end();
        write_span("label", block.label);
        write_span("value", block.value);
        if (block.unit) {
            write_span("unit", *block.unit);
        }
        if (block.trend) {
            write_span("trend " + std::string(trend_name(*block.trend)), trend_arrow(*block.trend));
        }
        m_writer.close_tag("div");
    }

    void render_block(const ast::Summary& block)
    {
        m_writer.open_tag_with_attributes("div")
            .write_attribute("class", "surfdoc-summary")
            .write_attribute("role", "doc-abstract")
            .end();
        write_paragraph(block.text);
        m_writer.close_tag("div");
    }

    void render_block(const ast::Figure& block)
    {
        m_writer.open_tag_with_attributes("figure").write_attribute("class", "surfdoc-figure").end();
        {
            auto image = m_writer.open_tag_with_attributes("img");
            image.write_attribute("src", block.src);
            image.write_attribute("alt", block.alt.value_or(""));
            if (block.width) {
                image.write_attribute("width", *block.width);
            }
            image.end_empty();
        }
        if (block.caption) {
            m_writer.open_tag("figcaption");
            m_writer.write_inner_text(*block.caption);
            m_writer.close_tag("figcaption");
        }
        m_writer.close_tag("figure");
    }

    void render_block(const ast::Tabs& block)
    {
        const std::string prefix = "surfdoc-" + to_string(m_tabs_count++) + "-";

        m_writer.open_tag_with_attributes("div").write_attribute("class", "surfdoc-tabs").end();
        m_writer.open_tag_with_attributes("nav").write_attribute("role", "tablist").end();
        for (Size i = 0; i < block.panels.size(); ++i) {
            const bool first = i == 0;
            m_writer.open_tag_with_attributes("button")
                .write_attribute("class", first ? "tab-btn active" : "tab-btn")
                .write_attribute("role", "tab")
                .write_attribute("aria-selected", first ? "true" : "false")
                .write_attribute("aria-controls", prefix + "panel-" + to_string(i))
                .write_attribute("id", prefix + "tab-" + to_string(i))
                .write_attribute("tabindex", first ? "0" : "-1")
                .end();
            m_writer.write_inner_text(block.panels[i].label);
            m_writer.close_tag("button");
        }
        m_writer.close_tag("nav");
        for (Size i = 0; i < block.panels.size(); ++i) {
            const bool first = i == 0;
            auto attributes = m_writer.open_tag_with_attributes("div");
            attributes.write_attribute("class", first ? "tab-panel active" : "tab-panel")
                .write_attribute("role", "tabpanel")
                .write_attribute("id", prefix + "panel-" + to_string(i))
                .write_attribute("aria-labelledby", prefix + "tab-" + to_string(i))
                .write_attribute("tabindex", "0");
            if (!first) {
                attributes.write_flag("hidden");
            }
            attributes.end();
            render_blocks(block.panels[i].children);
            m_writer.close_tag("div");
        }
        m_writer.close_tag("div");
    }

    void render_block(const ast::Columns& block)
    {
        m_writer.open_tag_with_attributes("div")
            .write_attribute("class", "surfdoc-columns")
            .write_attribute("role", "group")
            .write_attribute("data-cols", to_string(block.columns.size()))
            .end();
        for (const ast::Column& column : block.columns) {
            m_writer.open_tag_with_attributes("div").write_attribute("class", "surfdoc-column").end();
            render_blocks(column.children);
            m_writer.close_tag("div");
        }
        m_writer.close_tag("div");
    }

    void render_block(const ast::Quote& block)
    {
        m_writer.open_tag_with_attributes("div").write_attribute("class", "surfdoc-quote").end();
        m_writer.open_tag("blockquote");
        m_writer.write_inner_text(block.text);
        m_writer.close_tag("blockquote");
        if (block.attribution || block.cite) {
            m_writer.open_tag_with_attributes("div").write_attribute("class", "attribution").end();
            if (block.attribution) {
                m_writer.write_inner_text(*block.attribution);
            }
            if (block.cite) {
                if (block.attribution) {
                    m_writer.write_inner_text(", ");
                }
                m_writer.open_tag("cite");
                m_writer.write_inner_text(*block.cite);
                m_writer.close_tag("cite");
            }
            m_writer.close_tag("div");
        }
        m_writer.close_tag("div");
    }

    void render_block(const ast::Cta& block)
    {
        auto attributes = m_writer.open_tag_with_attributes("a");
        attributes
            .write_attribute("class",
                             block.primary ? "surfdoc-cta surfdoc-cta-primary"
                                           : "surfdoc-cta surfdoc-cta-secondary")
            .write_attribute("href", block.href);
        if (block.icon) {
            attributes.write_attribute("data-icon", *block.icon);
        }
        attributes.end();
        m_writer.write_inner_text(block.label);
        m_writer.close_tag("a");
    }

    void render_block(const ast::Nav& block)
    {
        m_writer.open_tag_with_attributes("nav")
            .write_attribute("class", "surfdoc-nav")
            .write_attribute("role", "navigation")
            .write_attribute("aria-label", "Page navigation")
            .end();
        if (block.logo) {
            write_span("surfdoc-nav-logo", *block.logo);
        }
        m_writer.open_tag_with_attributes("div").write_attribute("class", "surfdoc-nav-links").end();
        for (const ast::Nav_Item& item : block.items) {
            auto attributes = m_writer.open_tag_with_attributes("a");
            attributes.write_attribute("href", item.href);
            if (item.icon) {
                attributes.write_attribute("data-icon", *item.icon);
            }
            attributes.end();
            m_writer.write_inner_text(item.label);
            m_writer.close_tag("a");
        }
        m_writer.close_tag("div");
        m_writer.close_tag("nav");
    }

    void render_block(const ast::Hero_Image& block)
    {
        const std::string_view alt = block.alt ? std::string_view { *block.alt } : "";
        auto attributes = m_writer.open_tag_with_attributes("div");
        attributes.write_attribute("class", "surfdoc-hero-image");
        if (!alt.empty()) {
            attributes.write_attribute("role", "img").write_attribute("aria-label", alt);
        }
        attributes.end();
        m_writer.open_tag_with_attributes("img")
            .write_attribute("src", block.src)
            .write_attribute("alt", alt)
            .end_empty();
        m_writer.close_tag("div");
    }

    void render_block(const ast::Testimonial& block)
    {
        m_writer.open_tag_with_attributes("div")
            .write_attribute("class", "surfdoc-testimonial")
            .write_attribute("role", "figure")
            .write_attribute("aria-label",
                             block.author ? "Testimonial from " + *block.author : "Testimonial")
            .end();
        m_writer.open_tag("blockquote");
        m_writer.write_inner_text(block.text);
        m_writer.close_tag("blockquote");
        if (block.author || block.role || block.company) {
            m_writer.open_tag_with_attributes("div").write_attribute("class", "author").end();
            if (block.author) {
                m_writer.write_inner_text(*block.author);
            }
            std::vector<std::string> details;
            if (block.role) {
                details.push_back(*block.role);
            }
            if (block.company) {
                details.push_back(*block.company);
            }
            if (!details.empty()) {
                m_writer.write_inner_text(" ");
                write_span("role", join(details, ", "));
            }
            m_writer.close_tag("div");
        }
        m_writer.close_tag("div");
    }

    void render_block(const ast::Style& block)
    {
        m_writer.open_tag_with_attributes("div")
            .write_attribute("class", "surfdoc-style")
            .write_attribute("aria-hidden", "true")
            .write_attribute("data-properties", properties_to_data(block.properties))
            .end();
        m_writer.close_tag("div");
    }

    void render_block(const ast::Faq& block)
    {
        m_writer.open_tag_with_attributes("div").write_attribute("class", "surfdoc-faq").end();
        for (const ast::Faq_Item& item : block.items) {
            m_writer.open_tag("details");
            m_writer.open_tag("summary");
            m_writer.write_inner_text(item.question);
            m_writer.close_tag("summary");
            m_writer.open_tag_with_attributes("div").write_attribute("class", "faq-answer").end();
            m_writer.write_inner_text(item.answer);
            m_writer.close_tag("div");
            m_writer.close_tag("details");
        }
        m_writer.close_tag("div");
    }

    void render_block(const ast::Pricing_Table& block)
    {
        m_writer.open_tag_with_attributes("table")
            .write_attribute("class", "surfdoc-pricing")
            .write_attribute("aria-label", "Pricing comparison")
            .end();
        write_table_content(block.table);
        m_writer.close_tag("table");
    }

    void render_block(const ast::Site& block)
    {
        auto attributes = m_writer.open_tag_with_attributes("div");
        attributes.write_attribute("class", "surfdoc-site").write_attribute("aria-hidden", "true");
        if (block.domain) {
            attributes.write_attribute("data-domain", *block.domain);
        }
        attributes.write_attribute("data-properties", properties_to_data(block.properties)).end();
        m_writer.close_tag("div");
        m_writer.write_line_break();
        render_blocks(block.children);
    }

    void render_block(const ast::Page& block)
    {
        auto attributes = m_writer.open_tag_with_attributes("section");
        attributes.write_attribute("class", "surfdoc-page");
        if (block.layout) {
            attributes.write_attribute("data-layout", *block.layout);
        }
        attributes.write_attribute("data-route", block.route);
        attributes.write_attribute("aria-label", block.title ? *block.title : "Page: " + block.route);
        attributes.end();
        m_writer.write_line_break();
        render_blocks(block.children);
        m_writer.close_tag("section");
    }

    void render_block(const ast::Unknown& block)
    {
        m_writer.open_tag_with_attributes("div")
            .write_attribute("class", "surfdoc-unknown")
            .write_attribute("role", "note")
            .write_attribute("data-name", block.tag)
            .end();
        m_writer.write_inner_text(block.body);
        m_writer.close_tag("div");
    }

    // UTILITIES ===================================================================================

    void write_paragraph(std::string_view text)
    {
        m_writer.open_tag("p");
        m_writer.write_inner_text(text);
        m_writer.close_tag("p");
    }

    void write_span(std::string_view css_class, std::string_view text)
    {
        m_writer.open_tag_with_attributes("span").write_attribute("class", css_class).end();
        m_writer.write_inner_text(text);
        m_writer.close_tag("span");
    }

    void write_table_content(const ast::Table& table)
    {
        if (!table.headers.empty()) {
            m_writer.open_tag("thead");
            m_writer.open_tag("tr");
            for (const std::string& header : table.headers) {
                m_writer.open_tag_with_attributes("th").write_attribute("scope", "col").end();
                m_writer.write_inner_text(header);
                m_writer.close_tag("th");
            }
            m_writer.close_tag("tr");
            m_writer.close_tag("thead");
        }
        m_writer.open_tag("tbody");
        for (const ast::Table_Row& row : table.rows) {
            m_writer.open_tag("tr");
            for (const std::string& cell : row.cells) {
                m_writer.open_tag("td");
                m_writer.write_inner_text(cell);
                m_writer.close_tag("td");
            }
            m_writer.close_tag("tr");
        }
        m_writer.close_tag("tbody");
    }
};

std::string_view resolve_title(const Document& document, const Render_Config& config)
{
    if (!config.title.empty()) {
        return config.title;
    }
    if (const auto it = document.front_matter.find("title"); it != document.front_matter.end()) {
        return it->second;
    }
    return "SurfDoc";
}

} // namespace

void collect_style_overrides(Style_Overrides& out, std::span<const ast::Property> properties)
{
    const auto apply_font = [&out](std::string_view value, bool heading, bool body) {
        const std::optional<Font_Preset> preset = font_preset_by_name(value);
        if (!preset) {
            return;
        }
        if (heading) {
            out.declarations += "--font-heading: ";
            out.declarations += preset->stack;
            out.declarations += ';';
        }
        if (body) {
            out.declarations += "--font-body: ";
            out.declarations += preset->stack;
            out.declarations += ';';
        }
        add_font_import(out, preset->import_url);
    };

    for (const ast::Property& property : properties) {
        if (property.key == "accent") {
            if (is_css_safe_value(property.value)) {
                out.declarations += "--accent: ";
                out.declarations += property.value;
                out.declarations += ';';
            }
        }
        else if (property.key == "font") {
            apply_font(property.value, true, true);
        }
        else if (property.key == "heading-font") {
            apply_font(property.value, true, false);
        }
        else if (property.key == "body-font") {
            apply_font(property.value, false, true);
        }
    }
}

void write_style_overrides(HTML_Writer& writer, const Style_Overrides& overrides)
{
    // @import must precede all other rules, so every import gets its own element.
    for (const std::string_view url : overrides.font_imports) {
        writer.open_tag("style");
        writer.write_inner_html("@import url('");
        writer.write_inner_html(url);
        writer.write_inner_html("');");
        writer.close_tag("style");
        writer.write_line_break();
    }
    if (!overrides.declarations.empty()) {
        writer.open_tag("style");
        writer.write_inner_html(":root { ");
        writer.write_inner_html(overrides.declarations);
        writer.write_inner_html(" }");
        writer.close_tag("style");
        writer.write_line_break();
    }
}

std::string html_stylesheet(Theme theme)
{
    std::string result { theme == Theme::dark ? dark_palette : light_palette };
    result += font_variables;
    result += stylesheet_rules;
    result += site_navigation_rules;
    return result;
}

void open_html_page(HTML_Writer& writer,
                    const Render_Config& config,
                    std::string_view title,
                    std::string_view extra_css)
{
    writer.write_comment("Built with SurfDoc, source: " + config.source_path);
    writer.write_line_break();
    writer.write_preamble();
    writer.open_tag_with_attributes("html").write_attribute("lang", config.lang).end();
    writer.write_line_break();
    writer.open_tag("head");
    writer.write_line_break();

    writer.open_tag_with_attributes("meta").write_attribute("charset", "utf-8").end_empty();
    writer.write_line_break();
    writer.open_tag_with_attributes("meta")
        .write_attribute("name", "viewport")
        .write_attribute("content", "width=device-width, initial-scale=1")
        .end_empty();
    writer.write_line_break();
    writer.open_tag_with_attributes("meta")
        .write_attribute("name", "generator")
        .write_attribute("content", "SurfDoc v0.1")
        .end_empty();
    writer.write_line_break();
    if (!config.source_path.empty()) {
        writer.open_tag_with_attributes("link")
            .write_attribute("rel", "alternate")
            .write_attribute("type", "text/surfdoc")
            .write_attribute("href", config.source_path)
            .end_empty();
        writer.write_line_break();
    }
    writer.open_tag("title");
    writer.write_inner_text(title);
    writer.close_tag("title");
    writer.write_line_break();
    if (!config.description.empty()) {
        writer.open_tag_with_attributes("meta")
            .write_attribute("name", "description")
            .write_attribute("content", config.description)
            .end_empty();
        writer.write_line_break();
    }
    if (!config.canonical_url.empty()) {
        writer.open_tag_with_attributes("link")
            .write_attribute("rel", "canonical")
            .write_attribute("href", config.canonical_url)
            .end_empty();
        writer.write_line_break();
    }
    if (config.stylesheet == Stylesheet_Mode::inline_css || !extra_css.empty()) {
        writer.open_tag("style");
        if (config.stylesheet == Stylesheet_Mode::inline_css) {
            writer.write_inner_html(html_stylesheet(config.theme));
        }
        writer.write_inner_html(extra_css);
        writer.close_tag("style");
        writer.write_line_break();
    }

    writer.close_tag("head");
    writer.write_line_break();
    writer.open_tag("body");
    writer.write_line_break();
}

void close_html_page(HTML_Writer& writer)
{
    writer.close_tag("body");
    writer.write_line_break();
    writer.close_tag("html");
    writer.write_line_break();
}

void render_html_blocks(HTML_Writer& writer,
                        std::span<const ast::Block> blocks,
                        const Markdown_Engine& engine)
{
    HTML_Renderer renderer { writer, engine };
    renderer.render_blocks(blocks);
    renderer.finish();
}

void render_html(Code_String& out,
                 const Document& document,
                 const Render_Config& config,
                 const Markdown_Engine& engine)
{
    Style_Overrides overrides;
    for (const ast::Block& block : document.blocks) {
        if (const auto* const style = std::get_if<ast::Style>(&block)) {
            collect_style_overrides(overrides, style->properties);
        }
        else if (const auto* const site = std::get_if<ast::Site>(&block)) {
            collect_style_overrides(overrides, site->properties);
        }
    }

    HTML_Writer writer { out };
    if (config.full_page) {
        open_html_page(writer, config, resolve_title(document, config));
    }
    else if (config.stylesheet == Stylesheet_Mode::inline_css) {
        writer.open_tag("style");
        writer.write_inner_html(html_stylesheet(config.theme));
        writer.close_tag("style");
        writer.write_line_break();
    }
    write_style_overrides(writer, overrides);

    if (config.full_page) {
        writer.open_tag_with_attributes("article").write_attribute("class", "surfdoc").end();
        writer.write_line_break();
        render_html_blocks(writer, document.blocks, engine);
        writer.close_tag("article");
        writer.write_line_break();
        close_html_page(writer);
    }
    else {
        render_html_blocks(writer, document.blocks, engine);
    }
    SURFDOC_ASSERT(writer.is_done());
}

} // namespace surfdoc
