#include <algorithm>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "surf/block_type.hpp"
#include "surf/parsing/attribute_parser.hpp"
#include "surf/parsing/build.hpp"
#include "surf/parsing/inline_extension.hpp"
#include "surf/parsing/scan.hpp"
#include "surf/validate.hpp"

namespace surfdoc {

namespace {

struct Body_Line {
    /// @brief The contents of the line, without `\n` or a trailing `\r`.
    std::string_view text;
    /// @brief The offset of the line within the text it was taken from.
    Size offset;
    Local_Source_Span pos;
};

[[nodiscard]] std::vector<Body_Line> split_body_lines(std::string_view text,
                                                      Local_Source_Position base)
{
    std::vector<Body_Line> result;
    Size begin = 0;
    Size line = 0;
    while (begin < text.length()) {
        const Size newline = text.find('\n', begin);
        const Size end = newline == std::string_view::npos ? text.length() : newline;
        std::string_view contents = text.substr(begin, end - begin);
        if (contents.ends_with('\r')) {
            contents.remove_suffix(1);
        }
        const Local_Source_Position local { .line = line, .column = 0, .begin = begin };
        result.push_back({ contents, begin, { local.relative_to(base), contents.length() } });
        begin = end + 1;
        ++line;
    }
    return result;
}

/// @brief Returns the document position of the character at `offset` within `text`.
[[nodiscard]] Local_Source_Position
position_at(std::string_view text, Local_Source_Position base, Size offset)
{
    SURFDOC_ASSERT(offset <= text.length());
    const std::string_view before = text.substr(0, offset);
    const auto line = Size(std::ranges::count(before, '\n'));
    const Size line_begin = line == 0 ? 0 : before.rfind('\n') + 1;
    const Local_Source_Position local { .line = line,
                                        .column = offset - line_begin,
                                        .begin = offset };
    return local.relative_to(base);
}

[[nodiscard]] std::string normalize_line_endings(std::string_view text)
{
    std::string result;
    result.reserve(text.length());
    for (Size i = 0; i < text.length(); ++i) {
        if (text[i] == '\r' && (i + 1 == text.length() || text[i + 1] == '\n')) {
            continue;
        }
        result.push_back(text[i]);
    }
    return result;
}

/// @brief Removes leading blank lines and trailing whitespace.
/// Indentation of the first non-blank line is kept.
[[nodiscard]] std::string_view trim_blank_lines(std::string_view text)
{
    Size begin = 0;
    while (begin < text.length()) {
        const Size newline = text.find('\n', begin);
        const Size end = newline == std::string_view::npos ? text.length() : newline;
        if (!is_blank(text.substr(begin, end - begin))) {
            break;
        }
        begin = end + 1;
    }
    if (begin >= text.length()) {
        return {};
    }
    return trim_right(text.substr(begin));
}

[[nodiscard]] std::string leaf_text(std::string_view body)
{
    return normalize_line_endings(trim_blank_lines(body));
}

/// @brief Matches a level 2 or 3 markdown heading such as `## Pricing`.
/// @return the heading text, or `std::nullopt` if `line` is no such heading
[[nodiscard]] std::optional<std::string_view> match_section_heading(std::string_view line)
{
    line = trim_left(line);
    const Size level = std::min(line.find_first_not_of('#'), line.length());
    if (level < 2 || level > 3 || level == line.length() || !is_space(line[level])) {
        return {};
    }
    std::string_view label = trim(line.substr(level));
    // Closing sequence, as in `## Title ##`.
    const Size closing = label.find_last_not_of('#');
    if (closing != std::string_view::npos && closing + 1 != label.length()
        && is_space(label[closing])) {
        label = trim_right(label.substr(0, closing));
    }
    return label;
}

/// @brief Tracks fenced code blocks within markdown so that their contents are not mistaken for
/// headings or separators.
struct Code_Fence_Tracker {
    bool in_fence = false;

    /// @brief Returns `true` if `line` is ordinary markdown outside of a code block.
    bool is_markdown_line(std::string_view line)
    {
        const std::string_view trimmed = trim_left(line);
        if (trimmed.starts_with("```") || trimmed.starts_with("~~~")) {
            in_fence = !in_fence;
            return false;
        }
        return !in_fence;
    }
};

[[nodiscard]] bool is_table_separator_row(std::string_view line)
{
    return line.find('-') != std::string_view::npos
        && line.find_first_not_of("|-: \t") == std::string_view::npos;
}

[[nodiscard]] std::vector<std::string> split_pipe_row(std::string_view row)
{
    row = trim(row);
    if (row.starts_with('|')) {
        row.remove_prefix(1);
    }
    if (row.ends_with('|') && !row.ends_with("\\|")) {
        row.remove_suffix(1);
    }

    std::vector<std::string> cells;
    std::string cell;
    for (Size i = 0; i < row.length(); ++i) {
        if (row[i] == '\\' && i + 1 < row.length() && row[i + 1] == '|') {
            cell.push_back('|');
            ++i;
        }
        else if (row[i] == '|') {
            cells.emplace_back(trim(cell));
            cell.clear();
        }
        else {
            cell.push_back(row[i]);
        }
    }
    cells.emplace_back(trim(cell));
    return cells;
}

[[nodiscard]] std::vector<std::string> split_csv_row(std::string_view row)
{
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (Size i = 0; i < row.length(); ++i) {
        const char c = row[i];
        if (quoted) {
            if (c == '"' && i + 1 < row.length() && row[i + 1] == '"') {
                cell.push_back('"');
                ++i;
            }
            else if (c == '"') {
                quoted = false;
            }
            else {
                cell.push_back(c);
            }
        }
        else if (c == '"') {
            quoted = true;
        }
        else if (c == ',') {
            cells.emplace_back(trim(cell));
            cell.clear();
        }
        else {
            cell.push_back(c);
        }
    }
    cells.emplace_back(trim(cell));
    return cells;
}

/// @brief Matches a `key: value` line.
[[nodiscard]] std::optional<ast::Property> match_property(std::string_view line)
{
    line = trim(line);
    const Size colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return {};
    }
    const std::string_view key = trim_right(line.substr(0, colon));
    if (key.find_first_of(" \t") != std::string_view::npos) {
        return {};
    }
    std::string_view value = trim(line.substr(colon + 1));
    if (value.length() >= 2
        && ((value.front() == '"' && value.back() == '"')
            || (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.length() - 2);
    }
    return ast::Property { std::string(key), std::string(value) };
}

[[nodiscard]] std::vector<ast::Property> parse_properties(std::string_view text)
{
    std::vector<ast::Property> result;
    for (const Body_Line& line : split_body_lines(text, {})) {
        const std::string_view trimmed = trim(line.text);
        if (trimmed.empty() || trimmed.starts_with('#')) {
            continue;
        }
        if (std::optional<ast::Property> property = match_property(trimmed)) {
            result.push_back(std::move(*property));
        }
    }
    return result;
}

[[nodiscard]] std::optional<std::string> get_text_any(const Attribute_List& attributes,
                                                      std::span<const std::string_view> keys)
{
    const Attribute* const attribute = attributes.find_any(keys);
    return attribute ? attribute->value.to_text() : std::nullopt;
}

constexpr std::string_view attribution_keys[] { "by", "attribution", "author" };
constexpr std::string_view cite_keys[] { "cite", "source" };
constexpr std::string_view author_keys[] { "author", "name" };
constexpr std::string_view role_keys[] { "role", "title" };
constexpr std::string_view company_keys[] { "company", "org" };

/// @brief A section of a container body which becomes a tab panel or a column.
struct Body_Section {
    std::string label;
    Size begin;
    Size end;
    Local_Source_Span pos;
};

/// @brief Containers with this many enclosing containers are kept as raw text.
/// This is one level beyond the point where validation reports the nesting as too deep,
/// so the report always has a container to point at.
constexpr Size max_built_depth = max_nesting_depth + 1;

struct [[nodiscard]] Block_Builder {
private:
    std::vector<Diagnostic>& m_diagnostics;
    /// @brief The number of containers enclosing the directive currently being built.
    Size m_depth = 0;

    struct [[nodiscard]] Depth_Guard {
        Size& depth;

        explicit Depth_Guard(Size& counter)
            : depth(++counter)
        {
        }

        ~Depth_Guard()
        {
            --depth;
        }

        Depth_Guard(const Depth_Guard&) = delete;
        Depth_Guard& operator=(const Depth_Guard&) = delete;
    };

public:
    explicit Block_Builder(std::vector<Diagnostic>& diagnostics)
        : m_diagnostics(diagnostics)
    {
    }

    std::vector<ast::Block> build_region(std::string_view text, Local_Source_Position base)
    {
        return build_spans(scan(text, base, m_diagnostics));
    }

private:
    // UTILITIES ===================================================================================

    std::vector<ast::Block> build_spans(const std::vector<Scanned_Span>& spans)
    {
        std::vector<ast::Block> result;
        result.reserve(spans.size());
        for (const Scanned_Span& span : spans) {
            result.push_back(build_span(span));
        }
        return result;
    }

    ast::Block build_span(const Scanned_Span& span)
    {
        if (const auto* prose = std::get_if<Prose_Span>(&span)) {
            ast::Markdown result {};
            result.m_pos = prose->pos;
            result.text = normalize_line_endings(prose->text);
            result.extensions = scan_inline_extensions(result.text);
            return result;
        }
        return build_directive(std::get<Directive_Span>(span));
    }

    Attribute_List parse_directive_attributes(const Directive_Span& span)
    {
        if (span.attribute_text) {
            return parse_attributes(*span.attribute_text, span.attribute_pos, m_diagnostics);
        }
        Attribute_List result;
        result.pos = { span.attribute_pos, 0 };
        return result;
    }

    template <typename T>
    T make_directive(const Directive_Span& span, Attribute_List&& attributes)
    {
        T result {};
        result.m_pos = span.pos;
        result.attributes = std::move(attributes);
        result.colon_count = span.colon_count;
        return result;
    }

    // DIRECTIVES ==================================================================================

    ast::Block build_directive(const Directive_Span& span)
    {
        Attribute_List attributes = parse_directive_attributes(span);
        const Block_Type type = block_type_by_tag(span.tag).value_or(Block_Type::unknown);
        if (is_container(type)) {
            if (m_depth >= max_built_depth) {
                return build_unknown(span, std::move(attributes));
            }
            const Depth_Guard guard { m_depth };
            return build_container(type, span, std::move(attributes));
        }

        switch (type) {
        case Block_Type::markdown: break;
        case Block_Type::callout: return build_callout(span, std::move(attributes));
        case Block_Type::data: return build_data(span, std::move(attributes));
        case Block_Type::code: return build_code(span, std::move(attributes));
        case Block_Type::tasks: return build_tasks(span, std::move(attributes));
        case Block_Type::decision: return build_decision(span, std::move(attributes));
        case Block_Type::metric: return build_metric(span, std::move(attributes));
        case Block_Type::summary: {
            auto result = make_directive<ast::Summary>(span, std::move(attributes));
            result.text = leaf_text(span.body);
            return result;
        }
        case Block_Type::figure: return build_figure(span, std::move(attributes));
        case Block_Type::quote: return build_quote(span, std::move(attributes));
        case Block_Type::cta: return build_cta(span, std::move(attributes));
        case Block_Type::nav: return build_nav(span, std::move(attributes));
        case Block_Type::hero_image: {
            auto result = make_directive<ast::Hero_Image>(span, std::move(attributes));
            result.src = result.attributes.get_text("src").value_or("");
            result.alt = result.attributes.get_text("alt");
            return result;
        }
        case Block_Type::testimonial: return build_testimonial(span, std::move(attributes));
        case Block_Type::style: {
            auto result = make_directive<ast::Style>(span, std::move(attributes));
            result.properties = parse_properties(span.body);
            return result;
        }
        case Block_Type::faq: return build_faq(span, std::move(attributes));
        case Block_Type::pricing_table: {
            auto result = make_directive<ast::Pricing_Table>(span, std::move(attributes));
            result.table = parse_pipe_table(span.body, span.body_pos);
            return result;
        }
        case Block_Type::unknown: return build_unknown(span, std::move(attributes));
        case Block_Type::tabs:
        case Block_Type::columns:
        case Block_Type::site:
        case Block_Type::page: break;
        }
        SURFDOC_ASSERT_UNREACHABLE("Containers and markdown are handled elsewhere.");
    }

    ast::Block build_container(Block_Type type, const Directive_Span& span, Attribute_List&& attributes)
    {
        switch (type) {
        case Block_Type::tabs: return build_tabs(span, std::move(attributes));
        case Block_Type::columns: return build_columns(span, std::move(attributes));
        case Block_Type::site: return build_site(span, std::move(attributes));
        case Block_Type::page: return build_page(span, std::move(attributes));
        default: break;
        }
        SURFDOC_ASSERT_UNREACHABLE("Invalid container type.");
    }

    /// @brief Builds a directive whose body is kept verbatim.
    /// This applies to unrecognized tags and to containers nested beyond `max_built_depth`.
    ast::Block build_unknown(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Unknown>(span, std::move(attributes));
        result.tag = std::string(span.tag);
        result.body = std::string(span.body);
        result.opening_line = std::string(span.opening_line);
        result.closing_line = std::string(span.closing_line);
        return result;
    }

    ast::Block build_callout(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Callout>(span, std::move(attributes));
        if (const std::optional<std::string> type = result.attributes.get_text("type")) {
            result.type = callout_type_by_name(*type).value_or(Callout_Type::info);
        }
        result.title = result.attributes.get_text("title");
        result.text = leaf_text(span.body);
        return result;
    }

    ast::Block build_data(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Data>(span, std::move(attributes));
        if (const std::optional<std::string> format = result.attributes.get_text("format")) {
            result.format = data_format_by_name(*format).value_or(Data_Format::table);
        }
        result.sortable = result.attributes.get_bool("sortable").value_or(false);
        result.id = result.attributes.get_text("id");
        result.raw = std::string(span.body);
        switch (result.format) {
        case Data_Format::table: result.table = parse_pipe_table(span.body, span.body_pos); break;
        case Data_Format::csv: result.table = parse_csv_table(span.body, span.body_pos); break;
        case Data_Format::json: break;
        }
        return result;
    }

    ast::Block build_code(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Code>(span, std::move(attributes));
        result.lang = result.attributes.get_text("lang");
        result.file = result.attributes.get_text("file");
        result.highlight = result.attributes.get_list("highlight").value_or(std::vector<std::string> {});
        result.text = leaf_text(span.body);
        return result;
    }

    ast::Block build_tasks(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Tasks>(span, std::move(attributes));
        for (const Body_Line& line : split_body_lines(span.body, span.body_pos)) {
            const std::string_view trimmed = trim(line.text);
            if (trimmed.length() < 5 || !(trimmed[0] == '-' || trimmed[0] == '*')
                || trimmed.substr(1, 2) != " [" || trimmed[4] != ']') {
                continue;
            }
            const char mark = trimmed[3];
            if (mark != ' ' && mark != 'x' && mark != 'X') {
                continue;
            }
            ast::Task_Item item { .done = mark != ' ',
                                  .text = std::string(trim(trimmed.substr(5))),
                                  .assignee = {} };
            const Size last_space = item.text.find_last_of(" \t");
            const Size token_begin = last_space == std::string::npos ? 0 : last_space + 1;
            if (item.text.length() > token_begin + 1 && item.text[token_begin] == '@') {
                item.assignee = item.text.substr(token_begin + 1);
                item.text = std::string(trim_right(std::string_view(item.text).substr(0, token_begin)));
            }
            result.items.push_back(std::move(item));
        }
        return result;
    }

    ast::Block build_decision(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Decision>(span, std::move(attributes));
        if (const std::optional<std::string> status = result.attributes.get_text("status")) {
            result.status = decision_status_by_name(*status).value_or(Decision_Status::proposed);
        }
        result.date = result.attributes.get_text("date");
        result.deciders = result.attributes.get_list("deciders").value_or(std::vector<std::string> {});
        result.options = result.attributes.get_list("options").value_or(std::vector<std::string> {});
        result.outcome = result.attributes.get_text("outcome");
        result.text = leaf_text(span.body);
        return result;
    }

    ast::Block build_metric(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Metric>(span, std::move(attributes));
        result.label = result.attributes.get_text("label").value_or("");
        result.value = result.attributes.get_text("value").value_or("");
        if (const std::optional<std::string> trend = result.attributes.get_text("trend")) {
            result.trend = trend_by_name(*trend);
        }
        result.unit = result.attributes.get_text("unit");
        return result;
    }

    ast::Block build_figure(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Figure>(span, std::move(attributes));
        result.src = result.attributes.get_text("src").value_or("");
        result.alt = result.attributes.get_text("alt");
        result.caption = result.attributes.get_text("caption");
        result.width = result.attributes.get_text("width");
        return result;
    }

    ast::Block build_quote(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Quote>(span, std::move(attributes));
        result.attribution = get_text_any(result.attributes, attribution_keys);
        result.cite = get_text_any(result.attributes, cite_keys);
        result.text = leaf_text(span.body);
        return result;
    }

    ast::Block build_cta(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Cta>(span, std::move(attributes));
        result.label = result.attributes.get_text("label").value_or("");
        result.href = result.attributes.get_text("href").value_or("");
        result.primary = result.attributes.get_bool("primary").value_or(false);
        result.icon = result.attributes.get_text("icon");
        return result;
    }

    /// @brief Builds a navigation bar whose body lists one link per line, such as
    /// `- [Docs](/docs) [icon=book]`.
    /// The list marker and the trailing attribute list are optional; other lines are ignored.
    ast::Block build_nav(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Nav>(span, std::move(attributes));
        result.logo = result.attributes.get_text("logo");
        for (const Body_Line& line : split_body_lines(span.body, span.body_pos)) {
            if (std::optional<ast::Nav_Item> item = match_nav_item(line)) {
                result.items.push_back(std::move(*item));
            }
        }
        return result;
    }

    std::optional<ast::Nav_Item> match_nav_item(const Body_Line& line)
    {
        std::string_view rest = trim(line.text);
        if (rest.starts_with("- ") || rest.starts_with("* ")) {
            rest = trim_left(rest.substr(2));
        }
        if (!rest.starts_with('[')) {
            return {};
        }
        const Size label_end = rest.find("](");
        if (label_end == std::string_view::npos) {
            return {};
        }
        const Size href_end = rest.find(')', label_end + 2);
        if (href_end == std::string_view::npos) {
            return {};
        }
        ast::Nav_Item result { .label = std::string(trim(rest.substr(1, label_end - 1))),
                               .href = std::string(trim(rest.substr(label_end + 2,
                                                                    href_end - label_end - 2))),
                               .icon = {},
                               .pos = line.pos };

        const std::string_view trailer = trim(rest.substr(href_end + 1));
        if (trailer.empty()) {
            return result;
        }
        if (trailer.length() < 2 || !trailer.starts_with('[') || !trailer.ends_with(']')) {
            return {};
        }
        const auto trailer_offset = Size(trailer.data() - line.text.data()) + 1;
        const Attribute_List item_attributes = parse_attributes(
            trailer.substr(1, trailer.length() - 2),
            position_at(line.text, line.pos, trailer_offset), m_diagnostics);
        result.icon = item_attributes.get_text("icon");
        return result;
    }

    ast::Block build_testimonial(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Testimonial>(span, std::move(attributes));
        result.author = get_text_any(result.attributes, author_keys);
        result.role = get_text_any(result.attributes, role_keys);
        result.company = get_text_any(result.attributes, company_keys);
        result.text = leaf_text(span.body);
        return result;
    }

    ast::Block build_faq(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Faq>(span, std::move(attributes));
        std::string answer;
        const auto finish_item = [&] {
            if (!result.items.empty()) {
                result.items.back().answer = leaf_text(answer);
            }
            answer.clear();
        };

        Code_Fence_Tracker fences;
        for (const Body_Line& line : split_body_lines(span.body, span.body_pos)) {
            if (fences.is_markdown_line(line.text)) {
                if (const std::optional<std::string_view> question = match_section_heading(line.text)) {
                    finish_item();
                    result.items.push_back(
                        { .question = std::string(*question), .answer = {}, .pos = line.pos });
                    continue;
                }
            }
            if (!result.items.empty()) {
                answer.append(line.text);
                answer.push_back('\n');
            }
        }
        finish_item();
        return result;
    }

    ast::Block build_page(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Page>(span, std::move(attributes));
        result.title = result.attributes.get_text("title");
        if (std::optional<std::string> route = result.attributes.get_text("route")) {
            result.route = std::move(*route);
        }
        else {
            result.route = "/" + (result.title ? slugify(*result.title) : std::string {});
        }
        result.layout = result.attributes.get_text("layout");
        result.sidebar = result.attributes.get_bool("sidebar").value_or(false);
        result.order = result.attributes.get_integer("order");
        result.children = build_region(span.body, span.body_pos);
        return result;
    }

    ast::Block build_site(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Site>(span, std::move(attributes));
        result.domain = result.attributes.get_text("domain");

        for (const Scanned_Span& child : scan(span.body, span.body_pos, m_diagnostics)) {
            const auto* const prose = std::get_if<Prose_Span>(&child);
            if (prose == nullptr) {
                result.children.push_back(build_span(child));
                continue;
            }
            // Prose which consists only of `key: value` lines configures the site.
            const std::vector<Body_Line> lines = split_body_lines(prose->text, {});
            const bool is_configuration = std::ranges::all_of(lines, [](const Body_Line& line) {
                const std::string_view trimmed = trim(line.text);
                return trimmed.empty() || trimmed.starts_with('#') || match_property(trimmed);
            });
            if (!is_configuration) {
                result.children.push_back(build_span(child));
                continue;
            }
            std::vector<ast::Property> properties = parse_properties(prose->text);
            std::ranges::move(properties, std::back_inserter(result.properties));
        }
        return result;
    }

    // SECTIONED CONTAINERS ========================================================================

    /// @brief Returns `true` if some top-level directive of `spans` has the tag `tag`.
    [[nodiscard]] static bool contains_directive(const std::vector<Scanned_Span>& spans,
                                                 std::string_view tag)
    {
        return std::ranges::any_of(spans, [tag](const Scanned_Span& span) {
            const auto* const directive = std::get_if<Directive_Span>(&span);
            return directive != nullptr && equals_ignore_case(directive->tag, tag);
        });
    }

    /// @brief Splits `body` at lines of its top-level prose for which `match` returns a label.
    /// The text before the first such line becomes a section with `default_label` unless it is
    /// blank.
    /// @param match returns the label of a section starting at the given line, if any
    template <typename Match>
    [[nodiscard]] std::vector<Body_Section> split_sections(const Directive_Span& span,
                                                           const std::vector<Scanned_Span>& spans,
                                                           Match match)
    {
        struct Boundary {
            std::optional<std::string> label;
            Size line_begin;
            Size content_begin;
            Local_Source_Span pos;
        };

        const std::string_view body = span.body;
        std::vector<Boundary> boundaries;
        for (const Scanned_Span& scanned : spans) {
            const auto* const prose = std::get_if<Prose_Span>(&scanned);
            if (prose == nullptr) {
                continue;
            }
            const auto prose_offset = Size(prose->text.data() - body.data());
            Code_Fence_Tracker fences;
            for (const Body_Line& line : split_body_lines(prose->text, prose->pos)) {
                if (!fences.is_markdown_line(line.text)) {
                    continue;
                }
                if (std::optional<std::string> label = match(line.text)) {
                    const Size line_begin = prose_offset + line.offset;
                    const Size content_begin
                        = std::min(line_begin + line.text.length() + 1, body.length());
                    boundaries.push_back({ std::move(label), line_begin, content_begin, line.pos });
                }
            }
        }

        std::vector<Body_Section> result;
        const auto add_section = [&](std::string label, Size begin, Size end,
                                     std::optional<Local_Source_Span> pos) {
            const std::string_view text = body.substr(begin, end - begin);
            if (!pos && is_blank(text)) {
                return;
            }
            const Local_Source_Span section_pos
                = pos ? *pos : Local_Source_Span { position_at(body, span.body_pos, begin), end - begin };
            result.push_back({ std::move(label), begin, end, section_pos });
        };

        const Size first_end = boundaries.empty() ? body.length() : boundaries.front().line_begin;
        add_section({}, 0, first_end, std::nullopt);
        for (Size i = 0; i < boundaries.size(); ++i) {
            const Size end = i + 1 < boundaries.size() ? boundaries[i + 1].line_begin : body.length();
            add_section(*boundaries[i].label,
                        boundaries[i].content_begin,
                        std::max(end, boundaries[i].content_begin),
                        boundaries[i].pos);
        }
        return result;
    }

    ast::Block build_tabs(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Tabs>(span, std::move(attributes));
        std::vector<Diagnostic> scan_diagnostics;
        const std::vector<Scanned_Span> spans = scan(span.body, span.body_pos, scan_diagnostics);

        const auto default_label = [&result] {
            return "Tab " + std::to_string(result.panels.size() + 1);
        };

        if (contains_directive(spans, "tab")) {
            m_diagnostics.insert(m_diagnostics.end(), scan_diagnostics.begin(), scan_diagnostics.end());
            for (const Scanned_Span& scanned : spans) {
                const auto* const directive = std::get_if<Directive_Span>(&scanned);
                if (directive != nullptr && equals_ignore_case(directive->tag, "tab")) {
                    const Attribute_List panel_attributes = parse_directive_attributes(*directive);
                    ast::Tab_Panel panel;
                    panel.m_pos = directive->pos;
                    constexpr std::string_view label_keys[] { "label", "title" };
                    panel.label = get_text_any(panel_attributes, label_keys).value_or(default_label());
                    panel.children = build_region(directive->body, directive->body_pos);
                    result.panels.push_back(std::move(panel));
                    continue;
                }
                if (result.panels.empty()) {
                    ast::Tab_Panel panel;
                    panel.m_pos = span.pos;
                    panel.label = default_label();
                    result.panels.push_back(std::move(panel));
                }
                result.panels.back().children.push_back(build_span(scanned));
            }
            return result;
        }

        const auto match_heading = [](std::string_view line) -> std::optional<std::string> {
            if (const std::optional<std::string_view> label = match_section_heading(line)) {
                return std::string(*label);
            }
            return std::nullopt;
        };
        for (Body_Section& section : split_sections(span, spans, match_heading)) {
            ast::Tab_Panel panel;
            panel.m_pos = section.pos;
            panel.label = section.label.empty() ? default_label() : std::move(section.label);
            panel.children = build_region(span.body.substr(section.begin, section.end - section.begin),
                                          position_at(span.body, span.body_pos, section.begin));
            result.panels.push_back(std::move(panel));
        }
        return result;
    }

    ast::Block build_columns(const Directive_Span& span, Attribute_List&& attributes)
    {
        auto result = make_directive<ast::Columns>(span, std::move(attributes));
        std::vector<Diagnostic> scan_diagnostics;
        const std::vector<Scanned_Span> spans = scan(span.body, span.body_pos, scan_diagnostics);

        if (contains_directive(spans, "column")) {
            m_diagnostics.insert(m_diagnostics.end(), scan_diagnostics.begin(), scan_diagnostics.end());
            for (const Scanned_Span& scanned : spans) {
                const auto* const directive = std::get_if<Directive_Span>(&scanned);
                if (directive != nullptr && equals_ignore_case(directive->tag, "column")) {
                    // Column attributes carry no meaning, but they are still checked for syntax.
                    static_cast<void>(parse_directive_attributes(*directive));
                    ast::Column column;
                    column.m_pos = directive->pos;
                    column.children = build_region(directive->body, directive->body_pos);
                    result.columns.push_back(std::move(column));
                    continue;
                }
                if (result.columns.empty()) {
                    ast::Column column;
                    column.m_pos = span.pos;
                    result.columns.push_back(std::move(column));
                }
                result.columns.back().children.push_back(build_span(scanned));
            }
            return result;
        }

        // Separators start a new column, but carry no label.
        const auto match_separator = [](std::string_view line) -> std::optional<std::string> {
            if (trim(line) == "---") {
                return std::string {};
            }
            return std::nullopt;
        };
        for (const Body_Section& section : split_sections(span, spans, match_separator)) {
            const std::string_view text = span.body.substr(section.begin, section.end - section.begin);
            if (is_blank(text)) {
                continue;
            }
            ast::Column column;
            column.m_pos = section.pos;
            column.children = build_region(text, position_at(span.body, span.body_pos, section.begin));
            result.columns.push_back(std::move(column));
        }
        return result;
    }
};

} // namespace

std::vector<ast::Block>
build_blocks(std::string_view text, Local_Source_Position base, std::vector<Diagnostic>& diagnostics)
{
    return Block_Builder { diagnostics }.build_region(text, base);
}

ast::Table parse_pipe_table(std::string_view text, Local_Source_Position base)
{
    ast::Table result;
    bool has_header = false;
    for (const Body_Line& line : split_body_lines(text, base)) {
        const std::string_view trimmed = trim(line.text);
        if (trimmed.empty() || is_table_separator_row(trimmed)) {
            continue;
        }
        std::vector<std::string> cells = split_pipe_row(trimmed);
        if (!has_header) {
            result.headers = std::move(cells);
            has_header = true;
        }
        else {
            result.rows.push_back({ std::move(cells), line.pos });
        }
    }
    return result;
}

ast::Table parse_csv_table(std::string_view text, Local_Source_Position base)
{
    ast::Table result;
    bool has_header = false;
    for (const Body_Line& line : split_body_lines(text, base)) {
        if (is_blank(line.text)) {
            continue;
        }
        std::vector<std::string> cells = split_csv_row(line.text);
        if (!has_header) {
            result.headers = std::move(cells);
            has_header = true;
        }
        else {
            result.rows.push_back({ std::move(cells), line.pos });
        }
    }
    return result;
}

} // namespace surfdoc
