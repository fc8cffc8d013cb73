#include <algorithm>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "surf/block_type.hpp"
#include "surf/site/site.hpp"
#include "surf/validate.hpp"

namespace surfdoc {

namespace {

/// @brief The kind of value which an attribute accepts.
enum struct Value_Kind : Default_Underlying {
    /// @brief Any scalar.
    text,
    /// @brief `true` or `false`, also as strings.
    boolean,
    /// @brief An integer, also as a string.
    integer,
    /// @brief A list, or a scalar which is taken as comma-separated list.
    list,
    /// @brief A symbol or string from a fixed domain.
    enumeration,
    /// @brief A number, or a string which looks like a metric value (`$1,200`, `99.9%`).
    metric_value,
};

struct Attribute_Rule {
    std::string_view key;
    Value_Kind kind;
    bool required = false;
    bool (*is_in_domain)(std::string_view) = nullptr;
};

[[nodiscard]] bool is_callout_type(std::string_view name)
{
    return callout_type_by_name(name).has_value();
}

[[nodiscard]] bool is_data_format(std::string_view name)
{
    return data_format_by_name(name).has_value();
}

[[nodiscard]] bool is_decision_status(std::string_view name)
{
    return decision_status_by_name(name).has_value();
}

[[nodiscard]] bool is_trend(std::string_view name)
{
    return trend_by_name(name).has_value();
}

using enum Value_Kind;

constexpr Attribute_Rule callout_rules[] {
    { "type", enumeration, true, is_callout_type },
    { "title", text },
};
constexpr Attribute_Rule data_rules[] {
    { "format", enumeration, false, is_data_format },
    { "sortable", boolean },
    { "id", text },
};
constexpr Attribute_Rule code_rules[] {
    { "lang", text },
    { "file", text },
    { "highlight", list },
};
constexpr Attribute_Rule decision_rules[] {
    { "status", enumeration, false, is_decision_status },
    { "date", text },
    { "deciders", list },
    { "options", list },
    { "outcome", text },
};
constexpr Attribute_Rule metric_rules[] {
    { "label", text, true },
    { "value", metric_value, true },
    { "trend", enumeration, false, is_trend },
    { "unit", text },
};
constexpr Attribute_Rule figure_rules[] {
    { "src", text, true },
    { "alt", text },
    { "caption", text },
    { "width", text },
};
constexpr Attribute_Rule quote_rules[] {
    { "by", text },
    { "attribution", text },
    { "author", text },
    { "cite", text },
    { "source", text },
};
constexpr Attribute_Rule cta_rules[] {
    { "label", text, true },
    { "href", text, true },
    { "primary", boolean },
    { "icon", text },
};
constexpr Attribute_Rule nav_rules[] {
    { "logo", text },
};
constexpr Attribute_Rule hero_image_rules[] {
    { "src", text, true },
    { "alt", text },
};
constexpr Attribute_Rule testimonial_rules[] {
    { "author", text },
    { "name", text },
    { "role", text },
    { "title", text },
    { "company", text },
    { "org", text },
};
constexpr Attribute_Rule site_rules[] {
    { "domain", text },
};
constexpr Attribute_Rule page_rules[] {
    { "route", text },
    { "title", text },
    { "layout", text },
    { "sidebar", boolean },
    { "order", integer },
    { "id", text },
};

[[nodiscard]] std::span<const Attribute_Rule> attribute_rules(Block_Type type)
{
    switch (type) {
    case Block_Type::callout: return callout_rules;
    case Block_Type::data: return data_rules;
    case Block_Type::code: return code_rules;
    case Block_Type::decision: return decision_rules;
    case Block_Type::metric: return metric_rules;
    case Block_Type::figure: return figure_rules;
    case Block_Type::quote: return quote_rules;
    case Block_Type::cta: return cta_rules;
    case Block_Type::nav: return nav_rules;
    case Block_Type::hero_image: return hero_image_rules;
    case Block_Type::testimonial: return testimonial_rules;
    case Block_Type::site: return site_rules;
    case Block_Type::page: return page_rules;
    case Block_Type::markdown:
    case Block_Type::tasks:
    case Block_Type::summary:
    case Block_Type::tabs:
    case Block_Type::columns:
    case Block_Type::style:
    case Block_Type::faq:
    case Block_Type::pricing_table:
    case Block_Type::unknown: return {};
    }
    SURFDOC_ASSERT_UNREACHABLE("Invalid block type.");
}

constexpr std::string_view document_types[] {
    "doc", "guide", "conversation", "plan", "agent", "preference", "report", "proposal", "incident",
    "review",
};
constexpr std::string_view document_statuses[] { "draft", "active", "closed", "archived" };
constexpr std::string_view document_scopes[] {
    "personal", "workspace-private", "workspace", "repo", "public",
};
constexpr std::string_view confidence_levels[] { "low", "medium", "high" };

/// @brief A front matter key whose value is restricted to a fixed set of names.
struct Front_Matter_Rule {
    std::string_view key;
    std::span<const std::string_view> domain;
};

constexpr Front_Matter_Rule front_matter_rules[] {
    { "type", document_types },
    { "status", document_statuses },
    { "scope", document_scopes },
    { "confidence", confidence_levels },
};

/// @brief Front matter keys which a document with front matter should have.
constexpr std::string_view expected_front_matter_keys[] { "title", "type" };

[[nodiscard]] std::string_view value_kind_name(Value_Kind kind)
{
    switch (kind) {
    case text: return "a scalar value";
    case boolean: return "a boolean";
    case integer: return "an integer";
    case list: return "a list";
    case enumeration: return "one of a fixed set of names";
    case metric_value: return "a numeric value";
    }
    SURFDOC_ASSERT_UNREACHABLE("Invalid value kind.");
}

[[nodiscard]] bool is_boolean_text(std::string_view text)
{
    return text == "true" || text == "false";
}

[[nodiscard]] bool matches_kind(const Attribute_Value& value, Value_Kind kind)
{
    const Attribute_Value_Type type = value.get_type();
    switch (kind) {
    case text:
    case enumeration: return type != Attribute_Value_Type::list;
    case list: return true;
    case boolean:
        if (type == Attribute_Value_Type::boolean) {
            return true;
        }
        if (type == Attribute_Value_Type::string || type == Attribute_Value_Type::symbol) {
            return is_boolean_text(*value.to_text());
        }
        return false;
    case integer:
        if (type == Attribute_Value_Type::number || type == Attribute_Value_Type::string) {
            return parse_integer(*value.to_text()).has_value();
        }
        return false;
    case metric_value:
        if (type == Attribute_Value_Type::number) {
            return true;
        }
        if (type == Attribute_Value_Type::string) {
            return is_numeric_metric_value(*value.to_text());
        }
        return false;
    }
    SURFDOC_ASSERT_UNREACHABLE("Invalid value kind.");
}

[[nodiscard]] std::string quoted(std::string_view text)
{
    std::string result;
    result.reserve(text.length() + 2);
    result += '\'';
    result += text;
    result += '\'';
    return result;
}

struct [[nodiscard]] Validator {
private:
    const Document& m_document;
    std::vector<Diagnostic> m_diagnostics;
    /// @brief The first occurrence of each `id` attribute.
    std::map<std::string, Local_Source_Span, std::less<>> m_ids;

public:
    explicit Validator(const Document& document)
        : m_document(document)
        , m_diagnostics(document.parse_diagnostics)
    {
    }

    std::vector<Diagnostic> operator()() &&
    {
        validate_front_matter();
        for (const ast::Block& block : m_document.blocks) {
            validate_block(block, nullptr, 0);
        }
        sort_diagnostics(m_diagnostics);
        return std::move(m_diagnostics);
    }

private:
    // UTILITIES ===================================================================================

    void raise(Diagnostic_Code code,
               std::string message,
               Local_Source_Span pos,
               std::optional<Local_Source_Span> related = {})
    {
        m_diagnostics.push_back(
            { .code = code, .message = std::move(message), .pos = pos, .related = related });
    }

    /// @brief Returns the first line of `span`, i.e. the opening line of a directive.
    [[nodiscard]] Local_Source_Span first_line(Local_Source_Span span) const
    {
        const std::string_view source = m_document.source;
        if (span.begin >= source.length()) {
            return span;
        }
        const Size newline = source.find('\n', span.begin);
        const Size end = std::min(newline == std::string_view::npos ? source.length() : newline,
                                  span.end());
        Size length = end - span.begin;
        if (length != 0 && source[span.begin + length - 1] == '\r') {
            --length;
        }
        return span.with_length(length);
    }

    [[nodiscard]] static std::string tag_of(const ast::Block& block)
    {
        if (const auto* const unknown = std::get_if<ast::Unknown>(&block)) {
            return unknown->tag;
        }
        return std::string(block_type_tag(block.get_type()));
    }

    // GENERAL RULES ===============================================================================

    void validate_attributes(const ast::Block& block)
    {
        const Attribute_List* const attributes = ast::get_attributes(block);
        if (attributes == nullptr) {
            return;
        }
        const Local_Source_Span header = first_line(ast::get_source_span(block));

        for (const Attribute_Rule& rule : attribute_rules(block.get_type())) {
            const Attribute* const attribute = attributes->find(rule.key);
            if (attribute == nullptr) {
                if (rule.required) {
                    raise(Diagnostic_Code::required_attribute_missing,
                          "Directive '" + tag_of(block) + "' requires the attribute "
                              + quoted(rule.key) + ".",
                          header);
                }
                continue;
            }
            if (!matches_kind(attribute->value, rule.kind)) {
                raise(Diagnostic_Code::attribute_type_mismatch,
                      "The attribute " + quoted(rule.key) + " of '" + tag_of(block) + "' must be "
                          + std::string(value_kind_name(rule.kind)) + ", but "
                          + attribute->value.to_source() + " is "
                          + std::string(attribute_value_type_name(attribute->value.get_type()))
                          + ".",
                      attribute->pos);
                continue;
            }
            if (rule.is_in_domain != nullptr) {
                const std::string value = *attribute->value.to_text();
                if (!rule.is_in_domain(value)) {
                    raise(Diagnostic_Code::enum_value_invalid,
                          quoted(value) + " is not a valid value for the attribute "
                              + quoted(rule.key) + " of '" + tag_of(block) + "'.",
                          attribute->pos);
                }
            }
        }

        if (const Attribute* const id = attributes->find("id")) {
            validate_id(*id);
        }
    }

    void validate_id(const Attribute& id)
    {
        const std::optional<std::string> text = id.value.to_text();
        if (!text) {
            raise(Diagnostic_Code::attribute_type_mismatch,
                  "The attribute 'id' must be a scalar value, but " + id.value.to_source()
                      + " is a list.",
                  id.pos);
            return;
        }
        const auto [it, inserted] = m_ids.try_emplace(*text, id.pos);
        if (!inserted) {
            raise(Diagnostic_Code::duplicate_id,
                  "The id " + quoted(*text) + " is already used elsewhere in the document.",
                  id.pos,
                  it->second);
        }
    }

    // FRONT MATTER ================================================================================

    void validate_front_matter()
    {
        const Front_Matter& front_matter = m_document.front_matter;
        if (front_matter.empty()) {
            return;
        }
        // Front matter precedes the body, so its diagnostics point at the start of the document.
        constexpr Local_Source_Span start {};

        for (const std::string_view key : expected_front_matter_keys) {
            if (!front_matter.contains(key)) {
                raise(Diagnostic_Code::front_matter_field_missing,
                      "The front matter has no " + quoted(key) + " field.",
                      start);
            }
        }
        for (const Front_Matter_Rule& rule : front_matter_rules) {
            const auto it = front_matter.find(rule.key);
            if (it == front_matter.end()
                || std::ranges::find(rule.domain, it->second) != rule.domain.end()) {
                continue;
            }
            std::string expected;
            for (const std::string_view name : rule.domain) {
                expected += expected.empty() ? "" : ", ";
                expected += name;
            }
            raise(Diagnostic_Code::front_matter_value_invalid,
                  quoted(it->second) + " is not a valid front matter " + quoted(rule.key)
                      + "; expected one of: " + expected + ".",
                  start);
        }
        if (const auto it = front_matter.find("version");
            it != front_matter.end() && !parse_integer(it->second)) {
            raise(Diagnostic_Code::front_matter_value_invalid,
                  "The front matter 'version' must be an integer, but is " + quoted(it->second)
                      + ".",
                  start);
        }
    }

    // BLOCKS ======================================================================================

    /// @param parent the enclosing block, or `nullptr` at the top level
    /// @param depth the number of enclosing containers
    void validate_block(const ast::Block& block, const ast::Block* parent, Size depth)
    {
        validate_attributes(block);

        const bool container = is_container(block.get_type());
        const Size child_depth = container ? depth + 1 : depth;
        if (container && child_depth == max_nesting_depth + 1) {
            raise(Diagnostic_Code::nesting_too_deep,
                  "Containers are nested " + std::to_string(child_depth)
                      + " levels deep, but at most " + std::to_string(max_nesting_depth)
                      + " levels are allowed.",
                  first_line(ast::get_source_span(block)));
        }

        fast_visit([&]<typename T>(const T& b) { validate_specific(b, parent); }, block);

        ast::for_each_child(block, [&](const ast::Block& child) {
            validate_block(child, &block, child_depth);
        });
    }

    template <typename T>
    void validate_specific(const T&, const ast::Block*)
    {
    }

    void validate_specific(const ast::Code& code, const ast::Block*)
    {
        if (!code.lang) {
            raise(Diagnostic_Code::code_language_missing,
                  "Code block has no 'lang' attribute, so it cannot be highlighted.",
                  first_line(code.get_source_position()));
        }
    }

    void validate_specific(const ast::Decision& decision, const ast::Block*)
    {
        const Local_Source_Span header = first_line(decision.get_source_position());
        if (decision.options.empty()) {
            if (is_blank(decision.text) && !decision.outcome) {
                raise(Diagnostic_Code::decision_outcome_missing,
                      "Decision states neither options with an 'outcome' nor any rationale.",
                      header);
            }
            return;
        }
        if (!decision.outcome) {
            raise(Diagnostic_Code::decision_outcome_missing,
                  "Decision lists options, but no 'outcome'.",
                  header);
            return;
        }
        if (std::ranges::find(decision.options, *decision.outcome) == decision.options.end()) {
            const Attribute* const outcome = decision.attributes.find("outcome");
            raise(Diagnostic_Code::decision_outcome_missing,
                  "The outcome " + quoted(*decision.outcome) + " is not among the options.",
                  outcome ? outcome->pos : header);
        }
    }

    void validate_specific(const ast::Metric& metric, const ast::Block*)
    {
        if (!metric.unit || is_known_metric_unit(*metric.unit)) {
            return;
        }
        const Attribute* const unit = metric.attributes.find("unit");
        SURFDOC_ASSERT(unit != nullptr);
        raise(Diagnostic_Code::metric_unit_unknown,
              "The unit " + quoted(*metric.unit) + " is not a recognized metric unit.",
              unit->pos);
    }

    void validate_specific(const ast::Figure& figure, const ast::Block*)
    {
        if (!figure.alt) {
            raise(Diagnostic_Code::alt_text_missing,
                  "Figure has no 'alt' text for screen readers.",
                  first_line(figure.get_source_position()));
        }
    }

    void validate_specific(const ast::Hero_Image& image, const ast::Block*)
    {
        if (!image.alt) {
            raise(Diagnostic_Code::alt_text_missing,
                  "Hero image has no 'alt' text for screen readers.",
                  first_line(image.get_source_position()));
        }
    }

    void validate_specific(const ast::Testimonial& testimonial, const ast::Block*)
    {
        if (!testimonial.author) {
            raise(Diagnostic_Code::testimonial_author_missing,
                  "Testimonial has no 'author' (or 'name') attribute.",
                  first_line(testimonial.get_source_position()));
        }
    }

    void validate_specific(const ast::Tabs& tabs, const ast::Block*)
    {
        if (tabs.panels.empty()) {
            raise(Diagnostic_Code::empty_container,
                  "Tabs have no panels. Start each panel with a '##' heading.",
                  first_line(tabs.get_source_position()));
        }
    }

    void validate_specific(const ast::Columns& columns, const ast::Block*)
    {
        if (columns.columns.empty()) {
            raise(Diagnostic_Code::empty_container,
                  "Columns have no content. Separate columns with '---' lines.",
                  first_line(columns.get_source_position()));
        }
    }

    void validate_specific(const ast::Nav& nav, const ast::Block*)
    {
        if (nav.items.empty()) {
            raise(Diagnostic_Code::empty_container,
                  "Navigation has no links. List each link as '- [Label](href)'.",
                  first_line(nav.get_source_position()));
        }
    }

    void validate_specific(const ast::Faq& faq, const ast::Block*)
    {
        if (faq.items.empty()) {
            raise(Diagnostic_Code::faq_entry_incomplete,
                  "FAQ has no entries. Start each question with a '###' heading.",
                  first_line(faq.get_source_position()));
            return;
        }
        for (const ast::Faq_Item& item : faq.items) {
            if (is_blank(item.question)) {
                raise(Diagnostic_Code::faq_entry_incomplete, "FAQ question is empty.", item.pos);
            }
            else if (is_blank(item.answer)) {
                raise(Diagnostic_Code::faq_entry_incomplete,
                      "FAQ question " + quoted(item.question) + " has no answer.",
                      item.pos);
            }
        }
    }

    void validate_specific(const ast::Pricing_Table& pricing, const ast::Block*)
    {
        const Size tier_columns = pricing.table.headers.size();
        for (const ast::Table_Row& row : pricing.table.rows) {
            if (row.cells.size() != tier_columns) {
                raise(Diagnostic_Code::pricing_tiers_inconsistent,
                      "Feature row has " + std::to_string(row.cells.size())
                          + " cells, but the header row has " + std::to_string(tier_columns)
                          + ".",
                      row.pos);
            }
        }
    }

    void validate_specific(const ast::Page& page, const ast::Block* parent)
    {
        if (parent != nullptr && parent->get_type() == Block_Type::site) {
            return;
        }
        std::optional<Local_Source_Span> related;
        if (parent != nullptr) {
            related = first_line(ast::get_source_span(*parent));
        }
        raise(Diagnostic_Code::orphan_page,
              "Page is not a direct child of a site, so it will not be part of any site.",
              first_line(page.get_source_position()),
              related);
    }

    void validate_specific(const ast::Site& site, const ast::Block*)
    {
        const Local_Source_Span header = first_line(site.get_source_position());
        std::vector<const ast::Page*> pages;
        for (const ast::Block& child : site.children) {
            if (const auto* const page = std::get_if<ast::Page>(&child)) {
                pages.push_back(page);
            }
        }
        if (pages.empty()) {
            raise(Diagnostic_Code::site_without_pages, "Site has no pages.", header);
            return;
        }
        validate_page_routes(pages);
        validate_page_order(pages, header);
    }

    /// @brief Reports pages which would be written to the same file as an earlier page.
    /// Routes are compared by output path, so `/a`, `a` and `/a/` collide.
    void validate_page_routes(std::span<const ast::Page* const> pages)
    {
        std::map<std::string, const ast::Page*, std::less<>> first_with_path;
        for (const ast::Page* const page : pages) {
            const auto [it, inserted]
                = first_with_path.try_emplace(output_path_of_route(page->route), page);
            if (inserted) {
                continue;
            }
            const Attribute* const route = page->attributes.find("route");
            raise(Diagnostic_Code::duplicate_id,
                  "The route " + quoted(page->route) + " is already used by another page of "
                      + "this site, so one page would overwrite the other.",
                  route ? route->pos : first_line(page->get_source_position()),
                  first_line(it->second->get_source_position()));
        }
    }

    void validate_page_order(std::span<const ast::Page* const> pages, Local_Source_Span site_header)
    {
        std::map<Int, const ast::Page*> first_with_order;
        Size ordered_count = 0;
        for (const ast::Page* const page : pages) {
            if (!page->order) {
                continue;
            }
            ++ordered_count;
            const auto [it, inserted] = first_with_order.try_emplace(*page->order, page);
            if (!inserted) {
                raise(Diagnostic_Code::page_order_ambiguous,
                      "Another page already has the order " + std::to_string(*page->order)
                          + "; document order decides between them.",
                      first_line(page->get_source_position()),
                      first_line(it->second->get_source_position()));
            }
        }
        if (ordered_count == 0) {
            return;
        }
        if (ordered_count != pages.size()) {
            raise(Diagnostic_Code::page_order_ambiguous,
                  "Only " + std::to_string(ordered_count) + " of " + std::to_string(pages.size())
                      + " pages have an 'order'; the others are placed after them.",
                  site_header);
        }
        std::optional<Int> previous;
        for (const auto& [order, page] : first_with_order) {
            if (previous && order != *previous + 1) {
                raise(Diagnostic_Code::page_order_ambiguous,
                      "Page order jumps from " + std::to_string(*previous) + " to "
                          + std::to_string(order) + ".",
                      first_line(page->get_source_position()));
            }
            previous = order;
        }
    }
};

} // namespace

std::vector<Diagnostic> validate(const Document& document)
{
    return Validator { document }();
}

std::vector<const ast::Page*> order_pages(const ast::Site& site)
{
    std::vector<const ast::Page*> result;
    for (const ast::Block& child : site.children) {
        if (const auto* const page = std::get_if<ast::Page>(&child)) {
            result.push_back(page);
        }
    }
    std::ranges::stable_sort(result, [](const ast::Page* a, const ast::Page* b) {
        if (a->order && b->order) {
            return *a->order < *b->order;
        }
        return a->order.has_value() && !b->order.has_value();
    });
    return result;
}

} // namespace surfdoc
