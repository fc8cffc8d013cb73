#include <algorithm>
#include <array>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "surf/block_type.hpp"

namespace surfdoc {

std::optional<Block_Type> block_type_by_tag(std::string_view tag) noexcept
{
    using enum Block_Type;

    static constexpr struct Pair {
        std::string_view tag;
        Block_Type type;
    } lookup[] {
        { "callout", callout },
        { "code", code },
        { "columns", columns },
        { "cta", cta },
        { "data", data },
        { "decision", decision },
        { "faq", faq },
        { "figure", figure },
        { "hero-image", hero_image },
        { "metric", metric },
        { "nav", nav },
        { "page", page },
        { "pricing-table", pricing_table },
        { "quote", quote },
        { "site", site },
        { "style", style },
        { "summary", summary },
        { "tabs", tabs },
        { "tasks", tasks },
        { "testimonial", testimonial },
    };

    static_assert(std::ranges::is_sorted(lookup, {}, &Pair::tag));

    std::array<char, 16> buffer;
    if (tag.length() > buffer.size()) {
        return {};
    }
    std::ranges::transform(tag, buffer.begin(), to_ascii_lower);
    const std::string_view lower { buffer.data(), tag.length() };

    const auto it = std::ranges::lower_bound(lookup, lower, {}, &Pair::tag);
    if (it == std::ranges::end(lookup) || it->tag != lower) {
        return {};
    }
    return it->type;
}

std::string_view block_type_tag(Block_Type type) noexcept
{
    using enum Block_Type;
    switch (type) {
    case markdown: return "markdown";
    case callout: return "callout";
    case data: return "data";
    case code: return "code";
    case tasks: return "tasks";
    case decision: return "decision";
    case metric: return "metric";
    case summary: return "summary";
    case figure: return "figure";
    case tabs: return "tabs";
    case columns: return "columns";
    case quote: return "quote";
    case cta: return "cta";
    case nav: return "nav";
    case hero_image: return "hero-image";
    case testimonial: return "testimonial";
    case style: return "style";
    case faq: return "faq";
    case pricing_table: return "pricing-table";
    case site: return "site";
    case page: return "page";
    case unknown: return "unknown";
    }
    SURFDOC_UNREACHABLE();
}

Directive_Content_Type block_type_content_type(Block_Type type) noexcept
{
    using enum Block_Type;
    switch (type) {
    case metric:
    case figure:
    case cta:
    case hero_image: return Directive_Content_Type::nothing;

    case markdown:
    case callout:
    case data:
    case code:
    case tasks:
    case decision:
    case summary:
    case quote:
    case testimonial:
    case style:
    case faq:
    case nav:
    case pricing_table: return Directive_Content_Type::text;

    case tabs:
    case columns:
    case site:
    case page:
    case unknown: return Directive_Content_Type::blocks;
    }
    SURFDOC_UNREACHABLE();
}

bool is_container(Block_Type type) noexcept
{
    return type != Block_Type::unknown
        && block_type_content_type(type) == Directive_Content_Type::blocks;
}

std::optional<Callout_Type> callout_type_by_name(std::string_view name) noexcept
{
    using enum Callout_Type;
    for (Callout_Type t : { info, warning, danger, tip, note, success }) {
        if (callout_type_name(t) == name) {
            return t;
        }
    }
    return {};
}

std::optional<Data_Format> data_format_by_name(std::string_view name) noexcept
{
    using enum Data_Format;
    for (Data_Format f : { table, csv, json }) {
        if (data_format_name(f) == name) {
            return f;
        }
    }
    return {};
}

std::optional<Decision_Status> decision_status_by_name(std::string_view name) noexcept
{
    using enum Decision_Status;
    for (Decision_Status s : { proposed, accepted, rejected, superseded }) {
        if (decision_status_name(s) == name) {
            return s;
        }
    }
    return {};
}

std::optional<Trend> trend_by_name(std::string_view name) noexcept
{
    using enum Trend;
    for (Trend t : { up, down, flat }) {
        if (trend_name(t) == name) {
            return t;
        }
    }
    return {};
}

std::string_view callout_type_name(Callout_Type type) noexcept
{
    using enum Callout_Type;
    switch (type) {
        SURFDOC_ENUM_STRING_CASE(info);
        SURFDOC_ENUM_STRING_CASE(warning);
        SURFDOC_ENUM_STRING_CASE(danger);
        SURFDOC_ENUM_STRING_CASE(tip);
        SURFDOC_ENUM_STRING_CASE(note);
        SURFDOC_ENUM_STRING_CASE(success);
    }
    SURFDOC_UNREACHABLE();
}

std::string_view data_format_name(Data_Format format) noexcept
{
    using enum Data_Format;
    switch (format) {
        SURFDOC_ENUM_STRING_CASE(table);
        SURFDOC_ENUM_STRING_CASE(csv);
        SURFDOC_ENUM_STRING_CASE(json);
    }
    SURFDOC_UNREACHABLE();
}

std::string_view decision_status_name(Decision_Status status) noexcept
{
    using enum Decision_Status;
    switch (status) {
        SURFDOC_ENUM_STRING_CASE(proposed);
        SURFDOC_ENUM_STRING_CASE(accepted);
        SURFDOC_ENUM_STRING_CASE(rejected);
        SURFDOC_ENUM_STRING_CASE(superseded);
    }
    SURFDOC_UNREACHABLE();
}

std::string_view trend_name(Trend trend) noexcept
{
    using enum Trend;
    switch (trend) {
        SURFDOC_ENUM_STRING_CASE(up);
        SURFDOC_ENUM_STRING_CASE(down);
        SURFDOC_ENUM_STRING_CASE(flat);
    }
    SURFDOC_UNREACHABLE();
}

std::string_view callout_type_label(Callout_Type type) noexcept
{
    using enum Callout_Type;
    switch (type) {
    case info: return "Info";
    case warning: return "Warning";
    case danger: return "Danger";
    case tip: return "Tip";
    case note: return "Note";
    case success: return "Success";
    }
    SURFDOC_UNREACHABLE();
}

bool is_known_metric_unit(std::string_view unit) noexcept
{
    static constexpr std::string_view units[] {
        "%",  "ms",    "s",     "min", "h",   "d",   "wk", "mo",  "yr",    "B",
        "KB", "MB",    "GB",    "TB",  "USD", "EUR", "GBP", "$",  "€",     "£",
        "x",  "pts",   "req/s", "rps", "users", "items", "k", "M",
    };
    return std::ranges::find(units, unit) != std::ranges::end(units);
}

bool is_numeric_metric_value(std::string_view value) noexcept
{
    value = trim(value);
    if (value.starts_with('+') || value.starts_with('-')) {
        value.remove_prefix(1);
    }
    static constexpr std::string_view currencies[] { "$", "€", "£" };
    for (std::string_view currency : currencies) {
        if (value.starts_with(currency)) {
            value.remove_prefix(currency.length());
            break;
        }
    }
    if (!value.empty() && (value.back() == '%' || value.back() == 'k' || value.back() == 'K'
                           || value.back() == 'M' || value.back() == 'B')) {
        value.remove_suffix(1);
    }
    if (value.empty() || !is_decimal_digit(value.front()) || !is_decimal_digit(value.back())) {
        return false;
    }

    bool seen_point = false;
    for (Size i = 0; i < value.length(); ++i) {
        const char c = value[i];
        if (c == ',') {
            // A thousands separator must sit between digits.
            if (seen_point || !is_decimal_digit(value[i - 1]) || !is_decimal_digit(value[i + 1])) {
                return false;
            }
        }
        else if (c == '.') {
            if (seen_point) {
                return false;
            }
            seen_point = true;
        }
        else if (!is_decimal_digit(c)) {
            return false;
        }
    }
    return true;
}

} // namespace surfdoc
