#include <algorithm>

#include "common/assert.hpp"

#include "surf/diagnostic.hpp"

namespace surfdoc {

Severity Diagnostic::severity() const noexcept
{
    return severity_of(code);
}

Severity severity_of(Diagnostic_Code code) noexcept
{
    using enum Diagnostic_Code;
    switch (code) {
    case metric_unit_unknown:
    case code_language_missing:
    case alt_text_missing:
    case page_order_ambiguous:
    case front_matter_field_missing: return Severity::warning;

    case unterminated_directive:
    case malformed_attribute:
    case duplicate_attribute:
    case required_attribute_missing:
    case attribute_type_mismatch:
    case enum_value_invalid:
    case orphan_page:
    case site_without_pages:
    case empty_container:
    case faq_entry_incomplete:
    case pricing_tiers_inconsistent:
    case decision_outcome_missing:
    case testimonial_author_missing:
    case nesting_too_deep:
    case duplicate_id:
    case front_matter_value_invalid: return Severity::error;
    }
    SURFDOC_UNREACHABLE();
}

std::string_view diagnostic_id(Diagnostic_Code code) noexcept
{
    static constexpr std::string_view ids[] {
        "SD001", "SD002", "SD003", "SD004", "SD005", "SD006", "SD007",
        "SD008", "SD009", "SD010", "SD011", "SD012", "SD013", "SD014",
        "SD015", "SD016", "SD017", "SD018", "SD019", "SD020", "SD021",
    };
    static_assert(std::size(ids) == diagnostic_code_count);
    return ids[Size(code)];
}

std::string_view diagnostic_code_name(Diagnostic_Code code) noexcept
{
    using enum Diagnostic_Code;
    switch (code) {
        SURFDOC_ENUM_STRING_CASE(unterminated_directive);
        SURFDOC_ENUM_STRING_CASE(malformed_attribute);
        SURFDOC_ENUM_STRING_CASE(duplicate_attribute);
        SURFDOC_ENUM_STRING_CASE(required_attribute_missing);
        SURFDOC_ENUM_STRING_CASE(attribute_type_mismatch);
        SURFDOC_ENUM_STRING_CASE(enum_value_invalid);
        SURFDOC_ENUM_STRING_CASE(orphan_page);
        SURFDOC_ENUM_STRING_CASE(site_without_pages);
        SURFDOC_ENUM_STRING_CASE(empty_container);
        SURFDOC_ENUM_STRING_CASE(faq_entry_incomplete);
        SURFDOC_ENUM_STRING_CASE(pricing_tiers_inconsistent);
        SURFDOC_ENUM_STRING_CASE(metric_unit_unknown);
        SURFDOC_ENUM_STRING_CASE(decision_outcome_missing);
        SURFDOC_ENUM_STRING_CASE(code_language_missing);
        SURFDOC_ENUM_STRING_CASE(alt_text_missing);
        SURFDOC_ENUM_STRING_CASE(testimonial_author_missing);
        SURFDOC_ENUM_STRING_CASE(nesting_too_deep);
        SURFDOC_ENUM_STRING_CASE(duplicate_id);
        SURFDOC_ENUM_STRING_CASE(page_order_ambiguous);
        SURFDOC_ENUM_STRING_CASE(front_matter_field_missing);
        SURFDOC_ENUM_STRING_CASE(front_matter_value_invalid);
    }
    SURFDOC_UNREACHABLE();
}

std::optional<Diagnostic_Code> diagnostic_code_by_name(std::string_view name) noexcept
{
    for (Size i = 0; i < diagnostic_code_count; ++i) {
        const auto code = Diagnostic_Code(i);
        if (diagnostic_id(code) == name || diagnostic_code_name(code) == name) {
            return code;
        }
    }
    return {};
}

std::string_view severity_name(Severity severity) noexcept
{
    switch (severity) {
    case Severity::warning: return "warning";
    case Severity::error: return "error";
    }
    SURFDOC_UNREACHABLE();
}

void sort_diagnostics(std::vector<Diagnostic>& diagnostics)
{
    std::ranges::stable_sort(diagnostics, [](const Diagnostic& x, const Diagnostic& y) {
        if (x.pos.begin != y.pos.begin) {
            return x.pos.begin < y.pos.begin;
        }
        return x.code < y.code;
    });
}

bool has_errors(std::span<const Diagnostic> diagnostics) noexcept
{
    return std::ranges::any_of(diagnostics, [](const Diagnostic& d) {
        return d.severity() == Severity::error;
    });
}

} // namespace surfdoc
