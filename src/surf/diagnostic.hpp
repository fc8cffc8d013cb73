#ifndef SURFDOC_SURF_DIAGNOSTIC_HPP
#define SURFDOC_SURF_DIAGNOSTIC_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "common/source_position.hpp"

#include "surf/fwd.hpp"

namespace surfdoc {

/// @brief The identifier of a diagnostic.
/// Each code belongs to exactly one rule family and has a fixed severity.
/// The numeric ids (`SD001` etc.) follow the order of enumerators and must stay stable, since
/// tooling filters diagnostics by them.
enum struct Diagnostic_Code : Default_Underlying {
    unterminated_directive,
    malformed_attribute,
    duplicate_attribute,
    required_attribute_missing,
    attribute_type_mismatch,
    enum_value_invalid,
    orphan_page,
    site_without_pages,
    empty_container,
    faq_entry_incomplete,
    pricing_tiers_inconsistent,
    metric_unit_unknown,
    decision_outcome_missing,
    code_language_missing,
    alt_text_missing,
    testimonial_author_missing,
    nesting_too_deep,
    duplicate_id,
    page_order_ambiguous,
    front_matter_field_missing,
    front_matter_value_invalid,
};

inline constexpr Size diagnostic_code_count
    = Size(Diagnostic_Code::front_matter_value_invalid) + 1;

enum struct Severity : Default_Underlying { warning, error };

struct Diagnostic {
    Diagnostic_Code code;
    std::string message;
    /// @brief The offending span, such as a directive opening line or an attribute.
    Local_Source_Span pos;
    /// @brief A second location which the diagnostic refers to,
    /// such as the first occurrence of a duplicate id.
    std::optional<Local_Source_Span> related {};

    [[nodiscard]] Severity severity() const noexcept;

    [[nodiscard]] friend bool operator==(const Diagnostic&, const Diagnostic&) = default;
};

[[nodiscard]] Severity severity_of(Diagnostic_Code code) noexcept;

/// @brief Returns the stable identifier of `code`, such as `SD004`.
[[nodiscard]] std::string_view diagnostic_id(Diagnostic_Code code) noexcept;

/// @brief Returns the enumerator name of `code`, such as `required_attribute_missing`.
[[nodiscard]] std::string_view diagnostic_code_name(Diagnostic_Code code) noexcept;

/// @brief Looks up a code by its stable identifier (`SD004`) or its name
/// (`required_attribute_missing`).
[[nodiscard]] std::optional<Diagnostic_Code> diagnostic_code_by_name(std::string_view name) noexcept;

[[nodiscard]] std::string_view severity_name(Severity severity) noexcept;

/// @brief Sorts diagnostics into their canonical order: by position in the document,
/// then by code.
/// The sort is stable, so diagnostics at the same location with the same code keep the order in
/// which they were raised.
void sort_diagnostics(std::vector<Diagnostic>& diagnostics);

[[nodiscard]] bool has_errors(std::span<const Diagnostic> diagnostics) noexcept;

} // namespace surfdoc

#endif
