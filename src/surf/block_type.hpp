#ifndef SURFDOC_SURF_BLOCK_TYPE_HPP
#define SURFDOC_SURF_BLOCK_TYPE_HPP

#include <optional>
#include <string_view>

#include "surf/fwd.hpp"

namespace surfdoc {

/// @brief The type of a node in the document tree.
/// Every directive tag which is recognized maps onto one of these types, except for
/// `markdown` (prose between directives) and `unknown` (unrecognized tags).
enum struct Block_Type : Default_Underlying {
    /// @brief Prose between directives, delegated to the markdown engine.
    markdown,
    /// @brief Admonition such as a tip or a warning.
    callout,
    /// @brief Tabular data.
    data,
    /// @brief Code listing.
    code,
    /// @brief Checklist.
    tasks,
    /// @brief Architecture decision record.
    decision,
    /// @brief Single key figure.
    metric,
    /// @brief Abstract of the document.
    summary,
    /// @brief Image with caption.
    figure,
    /// @brief Tabbed panels of nested blocks.
    tabs,
    /// @brief Side-by-side columns of nested blocks.
    columns,
    /// @brief Block quotation.
    quote,
    /// @brief Call to action button.
    cta,
    /// @brief Navigation bar of links.
    nav,
    /// @brief Full-width image.
    hero_image,
    /// @brief Customer quote with author.
    testimonial,
    /// @brief Presentation overrides.
    style,
    /// @brief Questions and answers.
    faq,
    /// @brief Comparison grid of pricing tiers.
    pricing_table,
    /// @brief Root of a multi-page site.
    site,
    /// @brief A page within a site.
    page,
    /// @brief Passthrough for unrecognized directives.
    unknown
};

/// @brief The kind of content which a directive body holds.
enum struct Directive_Content_Type : Default_Underlying {
    /// @brief The directive consists only of its attributes.
    /// Such directives may be written on a single line without closing fence.
    nothing,
    /// @brief Raw text which is interpreted by the block builder, but never contains directives.
    text,
    /// @brief Nested blocks, i.e. prose and directives.
    blocks
};

/// @brief Returns the block type for the given directive tag.
/// The comparison is case-insensitive.
/// @param tag the directive tag, such as `callout` or `Pricing-Table`
/// @return the type, or `std::nullopt` if the tag is not recognized
[[nodiscard]] std::optional<Block_Type> block_type_by_tag(std::string_view tag) noexcept;

/// @brief Returns the canonical directive tag of `type`, such as `hero-image`.
/// For `markdown` and `unknown`, which have no tag, returns the enumerator name.
[[nodiscard]] std::string_view block_type_tag(Block_Type type) noexcept;

[[nodiscard]] Directive_Content_Type block_type_content_type(Block_Type type) noexcept;

/// @brief Returns `true` if blocks of this type count towards the nesting depth limit.
[[nodiscard]] bool is_container(Block_Type type) noexcept;

enum struct Callout_Type : Default_Underlying { info, warning, danger, tip, note, success };

enum struct Data_Format : Default_Underlying { table, csv, json };

enum struct Decision_Status : Default_Underlying { proposed, accepted, rejected, superseded };

enum struct Trend : Default_Underlying { up, down, flat };

[[nodiscard]] std::optional<Callout_Type> callout_type_by_name(std::string_view name) noexcept;
[[nodiscard]] std::optional<Data_Format> data_format_by_name(std::string_view name) noexcept;
[[nodiscard]] std::optional<Decision_Status> decision_status_by_name(std::string_view name) noexcept;
[[nodiscard]] std::optional<Trend> trend_by_name(std::string_view name) noexcept;

[[nodiscard]] std::string_view callout_type_name(Callout_Type type) noexcept;
[[nodiscard]] std::string_view data_format_name(Data_Format format) noexcept;
[[nodiscard]] std::string_view decision_status_name(Decision_Status status) noexcept;
[[nodiscard]] std::string_view trend_name(Trend trend) noexcept;

/// @brief Returns the human-readable heading of a callout, such as `Warning`.
[[nodiscard]] std::string_view callout_type_label(Callout_Type type) noexcept;

/// @brief Returns `true` if `unit` belongs to the vocabulary of metric units.
/// The comparison is case-sensitive, since `M` (million) and `m` are different.
[[nodiscard]] bool is_known_metric_unit(std::string_view unit) noexcept;

/// @brief Returns `true` if `value` is a numeric metric value.
/// Besides plain numbers such as `42` or `-3.5`, this accepts thousands separators (`12,000`),
/// a leading currency symbol (`$`, `€`, `£`) and a trailing magnitude suffix (`k`, `K`, `M`, `B`)
/// or percent sign, e.g. `$2.5M` or `12%`.
[[nodiscard]] bool is_numeric_metric_value(std::string_view value) noexcept;

} // namespace surfdoc

#endif
