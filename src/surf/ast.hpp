#ifndef SURFDOC_SURF_AST_HPP
#define SURFDOC_SURF_AST_HPP

#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/source_position.hpp"
#include "common/visit.hpp"

#include "surf/attribute.hpp"
#include "surf/block_type.hpp"
#include "surf/diagnostic.hpp"
#include "surf/fwd.hpp"

namespace surfdoc {

/// @brief Key-value metadata preceding the document body.
/// It is extracted by an external collaborator and only read by the renderers.
using Front_Matter = std::map<std::string, std::string, std::less<>>;

namespace ast {

namespace detail {

struct Base {
    Local_Source_Span m_pos;

    [[nodiscard]] Local_Source_Span get_source_position() const
    {
        return m_pos;
    }
};

/// @brief Common base of all nodes which originate from a directive.
struct Directive_Base : Base {
    Attribute_List attributes;
    /// @brief The number of colons of the opening fence, at least two.
    Size colon_count = 2;
};

} // namespace detail

struct Property {
    std::string key;
    std::string value;

    [[nodiscard]] friend bool operator==(const Property&, const Property&) = default;
};

struct Table_Row {
    std::vector<std::string> cells;
    Local_Source_Span pos;
};

struct Table {
    std::vector<std::string> headers;
    std::vector<Table_Row> rows;
};

struct Task_Item {
    bool done;
    std::string text;
    std::optional<std::string> assignee;
};

struct Nav_Item {
    std::string label;
    std::string href;
    std::optional<std::string> icon;
    Local_Source_Span pos;
};

struct Faq_Item {
    std::string question;
    std::string answer;
    Local_Source_Span pos;
};

enum struct Inline_Extension_Type : Default_Underlying {
    /// @brief `:evidence[tier=1 source="..."]`, a reference backing a claim.
    evidence,
    /// @brief `:status[value=...]`, an inline status badge.
    status
};

/// @brief An annotation within prose, written as `:evidence[...]` or `:status[...]`.
struct Inline_Extension {
    Inline_Extension_Type type;
    /// @brief The offset of the colon within the prose text.
    Size begin;
    /// @brief The length of the annotation, from the colon through the closing `]`.
    Size length;
    /// @brief For `status`, the value; for `evidence`, the text between the brackets.
    std::string text;
    std::optional<Int> tier;
    std::optional<std::string> source;

    [[nodiscard]] Size end() const noexcept
    {
        return begin + length;
    }

    [[nodiscard]] friend bool operator==(const Inline_Extension&, const Inline_Extension&)
        = default;
};

/// @brief Prose between directives.
/// The text is handed to the markdown engine unchanged, except for inline extensions, which
/// each renderer replaces with its own markup.
struct Markdown final : detail::Base {
    std::string text;
    /// @brief The inline extensions within `text`, in ascending order.
    std::vector<Inline_Extension> extensions;
};

struct Callout final : detail::Directive_Base {
    Callout_Type type = Callout_Type::info;
    std::optional<std::string> title;
    std::string text;
};

struct Data final : detail::Directive_Base {
    Data_Format format = Data_Format::table;
    bool sortable = false;
    std::optional<std::string> id;
    Table table;
    std::string raw;
};

struct Code final : detail::Directive_Base {
    std::optional<std::string> lang;
    std::optional<std::string> file;
    std::vector<std::string> highlight;
    std::string text;
};

struct Tasks final : detail::Directive_Base {
    std::vector<Task_Item> items;
};

struct Decision final : detail::Directive_Base {
    Decision_Status status = Decision_Status::proposed;
    std::optional<std::string> date;
    std::vector<std::string> deciders;
    std::vector<std::string> options;
    std::optional<std::string> outcome;
    std::string text;
};

struct Metric final : detail::Directive_Base {
    std::string label;
    std::string value;
    std::optional<Trend> trend;
    std::optional<std::string> unit;
};

struct Summary final : detail::Directive_Base {
    std::string text;
};

struct Figure final : detail::Directive_Base {
    std::string src;
    std::optional<std::string> alt;
    std::optional<std::string> caption;
    std::optional<std::string> width;
};

struct Tab_Panel final : detail::Base {
    std::string label;
    std::vector<Block> children;

    Tab_Panel();
    Tab_Panel(const Tab_Panel&);
    Tab_Panel(Tab_Panel&&) noexcept;
    Tab_Panel& operator=(const Tab_Panel&);
    Tab_Panel& operator=(Tab_Panel&&) noexcept;
    ~Tab_Panel();
};

struct Tabs final : detail::Directive_Base {
    std::vector<Tab_Panel> panels;
};

struct Column final : detail::Base {
    std::vector<Block> children;

    Column();
    Column(const Column&);
    Column(Column&&) noexcept;
    Column& operator=(const Column&);
    Column& operator=(Column&&) noexcept;
    ~Column();
};

struct Columns final : detail::Directive_Base {
    std::vector<Column> columns;
};

struct Quote final : detail::Directive_Base {
    std::string text;
    std::optional<std::string> attribution;
    std::optional<std::string> cite;
};

struct Cta final : detail::Directive_Base {
    std::string label;
    std::string href;
    bool primary = false;
    std::optional<std::string> icon;
};

struct Nav final : detail::Directive_Base {
    std::optional<std::string> logo;
    std::vector<Nav_Item> items;
};

struct Hero_Image final : detail::Directive_Base {
    std::string src;
    std::optional<std::string> alt;
};

struct Testimonial final : detail::Directive_Base {
    std::string text;
    std::optional<std::string> author;
    std::optional<std::string> role;
    std::optional<std::string> company;
};

struct Style final : detail::Directive_Base {
    std::vector<Property> properties;
};

struct Faq final : detail::Directive_Base {
    std::vector<Faq_Item> items;
};

struct Pricing_Table final : detail::Directive_Base {
    /// @brief The header row holds the tier names, the other rows compare features.
    Table table;
};

struct Site final : detail::Directive_Base {
    std::optional<std::string> domain;
    std::vector<Property> properties;
    std::vector<Block> children;

    Site();
    Site(const Site&);
    Site(Site&&) noexcept;
    Site& operator=(const Site&);
    Site& operator=(Site&&) noexcept;
    ~Site();
};

struct Page final : detail::Directive_Base {
    std::string route;
    std::optional<std::string> title;
    std::optional<std::string> layout;
    bool sidebar = false;
    std::optional<Int> order;
    std::vector<Block> children;

    Page();
    Page(const Page&);
    Page(Page&&) noexcept;
    Page& operator=(const Page&);
    Page& operator=(Page&&) noexcept;
    ~Page();
};

/// @brief A directive with an unrecognized tag.
/// All text is preserved byte-for-byte so that the directive can be reproduced exactly.
struct Unknown final : detail::Directive_Base {
    /// @brief The tag as written, without any case folding.
    std::string tag;
    std::string body;
    /// @brief The opening line, without line terminator.
    std::string opening_line;
    /// @brief The closing line, or an empty string if the directive was unterminated.
    std::string closing_line;
};

/// @brief A node of the document tree.
/// The alternatives are ordered like the enumerators of `Block_Type`.
struct Block : std::variant<Markdown,
                            Callout,
                            Data,
                            Code,
                            Tasks,
                            Decision,
                            Metric,
                            Summary,
                            Figure,
                            Tabs,
                            Columns,
                            Quote,
                            Cta,
                            Nav,
                            Hero_Image,
                            Testimonial,
                            Style,
                            Faq,
                            Pricing_Table,
                            Site,
                            Page,
                            Unknown> {
    using variant::variant;

    [[nodiscard]] Block_Type get_type() const noexcept
    {
        return Block_Type(index());
    }
};

static_assert(std::variant_size_v<Block::variant> == Size(Block_Type::unknown) + 1);

inline Tab_Panel::Tab_Panel() = default;
inline Tab_Panel::Tab_Panel(const Tab_Panel&) = default;
inline Tab_Panel::Tab_Panel(Tab_Panel&&) noexcept = default;
inline Tab_Panel& Tab_Panel::operator=(const Tab_Panel&) = default;
inline Tab_Panel& Tab_Panel::operator=(Tab_Panel&&) noexcept = default;
inline Tab_Panel::~Tab_Panel() = default;

inline Column::Column() = default;
inline Column::Column(const Column&) = default;
inline Column::Column(Column&&) noexcept = default;
inline Column& Column::operator=(const Column&) = default;
inline Column& Column::operator=(Column&&) noexcept = default;
inline Column::~Column() = default;

inline Site::Site() = default;
inline Site::Site(const Site&) = default;
inline Site::Site(Site&&) noexcept = default;
inline Site& Site::operator=(const Site&) = default;
inline Site& Site::operator=(Site&&) noexcept = default;
inline Site::~Site() = default;

inline Page::Page() = default;
inline Page::Page(const Page&) = default;
inline Page::Page(Page&&) noexcept = default;
inline Page& Page::operator=(const Page&) = default;
inline Page& Page::operator=(Page&&) noexcept = default;
inline Page::~Page() = default;

[[nodiscard]] inline Local_Source_Span get_source_span(const Block& block)
{
    return fast_visit([]<typename T>(const T& v) -> const detail::Base& { return v; }, block)
        .get_source_position();
}

/// @brief Returns the attributes of a directive block, or `nullptr` for prose.
[[nodiscard]] inline const Attribute_List* get_attributes(const Block& block)
{
    return fast_visit(
        []<typename T>(const T& v) -> const Attribute_List* {
            if constexpr (std::is_base_of_v<detail::Directive_Base, T>) {
                return &v.attributes;
            }
            else {
                return nullptr;
            }
        },
        block);
}

/// @brief Invokes `f` for every direct child block of `block`, in document order.
/// Children of tab panels and columns count as direct children of the `Tabs` or `Columns` block.
template <typename F>
void for_each_child(const Block& block, F&& f)
{
    if (const auto* tabs = std::get_if<Tabs>(&block)) {
        for (const Tab_Panel& panel : tabs->panels) {
            for (const Block& child : panel.children) {
                f(child);
            }
        }
    }
    else if (const auto* columns = std::get_if<Columns>(&block)) {
        for (const Column& column : columns->columns) {
            for (const Block& child : column.children) {
                f(child);
            }
        }
    }
    else if (const auto* site = std::get_if<Site>(&block)) {
        for (const Block& child : site->children) {
            f(child);
        }
    }
    else if (const auto* page = std::get_if<Page>(&block)) {
        for (const Block& child : page->children) {
            f(child);
        }
    }
}

} // namespace ast

/// @brief The root of the document tree.
/// A document is built once by `parse` and never modified by validation or rendering.
struct Document {
    std::vector<ast::Block> blocks;
    Front_Matter front_matter;
    /// @brief The text which was parsed; source spans of all nodes refer to it.
    std::string source;
    /// @brief Diagnostics raised by scanning and attribute parsing.
    /// These cannot be recomputed from the tree, so the tree carries them.
    std::vector<Diagnostic> parse_diagnostics;
};

} // namespace surfdoc

#endif
