#ifndef SURFDOC_SURF_ATTRIBUTE_HPP
#define SURFDOC_SURF_ATTRIBUTE_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/source_position.hpp"

#include "surf/fwd.hpp"

namespace surfdoc {

struct Number_Value {
    double value;
    /// @brief The literal as written, such as `2.50`.
    std::string text;

    [[nodiscard]] friend bool operator==(const Number_Value&, const Number_Value&) = default;
};

struct Symbol_Value {
    std::string name;

    [[nodiscard]] friend bool operator==(const Symbol_Value&, const Symbol_Value&) = default;
};

enum struct Attribute_Value_Type : Default_Underlying { string, number, boolean, symbol, list };

/// @brief The value of a `key=value` pair.
/// The alternatives are ordered like the enumerators of `Attribute_Value_Type`.
struct Attribute_Value
    : std::variant<std::string, Number_Value, bool, Symbol_Value, std::vector<std::string>> {
    using variant::variant;

    [[nodiscard]] Attribute_Value_Type get_type() const noexcept
    {
        return Attribute_Value_Type(index());
    }

    /// @brief Returns the value as text if it is a scalar.
    /// Strings and symbols yield their contents, numbers the literal as written,
    /// and booleans `true` or `false`.
    /// @return the text, or `std::nullopt` for lists
    [[nodiscard]] std::optional<std::string> to_text() const;

    /// @brief Renders the value back into attribute syntax, e.g. `"a b"` or `["x", "y"]`.
    [[nodiscard]] std::string to_source() const;
};

[[nodiscard]] std::string_view attribute_value_type_name(Attribute_Value_Type type) noexcept;

struct Attribute {
    std::string key;
    Attribute_Value value;
    /// @brief The span of the whole `key=value` pair.
    Local_Source_Span pos;
};

/// @brief The attributes of one directive, in source order.
/// Keys are unique; the attribute parser drops repeated keys after diagnosing them.
struct Attribute_List {
    std::vector<Attribute> entries;
    /// @brief The raw text between the brackets, kept verbatim.
    std::string raw;
    /// @brief The span of `raw`, or an empty span after the tag if there were no brackets.
    Local_Source_Span pos {};

    [[nodiscard]] const Attribute* find(std::string_view key) const noexcept;

    /// @brief Returns the first attribute among `keys` which is present.
    /// This supports aliases such as `author` and `name`.
    [[nodiscard]] const Attribute* find_any(std::span<const std::string_view> keys) const noexcept;

    [[nodiscard]] bool contains(std::string_view key) const noexcept
    {
        return find(key) != nullptr;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return entries.empty();
    }

    /// @brief Returns the value of a scalar attribute as text.
    /// See `Attribute_Value::to_text`.
    [[nodiscard]] std::optional<std::string> get_text(std::string_view key) const;

    /// @brief Returns a boolean attribute.
    /// The strings and symbols `true` and `false` are accepted as well.
    [[nodiscard]] std::optional<bool> get_bool(std::string_view key) const noexcept;

    /// @brief Returns a numeric attribute if it holds an integer value, such as `3`.
    /// Strings which consist of an integer literal are accepted as well.
    [[nodiscard]] std::optional<Int> get_integer(std::string_view key) const noexcept;

    /// @brief Returns a list attribute.
    /// A scalar string is interpreted as a comma-separated list, where each element is trimmed.
    [[nodiscard]] std::optional<std::vector<std::string>> get_list(std::string_view key) const;
};

} // namespace surfdoc

#endif
