#include <algorithm>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "surf/attribute.hpp"

namespace surfdoc {

namespace {

void append_quoted(std::string& out, std::string_view text)
{
    out += '"';
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
}

} // namespace

std::optional<std::string> Attribute_Value::to_text() const
{
    switch (get_type()) {
    case Attribute_Value_Type::string: return std::get<std::string>(*this);
    case Attribute_Value_Type::number: return std::get<Number_Value>(*this).text;
    case Attribute_Value_Type::boolean: return std::get<bool>(*this) ? "true" : "false";
    case Attribute_Value_Type::symbol: return std::get<Symbol_Value>(*this).name;
    case Attribute_Value_Type::list: return {};
    }
    SURFDOC_ASSERT_UNREACHABLE("Invalid attribute value type.");
}

std::string Attribute_Value::to_source() const
{
    std::string result;
    if (const auto* string = std::get_if<std::string>(this)) {
        append_quoted(result, *string);
    }
    else if (const auto* list = std::get_if<std::vector<std::string>>(this)) {
        result += '[';
        for (Size i = 0; i < list->size(); ++i) {
            if (i != 0) {
                result += ", ";
            }
            append_quoted(result, (*list)[i]);
        }
        result += ']';
    }
    else {
        result = *to_text();
    }
    return result;
}

std::string_view attribute_value_type_name(Attribute_Value_Type type) noexcept
{
    using enum Attribute_Value_Type;
    switch (type) {
    case string: return "string";
    case number: return "number";
    case boolean: return "boolean";
    case symbol: return "identifier";
    case list: return "list";
    }
    SURFDOC_UNREACHABLE();
}

const Attribute* Attribute_List::find(std::string_view key) const noexcept
{
    const auto it = std::ranges::find(entries, key, &Attribute::key);
    return it == entries.end() ? nullptr : &*it;
}

const Attribute* Attribute_List::find_any(std::span<const std::string_view> keys) const noexcept
{
    for (std::string_view key : keys) {
        if (const Attribute* result = find(key)) {
            return result;
        }
    }
    return nullptr;
}

std::optional<std::string> Attribute_List::get_text(std::string_view key) const
{
    const Attribute* attribute = find(key);
    return attribute ? attribute->value.to_text() : std::nullopt;
}

std::optional<bool> Attribute_List::get_bool(std::string_view key) const noexcept
{
    const Attribute* attribute = find(key);
    if (!attribute) {
        return {};
    }
    if (const bool* b = std::get_if<bool>(&attribute->value)) {
        return *b;
    }
    std::string_view text;
    if (const auto* string = std::get_if<std::string>(&attribute->value)) {
        text = *string;
    }
    else if (const auto* symbol = std::get_if<Symbol_Value>(&attribute->value)) {
        text = symbol->name;
    }
    if (text == "true") {
        return true;
    }
    if (text == "false") {
        return false;
    }
    return {};
}

std::optional<Int> Attribute_List::get_integer(std::string_view key) const noexcept
{
    const Attribute* attribute = find(key);
    if (!attribute) {
        return {};
    }
    if (const auto* number = std::get_if<Number_Value>(&attribute->value)) {
        return parse_integer(number->text);
    }
    if (const auto* string = std::get_if<std::string>(&attribute->value)) {
        return parse_integer(trim(*string));
    }
    return {};
}

std::optional<std::vector<std::string>> Attribute_List::get_list(std::string_view key) const
{
    const Attribute* attribute = find(key);
    if (!attribute) {
        return {};
    }
    if (const auto* list = std::get_if<std::vector<std::string>>(&attribute->value)) {
        return *list;
    }
    const std::optional<std::string> text = attribute->value.to_text();
    SURFDOC_ASSERT(text);

    std::vector<std::string> result;
    std::string_view rest = *text;
    while (!rest.empty()) {
        const Size comma = rest.find(',');
        const std::string_view item = trim(rest.substr(0, comma));
        if (!item.empty()) {
            result.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }
    return result;
}

} // namespace surfdoc
