#include <algorithm>
#include <optional>
#include <string>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "surf/parsing/attribute_parser.hpp"

namespace surfdoc {

namespace {

[[nodiscard]] bool is_separator(char c)
{
    return c == ',' || c == ' ' || c == '\t';
}

struct [[nodiscard]] Attribute_Parser {
private:
    std::string_view m_source;
    Local_Source_Position m_base;
    std::vector<Diagnostic>& m_diagnostics;
    Size m_pos = 0;
    Attribute_List m_result;

public:
    Attribute_Parser(std::string_view source,
                     Local_Source_Position base,
                     std::vector<Diagnostic>& diagnostics)
        : m_source(source)
        , m_base(base)
        , m_diagnostics(diagnostics)
    {
        m_result.raw = std::string(source);
        m_result.pos = { base, source.length() };
    }

    Attribute_List operator()() &&
    {
        while (true) {
            skip_separators();
            if (eof()) {
                break;
            }
            match_pair();
        }
        return std::move(m_result);
    }

private:
    // UTILITIES ===================================================================================

    [[nodiscard]] bool eof() const
    {
        return m_pos >= m_source.length();
    }

    [[nodiscard]] char peek() const
    {
        SURFDOC_ASSERT(!eof());
        return m_source[m_pos];
    }

    [[nodiscard]] std::string_view remainder() const
    {
        return m_source.substr(m_pos);
    }

    [[nodiscard]] Local_Source_Span span(Size begin, Size end) const
    {
        return { m_base.to_right(begin), end - begin };
    }

    void skip_separators()
    {
        while (!eof() && is_separator(peek())) {
            ++m_pos;
        }
    }

    void skip_spaces()
    {
        while (!eof() && (peek() == ' ' || peek() == '\t')) {
            ++m_pos;
        }
    }

    /// @brief Skips to the next separator, which is where parsing resumes after an error.
    void recover()
    {
        bool in_string = false;
        while (!eof() && (in_string || !is_separator(peek()))) {
            if (peek() == '\\' && in_string && m_pos + 1 < m_source.length()) {
                ++m_pos;
            }
            else if (peek() == '"') {
                in_string = !in_string;
            }
            ++m_pos;
        }
    }

    void error(Size begin, Size end, std::string message)
    {
        m_diagnostics.push_back({ .code = Diagnostic_Code::malformed_attribute,
                                  .message = std::move(message),
                                  .pos = span(begin, std::max(end, begin + 1)) });
    }

    // GRAMMAR =====================================================================================

    void match_pair()
    {
        const Size pair_begin = m_pos;
        const Size key_length = match_name(remainder());
        if (key_length == 0) {
            error(m_pos, m_pos + 1,
                  "Expected an attribute name, but found '" + std::string(1, peek()) + "'.");
            recover();
            return;
        }
        std::string key { m_source.substr(m_pos, key_length) };
        m_pos += key_length;

        const Size after_key = m_pos;
        skip_spaces();
        std::optional<Attribute_Value> value;
        if (!eof() && peek() == '=') {
            ++m_pos;
            skip_spaces();
            value = match_value(key);
            if (!value) {
                recover();
                return;
            }
        }
        else {
            // A flag; the spaces are a separator.
            m_pos = after_key;
            value = Attribute_Value { true };
        }

        if (!eof() && !is_separator(peek())) {
            error(m_pos, m_pos + 1,
                  "Unexpected '" + std::string(1, peek()) + "' after the value of '" + key
                      + "'. Separate attributes with ',' or spaces.");
            recover();
            return;
        }

        Attribute attribute { .key = std::move(key),
                              .value = std::move(*value),
                              .pos = span(pair_begin, m_pos) };
        add(std::move(attribute));
    }

    void add(Attribute&& attribute)
    {
        if (const Attribute* first = m_result.find(attribute.key)) {
            m_diagnostics.push_back(
                { .code = Diagnostic_Code::duplicate_attribute,
                  .message = "Duplicate attribute '" + attribute.key
                      + "'. The first occurrence is used and this one is ignored.",
                  .pos = attribute.pos,
                  .related = first->pos });
            return;
        }
        m_result.entries.push_back(std::move(attribute));
    }

    [[nodiscard]] std::optional<Attribute_Value> match_value(std::string_view key)
    {
        if (eof() || peek() == ',') {
            error(m_pos, m_pos, "Missing value after '=' for attribute '" + std::string(key) + "'.");
            return {};
        }
        if (peek() == '"') {
            std::optional<std::string> string = match_quoted_string(key);
            if (!string) {
                return {};
            }
            return Attribute_Value { std::move(*string) };
        }
        if (peek() == '[') {
            return match_list(key);
        }

        const Size begin = m_pos;
        while (!eof() && !is_separator(peek())) {
            ++m_pos;
        }
        const std::string_view token = m_source.substr(begin, m_pos - begin);

        if (token == "true" || token == "false") {
            return Attribute_Value { token == "true" };
        }
        if (match_number(token) == token.length()) {
            if (std::optional<double> number = parse_number(token)) {
                return Attribute_Value { Number_Value { *number, std::string(token) } };
            }
        }
        if (match_name(token) == token.length()) {
            return Attribute_Value { Symbol_Value { std::string(token) } };
        }
        return Attribute_Value { std::string(token) };
    }

    /// @brief Matches a string in double quotes, starting at the opening quote.
    [[nodiscard]] std::optional<std::string> match_quoted_string(std::string_view key)
    {
        SURFDOC_ASSERT(peek() == '"');
        const Size begin = m_pos++;

        std::string result;
        while (!eof() && peek() != '"') {
            if (peek() == '\\' && m_pos + 1 < m_source.length()
                && (m_source[m_pos + 1] == '"' || m_source[m_pos + 1] == '\\')) {
                ++m_pos;
            }
            result += m_source[m_pos++];
        }
        if (eof()) {
            error(begin, m_pos,
                  "Unterminated string in the value of attribute '" + std::string(key) + "'.");
            return {};
        }
        ++m_pos;
        return result;
    }

    [[nodiscard]] std::optional<Attribute_Value> match_list(std::string_view key)
    {
        SURFDOC_ASSERT(peek() == '[');
        const Size begin = m_pos++;

        std::vector<std::string> result;
        while (true) {
            while (!eof() && (is_separator(peek()))) {
                ++m_pos;
            }
            if (eof()) {
                error(begin, m_pos,
                      "Unterminated list in the value of attribute '" + std::string(key) + "'.");
                return {};
            }
            if (peek() == ']') {
                ++m_pos;
                return Attribute_Value { std::move(result) };
            }
            if (peek() != '"') {
                error(m_pos, m_pos + 1,
                      "List items of attribute '" + std::string(key) + "' must be quoted strings.");
                // Skip the rest of the list, so that its items are not mistaken for attributes.
                while (!eof() && peek() != ']') {
                    ++m_pos;
                }
                if (!eof()) {
                    ++m_pos;
                }
                return {};
            }
            std::optional<std::string> item = match_quoted_string(key);
            if (!item) {
                return {};
            }
            result.push_back(std::move(*item));
        }
    }
};

} // namespace

Attribute_List parse_attributes(std::string_view text,
                                Local_Source_Position pos,
                                std::vector<Diagnostic>& diagnostics)
{
    return Attribute_Parser { text, pos, diagnostics }();
}

} // namespace surfdoc
