#ifndef SURFDOC_CODE_STRING_HPP
#define SURFDOC_CODE_STRING_HPP

#include <concepts>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "common/assert.hpp"
#include "common/code_span_type.hpp"
#include "common/to_chars.hpp"

namespace surfdoc {

struct Code_String_Span {
    Size begin;
    Size length;
    Code_Span_Type type;
};

/// @brief Rendered output where some ranges of text carry a `Code_Span_Type`.
/// Diagnostics, HTML and terminal output are all produced this way so that colors can be
/// applied or dropped when the text is finally printed.
/// Spans never overlap and are stored in ascending order.
struct Code_String {
private:
    std::pmr::vector<char> m_text;
    std::pmr::vector<Code_String_Span> m_spans;

public:
    [[nodiscard]] Code_String(std::pmr::memory_resource* memory = std::pmr::get_default_resource())
        : m_text(memory)
        , m_spans(memory)
    {
    }

    [[nodiscard]] std::string_view get_text() const
    {
        return { m_text.data(), m_text.size() };
    }

    [[nodiscard]] std::span<const Code_String_Span> get_spans() const
    {
        return m_spans;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_text.empty();
    }

    /// @brief Appends untagged text, such as whitespace or markup-free prose.
    void append(std::string_view text)
    {
        m_text.insert(m_text.end(), text.begin(), text.end());
    }

    void append(char c)
    {
        m_text.push_back(c);
    }

    void append(Size amount, char c)
    {
        m_text.insert(m_text.end(), amount, c);
    }

    /// @brief Appends `text` tagged with `type`.
    /// Empty text creates no span.
    void append(std::string_view text, Code_Span_Type type)
    {
        if (!text.empty()) {
            m_spans.push_back({ .begin = m_text.size(), .length = text.size(), .type = type });
            append(text);
        }
    }

    void append(char c, Code_Span_Type type)
    {
        append(std::string_view(&c, 1), type);
    }

    template <std::integral T>
    void append_integer(T x)
    {
        append(to_characters(x).as_string());
    }

    template <std::integral T>
    void append_integer(T x, Code_Span_Type type)
    {
        append(to_characters(x).as_string(), type);
    }

    struct Scoped_Builder;

    /// @brief Starts a span of the given `type` which covers everything appended through the
    /// returned builder, e.g.
    /// ```
    /// out.build(Code_Span_Type::diagnostic_code_position).append(file).append(':');
    /// ```
    Scoped_Builder build(Code_Span_Type type) &;
};

struct [[nodiscard]] Code_String::Scoped_Builder {
private:
    Code_String& m_self;
    Size m_begin;
    Code_Span_Type m_type;

public:
    Scoped_Builder(Code_String& self, Code_Span_Type type)
        : m_self { self }
        , m_begin { self.m_text.size() }
        , m_type { type }
    {
    }

    ~Scoped_Builder() noexcept(false)
    {
        SURFDOC_ASSERT(m_self.m_text.size() >= m_begin);
        if (const Size length = m_self.m_text.size() - m_begin) {
            m_self.m_spans.push_back({ .begin = m_begin, .length = length, .type = m_type });
        }
    }

    Scoped_Builder(const Scoped_Builder&) = delete;
    Scoped_Builder& operator=(const Scoped_Builder&) = delete;

    Scoped_Builder& append(char c)
    {
        m_self.append(c);
        return *this;
    }

    Scoped_Builder& append(std::string_view text)
    {
        m_self.append(text);
        return *this;
    }

    template <std::integral T>
    Scoped_Builder& append_integer(T x)
    {
        m_self.append_integer(x);
        return *this;
    }
};

inline Code_String::Scoped_Builder Code_String::build(Code_Span_Type type) &
{
    return { *this, type };
}

} // namespace surfdoc

#endif
