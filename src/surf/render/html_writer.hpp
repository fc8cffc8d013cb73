#ifndef SURFDOC_SURF_RENDER_HTML_WRITER_HPP
#define SURFDOC_SURF_RENDER_HTML_WRITER_HPP

#include <string>
#include <string_view>

#include "common/assert.hpp"
#include "common/fwd.hpp"

namespace surfdoc {

/// @brief Returns `text` where `&`, `<`, `>` and `"` are replaced with HTML entities.
[[nodiscard]] std::string escape_html(std::string_view text);

struct Attribute_Writer;

/// @brief A class which provides member functions for writing HTML content to a `Code_String`
/// correctly.
/// Both entire HTML documents can be written, as well as HTML snippets.
/// This writer only performs checks that are possible without additional memory.
/// These include:
/// - verifying that given tag names and attribute keys are appropriate
/// - ensuring that the number of opened tags matches the number of closed tags
/// - ensuring that attributes are only written while a tag is being opened
///
/// To correctly use this class, the opening tags must match the closing tags.
/// I.e. for every `open_tag(id)` or `open_tag_with_attributes(id)`,
/// there must be a matching `close_tag(id)`.
struct HTML_Writer {
public:
    friend struct Attribute_Writer;
    using Self = HTML_Writer;

private:
    Code_String& m_out;

    Size m_depth = 0;
    bool m_in_attributes = false;

public:
    /// @brief Constructor.
    /// Writes nothing to the string.
    /// @param out the string to write to
    explicit HTML_Writer(Code_String& out);

    HTML_Writer(const HTML_Writer&) = delete;
    HTML_Writer& operator=(const HTML_Writer&) = delete;

    /// @brief Returns `true` if every opened tag has been closed.
    [[nodiscard]] bool is_done() const
    {
        return m_depth == 0 && !m_in_attributes;
    }

    /// @brief Returns the string which is written to.
    /// Content appended directly must be valid HTML between tags.
    [[nodiscard]] Code_String& get_output()
    {
        SURFDOC_ASSERT(!m_in_attributes);
        return m_out;
    }

    /// @brief Writes the `<!DOCTYPE html>` preamble.
    /// For whole documents, this should be called once, prior to any other `write` functions.
    Self& write_preamble();

    /// @brief Writes an empty tag such as `<br/>` or `<hr/>`.
    Self& write_empty_tag(std::string_view id);

    /// @brief Writes an HTML comment with the given contents.
    Self& write_comment(std::string_view comment);

    /// @brief Writes an opening tag such as `<div>`.
    Self& open_tag(std::string_view id);

    /// @brief Writes an incomplete opening tag such as `<div`.
    /// Returns an `Attribute_Writer` which must be used to write attributes (if any)
    /// and complete the opening tag.
    [[nodiscard]] Attribute_Writer open_tag_with_attributes(std::string_view id);

    /// @brief Writes a closing tag, such as `</div>`.
    /// The most recent unclosed call to `open_tag` or `open_tag_with_attributes` shall have been
    /// made with the same `id`.
    Self& close_tag(std::string_view id);

    /// @brief Writes text between tags.
    /// Characters such as `<` or `&` which interfere with HTML are converted to entities.
    Self& write_inner_text(std::string_view text);

    /// @brief Writes HTML content between tags.
    /// Unlike `write_inner_text`, does not escape any entities.
    ///
    /// WARNING: Improper use of this function can easily result in incorrect HTML output.
    Self& write_inner_html(std::string_view text);

    /// @brief Writes a line break, which is not part of any span.
    Self& write_line_break();

private:
    Self& write_attribute(std::string_view key, std::string_view value, bool has_value);
    Self& end_attributes();
    Self& end_empty_tag_attributes();
};

/// @brief RAII helper class which lets us write attributes more conveniently.
/// This class is not intended to be used directly, but with the help of `HTML_Writer`.
struct Attribute_Writer {
private:
    HTML_Writer& m_writer;

public:
    explicit Attribute_Writer(HTML_Writer& writer)
        : m_writer(writer)
    {
    }

    Attribute_Writer(const Attribute_Writer&) = delete;
    Attribute_Writer& operator=(const Attribute_Writer&) = delete;

    /// @brief Writes an attribute such as `class="centered"`.
    /// The value is always quoted and escaped.
    /// @param key the attribute key; `is_html_identifier(key)` shall be `true`.
    /// @param value the attribute value
    /// @return `*this`
    Attribute_Writer& write_attribute(std::string_view key, std::string_view value)
    {
        m_writer.write_attribute(key, value, true);
        return *this;
    }

    /// @brief Writes an attribute without value, such as `open` or `hidden`.
    Attribute_Writer& write_flag(std::string_view key)
    {
        m_writer.write_attribute(key, {}, false);
        return *this;
    }

    /// @brief Writes `>` and finishes writing attributes.
    /// This function or `end_empty()` shall be called exactly once prior to destruction of this
    /// writer.
    Attribute_Writer& end()
    {
        m_writer.end_attributes();
        return *this;
    }

    /// @brief Writes `/>` and finishes writing attributes.
    /// This function or `end()` shall be called exactly once prior to destruction of this
    /// writer.
    Attribute_Writer& end_empty()
    {
        m_writer.end_empty_tag_attributes();
        return *this;
    }

    /// @brief Destructor.
    /// A call to `end()` or `end_empty()` shall have been made prior to destruction.
    ~Attribute_Writer() noexcept(false)
    {
        // This indicates that end() or end_empty() weren't called.
        SURFDOC_ASSERT(!m_writer.m_in_attributes);
    }
};

} // namespace surfdoc

#endif
