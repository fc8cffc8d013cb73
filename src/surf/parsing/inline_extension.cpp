#include <optional>
#include <string>
#include <vector>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "surf/parsing/attribute_parser.hpp"
#include "surf/parsing/inline_extension.hpp"

namespace surfdoc {

namespace {

struct Extension_Name {
    std::string_view prefix;
    ast::Inline_Extension_Type type;
};

constexpr Extension_Name extension_names[] {
    { "evidence[", ast::Inline_Extension_Type::evidence },
    { "status[", ast::Inline_Extension_Type::status },
};

/// @brief Returns the length of the run of `c` starting at `pos`.
[[nodiscard]] Size run_length(std::string_view text, Size pos, char c)
{
    const Size end = text.find_first_not_of(c, pos);
    return (end == std::string_view::npos ? text.length() : end) - pos;
}

/// @brief Returns `true` if `text` starts a fenced code block at `pos`, which is the beginning
/// of a line.
[[nodiscard]] bool is_fence_line(std::string_view text, Size pos)
{
    const Size end = text.find('\n', pos);
    const std::string_view line = trim_left(text.substr(pos, end - pos));
    return line.starts_with("```") || line.starts_with("~~~");
}

/// @brief Matches an extension whose colon is at `colon`.
[[nodiscard]] std::optional<ast::Inline_Extension> match_extension(std::string_view text, Size colon)
{
    const std::string_view rest = text.substr(colon + 1);
    for (const Extension_Name& name : extension_names) {
        if (!rest.starts_with(name.prefix)) {
            continue;
        }
        const Size attributes_begin = colon + 1 + name.prefix.length();
        const Size close = text.find_first_of("]\n", attributes_begin);
        if (close == std::string_view::npos || text[close] != ']') {
            return {};
        }
        const std::string_view attribute_text
            = text.substr(attributes_begin, close - attributes_begin);

        std::vector<Diagnostic> diagnostics;
        const Attribute_List attributes = parse_attributes(attribute_text, {}, diagnostics);
        if (!diagnostics.empty()) {
            return {};
        }

        ast::Inline_Extension result { .type = name.type,
                                       .begin = colon,
                                       .length = close + 1 - colon,
                                       .text = {},
                                       .tier = {},
                                       .source = {} };
        switch (name.type) {
        case ast::Inline_Extension_Type::evidence:
            result.text = std::string(trim(attribute_text));
            result.tier = attributes.get_integer("tier");
            result.source = attributes.get_text("source");
            break;
        case ast::Inline_Extension_Type::status:
            result.text = attributes.get_text("value").value_or("");
            break;
        }
        return result;
    }
    return {};
}

} // namespace

std::vector<ast::Inline_Extension> scan_inline_extensions(std::string_view text)
{
    std::vector<ast::Inline_Extension> result;
    bool in_fence = false;
    Size pos = 0;
    while (pos < text.length()) {
        const bool at_line_start = pos == 0 || text[pos - 1] == '\n';
        const bool is_fence = at_line_start && is_fence_line(text, pos);
        if (is_fence) {
            in_fence = !in_fence;
        }
        if (in_fence || is_fence) {
            const Size newline = text.find('\n', pos);
            pos = newline == std::string_view::npos ? text.length() : newline + 1;
            continue;
        }

        const char c = text[pos];
        if (c == '`') {
            // A code span ends at the next run of backticks of equal length.
            const Size ticks = run_length(text, pos, '`');
            Size search = pos + ticks;
            pos = search;
            while ((search = text.find('`', search)) != std::string_view::npos) {
                const Size length = run_length(text, search, '`');
                if (length == ticks) {
                    pos = search + length;
                    break;
                }
                search += length;
            }
            continue;
        }
        if (c == ':') {
            const Size colons = run_length(text, pos, ':');
            if (colons == 1) {
                if (std::optional<ast::Inline_Extension> extension = match_extension(text, pos)) {
                    pos = extension->end();
                    result.push_back(std::move(*extension));
                    continue;
                }
            }
            pos += colons;
            continue;
        }
        ++pos;
    }
    return result;
}

std::string inline_extension_label(const ast::Inline_Extension& extension)
{
    switch (extension.type) {
    case ast::Inline_Extension_Type::status: return extension.text;
    case ast::Inline_Extension_Type::evidence: {
        std::string result = extension.source.value_or("");
        if (extension.tier) {
            result += result.empty() ? "tier " : ", tier ";
            result += std::to_string(*extension.tier);
        }
        return result.empty() ? extension.text : result;
    }
    }
    SURFDOC_ASSERT_UNREACHABLE("Invalid inline extension type.");
}

} // namespace surfdoc
