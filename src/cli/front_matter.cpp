#include "common/parse.hpp"

#include "cli/front_matter.hpp"

namespace surfdoc {

namespace {

struct Line {
    std::string_view text;
    /// @brief The offset of the first character past the line terminator.
    Size next;
};

Line line_at(std::string_view source, Size offset)
{
    const Size end = source.find('\n', offset);
    const Size text_end = end == std::string_view::npos ? source.length() : end;
    std::string_view text = source.substr(offset, text_end - offset);
    if (text.ends_with('\r')) {
        text.remove_suffix(1);
    }
    return { text, end == std::string_view::npos ? source.length() : end + 1 };
}

std::string_view unquote(std::string_view value)
{
    if (value.length() >= 2 && (value.front() == '"' || value.front() == '\'')
        && value.back() == value.front()) {
        return value.substr(1, value.length() - 2);
    }
    return value;
}

void parse_entry(Front_Matter& out, std::string_view line)
{
    // Indented lines belong to nested structures, which are not supported.
    if (line.empty() || is_space(line.front()) || line.starts_with('#')) {
        return;
    }
    const Size colon = line.find(':');
    if (colon == std::string_view::npos) {
        return;
    }
    const std::string_view key = trim(line.substr(0, colon));
    if (key.empty()) {
        return;
    }
    const std::string_view value = unquote(trim(line.substr(colon + 1)));
    out.emplace(std::string(key), std::string(value));
}

} // namespace

Split_Document split_front_matter(std::string_view source)
{
    Split_Document result;

    const Line opening = line_at(source, 0);
    if (trim_right(opening.text) != "---") {
        result.body = std::string(source);
        return result;
    }

    Front_Matter front_matter;
    Size line_count = 1;
    for (Size offset = opening.next; offset < source.length(); ++line_count) {
        const Line line = line_at(source, offset);
        const std::string_view fence = trim_right(line.text);
        if (fence == "---" || fence == "...") {
            result.front_matter = std::move(front_matter);
            result.body_line = line_count + 1;
            result.body.assign(result.body_line, '\n');
            result.body += source.substr(line.next);
            return result;
        }
        parse_entry(front_matter, line.text);
        offset = line.next;
    }

    result.body = std::string(source);
    return result;
}

} // namespace surfdoc
