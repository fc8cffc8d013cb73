#ifndef SURFDOC_CLI_FRONT_MATTER_HPP
#define SURFDOC_CLI_FRONT_MATTER_HPP

#include <string>
#include <string_view>

#include "surf/ast.hpp"

namespace surfdoc {

struct Split_Document {
    Front_Matter front_matter;
    /// @brief The source where every line of the front matter block, including its fences, is
    /// replaced with an empty line.
    /// Line numbers within the body therefore match those of the original file.
    std::string body;
    /// @brief The zero-based line on which the body starts.
    Size body_line = 0;
};

/// @brief Extracts a leading `---` fenced block of flat `key: value` lines.
/// Surrounding quotes of values are removed; blank lines, `#` comments and lines which are not
/// `key: value` pairs (such as nested YAML) are ignored.
/// If the source does not start with `---`, or the block is not closed with `---` or `...`,
/// there is no front matter and the body is the whole source.
[[nodiscard]] Split_Document split_front_matter(std::string_view source);

} // namespace surfdoc

#endif
