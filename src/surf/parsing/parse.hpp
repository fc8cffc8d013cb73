#ifndef SURFDOC_SURF_PARSING_PARSE_HPP
#define SURFDOC_SURF_PARSING_PARSE_HPP

#include <string_view>
#include <vector>

#include "surf/ast.hpp"
#include "surf/diagnostic.hpp"

namespace surfdoc {

struct Parsed_Document {
    Document document;
    /// @brief All diagnostics of `document`, in canonical order.
    /// This is the result of `validate(document)`.
    std::vector<Diagnostic> diagnostics;
};

/// @brief Parses a SurfDoc document and validates it.
/// Parsing never fails: a tree is returned even for malformed input, and all problems are
/// reported as diagnostics.
/// @param source the document text, without front matter
/// @param front_matter metadata extracted by the caller, if any
[[nodiscard]] Parsed_Document parse(std::string_view source, Front_Matter front_matter = {});

} // namespace surfdoc

#endif
