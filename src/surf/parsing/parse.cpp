#include <utility>

#include "surf/parsing/build.hpp"
#include "surf/parsing/parse.hpp"
#include "surf/validate.hpp"

namespace surfdoc {

Parsed_Document parse(std::string_view source, Front_Matter front_matter)
{
    Document document;
    document.source = std::string(source);
    document.front_matter = std::move(front_matter);
    document.blocks = build_blocks(document.source, {}, document.parse_diagnostics);
    sort_diagnostics(document.parse_diagnostics);

    std::vector<Diagnostic> diagnostics = validate(document);
    return { std::move(document), std::move(diagnostics) };
}

} // namespace surfdoc
