#ifndef SURFDOC_SURF_FWD_HPP
#define SURFDOC_SURF_FWD_HPP

#include "common/fwd.hpp"

namespace surfdoc {

enum struct Block_Type : Default_Underlying;
enum struct Directive_Content_Type : Default_Underlying;
enum struct Diagnostic_Code : Default_Underlying;
enum struct Severity : Default_Underlying;

struct Diagnostic;
struct Attribute;
struct Attribute_List;
struct Attribute_Value;
struct Document;
struct Parsed_Document;
struct Render_Config;
struct Markdown_Engine;

namespace ast {

struct Block;

} // namespace ast

} // namespace surfdoc

#endif
