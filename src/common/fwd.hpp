#ifndef SURFDOC_FWD_HPP
#define SURFDOC_FWD_HPP

#include "common/config.hpp"

namespace surfdoc {

enum struct Code_Span_Type : Default_Underlying;
enum struct IO_Error_Code;

struct Local_Source_Position;
struct Local_Source_Span;
struct Code_String;

template <typename T, typename Error>
struct Result;

} // namespace surfdoc

#endif
