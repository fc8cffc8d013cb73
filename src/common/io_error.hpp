#ifndef SURFDOC_IO_ERROR_HPP
#define SURFDOC_IO_ERROR_HPP

namespace surfdoc {

enum struct IO_Error_Code {
    cannot_open,
    read_error,
    write_error,
};

} // namespace surfdoc

#endif
