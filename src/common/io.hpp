#ifndef SURFDOC_IO_HPP
#define SURFDOC_IO_HPP

#include <memory_resource>
#include <string_view>
#include <vector>

#include "common/io_error.hpp"
#include "common/result.hpp"

namespace surfdoc {

/// @brief Reads the whole file at `path` into a vector of bytes.
Result<std::pmr::vector<char>, IO_Error_Code> file_to_bytes(std::string_view path,
                                                            std::pmr::memory_resource* memory);

/// @brief Writes `bytes` to the file at `path`, replacing any previous contents.
/// The parent directory is created if it does not exist yet.
Result<void, IO_Error_Code> bytes_to_file(std::string_view path, std::string_view bytes);

} // namespace surfdoc

#endif
