#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include "common/assert.hpp"
#include "common/config.hpp"
#include "common/io.hpp"

namespace surfdoc {

namespace {

struct File_Closer {
    void operator()(std::FILE* f) const noexcept
    {
        std::fclose(f);
    }
};

using Unique_File = std::unique_ptr<std::FILE, File_Closer>;

} // namespace

Result<std::pmr::vector<char>, IO_Error_Code> file_to_bytes(std::string_view path,
                                                            std::pmr::memory_resource* memory)
{
    constexpr Size block_size = 4096;
    char buffer[block_size] {};

    const Unique_File stream { std::fopen(std::string(path).c_str(), "rb") };
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }

    std::pmr::vector<char> out(memory);
    Size read_size;
    do {
        read_size = std::fread(buffer, 1, block_size, stream.get());
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
        out.insert(out.end(), buffer, buffer + read_size);
    } while (read_size == block_size);

    return out;
}

Result<void, IO_Error_Code> bytes_to_file(std::string_view path, std::string_view bytes)
{
    const std::filesystem::path fs_path { path };
    if (fs_path.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(fs_path.parent_path(), error);
        if (error) {
            return IO_Error_Code::cannot_open;
        }
    }

    const Unique_File stream { std::fopen(fs_path.c_str(), "wb") };
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }
    if (std::fwrite(bytes.data(), 1, bytes.size(), stream.get()) != bytes.size()) {
        return IO_Error_Code::write_error;
    }
    return {};
}

} // namespace surfdoc
