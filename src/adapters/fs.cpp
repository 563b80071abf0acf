#include "fs.hpp"

#include <iterator>
#include <system_error>
#include <sys/stat.h>
#include <unistd.h>

namespace nxup::adapters::fs {

auto stdin_is_pipe() -> bool {
    struct stat sb;
    if (::fstat(STDIN_FILENO, &sb) == -1) {
        return false;
    }
    return S_ISFIFO(sb.st_mode);
}

auto read_tokens(std::istream& in) -> std::vector<std::string> {
    return {std::istream_iterator<std::string>(in), std::istream_iterator<std::string>()};
}

auto resolve_inputs(const std::vector<std::string>& positional,
                    const InputSource& source) -> std::vector<std::string>
{
    if (source.stdin_is_pipe && source.stdin_stream != nullptr) {
        return read_tokens(*source.stdin_stream);
    }
    return positional;
}

auto is_uploadable(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

auto file_size_or_zero(const std::filesystem::path& path) -> std::uintmax_t {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

} // namespace nxup::adapters::fs
