#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace nxup::adapters::fs {

/// Where the list of files to upload comes from.
struct InputSource {
    bool stdin_is_pipe = false;
    std::istream* stdin_stream = nullptr;   // читается только если stdin_is_pipe
};

// Проверка fd 0 на FIFO (аналог `[[ -p /dev/stdin ]]`)
[[nodiscard]] auto stdin_is_pipe() -> bool;

// Весь поток, разбитый по пробельным символам
[[nodiscard]] auto read_tokens(std::istream& in) -> std::vector<std::string>;

/// Piped stdin replaces the positional arguments entirely; the two are never merged.
[[nodiscard]] auto resolve_inputs(const std::vector<std::string>& positional,
                                  const InputSource& source) -> std::vector<std::string>;

// Существует и является обычным файлом (симлинки разыменовываются)
[[nodiscard]] auto is_uploadable(const std::filesystem::path& path) -> bool;

[[nodiscard]] auto file_size_or_zero(const std::filesystem::path& path) -> std::uintmax_t;

} // namespace nxup::adapters::fs
