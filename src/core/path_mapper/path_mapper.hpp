#pragma once

#include <optional>
#include <string>
#include <string_view>
#include "../catalog/catalog.hpp"

namespace nxup::core {

inline constexpr std::string_view kRepositoryHost = "artifacts.unidata.ucar.edu";
inline constexpr std::string_view kRepositoryRoot = "/repository";

enum class NamingMode {
    FileOnlyRenamed,   // -f -c: basename значения -c
    FileOnly,          // -f: basename локального пути
    PreserveRenamed,   // -c: значение -c как есть
    PreservePath,      // по умолчанию: локальный путь без ведущего "/" или "./"
};

struct UploadTarget {
    std::string local_path;
    std::string server_path;
    std::string url;
};

[[nodiscard]] auto select_naming_mode(bool file_only, const std::optional<std::string>& rename) -> NamingMode;

/// Last path segment, ignoring trailing slashes (same as POSIX basename(1)).
[[nodiscard]] auto base_name(std::string_view path) -> std::string;

/// Path of the file under <repository>/<project>/<version>/ on the server.
[[nodiscard]] auto server_relative_path(std::string_view local_path,
                                        bool file_only,
                                        const std::optional<std::string>& rename) -> std::string;

/// https://<host>/repository/<type>-<project>/<project>/<version>/<server_path>.
/// Characters that are not valid in a URL path are percent-encoded.
[[nodiscard]] auto build_upload_url(UploadType type,
                                    std::string_view project,
                                    std::string_view version,
                                    std::string_view server_path) -> std::string;

} // namespace nxup::core
