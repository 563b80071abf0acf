#include "path_mapper.hpp"
#include <boost/url.hpp>
#include <fmt/core.h>

namespace nxup::core {

auto select_naming_mode(bool file_only, const std::optional<std::string>& rename) -> NamingMode {
    const bool renamed = rename.has_value() && !rename->empty();
    if (file_only) {
        return renamed ? NamingMode::FileOnlyRenamed : NamingMode::FileOnly;
    }
    return renamed ? NamingMode::PreserveRenamed : NamingMode::PreservePath;
}

auto base_name(std::string_view path) -> std::string {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    if (path == "/") {
        return "/";
    }
    const auto slash = path.rfind('/');
    if (slash == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(slash + 1));
}

auto server_relative_path(std::string_view local_path,
                          bool file_only,
                          const std::optional<std::string>& rename) -> std::string
{
    switch (select_naming_mode(file_only, rename)) {
        case NamingMode::FileOnlyRenamed:
            return base_name(*rename);
        case NamingMode::FileOnly:
            return base_name(local_path);
        case NamingMode::PreserveRenamed:
            return *rename;
        case NamingMode::PreservePath:
            break;
    }

    // Срезаем ровно один ведущий "/" или "./", остальное оставляем как есть
    if (local_path.starts_with('/')) {
        local_path.remove_prefix(1);
    } else if (local_path.starts_with("./")) {
        local_path.remove_prefix(2);
    }
    return std::string(local_path);
}

auto build_upload_url(UploadType type,
                      std::string_view project,
                      std::string_view version,
                      std::string_view server_path) -> std::string
{
    // Имя проекта встречается дважды: в имени репозитория и первым сегментом пути
    boost::urls::url url;
    url.set_scheme_id(boost::urls::scheme::https);
    url.set_host(boost::urls::string_view(kRepositoryHost.data(), kRepositoryHost.size()));
    url.set_path(fmt::format("{}/{}/{}/{}/{}",
                             kRepositoryRoot,
                             repository_id(type, project),
                             project,
                             version,
                             server_path));
    const auto buffer = url.buffer();
    return std::string(buffer.data(), buffer.size());
}

} // namespace nxup::core
