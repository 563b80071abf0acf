#include "catalog.hpp"
#include <fmt/core.h>

namespace nxup::core {

auto field_name(Field field) -> std::string_view {
    switch (field) {
        case Field::UploadType: return "TYPE";
        case Field::Project:    return "PROJECT";
    }
    return "FIELD";
}

auto parse_upload_type(std::string_view value) -> std::optional<UploadType> {
    if (value == "docs") return UploadType::Docs;
    if (value == "downloads") return UploadType::Downloads;
    return std::nullopt;
}

auto to_string(UploadType type) -> std::string_view {
    switch (type) {
        case UploadType::Docs:      return "docs";
        case UploadType::Downloads: return "downloads";
    }
    return "";
}

auto repository_id(UploadType type, std::string_view project) -> std::string {
    return fmt::format("{}-{}", to_string(type), project);
}

} // namespace nxup::core
