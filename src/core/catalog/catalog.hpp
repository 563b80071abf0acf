#pragma once

#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <expected>
#include <algorithm>
#include <fmt/core.h>
#include "../../infra/error_handler/error.hpp"

namespace nxup::core {

// Поля командной строки, значения которых ограничены фиксированным набором
enum class Field {
    UploadType,
    Project,
};

enum class UploadType {
    Docs,
    Downloads,
};

inline constexpr std::array<std::string_view, 2> kUploadTypes{
    "docs",
    "downloads",
};

inline constexpr std::array<std::string_view, 11> kProjects{
    "idv",
    "ldm",
    "netcdf-c",
    "netcdf-cxx",
    "netcdf-fortran",
    "netcdf-java",
    "rosetta",
    "ncml",
    "tds",
    "udunits",
    "awips2",
};

/// Permitted values for a restricted field, resolved at compile time.
template<Field F>
[[nodiscard]] constexpr auto allowed_values() {
    if constexpr (F == Field::UploadType) {
        return kUploadTypes;
    } else {
        return kProjects;
    }
}

template<Field F>
[[nodiscard]] constexpr auto is_allowed(std::string_view value) -> bool {
    constexpr auto values = allowed_values<F>();
    return std::find(values.begin(), values.end(), value) != values.end();
}

static_assert(is_allowed<Field::UploadType>("docs"));
static_assert(!is_allowed<Field::UploadType>("doc"));
static_assert(is_allowed<Field::Project>("netcdf-java"));

[[nodiscard]] auto field_name(Field field) -> std::string_view;

/// Checks membership and builds the user-facing error listing the permitted values.
template<Field F>
[[nodiscard]] auto validate(std::string_view value) -> std::expected<void, infra::Error> {
    if (is_allowed<F>(value)) {
        return {};
    }
    std::string valid;
    for (const auto& v : allowed_values<F>()) {
        if (!valid.empty()) valid += " || ";
        valid += v;
    }
    return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
        fmt::format("Invalid value \"{}\". {} must be one of [ {} ]", value, field_name(F), valid)));
}

[[nodiscard]] auto parse_upload_type(std::string_view value) -> std::optional<UploadType>;
[[nodiscard]] auto to_string(UploadType type) -> std::string_view;

/// Raw repository name on the artifacts server: "<type>-<project>".
[[nodiscard]] auto repository_id(UploadType type, std::string_view project) -> std::string;

} // namespace nxup::core
