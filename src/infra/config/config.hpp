#pragma once

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include "../error_handler/error.hpp"
#include "../../core/catalog/catalog.hpp"

namespace nxup::args_parser {
    struct CLIArgs;
}

namespace nxup::infra {

/// HTTP status codes treated as a successful upload: lower < status <= upper.
/// The default (200, 300] rejects a plain 200 OK and accepts 300; kept as the
/// server-facing behaviour the tool has always had.
struct StatusWindow {
    int lower_exclusive = 200;
    int upper_inclusive = 300;

    [[nodiscard]] constexpr auto accepts(int status) const -> bool {
        return status > lower_exclusive && status <= upper_inclusive;
    }
};

static_assert(StatusWindow{}.accepts(201));
static_assert(!StatusWindow{}.accepts(200));
static_assert(StatusWindow{}.accepts(300));
static_assert(!StatusWindow{}.accepts(301));

struct Config {
    // Куда загружаем
    core::UploadType upload_type = core::UploadType::Docs;
    std::string project;
    std::string version;

    // Учётные данные
    std::string username;
    std::optional<std::string> password;   // nullopt -> запрос на терминале

    // Поведение
    bool dry_run = false;
    bool file_only = false;
    std::optional<std::string> rename;     // только для одного файла

    // Входные файлы в порядке загрузки
    std::vector<std::string> files;

    StatusWindow accepted_status{};

    [[nodiscard]] auto has_rename() const -> bool { return rename.has_value() && !rename->empty(); }
    [[nodiscard]] auto needs_password() const -> bool { return !password.has_value() || password->empty(); }
};

/// Validates the parsed command line against the resolved input list and
/// builds the run configuration. Usage errors come back as InvalidArgument or
/// InvalidFlagCombination.
[[nodiscard]] auto config_from_cli(const struct nxup::args_parser::CLIArgs& args,
                                   std::vector<std::string> inputs) -> std::expected<Config, Error>;

} // namespace nxup::infra
