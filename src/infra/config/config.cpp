#include "config.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include "../../cli/args_parser/args_parser.hpp"

namespace nxup::infra {

    [[nodiscard]]
    auto config_from_cli(const NX_CLI& args, std::vector<std::string> inputs) -> std::expected<Config, Error> {
        if (auto ok = core::validate<core::Field::UploadType>(args.upload_type); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        if (auto ok = core::validate<core::Field::Project>(args.project); !ok) {
            return std::unexpected(std::move(ok.error()));
        }

        Config cfg{};
        // validate() выше гарантирует успешный разбор
        cfg.upload_type = core::parse_upload_type(args.upload_type).value_or(core::UploadType::Docs);
        cfg.project = args.project;
        cfg.version = args.version;
        cfg.username = args.username;
        cfg.password = args.password;
        cfg.dry_run = args.dry_run;
        cfg.file_only = args.file_only;
        cfg.rename = args.rename;
        cfg.files = std::move(inputs);

        if (cfg.files.size() > 1 && cfg.has_rename()) {
            return std::unexpected(make_error(ErrorCode::InvalidFlagCombination,
                "Cannot use the change filename (-c flag) with multiple file uploads"));
        }

        spdlog::debug("Repository: {}", core::repository_id(cfg.upload_type, cfg.project));
        spdlog::debug("Version: {}", cfg.version);
        spdlog::debug("Dry run: {}", cfg.dry_run ? "yes" : "no");
        spdlog::debug("File only: {}", cfg.file_only ? "yes" : "no");
        spdlog::debug("Inputs: {}", cfg.files.size());
        return cfg;
    }

} // namespace nxup::infra
