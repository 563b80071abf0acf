#include "app.hpp"

#include <filesystem>
#include <fmt/core.h>
#include <fmt/ostream.h>
#include <spdlog/spdlog.h>
#include <git_info.hpp>

#include "../args_parser/args_parser.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../../core/upload_engine/upload_engine.hpp"

namespace nxup::cli {

namespace {

using GIT = build_info::GitInfo;

auto out_build_info(std::ostream& out, const GIT& info) -> void {
    fmt::print(out, "nexus-upload {}\n", build_info::project_version);
    fmt::print(out, "Git branch: {}\n", info.branch);
    fmt::print(out, "Git commit: {}\n", info.commit);
    fmt::print(out, "Git commit short: {}\n", info.commit_short);
    fmt::print(out, "Git dirty: {}\n", info.dirty ? "yes" : "no");
    fmt::print(out, "Build timestamp (UTC): {}\n", info.timestamp);
}

} // namespace

auto run(int argc, char const* const* argv,
         const adapters::fs::InputSource& source,
         adapters::http::Transport& transport,
         const core::SecretPrompt& prompt,
         std::ostream& out) -> int
{
    const auto program = std::filesystem::path(argc > 0 && argv[0] ? argv[0] : "nexus-upload").filename().string();

    if (argc <= 1) {
        fmt::print(stderr, "{}", args_parser::usage_text(program));
        return 1;
    }

    auto args_opt = args_parser::parse_args(argc, argv);
    if (!args_opt) {
        return 1; // причина и usage уже выведены
    }
    const auto& args = *args_opt;

    if (args.help) {
        fmt::print(out, "{}", args_parser::help_text(program));
        return 0;
    }
    if (args.build_info) {
        out_build_info(out, build_info::get_git_info());
        return 0;
    }

    // 1. Список файлов: либо из pipe, либо из аргументов
    auto inputs = adapters::fs::resolve_inputs(args.files, source);

    // 2. Проверка флагов и сборка конфигурации
    auto config_res = infra::config_from_cli(args, std::move(inputs));
    if (!config_res) {
        auto err = infra::log_and_return(std::move(config_res.error()));
        if (err.is_usage_error()) {
            fmt::print(stderr, "{}", args_parser::usage_text(program));
        }
        return err.to_exit_code();
    }
    const auto& config = *config_res;

    // 3. Пароль запрашивается один раз на весь запуск
    auto credentials = core::resolve_credentials(config, prompt);
    if (!credentials) {
        return infra::log_and_return(std::move(credentials.error())).to_exit_code();
    }

    infra::ProgressReporter reporter(out);
    core::UploadEngine engine(config, transport, reporter);

    auto result = engine.run(*credentials);
    if (!result) {
        return infra::log_and_return(std::move(result.error())).to_exit_code();
    }
    return 0;
}

} // namespace nxup::cli
