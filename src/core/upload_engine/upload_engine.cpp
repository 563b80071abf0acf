#include "upload_engine.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"

namespace nxup::core {

UploadEngine::UploadEngine(const infra::Config& config,
                           adapters::http::Transport& transport,
                           infra::ProgressReporter& reporter)
    : config_(config), transport_(transport), reporter_(reporter) {}

auto UploadEngine::make_target(const std::string& local_path) const -> UploadTarget {
    auto server_path = server_relative_path(local_path, config_.file_only, config_.rename);
    auto url = build_upload_url(config_.upload_type, config_.project, config_.version, server_path);
    return UploadTarget{
        .local_path = local_path,
        .server_path = std::move(server_path),
        .url = std::move(url)
    };
}

auto UploadEngine::dry_run_command(const UploadTarget& target,
                                   const Credentials& credentials) -> std::string {
    return fmt::format("curl -w httpcode=%{{http_code}} -u {}:{} --upload-file {} {}",
                       credentials.username, kPasswordMask, target.local_path, target.url);
}

auto UploadEngine::run(const Credentials& credentials)
    -> std::expected<UploadStatsSnapshot, infra::Error>
{
    reporter_.set_total(config_.files.size());

    for (const auto& file : config_.files) {
        // Несуществующие и не обычные файлы молча пропускаем
        if (!adapters::fs::is_uploadable(file)) {
            reporter_.skipped();
            continue;
        }

        const auto target = make_target(file);
        reporter_.uploading(target.local_path);

        if (config_.dry_run) {
            reporter_.dry_run_command(dry_run_command(target, credentials));
            reporter_.uploaded(0);
            continue;
        }

        if (auto res = upload_one(target, credentials); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }

    const auto stats = reporter_.get_stats();
    reporter_.summary(config_.dry_run);
    return UploadStatsSnapshot{
        .files_uploaded = stats.uploaded_files,
        .bytes_uploaded = stats.uploaded_bytes,
        .files_skipped = stats.skipped_files
    };
}

auto UploadEngine::upload_one(const UploadTarget& target, const Credentials& credentials)
    -> std::expected<void, infra::Error>
{
    spdlog::debug("{} -> {}", target.local_path, target.url);

    const auto size = adapters::fs::file_size_or_zero(target.local_path);
    auto status = transport_.put_file(target.local_path, target.url, credentials);
    if (!status) {
        return std::unexpected(std::move(status.error()));
    }

    if (!config_.accepted_status.accepts(*status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RejectedStatus,
            fmt::format("Upload to {} failed.\nServer HTTP response code - {}", target.url, *status)));
    }

    reporter_.uploaded(size);
    return {};
}

} // namespace nxup::core
