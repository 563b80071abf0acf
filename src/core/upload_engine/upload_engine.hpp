#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <expected>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../../adapters/http/transport.hpp"
#include "../credentials/credentials.hpp"
#include "../path_mapper/path_mapper.hpp"

namespace nxup::core {

struct UploadStatsSnapshot {
    std::uint64_t files_uploaded = 0;
    std::uint64_t bytes_uploaded = 0;
    std::uint64_t files_skipped = 0;
};

/// Uploads the configured files in order and stops at the first failure.
class UploadEngine {
public:
    UploadEngine(const infra::Config& config,
                 adapters::http::Transport& transport,
                 infra::ProgressReporter& reporter);

    [[nodiscard]] auto run(const Credentials& credentials)
        -> std::expected<UploadStatsSnapshot, infra::Error>;

    [[nodiscard]] auto make_target(const std::string& local_path) const -> UploadTarget;

    /// Command line printed in dry-run mode. The password never appears in it.
    [[nodiscard]] static auto dry_run_command(const UploadTarget& target,
                                              const Credentials& credentials) -> std::string;

private:
    [[nodiscard]] auto upload_one(const UploadTarget& target, const Credentials& credentials)
        -> std::expected<void, infra::Error>;

    const infra::Config& config_;
    adapters::http::Transport& transport_;
    infra::ProgressReporter& reporter_;
};

} // namespace nxup::core
