#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace nxup::infra {

/// User-facing progress output of an upload run (stdout by default).
/// Diagnostics go through spdlog; this only prints what the user asked to see.
class ProgressReporter {
public:
    struct Stats {
        std::uint64_t total_files = 0;
        std::uint64_t uploaded_files = 0;
        std::uint64_t skipped_files = 0;
        std::uint64_t uploaded_bytes = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressReporter(std::ostream& out);

    void set_total(std::uint64_t files);
    void uploading(std::string_view local_path);
    void dry_run_command(std::string_view command);
    void uploaded(std::uint64_t bytes);
    void skipped();

    [[nodiscard]] auto get_stats() const -> Stats;

    // Итоговая строка в лог
    void summary(bool dry_run) const;

private:
    std::ostream& out_;
    std::uint64_t total_files_ = 0;
    std::uint64_t uploaded_files_ = 0;
    std::uint64_t skipped_files_ = 0;
    std::uint64_t uploaded_bytes_ = 0;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace nxup::infra
