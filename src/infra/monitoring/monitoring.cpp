#include "monitoring.hpp"
#include <fmt/core.h>
#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

namespace nxup::infra {

ProgressReporter::ProgressReporter(std::ostream& out)
    : out_(out)
    , start_time_(std::chrono::steady_clock::now())
{}

void ProgressReporter::set_total(std::uint64_t files) {
    total_files_ = files;
}

void ProgressReporter::uploading(std::string_view local_path) {
    fmt::print(out_, "Uploading {}\n", local_path);
    out_.flush();
}

void ProgressReporter::dry_run_command(std::string_view command) {
    fmt::print(out_, "{}\n", command);
    out_.flush();
}

void ProgressReporter::uploaded(std::uint64_t bytes) {
    ++uploaded_files_;
    uploaded_bytes_ += bytes;
}

void ProgressReporter::skipped() {
    ++skipped_files_;
}

auto ProgressReporter::get_stats() const -> Stats {
    return Stats{
        .total_files = total_files_,
        .uploaded_files = uploaded_files_,
        .skipped_files = skipped_files_,
        .uploaded_bytes = uploaded_bytes_,
        .start_time = start_time_
    };
}

void ProgressReporter::summary(bool dry_run) const {
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
    if (dry_run) {
        spdlog::debug("Dry run: {} of {} inputs would be uploaded, {} skipped",
                      uploaded_files_, total_files_, skipped_files_);
        return;
    }
    spdlog::debug("Uploaded {} of {} inputs ({} bytes) in {:.2f} s, {} skipped",
                  uploaded_files_, total_files_, uploaded_bytes_, elapsed, skipped_files_);
}

} // namespace nxup::infra
