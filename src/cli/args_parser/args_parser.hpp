#pragma once

#include <string>
#include <vector>
#include <optional>
#include <string_view>

namespace nxup::args_parser {
    struct CLIArgs
{
    std::string upload_type;                // -t, --type
    std::string username;                   // -u, --user
    std::string project;                    // -o, --project
    std::string version;                    // -v, --project-version
    std::optional<std::string> password;    // -p, --password
    bool dry_run{false};                    // -n, --dry-run
    bool file_only{false};                  // -f, --file-only
    std::optional<std::string> rename;      // -c, --rename
    std::vector<std::string> files;         // позиционные аргументы
    bool help{false};                       // -h, --help
    bool build_info{false};                 // --build-info
};

/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns std::nullopt when the command line is unusable; the reason and the
/// short usage have already been printed to stderr in that case.
/// -h and --build-info short-circuit required-flag checks.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

/// Short usage shown on errors and on a bare invocation.
[[nodiscard]] auto usage_text(std::string_view program) -> std::string;

/// Full help shown by -h.
[[nodiscard]] auto help_text(std::string_view program) -> std::string;

} // namespace nxup::args_parser

using NX_CLI = nxup::args_parser::CLIArgs;
