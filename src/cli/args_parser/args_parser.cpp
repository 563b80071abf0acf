#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <array>
#include <utility>

namespace nxup::args_parser {

namespace {

auto program_name(int argc, char const* const* argv) -> std::string {
    if (argc < 1 || argv[0] == nullptr) {
        return "nexus-upload";
    }
    return std::filesystem::path(argv[0]).filename().string();
}

} // namespace

auto usage_text(std::string_view program) -> std::string {
    return fmt::format(
R"(Minimum Usage:
  {0} -t <docs|downloads> -u USERNAME -o PROJECT_NAME -v PROJECT_VERSION file1...
Use {0} -h for more details.
)", program);
}

auto help_text(std::string_view program) -> std::string {
    return fmt::format(
R"(
Usage:
  {0} -t <docs|downloads> -u USERNAME -o PROJECT_NAME -v PROJECT_VERSION [-p PASSWORD] [-c NEW_FILENAME] [-nhf] file...

Description:
  {0} - upload one or more files to the Unidata Nexus artifacts server.

  Files will be uploaded to https://artifacts.unidata.ucar.edu/repository/<raw-repo-name>/<project>/<version>/,
  where <raw-repo-name> is determined by the upload type (-t) and project name (-o) flags, and version is
  set by the project version (-v) flag. If the password flag (-p) is not supplied, a password prompt will
  display.

  For example, upload type "docs", project name "netcdf-java", and version "5.4.2" will upload files to:

    https://artifacts.unidata.ucar.edu/repository/docs-netcdf-java/netcdf-java/5.4.2/

  The naming structure under <raw-repo-name>/<project>/<version> will match the path used by the input file,
  so if the file path passed to {0} is ./a/b/file.txt, then the command:

    {0} -t downloads -u username -o tds -v 1.2.3 ./a/b/file.txt

  will create the following file on the nexus artifacts server:

    https://artifacts.unidata.ucar.edu/repository/downloads-tds/tds/1.2.3/a/b/file.txt

  If the path should not be reflected on the server side, use the filename only flag (-f).

  For example, the command:

    {0} -t downloads -u username -o tds -v 1.2.3 -f ./a/b/file.txt

  will create the following file on the nexus artifacts server:

    https://artifacts.unidata.ucar.edu/repository/downloads-tds/tds/1.2.3/file.txt

  If the directory ./a/b contains the following tarballs:
    a/
      b/
        tarball-1.tar.bz2
        tarball-2.tar.bz2
        tarball-3.tar.bz2

  The command:

    {0} -t downloads -u username -o tds -v 1.2.3 ./a/b/*.tar.bz2

  will create the following three files on the nexus artifacts server:

    https://artifacts.unidata.ucar.edu/repository/downloads-tds/tds/1.2.3/a/b/tarball-1.tar.bz2
    https://artifacts.unidata.ucar.edu/repository/downloads-tds/tds/1.2.3/a/b/tarball-2.tar.bz2
    https://artifacts.unidata.ucar.edu/repository/downloads-tds/tds/1.2.3/a/b/tarball-3.tar.bz2

  Using the -f flag with the previous command would result in the following files on the nexus artifacts server:

    https://artifacts.unidata.ucar.edu/repository/downloads-tds/tds/1.2.3/tarball-1.tar.bz2
    https://artifacts.unidata.ucar.edu/repository/downloads-tds/tds/1.2.3/tarball-2.tar.bz2
    https://artifacts.unidata.ucar.edu/repository/downloads-tds/tds/1.2.3/tarball-3.tar.bz2

  If you would like the name of the file on the nexus artifacts server to be different than the local
  file you are uploading, use the change filename flag (-c).

  For example, the command:

    {0} -t downloads -u username -o tds -v 1.2.3 -c newFile.txt file.txt

  will create the following file on the nexus artifacts server:

    https://artifacts.unidata.ucar.edu/repository/downloads-tds/tds/1.2.3/newFile.txt

  To upload the entire contents of a directory, pair {0} with the find command using a pipe.
  For example, to upload every file found under the ./docs/ directory, use the command:

    find ./docs -type f | {0} -t docs -u username -o tds -v 1.2.3

Required flags:
  -t, --type:            upload type
                         must be either docs or downloads
  -u, --user:            nexus username
  -o, --project:         project name
                         one of idv, ldm, netcdf-c, netcdf-cxx, netcdf-fortran,
                         netcdf-java, rosetta, ncml, tds, udunits, awips2
  -v, --project-version: project version

Optional flags:
  -p, --password:        nexus password
                         prompted for on the terminal when omitted
  -n, --dry-run:         dry-run
                         echo upload command, but do not execute
  -f, --file-only:       use filename only
                         do not preserve local path in the server side path
  -c, --rename:          change the filename on the server side (incompatible when uploading multiple files)
  -h, --help:            help
                         display this help message
  --build-info:          print build information and exit

)", program);
}

std::optional<CLIArgs> parse_args(int argc, char const* const* argv) {
    const auto program = program_name(argc, argv);
    CLIArgs args{};

    CLI::App app{"Upload files to the Unidata Nexus artifacts server", program};
    // Свой текст help печатает main; CLI11 только сообщает о флаге через CallForHelp
    auto* help_opt = app.set_help_flag("-h,--help", "Display help");

    std::string password;
    std::string rename;

    auto* type_opt    = app.add_option("-t,--type", args.upload_type, "Upload type (docs|downloads)");
    auto* user_opt    = app.add_option("-u,--user", args.username, "Nexus username");
    auto* project_opt = app.add_option("-o,--project", args.project, "Project name");
    auto* version_opt = app.add_option("-v,--project-version", args.version, "Project version");
    auto* pass_opt    = app.add_option("-p,--password", password, "Nexus password");
    auto* rename_opt  = app.add_option("-c,--rename", rename, "Server side file name");
    app.add_flag("-n,--dry-run", args.dry_run, "Echo upload commands, do not execute");
    app.add_flag("-f,--file-only", args.file_only, "Do not preserve the local path on the server");
    app.add_flag("--build-info", args.build_info, "Print build information");
    app.add_option("files", args.files, "Files to upload");

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp&) {
        args.help = true;
        return args;
    } catch (const CLI::ParseError& e) {
        // -h, встреченный до ошибки разбора, всё равно выигрывает
        if (help_opt->count() > 0) {
            args.help = true;
            return args;
        }
        spdlog::error("{}", e.what());
        fmt::print(stderr, "{}", usage_text(program));
        return std::nullopt;
    }

    if (args.build_info) {
        return args;
    }

    const std::array<std::pair<CLI::Option*, std::string_view>, 4> required{{
        {type_opt, "-t"},
        {user_opt, "-u"},
        {project_opt, "-o"},
        {version_opt, "-v"},
    }};
    for (const auto& [opt, flag] : required) {
        if (opt->count() == 0) {
            spdlog::error("Missing required flag {}", flag);
            fmt::print(stderr, "{}", usage_text(program));
            return std::nullopt;
        }
    }

    if (pass_opt->count() > 0) {
        args.password = std::move(password);
    }
    if (rename_opt->count() > 0) {
        args.rename = std::move(rename);
    }
    return args;
}

} // namespace nxup::args_parser
