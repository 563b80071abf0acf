#pragma once

#include <ostream>
#include "../../adapters/fs.hpp"
#include "../../adapters/http/transport.hpp"
#include "../../core/credentials/credentials.hpp"

namespace nxup::cli {

/// Whole command line run: flags, inputs, password, uploads.
/// Help, build info and progress go to `out`; diagnostics and usage go to stderr.
/// Returns the process exit code.
[[nodiscard]] auto run(int argc, char const* const* argv,
                       const adapters::fs::InputSource& source,
                       adapters::http::Transport& transport,
                       const core::SecretPrompt& prompt,
                       std::ostream& out) -> int;

} // namespace nxup::cli
