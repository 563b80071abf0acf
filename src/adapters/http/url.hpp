#pragma once

#include <string>
#include <string_view>
#include <expected>
#include "../../infra/error_handler/error.hpp"

namespace nxup::adapters::http {

struct ParsedUrl {
    std::string host;
    std::string port;
    std::string target;   // закодированный путь, начинающийся с "/"
};

/// Splits an https:// URL into host, port (default 443) and request target.
/// Any other scheme, and anything that is not a valid URI, is rejected.
[[nodiscard]] auto parse_https_url(std::string_view url) -> std::expected<ParsedUrl, infra::Error>;

} // namespace nxup::adapters::http
