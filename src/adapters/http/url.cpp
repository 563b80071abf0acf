#include "url.hpp"

#include <boost/url.hpp>
#include <fmt/core.h>

namespace nxup::adapters::http {

namespace urls = boost::urls;

auto parse_https_url(std::string_view url) -> std::expected<ParsedUrl, infra::Error> {
    const auto parsed = urls::parse_uri(urls::string_view(url.data(), url.size()));
    if (!parsed) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidUrl,
            fmt::format("Malformed URL {}: {}", url, parsed.error().message())));
    }
    const urls::url_view& uri = *parsed;

    if (uri.scheme_id() != urls::scheme::https) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidUrl,
            fmt::format("Only https URLs are supported: {}", url)));
    }
    if (!uri.has_authority() || uri.encoded_host().empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidUrl,
            fmt::format("Missing host in URL: {}", url)));
    }
    if (uri.has_port() && uri.port().empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidUrl,
            fmt::format("Malformed port in URL: {}", url)));
    }

    const auto port = uri.port();
    const auto path = uri.encoded_path();

    ParsedUrl result{};
    result.host = uri.host();
    result.port = uri.has_port() ? std::string(port.data(), port.size()) : "443";
    result.target = path.empty() ? "/" : std::string(path.data(), path.size());
    return result;
}

} // namespace nxup::adapters::http
