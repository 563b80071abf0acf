#include "beast_transport.hpp"
#include "url.hpp"
#include "exchange.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <git_info.hpp>

namespace nxup::adapters::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr int kHttp11 = 11;

} // namespace

BeastTransport::BeastTransport()
    : user_agent_(fmt::format("nexus-upload/{} {}", build_info::project_version, BOOST_BEAST_VERSION_STRING))
{}

auto BeastTransport::put_file(const std::filesystem::path& file,
                              const std::string& url,
                              const core::Credentials& credentials)
    -> std::expected<int, infra::Error>
{
    auto endpoint = parse_https_url(url);
    if (!endpoint) {
        return std::unexpected(std::move(endpoint.error()));
    }

    bhttp::request<bhttp::file_body> request{bhttp::verb::put, endpoint->target, kHttp11};
    beast::error_code ec;
    request.body().open(file.c_str(), beast::file_mode::scan, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            fmt::format("Cannot open {} for upload: {}", file.string(), ec.message())));
    }
    request.set(bhttp::field::host, endpoint->host);
    request.set(bhttp::field::user_agent, user_agent_);
    request.set(bhttp::field::authorization, core::basic_auth_header(credentials));
    request.set(bhttp::field::content_type, "application/octet-stream");
    request.prepare_payload();

    spdlog::debug("PUT https://{}:{}{}", endpoint->host, endpoint->port, endpoint->target);

    try {
        net::io_context ioc;
        ssl::context ssl_context(ssl::context::tls_client);
        ssl_context.set_default_verify_paths();
        ssl_context.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_context);
        // SNI: без него многие хосты не завершают handshake
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint->host.c_str())) {
            return std::unexpected(transport_error(
                boost::system::error_code{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()}));
        }
        stream.set_verify_callback(ssl::host_name_verification(endpoint->host));

        tcp::resolver resolver(ioc);
        const auto results = resolver.resolve(endpoint->host, endpoint->port);
        beast::get_lowest_layer(stream).connect(results);
        stream.handshake(ssl::stream_base::client);

        auto status = exchange(stream, request);
        if (!status) {
            return status;
        }

        stream.shutdown(ec);
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            // Ответ уже получен целиком, ошибка закрытия на результат не влияет
            spdlog::debug("TLS shutdown: {}", ec.message());
        }
        return status;
    } catch (const boost::system::system_error& e) {
        return std::unexpected(transport_error(e.code()));
    }
}

} // namespace nxup::adapters::http
