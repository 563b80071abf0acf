#pragma once

#include <expected>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../infra/error_handler/error.hpp"

namespace nxup::adapters::http {

inline auto transport_error(const boost::system::error_code& ec) -> infra::Error {
    return infra::make_error(infra::ErrorCode::TransportFailure,
        fmt::format("Upload transport failed with error - {}: {}", ec.value(), ec.message()));
}

/// Sends `request` and reads one response from `stream`, returning its status.
/// The server may answer (401, 413 ...) and close before the body is sent in full:
/// after a write error one read is still attempted, and only when it also fails
/// is the write error reported.
template<class SyncStream, class Body>
[[nodiscard]] auto exchange(SyncStream& stream, boost::beast::http::request<Body>& request)
    -> std::expected<int, infra::Error>
{
    namespace beast = boost::beast;
    namespace bhttp = boost::beast::http;

    beast::error_code write_ec;
    bhttp::write(stream, request, write_ec);
    if (write_ec) {
        spdlog::debug("Request write stopped early: {}", write_ec.message());
    }

    beast::error_code read_ec;
    beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> response;
    bhttp::read(stream, buffer, response, read_ec);
    if (read_ec) {
        return std::unexpected(transport_error(write_ec ? write_ec : read_ec));
    }

    const int status = static_cast<int>(response.result_int());
    spdlog::debug("HTTP status: {}", status);
    if (!response.body().empty()) {
        spdlog::debug("Response: {}", response.body());
    }
    return status;
}

} // namespace nxup::adapters::http
