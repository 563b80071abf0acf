#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "adapters/http/exchange.hpp"

namespace fs = std::filesystem;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net = boost::asio;
using socket_type = net::local::stream_protocol::socket;
using nxup::adapters::http::exchange;
using nxup::infra::ErrorCode;

namespace {

constexpr std::string_view kUnauthorized =
    "HTTP/1.1 401 Unauthorized\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
constexpr std::string_view kCreated =
    "HTTP/1.1 201 Created\r\nContent-Length: 0\r\n\r\n";

class ExchangeTest : public ::testing::Test {
protected:
    void SetUp() override {
        file_ = fs::temp_directory_path() /
            ("nxup_exchange_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        net::local::connect_pair(client_, server_);
    }

    void TearDown() override {
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        fs::remove(file_);
    }

    auto make_request(std::size_t size) -> bhttp::request<bhttp::file_body> {
        {
            std::ofstream out(file_, std::ios::binary);
            const std::string chunk(64 * 1024, 'x');
            for (std::size_t written = 0; written < size; written += chunk.size()) {
                out.write(chunk.data(), static_cast<std::streamsize>(std::min(chunk.size(), size - written)));
            }
        }
        bhttp::request<bhttp::file_body> request{bhttp::verb::put, "/repository/docs-tds/tds/1.0/a.bin", 11};
        beast::error_code ec;
        request.body().open(file_.c_str(), beast::file_mode::scan, ec);
        EXPECT_FALSE(ec) << ec.message();
        request.set(bhttp::field::host, "artifacts.unidata.ucar.edu");
        request.prepare_payload();
        return request;
    }

    net::io_context ioc_;
    socket_type client_{ioc_};
    socket_type server_{ioc_};
    std::thread server_thread_;
    fs::path file_;
};

} // namespace

TEST_F(ExchangeTest, ReturnsStatusAfterFullRequest)
{
    auto request = make_request(1024);
    server_thread_ = std::thread([this] {
        beast::flat_buffer buffer;
        bhttp::request<bhttp::string_body> received;
        beast::error_code ec;
        bhttp::read(server_, buffer, received, ec);
        EXPECT_FALSE(ec) << ec.message();
        EXPECT_EQ(received.method(), bhttp::verb::put);
        EXPECT_EQ(received.body().size(), 1024u);
        net::write(server_, net::buffer(kCreated), ec);
    });

    auto status = exchange(client_, request);
    ASSERT_TRUE(status.has_value()) << status.error().message;
    EXPECT_EQ(*status, 201);
}

TEST_F(ExchangeTest, EarlyRejectionIsReportedAsStatus)
{
    // Тело намного больше буфера сокета: сервер отвечает и закрывается, не дочитав
    auto request = make_request(8 * 1024 * 1024);
    server_thread_ = std::thread([this] {
        beast::error_code ec;
        net::write(server_, net::buffer(kUnauthorized), ec);
        server_.close(ec);
    });

    auto status = exchange(client_, request);
    ASSERT_TRUE(status.has_value()) << status.error().message;
    EXPECT_EQ(*status, 401);
}

TEST_F(ExchangeTest, ClosedWithoutResponseIsTransportFailure)
{
    auto request = make_request(8 * 1024 * 1024);
    server_thread_ = std::thread([this] {
        beast::error_code ec;
        server_.close(ec);
    });

    auto status = exchange(client_, request);
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, ErrorCode::TransportFailure);
    EXPECT_EQ(status.error().message.rfind("Upload transport failed with error - ", 0), 0u);
}
