#include "server_harness.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <array>
#include <thread>
#include <vector>

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using namespace std::chrono_literals;

constexpr std::uint64_t kMaxSize = 4096;

class HttpServerTest : public ::testing::Test {
  protected:
    HttpServerTest() : server_(1s, kMaxSize) {}

    tcp::socket Connect() {
        tcp::socket socket(ioc_);
        socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_.Port()));
        return socket;
    }

    http::response<http::string_body> Send(http::verb method, const std::string& target,
                                           const std::string& body = {}) {
        auto socket = Connect();
        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(false);
        if (method == http::verb::post || !body.empty()) {
            req.body() = body;
            req.prepare_payload();
        }
        http::write(socket, req);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.skip(method == http::verb::head);
        http::read(socket, buffer, parser);
        return parser.release();
    }

    // Writes `raw` as is and reads one response.
    http::response<http::string_body> SendRaw(const std::string& raw) {
        auto socket = Connect();
        asio::write(socket, asio::buffer(raw));
        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(socket, buffer, res);
        return res;
    }

    std::string Upload(const std::string& body) {
        auto res = Send(http::verb::post, "/transfer", body);
        EXPECT_EQ(res.result(), http::status::created) << res.body();
        return nlohmann::json::parse(res.body()).at("id").get<std::string>();
    }

    asio::io_context ioc_;
    testutil::ServerHarness server_;
};

TEST_F(HttpServerTest, IndexAndCommonHeaders) {
    auto res = Send(http::verb::get, "/");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::server], "xfer-server");
    EXPECT_EQ(res["X-Robots-Tag"], "none");
    EXPECT_NE(res.body().find("xfer-server"), std::string::npos);
}

TEST_F(HttpServerTest, ConfigurationReportsLimits) {
    auto res = Send(http::verb::get, "/configuration");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");

    const auto j = nlohmann::json::parse(res.body());
    EXPECT_EQ(j.at("transfer").at("expire_after_ms").get<std::uint64_t>(), 1000u);
    EXPECT_EQ(j.at("transfer").at("max_size_bytes").get<std::uint64_t>(), kMaxSize);
}

TEST_F(HttpServerTest, TrailingSlashAndQueryAreIgnored) {
    EXPECT_EQ(Send(http::verb::get, "/configuration/").result(), http::status::ok);
    EXPECT_EQ(Send(http::verb::get, "/configuration?v=1").result(), http::status::ok);
}

TEST_F(HttpServerTest, UploadThenDownload) {
    const std::string id = Upload("world");
    EXPECT_TRUE(xfer::ValidateIdentifier(id)) << id;

    auto get = Send(http::verb::get, "/transfer/" + id);
    ASSERT_EQ(get.result(), http::status::ok);
    EXPECT_EQ(get.body(), "world");
    EXPECT_EQ(get[http::field::content_type], "application/octet-stream");
    EXPECT_EQ(get[http::field::cache_control].substr(0, 8), "max-age=");
    EXPECT_NE(get[http::field::cache_control].find("must-revalidate"), beast::string_view::npos);

    auto head = Send(http::verb::head, "/transfer/" + id);
    ASSERT_EQ(head.result(), http::status::ok);
    EXPECT_EQ(head[http::field::content_length], "5");
    EXPECT_TRUE(head.body().empty());
}

TEST_F(HttpServerTest, EmptyUploadIsAccepted) {
    const std::string id = Upload("");
    auto head = Send(http::verb::head, "/transfer/" + id);
    ASSERT_EQ(head.result(), http::status::ok);
    EXPECT_EQ(head[http::field::content_length], "0");
}

TEST_F(HttpServerTest, RecognisedFileTypeIsRejected) {
    std::string png("\x89PNG\r\n\x1a\n", 8);
    png.append(200, 'x');
    auto res = Send(http::verb::post, "/transfer", png);
    EXPECT_EQ(res.result(), http::status::unprocessable_entity);
    EXPECT_NE(res.body().find("image/png"), std::string::npos);
    EXPECT_EQ(server_.StoredCount(), 0u);
}

TEST_F(HttpServerTest, OversizedUploadIsRejected) {
    auto res = SendRaw("POST /transfer HTTP/1.1\r\nHost: 127.0.0.1\r\nContent-Length: " +
                       std::to_string(kMaxSize + 1) + "\r\n\r\n");
    EXPECT_EQ(res.result(), http::status::payload_too_large);
    EXPECT_EQ(server_.StoredCount(), 0u);
}

TEST_F(HttpServerTest, UploadAtLimitIsAccepted) {
    const auto body = testutil::PatternBytes(kMaxSize, 200);
    // The pattern starts with 58 DB 5E and matches no known signature.
    const std::string id = Upload(std::string(body.begin(), body.end()));
    auto head = Send(http::verb::head, "/transfer/" + id);
    EXPECT_EQ(head[http::field::content_length], std::to_string(kMaxSize));
}

TEST_F(HttpServerTest, MalformedRequestIsBadRequest) {
    auto res = SendRaw("GET /\r\n\r\n");
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(HttpServerTest, RoutingErrors) {
    EXPECT_EQ(Send(http::verb::get, "/nowhere").result(), http::status::not_found);
    EXPECT_EQ(Send(http::verb::get, "/transfer/NOT_AN_ID").result(), http::status::bad_request);
    EXPECT_EQ(Send(http::verb::get, "/transfer/alpha-bravo-charlie-delta").result(), http::status::not_found);
    EXPECT_EQ(Send(http::verb::get, "/transfer/Ab-cd-ef-gh").result(), http::status::not_found);
    EXPECT_EQ(Send(http::verb::head, "/transfer/..%2F-b-c-d").result(), http::status::not_found);
    EXPECT_EQ(Send(http::verb::get, "/transfer/a/../b-c-d-e").result(), http::status::not_found);

    auto del = Send(http::verb::delete_, "/transfer/alpha-bravo-charlie-delta");
    EXPECT_EQ(del.result(), http::status::method_not_allowed);
    EXPECT_EQ(del[http::field::allow], "GET, HEAD");

    auto get = Send(http::verb::get, "/transfer");
    EXPECT_EQ(get.result(), http::status::method_not_allowed);
    EXPECT_EQ(get[http::field::allow], "POST");

    auto post = Send(http::verb::post, "/transfer/alpha-bravo-charlie-delta", "data");
    EXPECT_EQ(post.result(), http::status::method_not_allowed);
}

TEST_F(HttpServerTest, KeepAliveServesSeveralRequests) {
    auto socket = Connect();
    beast::flat_buffer buffer;
    for (int i = 0; i < 3; ++i) {
        http::request<http::empty_body> req{http::verb::get, "/configuration", 11};
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(true);
        http::write(socket, req);

        http::response<http::string_body> res;
        http::read(socket, buffer, res);
        EXPECT_EQ(res.result(), http::status::ok);
        EXPECT_TRUE(res.keep_alive());
    }
}

TEST_F(HttpServerTest, TransferExpires) {
    const std::string id = Upload("gone soon");
    ASSERT_EQ(Send(http::verb::get, "/transfer/" + id).result(), http::status::ok);

    std::this_thread::sleep_for(1200ms);
    EXPECT_EQ(Send(http::verb::get, "/transfer/" + id).result(), http::status::not_found);
    EXPECT_EQ(Send(http::verb::head, "/transfer/" + id).result(), http::status::not_found);
}

// Connections closing on their own while the server shuts down.
TEST(HttpServerShutdownTest, StopWhileConnectionsClose) {
    asio::io_context ioc;
    std::vector<tcp::socket> sockets;
    std::thread closer;
    {
        testutil::ServerHarness server(1h, kMaxSize);
        for (int i = 0; i < 8; ++i) {
            tcp::socket socket(ioc);
            socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), server.Port()));
            http::request<http::empty_body> req{http::verb::get, "/", 11};
            req.set(http::field::host, "127.0.0.1");
            req.keep_alive(true);
            http::write(socket, req);
            beast::flat_buffer buffer;
            http::response<http::string_body> res;
            http::read(socket, buffer, res);
            ASSERT_EQ(res.result(), http::status::ok);
            sockets.push_back(std::move(socket));
        }

        closer = std::thread([&sockets] {
            for (size_t i = 0; i < sockets.size(); i += 2) {
                beast::error_code ec;
                sockets[i].close(ec);
            }
        });
        // Leaving the scope stops the server and waits for every connection.
    }
    closer.join();

    for (size_t i = 1; i < sockets.size(); i += 2) {
        std::array<char, 1> byte{};
        beast::error_code ec;
        sockets[i].read_some(asio::buffer(byte), ec);
        EXPECT_EQ(ec, asio::error::eof) << ec.message();
    }
}

} // namespace
