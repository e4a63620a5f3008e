#include "client/api_client.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/optional/optional.hpp>
#include <nlohmann/json.hpp>

#include <cerrno>
#include <memory>
#include <optional>
#include <vector>

namespace xfer {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

constexpr const char* kUserAgent = "xfer-client";
constexpr size_t kChunkSize = 64 * 1024;
constexpr size_t kMaxErrorBody = 4 * 1024;
constexpr std::string_view kUploadStage = "upload";
constexpr std::string_view kDownloadStage = "download";

Result NetFail(const std::string& what, const beast::error_code& ec) {
    return Result::Fail(ErrorKind::Io, ec.value(), what + " (" + ec.message() + ")");
}

std::string Trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

Result FailFromStatus(http::status status, const std::string& body) {
    const std::string detail = Trim(body.substr(0, kMaxErrorBody));
    switch (status) {
    case http::status::not_found:
        return Result::Fail(ErrorKind::NotFound, "transfer not found (it may have expired)");
    case http::status::bad_request:
        return Result::Fail(ErrorKind::Validation, "server rejected the request: " + detail);
    case http::status::payload_too_large:
        return Result::Fail(ErrorKind::Validation, "transfer exceeds the server's maximum size");
    case http::status::unprocessable_entity:
        return Result::Fail(ErrorKind::Validation, "server refused the transfer: " + detail);
    default:
        return Result::Fail(ErrorKind::Protocol, "server replied " + std::to_string(static_cast<unsigned>(status)) +
                                                     " " + std::string(http::obsolete_reason(status)) +
                                                     (detail.empty() ? "" : ": " + detail));
    }
}

void Report(IProgress* progress, std::string_view stage, std::uint64_t done, std::uint64_t total) {
    if (!progress) return;
    ProgressEvent e{};
    e.stage = stage;
    e.done = done;
    e.total = total;
    progress->OnProgress(e);
}

// One TCP or TLS connection to the relay.
class Connection {
  public:
    Result Open(const ServerUrl& url) {
        beast::error_code ec;
        tcp::resolver resolver(ioc_);
        const auto endpoints = resolver.resolve(url.host, url.port, ec);
        if (ec) return NetFail("resolve " + url.host, ec);

        const std::string where = url.HostHeader();
        if (!url.Tls()) {
            plain_ = std::make_unique<beast::tcp_stream>(ioc_);
            plain_->connect(endpoints, ec);
            if (ec) return NetFail("connect to " + where, ec);
            return Result::Ok();
        }

        ssl_ctx_.emplace(ssl::context::tls_client);
        ssl_ctx_->set_default_verify_paths(ec);
        if (ec) return NetFail("load system CA certificates", ec);
        ssl_ctx_->set_verify_mode(ssl::verify_peer);

        tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_, *ssl_ctx_);
        if (!SSL_set_tlsext_host_name(tls_->native_handle(), url.host.c_str())) {
            return Result::Fail(ErrorKind::Io, "cannot set TLS server name for " + url.host);
        }
        tls_->set_verify_callback(ssl::host_name_verification(url.host));

        beast::get_lowest_layer(*tls_).connect(endpoints, ec);
        if (ec) return NetFail("connect to " + where, ec);
        tls_->handshake(ssl::stream_base::client, ec);
        if (ec) return NetFail("TLS handshake with " + where, ec);
        return Result::Ok();
    }

    template <class Fn>
    Result Visit(Fn&& fn) {
        if (tls_) return fn(*tls_);
        return fn(*plain_);
    }

    ~Connection() {
        beast::error_code ec;
        if (tls_) {
            // Peers commonly drop TLS without close_notify; nothing to act on.
            tls_->shutdown(ec);
        } else if (plain_) {
            plain_->socket().shutdown(tcp::socket::shutdown_both, ec);
        }
    }

  private:
    asio::io_context ioc_;
    std::optional<ssl::context> ssl_ctx_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
    std::unique_ptr<beast::tcp_stream> plain_;
};

template <class Body>
void SetCommonHeaders(http::request<Body>& req, const ServerUrl& server) {
    req.set(http::field::host, server.HostHeader());
    req.set(http::field::user_agent, kUserAgent);
    req.keep_alive(false);
}

// Reads a complete response with a small string body.
template <class Stream>
Result ReadSmallResponse(Stream& stream, beast::flat_buffer& buffer, http::response<http::string_body>& res) {
    beast::error_code ec;
    http::response_parser<http::string_body> parser;
    parser.body_limit(1024 * 1024);
    http::read(stream, buffer, parser, ec);
    if (ec) return NetFail("read response", ec);
    res = parser.release();
    return Result::Ok();
}

template <class Stream>
Result Exchange(Stream& stream, const ServerUrl& server, http::verb verb, std::string_view path,
                http::response<http::string_body>& res) {
    http::request<http::empty_body> req{verb, server.Target(path), 11};
    SetCommonHeaders(req, server);

    beast::error_code ec;
    http::write(stream, req, ec);
    if (ec) return NetFail("send request", ec);

    beast::flat_buffer buffer;
    return ReadSmallResponse(stream, buffer, res);
}

} // namespace

Result ApiClient::GetConfiguration(ServerConfiguration& out) const {
    Connection conn;
    auto r = conn.Open(server_);
    if (!r.is_ok()) return r;

    http::response<http::string_body> res;
    r = conn.Visit([&](auto& s) { return Exchange(s, server_, http::verb::get, "/configuration", res); });
    if (!r.is_ok()) return r;
    if (res.result() != http::status::ok) return FailFromStatus(res.result(), res.body());

    try {
        const auto j = nlohmann::json::parse(res.body());
        const auto& t = j.at("transfer");
        out.expire_after = std::chrono::milliseconds(t.at("expire_after_ms").get<std::uint64_t>());
        out.max_size = t.at("max_size_bytes").get<std::uint64_t>();
    } catch (const nlohmann::json::exception& e) {
        return Result::Fail(ErrorKind::Protocol, std::string("malformed server configuration: ") + e.what());
    }
    LogDebug("Server configuration: expire_after=%lldms max_size=%llu",
             static_cast<long long>(out.expire_after.count()), static_cast<unsigned long long>(out.max_size));
    return Result::Ok();
}

Result ApiClient::CreateTransfer(IReader& body, std::string& out_id, IProgress* progress) const {
    const auto total = body.TotalSize();
    if (!total) return Result::Fail(ErrorKind::Validation, "upload size is unknown");

    Connection conn;
    auto r = conn.Open(server_);
    if (!r.is_ok()) return r;

    http::response<http::string_body> res;
    r = conn.Visit([&](auto& stream) -> Result {
        http::request<http::buffer_body> req{http::verb::post, server_.Target("/transfer"), 11};
        SetCommonHeaders(req, server_);
        req.set(http::field::content_type, "application/octet-stream");
        req.content_length(*total);

        beast::error_code ec;
        beast::flat_buffer buffer;
        http::request_serializer<http::buffer_body> sr{req};
        http::write_header(stream, sr, ec);

        std::vector<std::uint8_t> chunk(kChunkSize);
        std::uint64_t sent = 0;
        while (!ec) {
            if (CancelRequested()) return Result::Fail(ErrorKind::Io, EINTR, "interrupted");
            const ssize_t n = body.Read(chunk);
            if (n < 0) return Result::Fail(ErrorKind::Io, errno, "read failed while uploading");

            req.body().data = n > 0 ? chunk.data() : nullptr;
            req.body().size = static_cast<size_t>(n);
            req.body().more = n > 0;
            http::write(stream, sr, ec);
            if (ec == http::error::need_buffer) ec = {};
            if (ec || n == 0) break;

            sent += static_cast<std::uint64_t>(n);
            Report(progress, kUploadStage, sent, *total);
        }

        // The server may reject the upload and close before the body is
        // through; its reply is still the better diagnostic.
        auto rr = ReadSmallResponse(stream, buffer, res);
        if (!rr.is_ok()) return ec ? NetFail("upload", ec) : rr;
        return Result::Ok();
    });
    if (!r.is_ok()) return r;
    if (res.result() != http::status::created) return FailFromStatus(res.result(), res.body());

    try {
        out_id = nlohmann::json::parse(res.body()).at("id").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        return Result::Fail(ErrorKind::Protocol, std::string("malformed create response: ") + e.what());
    }
    return Result::Ok();
}

Result ApiClient::GetTransferMetadata(const std::string& id, TransferMetadata& out) const {
    Connection conn;
    auto r = conn.Open(server_);
    if (!r.is_ok()) return r;

    return conn.Visit([&](auto& stream) -> Result {
        http::request<http::empty_body> req{http::verb::head, server_.Target("/transfer/" + id), 11};
        SetCommonHeaders(req, server_);

        beast::error_code ec;
        http::write(stream, req, ec);
        if (ec) return NetFail("send request", ec);

        beast::flat_buffer buffer;
        http::response_parser<http::empty_body> parser;
        parser.skip(true);
        http::read(stream, buffer, parser, ec);
        if (ec) return NetFail("read response", ec);

        const auto status = parser.get().result();
        if (status != http::status::ok) return FailFromStatus(status, "");

        out.size.reset();
        if (auto len = parser.content_length()) out.size = *len;
        return Result::Ok();
    });
}

Result ApiClient::DownloadTransfer(const std::string& id, IWriter& out, IProgress* progress) const {
    Connection conn;
    auto r = conn.Open(server_);
    if (!r.is_ok()) return r;

    return conn.Visit([&](auto& stream) -> Result {
        http::request<http::empty_body> req{http::verb::get, server_.Target("/transfer/" + id), 11};
        SetCommonHeaders(req, server_);

        beast::error_code ec;
        http::write(stream, req, ec);
        if (ec) return NetFail("send request", ec);

        beast::flat_buffer buffer;
        http::response_parser<http::buffer_body> parser;
        parser.body_limit(boost::none);
        http::read_header(stream, buffer, parser, ec);
        if (ec) return NetFail("read response", ec);

        const auto status = parser.get().result();
        const std::uint64_t total = parser.content_length().value_or(0);
        const bool ok = status == http::status::ok;

        std::vector<std::uint8_t> chunk(kChunkSize);
        std::string error_body;
        std::uint64_t received = 0;
        while (!parser.is_done()) {
            if (CancelRequested()) return Result::Fail(ErrorKind::Io, EINTR, "interrupted");
            parser.get().body().data = chunk.data();
            parser.get().body().size = chunk.size();
            http::read(stream, buffer, parser, ec);
            if (ec == http::error::need_buffer) ec = {};
            if (ec) return NetFail("download interrupted", ec);

            const size_t n = chunk.size() - parser.get().body().size;
            if (!ok) {
                if (error_body.size() < kMaxErrorBody) error_body.append(chunk.begin(), chunk.begin() + n);
                continue;
            }
            auto wr = out.WriteAll(std::span<const std::uint8_t>(chunk.data(), n));
            if (!wr.is_ok()) return wr.WithContext("Failed to save download");
            received += n;
            Report(progress, kDownloadStage, received, total);
        }
        if (!ok) return FailFromStatus(status, error_body);
        return Result::Ok();
    });
}

} // namespace xfer
