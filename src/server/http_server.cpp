#include "server/http_server.hpp"

#include "util/logger.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <sys/socket.h>
#include <system_error>
#include <thread>

namespace xfer {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {

constexpr const char* kServerName = "xfer-server";
constexpr std::string_view kTransferPrefix = "/transfer/";

using RequestParser = http::request_parser<http::buffer_body>;

// Streams the body of the request being parsed, chunk by chunk, straight
// from the socket into the caller's buffer.
class RequestBodyReader final : public IReader {
  public:
    RequestBodyReader(tcp::socket& socket, beast::flat_buffer& buffer, RequestParser& parser)
        : socket_(socket), buffer_(buffer), parser_(parser) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        while (!parser_.is_done()) {
            auto& body = parser_.get().body();
            body.data = out.data();
            body.size = out.size();
            http::read(socket_, buffer_, parser_, ec_);
            if (ec_ == http::error::need_buffer) ec_ = {};
            if (ec_) {
                errno = LimitExceeded() ? EFBIG : EIO;
                return -1;
            }
            const size_t n = out.size() - body.size;
            if (n > 0) return static_cast<ssize_t>(n);
        }
        return 0;
    }

    std::optional<std::uint64_t> TotalSize() const override {
        if (auto len = parser_.content_length()) return *len;
        return std::nullopt;
    }

    bool Done() const { return parser_.is_done(); }
    bool Failed() const { return static_cast<bool>(ec_); }
    bool LimitExceeded() const { return ec_ == http::error::body_limit; }
    const beast::error_code& Error() const { return ec_; }

  private:
    tcp::socket& socket_;
    beast::flat_buffer& buffer_;
    RequestParser& parser_;
    beast::error_code ec_;
};

// Reads and discards whatever is left of the request body so the
// connection can carry on with the next request. Errors end up in
// `body.Failed()`.
void DiscardBody(RequestBodyReader& body) {
    std::array<std::uint8_t, 16 * 1024> scratch{};
    while (body.Read(scratch) > 0) {
    }
}

// "/transfer/?x=1" -> "/transfer"
std::string NormalizePath(beast::string_view target) {
    std::string path(target.substr(0, target.find('?')));
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    if (path.empty()) path = "/";
    return path;
}

bool IsParseError(const beast::error_code& ec) {
    return &ec.category() == &beast::error_code(http::error::bad_target).category();
}

ApiReply PlainReply(http::status status, std::string body) {
    ApiReply r;
    r.status = status;
    r.body = std::move(body) + "\n";
    return r;
}

template <class Body>
void Decorate(http::response<Body>& res, const ApiReply& reply, const std::string& allow, bool keep_alive) {
    res.set(http::field::server, kServerName);
    res.set("X-Robots-Tag", "none");
    res.set(http::field::content_type, reply.content_type);
    if (reply.cache_control) res.set(http::field::cache_control, *reply.cache_control);
    if (!allow.empty()) res.set(http::field::allow, allow);
    res.keep_alive(keep_alive);
}

void WriteReply(tcp::socket& socket, ApiReply& reply, unsigned version, bool head_only,
                const std::string& allow, bool keep_alive, beast::error_code& ec) {
    if (head_only) {
        http::response<http::empty_body> res{reply.status, version};
        Decorate(res, reply, allow, keep_alive);
        res.content_length(reply.stream_size ? *reply.stream_size : reply.body.size());
        http::write(socket, res, ec);
        return;
    }

    if (!reply.stream) {
        http::response<http::string_body> res{reply.status, version};
        Decorate(res, reply, allow, keep_alive);
        res.body() = std::move(reply.body);
        res.prepare_payload();
        http::write(socket, res, ec);
        return;
    }

    http::response<http::buffer_body> res{reply.status, version};
    Decorate(res, reply, allow, keep_alive);
    res.content_length(reply.stream_size.value_or(0));
    http::response_serializer<http::buffer_body> sr{res};
    http::write_header(socket, sr, ec);
    if (ec) return;

    std::vector<std::uint8_t> chunk(64 * 1024);
    while (true) {
        const ssize_t n = reply.stream->Read(chunk);
        if (n < 0) {
            // Headers are out already; all that is left is to drop the connection.
            ec = beast::error_code(errno, boost::system::generic_category());
            LogError("Read of %s failed mid-response", reply.stream->Path().c_str());
            return;
        }
        res.body().data = n > 0 ? chunk.data() : nullptr;
        res.body().size = static_cast<size_t>(n);
        res.body().more = n > 0;
        http::write(socket, sr, ec);
        if (ec == http::error::need_buffer) ec = {};
        if (ec || n == 0) return;
    }
}

} // namespace

struct HttpServer::Connection {
    explicit Connection(tcp::socket s) : socket(std::move(s)) {}

    tcp::socket socket;
    beast::flat_buffer buffer;
    // Waiting for the next request; safe to wake during shutdown.
    std::atomic<bool> idle{true};
};

HttpServer::HttpServer(std::shared_ptr<TransferApi> api, Options opt)
    : api_(std::move(api)), opt_(std::move(opt)), acceptor_(ioc_), signals_(ioc_) {}

HttpServer::~HttpServer() {
    Stop();
    std::unique_lock<std::mutex> lk(conns_mu_);
    conns_cv_.wait(lk, [this] { return conns_.empty(); });
}

Result HttpServer::Listen() {
    beast::error_code ec;
    const auto addr = asio::ip::make_address(opt_.host, ec);
    if (ec) {
        return Result::Fail(ErrorKind::Validation, "invalid listen address '" + opt_.host + "'");
    }
    const tcp::endpoint ep(addr, opt_.port);
    const std::string where = opt_.host + ":" + std::to_string(opt_.port);

    acceptor_.open(ep.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(ep, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return Result::Fail(ErrorKind::Io, ec.value(), "listen on " + where + " failed (" + ec.message() + ")");
    }

    port_ = acceptor_.local_endpoint(ec).port();
    LogInfo("Listening on http://%s:%u", opt_.host.c_str(), static_cast<unsigned>(port_));
    return Result::Ok();
}

void HttpServer::Run() {
    if (opt_.handle_signals) {
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const beast::error_code& ec, int sig) {
            if (ec) return;
            LogInfo("Received signal %d, shutting down", sig);
            Stop();
        });
    }

    DoAccept();
    ioc_.run();
    Drain();
    LogInfo("Server stopped");
}

void HttpServer::Stop() {
    if (stopping_.exchange(true)) return;
    asio::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
        // A second Ctrl+C during the drain terminates immediately.
        signals_.clear(ec);
    });
}

void HttpServer::DoAccept() {
    acceptor_.async_accept([this](const beast::error_code& ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || stopping_) return;
        if (ec) {
            LogWarn("Accept failed: %s", ec.message().c_str());
        } else {
            auto conn = std::make_shared<Connection>(std::move(socket));
            {
                std::lock_guard<std::mutex> lk(conns_mu_);
                conns_.insert(conn);
            }
            try {
                std::thread(&HttpServer::Serve, this, conn).detach();
            } catch (const std::system_error& e) {
                LogError("Cannot start connection thread: %s", e.what());
                std::lock_guard<std::mutex> lk(conns_mu_);
                conns_.erase(conn);
            }
        }
        DoAccept();
    });
}

void HttpServer::Drain() {
    std::unique_lock<std::mutex> lk(conns_mu_);
    if (!conns_.empty()) {
        LogInfo("Waiting for %zu connection(s) to finish", conns_.size());
    }
    for (const auto& conn : conns_) {
        if (conn->idle) ::shutdown(conn->socket.native_handle(), SHUT_RD);
    }
    conns_cv_.wait(lk, [this] { return conns_.empty(); });
}

void HttpServer::Serve(std::shared_ptr<Connection> conn) {
    try {
        while (true) {
            conn->idle = true;
            if (stopping_) break;
            if (!HandleRequest(*conn)) break;
        }
    } catch (const std::exception& e) {
        LogError("Connection aborted: %s", e.what());
    }

    // Drain() touches the socket under conns_mu_, so close it there too.
    std::lock_guard<std::mutex> lk(conns_mu_);
    beast::error_code ec;
    conn->socket.shutdown(tcp::socket::shutdown_send, ec);
    conn->socket.close(ec);
    conns_.erase(conn);
    conns_cv_.notify_all();
}

bool HttpServer::HandleRequest(Connection& conn) {
    RequestParser parser;
    parser.body_limit(api_->MaxSize());

    beast::error_code ec;
    http::read_header(conn.socket, conn.buffer, parser, ec);
    conn.idle = false;

    if (ec == http::error::body_limit) {
        auto reply = PlainReply(http::status::payload_too_large, "transfer exceeds the maximum size");
        WriteReply(conn.socket, reply, parser.get().version(), false, "", false, ec);
        return false;
    }
    if (ec) {
        if (IsParseError(ec) && ec != http::error::end_of_stream && ec != http::error::partial_message) {
            auto reply = PlainReply(http::status::bad_request, "malformed request");
            WriteReply(conn.socket, reply, 11, false, "", false, ec);
        }
        return false;
    }

    auto& req = parser.get();
    const auto method = req.method();
    const std::string path = NormalizePath(req.target());
    const unsigned version = req.version();
    const bool head_only = method == http::verb::head;
    const bool is_get = method == http::verb::get || head_only;
    bool keep_alive = req.keep_alive();
    std::string allow;

    ApiReply reply;
    try {
        if (path == "/" || path == "/configuration") {
            if (!is_get) {
                allow = "GET, HEAD";
                reply = PlainReply(http::status::method_not_allowed, "method not allowed");
            } else {
                reply = path == "/" ? api_->Index() : api_->Configuration();
            }
        } else if (path == "/transfer") {
            if (method != http::verb::post) {
                allow = "POST";
                reply = PlainReply(http::status::method_not_allowed, "method not allowed");
            } else {
                if (beast::iequals(req[http::field::expect], "100-continue")) {
                    http::response<http::empty_body> cont{http::status::continue_, version};
                    http::write(conn.socket, cont, ec);
                    if (ec) return false;
                }

                RequestBodyReader body(conn.socket, conn.buffer, parser);
                reply = api_->CreateTransfer(body);
                if (!body.Failed() && !body.Done()) DiscardBody(body);

                if (body.LimitExceeded()) {
                    reply = PlainReply(http::status::payload_too_large, "transfer exceeds the maximum size");
                    keep_alive = false;
                } else if (body.Failed()) {
                    LogWarn("Upload aborted by client: %s", body.Error().message().c_str());
                    return false;
                }
            }
        } else if (path.starts_with(kTransferPrefix)) {
            if (!is_get) {
                allow = "GET, HEAD";
                reply = PlainReply(http::status::method_not_allowed, "method not allowed");
            } else {
                reply = api_->GetTransfer(path.substr(kTransferPrefix.size()), head_only);
            }
        } else {
            reply = PlainReply(http::status::not_found, "not found");
        }
    } catch (const std::exception& e) {
        LogError("%s %s failed: %s", std::string(req.method_string()).c_str(), path.c_str(), e.what());
        reply = PlainReply(http::status::internal_server_error, "internal server error");
        keep_alive = false;
    }

    // A body nobody read leaves the stream out of sync.
    if (!parser.is_done()) keep_alive = false;
    if (stopping_) keep_alive = false;

    LogInfo("%s %s -> %u", std::string(req.method_string()).c_str(), path.c_str(),
            static_cast<unsigned>(reply.status));

    WriteReply(conn.socket, reply, version, head_only, allow, keep_alive, ec);
    if (ec) {
        LogDebug("Write failed: %s", ec.message().c_str());
        return false;
    }
    return keep_alive;
}

} // namespace xfer
