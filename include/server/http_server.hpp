#pragma once

#include "server/transfer_api.hpp"
#include "util/result.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace xfer {

// Blocking HTTP/1.1 server, one thread per connection. The accept loop and
// shutdown signals run on a single io_context driven by Run().
class HttpServer {
  public:
    struct Options {
        std::string host = "127.0.0.1";
        std::uint16_t port = 0;  // 0 picks an ephemeral port
        bool handle_signals = false;  // SIGINT/SIGTERM trigger Stop()
    };

    HttpServer(std::shared_ptr<TransferApi> api, Options opt);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and listens. Port() is valid afterwards.
    Result Listen();
    std::uint16_t Port() const { return port_; }

    // Serves until Stop(), then waits for in-flight requests to finish.
    void Run();
    // Thread-safe. Stops accepting and wakes idle keep-alive connections.
    void Stop();

  private:
    struct Connection;

    void DoAccept();
    void Serve(std::shared_ptr<Connection> conn);
    bool HandleRequest(Connection& conn);
    void Drain();

    std::shared_ptr<TransferApi> api_;
    Options opt_;
    std::uint16_t port_ = 0;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;

    std::atomic<bool> stopping_{false};
    std::mutex conns_mu_;
    std::condition_variable conns_cv_;
    std::set<std::shared_ptr<Connection>> conns_;
};

} // namespace xfer
