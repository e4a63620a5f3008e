#pragma once

#include "client/server_url.hpp"
#include "io/io.hpp"
#include "util/result.hpp"
#include "xfer/progress.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace xfer {

struct ServerConfiguration {
    std::chrono::milliseconds expire_after{};
    std::uint64_t max_size = 0;
};

struct TransferMetadata {
    // Absent when the server did not send Content-Length.
    std::optional<std::uint64_t> size;
};

// Blocking client for the relay's HTTP API, plain or TLS. Each call opens
// its own connection. Bodies are streamed in both directions and there is
// no read deadline, so slow multi-day transfers are not cut off.
class ApiClient {
  public:
    explicit ApiClient(ServerUrl server) : server_(std::move(server)) {}

    const ServerUrl& Server() const { return server_; }

    Result GetConfiguration(ServerConfiguration& out) const;
    // Uploads everything `body` yields; its TotalSize() must be known.
    Result CreateTransfer(IReader& body, std::string& out_id, IProgress* progress = nullptr) const;
    // HEAD probe. Unknown transfers fail with ErrorKind::NotFound.
    Result GetTransferMetadata(const std::string& id, TransferMetadata& out) const;
    Result DownloadTransfer(const std::string& id, IWriter& out, IProgress* progress = nullptr) const;

  private:
    ServerUrl server_;
};

} // namespace xfer
