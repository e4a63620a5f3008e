#pragma once

#include "io/file_reader.hpp"
#include "io/io.hpp"
#include "server/transfer_store.hpp"
#include "util/result.hpp"

#include <boost/beast/http/status.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace xfer {

namespace http = boost::beast::http;

inline constexpr const char* kPlainText = "text/plain; charset=utf-8";

// Transport-independent outcome of one API call. Either `body` or, for a
// transfer download, `stream` carries the payload.
struct ApiReply {
    http::status status = http::status::ok;
    std::string content_type = kPlainText;
    std::string body;
    std::optional<std::string> cache_control;

    std::optional<FileReader> stream;
    // Size of the stored transfer, also reported for HEAD.
    std::optional<std::uint64_t> stream_size;
};

// Maps a store failure to its HTTP status: EFBIG -> 413, Validation -> 400,
// NotFound -> 404, everything else 500.
http::status StatusForError(const Result& r);

class TransferApi {
  public:
    TransferApi(std::shared_ptr<TransferStore> store, std::uint64_t max_size);

    ApiReply Index() const;
    // {"transfer":{"expire_after_ms":N,"max_size_bytes":N}}
    ApiReply Configuration() const;
    // 201 {"id":"..."}; 422 when the body starts with a known file
    // signature. The size limit is enforced by the transport reading `body`.
    ApiReply CreateTransfer(IReader& body) const;
    // GET streams the file; HEAD only reports its size.
    ApiReply GetTransfer(const std::string& id, bool head_only) const;

    std::uint64_t MaxSize() const { return max_size_; }

  private:
    std::shared_ptr<TransferStore> store_;
    std::uint64_t max_size_;
};

} // namespace xfer
