#include "server/transfer_api.hpp"

#include "io/prefixed_reader.hpp"
#include "server/content_sniffer.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>

namespace xfer {

namespace {

ApiReply Plain(http::status status, std::string body) {
    ApiReply r;
    r.status = status;
    r.body = std::move(body);
    if (!r.body.empty() && r.body.back() != '\n') r.body.push_back('\n');
    return r;
}

ApiReply Json(http::status status, const nlohmann::json& j) {
    ApiReply r;
    r.status = status;
    r.content_type = "application/json";
    r.body = j.dump();
    return r;
}

ApiReply Failure(const Result& r) {
    const auto status = StatusForError(r);
    if (status == http::status::internal_server_error) {
        LogError("%s", r.message().c_str());
        return Plain(status, "internal server error");
    }
    return Plain(status, r.message());
}

} // namespace

http::status StatusForError(const Result& r) {
    // The request body outgrew the size limit while it was being stored.
    if (r.err == EFBIG) return http::status::payload_too_large;
    switch (r.kind) {
    case ErrorKind::Validation:
        return http::status::bad_request;
    case ErrorKind::NotFound:
        return http::status::not_found;
    default:
        return http::status::internal_server_error;
    }
}

TransferApi::TransferApi(std::shared_ptr<TransferStore> store, std::uint64_t max_size)
    : store_(std::move(store)), max_size_(max_size) {}

ApiReply TransferApi::Index() const {
    return Plain(http::status::ok,
                 "xfer-server: ephemeral encrypted file relay.\n"
                 "Use the xfer client to upload and download transfers.");
}

ApiReply TransferApi::Configuration() const {
    nlohmann::json j;
    j["transfer"]["expire_after_ms"] = static_cast<std::uint64_t>(store_->ExpireAfter().count());
    j["transfer"]["max_size_bytes"] = max_size_;
    return Json(http::status::ok, j);
}

ApiReply TransferApi::CreateTransfer(IReader& body) const {
    std::vector<std::uint8_t> head;
    if (ReadPrefix(body, head, kSniffPrefixSize) < 0) {
        if (errno == EFBIG) return Plain(http::status::payload_too_large, "transfer exceeds the maximum size");
        return Plain(http::status::bad_request, "failed to read request body");
    }

    if (auto mime = SniffContentType(head)) {
        LogWarn("Rejected unencrypted upload (looks like %.*s)", static_cast<int>(mime->size()), mime->data());
        return Plain(http::status::unprocessable_entity,
                     "Transfer content was identified as " + std::string(*mime) +
                         " - encrypt the transfer before uploading");
    }

    PrefixedReader full(std::move(head), body);
    std::string id;
    auto r = store_->Create(full, id);
    if (!r.is_ok()) return Failure(r);

    return Json(http::status::created, nlohmann::json{{"id", id}});
}

ApiReply TransferApi::GetTransfer(const std::string& id, bool head_only) const {
    FileReader reader;
    TransferInfo info;
    auto r = store_->Read(id, reader, &info);
    if (!r.is_ok()) return Failure(r);

    ApiReply reply;
    reply.content_type = "application/octet-stream";
    reply.cache_control = "max-age=" + std::to_string(info.Remaining(std::chrono::system_clock::now()).count()) +
                          ", must-revalidate";
    reply.stream_size = info.size;
    if (!head_only) reply.stream = std::move(reader);
    return reply;
}

} // namespace xfer
