#pragma once
#include <string>
#include <utility>

namespace xfer {

enum class ErrorKind : int {
    None = 0,
    Io,         // filesystem or network failure
    Validation, // rejected before expensive work
    Crypto,     // authentication failure or malformed key
    Archive,    // malformed archive stream
    NotFound,   // unknown or expired transfer
    Protocol,   // unexpected reply from the other side
};

const char* ErrorKindName(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    // Prefix the message with the step that failed, keeping kind and errno.
    Result WithContext(const std::string& context) const {
        if (ok) return *this;
        Result r = *this;
        r.msg = msg.empty() ? context : context + ": " + msg;
        return r;
    }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .kind = k, .err = 0, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, int e, std::string m) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }
};

} // namespace xfer
