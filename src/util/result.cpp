#include "util/result.hpp"

namespace xfer {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:       return "none";
        case ErrorKind::Io:         return "io";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Crypto:     return "crypto";
        case ErrorKind::Archive:    return "archive";
        case ErrorKind::NotFound:   return "not-found";
        case ErrorKind::Protocol:   return "protocol";
    }
    return "unknown";
}

} // namespace xfer
