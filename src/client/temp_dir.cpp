#include "client/temp_dir.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace xfer {

Result TempDir::Create(TempDir& out) {
    const char* base = std::getenv("TMPDIR");
    std::string tmpl = std::string(base && *base ? base : "/tmp") + "/xfer-XXXXXX";
    if (::mkdtemp(tmpl.data()) == nullptr) {
        const int e = errno;
        return Result::Fail(ErrorKind::Io, e, "mkdtemp " + tmpl + " failed (" + std::strerror(e) + ")");
    }
    out.Cleanup();
    out.path_ = std::move(tmpl);
    return Result::Ok();
}

TempDir::TempDir(TempDir&& other) noexcept { *this = std::move(other); }

TempDir& TempDir::operator=(TempDir&& other) noexcept {
    if (this != &other) {
        Cleanup();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

TempDir::~TempDir() { Cleanup(); }

void TempDir::Cleanup() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) LogWarn("Could not remove temporary directory %s: %s", path_.c_str(), ec.message().c_str());
    path_.clear();
}

} // namespace xfer
