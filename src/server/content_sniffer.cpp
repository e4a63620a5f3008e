#include "server/content_sniffer.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace xfer {

namespace {

struct Signature {
    std::string_view mime;
    std::size_t offset;
    std::string_view magic;
};

using namespace std::string_view_literals;

// clang-format off
constexpr std::array kSignatures{
    // images
    Signature{"image/png",                    0, "\x89PNG\r\n\x1a\n"sv},
    Signature{"image/jpeg",                   0, "\xFF\xD8\xFF"sv},
    Signature{"image/gif",                    0, "GIF87a"sv},
    Signature{"image/gif",                    0, "GIF89a"sv},
    Signature{"image/webp",                   8, "WEBP"sv},
    Signature{"image/tiff",                   0, "II*\x00"sv},
    Signature{"image/tiff",                   0, "MM\x00*"sv},
    Signature{"image/vnd.adobe.photoshop",    0, "8BPS"sv},
    Signature{"image/x-icon",                 0, "\x00\x00\x01\x00"sv},
    // audio and video
    Signature{"audio/mpeg",                   0, "ID3"sv},
    Signature{"audio/ogg",                    0, "OggS"sv},
    Signature{"audio/x-flac",                 0, "fLaC"sv},
    Signature{"audio/x-wav",                  8, "WAVE"sv},
    Signature{"video/x-msvideo",              8, "AVI "sv},
    Signature{"video/mp4",                    4, "ftyp"sv},
    Signature{"video/x-matroska",             0, "\x1A\x45\xDF\xA3"sv},
    // documents
    Signature{"application/pdf",              0, "%PDF-"sv},
    Signature{"application/postscript",       0, "%!PS"sv},
    Signature{"application/rtf",              0, "{\\rtf"sv},
    Signature{"application/x-ole-storage",    0, "\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1"sv},
    Signature{"text/xml",                     0, "<?xml"sv},
    Signature{"application/vnd.sqlite3",      0, "SQLite format 3\x00"sv},
    // archives and compression
    Signature{"application/zip",              0, "PK\x03\x04"sv},
    Signature{"application/zip",              0, "PK\x05\x06"sv},
    Signature{"application/gzip",             0, "\x1F\x8B\x08"sv},
    Signature{"application/x-bzip2",          0, "BZh"sv},
    Signature{"application/x-xz",             0, "\xFD" "7zXZ\x00"sv},
    Signature{"application/x-7z-compressed",  0, "7z\xBC\xAF\x27\x1C"sv},
    Signature{"application/vnd.rar",          0, "Rar!\x1A\x07"sv},
    Signature{"application/zstd",             0, "\x28\xB5\x2F\xFD"sv},
    Signature{"application/x-lz4",            0, "\x04\x22\x4D\x18"sv},
    Signature{"application/x-tar",          257, "ustar"sv},
    Signature{"application/vnd.ms-cab-compressed", 0, "MSCF"sv},
    Signature{"application/x-unix-archive",   0, "!<arch>\n"sv},
    Signature{"application/x-rpm",            0, "\xED\xAB\xEE\xDB"sv},
    // executables
    Signature{"application/x-executable",     0, "\x7F" "ELF"sv},
    Signature{"application/x-mach-binary",    0, "\xCF\xFA\xED\xFE"sv},
    Signature{"application/x-mach-binary",    0, "\xCE\xFA\xED\xFE"sv},
    Signature{"application/java-vm",          0, "\xCA\xFE\xBA\xBE"sv},
    Signature{"application/wasm",             0, "\x00" "asm"sv},
    // fonts
    Signature{"font/woff",                    0, "wOFF"sv},
    Signature{"font/woff2",                   0, "wOF2"sv},
    Signature{"font/otf",                     0, "OTTO"sv},
};
// clang-format on

bool Matches(std::span<const std::uint8_t> head, const Signature& sig) {
    if (head.size() < sig.offset + sig.magic.size()) return false;
    return std::memcmp(head.data() + sig.offset, sig.magic.data(), sig.magic.size()) == 0;
}

} // namespace

std::optional<std::string_view> SniffContentType(std::span<const std::uint8_t> head) {
    const auto it = std::find_if(kSignatures.begin(), kSignatures.end(),
                                 [&](const Signature& s) { return Matches(head, s); });
    if (it == kSignatures.end()) return std::nullopt;
    return it->mime;
}

} // namespace xfer
