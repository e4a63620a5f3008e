#include "server/identifier.hpp"

#include "server/wordlist.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace xfer {

namespace {

// Uniform value in [0, bound) by rejection sampling.
Result RandomBelow(std::uint32_t bound, std::uint32_t& out) {
    const std::uint32_t limit = std::numeric_limits<std::uint32_t>::max() -
                                (std::numeric_limits<std::uint32_t>::max() % bound);
    while (true) {
        std::uint32_t v = 0;
        if (RAND_bytes(reinterpret_cast<unsigned char*>(&v), sizeof(v)) != 1) {
            return Result::Fail(ErrorKind::Crypto, "failed to draw random identifier words");
        }
        if (v < limit) {
            out = v % bound;
            return Result::Ok();
        }
    }
}

} // namespace

WordlistIdentifierGenerator::WordlistIdentifierGenerator()
    : WordlistIdentifierGenerator(WordList(), kIdentifierWords) {}

WordlistIdentifierGenerator::WordlistIdentifierGenerator(std::span<const std::string_view> words,
                                                         std::size_t word_count)
    : words_(words), word_count_(word_count) {
    if (word_count_ == 0 || words_.size() < word_count_) {
        throw std::invalid_argument("word list is smaller than the identifier word count");
    }
}

Result WordlistIdentifierGenerator::Generate(std::string& out) {
    std::vector<std::uint32_t> picked;
    picked.reserve(word_count_);
    while (picked.size() < word_count_) {
        std::uint32_t idx = 0;
        auto r = RandomBelow(static_cast<std::uint32_t>(words_.size()), idx);
        if (!r.is_ok()) return r;
        if (std::find(picked.begin(), picked.end(), idx) == picked.end()) {
            picked.push_back(idx);
        }
    }

    std::string id;
    for (std::uint32_t idx : picked) {
        if (!id.empty()) id.push_back(kIdentifierSeparator);
        id.append(words_[idx]);
    }
    out = std::move(id);
    return Result::Ok();
}

bool ValidateIdentifier(std::string_view id, std::size_t expected_words) {
    std::size_t segments = 0;
    while (true) {
        const auto pos = id.find(kIdentifierSeparator);
        const auto seg = id.substr(0, pos);
        if (seg.empty()) return false;
        ++segments;
        if (pos == std::string_view::npos) break;
        id.remove_prefix(pos + 1);
    }
    return segments == expected_words;
}

} // namespace xfer
