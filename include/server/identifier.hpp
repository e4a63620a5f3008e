#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace xfer {

inline constexpr std::size_t kIdentifierWords = 4;
inline constexpr char kIdentifierSeparator = '-';

// Source of candidate transfer identifiers. Uniqueness is enforced by the
// store, not here. Generate() is called concurrently.
class IIdentifierGenerator {
  public:
    virtual ~IIdentifierGenerator() = default;
    virtual Result Generate(std::string& out) = 0;
};

// Draws `word_count` distinct words from `words` using OpenSSL's CSPRNG.
class WordlistIdentifierGenerator final : public IIdentifierGenerator {
  public:
    WordlistIdentifierGenerator();
    WordlistIdentifierGenerator(std::span<const std::string_view> words, std::size_t word_count);

    // Fails with ErrorKind::Crypto when the CSPRNG does.
    Result Generate(std::string& out) override;

  private:
    std::span<const std::string_view> words_;
    std::size_t word_count_;
};

// Syntax only: exactly `expected_words` non-empty segments separated by
// '-'. Says nothing about existence.
bool ValidateIdentifier(std::string_view id, std::size_t expected_words = kIdentifierWords);

} // namespace xfer
