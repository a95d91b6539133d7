// HashCodec.cpp
#include "hash/HashCodec.hpp"

#include <charconv>
#include <fmt/format.h>
#include <limits>

namespace {

constexpr std::size_t MAX_HEX_DIGITS = 16;
constexpr std::size_t WORD_HEX_DIGITS = 8;

std::unexpected<HashError> malformed(std::string_view encoded,
                                     std::string_view reason) {
  return std::unexpected(
      HashError{HashError::Code::MALFORMED_HASH,
                fmt::format("Malformed hash '{}': {}", encoded, reason)});
}

bool isHexDigit(char c) noexcept {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
         (c >= 'A' && c <= 'F');
}

unsigned nibbleValue(char c) noexcept {
  if (c >= '0' && c <= '9')
    return static_cast<unsigned>(c - '0');
  if (c >= 'a' && c <= 'f')
    return static_cast<unsigned>(c - 'a' + 10);
  return static_cast<unsigned>(c - 'A' + 10);
}

// 解析恰好8位十六进制数字为无符号32位字
std::uint32_t parseWord(std::string_view word) noexcept {
  std::uint32_t value = 0;
  std::from_chars(word.data(), word.data() + word.size(), value, 16);
  return value;
}

} // namespace

namespace HashCodec {

EncodedHash encode(std::uint64_t raw, HashMode mode) {
  if (mode == HashMode::Hexadecimal) {
    return fmt::format("{:x}", raw);
  }
  return fmt::format("{}", static_cast<std::int64_t>(raw));
}

std::expected<std::uint64_t, HashError> decode(std::string_view encoded,
                                               HashMode mode) {
  return mode == HashMode::Hexadecimal ? decodeHex(encoded)
                                       : decodeDecimal(encoded);
}

std::expected<std::uint64_t, HashError> decodeHex(std::string_view hex) {
  if (hex.empty()) {
    return malformed(hex, "empty string");
  }
  if (hex.size() > MAX_HEX_DIGITS) {
    return malformed(hex, "more than 16 hex digits");
  }
  for (char c : hex) {
    if (!isHexDigit(c)) {
      return malformed(hex, "non-hex character");
    }
  }

  if (hex.size() == MAX_HEX_DIGITS && nibbleValue(hex.front()) > 8) {
    const std::uint64_t high = parseWord(hex.substr(0, WORD_HEX_DIGITS));
    const std::uint64_t low = parseWord(hex.substr(WORD_HEX_DIGITS));
    return (high << 32) | low;
  }

  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
  if (ec != std::errc{} || ptr != hex.data() + hex.size()) {
    return malformed(hex, "not a hex literal");
  }
  return value;
}

std::expected<std::uint64_t, HashError> decodeDecimal(std::string_view dec) {
  if (dec.empty()) {
    return malformed(dec, "empty string");
  }

  const char *first = dec.data();
  const char *last = dec.data() + dec.size();

  std::int64_t signedValue = 0;
  auto [ptr, ec] = std::from_chars(first, last, signedValue, 10);
  if (ec == std::errc{} && ptr == last) {
    return static_cast<std::uint64_t>(signedValue);
  }

  // 兼容以无符号形式保存的哈希值 (>= 2^63)
  if (ec == std::errc::result_out_of_range) {
    std::uint64_t unsignedValue = 0;
    auto [uptr, uec] = std::from_chars(first, last, unsignedValue, 10);
    if (dec.front() != '-' && uec == std::errc{} && uptr == last) {
      return unsignedValue;
    }
    return malformed(dec, "exceeds 64 bits");
  }

  return malformed(dec, "not a decimal integer literal");
}

const char *modeName(HashMode mode) noexcept {
  switch (mode) {
  case HashMode::Hexadecimal:
    return "hex";
  case HashMode::Decimal:
    return "dec";
  }
  return "unknown";
}

std::expected<HashMode, HashError> parseMode(std::string_view name) {
  if (name == "hex") {
    return HashMode::Hexadecimal;
  }
  if (name == "dec") {
    return HashMode::Decimal;
  }
  return std::unexpected(HashError{
      HashError::Code::INVALID_CONFIG,
      fmt::format("Unknown hash mode '{}', expected 'hex' or 'dec'", name)});
}

} // namespace HashCodec
