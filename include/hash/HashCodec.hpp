// HashCodec.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "HashError.hpp"

/**
 * @enum HashMode
 * @brief 哈希值的编码方式
 */
enum class HashMode {
  Hexadecimal, ///< 最短小写十六进制，无前缀
  Decimal      ///< 有符号64位位模式的十进制表示
};

/**
 * @brief Encoded fingerprint. Hex digits or a decimal literal, depending on
 * the HashMode it was produced with.
 */
using EncodedHash = std::string;

/**
 * @namespace HashCodec
 * @brief Conversion between raw 64-bit fingerprints and their encoded form.
 */
namespace HashCodec {

/**
 * @brief Encode a raw hash.
 *
 * Hexadecimal renders the minimal lower-case digits ("0" for zero).
 * Decimal renders the value reinterpreted as a signed 64-bit integer, so
 * values with the top bit set come out negative.
 *
 * @param raw Raw 64-bit hash
 * @param mode Target encoding
 * @return Encoded hash
 */
[[nodiscard]] EncodedHash encode(std::uint64_t raw, HashMode mode);

/**
 * @brief Decode an encoded hash back to its raw 64-bit value.
 *
 * @param encoded Hash produced by encode() or persisted by a caller
 * @param mode Encoding the hash was produced with
 * @return Raw hash, or MALFORMED_HASH
 */
[[nodiscard]] std::expected<std::uint64_t, HashError>
decode(std::string_view encoded, HashMode mode);

/**
 * @brief Parse a hexadecimal hash of up to 16 digits.
 *
 * Full-width strings whose leading nibble exceeds 8 are parsed as two
 * unsigned 32-bit words and reassembled as (high << 32) | low.
 */
[[nodiscard]] std::expected<std::uint64_t, HashError>
decodeHex(std::string_view hex);

/**
 * @brief Parse a decimal hash literal as a 64-bit bit pattern.
 */
[[nodiscard]] std::expected<std::uint64_t, HashError>
decodeDecimal(std::string_view dec);

// "hex" / "dec"
[[nodiscard]] const char *modeName(HashMode mode) noexcept;
[[nodiscard]] std::expected<HashMode, HashError> parseMode(std::string_view name);

} // namespace HashCodec
