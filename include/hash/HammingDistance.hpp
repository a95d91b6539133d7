// HammingDistance.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <string_view>

#include "HashError.hpp"
#include "hash/HashCodec.hpp"

/**
 * @enum BitCounter
 * @brief 位计数策略
 */
enum class BitCounter {
  Auto,    ///< 根据平台能力选择
  Loop,    ///< 逐位比较全部64位
  Popcount ///< 对异或结果使用原生popcount
};

/**
 * @brief Bit-level distance between two 64-bit fingerprints.
 *
 * Both strategies look at all 64 bit positions and return identical
 * results for every input pair. The strategy is fixed at construction.
 */
class HammingDistance {
public:
  static constexpr unsigned HASH_BITS = 64;

  explicit HammingDistance(BitCounter counter = BitCounter::Auto) noexcept;

  /**
   * @brief 计算两个原始哈希之间不同位的数量
   * @return [0, 64]
   */
  [[nodiscard]] unsigned count(std::uint64_t a, std::uint64_t b) const noexcept;

  /**
   * @brief Decode two encoded hashes and count their differing bits.
   * Decode failures are returned as MALFORMED_HASH.
   */
  [[nodiscard]] std::expected<unsigned, HashError>
  between(std::string_view a, std::string_view b, HashMode mode) const;

  /**
   * @brief Strategy actually in use (never Auto).
   */
  [[nodiscard]] BitCounter counter() const noexcept { return m_counter; }

  static unsigned countLoop(std::uint64_t a, std::uint64_t b) noexcept;
  static unsigned countPopcount(std::uint64_t a, std::uint64_t b) noexcept;

private:
  BitCounter m_counter;
};
