// HammingDistance.cpp
#include "hash/HammingDistance.hpp"
#include "utils/CpuFeatures.hpp"

#include <bit>

namespace {

BitCounter resolveCounter(BitCounter requested) noexcept {
  if (requested != BitCounter::Auto) {
    return requested;
  }
  return utils::hasNativePopcount() ? BitCounter::Popcount : BitCounter::Loop;
}

} // namespace

HammingDistance::HammingDistance(BitCounter counter) noexcept
    : m_counter(resolveCounter(counter)) {}

unsigned HammingDistance::count(std::uint64_t a,
                                std::uint64_t b) const noexcept {
  return m_counter == BitCounter::Popcount ? countPopcount(a, b)
                                           : countLoop(a, b);
}

std::expected<unsigned, HashError>
HammingDistance::between(std::string_view a, std::string_view b,
                         HashMode mode) const {
  auto rawA = HashCodec::decode(a, mode);
  if (!rawA) {
    return std::unexpected(rawA.error());
  }
  auto rawB = HashCodec::decode(b, mode);
  if (!rawB) {
    return std::unexpected(rawB.error());
  }
  return count(*rawA, *rawB);
}

unsigned HammingDistance::countLoop(std::uint64_t a, std::uint64_t b) noexcept {
  unsigned distance = 0;
  // 指纹是固定宽度的，不能因前导零提前结束
  for (unsigned i = 0; i < HASH_BITS; ++i) {
    const std::uint64_t mask = std::uint64_t{1} << i;
    if ((a & mask) != (b & mask)) {
      ++distance;
    }
  }
  return distance;
}

unsigned HammingDistance::countPopcount(std::uint64_t a,
                                        std::uint64_t b) noexcept {
  return static_cast<unsigned>(std::popcount(a ^ b));
}
