#pragma once

namespace utils {

// Native population count detection
constexpr bool hasNativePopcount() noexcept {
#if defined(__POPCNT__)
  return true;
#elif defined(__SSE4_2__)
  return true;
#elif defined(__ARM_NEON) || defined(__aarch64__)
  return true;
#elif defined(_MSC_VER) && (defined(_M_X64) || defined(_M_ARM64))
  return true;
#else
  return false;
#endif
}

} // namespace utils
