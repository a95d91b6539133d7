// ScopedTimer.hpp
#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace utils {

/**
 * @struct ScopedTimer
 * @brief 用于测量操作持续时间的工具结构
 */
struct ScopedTimer {
  std::string operation; ///< 正在计时的操作名称
  std::chrono::steady_clock::time_point start; ///< 操作的开始时间

  /**
   * @brief ScopedTimer的构造函数
   * @param op 操作的名称
   */
  explicit ScopedTimer(std::string_view op);

  ~ScopedTimer();

  // 禁止复制和移动
  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;
};

} // namespace utils
