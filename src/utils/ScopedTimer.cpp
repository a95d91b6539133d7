// ScopedTimer.cpp
#include "utils/ScopedTimer.hpp"
#include "Logging.hpp"

namespace utils {

ScopedTimer::ScopedTimer(std::string_view op)
    : operation(op), start(std::chrono::steady_clock::now()) {
  Logger::getInstance()->debug("Starting operation: {}", operation);
}

ScopedTimer::~ScopedTimer() {
  auto duration = std::chrono::steady_clock::now() - start;
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(duration);
  Logger::getInstance()->debug("{} took {} us", operation, us.count());
}

} // namespace utils
