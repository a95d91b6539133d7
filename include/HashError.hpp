// HashError.hpp
#pragma once

#include <string>

/**
 * @struct HashError
 * @brief 哈希操作的错误代码和描述
 */
struct HashError {
  enum class Code {
    INVALID_INPUT,
    INVALID_CONFIG,
    UNREADABLE_IMAGE,
    INVALID_COMPOSITE_INPUT,
    MALFORMED_HASH,
    FINGERPRINT_FAILED
  };

  Code code;
  std::string message;
};

/**
 * @brief 错误代码的字符串表示
 */
constexpr const char *errorCodeName(HashError::Code code) noexcept {
  switch (code) {
  case HashError::Code::INVALID_INPUT:
    return "INVALID_INPUT";
  case HashError::Code::INVALID_CONFIG:
    return "INVALID_CONFIG";
  case HashError::Code::UNREADABLE_IMAGE:
    return "UNREADABLE_IMAGE";
  case HashError::Code::INVALID_COMPOSITE_INPUT:
    return "INVALID_COMPOSITE_INPUT";
  case HashError::Code::MALFORMED_HASH:
    return "MALFORMED_HASH";
  case HashError::Code::FINGERPRINT_FAILED:
    return "FINGERPRINT_FAILED";
  }
  return "UNKNOWN";
}
