#pragma once

#include "algorithm/HashAlgorithm.hpp"
#include "hash/HammingDistance.hpp"
#include "hash/HashCodec.hpp"

/**
 * @brief Structure to hold hasher configuration.
 */
struct HasherParameters {
  HashMode mode = HashMode::Hexadecimal;      ///< Encoding of produced hashes
  HashMethod method = HashMethod::Difference; ///< Fingerprinting algorithm
  BitCounter counter = BitCounter::Auto;      ///< 位计数策略
};
