#include "core/ImageComparator.hpp"
#include "Logging.hpp"

#include <utility>

namespace {
std::shared_ptr<spdlog::logger> comparatorLogger = Logger::getInstance();
} // namespace

ImageComparator::ImageComparator(ImageHasher hasher)
    : m_hasher(std::move(hasher)) {}

std::expected<unsigned, HashError>
ImageComparator::compare(const ImageInput &image1,
                         const ImageInput &image2) const {
  auto hash1 = m_hasher.hash(image1);
  if (!hash1) {
    return std::unexpected(hash1.error());
  }
  auto hash2 = m_hasher.hash(image2);
  if (!hash2) {
    return std::unexpected(hash2.error());
  }

  auto result = m_hasher.distance(*hash1, *hash2);
  if (result) {
    comparatorLogger->debug("compare {} vs {}: distance {}/{}", *hash1, *hash2,
                            *result, HammingDistance::HASH_BITS);
  }
  return result;
}

std::expected<CompositeDistance, HashError>
ImageComparator::multipleCompare(const ImageInput &image1,
                                 const ImageInput &image2) const {
  auto hash1 = m_hasher.multipleHash(image1);
  if (!hash1) {
    return std::unexpected(hash1.error());
  }
  auto hash2 = m_hasher.multipleHash(image2);
  if (!hash2) {
    return std::unexpected(hash2.error());
  }
  return multipleDistance(*hash1, *hash2);
}

std::expected<unsigned, HashError>
ImageComparator::distance(std::string_view hash1,
                          std::string_view hash2) const {
  return m_hasher.distance(hash1, hash2);
}

std::expected<CompositeDistance, HashError>
ImageComparator::multipleDistance(const CompositeHash &hash1,
                                  const CompositeHash &hash2) const {
  auto full = m_hasher.distance(hash1.full, hash2.full);
  if (!full) {
    return std::unexpected(full.error());
  }
  auto left = m_hasher.distance(hash1.left, hash2.left);
  if (!left) {
    return std::unexpected(left.error());
  }
  auto right = m_hasher.distance(hash1.right, hash2.right);
  if (!right) {
    return std::unexpected(right.error());
  }

  comparatorLogger->debug("multipleCompare: full {}, left {}, right {}", *full,
                          *left, *right);
  return CompositeDistance{*full, *left, *right};
}
