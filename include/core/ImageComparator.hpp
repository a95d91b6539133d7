#pragma once

#include <expected>
#include <string_view>

#include "core/ImageHasher.hpp"

/**
 * @brief 组合哈希的三个独立距离
 */
struct CompositeDistance {
  unsigned full_distance = 0;       ///< 整图距离
  unsigned left_part_distance = 0;  ///< 左半距离
  unsigned right_part_distance = 0; ///< 右半距离
};

/**
 * @brief 图像比较类
 *
 * Hashes both inputs with the same ImageHasher and reports Hamming
 * distances. No aggregate score is computed.
 */
class ImageComparator {
public:
  explicit ImageComparator(ImageHasher hasher = ImageHasher());

  /**
   * @brief 比较两个图像的整图哈希
   * @return 汉明距离 [0, 64]，或错误
   */
  [[nodiscard]] std::expected<unsigned, HashError>
  compare(const ImageInput &image1, const ImageInput &image2) const;

  /**
   * @brief 比较两个图像的组合哈希
   *
   * @param image1 第一个图像来源
   * @param image2 第二个图像来源
   * @return 整图、左半、右半的距离，或错误
   */
  [[nodiscard]] std::expected<CompositeDistance, HashError>
  multipleCompare(const ImageInput &image1, const ImageInput &image2) const;

  [[nodiscard]] std::expected<unsigned, HashError>
  distance(std::string_view hash1, std::string_view hash2) const;

  [[nodiscard]] std::expected<CompositeDistance, HashError>
  multipleDistance(const CompositeHash &hash1,
                   const CompositeHash &hash2) const;

  [[nodiscard]] const ImageHasher &hasher() const noexcept { return m_hasher; }

private:
  ImageHasher m_hasher;
};
