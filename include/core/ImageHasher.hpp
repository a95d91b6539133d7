#pragma once

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include "HashError.hpp"
#include "algorithm/HashAlgorithm.hpp"
#include "core/Parameters.hpp"
#include "hash/HammingDistance.hpp"
#include "hash/HashCodec.hpp"
#include "image/ImageProcessor.hpp"

/**
 * @brief 待哈希的图像：文件路径、编码字节或已解码的图像句柄
 *
 * Paths and byte buffers are decodable sources. A handle refers to an image
 * the caller already decoded and still owns.
 */
using ImageInput = std::variant<std::filesystem::path, ImageBytes,
                                std::reference_wrapper<const ImageHandle>>;

/**
 * @brief 整图、左半和右半三个指纹
 */
struct CompositeHash {
  EncodedHash full;
  EncodedHash left;
  EncodedHash right;
};

/**
 * @brief Turns images into encoded perceptual hashes.
 *
 * The encoding mode, algorithm and image processor are fixed at
 * construction; a single instance may be shared between threads.
 */
class ImageHasher {
public:
  /**
   * @param algorithm Fingerprinting algorithm, DifferenceHash when null
   * @param mode Encoding of produced hashes
   * @param processor Image decoder, OpenCvImageProcessor when null
   * @param counter Bit counting strategy used by distance()
   */
  explicit ImageHasher(std::shared_ptr<const HashAlgorithm> algorithm = nullptr,
                       HashMode mode = HashMode::Hexadecimal,
                       std::shared_ptr<ImageProcessor> processor = nullptr,
                       BitCounter counter = BitCounter::Auto);

  explicit ImageHasher(const HasherParameters &params,
                       std::shared_ptr<ImageProcessor> processor = nullptr);

  /**
   * @brief 计算图像的感知哈希
   *
   * Sources are decoded and released before returning; handles are hashed
   * in place and left to the caller.
   *
   * @param image 图像来源
   * @return 编码后的哈希，或错误
   */
  [[nodiscard]] std::expected<EncodedHash, HashError>
  hash(const ImageInput &image) const;

  /**
   * @brief 计算图像字节的感知哈希
   */
  [[nodiscard]] std::expected<EncodedHash, HashError>
  hashFromBytes(std::span<const unsigned char> data) const;

  /**
   * @brief 计算整图、左半和右半的组合哈希
   *
   * The image is split on column width / 2: left covers [0, width / 2),
   * right covers [width / 2, width). Only decodable sources are accepted;
   * a handle input yields INVALID_COMPOSITE_INPUT. All decoded images are
   * released on every path, including fingerprint failures.
   *
   * @param image 图像文件路径或编码字节
   * @return 组合哈希，或错误
   */
  [[nodiscard]] std::expected<CompositeHash, HashError>
  multipleHash(const ImageInput &image) const;

  /**
   * @brief 并行计算多个图像的哈希，结果与输入顺序一致
   */
  [[nodiscard]] std::vector<std::expected<EncodedHash, HashError>>
  hashBatch(const std::vector<ImageInput> &images) const;

  /**
   * @brief 两个已编码哈希之间的汉明距离
   */
  [[nodiscard]] std::expected<unsigned, HashError>
  distance(std::string_view hash1, std::string_view hash2) const;

  [[nodiscard]] HashMode mode() const noexcept { return m_mode; }
  [[nodiscard]] const HashAlgorithm &algorithm() const noexcept {
    return *m_algorithm;
  }
  [[nodiscard]] const HammingDistance &hamming() const noexcept {
    return m_hamming;
  }

private:
  std::shared_ptr<const HashAlgorithm> m_algorithm;
  std::shared_ptr<ImageProcessor> m_processor;
  HashMode m_mode;
  HammingDistance m_hamming;

  [[nodiscard]] std::expected<ImageHandle, HashError>
  acquire(const ImageInput &image) const;

  [[nodiscard]] std::expected<EncodedHash, HashError>
  fingerprint(const ImageHandle &image, std::string_view region) const;
};
