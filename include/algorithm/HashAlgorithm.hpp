#ifndef IMAGEHASH_HASHALGORITHM_HPP
#define IMAGEHASH_HASHALGORITHM_HPP

#include <cstdint>
#include <expected>
#include <memory>
#include <opencv2/opencv.hpp>
#include <string>
#include <string_view>

#include "HashError.hpp"

// 可选的指纹算法
enum class HashMethod { Average, Difference, Perceptual };

// 所有指纹算法的抽象基类
class HashAlgorithm {
public:
  virtual ~HashAlgorithm() = default;

  // 同样的像素内容必须得到同样的64位哈希
  virtual std::uint64_t hash(const cv::Mat &image) const = 0;
  virtual std::string name() const noexcept = 0;

  virtual void validateInput(const cv::Mat &input) const;

protected:
  // 转换为8位单通道灰度图并缩放到指定大小
  static cv::Mat grayscaleResized(const cv::Mat &input, cv::Size size);
};

// 具体算法实现
class AverageHash : public HashAlgorithm {
public:
  static constexpr int SIZE = 8;

  std::uint64_t hash(const cv::Mat &image) const override;
  std::string name() const noexcept override { return "Average Hash"; }
};

class DifferenceHash : public HashAlgorithm {
public:
  static constexpr int SIZE = 8;

  std::uint64_t hash(const cv::Mat &image) const override;
  std::string name() const noexcept override { return "Difference Hash"; }
};

class PerceptualHash : public HashAlgorithm {
public:
  static constexpr int SIZE = 32;
  static constexpr int BLOCK = 8;

  std::uint64_t hash(const cv::Mat &image) const override;
  std::string name() const noexcept override { return "Perceptual Hash"; }
};

// 根据方法创建适当的算法
std::unique_ptr<HashAlgorithm> createHashAlgorithm(HashMethod method);

const char *methodName(HashMethod method) noexcept;
std::expected<HashMethod, HashError> parseMethod(std::string_view name);

#endif // IMAGEHASH_HASHALGORITHM_HPP
