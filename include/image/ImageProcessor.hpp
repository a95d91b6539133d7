#pragma once

#include <expected>
#include <filesystem>
#include <opencv2/opencv.hpp>
#include <span>
#include <vector>

#include "HashError.hpp"
#include "image/ImageHandle.hpp"

/**
 * @brief 原始图像字节（编码后的文件内容）
 */
using ImageBytes = std::vector<unsigned char>;

/**
 * @brief 图像解码与裁剪接口
 *
 * Handles returned by an ImageProcessor carry the processor's release hook,
 * so dropping the handle is all a caller needs to do to release it.
 */
class ImageProcessor {
public:
  virtual ~ImageProcessor() = default;

  /**
   * @brief 将编码后的字节解码为内存图像
   * @param data 图像文件内容
   * @return 图像句柄，或UNREADABLE_IMAGE
   */
  [[nodiscard]] virtual std::expected<ImageHandle, HashError>
  decode(std::span<const unsigned char> data) = 0;

  /**
   * @brief 读取并解码图像文件
   * @param file 图像文件路径
   * @return 图像句柄，或UNREADABLE_IMAGE
   */
  [[nodiscard]] virtual std::expected<ImageHandle, HashError>
  load(const std::filesystem::path &file);

  /**
   * @brief 图像的像素宽高
   */
  [[nodiscard]] virtual cv::Size dimensions(const ImageHandle &image) const;

  /**
   * @brief 裁剪出一个独立的新图像
   * @param image 源图像
   * @param region 裁剪区域，必须完全位于图像内部
   * @return 新的图像句柄，或INVALID_INPUT
   */
  [[nodiscard]] virtual std::expected<ImageHandle, HashError>
  crop(const ImageHandle &image, const cv::Rect &region) = 0;
};

/**
 * @brief 基于OpenCV的图像处理实现
 */
class OpenCvImageProcessor : public ImageProcessor {
public:
  [[nodiscard]] std::expected<ImageHandle, HashError>
  decode(std::span<const unsigned char> data) override;

  [[nodiscard]] std::expected<ImageHandle, HashError>
  crop(const ImageHandle &image, const cv::Rect &region) override;
};
