#pragma once

#include <functional>
#include <opencv2/opencv.hpp>

/**
 * @brief 已解码图像的独占句柄
 *
 * Owns decoded pixels for the duration of a hashing call. The release hook
 * supplied by the ImageProcessor that created the handle runs exactly once,
 * either on reset() or on destruction, whichever comes first.
 */
class ImageHandle {
public:
  using Releaser = std::function<void(cv::Mat &)>;

  ImageHandle() = default;
  explicit ImageHandle(cv::Mat pixels, Releaser releaser = {});
  ImageHandle(ImageHandle &&other) noexcept;
  ~ImageHandle();

  ImageHandle &operator=(ImageHandle &&other) noexcept;

  ImageHandle(const ImageHandle &) = delete;
  ImageHandle &operator=(const ImageHandle &) = delete;

  /**
   * @brief 释放像素数据，重复调用无副作用
   */
  void reset() noexcept;

  [[nodiscard]] const cv::Mat &pixels() const noexcept { return m_pixels; }
  [[nodiscard]] int width() const noexcept { return m_pixels.cols; }
  [[nodiscard]] int height() const noexcept { return m_pixels.rows; }
  [[nodiscard]] bool isNull() const noexcept { return m_pixels.empty(); }

private:
  cv::Mat m_pixels;
  Releaser m_releaser;
  bool m_owned = false;
};
