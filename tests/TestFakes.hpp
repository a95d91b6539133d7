#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "algorithm/HashAlgorithm.hpp"
#include "image/ImageProcessor.hpp"

namespace testing_support {

/**
 * Decodes three-byte "images" {value, width, height} into a single-channel
 * matrix where pixel (x, y) = value + x, and counts every handle it hands
 * out and gets back.
 */
class CountingImageProcessor : public ImageProcessor {
public:
  std::atomic<int> decoded{0};
  std::atomic<int> released{0};
  std::vector<cv::Rect> crops;

  static ImageBytes image(unsigned char value, unsigned char width,
                          unsigned char height) {
    return {value, width, height};
  }

  std::expected<ImageHandle, HashError>
  decode(std::span<const unsigned char> data) override {
    if (data.size() != 3 || data[1] == 0 || data[2] == 0) {
      return std::unexpected(
          HashError{HashError::Code::UNREADABLE_IMAGE, "bad test image"});
    }

    cv::Mat pixels(data[2], data[1], CV_8UC1);
    for (int y = 0; y < pixels.rows; ++y) {
      for (int x = 0; x < pixels.cols; ++x) {
        pixels.at<uchar>(y, x) = static_cast<uchar>(data[0] + x);
      }
    }
    ++decoded;
    return makeHandle(std::move(pixels));
  }

  std::expected<ImageHandle, HashError>
  crop(const ImageHandle &image, const cv::Rect &region) override {
    {
      std::lock_guard lock(m_mutex);
      crops.push_back(region);
    }
    return makeHandle(image.pixels()(region).clone());
  }

  ImageHandle makeHandle(cv::Mat pixels) {
    return ImageHandle(std::move(pixels),
                       [this](cv::Mat &) { ++released; });
  }

private:
  std::mutex m_mutex;
};

/**
 * Packs the top-left pixel and the image geometry into the hash:
 * pixel | width << 8 | height << 16. Throws on the configured call.
 */
class GeometryHash : public HashAlgorithm {
public:
  explicit GeometryHash(int failOnCall = 0) : m_failOnCall(failOnCall) {}

  std::uint64_t hash(const cv::Mat &image) const override {
    const int call = ++m_calls;
    if (call == m_failOnCall) {
      throw std::runtime_error("injected fingerprint failure");
    }
    return static_cast<std::uint64_t>(image.at<uchar>(0, 0)) |
           static_cast<std::uint64_t>(image.cols) << 8 |
           static_cast<std::uint64_t>(image.rows) << 16;
  }

  std::string name() const noexcept override { return "Geometry Hash"; }

  int calls() const noexcept { return m_calls; }

private:
  int m_failOnCall;
  mutable std::atomic<int> m_calls{0};
};

/**
 * Always returns the same raw value.
 */
class ConstantHash : public HashAlgorithm {
public:
  explicit ConstantHash(std::uint64_t value) : m_value(value) {}

  std::uint64_t hash(const cv::Mat &) const override { return m_value; }
  std::string name() const noexcept override { return "Constant Hash"; }

private:
  std::uint64_t m_value;
};

} // namespace testing_support
