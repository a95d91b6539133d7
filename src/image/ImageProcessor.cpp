#include "image/ImageProcessor.hpp"
#include "Logging.hpp"

#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <limits>

namespace {
std::shared_ptr<spdlog::logger> imageLogger = Logger::getInstance();

void releasePixels(cv::Mat &pixels) { pixels.release(); }
} // namespace

std::expected<ImageHandle, HashError>
ImageProcessor::load(const std::filesystem::path &file) {
  std::ifstream stream(file, std::ios::binary);
  if (!stream) {
    imageLogger->error("Unable to open image file: {}", file.string());
    return std::unexpected(
        HashError{HashError::Code::UNREADABLE_IMAGE,
                  fmt::format("Unable to load file: {}", file.string())});
  }

  ImageBytes data((std::istreambuf_iterator<char>(stream)),
                  std::istreambuf_iterator<char>());

  auto image = decode(data);
  if (!image) {
    return std::unexpected(
        HashError{HashError::Code::UNREADABLE_IMAGE,
                  fmt::format("Unable to load file: {}", file.string())});
  }
  return image;
}

cv::Size ImageProcessor::dimensions(const ImageHandle &image) const {
  return cv::Size(image.width(), image.height());
}

std::expected<ImageHandle, HashError>
OpenCvImageProcessor::decode(std::span<const unsigned char> data) {
  if (data.empty()) {
    return std::unexpected(HashError{HashError::Code::UNREADABLE_IMAGE,
                                     "Image data is empty"});
  }
  if (data.size() >
      static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return std::unexpected(HashError{HashError::Code::UNREADABLE_IMAGE,
                                     "Image data is too large"});
  }

  cv::Mat decoded;
  try {
    const cv::Mat buffer(1, static_cast<int>(data.size()), CV_8U,
                         const_cast<unsigned char *>(data.data()));
    decoded = cv::imdecode(buffer, cv::IMREAD_COLOR);
  } catch (const cv::Exception &e) {
    imageLogger->error("OpenCV failed to decode image: {}", e.what());
  }

  if (decoded.empty()) {
    return std::unexpected(HashError{HashError::Code::UNREADABLE_IMAGE,
                                     "Unable to decode image data"});
  }

  imageLogger->debug("Decoded {} bytes into {}x{} image", data.size(),
                     decoded.cols, decoded.rows);
  return ImageHandle(std::move(decoded), releasePixels);
}

std::expected<ImageHandle, HashError>
OpenCvImageProcessor::crop(const ImageHandle &image, const cv::Rect &region) {
  const cv::Rect bounds(0, 0, image.width(), image.height());
  if (image.isNull() || region.empty() || (region & bounds) != region) {
    return std::unexpected(HashError{
        HashError::Code::INVALID_INPUT,
        fmt::format("Crop region {}x{}+{}+{} outside {}x{} image",
                    region.width, region.height, region.x, region.y,
                    image.width(), image.height())});
  }

  // clone使裁剪结果不与源图像共享内存
  return ImageHandle(image.pixels()(region).clone(), releasePixels);
}
