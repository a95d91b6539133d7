#include "image/ImageHandle.hpp"
#include "Logging.hpp"

#include <utility>

ImageHandle::ImageHandle(cv::Mat pixels, Releaser releaser)
    : m_pixels(std::move(pixels)), m_releaser(std::move(releaser)),
      m_owned(true) {}

ImageHandle::ImageHandle(ImageHandle &&other) noexcept
    : m_pixels(std::move(other.m_pixels)),
      m_releaser(std::move(other.m_releaser)),
      m_owned(std::exchange(other.m_owned, false)) {
  other.m_pixels = cv::Mat();
}

ImageHandle::~ImageHandle() { reset(); }

ImageHandle &ImageHandle::operator=(ImageHandle &&other) noexcept {
  if (this != &other) {
    reset();
    m_pixels = std::move(other.m_pixels);
    m_releaser = std::move(other.m_releaser);
    m_owned = std::exchange(other.m_owned, false);
    other.m_pixels = cv::Mat();
  }
  return *this;
}

void ImageHandle::reset() noexcept {
  if (!m_owned) {
    return;
  }
  m_owned = false;

  try {
    if (m_releaser) {
      m_releaser(m_pixels);
    }
  } catch (const std::exception &e) {
    Logger::getInstance()->error("Image release hook failed: {}", e.what());
  }
  m_pixels.release();
  m_releaser = nullptr;
}
