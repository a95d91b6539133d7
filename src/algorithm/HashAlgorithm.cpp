#include "algorithm/HashAlgorithm.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <array>
#include <fmt/format.h>
#include <stdexcept>

namespace {
std::shared_ptr<spdlog::logger> algorithmLogger = Logger::getInstance();
} // namespace

void HashAlgorithm::validateInput(const cv::Mat &input) const {
  if (input.empty()) {
    throw std::invalid_argument("Input image is empty");
  }
  if (input.depth() != CV_8U) {
    throw std::invalid_argument(
        fmt::format("Unsupported image depth {}, expected 8-bit",
                    input.depth()));
  }
  const int channels = input.channels();
  if (channels != 1 && channels != 3 && channels != 4) {
    throw std::invalid_argument(
        fmt::format("Unsupported channel count {}", channels));
  }
}

cv::Mat HashAlgorithm::grayscaleResized(const cv::Mat &input, cv::Size size) {
  cv::Mat gray;
  switch (input.channels()) {
  case 3:
    cv::cvtColor(input, gray, cv::COLOR_BGR2GRAY);
    break;
  case 4:
    cv::cvtColor(input, gray, cv::COLOR_BGRA2GRAY);
    break;
  default:
    gray = input;
    break;
  }

  cv::Mat resized;
  cv::resize(gray, resized, size, 0, 0, cv::INTER_AREA);
  return resized;
}

//////////////////////////////////////////////////////////////
// AverageHash
//////////////////////////////////////////////////////////////

std::uint64_t AverageHash::hash(const cv::Mat &image) const {
  validateInput(image);

  cv::Mat small = grayscaleResized(image, cv::Size(SIZE, SIZE));

  unsigned sum = 0;
  for (int y = 0; y < SIZE; ++y) {
    const uchar *row = small.ptr<uchar>(y);
    for (int x = 0; x < SIZE; ++x) {
      sum += row[x];
    }
  }
  const unsigned average = sum / (SIZE * SIZE);

  std::uint64_t hash = 0;
  std::uint64_t one = 1;
  for (int y = 0; y < SIZE; ++y) {
    const uchar *row = small.ptr<uchar>(y);
    for (int x = 0; x < SIZE; ++x) {
      if (row[x] > average) {
        hash |= one;
      }
      one <<= 1;
    }
  }

  algorithmLogger->debug("{}: {:016x}", name(), hash);
  return hash;
}

//////////////////////////////////////////////////////////////
// DifferenceHash
//////////////////////////////////////////////////////////////

std::uint64_t DifferenceHash::hash(const cv::Mat &image) const {
  validateInput(image);

  // 每行9个像素产生8个相邻差分位
  cv::Mat small = grayscaleResized(image, cv::Size(SIZE + 1, SIZE));

  std::uint64_t hash = 0;
  std::uint64_t one = 1;
  for (int y = 0; y < SIZE; ++y) {
    const uchar *row = small.ptr<uchar>(y);
    uchar left = row[0];
    for (int x = 1; x <= SIZE; ++x) {
      const uchar right = row[x];
      if (left > right) {
        hash |= one;
      }
      left = right;
      one <<= 1;
    }
  }

  algorithmLogger->debug("{}: {:016x}", name(), hash);
  return hash;
}

//////////////////////////////////////////////////////////////
// PerceptualHash
//////////////////////////////////////////////////////////////

std::uint64_t PerceptualHash::hash(const cv::Mat &image) const {
  validateInput(image);

  cv::Mat small = grayscaleResized(image, cv::Size(SIZE, SIZE));
  cv::Mat floatImage;
  small.convertTo(floatImage, CV_32F);

  cv::Mat dctCoeffs;
  cv::dct(floatImage, dctCoeffs);

  // 取左上角低频系数
  std::array<float, BLOCK * BLOCK> coeffs{};
  for (int y = 0; y < BLOCK; ++y) {
    for (int x = 0; x < BLOCK; ++x) {
      coeffs[y * BLOCK + x] = dctCoeffs.at<float>(y, x);
    }
  }

  std::array<float, BLOCK * BLOCK> sorted = coeffs;
  const auto mid = sorted.begin() + sorted.size() / 2;
  std::nth_element(sorted.begin(), mid, sorted.end());
  const float upper = *mid;
  const float lower = *std::max_element(sorted.begin(), mid);
  const float median = (lower + upper) / 2.0f;

  std::uint64_t hash = 0;
  for (std::size_t i = 0; i < coeffs.size(); ++i) {
    if (coeffs[i] > median) {
      hash |= std::uint64_t{1} << i;
    }
  }

  algorithmLogger->debug("{}: {:016x} (median {:.4f})", name(), hash, median);
  return hash;
}

//////////////////////////////////////////////////////////////
// Factory
//////////////////////////////////////////////////////////////

std::unique_ptr<HashAlgorithm> createHashAlgorithm(HashMethod method) {
  switch (method) {
  case HashMethod::Average:
    return std::make_unique<AverageHash>();
  case HashMethod::Difference:
    return std::make_unique<DifferenceHash>();
  case HashMethod::Perceptual:
    return std::make_unique<PerceptualHash>();
  }
  return std::make_unique<DifferenceHash>();
}

const char *methodName(HashMethod method) noexcept {
  switch (method) {
  case HashMethod::Average:
    return "average";
  case HashMethod::Difference:
    return "difference";
  case HashMethod::Perceptual:
    return "perceptual";
  }
  return "unknown";
}

std::expected<HashMethod, HashError> parseMethod(std::string_view name) {
  if (name == "average") {
    return HashMethod::Average;
  }
  if (name == "difference") {
    return HashMethod::Difference;
  }
  if (name == "perceptual") {
    return HashMethod::Perceptual;
  }
  return std::unexpected(HashError{
      HashError::Code::INVALID_CONFIG,
      fmt::format("Unknown hash method '{}'", name)});
}
