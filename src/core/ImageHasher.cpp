#include "core/ImageHasher.hpp"
#include "Logging.hpp"
#include "utils/ScopedTimer.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <type_traits>

namespace {
std::shared_ptr<spdlog::logger> hasherLogger = Logger::getInstance();

bool isHandle(const ImageInput &image) noexcept {
  return std::holds_alternative<std::reference_wrapper<const ImageHandle>>(
      image);
}
} // namespace

ImageHasher::ImageHasher(std::shared_ptr<const HashAlgorithm> algorithm,
                         HashMode mode,
                         std::shared_ptr<ImageProcessor> processor,
                         BitCounter counter)
    : m_algorithm(algorithm ? std::move(algorithm)
                            : std::make_shared<DifferenceHash>()),
      m_processor(processor ? std::move(processor)
                            : std::make_shared<OpenCvImageProcessor>()),
      m_mode(mode), m_hamming(counter) {
  hasherLogger->debug("ImageHasher using {} ({} mode)", m_algorithm->name(),
                      HashCodec::modeName(m_mode));
}

ImageHasher::ImageHasher(const HasherParameters &params,
                         std::shared_ptr<ImageProcessor> processor)
    : ImageHasher(createHashAlgorithm(params.method), params.mode,
                  std::move(processor), params.counter) {}

std::expected<EncodedHash, HashError>
ImageHasher::hash(const ImageInput &image) const {
  if (isHandle(image)) {
    const auto &handle =
        std::get<std::reference_wrapper<const ImageHandle>>(image).get();
    return fingerprint(handle, "full");
  }

  utils::ScopedTimer timer("hash");
  auto decoded = acquire(image);
  if (!decoded) {
    return std::unexpected(decoded.error());
  }
  return fingerprint(*decoded, "full");
}

std::expected<EncodedHash, HashError>
ImageHasher::hashFromBytes(std::span<const unsigned char> data) const {
  utils::ScopedTimer timer("hashFromBytes");
  auto decoded = m_processor->decode(data);
  if (!decoded) {
    hasherLogger->warn("hashFromBytes: {}", decoded.error().message);
    return std::unexpected(decoded.error());
  }
  return fingerprint(*decoded, "full");
}

std::expected<CompositeHash, HashError>
ImageHasher::multipleHash(const ImageInput &image) const {
  if (isHandle(image)) {
    hasherLogger->warn("multipleHash requires a decodable image source");
    return std::unexpected(
        HashError{HashError::Code::INVALID_COMPOSITE_INPUT,
                  "multipleHash requires a file path or image bytes"});
  }

  utils::ScopedTimer timer("multipleHash");

  auto full = acquire(image);
  if (!full) {
    return std::unexpected(full.error());
  }

  const cv::Size size = m_processor->dimensions(*full);
  const int midpoint = size.width / 2;
  if (midpoint <= 0 || size.height <= 0) {
    return std::unexpected(HashError{
        HashError::Code::INVALID_INPUT,
        fmt::format("Image {}x{} is too small to split", size.width,
                    size.height)});
  }

  auto left = m_processor->crop(*full, cv::Rect(0, 0, midpoint, size.height));
  if (!left) {
    return std::unexpected(left.error());
  }
  auto right = m_processor->crop(
      *full, cv::Rect(midpoint, 0, size.width - midpoint, size.height));
  if (!right) {
    return std::unexpected(right.error());
  }

  // 三个句柄在返回时均由析构函数释放
  auto fullHash = fingerprint(*full, "full");
  if (!fullHash) {
    return std::unexpected(fullHash.error());
  }
  auto leftHash = fingerprint(*left, "left");
  if (!leftHash) {
    return std::unexpected(leftHash.error());
  }
  auto rightHash = fingerprint(*right, "right");
  if (!rightHash) {
    return std::unexpected(rightHash.error());
  }

  return CompositeHash{std::move(*fullHash), std::move(*leftHash),
                       std::move(*rightHash)};
}

std::vector<std::expected<EncodedHash, HashError>>
ImageHasher::hashBatch(const std::vector<ImageInput> &images) const {
  std::vector<std::expected<EncodedHash, HashError>> results(
      images.size(),
      std::unexpected(HashError{HashError::Code::INVALID_INPUT, "not hashed"}));

  if (images.empty()) {
    return results;
  }

  hasherLogger->debug("Starting batch hashing of {} images", images.size());

  tbb::parallel_for(tbb::blocked_range<size_t>(0, images.size()),
                    [&](const tbb::blocked_range<size_t> &range) {
                      for (size_t i = range.begin(); i < range.end(); ++i) {
                        results[i] = hash(images[i]);
                      }
                    });

  const auto failed = std::count_if(results.begin(), results.end(),
                                    [](const auto &r) { return !r; });
  hasherLogger->info("Batch hashing completed: {} images, {} failed",
                     images.size(), failed);
  return results;
}

std::expected<unsigned, HashError>
ImageHasher::distance(std::string_view hash1, std::string_view hash2) const {
  return m_hamming.between(hash1, hash2, m_mode);
}

std::expected<ImageHandle, HashError>
ImageHasher::acquire(const ImageInput &image) const {
  auto decoded = std::visit(
      [this](const auto &source) -> std::expected<ImageHandle, HashError> {
        using T = std::decay_t<decltype(source)>;

        if constexpr (std::is_same_v<T, std::filesystem::path>) {
          return m_processor->load(source);
        } else if constexpr (std::is_same_v<T, ImageBytes>) {
          return m_processor->decode(source);
        } else {
          return std::unexpected(HashError{HashError::Code::INVALID_INPUT,
                                           "Image is already decoded"});
        }
      },
      image);

  if (!decoded) {
    hasherLogger->warn("Unable to decode image: {}", decoded.error().message);
  }
  return decoded;
}

std::expected<EncodedHash, HashError>
ImageHasher::fingerprint(const ImageHandle &image,
                         std::string_view region) const {
  try {
    const std::uint64_t raw = m_algorithm->hash(image.pixels());
    EncodedHash encoded = HashCodec::encode(raw, m_mode);
    hasherLogger->debug("{} hash of {}x{} image: {}", region, image.width(),
                        image.height(), encoded);
    return encoded;
  } catch (const std::exception &e) {
    hasherLogger->error("{} failed on {} image: {}", m_algorithm->name(),
                        region, e.what());
    return std::unexpected(HashError{
        HashError::Code::FINGERPRINT_FAILED,
        fmt::format("{} failed on {} image: {}", m_algorithm->name(), region,
                    e.what())});
  }
}
