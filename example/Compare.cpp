#include "core/ImageComparator.hpp"

#include <fmt/format.h>

// 用法: imagehash_compare <image1> <image2> [hex|dec] [average|difference|perceptual]
int main(int argc, char **argv) {
  if (argc < 3) {
    fmt::print(stderr,
               "usage: {} <image1> <image2> [hex|dec] "
               "[average|difference|perceptual]\n",
               argv[0]);
    return 2;
  }

  HasherParameters params;
  if (argc > 3) {
    auto mode = HashCodec::parseMode(argv[3]);
    if (!mode) {
      fmt::print(stderr, "{}\n", mode.error().message);
      return 2;
    }
    params.mode = *mode;
  }
  if (argc > 4) {
    auto method = parseMethod(argv[4]);
    if (!method) {
      fmt::print(stderr, "{}\n", method.error().message);
      return 2;
    }
    params.method = *method;
  }

  ImageComparator comparator{ImageHasher(params)};
  const std::filesystem::path first(argv[1]);
  const std::filesystem::path second(argv[2]);

  auto hash1 = comparator.hasher().hash(first);
  auto hash2 = comparator.hasher().hash(second);
  if (!hash1 || !hash2) {
    const auto &error = !hash1 ? hash1.error() : hash2.error();
    fmt::print(stderr, "[{}] {}\n", errorCodeName(error.code), error.message);
    return 1;
  }

  fmt::print("{}  {}\n{}  {}\n", *hash1, first.string(), *hash2,
             second.string());

  auto distance = comparator.distance(*hash1, *hash2);
  if (distance) {
    fmt::print("distance: {}\n", *distance);
  }

  // 图像宽度不足时组合比较会失败，不影响整图结果
  auto parts = comparator.multipleCompare(first, second);
  if (parts) {
    fmt::print("full: {}  left: {}  right: {}\n", parts->full_distance,
               parts->left_part_distance, parts->right_part_distance);
  } else {
    fmt::print(stderr, "multipleCompare: {}\n", parts.error().message);
  }

  return distance ? 0 : 1;
}
