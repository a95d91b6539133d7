#include <gtest/gtest.h>

#include "hash/HashCodec.hpp"

#include <cstdint>
#include <limits>
#include <random>
#include <vector>

namespace {

constexpr std::uint64_t MAX_HASH = std::numeric_limits<std::uint64_t>::max();
constexpr std::uint64_t SIGN_BIT = std::uint64_t{1} << 63;

std::vector<std::uint64_t> sampleValues() {
  std::vector<std::uint64_t> values = {0,
                                       1,
                                       0xff,
                                       0x7fffffffffffffffULL,
                                       SIGN_BIT,
                                       SIGN_BIT + 1,
                                       0x8fffffffffffffffULL,
                                       0x9000000000000000ULL,
                                       0xf0000000000000ffULL,
                                       0x00000000ffffffffULL,
                                       0xffffffff00000000ULL,
                                       MAX_HASH};
  std::mt19937_64 rng(20240611);
  for (int i = 0; i < 500; ++i) {
    values.push_back(rng());
  }
  return values;
}

} // namespace

// ========== Encoding ==========

TEST(HashCodecTest, EncodeHex_MinimalLowerCase) {
  EXPECT_EQ(HashCodec::encode(0, HashMode::Hexadecimal), "0");
  EXPECT_EQ(HashCodec::encode(0xff, HashMode::Hexadecimal), "ff");
  EXPECT_EQ(HashCodec::encode(0x0abc, HashMode::Hexadecimal), "abc");
  EXPECT_EQ(HashCodec::encode(MAX_HASH, HashMode::Hexadecimal),
            "ffffffffffffffff");
  EXPECT_EQ(HashCodec::encode(SIGN_BIT + 1, HashMode::Hexadecimal),
            "8000000000000001");
}

TEST(HashCodecTest, EncodeDecimal_UsesSignedBitPattern) {
  EXPECT_EQ(HashCodec::encode(0, HashMode::Decimal), "0");
  EXPECT_EQ(HashCodec::encode(42, HashMode::Decimal), "42");
  EXPECT_EQ(HashCodec::encode(0x7fffffffffffffffULL, HashMode::Decimal),
            "9223372036854775807");
  EXPECT_EQ(HashCodec::encode(SIGN_BIT, HashMode::Decimal),
            "-9223372036854775808");
  EXPECT_EQ(HashCodec::encode(MAX_HASH, HashMode::Decimal), "-1");
}

// ========== Round trips ==========

TEST(HashCodecTest, RoundTrip_Hexadecimal) {
  for (std::uint64_t value : sampleValues()) {
    auto decoded =
        HashCodec::decode(HashCodec::encode(value, HashMode::Hexadecimal),
                          HashMode::Hexadecimal);
    ASSERT_TRUE(decoded.has_value()) << value;
    EXPECT_EQ(*decoded, value);
  }
}

TEST(HashCodecTest, RoundTrip_Decimal) {
  for (std::uint64_t value : sampleValues()) {
    auto decoded = HashCodec::decode(
        HashCodec::encode(value, HashMode::Decimal), HashMode::Decimal);
    ASSERT_TRUE(decoded.has_value()) << value;
    EXPECT_EQ(*decoded, value);
  }
}

// ========== Full-width hex ==========

TEST(HashCodecTest, DecodeHex_SignBitSetIsUnsigned) {
  auto decoded = HashCodec::decodeHex("8000000000000001");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, 9223372036854775809ULL);
}

TEST(HashCodecTest, DecodeHex_HighNibbleAboveEightUsesWordSplit) {
  auto nine = HashCodec::decodeHex("9000000000000000");
  ASSERT_TRUE(nine.has_value());
  EXPECT_EQ(*nine, 0x9000000000000000ULL);

  auto mixed = HashCodec::decodeHex("fedcba9876543210");
  ASSERT_TRUE(mixed.has_value());
  EXPECT_EQ(*mixed, 0xfedcba9876543210ULL);

  auto max = HashCodec::decodeHex("ffffffffffffffff");
  ASSERT_TRUE(max.has_value());
  EXPECT_EQ(*max, MAX_HASH);
}

TEST(HashCodecTest, DecodeHex_ShortStrings) {
  EXPECT_EQ(HashCodec::decodeHex("0").value(), 0u);
  EXPECT_EQ(HashCodec::decodeHex("f").value(), 15u);
  EXPECT_EQ(HashCodec::decodeHex("ffffffff").value(), 0xffffffffULL);
  EXPECT_EQ(HashCodec::decodeHex("0000000000000001").value(), 1u);
}

TEST(HashCodecTest, DecodeHex_AcceptsUpperCase) {
  EXPECT_EQ(HashCodec::decodeHex("ABCDEF").value(), 0xabcdefULL);
  EXPECT_EQ(HashCodec::decodeHex("FEDCBA9876543210").value(),
            0xfedcba9876543210ULL);
}

// ========== Malformed input ==========

TEST(HashCodecTest, DecodeHex_RejectsMalformed) {
  for (const char *bad :
       {"", "xyz", "0x12", "12 ", "-1", "g", "10000000000000000"}) {
    auto decoded = HashCodec::decodeHex(bad);
    ASSERT_FALSE(decoded.has_value()) << bad;
    EXPECT_EQ(decoded.error().code, HashError::Code::MALFORMED_HASH) << bad;
  }
}

TEST(HashCodecTest, DecodeHex_RejectsNonHexInFullWidthString) {
  auto decoded = HashCodec::decodeHex("f00000000000000z");
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error().code, HashError::Code::MALFORMED_HASH);
}

TEST(HashCodecTest, DecodeDecimal_RejectsMalformed) {
  for (const char *bad : {"", "abc", "1.5", "12a", " 1", "+1", "--1",
                          "18446744073709551616", "-9223372036854775809"}) {
    auto decoded = HashCodec::decodeDecimal(bad);
    ASSERT_FALSE(decoded.has_value()) << bad;
    EXPECT_EQ(decoded.error().code, HashError::Code::MALFORMED_HASH) << bad;
  }
}

TEST(HashCodecTest, DecodeDecimal_AcceptsUnsignedForm) {
  EXPECT_EQ(HashCodec::decodeDecimal("18446744073709551615").value(),
            MAX_HASH);
  EXPECT_EQ(HashCodec::decodeDecimal("9223372036854775809").value(),
            SIGN_BIT + 1);
  EXPECT_EQ(HashCodec::decodeDecimal("-1").value(), MAX_HASH);
}

// ========== Mode names ==========

TEST(HashCodecTest, ParseMode) {
  EXPECT_EQ(HashCodec::parseMode("hex").value(), HashMode::Hexadecimal);
  EXPECT_EQ(HashCodec::parseMode("dec").value(), HashMode::Decimal);
  EXPECT_STREQ(HashCodec::modeName(HashMode::Hexadecimal), "hex");
  EXPECT_STREQ(HashCodec::modeName(HashMode::Decimal), "dec");

  auto unknown = HashCodec::parseMode("binary");
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().code, HashError::Code::INVALID_CONFIG);
}
