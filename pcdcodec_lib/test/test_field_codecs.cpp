#include <gtest/gtest.h>

#include <cmath>
#include <cstring>
#include <limits>
#include <random>

#include "pcdcodec/errors.hpp"
#include "pcdcodec/field_decoder.hpp"
#include "pcdcodec/field_encoder.hpp"

namespace {

template <typename T>
std::string EncodeValue(T value) {
  auto encoder = PcdCodec::CreateAsciiEncoder(PcdCodec::FieldTypeOf<T>());
  std::string text;
  encoder->encode(reinterpret_cast<const uint8_t*>(&value), text);
  return text;
}

template <typename T>
bool DecodeValue(std::string_view token, T& value) {
  auto decoder = PcdCodec::CreateAsciiDecoder(PcdCodec::FieldTypeOf<T>());
  return decoder->decode(token, reinterpret_cast<uint8_t*>(&value));
}

}  // namespace

TEST(FieldCodecs, IntField) {
  const size_t kNumpoints = 1000;
  std::mt19937 rng(42);
  std::uniform_int_distribution<int32_t> dist(std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max());

  for (size_t i = 0; i < kNumpoints; ++i) {
    const int32_t input = dist(rng);
    int32_t output = 0;
    const auto text = EncodeValue(input);
    ASSERT_TRUE(DecodeValue(text, output)) << text;
    ASSERT_EQ(input, output) << "Mismatch at index " << i;
  }

  EXPECT_EQ(EncodeValue<int8_t>(-128), "-128");
  EXPECT_EQ(EncodeValue<uint8_t>(255), "255");
  EXPECT_EQ(EncodeValue<uint16_t>(65535), "65535");
}

TEST(FieldCodecs, IntLimits) {
  int8_t i8 = 0;
  EXPECT_TRUE(DecodeValue("-128", i8));
  EXPECT_EQ(i8, -128);
  EXPECT_FALSE(DecodeValue("128", i8));

  uint16_t u16 = 0;
  EXPECT_TRUE(DecodeValue("+65535", u16));
  EXPECT_EQ(u16, 65535);
  EXPECT_FALSE(DecodeValue("65536", u16));
  EXPECT_FALSE(DecodeValue("-1", u16));

  uint32_t u32 = 0;
  EXPECT_FALSE(DecodeValue("12abc", u32));
  EXPECT_FALSE(DecodeValue("1.5", u32));
  EXPECT_FALSE(DecodeValue("", u32));
  EXPECT_FALSE(DecodeValue("+", u32));
}

TEST(FieldCodecs, FloatRoundTripIsExact) {
  const size_t kNumpoints = 100000;
  std::mt19937 rng(7);
  std::uniform_real_distribution<float> small(-1.0f, 1.0f);
  std::uniform_int_distribution<int> exponent(-30, 30);

  for (size_t i = 0; i < kNumpoints; ++i) {
    const float input = std::ldexp(small(rng), exponent(rng));
    float output = 0;
    const auto text = EncodeValue(input);
    ASSERT_TRUE(DecodeValue(text, output)) << text;
    ASSERT_EQ(std::memcmp(&input, &output, sizeof(float)), 0) << "Mismatch at index " << i << ": " << text;
  }
}

TEST(FieldCodecs, DoubleRoundTripIsExact) {
  const size_t kNumpoints = 100000;
  std::mt19937_64 rng(11);
  std::uniform_real_distribution<double> dist(-1e6, 1e6);

  for (size_t i = 0; i < kNumpoints; ++i) {
    const double input = dist(rng);
    double output = 0;
    const auto text = EncodeValue(input);
    ASSERT_TRUE(DecodeValue(text, output)) << text;
    ASSERT_EQ(input, output) << "Mismatch at index " << i << ": " << text;
  }

  // values that are not representable with few digits
  for (double value : {0.1, 1.0 / 3.0, 1e-300, 1.7976931348623157e308}) {
    double output = 0;
    ASSERT_TRUE(DecodeValue(EncodeValue(value), output));
    EXPECT_EQ(value, output);
  }
}

TEST(FieldCodecs, FloatSpecialTokens) {
  float value = 0;
  EXPECT_TRUE(DecodeValue("nan", value));
  EXPECT_TRUE(std::isnan(value));

  EXPECT_TRUE(DecodeValue("inf", value));
  EXPECT_TRUE(std::isinf(value) && value > 0);

  EXPECT_TRUE(DecodeValue("-inf", value));
  EXPECT_TRUE(std::isinf(value) && value < 0);

  EXPECT_TRUE(DecodeValue("+1.5e3", value));
  EXPECT_EQ(value, 1500.0f);

  EXPECT_TRUE(DecodeValue("-2.5E-1", value));
  EXPECT_EQ(value, -0.25f);

  EXPECT_FALSE(DecodeValue("1.0.0", value));
  EXPECT_FALSE(DecodeValue("x", value));

  // nan is written in a form that can be read back
  float nan_out = 0;
  EXPECT_TRUE(DecodeValue(EncodeValue(std::numeric_limits<float>::quiet_NaN()), nan_out));
  EXPECT_TRUE(std::isnan(nan_out));
}

TEST(FieldCodecs, OutOfRangeFloats) {
  float value = 0;
  EXPECT_FALSE(DecodeValue("1e39", value));
  EXPECT_FALSE(DecodeValue("-1e39", value));
  EXPECT_FALSE(DecodeValue("1e-50", value));

  // denormals are representable
  EXPECT_TRUE(DecodeValue("1e-40", value));
  EXPECT_GT(value, 0.0f);
  EXPECT_LT(value, std::numeric_limits<float>::min());

  EXPECT_TRUE(DecodeValue("3.4028235e38", value));
  EXPECT_EQ(value, std::numeric_limits<float>::max());

  double wide = 0;
  EXPECT_FALSE(DecodeValue("1e400", wide));
}

TEST(FieldCodecs, UnknownTypeThrows) {
  using namespace PcdCodec;
  EXPECT_THROW(CreateAsciiEncoder(FieldType::UNKNOWN), SchemaError);
  EXPECT_THROW(CreateAsciiDecoder(FieldType::UNKNOWN), SchemaError);
}
