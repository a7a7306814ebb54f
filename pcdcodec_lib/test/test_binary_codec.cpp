#include <gtest/gtest.h>

#include "pcdcodec/errors.hpp"
#include "pcdcodec/payload_codec.hpp"
#include "test_utils.hpp"

using PcdCodec::tests::MakeTestMetadata;
using PcdCodec::tests::MakeXYZIdColumns;
using PcdCodec::tests::XYZIdFields;

TEST(BinaryCodec, RecordLayout) {
  using namespace PcdCodec;
  const size_t kPoints = 5;
  const auto meta = MakeTestMetadata(XYZIdFields(), kPoints, DataEncoding::BINARY);
  const auto columns = MakeXYZIdColumns(kPoints);

  std::vector<uint8_t> payload;
  EncodeBinaryPayload(meta, columns, payload);
  ASSERT_EQ(meta.point_step, 16u);
  ASSERT_EQ(payload.size(), kPoints * meta.point_step);

  // row-major records, fields at their offset, little-endian
  for (size_t i = 0; i < kPoints; ++i) {
    ConstBufferView record(payload.data() + i * meta.point_step, meta.point_step);
    float x, y, z;
    uint32_t id;
    decodeLE(record, x);
    decodeLE(record, y);
    decodeLE(record, z);
    decodeLE(record, id);
    EXPECT_EQ(x, columns.at("x").at<float>(i));
    EXPECT_EQ(y, columns.at("y").at<float>(i));
    EXPECT_EQ(z, columns.at("z").at<float>(i));
    EXPECT_EQ(id, columns.at("id").at<uint32_t>(i));
  }

  const auto decoded = DecodeBinaryPayload(meta, payload, ReadOptions{});
  PcdCodec::tests::ExpectSameColumns(columns, decoded);
}

TEST(BinaryCodec, TruncatedPayload) {
  using namespace PcdCodec;
  const size_t kPoints = 100;
  const auto meta = MakeTestMetadata(XYZIdFields(), kPoints, DataEncoding::BINARY);

  std::vector<uint8_t> payload;
  EncodeBinaryPayload(meta, MakeXYZIdColumns(kPoints), payload);
  payload.pop_back();

  try {
    DecodeBinaryPayload(meta, payload, ReadOptions{});
    FAIL() << "expected PayloadError";
  } catch (const PayloadError& err) {
    EXPECT_EQ(err.kind(), PayloadError::Kind::TRUNCATED);
    EXPECT_EQ(err.expected(), kPoints * 16);
    EXPECT_EQ(err.actual(), kPoints * 16 - 1);
  }
}

TEST(BinaryCodec, TrailingBytesAreIgnored) {
  using namespace PcdCodec;
  const auto meta = MakeTestMetadata(XYZIdFields(), 10, DataEncoding::BINARY);
  const auto columns = MakeXYZIdColumns(10);

  std::vector<uint8_t> payload;
  EncodeBinaryPayload(meta, columns, payload);
  payload.push_back('\n');
  payload.push_back('\n');

  PcdCodec::tests::ExpectSameColumns(columns, DecodeBinaryPayload(meta, payload, ReadOptions{}));
}

TEST(BinaryCodec, BufferSourceIsAlwaysCopied) {
  using namespace PcdCodec;
  const auto meta = MakeTestMetadata({{"intensity", 0, FieldType::FLOAT32, 1}}, 4, DataEncoding::BINARY);

  ColumnSet columns;
  columns.add("intensity", std::vector<float>{1, 2, 3, 4});
  std::vector<uint8_t> payload;
  EncodeBinaryPayload(meta, columns, payload);

  const auto decoded = DecodeBinaryPayload(meta, payload, ReadOptions{});
  const Column& intensity = decoded.at("intensity");
  EXPECT_FALSE(intensity.isView());
  EXPECT_NE(intensity.data(), payload.data());
  EXPECT_EQ(intensity.toVector<float>(), (std::vector<float>{1, 2, 3, 4}));
}

TEST(BinaryCodec, PaddingAndVectorFields) {
  using namespace PcdCodec;
  std::vector<PointField> fields = {{"rgb", 0, FieldType::UINT8, 3},
                                    {"_", 0, FieldType::UINT8, 1},
                                    {"stamp", 0, FieldType::FLOAT64, 1},
                                    {"label", 0, FieldType::INT16, 1}};
  const auto meta = MakeTestMetadata(fields, 3, DataEncoding::BINARY);
  ASSERT_EQ(meta.point_step, 3u + 1u + 8u + 2u);

  ColumnSet columns;
  columns.add("rgb", std::vector<uint8_t>{255, 0, 0, 0, 255, 0, 0, 0, 255}, 3);
  columns.add("_", std::vector<uint8_t>{0, 0, 0});
  columns.add("stamp", std::vector<double>{1700000000.123456, 1700000000.5, -1.0});
  columns.add("label", std::vector<int16_t>{-1, 0, 32767});

  std::vector<uint8_t> payload;
  EncodeBinaryPayload(meta, columns, payload);
  ASSERT_EQ(payload.size(), 3u * meta.point_step);

  const auto decoded = DecodeBinaryPayload(meta, payload, ReadOptions{});
  ASSERT_EQ(decoded.names(), (std::vector<std::string>{"rgb", "stamp", "label"}));
  EXPECT_TRUE(decoded.at("rgb").sameValues(columns.at("rgb")));
  EXPECT_TRUE(decoded.at("stamp").sameValues(columns.at("stamp")));
  EXPECT_TRUE(decoded.at("label").sameValues(columns.at("label")));
}

TEST(BinaryCodec, ParallelDecodeMatchesSequential) {
  using namespace PcdCodec;
  const size_t kPoints = 50000;
  const auto meta = MakeTestMetadata(XYZIdFields(), kPoints, DataEncoding::BINARY);
  const auto columns = MakeXYZIdColumns(kPoints);

  std::vector<uint8_t> payload;
  EncodeBinaryPayload(meta, columns, payload);

  ReadOptions sequential;
  sequential.num_threads = 1;
  ReadOptions parallel;
  parallel.num_threads = 3;
  parallel.min_points_per_thread = 1;

  PcdCodec::tests::ExpectSameColumns(
      DecodeBinaryPayload(meta, payload, sequential), DecodeBinaryPayload(meta, payload, parallel));
}

TEST(BinaryCodec, EmptyCloud) {
  using namespace PcdCodec;
  const auto meta = MakeTestMetadata(XYZIdFields(), 0, DataEncoding::BINARY);
  std::vector<uint8_t> payload;
  EncodeBinaryPayload(meta, MakeXYZIdColumns(0), payload);
  EXPECT_TRUE(payload.empty());

  const auto decoded = DecodeBinaryPayload(meta, payload, ReadOptions{});
  ASSERT_EQ(decoded.size(), 4u);
  EXPECT_EQ(decoded.at("x").points(), 0u);
}
