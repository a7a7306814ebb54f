#include <gtest/gtest.h>

#include <string>

#include "pcdcodec/errors.hpp"
#include "pcdcodec/header.hpp"

namespace {

const char* kHeaderXYZI =
    "# .PCD v0.7 - Point Cloud Data file format\n"
    "VERSION 0.7\n"
    "FIELDS x y z intensity\n"
    "SIZE 4 4 4 1\n"
    "TYPE F F F U\n"
    "COUNT 1 1 1 1\n"
    "WIDTH 10\n"
    "HEIGHT 1\n"
    "VIEWPOINT 0 0 0 1 0 0 0\n"
    "POINTS 10\n"
    "DATA binary\n";

std::string ReplaceLine(std::string text, const std::string& key, const std::string& new_line) {
  const auto start = text.find(key + " ");
  const auto end = text.find('\n', start);
  return text.replace(start, end - start + 1, new_line);
}

}  // namespace

TEST(Header, Parse) {
  using namespace PcdCodec;
  const std::string text = std::string(kHeaderXYZI) + "PAYLOAD";

  const auto result = ParseHeader(text);
  const Metadata& meta = result.metadata;

  EXPECT_EQ(meta.version, "0.7");
  EXPECT_EQ(meta.width, 10u);
  EXPECT_EQ(meta.height, 1u);
  EXPECT_EQ(meta.points, 10u);
  EXPECT_EQ(meta.encoding, DataEncoding::BINARY);
  EXPECT_EQ(meta.viewpoint, kDefaultViewpoint);
  EXPECT_EQ(meta.point_step, 13u);

  ASSERT_EQ(meta.fields.size(), 4u);
  EXPECT_EQ(FieldNames(meta), (std::vector<std::string>{"x", "y", "z", "intensity"}));
  EXPECT_EQ(meta.fields[1].offset, 4u);
  EXPECT_EQ(meta.fields[3].type, FieldType::UINT8);
  EXPECT_EQ(meta.fields[3].offset, 12u);

  // the payload starts right after the DATA line
  EXPECT_EQ(text.substr(result.header_length), "PAYLOAD");
}

TEST(Header, SerializeAndParse) {
  using namespace PcdCodec;

  Metadata meta;
  meta.width = 640;
  meta.height = 480;
  meta.points = 640 * 480;
  meta.viewpoint = {1.5, -2.25, 0.1, 0.7071067811865476, 0.0, 0.7071067811865476, 0.0};
  meta.encoding = DataEncoding::BINARY_COMPRESSED;
  meta.fields.push_back({"x", 0, FieldType::FLOAT32, 1});
  meta.fields.push_back({"y", 4, FieldType::FLOAT32, 1});
  meta.fields.push_back({"z", 8, FieldType::FLOAT32, 1});
  meta.fields.push_back({"ring", 12, FieldType::UINT16, 1});
  meta.fields.push_back({"stamp", 14, FieldType::FLOAT64, 1});
  meta.fields.push_back({"fpfh", 22, FieldType::FLOAT32, 33});
  meta.point_step = 22 + 33 * 4;

  const std::string text = SerializeHeader(meta);
  EXPECT_EQ(text.rfind("# .PCD v0.7", 0), 0u);

  const auto result = ParseHeader(text);
  EXPECT_EQ(result.header_length, text.size());
  EXPECT_EQ(result.metadata, meta);
}

TEST(Header, MissingCountDefaultsToOne) {
  using namespace PcdCodec;
  std::string text = kHeaderXYZI;
  const auto pos = text.find("COUNT");
  text.erase(pos, text.find('\n', pos) - pos + 1);

  const auto meta = ParseHeader(text).metadata;
  ASSERT_EQ(meta.fields.size(), 4u);
  for (const auto& field : meta.fields) {
    EXPECT_EQ(field.count, 1u);
  }
  EXPECT_EQ(meta.point_step, 13u);
}

TEST(Header, WindowsLineEndings) {
  using namespace PcdCodec;
  std::string text;
  for (char c : std::string(kHeaderXYZI)) {
    if (c == '\n') {
      text += '\r';
    }
    text += c;
  }
  const auto result = ParseHeader(text);
  EXPECT_EQ(result.metadata.fields.back().name, "intensity");
  EXPECT_EQ(result.metadata.encoding, DataEncoding::BINARY);
  EXPECT_EQ(result.header_length, text.size());
}

TEST(Header, UnknownKeysAreIgnored) {
  using namespace PcdCodec;
  const std::string text = ReplaceLine(kHeaderXYZI, "HEIGHT", "HEIGHT 1\nSENSOR velodyne\n");
  const auto meta = ParseHeader(text).metadata;
  EXPECT_EQ(meta.points, 10u);
}

TEST(Header, MissingRequiredKey) {
  using namespace PcdCodec;
  for (const std::string key : {"VERSION", "FIELDS", "SIZE", "TYPE", "WIDTH", "HEIGHT", "VIEWPOINT", "POINTS"}) {
    const std::string text = ReplaceLine(kHeaderXYZI, key, "");
    try {
      ParseHeader(text);
      FAIL() << "expected HeaderError for missing " << key;
    } catch (const HeaderError& err) {
      EXPECT_EQ(err.key(), key);
    }
  }

  // no DATA line at all
  const std::string text = ReplaceLine(kHeaderXYZI, "DATA", "");
  try {
    ParseHeader(text);
    FAIL() << "expected HeaderError for missing DATA";
  } catch (const HeaderError& err) {
    EXPECT_EQ(err.key(), "DATA");
  }
}

TEST(Header, InvalidEntries) {
  using namespace PcdCodec;

  EXPECT_THROW(ParseHeader(ReplaceLine(kHeaderXYZI, "SIZE", "SIZE 4 4 4\n")), HeaderError);
  EXPECT_THROW(ParseHeader(ReplaceLine(kHeaderXYZI, "COUNT", "COUNT 1 1 1 1 1\n")), HeaderError);
  EXPECT_THROW(ParseHeader(ReplaceLine(kHeaderXYZI, "VIEWPOINT", "VIEWPOINT 0 0 0 1 0 0\n")), HeaderError);
  EXPECT_THROW(ParseHeader(ReplaceLine(kHeaderXYZI, "WIDTH", "WIDTH ten\n")), HeaderError);
  EXPECT_THROW(ParseHeader(ReplaceLine(kHeaderXYZI, "DATA", "DATA binary_zstd\n")), HeaderError);

  // schema problems
  EXPECT_THROW(ParseHeader(ReplaceLine(kHeaderXYZI, "TYPE", "TYPE F F F X\n")), SchemaError);
  EXPECT_THROW(ParseHeader(ReplaceLine(kHeaderXYZI, "SIZE", "SIZE 4 4 4 3\n")), SchemaError);
  EXPECT_THROW(ParseHeader(ReplaceLine(kHeaderXYZI, "SIZE", "SIZE 4 4 4 0\n")), SchemaError);
  EXPECT_THROW(ParseHeader(ReplaceLine(kHeaderXYZI, "FIELDS", "FIELDS x y x intensity\n")), SchemaError);

  // every error is a PcdError
  EXPECT_THROW(ParseHeader(std::string("")), PcdError);
}

TEST(Header, PointsMismatchKeepsPoints) {
  using namespace PcdCodec;
  const std::string text = ReplaceLine(kHeaderXYZI, "POINTS", "POINTS 7\n");
  const auto meta = ParseHeader(text).metadata;
  EXPECT_EQ(meta.width, 10u);
  EXPECT_EQ(meta.points, 7u);
}

TEST(Header, PaddingFieldsMayRepeat) {
  using namespace PcdCodec;
  const std::string text = ReplaceLine(
      ReplaceLine(ReplaceLine(kHeaderXYZI, "FIELDS", "FIELDS x _ y _\n"), "TYPE", "TYPE F U F U\n"), "SIZE",
      "SIZE 4 1 4 1\n");
  const auto meta = ParseHeader(text).metadata;
  ASSERT_EQ(meta.fields.size(), 4u);
  EXPECT_TRUE(meta.fields[1].isPadding());
  EXPECT_EQ(meta.point_step, 10u);
}
