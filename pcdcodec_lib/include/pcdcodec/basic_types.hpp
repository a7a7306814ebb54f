/*
 * Copyright 2025 Davide Faconti
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PcdCodec {

// Enums 1 to 8 conveniently match sensor_msgs/PointField.msg and pcl::PCLPointField
enum class FieldType : uint8_t {
  UNKNOWN = 0,

  INT8 = 1,
  UINT8 = 2,

  INT16 = 3,
  UINT16 = 4,

  INT32 = 5,
  UINT32 = 6,

  FLOAT32 = 7,
  FLOAT64 = 8,
};

/// Encoding of the payload, as written in the DATA line of the header
enum class DataEncoding : uint8_t {
  ASCII = 0,
  BINARY = 1,
  BINARY_COMPRESSED = 2,
};

// Name used by PCL for fields that only pad the point record
constexpr const char* kPaddingFieldName = "_";

struct PointField {
  // name of the field
  std::string name;

  // offset in bytes with respect to the start of the point record (binary layout)
  uint32_t offset = 0;

  // The data type of each element
  FieldType type = FieldType::UNKNOWN;

  // number of elements per point (small fixed-size vectors, e.g. FPFH histograms)
  uint32_t count = 1;

  bool isPadding() const {
    return name == kPaddingFieldName;
  }

  bool operator==(const PointField& other) const {
    return name == other.name && offset == other.offset && type == other.type && count == other.count;
  }
  bool operator!=(const PointField& other) const {
    return !(*this == other);
  }
};

inline int constexpr SizeOf(const FieldType& type) {
  switch (type) {
    case FieldType::INT8:
    case FieldType::UINT8:
      return sizeof(uint8_t);
    case FieldType::INT16:
    case FieldType::UINT16:
      return sizeof(uint16_t);
    case FieldType::INT32:
    case FieldType::UINT32:
      return sizeof(uint32_t);
    case FieldType::FLOAT32:
      return sizeof(float);
    case FieldType::FLOAT64:
      return sizeof(double);
    default:
      return 0;
  }
}

// Maps a C++ arithmetic type to its FieldType
template <typename T>
constexpr FieldType FieldTypeOf();

template <>
constexpr FieldType FieldTypeOf<int8_t>() {
  return FieldType::INT8;
}
template <>
constexpr FieldType FieldTypeOf<uint8_t>() {
  return FieldType::UINT8;
}
template <>
constexpr FieldType FieldTypeOf<int16_t>() {
  return FieldType::INT16;
}
template <>
constexpr FieldType FieldTypeOf<uint16_t>() {
  return FieldType::UINT16;
}
template <>
constexpr FieldType FieldTypeOf<int32_t>() {
  return FieldType::INT32;
}
template <>
constexpr FieldType FieldTypeOf<uint32_t>() {
  return FieldType::UINT32;
}
template <>
constexpr FieldType FieldTypeOf<float>() {
  return FieldType::FLOAT32;
}
template <>
constexpr FieldType FieldTypeOf<double>() {
  return FieldType::FLOAT64;
}

const char* ToString(FieldType type);

/// Token used in the DATA line: "ascii", "binary" or "binary_compressed"
const char* ToString(DataEncoding encoding);

/// Inverse of ToString(DataEncoding). Returns std::nullopt for unknown tokens.
std::optional<DataEncoding> ParseDataEncoding(std::string_view token);

}  // namespace PcdCodec
