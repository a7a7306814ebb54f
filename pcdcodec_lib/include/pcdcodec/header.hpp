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

#include <array>
#include <string>
#include <vector>

#include "pcdcodec/basic_types.hpp"
#include "pcdcodec/encoding_utils.hpp"

namespace PcdCodec {

using Viewpoint = std::array<double, 7>;

// translation (0,0,0) and identity quaternion (w=1)
constexpr Viewpoint kDefaultViewpoint = {0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0};

constexpr const char* kDefaultVersion = "0.7";

struct Metadata {
  std::string version = kDefaultVersion;

  // equal to number of points when (height == 1)
  uint32_t width = 0;

  // clouds that are not organized have height equal to 1
  uint32_t height = 1;

  // number of points stored in the payload. Usually width * height
  uint32_t points = 0;

  // sensor pose: tx ty tz qw qx qy qz
  Viewpoint viewpoint = kDefaultViewpoint;

  // fields in the order they are stored. Offsets are filled
  std::vector<PointField> fields;

  // the size in bytes of a single point in the binary layouts
  uint32_t point_step = 0;

  DataEncoding encoding = DataEncoding::BINARY;

  bool operator==(const Metadata& other) const {
    return version == other.version && width == other.width && height == other.height && points == other.points &&
           viewpoint == other.viewpoint && fields == other.fields && point_step == other.point_step &&
           encoding == other.encoding;
  }
  bool operator!=(const Metadata& other) const {
    return !(*this == other);
  }
};

/// Names of the fields, in order
std::vector<std::string> FieldNames(const Metadata& metadata);

struct HeaderParseResult {
  Metadata metadata;
  // number of bytes of the header; the payload starts right after
  size_t header_length = 0;
};

/**
 * @brief Parse the textual header at the beginning of the buffer.
 *
 * Lines starting with '#' are comments. Parsing stops after the DATA line.
 * Throws HeaderError if a required key is missing, if SIZE/TYPE/COUNT do not have as many
 * entries as FIELDS, if a number can not be parsed or if DATA is unknown.
 * Throws SchemaError if the fields do not describe a valid layout.
 *
 * @param input buffer containing at least the full header.
 */
HeaderParseResult ParseHeader(ConstBufferView input);

/**
 * @brief Serialize the header. The size of the returned string is the offset of the payload.
 *
 * Fields offsets and point_step are recomputed from the fields, not read from the metadata.
 */
std::string SerializeHeader(const Metadata& metadata);

}  // namespace PcdCodec
