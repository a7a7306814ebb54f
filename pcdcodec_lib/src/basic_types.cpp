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

#include "pcdcodec/basic_types.hpp"

namespace PcdCodec {

const char* ToString(FieldType type) {
  switch (type) {
    case FieldType::INT8:
      return "INT8";
    case FieldType::UINT8:
      return "UINT8";
    case FieldType::INT16:
      return "INT16";
    case FieldType::UINT16:
      return "UINT16";
    case FieldType::INT32:
      return "INT32";
    case FieldType::UINT32:
      return "UINT32";
    case FieldType::FLOAT32:
      return "FLOAT32";
    case FieldType::FLOAT64:
      return "FLOAT64";
    default:
      return "UNKNOWN";
  }
}

const char* ToString(DataEncoding encoding) {
  switch (encoding) {
    case DataEncoding::ASCII:
      return "ascii";
    case DataEncoding::BINARY:
      return "binary";
    case DataEncoding::BINARY_COMPRESSED:
      return "binary_compressed";
  }
  return "unknown";
}

std::optional<DataEncoding> ParseDataEncoding(std::string_view token) {
  if (token == "ascii") {
    return DataEncoding::ASCII;
  }
  if (token == "binary") {
    return DataEncoding::BINARY;
  }
  if (token == "binary_compressed") {
    return DataEncoding::BINARY_COMPRESSED;
  }
  return std::nullopt;
}

}  // namespace PcdCodec
