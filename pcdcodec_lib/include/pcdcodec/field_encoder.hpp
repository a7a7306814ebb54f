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

#include <charconv>
#include <memory>
#include <string>
#include <type_traits>

#include "pcdcodec/encoding_utils.hpp"

namespace PcdCodec {

/**
 * @brief Append the decimal representation of a number.
 *
 * Floating point numbers use the shortest representation that parses back to the very same
 * value (std::to_chars without precision), so ASCII round-trips are exact for both float and double.
 */
template <typename T>
inline void AppendNumber(std::string& output, T value) {
  static_assert(std::is_arithmetic_v<T>, "AppendNumber requires an arithmetic type");
  char buffer[64];
  const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
  output.append(buffer, result.ptr);
}

class FieldEncoder {
 public:
  FieldEncoder() = default;

  virtual ~FieldEncoder() = default;

  /**
   * @brief Append to the output the ASCII token of a single element.
   *
   * @param element_ptr pointer to the element in memory (may be unaligned).
   * @param output string where the token is appended.
   */
  virtual void encode(const uint8_t* element_ptr, std::string& output) const = 0;

  /// size in bytes of an element
  virtual size_t elementSize() const = 0;
};

//------------------------------------------------------------------------------------------
template <typename NumberType>
class FieldEncoderAscii : public FieldEncoder {
 public:
  FieldEncoderAscii() {
    static_assert(std::is_arithmetic<NumberType>::value, "FieldEncoderAscii requires an arithmetic type");
  }

  void encode(const uint8_t* element_ptr, std::string& output) const override {
    AppendNumber(output, LoadUnaligned<NumberType>(element_ptr));
  }

  size_t elementSize() const override {
    return sizeof(NumberType);
  }
};

/// Create the ASCII encoder of a given type. Throws SchemaError for FieldType::UNKNOWN
std::unique_ptr<FieldEncoder> CreateAsciiEncoder(FieldType type);

}  // namespace PcdCodec
