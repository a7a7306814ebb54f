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
#include <cmath>
#include <limits>
#include <memory>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "pcdcodec/encoding_utils.hpp"

namespace PcdCodec {

/**
 * @brief Parse a whole token as a number of type T.
 *
 * Accepts an optional leading '+'. Floating point values also accept exponents, "nan" and "inf".
 * Returns false if the token is not entirely consumed or the value does not fit in T.
 */
template <typename T>
inline bool ParseNumber(std::string_view token, T& value) {
  static_assert(std::is_arithmetic_v<T>, "ParseNumber requires an arithmetic type");
  if (!token.empty() && token.front() == '+') {
    token.remove_prefix(1);
  }
  if (token.empty()) {
    return false;
  }
  const char* first = token.data();
  const char* last = token.data() + token.size();

  if constexpr (std::is_floating_point_v<T>) {
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range && std::is_same_v<T, float>) {
      // some standard libraries report float denormals as out of range: retry in double and
      // accept the value only if it is representable as a float
      double wide = 0;
      auto [wptr, wec] = std::from_chars(first, last, wide);
      if (wec != std::errc() || wptr != last) {
        return false;
      }
      if (std::fabs(wide) > static_cast<double>(std::numeric_limits<float>::max())) {
        return false;
      }
      value = static_cast<T>(wide);
      return !(value == 0 && wide != 0);
    }
    return ec == std::errc() && ptr == last;
  } else {
    auto [ptr, ec] = std::from_chars(first, last, value);
    return ec == std::errc() && ptr == last;
  }
}

class FieldDecoder {
 public:
  FieldDecoder() = default;

  virtual ~FieldDecoder() = default;

  /**
   * @brief Parse a single ASCII token and store the element at the destination.
   *
   * @param token the token, without surrounding white spaces.
   * @param element_ptr where the element is written (may be unaligned).
   * @return false if the token is not a valid number of this type.
   */
  virtual bool decode(std::string_view token, uint8_t* element_ptr) const = 0;

  /// size in bytes of an element
  virtual size_t elementSize() const = 0;
};

//------------------------------------------------------------------------------------------
template <typename NumberType>
class FieldDecoderAscii : public FieldDecoder {
 public:
  FieldDecoderAscii() {
    static_assert(std::is_arithmetic<NumberType>::value, "FieldDecoderAscii requires an arithmetic type");
  }

  bool decode(std::string_view token, uint8_t* element_ptr) const override {
    NumberType value{};
    if (!ParseNumber(token, value)) {
      return false;
    }
    memcpy(element_ptr, &value, sizeof(NumberType));
    return true;
  }

  size_t elementSize() const override {
    return sizeof(NumberType);
  }
};

/// Create the ASCII decoder of a given type. Throws SchemaError for FieldType::UNKNOWN
std::unique_ptr<FieldDecoder> CreateAsciiDecoder(FieldType type);

}  // namespace PcdCodec
