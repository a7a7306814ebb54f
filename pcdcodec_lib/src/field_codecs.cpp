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

#include <string>

#include "pcdcodec/errors.hpp"
#include "pcdcodec/field_decoder.hpp"
#include "pcdcodec/field_encoder.hpp"

namespace PcdCodec {

std::unique_ptr<FieldEncoder> CreateAsciiEncoder(FieldType type) {
  switch (type) {
    case FieldType::INT8:
      return std::make_unique<FieldEncoderAscii<int8_t>>();
    case FieldType::UINT8:
      return std::make_unique<FieldEncoderAscii<uint8_t>>();
    case FieldType::INT16:
      return std::make_unique<FieldEncoderAscii<int16_t>>();
    case FieldType::UINT16:
      return std::make_unique<FieldEncoderAscii<uint16_t>>();
    case FieldType::INT32:
      return std::make_unique<FieldEncoderAscii<int32_t>>();
    case FieldType::UINT32:
      return std::make_unique<FieldEncoderAscii<uint32_t>>();
    case FieldType::FLOAT32:
      return std::make_unique<FieldEncoderAscii<float>>();
    case FieldType::FLOAT64:
      return std::make_unique<FieldEncoderAscii<double>>();
    default:
      throw SchemaError("Unsupported field type:" + std::to_string(static_cast<int>(type)));
  }
}

std::unique_ptr<FieldDecoder> CreateAsciiDecoder(FieldType type) {
  switch (type) {
    case FieldType::INT8:
      return std::make_unique<FieldDecoderAscii<int8_t>>();
    case FieldType::UINT8:
      return std::make_unique<FieldDecoderAscii<uint8_t>>();
    case FieldType::INT16:
      return std::make_unique<FieldDecoderAscii<int16_t>>();
    case FieldType::UINT16:
      return std::make_unique<FieldDecoderAscii<uint16_t>>();
    case FieldType::INT32:
      return std::make_unique<FieldDecoderAscii<int32_t>>();
    case FieldType::UINT32:
      return std::make_unique<FieldDecoderAscii<uint32_t>>();
    case FieldType::FLOAT32:
      return std::make_unique<FieldDecoderAscii<float>>();
    case FieldType::FLOAT64:
      return std::make_unique<FieldDecoderAscii<double>>();
    default:
      throw SchemaError("Unsupported field type:" + std::to_string(static_cast<int>(type)));
  }
}

}  // namespace PcdCodec
