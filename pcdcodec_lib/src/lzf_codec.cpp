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

#include "pcdcodec/lzf_codec.hpp"

#include <algorithm>
#include <limits>

#include "pcdcodec/errors.hpp"

extern "C" {
#include <lzf.h>
}

namespace PcdCodec {

namespace {
constexpr size_t kMaxLzfSize = std::numeric_limits<unsigned int>::max();
}  // namespace

std::vector<uint8_t> LzfCompress(ConstBufferView input) {
  std::vector<uint8_t> output;
  if (input.empty()) {
    return output;
  }
  if (input.size > kMaxLzfSize) {
    throw PayloadError::CompressTooLarge(input.size);
  }
  // incompressible data grows by about 1 byte every 32; leave some margin
  const size_t capacity = std::min(input.size + input.size / 16 + 64, kMaxLzfSize);
  output.resize(capacity);

  const unsigned int compressed_size = lzf_compress(
      input.data, static_cast<unsigned int>(input.size), output.data(), static_cast<unsigned int>(output.size()));
  if (compressed_size == 0) {
    throw PayloadError::CompressTooLarge(input.size);
  }
  output.resize(compressed_size);
  return output;
}

std::vector<uint8_t> LzfDecompress(ConstBufferView input, size_t expected_size) {
  std::vector<uint8_t> output;
  if (expected_size == 0) {
    if (!input.empty()) {
      throw PayloadError::DecompressSizeMismatch(expected_size, input.size);
    }
    return output;
  }
  if (input.size > kMaxLzfSize || expected_size > kMaxLzfSize) {
    throw PayloadError::DecompressSizeMismatch(expected_size, 0);
  }
  output.resize(expected_size);

  // returns 0 on corrupted data or when the output does not fit
  const unsigned int decompressed_size = lzf_decompress(
      input.data, static_cast<unsigned int>(input.size), output.data(), static_cast<unsigned int>(output.size()));
  if (decompressed_size != expected_size) {
    throw PayloadError::DecompressSizeMismatch(expected_size, decompressed_size);
  }
  return output;
}

}  // namespace PcdCodec
