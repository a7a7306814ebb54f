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

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "pcdcodec/basic_types.hpp"

namespace PcdCodec {

// Non-owning view over a contiguous range of bytes
template <typename ByteType>
struct BufferViewT {
  ByteType* data = nullptr;
  size_t size = 0;

  BufferViewT() = default;

  BufferViewT(ByteType* ptr, size_t len) : data(ptr), size(len) {}

  template <typename T>
  BufferViewT(T* ptr, size_t len) : data(reinterpret_cast<ByteType*>(ptr)), size(len) {}

  template <typename T, typename Alloc>
  BufferViewT(std::vector<T, Alloc>& vect) : BufferViewT(vect.data(), vect.size() * sizeof(T)) {}

  template <typename T, typename Alloc>
  BufferViewT(const std::vector<T, Alloc>& vect) : BufferViewT(vect.data(), vect.size() * sizeof(T)) {}

  BufferViewT(std::string_view str) : BufferViewT(str.data(), str.size()) {}

  BufferViewT(const std::string& str) : BufferViewT(str.data(), str.size()) {}

  bool empty() const {
    return size == 0;
  }

  void advance(size_t len) {
    if (len > size) {
      throw std::out_of_range("BufferView: advance beyond the end of the buffer");
    }
    data += len;
    size -= len;
  }

  BufferViewT subview(size_t offset, size_t len) const {
    if (offset > size || len > size - offset) {
      throw std::out_of_range("BufferView: subview out of range");
    }
    return BufferViewT(data + offset, len);
  }

  std::string_view asStringView() const {
    return std::string_view(reinterpret_cast<const char*>(data), size);
  }
};

using ConstBufferView = BufferViewT<const uint8_t>;
using BufferView = BufferViewT<uint8_t>;

constexpr bool kHostIsLittleEndian = (std::endian::native == std::endian::little);

// Reverse, in place, the bytes of each element of size `element_size`
inline void SwapElementsBytes(uint8_t* data, size_t element_size, size_t elements_count) {
  if (element_size <= 1) {
    return;
  }
  for (size_t i = 0; i < elements_count; ++i) {
    std::reverse(data + i * element_size, data + (i + 1) * element_size);
  }
}

// PCD stores numbers as little-endian: writes a scalar in that order
template <typename T>
inline void encodeLE(const T& val, BufferView& buff) {
  memcpy(buff.data, &val, sizeof(T));
  if constexpr (!kHostIsLittleEndian) {
    SwapElementsBytes(buff.data, sizeof(T), 1);
  }
  buff.advance(sizeof(T));
}

template <typename T>
inline void decodeLE(ConstBufferView& buff, T& val) {
  if (buff.size < sizeof(T)) {
    throw std::out_of_range("decodeLE: buffer too small");
  }
  memcpy(&val, buff.data, sizeof(T));
  if constexpr (!kHostIsLittleEndian) {
    SwapElementsBytes(reinterpret_cast<uint8_t*>(&val), sizeof(T), 1);
  }
  buff.advance(sizeof(T));
}

inline bool IsBlank(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

// Split a line on white spaces. The output vector is cleared and reused to avoid allocations.
inline void SplitTokens(std::string_view line, std::vector<std::string_view>& tokens) {
  tokens.clear();
  size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && IsBlank(line[pos])) {
      pos++;
    }
    const size_t start = pos;
    while (pos < line.size() && !IsBlank(line[pos])) {
      pos++;
    }
    if (pos > start) {
      tokens.push_back(line.substr(start, pos - start));
    }
  }
}

// Copies a scalar from possibly unaligned memory
template <typename T>
inline T LoadUnaligned(const uint8_t* ptr) {
  T value;
  memcpy(&value, ptr, sizeof(T));
  return value;
}

}  // namespace PcdCodec
