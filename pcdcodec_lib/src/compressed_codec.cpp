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

#include <cstring>
#include <limits>

#include "pcdcodec/errors.hpp"
#include "pcdcodec/layout.hpp"
#include "pcdcodec/lzf_codec.hpp"
#include "pcdcodec/parallel.hpp"
#include "pcdcodec/payload_codec.hpp"

namespace PcdCodec {

namespace {
// compressed size + uncompressed size
constexpr size_t kPrefixSize = 2 * sizeof(uint32_t);
}  // namespace

ColumnSet DecodeCompressedPayload(const Metadata& metadata, ConstBufferView payload, const ReadOptions& options) {
  const size_t points = metadata.points;
  const auto& fields = metadata.fields;

  if (payload.size < kPrefixSize) {
    throw PayloadError::Truncated("missing the size prefix of the compressed block", std::nullopt, kPrefixSize,
                                  payload.size);
  }
  uint32_t compressed_size = 0;
  uint32_t uncompressed_size = 0;
  decodeLE(payload, compressed_size);
  decodeLE(payload, uncompressed_size);

  if (payload.size < compressed_size) {
    throw PayloadError::Truncated("compressed block shorter than declared", std::nullopt, compressed_size,
                                  payload.size);
  }
  const size_t expected_size = points * metadata.point_step;
  if (uncompressed_size != expected_size) {
    throw PayloadError::DecompressSizeMismatch(expected_size, uncompressed_size);
  }

  auto buffer = std::make_shared<std::vector<uint8_t>>(
      LzfDecompress(payload.subview(0, compressed_size), uncompressed_size));

  // column-major: each field occupies points x size x count consecutive bytes
  std::vector<size_t> column_offsets(fields.size());
  size_t offset = 0;
  for (size_t i = 0; i < fields.size(); ++i) {
    column_offsets[i] = offset;
    offset += points * PointLayout::FieldBytes(fields[i]);
  }

  if constexpr (!kHostIsLittleEndian) {
    ParallelFor(fields.size(), DecodeThreadsCount(options, points), [&](size_t begin, size_t end) {
      for (size_t i = begin; i < end; ++i) {
        SwapElementsBytes(buffer->data() + column_offsets[i], SizeOf(fields[i].type), points * fields[i].count);
      }
    });
  } else {
    (void)options;
  }

  ColumnSet output;
  output.reserve(fields.size());
  for (size_t i = 0; i < fields.size(); ++i) {
    const auto& field = fields[i];
    if (field.isPadding()) {
      continue;
    }
    output.add(field.name, Column::Borrow(field.type, field.count, points, buffer->data() + column_offsets[i],
                                          buffer, Column::Storage::OWNED));
  }
  return output;
}

void EncodeCompressedPayload(const Metadata& metadata, const ColumnSet& columns, std::vector<uint8_t>& output) {
  const size_t points = metadata.points;
  const auto& fields = metadata.fields;

  std::vector<uint8_t> uncompressed(points * metadata.point_step);
  size_t offset = 0;
  for (size_t i = 0; i < fields.size(); ++i) {
    const size_t column_bytes = points * PointLayout::FieldBytes(fields[i]);
    if (column_bytes > 0) {
      memcpy(uncompressed.data() + offset, columns[i].second.data(), column_bytes);
    }
    if constexpr (!kHostIsLittleEndian) {
      SwapElementsBytes(uncompressed.data() + offset, SizeOf(fields[i].type), points * fields[i].count);
    }
    offset += column_bytes;
  }

  if (uncompressed.size() > std::numeric_limits<uint32_t>::max()) {
    throw PayloadError::CompressTooLarge(uncompressed.size());
  }
  const auto compressed = LzfCompress(uncompressed);

  const size_t start = output.size();
  output.resize(start + kPrefixSize + compressed.size());
  BufferView prefix(output.data() + start, kPrefixSize);
  encodeLE(static_cast<uint32_t>(compressed.size()), prefix);
  encodeLE(static_cast<uint32_t>(uncompressed.size()), prefix);
  if (!compressed.empty()) {
    memcpy(output.data() + start + kPrefixSize, compressed.data(), compressed.size());
  }
}

}  // namespace PcdCodec
