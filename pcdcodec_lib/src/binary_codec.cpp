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

#include "pcdcodec/errors.hpp"
#include "pcdcodec/layout.hpp"
#include "pcdcodec/parallel.hpp"
#include "pcdcodec/payload_codec.hpp"

namespace PcdCodec {

namespace {

PointLayout LayoutOf(const Metadata& metadata) {
  PointLayout layout;
  layout.fields = metadata.fields;
  layout.stride = metadata.point_step;
  return layout;
}

// Copy the strided bytes of a field into a contiguous destination
void GatherField(const uint8_t* records, uint32_t stride, const PointField& field, size_t points, uint8_t* dst) {
  if (points == 0) {
    return;
  }
  const size_t field_bytes = PointLayout::FieldBytes(field);
  if (field_bytes == stride) {
    memcpy(dst, records, points * field_bytes);
  } else {
    const uint8_t* src = records + field.offset;
    uint8_t* out = dst;
    for (size_t row = 0; row < points; ++row) {
      memcpy(out, src, field_bytes);
      out += field_bytes;
      src += stride;
    }
  }
  if constexpr (!kHostIsLittleEndian) {
    SwapElementsBytes(dst, SizeOf(field.type), points * field.count);
  }
}

}  // namespace

ColumnSet DecodeBinaryPayload(
    const Metadata& metadata, ConstBufferView payload, const ReadOptions& options,
    const std::shared_ptr<const MappedFile>& mapping) {
  const size_t points = metadata.points;
  const uint32_t stride = metadata.point_step;
  const auto& fields = metadata.fields;

  const size_t expected_size = points * stride;
  if (payload.size < expected_size) {
    throw PayloadError::Truncated("binary payload shorter than POINTS x point size", std::nullopt, expected_size,
                                  payload.size);
  }

  const auto layout = LayoutOf(metadata);
  std::vector<Column> columns(fields.size());
  std::vector<size_t> to_copy;

  for (size_t i = 0; i < fields.size(); ++i) {
    const auto& field = fields[i];
    if (field.isPadding()) {
      continue;
    }
    const uint8_t* field_start = payload.data + field.offset;
    const size_t field_bytes = points * PointLayout::FieldBytes(field);
    const bool as_view = options.allow_zero_copy && mapping && CanExposeView(layout, i) &&
                         mapping->contains(field_start, field_bytes);
    if (as_view) {
      columns[i] = Column::Borrow(field.type, field.count, points, field_start, mapping, Column::Storage::MAPPED);
    } else {
      columns[i] = Column(field.type, field.count, points);
      to_copy.push_back(i);
    }
  }

  const size_t threads = DecodeThreadsCount(options, points);
  ParallelFor(to_copy.size(), threads, [&](size_t begin, size_t end) {
    for (size_t k = begin; k < end; ++k) {
      const size_t i = to_copy[k];
      GatherField(payload.data, stride, fields[i], points, columns[i].mutableData());
    }
  });

  ColumnSet output;
  output.reserve(fields.size());
  for (size_t i = 0; i < fields.size(); ++i) {
    if (!fields[i].isPadding()) {
      output.add(fields[i].name, std::move(columns[i]));
    }
  }
  return output;
}

void EncodeBinaryPayload(const Metadata& metadata, const ColumnSet& columns, std::vector<uint8_t>& output) {
  const size_t points = metadata.points;
  const uint32_t stride = metadata.point_step;
  const auto& fields = metadata.fields;

  const size_t start = output.size();
  output.resize(start + points * stride);
  uint8_t* records = output.data() + start;

  for (size_t i = 0; i < fields.size(); ++i) {
    const auto& field = fields[i];
    const size_t field_bytes = PointLayout::FieldBytes(field);
    const uint8_t* src = columns[i].second.data();

    if (field_bytes == stride) {
      // single field: the record is the column itself
      if (points > 0) {
        memcpy(records, src, points * field_bytes);
      }
    } else {
      uint8_t* dst = records + field.offset;
      for (size_t row = 0; row < points; ++row) {
        memcpy(dst, src, field_bytes);
        src += field_bytes;
        dst += stride;
      }
    }
  }

  if constexpr (!kHostIsLittleEndian) {
    for (size_t row = 0; row < points; ++row) {
      for (const auto& field : fields) {
        SwapElementsBytes(records + row * stride + field.offset, SizeOf(field.type), field.count);
      }
    }
  }
}

}  // namespace PcdCodec
