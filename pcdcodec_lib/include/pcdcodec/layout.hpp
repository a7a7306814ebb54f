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

#include <cstddef>
#include <cstdint>
#include <vector>

#include "pcdcodec/basic_types.hpp"

namespace PcdCodec {

/**
 * @brief Resolve the TYPE and SIZE entries of the header into a FieldType.
 *
 * Valid combinations are I/U with size 1, 2 or 4 and F with size 4 or 8.
 * Throws SchemaError otherwise (size 0 included).
 */
FieldType MakeFieldType(char type_code, int size);

/// Inverse of MakeFieldType: 'I', 'U' or 'F'
char TypeCode(FieldType type);

struct PointLayout {
  // same fields, in the same order, with PointField::offset filled
  std::vector<PointField> fields;

  // size in bytes of a point record: sum of (size x count)
  uint32_t stride = 0;

  // bytes used by a field in a single point: size x count
  static uint32_t FieldBytes(const PointField& field) {
    return static_cast<uint32_t>(SizeOf(field.type)) * field.count;
  }
};

/**
 * @brief Compute the offset of each field inside the point record (prefix sum of size x count)
 * and the total stride. Shared by all the payload encodings.
 *
 * Throws SchemaError if the list is empty, a field has an unknown type, a count of 0,
 * an empty name or a name used twice ("_" padding fields excepted).
 */
PointLayout ComputeLayout(const std::vector<PointField>& fields);

/**
 * @brief Zero-copy policy of the binary reader.
 *
 * The column of field `field_index` can be exposed as a view directly over the bytes of a memory-mapped
 * binary payload only if:
 *
 * - the host is little-endian (PCD stores little-endian numbers);
 * - the record contains this field alone, with count == 1 (stride equal to the element size),
 *   so that consecutive elements are contiguous.
 *
 * In every other case the elements are gathered into a freshly allocated column.
 */
bool CanExposeView(const PointLayout& layout, size_t field_index);

}  // namespace PcdCodec
