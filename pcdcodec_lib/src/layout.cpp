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

#include "pcdcodec/layout.hpp"

#include <limits>
#include <set>
#include <string>

#include "pcdcodec/encoding_utils.hpp"
#include "pcdcodec/errors.hpp"

namespace PcdCodec {

FieldType MakeFieldType(char type_code, int size) {
  if (size <= 0) {
    throw SchemaError("field size must be > 0, got " + std::to_string(size));
  }
  switch (type_code) {
    case 'I':
      switch (size) {
        case 1:
          return FieldType::INT8;
        case 2:
          return FieldType::INT16;
        case 4:
          return FieldType::INT32;
      }
      break;
    case 'U':
      switch (size) {
        case 1:
          return FieldType::UINT8;
        case 2:
          return FieldType::UINT16;
        case 4:
          return FieldType::UINT32;
      }
      break;
    case 'F':
      switch (size) {
        case 4:
          return FieldType::FLOAT32;
        case 8:
          return FieldType::FLOAT64;
      }
      break;
    default:
      throw SchemaError(std::string("unknown type code '") + type_code + "'");
  }
  throw SchemaError(std::string("unsupported size ") + std::to_string(size) + " for type code '" + type_code + "'");
}

char TypeCode(FieldType type) {
  switch (type) {
    case FieldType::INT8:
    case FieldType::INT16:
    case FieldType::INT32:
      return 'I';
    case FieldType::UINT8:
    case FieldType::UINT16:
    case FieldType::UINT32:
      return 'U';
    case FieldType::FLOAT32:
    case FieldType::FLOAT64:
      return 'F';
    default:
      throw SchemaError("unknown field type " + std::to_string(static_cast<int>(type)));
  }
}

PointLayout ComputeLayout(const std::vector<PointField>& fields) {
  if (fields.empty()) {
    throw SchemaError("a point must have at least one field");
  }
  PointLayout layout;
  layout.fields.reserve(fields.size());

  std::set<std::string> names;
  uint64_t offset = 0;

  for (const auto& field : fields) {
    if (field.name.empty()) {
      throw SchemaError("empty field name");
    }
    if (SizeOf(field.type) == 0) {
      throw SchemaError("field '" + field.name + "' has an unknown type");
    }
    if (field.count == 0) {
      throw SchemaError("field '" + field.name + "' has count 0");
    }
    if (!field.isPadding() && !names.insert(field.name).second) {
      throw SchemaError("duplicated field name '" + field.name + "'");
    }
    PointField out = field;
    out.offset = static_cast<uint32_t>(offset);
    offset += PointLayout::FieldBytes(field);
    if (offset > std::numeric_limits<uint32_t>::max()) {
      throw SchemaError("point record larger than 4 GB");
    }
    layout.fields.push_back(std::move(out));
  }
  layout.stride = static_cast<uint32_t>(offset);
  return layout;
}

bool CanExposeView(const PointLayout& layout, size_t field_index) {
  if (!kHostIsLittleEndian) {
    return false;
  }
  if (layout.fields.size() != 1 || field_index != 0) {
    return false;
  }
  const auto& field = layout.fields.front();
  return field.count == 1 && layout.stride == static_cast<uint32_t>(SizeOf(field.type));
}

}  // namespace PcdCodec
