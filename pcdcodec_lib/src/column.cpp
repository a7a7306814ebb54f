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

#include "pcdcodec/column.hpp"

namespace PcdCodec {

Column::Column(FieldType type, uint32_t count, size_t points) : type_(type), count_(count), points_(points) {
  auto buffer = std::make_shared<std::vector<uint8_t>>(byteSize(), 0);
  data_ = buffer->data();
  owner_ = std::move(buffer);
}

Column Column::Borrow(
    FieldType type, uint32_t count, size_t points, const uint8_t* data, std::shared_ptr<const void> owner,
    Storage storage) {
  Column column;
  column.type_ = type;
  column.count_ = count;
  column.points_ = points;
  column.storage_ = storage;
  column.data_ = data;
  column.owner_ = std::move(owner);
  return column;
}

uint8_t* Column::mutableData() {
  if (storage_ == Storage::MAPPED) {
    throw std::logic_error("Column: a view over a file mapping is read-only");
  }
  // OWNED memory was allocated by this library as non-const
  return const_cast<uint8_t*>(data_);
}

bool Column::sameValues(const Column& other) const {
  if (type_ != other.type_ || count_ != other.count_ || points_ != other.points_) {
    return false;
  }
  return byteSize() == 0 || memcmp(data_, other.data_, byteSize()) == 0;
}

//------------------------------------------------------------------------------------------

void ColumnSet::add(std::string name, Column column) {
  columns_.emplace_back(std::move(name), std::move(column));
}

const Column* ColumnSet::find(const std::string& name) const {
  for (const auto& [column_name, column] : columns_) {
    if (column_name == name) {
      return &column;
    }
  }
  return nullptr;
}

const Column& ColumnSet::at(const std::string& name) const {
  const Column* column = find(name);
  if (!column) {
    throw std::out_of_range("ColumnSet: no column named '" + name + "'");
  }
  return *column;
}

std::vector<std::string> ColumnSet::names() const {
  std::vector<std::string> out;
  out.reserve(columns_.size());
  for (const auto& entry : columns_) {
    out.push_back(entry.first);
  }
  return out;
}

}  // namespace PcdCodec
