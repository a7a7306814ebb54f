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

#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "pcdcodec/basic_types.hpp"
#include "pcdcodec/encoding_utils.hpp"

namespace PcdCodec {

/**
 * @brief Homogeneous typed array with the values of one field for all the points.
 *
 * A field with count > 1 stores `count` consecutive elements per point, so the column has
 * points() * count() elements.
 *
 * The memory is either OWNED (a heap buffer, possibly shared with other columns decoded from the
 * same decompressed buffer) or MAPPED (a view over a read-only file mapping). In both cases the
 * column holds a reference to the object owning the bytes, therefore it never dangles.
 * Copies of a Column share the same memory.
 */
class Column {
 public:
  enum class Storage : uint8_t { OWNED, MAPPED };

  Column() = default;

  /// Allocate a zero-filled column
  Column(FieldType type, uint32_t count, size_t points);

  /**
   * @brief Column over existing memory, kept alive by `owner`.
   *
   * @param data first byte of the column; must hold points * count elements.
   * @param owner object that owns the memory (a mapping or a shared buffer).
   */
  static Column Borrow(
      FieldType type, uint32_t count, size_t points, const uint8_t* data, std::shared_ptr<const void> owner,
      Storage storage);

  /// Create an owned column copying a vector of values. values.size() must be a multiple of count
  template <typename T>
  static Column FromVector(const std::vector<T>& values, uint32_t count = 1);

  FieldType type() const {
    return type_;
  }

  uint32_t count() const {
    return count_;
  }

  size_t points() const {
    return points_;
  }

  // total number of elements: points * count
  size_t elements() const {
    return points_ * count_;
  }

  size_t elementSize() const {
    return static_cast<size_t>(SizeOf(type_));
  }

  size_t byteSize() const {
    return elements() * elementSize();
  }

  Storage storage() const {
    return storage_;
  }

  // true when the values are read directly from the file mapping
  bool isView() const {
    return storage_ == Storage::MAPPED;
  }

  const uint8_t* data() const {
    return data_;
  }

  ConstBufferView bytes() const {
    return {data_, byteSize()};
  }

  /// Writable access. Throws std::logic_error on MAPPED columns
  uint8_t* mutableData();

  /// Element `index` (in [0, elements())). Safe also for unaligned memory
  template <typename T>
  T at(size_t index) const {
    checkType<T>();
    if (index >= elements()) {
      throw std::out_of_range("Column::at: index out of range");
    }
    return LoadUnaligned<T>(data_ + index * sizeof(T));
  }

  /**
   * @brief Typed pointer to the elements.
   * Throws std::invalid_argument if T does not match the type of the column or if the memory is not
   * aligned for T (it may happen with views over a mapping; use at() or toVector() in that case).
   */
  template <typename T>
  const T* typedData() const {
    checkType<T>();
    if (reinterpret_cast<uintptr_t>(data_) % alignof(T) != 0) {
      throw std::invalid_argument("Column::typedData: memory not aligned for the requested type");
    }
    return reinterpret_cast<const T*>(data_);
  }

  /// Copy the elements into a vector
  template <typename T>
  std::vector<T> toVector() const {
    checkType<T>();
    std::vector<T> out(elements());
    if (!out.empty()) {
      memcpy(out.data(), data_, byteSize());
    }
    return out;
  }

  /// Same type, count and values (storage is not compared)
  bool sameValues(const Column& other) const;

 private:
  template <typename T>
  void checkType() const {
    if (FieldTypeOf<T>() != type_) {
      throw std::invalid_argument(std::string("Column: requested ") + ToString(FieldTypeOf<T>()) +
                                  " but the column contains " + ToString(type_));
    }
  }

  FieldType type_ = FieldType::UNKNOWN;
  uint32_t count_ = 1;
  size_t points_ = 0;
  Storage storage_ = Storage::OWNED;
  const uint8_t* data_ = nullptr;
  std::shared_ptr<const void> owner_;
};

/**
 * @brief Ordered map name -> Column. The order of insertion is the order of the fields in the file.
 */
class ColumnSet {
 public:
  using Entry = std::pair<std::string, Column>;

  ColumnSet() = default;

  /// Append a column. Names are not checked here; the writer validates them.
  void add(std::string name, Column column);

  template <typename T>
  void add(std::string name, const std::vector<T>& values, uint32_t count = 1) {
    add(std::move(name), Column::FromVector(values, count));
  }

  /// nullptr if not found
  const Column* find(const std::string& name) const;

  /// Throws std::out_of_range if not found
  const Column& at(const std::string& name) const;

  bool contains(const std::string& name) const {
    return find(name) != nullptr;
  }

  std::vector<std::string> names() const;

  size_t size() const {
    return columns_.size();
  }

  bool empty() const {
    return columns_.empty();
  }

  const Entry& operator[](size_t index) const {
    return columns_[index];
  }

  auto begin() const {
    return columns_.begin();
  }
  auto end() const {
    return columns_.end();
  }

  void reserve(size_t count) {
    columns_.reserve(count);
  }

 private:
  std::vector<Entry> columns_;
};

//------------------------------------------------------------------------------------------
template <typename T>
inline Column Column::FromVector(const std::vector<T>& values, uint32_t count) {
  if (count == 0 || values.size() % count != 0) {
    throw std::invalid_argument("Column::FromVector: size is not a multiple of count");
  }
  Column column(FieldTypeOf<T>(), count, values.size() / count);
  if (!values.empty()) {
    memcpy(column.mutableData(), values.data(), values.size() * sizeof(T));
  }
  return column;
}

}  // namespace PcdCodec
