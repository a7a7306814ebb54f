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
#include <memory>
#include <string>
#include <utility>

#include "pcdcodec/encoding_utils.hpp"

namespace PcdCodec {

/**
 * @brief Read-only memory mapping of a whole file.
 *
 * Always handled through a std::shared_ptr: columns that are views over the mapping hold a copy
 * of it, so the file stays mapped until the last of them is destroyed.
 */
class MappedFile {
 public:
  /// Throws IoError if the file can not be opened, inspected or mapped
  static std::shared_ptr<const MappedFile> Open(const std::string& path);

  ~MappedFile();

  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;

  const uint8_t* data() const {
    return data_;
  }

  size_t size() const {
    return size_;
  }

  ConstBufferView view() const {
    return {data_, size_};
  }

  const std::string& path() const {
    return path_;
  }

  /// true if [ptr, ptr + len) lies inside the mapping
  bool contains(const void* ptr, size_t len = 1) const;

 private:
  explicit MappedFile(std::string path) : path_(std::move(path)) {}

  std::string path_;
  const uint8_t* data_ = nullptr;
  size_t size_ = 0;
  int fd_ = -1;
};

}  // namespace PcdCodec
