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

#include <memory>
#include <string>

#include "pcdcodec/column.hpp"
#include "pcdcodec/encoding_utils.hpp"
#include "pcdcodec/header.hpp"
#include "pcdcodec/mapped_file.hpp"
#include "pcdcodec/options.hpp"

namespace PcdCodec {

struct PointCloudData {
  Metadata metadata;
  ColumnSet columns;
};

/**
 * @brief A PCD file mapped in memory, whose header was already parsed.
 *
 * Use it when the metadata is needed before deciding how (or whether) to decode the payload.
 * Columns returned by read() may be views over the mapping; they keep it alive even after the
 * MappedPcd is destroyed.
 */
class MappedPcd {
 public:
  /// Throws IoError if the file can't be mapped, HeaderError / SchemaError if the header is invalid
  static MappedPcd Open(const std::string& path);

  const Metadata& metadata() const {
    return metadata_;
  }

  const std::shared_ptr<const MappedFile>& mapping() const {
    return mapping_;
  }

  // bytes after the DATA line
  ConstBufferView payload() const;

  PointCloudData read(const ReadOptions& options = {}) const;

 private:
  MappedPcd(std::shared_ptr<const MappedFile> mapping, HeaderParseResult header);

  std::shared_ptr<const MappedFile> mapping_;
  Metadata metadata_;
  size_t header_length_ = 0;
};

/// Map and decode a whole file. See MappedPcd
PointCloudData ReadPcd(const std::string& path, const ReadOptions& options = {});

/// Decode a PCD held in memory. Columns never reference `buffer`: it can be released afterward.
PointCloudData ReadPcdFromBuffer(ConstBufferView buffer, const ReadOptions& options = {});

}  // namespace PcdCodec
