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

#include "pcdcodec/pcd_writer.hpp"

#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <set>
#include <system_error>

#include "pcdcodec/errors.hpp"
#include "pcdcodec/layout.hpp"
#include "pcdcodec/payload_codec.hpp"

namespace PcdCodec {

namespace {

bool HasWhiteSpace(const std::string& name) {
  return std::any_of(name.begin(), name.end(), [](char c) { return IsBlank(c) || c == '\n'; });
}

void ValidateColumns(const ColumnSet& columns) {
  if (columns.empty()) {
    throw ValidationError("no columns to write");
  }
  const size_t points = columns[0].second.points();
  std::set<std::string> names;

  for (const auto& [name, column] : columns) {
    if (name.empty()) {
      throw ValidationError("empty column name");
    }
    if (HasWhiteSpace(name)) {
      throw ValidationError("column name '" + name + "' contains white spaces");
    }
    if (name != kPaddingFieldName && !names.insert(name).second) {
      throw ValidationError("duplicated column name '" + name + "'");
    }
    if (column.type() == FieldType::UNKNOWN) {
      throw ValidationError("column '" + name + "' has an unknown type");
    }
    if (column.count() == 0) {
      throw ValidationError("column '" + name + "' has count 0");
    }
    if (column.points() != points) {
      throw ValidationError("column '" + name + "' has " + std::to_string(column.points()) + " points, expected " +
                            std::to_string(points));
    }
  }
  if (points > std::numeric_limits<uint32_t>::max()) {
    throw ValidationError("too many points: " + std::to_string(points));
  }
}

}  // namespace

DataEncoding DataEncodingFromString(std::string_view name) {
  const auto encoding = ParseDataEncoding(name);
  if (!encoding) {
    throw ValidationError("unknown data encoding '" + std::string(name) + "'");
  }
  return *encoding;
}

Metadata MakeMetadata(const ColumnSet& columns, const WriteOptions& options) {
  ValidateColumns(columns);

  // VERSION is a single header token
  if (options.version.empty() || HasWhiteSpace(options.version)) {
    throw ValidationError("invalid version '" + options.version + "'");
  }

  Metadata meta;
  meta.version = options.version;
  meta.encoding = options.encoding;
  meta.points = static_cast<uint32_t>(columns[0].second.points());

  if (options.viewpoint) {
    const auto& values = *options.viewpoint;
    if (values.size() != meta.viewpoint.size()) {
      throw ValidationError("viewpoint must have 7 values, got " + std::to_string(values.size()));
    }
    std::copy(values.begin(), values.end(), meta.viewpoint.begin());
  }

  meta.height = options.height.value_or(1);
  if (meta.height == 0 || meta.points % meta.height != 0) {
    throw ValidationError("height " + std::to_string(meta.height) + " does not divide the number of points (" +
                          std::to_string(meta.points) + ")");
  }
  meta.width = meta.points / meta.height;

  std::vector<PointField> fields;
  fields.reserve(columns.size());
  for (const auto& [name, column] : columns) {
    PointField field;
    field.name = name;
    field.type = column.type();
    field.count = column.count();
    fields.push_back(std::move(field));
  }
  auto layout = ComputeLayout(fields);
  meta.fields = std::move(layout.fields);
  meta.point_step = layout.stride;
  return meta;
}

std::vector<uint8_t> WritePcdToBuffer(const ColumnSet& columns, const WriteOptions& options) {
  const Metadata meta = MakeMetadata(columns, options);
  const std::string header = SerializeHeader(meta);

  std::vector<uint8_t> output;
  output.reserve(header.size() + static_cast<size_t>(meta.points) * meta.point_step);
  output.insert(output.end(), header.begin(), header.end());
  EncodePayload(meta, columns, output);
  return output;
}

void WritePcd(const std::string& path, const ColumnSet& columns, const WriteOptions& options) {
  // encode first: nothing touches the file system if the data is invalid
  const auto buffer = WritePcdToBuffer(columns, options);

  const std::string temp_path = path + ".tmp." + std::to_string(::getpid());
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw IoError(path, "can't create the temporary file '" + temp_path + "'");
    }
    file.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    file.flush();
    if (!file) {
      file.close();
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      throw IoError(path, "failed writing " + std::to_string(buffer.size()) + " bytes");
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw IoError(path, "can't rename the temporary file: " + ec.message());
  }
}

}  // namespace PcdCodec
