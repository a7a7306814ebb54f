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

#include "pcdcodec/header.hpp"

#include <iostream>
#include <optional>
#include <string_view>

#include "pcdcodec/errors.hpp"
#include "pcdcodec/field_decoder.hpp"
#include "pcdcodec/field_encoder.hpp"
#include "pcdcodec/layout.hpp"

namespace PcdCodec {

namespace {

// Entries of the header as they are found in the text, before validation
struct RawHeader {
  std::optional<std::string> version;
  std::optional<std::vector<std::string>> fields;
  std::optional<std::vector<int>> sizes;
  std::optional<std::vector<char>> types;
  std::optional<std::vector<uint32_t>> counts;
  std::optional<uint32_t> width;
  std::optional<uint32_t> height;
  std::optional<Viewpoint> viewpoint;
  std::optional<uint32_t> points;
  std::optional<DataEncoding> encoding;
};

template <typename T>
T ParseHeaderNumber(std::string_view key, std::string_view token) {
  T value{};
  if (!ParseNumber(token, value)) {
    throw HeaderError(std::string(key), "invalid number '" + std::string(token) + "'");
  }
  return value;
}

template <typename T>
std::vector<T> ParseHeaderNumbers(std::string_view key, const std::vector<std::string_view>& values) {
  std::vector<T> out;
  out.reserve(values.size());
  for (const auto& token : values) {
    out.push_back(ParseHeaderNumber<T>(key, token));
  }
  return out;
}

uint32_t ParseSingleNumber(std::string_view key, const std::vector<std::string_view>& values) {
  if (values.size() != 1) {
    throw HeaderError(std::string(key), "expected a single value, got " + std::to_string(values.size()));
  }
  return ParseHeaderNumber<uint32_t>(key, values.front());
}

template <typename T>
const T& Require(const std::optional<T>& entry, const char* key) {
  if (!entry) {
    throw HeaderError(key, "missing required key");
  }
  return *entry;
}

void CheckSameLength(size_t fields_count, size_t count, const char* key) {
  if (count != fields_count) {
    throw HeaderError(
        key, "has " + std::to_string(count) + " entries but FIELDS has " + std::to_string(fields_count));
  }
}

template <typename Container, typename Func>
void AppendLine(std::string& output, const char* key, const Container& values, Func&& append_value) {
  output += key;
  for (const auto& value : values) {
    output += ' ';
    append_value(value);
  }
  output += '\n';
}

}  // namespace

std::vector<std::string> FieldNames(const Metadata& metadata) {
  std::vector<std::string> names;
  names.reserve(metadata.fields.size());
  for (const auto& field : metadata.fields) {
    names.push_back(field.name);
  }
  return names;
}

HeaderParseResult ParseHeader(ConstBufferView input) {
  const std::string_view text = input.asStringView();

  RawHeader raw;
  std::vector<std::string_view> tokens;
  std::vector<std::string_view> values;
  size_t pos = 0;
  size_t header_length = 0;

  while (pos < text.size() && !raw.encoding) {
    const size_t eol = text.find('\n', pos);
    const size_t line_end = (eol == std::string_view::npos) ? text.size() : eol;
    const std::string_view line = text.substr(pos, line_end - pos);
    pos = (eol == std::string_view::npos) ? text.size() : eol + 1;

    SplitTokens(line, tokens);
    if (tokens.empty() || tokens.front().front() == '#') {
      continue;
    }
    const std::string_view key = tokens.front();
    values.assign(tokens.begin() + 1, tokens.end());

    if (key == "VERSION") {
      if (values.empty()) {
        throw HeaderError("VERSION", "missing value");
      }
      raw.version = std::string(values.front());
    } else if (key == "FIELDS") {
      if (values.empty()) {
        throw HeaderError("FIELDS", "no fields listed");
      }
      raw.fields = std::vector<std::string>(values.begin(), values.end());
    } else if (key == "SIZE") {
      raw.sizes = ParseHeaderNumbers<int>(key, values);
    } else if (key == "TYPE") {
      std::vector<char> types;
      for (const auto& token : values) {
        if (token.size() != 1) {
          throw HeaderError("TYPE", "invalid type '" + std::string(token) + "'");
        }
        types.push_back(token.front());
      }
      raw.types = std::move(types);
    } else if (key == "COUNT") {
      raw.counts = ParseHeaderNumbers<uint32_t>(key, values);
    } else if (key == "WIDTH") {
      raw.width = ParseSingleNumber(key, values);
    } else if (key == "HEIGHT") {
      raw.height = ParseSingleNumber(key, values);
    } else if (key == "POINTS") {
      raw.points = ParseSingleNumber(key, values);
    } else if (key == "VIEWPOINT") {
      if (values.size() != 7) {
        throw HeaderError("VIEWPOINT", "expected 7 values, got " + std::to_string(values.size()));
      }
      Viewpoint viewpoint;
      for (size_t i = 0; i < 7; ++i) {
        viewpoint[i] = ParseHeaderNumber<double>(key, values[i]);
      }
      raw.viewpoint = viewpoint;
    } else if (key == "DATA") {
      if (values.size() != 1) {
        throw HeaderError("DATA", "expected a single value");
      }
      raw.encoding = ParseDataEncoding(values.front());
      if (!raw.encoding) {
        throw HeaderError("DATA", "unknown encoding '" + std::string(values.front()) + "'");
      }
      header_length = pos;
    }
    // unknown keys are ignored
  }

  HeaderParseResult result;
  Metadata& meta = result.metadata;

  meta.version = Require(raw.version, "VERSION");
  const auto& names = Require(raw.fields, "FIELDS");
  const auto& sizes = Require(raw.sizes, "SIZE");
  const auto& types = Require(raw.types, "TYPE");
  meta.width = Require(raw.width, "WIDTH");
  meta.height = Require(raw.height, "HEIGHT");
  meta.viewpoint = Require(raw.viewpoint, "VIEWPOINT");
  meta.points = Require(raw.points, "POINTS");
  meta.encoding = Require(raw.encoding, "DATA");

  CheckSameLength(names.size(), sizes.size(), "SIZE");
  CheckSameLength(names.size(), types.size(), "TYPE");
  // PCD 0.6 files have no COUNT: one element per field
  const std::vector<uint32_t> counts = raw.counts ? *raw.counts : std::vector<uint32_t>(names.size(), 1);
  CheckSameLength(names.size(), counts.size(), "COUNT");

  std::vector<PointField> fields;
  fields.reserve(names.size());
  for (size_t i = 0; i < names.size(); ++i) {
    PointField field;
    field.name = names[i];
    field.type = MakeFieldType(types[i], sizes[i]);
    field.count = counts[i];
    fields.push_back(std::move(field));
  }
  PointLayout layout = ComputeLayout(fields);
  meta.fields = std::move(layout.fields);
  meta.point_step = layout.stride;

  if (static_cast<uint64_t>(meta.width) * meta.height != meta.points) {
    std::cerr << "[PcdCodec] warning: WIDTH (" << meta.width << ") x HEIGHT (" << meta.height
              << ") differs from POINTS (" << meta.points << "); using POINTS" << std::endl;
  }

  result.header_length = header_length;
  return result;
}

std::string SerializeHeader(const Metadata& metadata) {
  const PointLayout layout = ComputeLayout(metadata.fields);

  std::string output;
  output.reserve(256 + 16 * layout.fields.size());
  output += "# .PCD v0.7 - Point Cloud Data file format\n";
  output += "VERSION ";
  output += metadata.version;
  output += '\n';

  AppendLine(output, "FIELDS", layout.fields, [&](const PointField& f) { output += f.name; });
  AppendLine(output, "SIZE", layout.fields, [&](const PointField& f) { AppendNumber(output, SizeOf(f.type)); });
  AppendLine(output, "TYPE", layout.fields, [&](const PointField& f) { output += TypeCode(f.type); });
  AppendLine(output, "COUNT", layout.fields, [&](const PointField& f) { AppendNumber(output, f.count); });

  output += "WIDTH ";
  AppendNumber(output, metadata.width);
  output += "\nHEIGHT ";
  AppendNumber(output, metadata.height);
  output += '\n';

  AppendLine(output, "VIEWPOINT", metadata.viewpoint, [&](double v) { AppendNumber(output, v); });

  output += "POINTS ";
  AppendNumber(output, metadata.points);
  output += "\nDATA ";
  output += ToString(metadata.encoding);
  output += '\n';
  return output;
}

}  // namespace PcdCodec
