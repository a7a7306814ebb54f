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

#include <algorithm>
#include <string>
#include <string_view>

#include "pcdcodec/errors.hpp"
#include "pcdcodec/field_decoder.hpp"
#include "pcdcodec/field_encoder.hpp"
#include "pcdcodec/parallel.hpp"
#include "pcdcodec/payload_codec.hpp"

namespace PcdCodec {

namespace {

bool IsBlankLine(std::string_view line) {
  for (char c : line) {
    if (!IsBlank(c)) {
      return false;
    }
  }
  return true;
}

// Collect the first `rows` non-blank lines. Whatever follows them is ignored.
// `rows` comes from the header, so the reservation is bounded by what the text can hold.
std::vector<std::string_view> SplitLines(std::string_view text, size_t rows) {
  std::vector<std::string_view> lines;
  lines.reserve(std::min(rows, text.size() / 2 + 1));
  size_t pos = 0;
  while (lines.size() < rows && pos < text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    const auto line = text.substr(pos, end - pos);
    if (!IsBlankLine(line)) {
      lines.push_back(line);
    }
    pos = end + 1;
  }
  return lines;
}

}  // namespace

ColumnSet DecodeAsciiPayload(const Metadata& metadata, ConstBufferView payload, const ReadOptions& options) {
  const size_t points = metadata.points;
  const auto& fields = metadata.fields;

  const auto lines = SplitLines(payload.asStringView(), points);
  if (lines.size() < points) {
    throw PayloadError::Truncated("ASCII payload has fewer rows than POINTS", lines.size(), points, lines.size());
  }

  std::vector<Column> columns(fields.size());
  std::vector<std::unique_ptr<FieldDecoder>> decoders(fields.size());
  size_t tokens_per_row = 0;
  for (size_t i = 0; i < fields.size(); ++i) {
    const auto& field = fields[i];
    tokens_per_row += field.count;
    if (field.isPadding()) {
      continue;
    }
    columns[i] = Column(field.type, field.count, points);
    decoders[i] = CreateAsciiDecoder(field.type);
  }

  std::vector<uint8_t*> destinations(fields.size(), nullptr);
  for (size_t i = 0; i < fields.size(); ++i) {
    if (decoders[i]) {
      destinations[i] = columns[i].mutableData();
    }
  }

  ParallelFor(points, DecodeThreadsCount(options, points), [&](size_t begin, size_t end) {
    std::vector<std::string_view> tokens;
    tokens.reserve(tokens_per_row);
    for (size_t row = begin; row < end; ++row) {
      SplitTokens(lines[row], tokens);
      if (tokens.size() != tokens_per_row) {
        throw PayloadError::RowLengthMismatch(row, tokens_per_row, tokens.size());
      }
      size_t token_index = 0;
      for (size_t i = 0; i < fields.size(); ++i) {
        const auto& field = fields[i];
        const auto* decoder = decoders[i].get();
        if (!decoder) {
          // padding: tokens are present but not parsed
          token_index += field.count;
          continue;
        }
        const size_t element_size = decoder->elementSize();
        uint8_t* dst = destinations[i] + row * field.count * element_size;
        for (uint32_t k = 0; k < field.count; ++k) {
          const auto token = tokens[token_index++];
          if (!decoder->decode(token, dst + k * element_size)) {
            throw PayloadError::ParseNumber(row, field.name, std::string(token));
          }
        }
      }
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

void EncodeAsciiPayload(const Metadata& metadata, const ColumnSet& columns, std::vector<uint8_t>& output) {
  const auto& fields = metadata.fields;
  std::vector<std::unique_ptr<FieldEncoder>> encoders;
  std::vector<const uint8_t*> sources;
  encoders.reserve(fields.size());
  sources.reserve(fields.size());
  for (size_t i = 0; i < fields.size(); ++i) {
    encoders.push_back(CreateAsciiEncoder(fields[i].type));
    sources.push_back(columns[i].second.data());
  }

  std::string text;
  // rough guess: two characters for each byte of the binary record
  text.reserve(static_cast<size_t>(metadata.points) * metadata.point_step * 2);

  for (size_t row = 0; row < metadata.points; ++row) {
    bool first = true;
    for (size_t i = 0; i < fields.size(); ++i) {
      const auto& encoder = encoders[i];
      const size_t element_size = encoder->elementSize();
      const uint8_t* src = sources[i] + row * fields[i].count * element_size;
      for (uint32_t k = 0; k < fields[i].count; ++k) {
        if (!first) {
          text.push_back(' ');
        }
        first = false;
        encoder->encode(src + k * element_size, text);
      }
    }
    text.push_back('\n');
  }
  output.insert(output.end(), text.begin(), text.end());
}

}  // namespace PcdCodec
