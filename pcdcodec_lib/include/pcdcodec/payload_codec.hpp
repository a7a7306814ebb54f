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
#include <memory>
#include <vector>

#include "pcdcodec/column.hpp"
#include "pcdcodec/encoding_utils.hpp"
#include "pcdcodec/header.hpp"
#include "pcdcodec/mapped_file.hpp"
#include "pcdcodec/options.hpp"

namespace PcdCodec {

/*
 * Decoders receive the payload (the bytes after the DATA line) and return one column per field
 * of the metadata, in the same order. Padding fields ("_") are skipped.
 *
 * Encoders expect columns in the order of metadata.fields, with metadata.points rows each, and
 * append the payload to `output`.
 */

ColumnSet DecodeAsciiPayload(const Metadata& metadata, ConstBufferView payload, const ReadOptions& options);

/**
 * @brief Decode the "binary" payload (row-major records of point_step bytes).
 *
 * @param mapping if not null, `payload` points into this mapping and columns may be exposed as
 * views over it (see CanExposeView). Otherwise every column is copied.
 */
ColumnSet DecodeBinaryPayload(
    const Metadata& metadata, ConstBufferView payload, const ReadOptions& options,
    const std::shared_ptr<const MappedFile>& mapping = nullptr);

/// Decode the "binary_compressed" payload. Columns are slices of a single decompressed buffer
ColumnSet DecodeCompressedPayload(const Metadata& metadata, ConstBufferView payload, const ReadOptions& options);

/// Dispatch on metadata.encoding
ColumnSet DecodePayload(
    const Metadata& metadata, ConstBufferView payload, const ReadOptions& options,
    const std::shared_ptr<const MappedFile>& mapping = nullptr);

void EncodeAsciiPayload(const Metadata& metadata, const ColumnSet& columns, std::vector<uint8_t>& output);

void EncodeBinaryPayload(const Metadata& metadata, const ColumnSet& columns, std::vector<uint8_t>& output);

void EncodeCompressedPayload(const Metadata& metadata, const ColumnSet& columns, std::vector<uint8_t>& output);

/// Dispatch on metadata.encoding
void EncodePayload(const Metadata& metadata, const ColumnSet& columns, std::vector<uint8_t>& output);

/// Threads used to decode `points` rows, according to ReadOptions
size_t DecodeThreadsCount(const ReadOptions& options, size_t points);

}  // namespace PcdCodec
