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
#include <string>
#include <string_view>
#include <vector>

#include "pcdcodec/column.hpp"
#include "pcdcodec/header.hpp"
#include "pcdcodec/options.hpp"

namespace PcdCodec {

/// "ascii", "binary" or "binary_compressed". Throws ValidationError otherwise
DataEncoding DataEncodingFromString(std::string_view name);

/**
 * @brief Check the columns and the options, and build the header that describes them.
 *
 * Fields follow the order of the ColumnSet. Throws ValidationError if:
 *
 * - the set is empty or the columns have a different number of points;
 * - a name is empty, contains white spaces or is duplicated ("_" excluded);
 * - a column has an UNKNOWN type;
 * - the viewpoint does not have 7 values, or the height does not divide the number of points.
 */
Metadata MakeMetadata(const ColumnSet& columns, const WriteOptions& options);

/// Encode the whole file in memory
std::vector<uint8_t> WritePcdToBuffer(const ColumnSet& columns, const WriteOptions& options = {});

/**
 * @brief Encode and save a PCD file.
 *
 * The data is written to a temporary file in the same directory, then renamed over `path`.
 * If anything fails, `path` is left untouched and IoError is thrown.
 */
void WritePcd(const std::string& path, const ColumnSet& columns, const WriteOptions& options = {});

}  // namespace PcdCodec
