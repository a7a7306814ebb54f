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
#include <vector>

#include "pcdcodec/encoding_utils.hpp"

namespace PcdCodec {

/**
 * @brief Compress a block with LZF, the algorithm used by the binary_compressed PCD payload.
 *
 * An empty input returns an empty output.
 * Throws PayloadError (COMPRESS_TOO_LARGE) if the input exceeds the 32-bit limit of LZF or if
 * the compressor fails.
 */
std::vector<uint8_t> LzfCompress(ConstBufferView input);

/**
 * @brief Decompress a LZF block whose uncompressed size is known in advance.
 *
 * Throws PayloadError (DECOMPRESS_SIZE_MISMATCH) if the data is corrupted or the number of
 * decompressed bytes differs from `expected_size`.
 */
std::vector<uint8_t> LzfDecompress(ConstBufferView input, size_t expected_size);

}  // namespace PcdCodec
