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

#include "pcdcodec/payload_codec.hpp"

#include <algorithm>

#include "pcdcodec/errors.hpp"
#include "pcdcodec/parallel.hpp"

namespace PcdCodec {

size_t DecodeThreadsCount(const ReadOptions& options, size_t points) {
  const size_t requested = options.num_threads == 0 ? DefaultThreadsCount() : options.num_threads;
  if (options.min_points_per_thread == 0) {
    return requested;
  }
  const size_t by_size = points / options.min_points_per_thread;
  return std::max<size_t>(1, std::min(requested, by_size));
}

ColumnSet DecodePayload(
    const Metadata& metadata, ConstBufferView payload, const ReadOptions& options,
    const std::shared_ptr<const MappedFile>& mapping) {
  switch (metadata.encoding) {
    case DataEncoding::ASCII:
      return DecodeAsciiPayload(metadata, payload, options);
    case DataEncoding::BINARY:
      return DecodeBinaryPayload(metadata, payload, options, mapping);
    case DataEncoding::BINARY_COMPRESSED:
      return DecodeCompressedPayload(metadata, payload, options);
  }
  throw PcdError("unknown data encoding");
}

void EncodePayload(const Metadata& metadata, const ColumnSet& columns, std::vector<uint8_t>& output) {
  switch (metadata.encoding) {
    case DataEncoding::ASCII:
      EncodeAsciiPayload(metadata, columns, output);
      return;
    case DataEncoding::BINARY:
      EncodeBinaryPayload(metadata, columns, output);
      return;
    case DataEncoding::BINARY_COMPRESSED:
      EncodeCompressedPayload(metadata, columns, output);
      return;
  }
  throw PcdError("unknown data encoding");
}

}  // namespace PcdCodec
