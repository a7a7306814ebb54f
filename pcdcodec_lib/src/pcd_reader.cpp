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

#include "pcdcodec/pcd_reader.hpp"

#include <utility>

#include "pcdcodec/payload_codec.hpp"

namespace PcdCodec {

MappedPcd::MappedPcd(std::shared_ptr<const MappedFile> mapping, HeaderParseResult header)
    : mapping_(std::move(mapping)), metadata_(std::move(header.metadata)), header_length_(header.header_length) {}

MappedPcd MappedPcd::Open(const std::string& path) {
  auto mapping = MappedFile::Open(path);
  auto header = ParseHeader(mapping->view());
  return MappedPcd(std::move(mapping), std::move(header));
}

ConstBufferView MappedPcd::payload() const {
  auto view = mapping_->view();
  view.advance(header_length_);
  return view;
}

PointCloudData MappedPcd::read(const ReadOptions& options) const {
  PointCloudData out;
  out.metadata = metadata_;
  out.columns = DecodePayload(metadata_, payload(), options, mapping_);
  return out;
}

PointCloudData ReadPcd(const std::string& path, const ReadOptions& options) {
  return MappedPcd::Open(path).read(options);
}

PointCloudData ReadPcdFromBuffer(ConstBufferView buffer, const ReadOptions& options) {
  auto header = ParseHeader(buffer);
  buffer.advance(header.header_length);

  PointCloudData out;
  out.columns = DecodePayload(header.metadata, buffer, options);
  out.metadata = std::move(header.metadata);
  return out;
}

}  // namespace PcdCodec
