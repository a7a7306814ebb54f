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
#include <optional>
#include <string>
#include <vector>

#include "pcdcodec/basic_types.hpp"
#include "pcdcodec/header.hpp"

namespace PcdCodec {

struct ReadOptions {
  // 0 means std::thread::hardware_concurrency()
  size_t num_threads = 0;

  // clouds smaller than this are decoded in the calling thread only
  size_t min_points_per_thread = 16384;

  // when false, every column is copied, even if it could be a view over the mapped file
  bool allow_zero_copy = true;
};

struct WriteOptions {
  DataEncoding encoding = DataEncoding::BINARY;

  // tx ty tz qw qx qy qz. Must contain exactly 7 values; kDefaultViewpoint when empty
  std::optional<std::vector<double>> viewpoint;

  // height of an organized cloud. Must divide the number of points
  std::optional<uint32_t> height;

  std::string version = kDefaultVersion;
};

}  // namespace PcdCodec
