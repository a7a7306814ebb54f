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

#include <pcl/PCLPointCloud2.h>

#include "pcdcodec/pcd_reader.hpp"

namespace PcdCodec {

/**
 * @brief Pack the columns into the interleaved representation used by PCL.
 *
 * Fields keep the order of the ColumnSet, without padding. The data is little-endian.
 */
pcl::PCLPointCloud2 ToPCLPointCloud2(const PointCloudData& cloud);

/**
 * @brief Unpack a pcl::PCLPointCloud2 into columns. Padding fields ("_") are dropped.
 *
 * Throws SchemaError if a field has a datatype that can not be represented.
 */
PointCloudData FromPCLPointCloud2(const pcl::PCLPointCloud2& cloud);

}  // namespace PcdCodec
