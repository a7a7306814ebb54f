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

#include "pcdcodec/pcl_conversion.hpp"

#include "pcdcodec/errors.hpp"
#include "pcdcodec/layout.hpp"
#include "pcdcodec/payload_codec.hpp"

namespace PcdCodec {

namespace {

FieldType ConvertDatatype(const pcl::PCLPointField& field) {
  switch (field.datatype) {
    case pcl::PCLPointField::INT8:
      return FieldType::INT8;
    case pcl::PCLPointField::UINT8:
      return FieldType::UINT8;
    case pcl::PCLPointField::INT16:
      return FieldType::INT16;
    case pcl::PCLPointField::UINT16:
      return FieldType::UINT16;
    case pcl::PCLPointField::INT32:
      return FieldType::INT32;
    case pcl::PCLPointField::UINT32:
      return FieldType::UINT32;
    case pcl::PCLPointField::FLOAT32:
      return FieldType::FLOAT32;
    case pcl::PCLPointField::FLOAT64:
      return FieldType::FLOAT64;
    default:
      throw SchemaError("field '" + field.name + "' has unsupported datatype " + std::to_string(field.datatype));
  }
}

}  // namespace

pcl::PCLPointCloud2 ToPCLPointCloud2(const PointCloudData& data) {
  const auto& columns = data.columns;
  if (columns.empty()) {
    throw SchemaError("no columns to convert");
  }

  Metadata meta = data.metadata;
  meta.points = static_cast<uint32_t>(columns[0].second.points());
  meta.encoding = DataEncoding::BINARY;

  std::vector<PointField> fields;
  fields.reserve(columns.size());
  for (const auto& [name, column] : columns) {
    fields.push_back(PointField{name, 0, column.type(), column.count()});
  }
  auto layout = ComputeLayout(fields);
  meta.fields = std::move(layout.fields);
  meta.point_step = layout.stride;

  pcl::PCLPointCloud2 cloud;
  if (static_cast<uint64_t>(meta.width) * meta.height == meta.points) {
    cloud.width = meta.width;
    cloud.height = meta.height;
  } else {
    cloud.width = meta.points;
    cloud.height = 1;
  }
  cloud.point_step = meta.point_step;
  cloud.row_step = cloud.width * cloud.point_step;
  cloud.is_bigendian = false;
  cloud.is_dense = false;

  for (const auto& field : meta.fields) {
    pcl::PCLPointField pcl_field;
    pcl_field.name = field.name;
    pcl_field.offset = field.offset;
    pcl_field.datatype = static_cast<uint8_t>(field.type);
    pcl_field.count = field.count;
    cloud.fields.push_back(pcl_field);
  }

  EncodeBinaryPayload(meta, columns, cloud.data);
  return cloud;
}

PointCloudData FromPCLPointCloud2(const pcl::PCLPointCloud2& cloud) {
  PointCloudData out;
  Metadata& meta = out.metadata;
  meta.width = cloud.width;
  meta.height = cloud.height;
  meta.points = cloud.width * cloud.height;
  meta.point_step = cloud.point_step;
  meta.encoding = DataEncoding::BINARY;

  for (const auto& pcl_field : cloud.fields) {
    PointField field;
    field.name = pcl_field.name;
    field.offset = pcl_field.offset;
    field.type = ConvertDatatype(pcl_field);
    // PCL uses count 0 in a few legacy point types
    field.count = pcl_field.count == 0 ? 1 : pcl_field.count;
    if (field.offset + PointLayout::FieldBytes(field) > cloud.point_step) {
      throw SchemaError("field '" + field.name + "' exceeds the point_step");
    }
    meta.fields.push_back(std::move(field));
  }

  ReadOptions options;
  options.allow_zero_copy = false;
  out.columns = DecodeBinaryPayload(meta, ConstBufferView(cloud.data), options);
  return out;
}

}  // namespace PcdCodec
