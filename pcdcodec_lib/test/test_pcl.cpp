#include <gtest/gtest.h>
#include <pcl/conversions.h>
#include <pcl/io/pcd_io.h>
#include <pcl/point_cloud.h>
#include <pcl/point_types.h>

#include "pcdcodec/pcdcodec.hpp"
#include "pcdcodec/pcl_conversion.hpp"
#include "test_utils.hpp"

using PcdCodec::tests::TempPath;

namespace {

pcl::PointCloud<pcl::PointXYZI> MakeCloud(size_t points) {
  pcl::PointCloud<pcl::PointXYZI> cloud;
  cloud.resize(points);
  for (size_t i = 0; i < points; ++i) {
    auto& p = cloud.points[i];
    p.x = 0.01f * static_cast<float>(i);
    p.y = -0.02f * static_cast<float>(i);
    p.z = 1.0f + 0.001f * static_cast<float>(i % 100);
    p.intensity = static_cast<float>(i % 255);
  }
  cloud.width = static_cast<uint32_t>(points);
  cloud.height = 1;
  return cloud;
}

PcdCodec::ColumnSet ToColumns(const pcl::PointCloud<pcl::PointXYZI>& cloud) {
  std::vector<float> x, y, z, intensity;
  for (const auto& p : cloud.points) {
    x.push_back(p.x);
    y.push_back(p.y);
    z.push_back(p.z);
    intensity.push_back(p.intensity);
  }
  PcdCodec::ColumnSet columns;
  columns.add("x", x);
  columns.add("y", y);
  columns.add("z", z);
  columns.add("intensity", intensity);
  return columns;
}

}  // namespace

TEST(PCL, LoadFilesWrittenByPcdCodec) {
  using namespace PcdCodec;
  const auto cloud = MakeCloud(10000);
  const auto columns = ToColumns(cloud);

  for (auto encoding : {DataEncoding::ASCII, DataEncoding::BINARY, DataEncoding::BINARY_COMPRESSED}) {
    TempPath path(std::string("to_pcl_") + ToString(encoding) + ".pcd");
    WriteOptions options;
    options.encoding = encoding;
    WritePcd(path.str(), columns, options);

    pcl::PointCloud<pcl::PointXYZI> loaded;
    ASSERT_EQ(pcl::io::loadPCDFile<pcl::PointXYZI>(path.str(), loaded), 0) << ToString(encoding);
    ASSERT_EQ(loaded.size(), cloud.size());
    for (size_t i = 0; i < cloud.size(); ++i) {
      ASSERT_EQ(loaded.points[i].x, cloud.points[i].x) << "i:" << i;
      ASSERT_EQ(loaded.points[i].y, cloud.points[i].y) << "i:" << i;
      ASSERT_EQ(loaded.points[i].z, cloud.points[i].z) << "i:" << i;
      ASSERT_EQ(loaded.points[i].intensity, cloud.points[i].intensity) << "i:" << i;
    }
  }
}

TEST(PCL, ReadFilesWrittenByPCL) {
  using namespace PcdCodec;
  const auto cloud = MakeCloud(10000);
  const auto expected = ToColumns(cloud);

  TempPath binary("pcl_binary.pcd");
  TempPath compressed("pcl_compressed.pcd");
  ASSERT_EQ(pcl::io::savePCDFileBinary(binary.str(), cloud), 0);
  ASSERT_EQ(pcl::io::savePCDFileBinaryCompressed(compressed.str(), cloud), 0);

  for (const auto* path : {&binary, &compressed}) {
    const auto data = ReadPcd(path->str());
    EXPECT_EQ(data.metadata.points, cloud.size());
    for (const auto& name : expected.names()) {
      ASSERT_TRUE(data.columns.contains(name)) << name;
      EXPECT_TRUE(data.columns.at(name).sameValues(expected.at(name))) << name;
    }
  }
}

TEST(PCL, PointCloud2Conversion) {
  using namespace PcdCodec;
  const auto cloud = MakeCloud(1000);

  pcl::PCLPointCloud2 blob;
  pcl::toPCLPointCloud2(cloud, blob);

  const auto data = FromPCLPointCloud2(blob);
  const auto expected = ToColumns(cloud);
  for (const auto& name : expected.names()) {
    ASSERT_TRUE(data.columns.contains(name)) << name;
    EXPECT_TRUE(data.columns.at(name).sameValues(expected.at(name))) << name;
  }

  // back to PCL: packed layout, same values
  const auto packed = ToPCLPointCloud2(data);
  EXPECT_EQ(packed.width * packed.height, cloud.size());
  pcl::PointCloud<pcl::PointXYZI> converted;
  pcl::fromPCLPointCloud2(packed, converted);
  ASSERT_EQ(converted.size(), cloud.size());
  for (size_t i = 0; i < cloud.size(); ++i) {
    ASSERT_EQ(converted.points[i].x, cloud.points[i].x) << "i:" << i;
    ASSERT_EQ(converted.points[i].intensity, cloud.points[i].intensity) << "i:" << i;
  }
}
