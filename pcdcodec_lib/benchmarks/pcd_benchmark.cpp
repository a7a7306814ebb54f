#include <benchmark/benchmark.h>

#include <filesystem>
#include <iostream>
#include <random>

#include "pcdcodec/pcdcodec.hpp"

static PcdCodec::ColumnSet makeLidarColumns() {
  const size_t kPoints = 1000000;
  std::mt19937 rng(42);
  std::uniform_real_distribution<float> position(-50.0f, 50.0f);
  std::uniform_real_distribution<float> reflectivity(0.0f, 255.0f);

  std::vector<float> x(kPoints), y(kPoints), z(kPoints), intensity(kPoints);
  std::vector<uint16_t> ring(kPoints);
  std::vector<double> timestamp(kPoints);
  for (size_t i = 0; i < kPoints; ++i) {
    x[i] = position(rng);
    y[i] = position(rng);
    z[i] = 0.1f * position(rng);
    intensity[i] = reflectivity(rng);
    ring[i] = static_cast<uint16_t>(i % 128);
    timestamp[i] = 1700000000.0 + 1e-7 * static_cast<double>(i);
  }
  PcdCodec::ColumnSet columns;
  columns.add("x", x);
  columns.add("y", y);
  columns.add("z", z);
  columns.add("intensity", intensity);
  columns.add("ring", ring);
  columns.add("timestamp", timestamp);
  return columns;
}

static std::string benchmarkPath(PcdCodec::DataEncoding encoding) {
  return (std::filesystem::temp_directory_path() / (std::string("pcdcodec_benchmark_") + ToString(encoding) + ".pcd"))
      .string();
}

static void PCD_Write_Impl(benchmark::State& state, PcdCodec::DataEncoding encoding) {
  using namespace PcdCodec;
  const auto columns = makeLidarColumns();
  WriteOptions options;
  options.encoding = encoding;

  const std::string path = benchmarkPath(encoding);
  for (auto _ : state) {
    WritePcd(path, columns, options);
  }
  std::cout << ToString(encoding) << " file size: " << std::filesystem::file_size(path) << std::endl;
  std::filesystem::remove(path);
}

static void PCD_Read_Impl(benchmark::State& state, PcdCodec::DataEncoding encoding) {
  using namespace PcdCodec;
  WriteOptions options;
  options.encoding = encoding;

  const std::string path = benchmarkPath(encoding);
  WritePcd(path, makeLidarColumns(), options);

  ReadOptions read_options;
  read_options.num_threads = static_cast<size_t>(state.range(0));
  for (auto _ : state) {
    auto cloud = ReadPcd(path, read_options);
    benchmark::DoNotOptimize(cloud);
  }
  std::filesystem::remove(path);
}

//------------------------------------------------------------------------------------------
static void PCD_Write_ASCII(benchmark::State& state) {
  PCD_Write_Impl(state, PcdCodec::DataEncoding::ASCII);
}

static void PCD_Write_Binary(benchmark::State& state) {
  PCD_Write_Impl(state, PcdCodec::DataEncoding::BINARY);
}

static void PCD_Write_BinaryCompressed(benchmark::State& state) {
  PCD_Write_Impl(state, PcdCodec::DataEncoding::BINARY_COMPRESSED);
}

//------------------------------------------------------------------------------------------
static void PCD_Read_ASCII(benchmark::State& state) {
  PCD_Read_Impl(state, PcdCodec::DataEncoding::ASCII);
}

static void PCD_Read_Binary(benchmark::State& state) {
  PCD_Read_Impl(state, PcdCodec::DataEncoding::BINARY);
}

static void PCD_Read_BinaryCompressed(benchmark::State& state) {
  PCD_Read_Impl(state, PcdCodec::DataEncoding::BINARY_COMPRESSED);
}

BENCHMARK(PCD_Write_ASCII)->Unit(benchmark::kMillisecond);
BENCHMARK(PCD_Write_Binary)->Unit(benchmark::kMillisecond);
BENCHMARK(PCD_Write_BinaryCompressed)->Unit(benchmark::kMillisecond);

BENCHMARK(PCD_Read_ASCII)->Arg(1)->Arg(0)->Unit(benchmark::kMillisecond);
BENCHMARK(PCD_Read_Binary)->Arg(1)->Arg(0)->Unit(benchmark::kMillisecond);
BENCHMARK(PCD_Read_BinaryCompressed)->Arg(1)->Arg(0)->Unit(benchmark::kMillisecond);

//------------------------------------------------------------------------------------------
BENCHMARK_MAIN();
