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

#include "pcdcodec/mapped_file.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "pcdcodec/errors.hpp"

namespace PcdCodec {

namespace {
// above this size, hint the kernel that the file will be read sequentially
constexpr size_t kSequentialAdviceThreshold = 16 * 1024 * 1024;
}  // namespace

std::shared_ptr<const MappedFile> MappedFile::Open(const std::string& path) {
  // constructor is private: can not use make_shared
  std::shared_ptr<MappedFile> file(new MappedFile(path));

  file->fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (file->fd_ < 0) {
    throw IoError(path, std::string("open failed: ") + std::strerror(errno));
  }

  struct stat st {};
  if (::fstat(file->fd_, &st) != 0) {
    throw IoError(path, std::string("fstat failed: ") + std::strerror(errno));
  }
  if (!S_ISREG(st.st_mode)) {
    throw IoError(path, "not a regular file");
  }
  file->size_ = static_cast<size_t>(st.st_size);

  // mmap does not accept a length of zero: an empty file is an empty view
  if (file->size_ == 0) {
    return file;
  }

  void* addr = ::mmap(nullptr, file->size_, PROT_READ, MAP_PRIVATE, file->fd_, 0);
  if (addr == MAP_FAILED) {
    throw IoError(path, std::string("mmap failed: ") + std::strerror(errno));
  }
  file->data_ = static_cast<const uint8_t*>(addr);

  if (file->size_ > kSequentialAdviceThreshold) {
    // only a hint: failure is harmless
    (void)::madvise(addr, file->size_, MADV_SEQUENTIAL);
  }
  return file;
}

MappedFile::~MappedFile() {
  if (data_ != nullptr) {
    ::munmap(const_cast<uint8_t*>(data_), size_);
  }
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

bool MappedFile::contains(const void* ptr, size_t len) const {
  if (data_ == nullptr) {
    return false;
  }
  const auto begin = reinterpret_cast<uintptr_t>(data_);
  const auto p = reinterpret_cast<uintptr_t>(ptr);
  return p >= begin && p + len <= begin + size_;
}

}  // namespace PcdCodec
