#include "font/ByteSource.h"

#include <cstring>

namespace PcfText {

MemoryByteSource::MemoryByteSource(const uint8_t* data, size_t size)
  : data_(data)
  , size_(data ? size : 0)
  , position_(0)
{
}

bool MemoryByteSource::seek(uint32_t offset) {
  if (offset > size_) {
    return false;
  }
  position_ = offset;
  return true;
}

bool MemoryByteSource::seekRelative(int32_t delta) {
  if (delta < 0 && static_cast<size_t>(-static_cast<int64_t>(delta)) > position_) {
    return false;
  }
  int64_t target = static_cast<int64_t>(position_) + delta;
  if (target > static_cast<int64_t>(size_)) {
    return false;
  }
  position_ = static_cast<size_t>(target);
  return true;
}

bool MemoryByteSource::readExact(uint8_t* buffer, size_t length) {
  if (length > size_ - position_) {
    return false;
  }
  if (length == 0) {
    return true;
  }
#ifdef ARDUINO
  memcpy_P(buffer, &data_[position_], length);
#else
  std::memcpy(buffer, &data_[position_], length);
#endif
  position_ += length;
  return true;
}

std::unique_ptr<MemoryByteSource> MemoryByteSource::clone() const {
  return std::make_unique<MemoryByteSource>(data_, size_);
}

#ifndef ARDUINO

std::unique_ptr<FileByteSource> FileByteSource::open(const char* path) {
  if (!path) {
    return nullptr;
  }
  std::FILE* file = std::fopen(path, "rb");
  if (!file) {
    return nullptr;
  }
  return std::unique_ptr<FileByteSource>(new FileByteSource(file));
}

FileByteSource::FileByteSource(std::FILE* file)
  : file_(file)
{
}

FileByteSource::~FileByteSource() {
  if (file_) {
    std::fclose(file_);
  }
}

bool FileByteSource::seek(uint32_t offset) {
  return std::fseek(file_, static_cast<long>(offset), SEEK_SET) == 0;
}

bool FileByteSource::seekRelative(int32_t delta) {
  return std::fseek(file_, static_cast<long>(delta), SEEK_CUR) == 0;
}

bool FileByteSource::readExact(uint8_t* buffer, size_t length) {
  if (length == 0) {
    return true;
  }
  return std::fread(buffer, 1, length, file_) == length;
}

#endif

}  // namespace PcfText
