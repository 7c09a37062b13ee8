#include "internal.hpp"
#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstring>

namespace dbn {

// BufferReader ////////////////////////////////////////////////////////////////

BufferReader::BufferReader(const std::byte* data, uint64_t size)
    : data_(data)
    , size_(size) {}

uint64_t BufferReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (!data_ || offset >= size_) {
    return 0;
  }

  const auto available = size_ - offset;
  *output = const_cast<std::byte*>(data_) + offset;
  return std::min(size, available);
}

uint64_t BufferReader::size() const {
  return size_;
}

// FileReader //////////////////////////////////////////////////////////////////

FileReader::FileReader(std::FILE* file) {
  attach_(file, false);
}

FileReader::~FileReader() {
  close();
}

Status FileReader::open(std::string_view filename) {
  close();
  const std::string path{filename};
  std::FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) {
    const auto msg = internal::StrCat("failed to open file \"", filename,
                                      "\" for reading: ", std::strerror(errno));
    return Status{StatusCode::OpenFailed, msg};
  }
  attach_(file, true);
  return StatusCode::Success;
}

void FileReader::close() {
  if (file_ && owned_) {
    std::fclose(file_);
  }
  file_ = nullptr;
  owned_ = false;
  size_ = 0;
  position_ = 0;
  status_ = StatusCode::Success;
}

void FileReader::attach_(std::FILE* file, bool owned) {
  assert(file);
  file_ = file;
  owned_ = owned;
  position_ = 0;
  status_ = StatusCode::Success;

  // Determine the size of the file
  std::fseek(file_, 0, SEEK_END);
  const long end = std::ftell(file_);
  size_ = end < 0 ? 0 : uint64_t(end);
  std::fseek(file_, 0, SEEK_SET);
}

uint64_t FileReader::size() const {
  return size_;
}

uint64_t FileReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (!file_ || offset >= size_) {
    return 0;
  }

  if (offset != position_) {
    if (std::fseek(file_, long(offset), SEEK_SET) != 0) {
      status_ = Status{StatusCode::ReadFailed,
                       internal::StrCat("seek to offset ", offset, " failed: ", std::strerror(errno))};
      return 0;
    }
    position_ = offset;
  }

  if (size > buffer_.size()) {
    buffer_.resize(size);
  }

  errno = 0;
  const uint64_t bytesRead = uint64_t(std::fread(buffer_.data(), 1, size, file_));
  if (bytesRead < size && std::ferror(file_)) {
    status_ = Status{StatusCode::ReadFailed,
                     internal::StrCat("read at offset ", offset, " failed: ", std::strerror(errno))};
    std::clearerr(file_);
  }
  *output = buffer_.data();

  position_ += bytesRead;
  return bytesRead;
}

Status FileReader::status() const {
  return status_;
}

}  // namespace dbn
