#include "internal.hpp"
#include <cassert>
#include <cerrno>
#include <cstring>

namespace dbn {

namespace internal {

inline Status FileErrorStatus(int error, std::string_view operation) {
  if (error == EPIPE) {
    return StatusCode::SinkClosed;
  }
  return Status{StatusCode::WriteFailed, StrCat(operation, " failed: ", std::strerror(error))};
}

}  // namespace internal

// IWritable ///////////////////////////////////////////////////////////////////

Status IWritable::write(const std::byte* data, uint64_t size) {
  if (size == 0) {
    return StatusCode::Success;
  }
  return handleWrite(data, size);
}

Status IWritable::write(std::string_view text) {
  return write(reinterpret_cast<const std::byte*>(text.data()), text.size());
}

// FileWriter //////////////////////////////////////////////////////////////////

FileWriter::~FileWriter() {
  end();
}

Status FileWriter::open(std::string_view filename) {
  end();
  const std::string path{filename};
  file_ = std::fopen(path.c_str(), "wb");
  if (!file_) {
    const auto msg = internal::StrCat("failed to open file \"", filename, "\" for writing");
    return Status(StatusCode::OpenFailed, msg);
  }
  owned_ = true;
  return StatusCode::Success;
}

void FileWriter::attach(std::FILE* file) {
  end();
  assert(file);
  file_ = file;
  owned_ = false;
}

Status FileWriter::handleWrite(const std::byte* data, uint64_t size) {
  assert(file_);
  errno = 0;
  const size_t written = std::fwrite(data, 1, size, file_);
  size_ += written;
  if (written != size) {
    return internal::FileErrorStatus(errno, "fwrite");
  }
  return StatusCode::Success;
}

Status FileWriter::flush() {
  if (file_) {
    errno = 0;
    if (std::fflush(file_) != 0) {
      return internal::FileErrorStatus(errno, "fflush");
    }
  }
  return StatusCode::Success;
}

void FileWriter::end() {
  if (file_) {
    if (owned_) {
      std::fclose(file_);
    } else {
      std::fflush(file_);
    }
    file_ = nullptr;
  }
  owned_ = false;
  size_ = 0;
}

uint64_t FileWriter::size() const {
  return size_;
}

// StreamWriter ////////////////////////////////////////////////////////////////

StreamWriter::StreamWriter(std::ostream& stream)
    : stream_(stream)
    , size_(0) {}

Status StreamWriter::handleWrite(const std::byte* data, uint64_t size) {
  stream_.write(reinterpret_cast<const char*>(data), std::streamsize(size));
  if (!stream_) {
    return Status{StatusCode::WriteFailed, "output stream is in a failed state"};
  }
  size_ += size;
  return StatusCode::Success;
}

Status StreamWriter::flush() {
  stream_.flush();
  if (!stream_) {
    return Status{StatusCode::WriteFailed, "output stream is in a failed state"};
  }
  return StatusCode::Success;
}

void StreamWriter::end() {
  stream_.flush();
}

uint64_t StreamWriter::size() const {
  return size_;
}

// BufferWriter ////////////////////////////////////////////////////////////////

Status BufferWriter::handleWrite(const std::byte* data, uint64_t size) {
  buffer_.insert(buffer_.end(), data, data + size);
  return StatusCode::Success;
}

void BufferWriter::end() {
  // no-op
}

uint64_t BufferWriter::size() const {
  return buffer_.size();
}

const std::byte* BufferWriter::data() const {
  return buffer_.data();
}

std::string_view BufferWriter::view() const {
  return std::string_view(reinterpret_cast<const char*>(buffer_.data()), buffer_.size());
}

void BufferWriter::clear() {
  buffer_.clear();
}

}  // namespace dbn
