#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <cstdio>

namespace dbn {

/**
 * @brief An abstract interface for reading DBN data.
 */
struct DBN_PUBLIC IReadable {
  virtual ~IReadable() = default;

  /**
   * @brief Returns the size of the source in bytes.
   */
  virtual uint64_t size() const = 0;
  /**
   * @brief Reads a portion of the source.
   *
   * @param output Set to a buffer holding the bytes read. Implementations either fill an internal
   *   buffer or point directly at the source data. The buffer must remain valid and unmodified
   *   until the next call to read().
   * @param offset The offset in bytes from the beginning of the source to read.
   * @param size The maximum number of bytes to read.
   * @return uint64_t Number of bytes actually read. Less than `size` at the end of the source, and
   *   0 if the read fails, in which case `status()` describes the failure.
   */
  virtual uint64_t read(std::byte** output, uint64_t offset, uint64_t size) = 0;
  /**
   * @brief The failure of the most recent read, or Success.
   */
  virtual Status status() const {
    return StatusCode::Success;
  }
};

/**
 * @brief IReadable implementation over a FILE*, either opened by the reader or attached from the
 * caller (e.g. stdin redirected from a file).
 */
class DBN_PUBLIC FileReader final : public IReadable {
public:
  FileReader() = default;
  FileReader(std::FILE* file);
  ~FileReader() override;

  FileReader(const FileReader&) = delete;
  FileReader& operator=(const FileReader&) = delete;

  Status open(std::string_view filename);
  void close();

  uint64_t size() const override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;
  Status status() const override;

private:
  std::FILE* file_ = nullptr;
  bool owned_ = false;
  ByteArray buffer_;
  uint64_t size_ = 0;
  uint64_t position_ = 0;
  Status status_;

  void attach_(std::FILE* file, bool owned);
};

/**
 * @brief IReadable implementation over a block of memory owned by the caller. No internal buffers
 * are allocated.
 */
class DBN_PUBLIC BufferReader final : public IReadable {
public:
  BufferReader(const std::byte* data, uint64_t size);

  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;
  uint64_t size() const override;

  BufferReader(const BufferReader&) = delete;
  BufferReader& operator=(const BufferReader&) = delete;

private:
  const std::byte* data_;
  uint64_t size_;
};

}  // namespace dbn

#ifdef DBN_IMPLEMENTATION
#  include "reader.inl"
#endif
