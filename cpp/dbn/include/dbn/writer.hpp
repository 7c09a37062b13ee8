#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <cstdio>
#include <ostream>

namespace dbn {

/**
 * @brief An abstract interface for the byte sinks encoders write to. Write failures are reported
 * as a Status: `StatusCode::SinkClosed` when the reading end of the sink has gone away, and
 * `StatusCode::WriteFailed` for any other failure.
 */
class DBN_PUBLIC IWritable {
public:
  virtual ~IWritable() = default;

  /**
   * @brief Called whenever an encoder needs to write data to the output.
   *
   * @param data A pointer to the data to write.
   * @param size Size of the data in bytes.
   */
  Status write(const std::byte* data, uint64_t size);
  Status write(std::string_view text);
  /**
   * @brief Called when the encoder is finished writing data to the output.
   */
  virtual void end() = 0;
  /**
   * @brief Returns the number of bytes written so far. This must be equal to the sum of all
   * `size` parameters passed to successful `write()` calls.
   */
  virtual uint64_t size() const = 0;
  /**
   * @brief Flushes any buffered data to the output. Defaults to a no-op.
   */
  virtual Status flush() {
    return StatusCode::Success;
  }

protected:
  virtual Status handleWrite(const std::byte* data, uint64_t size) = 0;
};

/**
 * @brief Implements the IWritable interface by wrapping a FILE* pointer, either opened by the
 * writer or attached from the caller (e.g. stdout).
 */
class DBN_PUBLIC FileWriter final : public IWritable {
public:
  ~FileWriter() override;

  Status open(std::string_view filename);
  /**
   * @brief Writes to a FILE* owned by the caller. The file is flushed but not closed by `end()`.
   */
  void attach(std::FILE* file);

  Status handleWrite(const std::byte* data, uint64_t size) override;
  void end() override;
  Status flush() override;
  uint64_t size() const override;

private:
  std::FILE* file_ = nullptr;
  bool owned_ = false;
  uint64_t size_ = 0;
};

/**
 * @brief Implements the IWritable interface by wrapping a std::ostream stream.
 */
class DBN_PUBLIC StreamWriter final : public IWritable {
public:
  StreamWriter(std::ostream& stream);

  Status handleWrite(const std::byte* data, uint64_t size) override;
  void end() override;
  Status flush() override;
  uint64_t size() const override;

private:
  std::ostream& stream_;
  uint64_t size_ = 0;
};

/**
 * @brief An in-memory IWritable implementation backed by a growable buffer.
 */
class DBN_PUBLIC BufferWriter final : public IWritable {
public:
  Status handleWrite(const std::byte* data, uint64_t size) override;
  void end() override;
  uint64_t size() const override;

  const std::byte* data() const;
  /**
   * @brief Returns the written bytes as text, for textual encoders.
   */
  std::string_view view() const;
  void clear();

private:
  std::vector<std::byte> buffer_;
};

}  // namespace dbn

#ifdef DBN_IMPLEMENTATION
#  include "writer.inl"
#endif
