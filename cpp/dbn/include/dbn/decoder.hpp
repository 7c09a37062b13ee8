#pragma once

#include "reader.hpp"
#include "record_ref.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <variant>

namespace dbn {

/**
 * @brief An owned record produced by `StreamDecoder::decode()`, with the trailing send timestamp
 * when the stream's metadata announces one.
 */
struct DBN_PUBLIC DecodedRecord {
  RecordVariant record;
  std::optional<Timestamp> tsOut;
};

/**
 * @brief One item produced by `StreamDecoder::decode()`. The Metadata is always produced first and
 * exactly once.
 */
using DecodedItem = std::variant<Metadata, DecodedRecord>;

enum struct DecoderState {
  AwaitingMetadata,
  StreamingRecords,
  /**
   * @brief A terminal error was encountered. Every further decode call returns the same error.
   */
  Failed,
};

/**
 * @brief A growable byte arena with a write end and a read cursor, owned by a single decoder.
 * Consumed bytes stay in place until `compact()` is called, so views into the readable region
 * stay valid across `consume()`.
 */
class DBN_PUBLIC RecordBuffer {
public:
  static constexpr size_t DefaultCapacity = 64 * 1024;

  explicit RecordBuffer(size_t initialCapacity = DefaultCapacity);

  /**
   * @brief Appends bytes after the write end. May reallocate, invalidating pointers into the
   * buffer.
   */
  void append(const std::byte* data, size_t size);
  /**
   * @brief Pointer to the first unconsumed byte.
   */
  const std::byte* readData() const;
  size_t readableSize() const;
  /**
   * @brief Advances the read cursor by `size` bytes, which must not exceed `readableSize()`.
   */
  void consume(size_t size);
  /**
   * @brief Moves the unconsumed bytes to the start of the arena. Invalidates pointers into the
   * buffer.
   */
  void compact();
  void clear();

private:
  std::vector<std::byte> buffer_;
  size_t readPos_ = 0;
  size_t writePos_ = 0;
};

/**
 * @brief Parses the metadata preamble that begins every DBN stream.
 */
struct DBN_PUBLIC MetadataDecoder {
  /**
   * @brief Validates as much of the fixed preamble prefix as is available. Once the first eight
   * bytes are present, `length` is set to the total size of the encoded metadata, otherwise it is
   * left empty. Returns `StatusCode::InvalidMetadata` for bad magic bytes and
   * `StatusCode::UnsupportedVersion` for an unknown encoding version.
   */
  static Status PeekMetadataLength(const std::byte* data, uint64_t size,
                                   std::optional<uint64_t>* length);

  /**
   * @brief Parses a complete encoded metadata block of `size` bytes.
   */
  static Status ParseMetadata(const std::byte* data, uint64_t size, Metadata* output);
};

/**
 * @brief A push-style incremental DBN decoder. Bytes are supplied with `write()` in chunks of any
 * size, and every call to `decode()` or `decodeRecordRefs()` returns whatever complete items the
 * buffered bytes hold. Decoding never blocks and performs no I/O.
 *
 * Records with a discriminant outside the catalog are skipped and reported to the problem
 * callback. A header whose length is smaller than a RecordHeader, or smaller than the record type
 * it names, is a terminal error for the stream.
 */
class DBN_PUBLIC StreamDecoder final {
public:
  explicit StreamDecoder(ProblemCallback onProblem = nullptr);

  StreamDecoder(const StreamDecoder&) = delete;
  StreamDecoder& operator=(const StreamDecoder&) = delete;
  StreamDecoder(StreamDecoder&&) = delete;
  StreamDecoder& operator=(StreamDecoder&&) = delete;

  /**
   * @brief Appends bytes to the internal buffer. Invalidates any RecordRef previously returned by
   * `decodeRecordRefs()`.
   */
  void write(const std::byte* data, uint64_t size);

  /**
   * @brief Decodes every complete item in the buffer into owned copies, replacing the contents of
   * `output`. The metadata is emitted first, exactly once. On a terminal error, items decoded
   * before the error are still placed in `output`.
   */
  Status decode(std::vector<DecodedItem>* output);

  /**
   * @brief Zero-copy variant of `decode()`. Parses the metadata if it has not been parsed yet
   * (available through `metadata()`), then replaces the contents of `output` with views into the
   * internal buffer. The views remain valid until the next call to `write()`, `decode()` or
   * `decodeRecordRefs()`.
   */
  Status decodeRecordRefs(std::vector<RecordRef>* output);

  DecoderState state() const;
  /**
   * @brief The decoded metadata, once the decoder has left `DecoderState::AwaitingMetadata`.
   */
  const std::optional<Metadata>& metadata() const;
  /**
   * @brief The buffered bytes that have not been decoded yet.
   */
  const RecordBuffer& buffer() const;
  /**
   * @brief Total number of stream bytes decoded or skipped so far.
   */
  ByteOffset consumedBytes() const;

private:
  RecordBuffer buffer_;
  ProblemCallback onProblem_;
  DecoderState state_ = DecoderState::AwaitingMetadata;
  std::optional<Metadata> metadata_;
  Status terminalStatus_;
  ByteOffset consumedBytes_ = 0;
  // 8-byte aligned copies of records that start at a misaligned buffer offset. Reset at the start
  // of each decode call and never reallocated while views into it are outstanding.
  std::vector<uint64_t> alignedRecords_;

  Status decodeMetadata_(bool* decoded);
  Status nextRecord_(std::optional<RecordRef>* output);
  const std::byte* alignRecord_(const std::byte* data, size_t size);
  Status fail_(Status status);
};

/**
 * @brief A lazy sequence of records, as consumed by `IEncoder::encodeStream()`.
 */
class DBN_PUBLIC IRecordStream {
public:
  virtual ~IRecordStream() = default;

  /**
   * @brief Returns the next record, or std::nullopt once the sequence is exhausted or failed. The
   * returned view is valid until the next call to `next()`.
   */
  virtual std::optional<RecordRef> next() = 0;
  /**
   * @brief Reports why the sequence ended. `StatusCode::Success` for a clean end.
   */
  virtual const Status& status() const = 0;
};

/**
 * @brief IRecordStream over a vector of views owned by the caller.
 */
class DBN_PUBLIC VectorRecordStream final : public IRecordStream {
public:
  explicit VectorRecordStream(const std::vector<RecordRef>& records);
  VectorRecordStream(std::vector<RecordRef>&&) = delete;

  std::optional<RecordRef> next() override;
  const Status& status() const override;

private:
  const std::vector<RecordRef>& records_;
  size_t index_ = 0;
  Status status_;
};

/**
 * @brief IRecordStream that pulls fixed-size chunks from an IReadable through a StreamDecoder.
 * Ends with `StatusCode::IncompleteStream` if the source ends partway through the metadata or a
 * record.
 */
class DBN_PUBLIC DecodingRecordStream final : public IRecordStream {
public:
  static constexpr uint64_t DefaultChunkSize = 64 * 1024;

  DecodingRecordStream(IReadable& source, uint64_t chunkSize = DefaultChunkSize,
                       ProblemCallback onProblem = nullptr);

  /**
   * @brief Reads from the source until the metadata has been decoded.
   */
  Status readMetadata();
  const std::optional<Metadata>& metadata() const;

  std::optional<RecordRef> next() override;
  const Status& status() const override;

private:
  IReadable& source_;
  uint64_t chunkSize_;
  StreamDecoder decoder_;
  ByteOffset offset_ = 0;
  std::vector<RecordRef> records_;
  size_t index_ = 0;
  Status status_;
  Status pendingStatus_;
  bool exhausted_ = false;

  bool readChunk_();
  void finishAtEnd_();
};

}  // namespace dbn

#ifdef DBN_IMPLEMENTATION
#  include "decoder.inl"
#endif
