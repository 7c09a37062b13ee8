#include "internal.hpp"
#include <algorithm>
#include <cassert>

namespace dbn {

// RecordBuffer ////////////////////////////////////////////////////////////////

RecordBuffer::RecordBuffer(size_t initialCapacity)
    : buffer_(initialCapacity) {}

void RecordBuffer::append(const std::byte* data, size_t size) {
  if (size == 0) {
    return;
  }
  if (writePos_ + size > buffer_.size()) {
    buffer_.resize(std::max(writePos_ + size, buffer_.size() * 2));
  }
  std::memcpy(buffer_.data() + writePos_, data, size);
  writePos_ += size;
}

const std::byte* RecordBuffer::readData() const {
  return buffer_.data() + readPos_;
}

size_t RecordBuffer::readableSize() const {
  return writePos_ - readPos_;
}

void RecordBuffer::consume(size_t size) {
  assert(size <= readableSize());
  readPos_ += size;
}

void RecordBuffer::compact() {
  if (readPos_ == 0) {
    return;
  }
  const size_t unread = writePos_ - readPos_;
  if (unread > 0) {
    std::memmove(buffer_.data(), buffer_.data() + readPos_, unread);
  }
  readPos_ = 0;
  writePos_ = unread;
}

void RecordBuffer::clear() {
  readPos_ = 0;
  writePos_ = 0;
}

// MetadataDecoder /////////////////////////////////////////////////////////////

Status MetadataDecoder::PeekMetadataLength(const std::byte* data, uint64_t size,
                                           std::optional<uint64_t>* length) {
  length->reset();
  const uint64_t magicAvailable = std::min<uint64_t>(size, sizeof(Magic));
  for (uint64_t i = 0; i < magicAvailable; ++i) {
    if (data[i] != std::byte(Magic[i])) {
      const auto msg = internal::StrCat("invalid magic byte 0x", internal::ToHex(data[i]),
                                        " at offset ", i, ", expected \"DBN\"");
      return Status{StatusCode::InvalidMetadata, msg};
    }
  }
  if (size < sizeof(Magic) + 1) {
    return StatusCode::Success;
  }
  const uint8_t version = uint8_t(data[sizeof(Magic)]);
  if (version != DbnVersion) {
    const auto msg = internal::StrCat("unsupported DBN version ", unsigned(version),
                                      ", expected ", unsigned(DbnVersion));
    return Status{StatusCode::UnsupportedVersion, msg};
  }
  if (size < internal::MetadataPrefixLength) {
    return StatusCode::Success;
  }
  const uint32_t frameLength = internal::ParseUint32(data + sizeof(Magic) + 1);
  // The fixed fields are followed by at least the four list counts
  constexpr uint64_t minFrameLength = internal::MetadataFixedLength + 4 * 4;
  if (frameLength < minFrameLength) {
    const auto msg = internal::StrCat("metadata frame length ", frameLength,
                                      " is less than the minimum of ", minFrameLength);
    return Status{StatusCode::InvalidMetadata, msg};
  }
  *length = internal::MetadataPrefixLength + frameLength;
  return StatusCode::Success;
}

Status MetadataDecoder::ParseMetadata(const std::byte* data, uint64_t size, Metadata* output) {
  std::optional<uint64_t> length;
  if (auto status = PeekMetadataLength(data, size, &length); !status.ok()) {
    return status;
  }
  if (!length.has_value() || size < *length) {
    const auto msg = internal::StrCat("metadata is incomplete, only ", size, " bytes available");
    return Status{StatusCode::InvalidMetadata, msg};
  }

  Metadata metadata;
  const uint64_t end = *length;
  uint64_t offset = internal::MetadataPrefixLength;
  metadata.version = uint8_t(data[sizeof(Magic)]);
  metadata.dataset = std::string(internal::ParseFixedString(data + offset, DatasetCstrLen));
  offset += DatasetCstrLen;
  const uint16_t schema = internal::ParseUint16(data + offset);
  offset += 2;
  if (schema == MixedSchema) {
    metadata.schema = std::nullopt;
  } else if (schema <= uint16_t(Schema::Imbalance)) {
    metadata.schema = Schema(schema);
  } else {
    return Status{StatusCode::InvalidMetadata, internal::StrCat("invalid schema ", schema)};
  }
  metadata.start = internal::ParseUint64(data + offset);
  offset += 8;
  const Timestamp endTs = internal::ParseUint64(data + offset);
  offset += 8;
  if (endTs != UndefTimestamp) {
    metadata.end = endTs;
  }
  const uint64_t limit = internal::ParseUint64(data + offset);
  offset += 8;
  if (limit != 0) {
    metadata.limit = limit;
  }
  metadata.recordCount = internal::ParseUint64(data + offset);
  offset += 8;
  const uint8_t stypeIn = uint8_t(data[offset++]);
  const uint8_t stypeOut = uint8_t(data[offset++]);
  if (stypeIn > uint8_t(SType::Smart) || stypeOut > uint8_t(SType::Smart)) {
    const auto msg = internal::StrCat("invalid stype_in ", unsigned(stypeIn), " or stype_out ",
                                      unsigned(stypeOut));
    return Status{StatusCode::InvalidMetadata, msg};
  }
  metadata.stypeIn = SType(stypeIn);
  metadata.stypeOut = SType(stypeOut);
  const uint8_t tsOut = uint8_t(data[offset++]);
  if (tsOut > 1) {
    return Status{StatusCode::InvalidMetadata,
                  internal::StrCat("invalid ts_out flag ", unsigned(tsOut))};
  }
  metadata.tsOut = tsOut == 1;
  offset += MetadataReservedLen;
  const uint32_t schemaDefinitionLength = internal::ParseUint32(data + offset);
  offset += 4;
  if (schemaDefinitionLength != 0) {
    const auto msg = internal::StrCat("schema definitions are not supported, found ",
                                      schemaDefinitionLength, " bytes");
    return Status{StatusCode::InvalidMetadata, msg};
  }

  for (auto* list : {&metadata.symbols, &metadata.partial, &metadata.notFound}) {
    uint64_t bytesRead = 0;
    if (auto status = internal::ParseSymbolList(data + offset, end - offset, list, &bytesRead);
        !status.ok()) {
      return status;
    }
    offset += bytesRead;
  }

  uint32_t mappingCount = 0;
  if (auto status = internal::ParseUint32(data + offset, end - offset, &mappingCount);
      !status.ok()) {
    return status;
  }
  offset += 4;
  // Every mapping holds at least a native symbol and an interval count
  if (uint64_t(mappingCount) * (SymbolCstrLen + 4) > end - offset) {
    const auto msg = internal::StrCat("mapping count ", mappingCount,
                                      " exceeds remaining bytes ", (end - offset));
    return Status{StatusCode::InvalidMetadata, msg};
  }
  metadata.mappings.reserve(mappingCount);
  for (uint32_t i = 0; i < mappingCount; ++i) {
    SymbolMapping mapping;
    if (auto status = internal::ParseFixedString(data + offset, end - offset, SymbolCstrLen,
                                                 &mapping.nativeSymbol);
        !status.ok()) {
      return status;
    }
    offset += SymbolCstrLen;
    uint32_t intervalCount = 0;
    if (auto status = internal::ParseUint32(data + offset, end - offset, &intervalCount);
        !status.ok()) {
      return status;
    }
    offset += 4;
    constexpr uint64_t intervalLength = 4 + 4 + SymbolCstrLen;
    if (uint64_t(intervalCount) * intervalLength > end - offset) {
      const auto msg = internal::StrCat("interval count ", intervalCount, " for symbol \"",
                                        mapping.nativeSymbol, "\" exceeds remaining bytes ",
                                        (end - offset));
      return Status{StatusCode::InvalidMetadata, msg};
    }
    mapping.intervals.reserve(intervalCount);
    for (uint32_t j = 0; j < intervalCount; ++j) {
      MappingInterval interval;
      interval.startDate = internal::ParseUint32(data + offset);
      interval.endDate = internal::ParseUint32(data + offset + 4);
      interval.symbol =
        std::string(internal::ParseFixedString(data + offset + 8, SymbolCstrLen));
      offset += intervalLength;
      mapping.intervals.push_back(std::move(interval));
    }
    metadata.mappings.push_back(std::move(mapping));
  }

  *output = std::move(metadata);
  return StatusCode::Success;
}

// StreamDecoder ///////////////////////////////////////////////////////////////

StreamDecoder::StreamDecoder(ProblemCallback onProblem)
    : onProblem_(std::move(onProblem)) {}

void StreamDecoder::write(const std::byte* data, uint64_t size) {
  buffer_.append(data, size);
}

Status StreamDecoder::decode(std::vector<DecodedItem>* output) {
  output->clear();
  if (state_ == DecoderState::Failed) {
    return terminalStatus_;
  }
  buffer_.compact();
  alignedRecords_.clear();
  if (state_ == DecoderState::AwaitingMetadata) {
    bool decoded = false;
    if (auto status = decodeMetadata_(&decoded); !status.ok() || !decoded) {
      return status;
    }
    output->emplace_back(*metadata_);
  }

  Status status;
  while (true) {
    std::optional<RecordRef> ref;
    status = nextRecord_(&ref);
    if (!status.ok() || !ref.has_value()) {
      break;
    }
    DecodedRecord decoded;
    if (status = ref->toOwned(&decoded.record); !status.ok()) {
      status = fail_(status);
      break;
    }
    if (metadata_->tsOut) {
      const size_t minSize = MinRecordSize(RType(ref->header().rtype));
      if (ref->recordSize() >= minSize + sizeof(Timestamp)) {
        decoded.tsOut = internal::ParseUint64(ref->data() + minSize);
      }
    }
    output->emplace_back(std::move(decoded));
  }
  buffer_.compact();
  return status;
}

Status StreamDecoder::decodeRecordRefs(std::vector<RecordRef>* output) {
  output->clear();
  if (state_ == DecoderState::Failed) {
    return terminalStatus_;
  }
  // Views returned by the previous call are invalidated from here on
  buffer_.compact();
  alignedRecords_.clear();
  if (state_ == DecoderState::AwaitingMetadata) {
    bool decoded = false;
    if (auto status = decodeMetadata_(&decoded); !status.ok() || !decoded) {
      return status;
    }
  }

  while (true) {
    std::optional<RecordRef> ref;
    if (auto status = nextRecord_(&ref); !status.ok()) {
      return status;
    }
    if (!ref.has_value()) {
      return StatusCode::Success;
    }
    output->push_back(*ref);
  }
}

DecoderState StreamDecoder::state() const {
  return state_;
}

const std::optional<Metadata>& StreamDecoder::metadata() const {
  return metadata_;
}

const RecordBuffer& StreamDecoder::buffer() const {
  return buffer_;
}

ByteOffset StreamDecoder::consumedBytes() const {
  return consumedBytes_;
}

Status StreamDecoder::decodeMetadata_(bool* decoded) {
  *decoded = false;
  std::optional<uint64_t> length;
  if (auto status = MetadataDecoder::PeekMetadataLength(buffer_.readData(),
                                                        buffer_.readableSize(), &length);
      !status.ok()) {
    return status;
  }
  if (!length.has_value() || buffer_.readableSize() < *length) {
    return StatusCode::Success;
  }
  Metadata metadata;
  if (auto status = MetadataDecoder::ParseMetadata(buffer_.readData(), *length, &metadata);
      !status.ok()) {
    return status;
  }
  metadata_ = std::move(metadata);
  buffer_.consume(*length);
  consumedBytes_ += *length;
  // Records must start on an 8-byte boundary regardless of the metadata length
  buffer_.compact();
  state_ = DecoderState::StreamingRecords;
  *decoded = true;
  return StatusCode::Success;
}

Status StreamDecoder::nextRecord_(std::optional<RecordRef>* output) {
  output->reset();
  while (true) {
    if (buffer_.readableSize() < sizeof(RecordHeader)) {
      return StatusCode::Success;
    }

    RecordHeader header;
    std::memcpy(&header, buffer_.readData(), sizeof(RecordHeader));
    const size_t recordSize = header.recordSize();
    if (recordSize < sizeof(RecordHeader)) {
      const auto msg =
        internal::StrCat("record at offset ", consumedBytes_, " has length ", recordSize,
                         " bytes, less than the ", sizeof(RecordHeader), "-byte record header");
      return fail_(Status{StatusCode::TruncatedRecord, msg});
    }
    const auto rtype = ParseRType(header.rtype);
    if (rtype.has_value() && recordSize < MinRecordSize(*rtype)) {
      const auto msg = internal::StrCat("rtype 0x", internal::ToHex(header.rtype),
                                        " record at offset ", consumedBytes_, " has length ",
                                        recordSize, " bytes, expected at least ",
                                        MinRecordSize(*rtype));
      return fail_(Status{StatusCode::TruncatedRecord, msg});
    }
    if (recordSize > buffer_.readableSize()) {
      return StatusCode::Success;
    }

    const std::byte* data = buffer_.readData();
    const ByteOffset recordOffset = consumedBytes_;
    buffer_.consume(recordSize);
    consumedBytes_ += recordSize;
    if (!rtype.has_value()) {
      if (onProblem_) {
        const auto msg = internal::StrCat("skipped ", recordSize, "-byte record with unknown rtype 0x",
                                          internal::ToHex(data[1]), " at offset ", recordOffset);
        onProblem_(Status{StatusCode::UnknownRecordType, msg});
      }
      continue;
    }
    if (!internal::IsAligned(data, alignof(RecordHeader))) {
      data = alignRecord_(data, recordSize);
    }
    output->emplace(data, recordSize);
    return StatusCode::Success;
  }
}

const std::byte* StreamDecoder::alignRecord_(const std::byte* data, size_t size) {
  const size_t words = (size + sizeof(uint64_t) - 1) / sizeof(uint64_t);
  if (alignedRecords_.empty()) {
    // Each record is at least 16 bytes, so padding a record to whole words at most adds half its
    // size. This bounds the copies of every record still buffered.
    const size_t remaining = size + buffer_.readableSize();
    alignedRecords_.reserve((remaining * 3) / (2 * sizeof(uint64_t)) + 1);
  }
  const size_t offset = alignedRecords_.size();
  assert(offset + words <= alignedRecords_.capacity());
  alignedRecords_.resize(offset + words);
  std::memcpy(alignedRecords_.data() + offset, data, size);
  return reinterpret_cast<const std::byte*>(alignedRecords_.data() + offset);
}

Status StreamDecoder::fail_(Status status) {
  state_ = DecoderState::Failed;
  terminalStatus_ = status;
  return status;
}

// VectorRecordStream //////////////////////////////////////////////////////////

VectorRecordStream::VectorRecordStream(const std::vector<RecordRef>& records)
    : records_(records) {}

std::optional<RecordRef> VectorRecordStream::next() {
  if (index_ >= records_.size()) {
    return std::nullopt;
  }
  return records_[index_++];
}

const Status& VectorRecordStream::status() const {
  return status_;
}

// DecodingRecordStream ////////////////////////////////////////////////////////

DecodingRecordStream::DecodingRecordStream(IReadable& source, uint64_t chunkSize,
                                           ProblemCallback onProblem)
    : source_(source)
    , chunkSize_(chunkSize)
    , decoder_(std::move(onProblem)) {
  assert(chunkSize_ > 0);
}

Status DecodingRecordStream::readMetadata() {
  while (!decoder_.metadata().has_value()) {
    if (!status_.ok() || exhausted_) {
      return status_;
    }
    if (!readChunk_()) {
      finishAtEnd_();
      return status_;
    }
    index_ = 0;
    if (auto status = decoder_.decodeRecordRefs(&records_); !status.ok()) {
      if (!decoder_.metadata().has_value()) {
        status_ = status;
        return status_;
      }
      pendingStatus_ = status;
    }
  }
  return StatusCode::Success;
}

const std::optional<Metadata>& DecodingRecordStream::metadata() const {
  return decoder_.metadata();
}

std::optional<RecordRef> DecodingRecordStream::next() {
  while (true) {
    if (index_ < records_.size()) {
      return records_[index_++];
    }
    if (!status_.ok() || exhausted_) {
      return std::nullopt;
    }
    if (!pendingStatus_.ok()) {
      status_ = pendingStatus_;
      return std::nullopt;
    }
    index_ = 0;
    if (auto status = decoder_.decodeRecordRefs(&records_); !status.ok()) {
      pendingStatus_ = status;
      continue;
    }
    if (records_.empty() && !readChunk_()) {
      finishAtEnd_();
    }
  }
}

const Status& DecodingRecordStream::status() const {
  return status_;
}

bool DecodingRecordStream::readChunk_() {
  std::byte* data = nullptr;
  const uint64_t bytesRead = source_.read(&data, offset_, chunkSize_);
  if (bytesRead == 0) {
    return false;
  }
  decoder_.write(data, bytesRead);
  offset_ += bytesRead;
  return true;
}

void DecodingRecordStream::finishAtEnd_() {
  exhausted_ = true;
  if (auto status = source_.status(); !status.ok()) {
    status_ = status;
  } else if (offset_ < source_.size()) {
    const auto msg = internal::StrCat("read of ", chunkSize_, " bytes at offset ", offset_,
                                      " returned no data, source size is ", source_.size());
    status_ = Status{StatusCode::ReadFailed, msg};
  } else if (!decoder_.metadata().has_value()) {
    const auto msg =
      internal::StrCat("source ended after ", offset_, " bytes, before the end of the metadata");
    status_ = Status{StatusCode::IncompleteStream, msg};
  } else if (decoder_.buffer().readableSize() > 0) {
    const auto msg = internal::StrCat("source ended with ", decoder_.buffer().readableSize(),
                                      " bytes of an incomplete record at offset ",
                                      decoder_.consumedBytes());
    status_ = Status{StatusCode::IncompleteStream, msg};
  }
}

}  // namespace dbn
