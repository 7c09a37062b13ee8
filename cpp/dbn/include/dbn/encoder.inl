#include "internal.hpp"

namespace dbn {

namespace internal {

inline Status AppendFixedString(std::string_view str, size_t width, std::string_view fieldName,
                                ByteArray* output) {
  // Leave room for the NUL terminator
  if (str.size() >= width) {
    const auto msg = StrCat(fieldName, " \"", str, "\" is longer than ", width - 1, " characters");
    return Status{StatusCode::InvalidArgument, msg};
  }
  const size_t offset = output->size();
  output->resize(offset + width, std::byte(0));
  std::memcpy(output->data() + offset, str.data(), str.size());
  return StatusCode::Success;
}

inline void AppendUint16(uint16_t value, ByteArray* output) {
  const size_t offset = output->size();
  output->resize(offset + 2);
  WriteUint16(output->data() + offset, value);
}

inline void AppendUint32(uint32_t value, ByteArray* output) {
  const size_t offset = output->size();
  output->resize(offset + 4);
  WriteUint32(output->data() + offset, value);
}

inline void AppendUint64(uint64_t value, ByteArray* output) {
  const size_t offset = output->size();
  output->resize(offset + 8);
  WriteUint64(output->data() + offset, value);
}

inline Status AppendSymbolList(const std::vector<std::string>& symbols, std::string_view fieldName,
                               ByteArray* output) {
  AppendUint32(uint32_t(symbols.size()), output);
  for (const auto& symbol : symbols) {
    if (auto status = AppendFixedString(symbol, SymbolCstrLen, fieldName, output); !status.ok()) {
      return status;
    }
  }
  return StatusCode::Success;
}

}  // namespace internal

// IEncoder ////////////////////////////////////////////////////////////////////

Status IEncoder::encodeRecords(const std::vector<RecordRef>& records) {
  for (const RecordRef& record : records) {
    if (auto status = encodeRecord(record); !status.ok()) {
      return FinishEarly(status, record);
    }
  }
  return finish_();
}

Status IEncoder::encodeStream(IRecordStream& stream) {
  while (auto record = stream.next()) {
    if (auto status = encodeRecord(*record); !status.ok()) {
      return FinishEarly(status, *record);
    }
  }
  if (!stream.status().ok()) {
    return stream.status();
  }
  return finish_();
}

Status IEncoder::encodeStream(IRecordStream& stream, const Metadata& metadata) {
  if (metadata.schema.has_value()) {
    const RType rtype = RTypeFromSchema(*metadata.schema);
    if (auto status = encodeHeader(rtype); !status.ok()) {
      return FinishHeader(status, rtype);
    }
  }
  return encodeStream(stream);
}

Status IEncoder::FinishHeader(const Status& status, RType rtype) {
  if (status.code == StatusCode::SinkClosed) {
    return StatusCode::Success;
  }
  const auto msg = internal::StrCat("failed to encode header for rtype 0x",
                                    internal::ToHex(uint8_t(rtype)), ": ", status.message);
  return Status{status.code, msg};
}

Status IEncoder::FinishEarly(const Status& status, const RecordRef& record) {
  if (status.code == StatusCode::SinkClosed) {
    return StatusCode::Success;
  }
  const auto& hd = record.header();
  const auto msg = internal::StrCat(
    "failed to encode record with rtype 0x", internal::ToHex(hd.rtype), ", publisher_id ",
    hd.publisherId, ", product_id ", hd.productId, ", ts_event ", hd.tsEvent, ": ", status.message);
  return Status{status.code, msg};
}

Status IEncoder::ReadTsOut(const RecordRef& record, Timestamp* output) {
  RType rtype;
  if (auto status = record.rtype(&rtype); !status.ok()) {
    return status;
  }
  const size_t offset = MinRecordSize(rtype);
  if (record.recordSize() < offset + sizeof(Timestamp)) {
    const auto msg = internal::StrCat("record of ", record.recordSize(),
                                      " bytes is too short to carry ts_out");
    return Status{StatusCode::TruncatedRecord, msg};
  }
  *output = internal::ParseUint64(record.data() + offset);
  return StatusCode::Success;
}

Status IEncoder::finish_() {
  auto status = flush();
  if (status.code == StatusCode::SinkClosed) {
    return StatusCode::Success;
  }
  return status;
}

// MetadataEncoder /////////////////////////////////////////////////////////////

Status MetadataEncoder::EncodeMetadata(const Metadata& metadata, ByteArray* output) {
  if (metadata.version != DbnVersion) {
    const auto msg = internal::StrCat("cannot encode DBN version ", unsigned(metadata.version));
    return Status{StatusCode::UnsupportedVersion, msg};
  }

  ByteArray encoded;
  for (uint8_t byte : Magic) {
    encoded.push_back(std::byte(byte));
  }
  encoded.push_back(std::byte(metadata.version));
  // Frame length, filled in once the variable-length sections are written
  internal::AppendUint32(0, &encoded);
  if (auto status =
        internal::AppendFixedString(metadata.dataset, DatasetCstrLen, "dataset", &encoded);
      !status.ok()) {
    return status;
  }
  internal::AppendUint16(metadata.schema ? uint16_t(*metadata.schema) : MixedSchema, &encoded);
  internal::AppendUint64(metadata.start, &encoded);
  internal::AppendUint64(metadata.end.value_or(UndefTimestamp), &encoded);
  internal::AppendUint64(metadata.limit.value_or(0), &encoded);
  internal::AppendUint64(metadata.recordCount, &encoded);
  encoded.push_back(std::byte(metadata.stypeIn));
  encoded.push_back(std::byte(metadata.stypeOut));
  encoded.push_back(std::byte(metadata.tsOut ? 1 : 0));
  encoded.resize(encoded.size() + MetadataReservedLen, std::byte(0));
  // Schema definition length
  internal::AppendUint32(0, &encoded);

  if (auto status = internal::AppendSymbolList(metadata.symbols, "symbol", &encoded);
      !status.ok()) {
    return status;
  }
  if (auto status = internal::AppendSymbolList(metadata.partial, "partial symbol", &encoded);
      !status.ok()) {
    return status;
  }
  if (auto status = internal::AppendSymbolList(metadata.notFound, "not found symbol", &encoded);
      !status.ok()) {
    return status;
  }
  internal::AppendUint32(uint32_t(metadata.mappings.size()), &encoded);
  for (const auto& mapping : metadata.mappings) {
    if (auto status = internal::AppendFixedString(mapping.nativeSymbol, SymbolCstrLen,
                                                  "native symbol", &encoded);
        !status.ok()) {
      return status;
    }
    internal::AppendUint32(uint32_t(mapping.intervals.size()), &encoded);
    for (const auto& interval : mapping.intervals) {
      internal::AppendUint32(interval.startDate, &encoded);
      internal::AppendUint32(interval.endDate, &encoded);
      if (auto status = internal::AppendFixedString(interval.symbol, SymbolCstrLen,
                                                    "mapped symbol", &encoded);
          !status.ok()) {
        return status;
      }
    }
  }

  const uint64_t frameLength = encoded.size() - internal::MetadataPrefixLength;
  if (frameLength > std::numeric_limits<uint32_t>::max()) {
    const auto msg = internal::StrCat("encoded metadata of ", frameLength, " bytes is too large");
    return Status{StatusCode::InvalidArgument, msg};
  }
  internal::WriteUint32(encoded.data() + sizeof(Magic) + 1, uint32_t(frameLength));
  output->insert(output->end(), encoded.begin(), encoded.end());
  return StatusCode::Success;
}

Status MetadataEncoder::UpdateEncodedMetadata(std::byte* data, uint64_t size, Timestamp start,
                                              std::optional<Timestamp> end,
                                              std::optional<uint64_t> limit,
                                              uint64_t recordCount) {
  std::optional<uint64_t> length;
  if (auto status = MetadataDecoder::PeekMetadataLength(data, size, &length); !status.ok()) {
    return status;
  }
  if (!length.has_value() || size < *length) {
    const auto msg = internal::StrCat("cannot update metadata in ", size, "-byte buffer");
    return Status{StatusCode::InvalidMetadata, msg};
  }
  std::byte* fields = data + internal::MetadataStartOffset;
  internal::WriteUint64(fields, start);
  internal::WriteUint64(fields + 8, end.value_or(UndefTimestamp));
  internal::WriteUint64(fields + 16, limit.value_or(0));
  internal::WriteUint64(fields + 24, recordCount);
  return StatusCode::Success;
}

// DbnEncoder //////////////////////////////////////////////////////////////////

DbnEncoder::DbnEncoder(IWritable& output)
    : output_(output) {}

Status DbnEncoder::encodeMetadata(const Metadata& metadata) {
  if (wroteMetadata_) {
    return Status{StatusCode::InvalidArgument, "metadata has already been encoded"};
  }
  ByteArray encoded;
  if (auto status = MetadataEncoder::EncodeMetadata(metadata, &encoded); !status.ok()) {
    return status;
  }
  if (auto status = output_.write(encoded.data(), encoded.size()); !status.ok()) {
    return status;
  }
  wroteMetadata_ = true;
  return StatusCode::Success;
}

Status DbnEncoder::encodeRecord(const RecordRef& record) {
  if (!wroteMetadata_) {
    return Status{StatusCode::InvalidArgument, "metadata must be encoded before records"};
  }
  return output_.write(record.data(), record.recordSize());
}

Status DbnEncoder::flush() {
  return output_.flush();
}

}  // namespace dbn
