#pragma once

#include "decoder.hpp"
#include "record_ref.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include "writer.hpp"

namespace dbn {

/**
 * @brief Presentation options for text encoders.
 */
struct DBN_PUBLIC EncoderOptions {
  /**
   * @brief Write prices as decimals instead of fixed-precision integers. Undefined prices are
   * written as empty values.
   */
  bool prettyPx = false;
  /**
   * @brief Write timestamps as ISO 8601 instead of integer nanoseconds. Zero and undefined
   * timestamps are written as empty values.
   */
  bool prettyTs = false;
  /**
   * @brief Records carry a trailing `ts_out` send timestamp, written as a final field. Set from
   * `Metadata::tsOut`.
   */
  bool tsOut = false;
};

/**
 * @brief The sink contract shared by every encoder. `encodeRecord()` returns
 * `StatusCode::SinkClosed` when the output has gone away and encoding should stop early; the bulk
 * methods treat this as a clean stop and return `StatusCode::Success`. Any other failure is
 * returned with the identity of the record that caused it.
 */
class DBN_PUBLIC IEncoder {
public:
  virtual ~IEncoder() = default;

  /**
   * @brief Encodes a single record.
   */
  virtual Status encodeRecord(const RecordRef& record) = 0;

  /**
   * @brief Flushes buffered output to the sink.
   */
  virtual Status flush() {
    return StatusCode::Success;
  }

  /**
   * @brief Writes whatever the output format places ahead of records of type `rtype`, such as a
   * CSV header row. Called by the bulk methods that know the record type up front, so the output
   * is well-formed even when there are no records. The default writes nothing.
   */
  virtual Status encodeHeader(RType /*rtype*/) {
    return StatusCode::Success;
  }

  /**
   * @brief Encodes every record in order, stopping early if the sink is closed.
   */
  Status encodeRecords(const std::vector<RecordRef>& records);

  /**
   * @brief Encodes typed records, writing the header for `T` first even if `records` is empty.
   */
  template <typename T>
  Status encodeRecords(const std::vector<T>& records) {
    const auto rtype = records.empty() ? RTypeOf<T>() : ParseRType(records.front().hd.rtype);
    if (rtype.has_value()) {
      if (auto status = encodeHeader(*rtype); !status.ok()) {
        return FinishHeader(status, *rtype);
      }
    }
    for (const T& record : records) {
      const auto ref = RecordRef::FromRecord(record);
      if (auto status = encodeRecord(ref); !status.ok()) {
        return FinishEarly(status, ref);
      }
    }
    return finish_();
  }

  /**
   * @brief Encodes every record of a lazy sequence, stopping early if the sink is closed. Fails
   * with the stream's status if the sequence ends abnormally.
   */
  Status encodeStream(IRecordStream& stream);
  /**
   * @brief Like `encodeStream(stream)`, but first writes the header for the record type of
   * `metadata.schema` when the stream holds a single schema.
   */
  Status encodeStream(IRecordStream& stream, const Metadata& metadata);

protected:
  /**
   * @brief Converts the status of a failed `encodeRecord()` into the result of a bulk encode.
   */
  static Status FinishEarly(const Status& status, const RecordRef& record);
  /**
   * @brief Converts the status of a failed `encodeHeader()` into the result of a bulk encode.
   */
  static Status FinishHeader(const Status& status, RType rtype);
  /**
   * @brief Reads the `ts_out` timestamp following the fixed layout of a record's type. Fails with
   * `StatusCode::TruncatedRecord` if the record is too short to carry one.
   */
  static Status ReadTsOut(const RecordRef& record, Timestamp* output);

private:
  Status finish_();
};

/**
 * @brief Writes the binary metadata preamble.
 */
struct DBN_PUBLIC MetadataEncoder {
  /**
   * @brief Encodes `metadata` in the DBN version 1 layout, appending to `output`. Fails with
   * `StatusCode::InvalidArgument` if a string does not fit its fixed-width field.
   */
  static Status EncodeMetadata(const Metadata& metadata, ByteArray* output);

  /**
   * @brief Rewrites the start, end, limit and record count of an already encoded metadata block
   * in place, e.g. once the number of records in a file is known.
   */
  static Status UpdateEncodedMetadata(std::byte* data, uint64_t size, Timestamp start,
                                      std::optional<Timestamp> end, std::optional<uint64_t> limit,
                                      uint64_t recordCount);
};

/**
 * @brief Encodes a binary DBN stream: the metadata preamble followed by records copied verbatim.
 */
class DBN_PUBLIC DbnEncoder final : public IEncoder {
public:
  DbnEncoder(IWritable& output);

  /**
   * @brief Writes the metadata preamble. Must be called once before any records are encoded.
   */
  Status encodeMetadata(const Metadata& metadata);

  Status encodeRecord(const RecordRef& record) override;
  Status flush() override;

private:
  IWritable& output_;
  bool wroteMetadata_ = false;
};

}  // namespace dbn

#ifdef DBN_IMPLEMENTATION
#  include "encoder.inl"
#endif
