#pragma once

#include "encoder.hpp"
#include "fields.hpp"
#include "visibility.hpp"

namespace dbn {

/**
 * @brief Encodes records as comma-separated values. A header row naming the fields of the first
 * record's type is written before the first record, and every following record must be of the
 * same type.
 */
class DBN_PUBLIC CsvEncoder final : public IEncoder {
public:
  CsvEncoder(IWritable& output, const EncoderOptions& options = {});

  /**
   * @brief Writes the header row for `rtype` ahead of any record. Succeeds without writing if the
   * header row for the same record type was already written.
   */
  Status encodeHeader(RType rtype) override;
  Status encodeRecord(const RecordRef& record) override;
  Status flush() override;

private:
  IWritable& output_;
  EncoderOptions options_;
  std::string line_;
  std::optional<size_t> recordType_;
};

}  // namespace dbn

#ifdef DBN_IMPLEMENTATION
#  include "csv_encoder.inl"
#endif
