#pragma once

#include "encoder.hpp"
#include "fields.hpp"
#include "visibility.hpp"

namespace dbn {

/**
 * @brief Encodes records as newline-delimited JSON, one object per record with the record header
 * nested under `"hd"`. Unlike CsvEncoder, records of different types may be mixed.
 */
class DBN_PUBLIC JsonEncoder final : public IEncoder {
public:
  JsonEncoder(IWritable& output, const EncoderOptions& options = {});

  /**
   * @brief Writes the metadata as a single JSON object line.
   */
  Status encodeMetadata(const Metadata& metadata);

  Status encodeRecord(const RecordRef& record) override;
  Status flush() override;

private:
  IWritable& output_;
  EncoderOptions options_;
  std::string line_;
};

}  // namespace dbn

#ifdef DBN_IMPLEMENTATION
#  include "json_encoder.inl"
#endif
