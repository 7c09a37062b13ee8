#pragma once

#include <string>

namespace dbn {

/**
 * @brief Status codes for DBN decoders and encoders.
 */
enum class StatusCode {
  Success = 0,
  UnknownRecordType,
  TruncatedRecord,
  InvalidMetadata,
  UnsupportedVersion,
  IncompleteStream,
  OpenFailed,
  ReadFailed,
  WriteFailed,
  SinkClosed,
  MismatchedRecordType,
  InvalidArgument,
};

/**
 * @brief Wraps a status code and string message carrying additional context.
 */
struct [[nodiscard]] Status {
  StatusCode code;
  std::string message;

  Status()
      : code(StatusCode::Success) {}

  Status(StatusCode _code)
      : code(_code) {
    switch (code) {
      case StatusCode::Success:
        break;
      case StatusCode::UnknownRecordType:
        message = "unknown record type";
        break;
      case StatusCode::TruncatedRecord:
        message = "truncated record";
        break;
      case StatusCode::InvalidMetadata:
        message = "invalid metadata";
        break;
      case StatusCode::UnsupportedVersion:
        message = "unsupported DBN version";
        break;
      case StatusCode::IncompleteStream:
        message = "stream ended with an incomplete record";
        break;
      case StatusCode::OpenFailed:
        message = "open failed";
        break;
      case StatusCode::ReadFailed:
        message = "read failed";
        break;
      case StatusCode::WriteFailed:
        message = "write failed";
        break;
      case StatusCode::SinkClosed:
        message = "sink closed";
        break;
      case StatusCode::MismatchedRecordType:
        message = "record type does not match the encoder's schema";
        break;
      case StatusCode::InvalidArgument:
        message = "invalid argument";
        break;
      default:
        message = "unknown";
        break;
    }
  }

  Status(StatusCode _code, const std::string& _message)
      : code(_code)
      , message(_message) {}

  bool ok() const {
    return code == StatusCode::Success;
  }
};

}  // namespace dbn
