#include "internal.hpp"
#include <iterator>

namespace dbn {

namespace internal {

inline void AppendCsvString(std::string_view value, std::string* line) {
  if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
    line->append(value);
    return;
  }
  line->push_back('"');
  for (char c : value) {
    if (c == '"') {
      line->push_back('"');
    }
    line->push_back(c);
  }
  line->push_back('"');
}

struct CsvHeaderWriter {
  std::string* line;
  bool first = true;

  template <typename V>
  void operator()(std::string_view name, const V&) {
    if (!first) {
      line->push_back(',');
    }
    first = false;
    line->append(name);
  }
};

struct CsvFieldWriter {
  std::string* line;
  const EncoderOptions* options;
  bool first = true;

  void separate() {
    if (!first) {
      line->push_back(',');
    }
    first = false;
  }

  template <typename Int>
  void operator()(std::string_view, Int value) {
    static_assert(std::is_integral_v<Int>);
    separate();
    fmt::format_to(std::back_inserter(*line), "{}", value);
  }

  void operator()(std::string_view, PriceField field) {
    separate();
    if (!options->prettyPx) {
      fmt::format_to(std::back_inserter(*line), "{}", field.value);
    } else if (field.value != UndefPrice) {
      line->append(FormatPrice(field.value));
    }
  }

  void operator()(std::string_view, TsField field) {
    separate();
    if (!options->prettyTs) {
      fmt::format_to(std::back_inserter(*line), "{}", field.value);
    } else if (field.value != 0 && field.value != UndefTimestamp) {
      line->append(FormatTimestamp(field.value));
    }
  }

  void operator()(std::string_view, CharField field) {
    separate();
    if (field.value != '\0') {
      AppendCsvString(std::string_view(&field.value, 1), line);
    }
  }

  void operator()(std::string_view, CStrField field) {
    separate();
    AppendCsvString(field.value, line);
  }
};

template <typename T>
void AppendCsvHeader(const T& rec, bool tsOut, std::string* line) {
  CsvHeaderWriter header{line};
  ForEachField(rec, header);
  if (tsOut) {
    header("ts_out", TsField{});
  }
  line->push_back('\n');
}

}  // namespace internal

CsvEncoder::CsvEncoder(IWritable& output, const EncoderOptions& options)
    : output_(output)
    , options_(options) {}

Status CsvEncoder::encodeHeader(RType rtype) {
  const size_t size = MinRecordSize(rtype);
  // A zeroed record of the requested type selects the field list
  std::vector<uint64_t> storage((size + sizeof(uint64_t) - 1) / sizeof(uint64_t), 0);
  RecordHeader header{};
  header.length = uint8_t(size / LengthMultiplier);
  header.rtype = uint8_t(rtype);
  std::memcpy(storage.data(), &header, sizeof(header));

  RecordRefVariant typed;
  const RecordRef ref{reinterpret_cast<const std::byte*>(storage.data()), size};
  if (auto status = ref.asVariant(&typed); !status.ok()) {
    return status;
  }
  if (recordType_.has_value()) {
    if (*recordType_ == typed.index()) {
      return StatusCode::Success;
    }
    const auto msg = internal::StrCat("rtype 0x", internal::ToHex(uint8_t(rtype)),
                                      " does not match the type of the CSV header row");
    return Status{StatusCode::MismatchedRecordType, msg};
  }

  line_.clear();
  std::visit(
    [&](const auto* rec) {
      internal::AppendCsvHeader(*rec, options_.tsOut, &line_);
    },
    typed);
  if (auto status = output_.write(line_); !status.ok()) {
    return status;
  }
  recordType_ = typed.index();
  return StatusCode::Success;
}

Status CsvEncoder::encodeRecord(const RecordRef& record) {
  RecordRefVariant typed;
  if (auto status = record.asVariant(&typed); !status.ok()) {
    return status;
  }
  if (recordType_.has_value() && *recordType_ != typed.index()) {
    const auto msg = internal::StrCat("rtype 0x", internal::ToHex(record.header().rtype),
                                      " does not match the type of the CSV header row");
    return Status{StatusCode::MismatchedRecordType, msg};
  }
  std::optional<Timestamp> tsOut;
  if (options_.tsOut) {
    Timestamp value = 0;
    if (auto status = ReadTsOut(record, &value); !status.ok()) {
      return status;
    }
    tsOut = value;
  }

  line_.clear();
  std::visit(
    [&](const auto* rec) {
      if (!recordType_.has_value()) {
        internal::AppendCsvHeader(*rec, tsOut.has_value(), &line_);
      }
      internal::CsvFieldWriter fields{&line_, &options_};
      ForEachField(*rec, fields);
      if (tsOut.has_value()) {
        fields("ts_out", TsField{*tsOut});
      }
      line_.push_back('\n');
    },
    typed);
  if (auto status = output_.write(line_); !status.ok()) {
    return status;
  }
  recordType_ = typed.index();
  return StatusCode::Success;
}

Status CsvEncoder::flush() {
  return output_.flush();
}

}  // namespace dbn
