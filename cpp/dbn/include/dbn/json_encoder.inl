#include "internal.hpp"
#include <nlohmann/json.hpp>

namespace dbn {

namespace internal {

using json = nlohmann::ordered_json;

struct JsonFieldWriter {
  json* object;
  const EncoderOptions* options;

  template <typename Int>
  void operator()(std::string_view name, Int value) {
    static_assert(std::is_integral_v<Int>);
    (*object)[std::string(name)] = value;
  }

  void operator()(std::string_view name, PriceField field) {
    auto& value = (*object)[std::string(name)];
    if (!options->prettyPx) {
      value = field.value;
    } else if (field.value == UndefPrice) {
      value = nullptr;
    } else {
      value = FormatPrice(field.value);
    }
  }

  void operator()(std::string_view name, TsField field) {
    auto& value = (*object)[std::string(name)];
    if (!options->prettyTs) {
      value = field.value;
    } else if (field.value == 0 || field.value == UndefTimestamp) {
      value = nullptr;
    } else {
      value = FormatTimestamp(field.value);
    }
  }

  void operator()(std::string_view name, CharField field) {
    (*object)[std::string(name)] =
      field.value == '\0' ? std::string() : std::string(1, field.value);
  }

  void operator()(std::string_view name, CStrField field) {
    (*object)[std::string(name)] = std::string(field.value);
  }
};

/**
 * @brief Fixed-width text fields are not guaranteed to be UTF-8, so invalid sequences are replaced
 * rather than failing the dump.
 */
inline std::string DumpLine(const json& object) {
  auto line = object.dump(-1, ' ', false, json::error_handler_t::replace);
  line.push_back('\n');
  return line;
}

inline json OptionalToJson(const std::optional<uint64_t>& value) {
  return value.has_value() ? json(*value) : json(nullptr);
}

}  // namespace internal

JsonEncoder::JsonEncoder(IWritable& output, const EncoderOptions& options)
    : output_(output)
    , options_(options) {}

Status JsonEncoder::encodeMetadata(const Metadata& metadata) {
  using internal::json;
  json object = json::object();
  object["version"] = metadata.version;
  object["dataset"] = metadata.dataset;
  object["schema"] =
    metadata.schema ? json(std::string(SchemaString(*metadata.schema))) : json(nullptr);
  object["start"] = metadata.start;
  object["end"] = internal::OptionalToJson(metadata.end);
  object["limit"] = internal::OptionalToJson(metadata.limit);
  object["record_count"] = metadata.recordCount;
  object["stype_in"] = std::string(STypeString(metadata.stypeIn));
  object["stype_out"] = std::string(STypeString(metadata.stypeOut));
  object["ts_out"] = metadata.tsOut;
  object["symbols"] = metadata.symbols;
  object["partial"] = metadata.partial;
  object["not_found"] = metadata.notFound;
  json mappings = json::array();
  for (const auto& mapping : metadata.mappings) {
    json intervals = json::array();
    for (const auto& interval : mapping.intervals) {
      intervals.push_back({{"start_date", interval.startDate},
                           {"end_date", interval.endDate},
                           {"symbol", interval.symbol}});
    }
    mappings.push_back({{"native_symbol", mapping.nativeSymbol}, {"intervals", intervals}});
  }
  object["mappings"] = std::move(mappings);

  line_ = internal::DumpLine(object);
  return output_.write(line_);
}

Status JsonEncoder::encodeRecord(const RecordRef& record) {
  RecordRefVariant typed;
  if (auto status = record.asVariant(&typed); !status.ok()) {
    return status;
  }
  std::optional<Timestamp> tsOut;
  if (options_.tsOut) {
    Timestamp value = 0;
    if (auto status = ReadTsOut(record, &value); !status.ok()) {
      return status;
    }
    tsOut = value;
  }

  internal::json object = internal::json::object();
  internal::json header = internal::json::object();
  std::visit(
    [&](const auto* rec) {
      internal::JsonFieldWriter headerFields{&header, &options_};
      ForEachHeaderField(rec->hd, headerFields);
      object["hd"] = std::move(header);
      internal::JsonFieldWriter bodyFields{&object, &options_};
      ForEachBodyField(*rec, bodyFields);
      if (tsOut.has_value()) {
        bodyFields("ts_out", TsField{*tsOut});
      }
    },
    typed);

  line_ = internal::DumpLine(object);
  return output_.write(line_);
}

Status JsonEncoder::flush() {
  return output_.flush();
}

}  // namespace dbn
