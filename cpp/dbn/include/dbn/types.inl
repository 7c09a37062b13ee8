#include "internal.hpp"

namespace dbn {

std::string_view RTypeString(RType rtype) {
  switch (rtype) {
    case RType::Mbp0:
      return "Mbp0";
    case RType::Mbp1:
      return "Mbp1";
    case RType::Mbp10:
      return "Mbp10";
    case RType::OhlcvDeprecated:
      return "OhlcvDeprecated";
    case RType::Status:
      return "Status";
    case RType::InstrumentDef:
      return "InstrumentDef";
    case RType::Imbalance:
      return "Imbalance";
    case RType::Error:
      return "Error";
    case RType::SymbolMapping:
      return "SymbolMapping";
    case RType::System:
      return "System";
    case RType::Statistics:
      return "Statistics";
    case RType::Ohlcv1S:
      return "Ohlcv1S";
    case RType::Ohlcv1M:
      return "Ohlcv1M";
    case RType::Ohlcv1H:
      return "Ohlcv1H";
    case RType::Ohlcv1D:
      return "Ohlcv1D";
    case RType::Mbo:
      return "Mbo";
    default:
      return "Unknown";
  }
}

std::optional<RType> ParseRType(uint8_t rtype) {
  switch (RType(rtype)) {
    case RType::Mbp0:
    case RType::Mbp1:
    case RType::Mbp10:
    case RType::OhlcvDeprecated:
    case RType::Status:
    case RType::InstrumentDef:
    case RType::Imbalance:
    case RType::Error:
    case RType::SymbolMapping:
    case RType::System:
    case RType::Statistics:
    case RType::Ohlcv1S:
    case RType::Ohlcv1M:
    case RType::Ohlcv1H:
    case RType::Ohlcv1D:
    case RType::Mbo:
      return RType(rtype);
    default:
      return std::nullopt;
  }
}

RType RTypeFromSchema(Schema schema) {
  switch (schema) {
    case Schema::Mbo:
      return RType::Mbo;
    case Schema::Mbp10:
      return RType::Mbp10;
    case Schema::Mbp1:
    case Schema::Tbbo:
      return RType::Mbp1;
    case Schema::Trades:
      return RType::Mbp0;
    case Schema::Ohlcv1S:
      return RType::Ohlcv1S;
    case Schema::Ohlcv1M:
      return RType::Ohlcv1M;
    case Schema::Ohlcv1H:
      return RType::Ohlcv1H;
    case Schema::Ohlcv1D:
      return RType::Ohlcv1D;
    case Schema::Definition:
      return RType::InstrumentDef;
    case Schema::Statistics:
      return RType::Statistics;
    case Schema::Status:
      return RType::Status;
    case Schema::Imbalance:
    default:
      return RType::Imbalance;
  }
}

std::string_view SchemaString(Schema schema) {
  switch (schema) {
    case Schema::Mbo:
      return "mbo";
    case Schema::Mbp10:
      return "mbp-10";
    case Schema::Mbp1:
      return "mbp-1";
    case Schema::Tbbo:
      return "tbbo";
    case Schema::Trades:
      return "trades";
    case Schema::Ohlcv1S:
      return "ohlcv-1s";
    case Schema::Ohlcv1M:
      return "ohlcv-1m";
    case Schema::Ohlcv1H:
      return "ohlcv-1h";
    case Schema::Ohlcv1D:
      return "ohlcv-1d";
    case Schema::Definition:
      return "definition";
    case Schema::Statistics:
      return "statistics";
    case Schema::Status:
      return "status";
    case Schema::Imbalance:
      return "imbalance";
    default:
      return "unknown";
  }
}

std::optional<Schema> ParseSchema(std::string_view schema) {
  for (uint16_t value = uint16_t(Schema::Mbo); value <= uint16_t(Schema::Imbalance); ++value) {
    if (SchemaString(Schema(value)) == schema) {
      return Schema(value);
    }
  }
  return std::nullopt;
}

std::string_view STypeString(SType stype) {
  switch (stype) {
    case SType::ProductId:
      return "product_id";
    case SType::Native:
      return "native";
    case SType::Smart:
      return "smart";
    default:
      return "unknown";
  }
}

std::optional<SType> ParseSType(std::string_view stype) {
  if (stype == "product_id") {
    return SType::ProductId;
  } else if (stype == "native") {
    return SType::Native;
  } else if (stype == "smart") {
    return SType::Smart;
  } else {
    return std::nullopt;
  }
}

bool MappingInterval::operator==(const MappingInterval& other) const {
  return startDate == other.startDate && endDate == other.endDate && symbol == other.symbol;
}

bool SymbolMapping::operator==(const SymbolMapping& other) const {
  return nativeSymbol == other.nativeSymbol && intervals == other.intervals;
}

bool Metadata::operator==(const Metadata& other) const {
  return version == other.version && dataset == other.dataset && schema == other.schema &&
         start == other.start && end == other.end && limit == other.limit &&
         recordCount == other.recordCount && stypeIn == other.stypeIn &&
         stypeOut == other.stypeOut && tsOut == other.tsOut && symbols == other.symbols &&
         partial == other.partial && notFound == other.notFound && mappings == other.mappings;
}

}  // namespace dbn
