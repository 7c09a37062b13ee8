#pragma once

#include "errors.hpp"
#include "visibility.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbn {

#define DBN_LIBRARY_VERSION "0.1.0"

using Timestamp = uint64_t;
using ByteOffset = uint64_t;
using ByteArray = std::vector<std::byte>;
using ProblemCallback = std::function<void(const Status&)>;

constexpr uint8_t DbnVersion = 1;
constexpr char LibraryVersion[] = DBN_LIBRARY_VERSION;
constexpr uint8_t Magic[] = {'D', 'B', 'N'};
constexpr size_t DatasetCstrLen = 16;
constexpr size_t SymbolCstrLen = 22;
constexpr size_t MetadataReservedLen = 47;
constexpr uint16_t MixedSchema = std::numeric_limits<uint16_t>::max();

/**
 * @brief The denominator of fixed prices. Prices are stored as integers in units of 1e-9.
 */
constexpr int64_t FixedPriceScale = 1000000000;
/**
 * @brief Sentinel for a null or undefined price.
 */
constexpr int64_t UndefPrice = std::numeric_limits<int64_t>::max();
/**
 * @brief Sentinel for a null or undefined order quantity.
 */
constexpr uint32_t UndefOrderSize = std::numeric_limits<uint32_t>::max();
/**
 * @brief Sentinel for a null or undefined statistic quantity.
 */
constexpr int32_t UndefStatQuantity = std::numeric_limits<int32_t>::max();
/**
 * @brief Sentinel for a null or undefined timestamp.
 */
constexpr Timestamp UndefTimestamp = std::numeric_limits<Timestamp>::max();

/**
 * @brief Record type discriminants. Several discriminants may map to the same record layout,
 * e.g. every OHLCV interval is an `OhlcvMsg`.
 */
enum struct RType : uint8_t {
  Mbp0 = 0x00,
  Mbp1 = 0x01,
  Mbp10 = 0x0A,
  OhlcvDeprecated = 0x11,
  Status = 0x12,
  InstrumentDef = 0x13,
  Imbalance = 0x14,
  Error = 0x15,
  SymbolMapping = 0x16,
  System = 0x17,
  Statistics = 0x18,
  Ohlcv1S = 0x20,
  Ohlcv1M = 0x21,
  Ohlcv1H = 0x22,
  Ohlcv1D = 0x23,
  Mbo = 0xA0,
};

/**
 * @brief A data record schema, i.e. which kind of records a dataset request produced.
 */
enum struct Schema : uint16_t {
  Mbo = 0,
  Mbp10 = 1,
  Mbp1 = 2,
  Tbbo = 3,
  Trades = 4,
  Ohlcv1S = 5,
  Ohlcv1M = 6,
  Ohlcv1H = 7,
  Ohlcv1D = 8,
  Definition = 9,
  Statistics = 10,
  Status = 11,
  Imbalance = 12,
};

/**
 * @brief Symbology type.
 */
enum struct SType : uint8_t {
  ProductId = 0,
  Native = 1,
  Smart = 2,
};

enum struct Side : char {
  Ask = 'A',
  Bid = 'B',
  None = 'N',
};

enum struct Action : char {
  Modify = 'M',
  Trade = 'T',
  Fill = 'F',
  Cancel = 'C',
  Add = 'A',
  Clear = 'R',
};

enum struct SecurityUpdateAction : char {
  Add = 'A',
  Modify = 'M',
  Delete = 'D',
  Invalid = '~',
};

enum struct UserDefinedInstrument : char {
  No = 'N',
  Yes = 'Y',
};

/**
 * @brief Get the string representation of an RType.
 */
DBN_PUBLIC
std::string_view RTypeString(RType rtype);

/**
 * @brief Converts a raw discriminant into an RType, or std::nullopt if the value is not part of
 * the record catalog.
 */
DBN_PUBLIC
std::optional<RType> ParseRType(uint8_t rtype);

/**
 * @brief Returns the discriminant of the records a schema produces. For OHLCV schemas this is the
 * interval-specific discriminant.
 */
DBN_PUBLIC
RType RTypeFromSchema(Schema schema);

DBN_PUBLIC
std::string_view SchemaString(Schema schema);

DBN_PUBLIC
std::optional<Schema> ParseSchema(std::string_view schema);

DBN_PUBLIC
std::string_view STypeString(SType stype);

DBN_PUBLIC
std::optional<SType> ParseSType(std::string_view stype);

/**
 * @brief The range of dates, inclusive of `startDate` and exclusive of `endDate`, during which a
 * native symbol resolved to `symbol`. Dates are encoded as YYYYMMDD integers.
 */
struct DBN_PUBLIC MappingInterval {
  uint32_t startDate = 0;
  uint32_t endDate = 0;
  std::string symbol;

  bool operator==(const MappingInterval& other) const;
  bool operator!=(const MappingInterval& other) const {
    return !(*this == other);
  }
};

/**
 * @brief All the resolutions of a requested symbol over the time range of a request.
 */
struct DBN_PUBLIC SymbolMapping {
  std::string nativeSymbol;
  std::vector<MappingInterval> intervals;

  bool operator==(const SymbolMapping& other) const;
  bool operator!=(const SymbolMapping& other) const {
    return !(*this == other);
  }
};

/**
 * @brief The preamble of every DBN stream, describing the dataset and request parameters. Decoded
 * exactly once per stream, before any records.
 */
struct DBN_PUBLIC Metadata {
  /**
   * @brief The DBN encoding version.
   */
  uint8_t version = DbnVersion;
  /**
   * @brief The dataset code, at most 15 characters.
   */
  std::string dataset;
  /**
   * @brief The schema of every record in the stream, or std::nullopt if the stream mixes record
   * types.
   */
  std::optional<Schema> schema;
  /**
   * @brief Nanosecond UNIX timestamp of the start of the query range.
   */
  Timestamp start = 0;
  /**
   * @brief Nanosecond UNIX timestamp of the end of the query range, if one was given.
   */
  std::optional<Timestamp> end;
  /**
   * @brief The maximum number of records requested, if limited.
   */
  std::optional<uint64_t> limit;
  uint64_t recordCount = 0;
  SType stypeIn = SType::Native;
  SType stypeOut = SType::ProductId;
  /**
   * @brief Whether every record carries a trailing `ts_out` send timestamp.
   */
  bool tsOut = false;
  std::vector<std::string> symbols;
  /**
   * @brief Symbols that resolved for only part of the query range.
   */
  std::vector<std::string> partial;
  /**
   * @brief Symbols that did not resolve for any of the query range.
   */
  std::vector<std::string> notFound;
  std::vector<SymbolMapping> mappings;

  bool operator==(const Metadata& other) const;
  bool operator!=(const Metadata& other) const {
    return !(*this == other);
  }
};

}  // namespace dbn

#ifdef DBN_IMPLEMENTATION
#  include "types.inl"
#endif
