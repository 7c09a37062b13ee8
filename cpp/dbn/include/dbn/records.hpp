#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <array>
#include <type_traits>
#include <variant>

namespace dbn {

/**
 * @brief The `length` field of a RecordHeader counts units of this many bytes.
 */
constexpr size_t LengthMultiplier = 4;

/**
 * @brief Returns the characters of a NUL-padded fixed-width record field up to the first NUL.
 */
template <size_t N>
std::string_view CStrView(const std::array<char, N>& chars) {
  size_t len = 0;
  while (len < N && chars[len] != '\0') {
    ++len;
  }
  return std::string_view(chars.data(), len);
}

/**
 * @brief The common prefix of every DBN record. Records are laid out in native little-endian
 * byte order and every record begins on an 8-byte boundary.
 */
struct DBN_PUBLIC RecordHeader {
  /**
   * @brief Size of the record in units of 4 bytes, including this header. This may exceed the
   * compiled size of the record type for forward-compatible padding or a trailing `ts_out`.
   */
  uint8_t length;
  /**
   * @brief The record type discriminant.
   */
  uint8_t rtype;
  uint16_t publisherId;
  /**
   * @brief The numeric instrument identifier.
   */
  uint32_t productId;
  /**
   * @brief Nanosecond UNIX timestamp of the matching engine event.
   */
  Timestamp tsEvent;

  size_t recordSize() const {
    return size_t(length) * LengthMultiplier;
  }

  /**
   * @brief Converts the raw discriminant into an RType. Returns
   * `StatusCode::UnknownRecordType` if the discriminant is not part of the record catalog.
   */
  Status rtypeAsEnum(RType* output) const;

  /**
   * @brief Creates a header for a record of type `T`, setting `length` from `sizeof(T)`.
   */
  template <typename T>
  static RecordHeader Create(RType rtype, uint16_t publisherId, uint32_t productId,
                             Timestamp tsEvent) {
    static_assert(sizeof(T) % LengthMultiplier == 0);
    static_assert(sizeof(T) / LengthMultiplier <= std::numeric_limits<uint8_t>::max());
    return RecordHeader{uint8_t(sizeof(T) / LengthMultiplier), uint8_t(rtype), publisherId,
                        productId, tsEvent};
  }

  bool operator==(const RecordHeader& other) const {
    return length == other.length && rtype == other.rtype && publisherId == other.publisherId &&
           productId == other.productId && tsEvent == other.tsEvent;
  }
  bool operator!=(const RecordHeader& other) const {
    return !(*this == other);
  }
};

/**
 * @brief Market by order: a single order book event.
 */
struct DBN_PUBLIC MboMsg {
  RecordHeader hd;
  uint64_t orderId;
  int64_t price;
  uint32_t size;
  uint8_t flags;
  uint8_t channelId;
  char action;
  char side;
  Timestamp tsRecv;
  int32_t tsInDelta;
  uint32_t sequence;

  static bool HasRType(uint8_t rtype) {
    return rtype == uint8_t(RType::Mbo);
  }
};

/**
 * @brief A price level of an aggregated book.
 */
struct DBN_PUBLIC BidAskPair {
  int64_t bidPx;
  int64_t askPx;
  uint32_t bidSz;
  uint32_t askSz;
  uint32_t bidCt;
  uint32_t askCt;
};

/**
 * @brief Market by price with a book depth of 0: trades only.
 */
struct DBN_PUBLIC TradeMsg {
  RecordHeader hd;
  int64_t price;
  uint32_t size;
  char action;
  char side;
  uint8_t flags;
  uint8_t depth;
  Timestamp tsRecv;
  int32_t tsInDelta;
  uint32_t sequence;

  static bool HasRType(uint8_t rtype) {
    return rtype == uint8_t(RType::Mbp0);
  }
};

/**
 * @brief Market by price with a known book depth of 1. Also used for TBBO.
 */
struct DBN_PUBLIC Mbp1Msg {
  RecordHeader hd;
  int64_t price;
  uint32_t size;
  char action;
  char side;
  uint8_t flags;
  uint8_t depth;
  Timestamp tsRecv;
  int32_t tsInDelta;
  uint32_t sequence;
  std::array<BidAskPair, 1> booklevel;

  static bool HasRType(uint8_t rtype) {
    return rtype == uint8_t(RType::Mbp1);
  }
};

/**
 * @brief Market by price with a known book depth of 10.
 */
struct DBN_PUBLIC Mbp10Msg {
  RecordHeader hd;
  int64_t price;
  uint32_t size;
  char action;
  char side;
  uint8_t flags;
  uint8_t depth;
  Timestamp tsRecv;
  int32_t tsInDelta;
  uint32_t sequence;
  std::array<BidAskPair, 10> booklevel;

  static bool HasRType(uint8_t rtype) {
    return rtype == uint8_t(RType::Mbp10);
  }
};

/**
 * @brief Open, high, low, close, and volume over an interval. The interval is given by the
 * record's discriminant.
 */
struct DBN_PUBLIC OhlcvMsg {
  RecordHeader hd;
  int64_t open;
  int64_t high;
  int64_t low;
  int64_t close;
  uint64_t volume;

  static bool HasRType(uint8_t rtype) {
    switch (RType(rtype)) {
      case RType::OhlcvDeprecated:
      case RType::Ohlcv1S:
      case RType::Ohlcv1M:
      case RType::Ohlcv1H:
      case RType::Ohlcv1D:
        return true;
      default:
        return false;
    }
  }
};

/**
 * @brief A trading status update.
 */
struct DBN_PUBLIC StatusMsg {
  RecordHeader hd;
  Timestamp tsRecv;
  std::array<char, 21> group;
  uint8_t tradingStatus;
  uint8_t haltReason;
  uint8_t tradingEvent;

  static bool HasRType(uint8_t rtype) {
    return rtype == uint8_t(RType::Status);
  }

  std::string_view groupView() const {
    return CStrView(group);
  }
};

/**
 * @brief An instrument definition.
 */
struct DBN_PUBLIC InstrumentDefMsg {
  RecordHeader hd;
  Timestamp tsRecv;
  int64_t minPriceIncrement;
  int64_t displayFactor;
  Timestamp expiration;
  Timestamp activation;
  int64_t highLimitPrice;
  int64_t lowLimitPrice;
  int64_t maxPriceVariation;
  int64_t tradingReferencePrice;
  int64_t unitOfMeasureQty;
  int64_t minPriceIncrementAmount;
  int64_t priceRatio;
  int32_t instAttribValue;
  uint32_t underlyingId;
  int32_t clearedVolume;
  int32_t marketDepthImplied;
  int32_t marketDepth;
  uint32_t marketSegmentId;
  uint32_t maxTradeVol;
  int32_t minLotSize;
  int32_t minLotSizeBlock;
  int32_t minLotSizeRoundLot;
  uint32_t minTradeVol;
  int32_t openInterestQty;
  int32_t contractMultiplier;
  int32_t decayQuantity;
  int32_t originalContractSize;
  uint32_t relatedSecurityId;
  uint16_t tradingReferenceDate;
  int16_t applId;
  uint16_t maturityYear;
  uint16_t decayStartDate;
  uint16_t channelId;
  std::array<char, 4> currency;
  std::array<char, 4> settlCurrency;
  std::array<char, 6> secsubtype;
  std::array<char, 22> symbol;
  std::array<char, 21> group;
  std::array<char, 5> exchange;
  std::array<char, 7> asset;
  std::array<char, 7> cfi;
  std::array<char, 7> securityType;
  std::array<char, 31> unitOfMeasure;
  std::array<char, 21> underlying;
  std::array<char, 21> related;
  char matchAlgorithm;
  uint8_t mdSecurityTradingStatus;
  uint8_t mainFraction;
  uint8_t priceDisplayFormat;
  uint8_t settlPriceType;
  uint8_t subFraction;
  uint8_t underlyingProduct;
  char securityUpdateAction;
  uint8_t maturityMonth;
  uint8_t maturityDay;
  uint8_t maturityWeek;
  char userDefinedInstrument;
  int8_t contractMultiplierUnit;
  int8_t flowScheduleType;
  uint8_t tickRule;
  std::array<uint8_t, 3> reserved;

  static bool HasRType(uint8_t rtype) {
    return rtype == uint8_t(RType::InstrumentDef);
  }

  std::string_view symbolView() const {
    return CStrView(symbol);
  }
  std::string_view exchangeView() const {
    return CStrView(exchange);
  }
  std::string_view currencyView() const {
    return CStrView(currency);
  }
};

/**
 * @brief An auction imbalance message.
 */
struct DBN_PUBLIC ImbalanceMsg {
  RecordHeader hd;
  Timestamp tsRecv;
  int64_t refPrice;
  Timestamp auctionTime;
  int64_t contBookClrPrice;
  int64_t auctInterestClrPrice;
  int64_t ssrFillingPrice;
  int64_t indMatchPrice;
  int64_t upperCollar;
  int64_t lowerCollar;
  uint32_t pairedQty;
  uint32_t totalImbalanceQty;
  uint32_t marketImbalanceQty;
  uint32_t unpairedQty;
  char auctionType;
  char side;
  uint8_t auctionStatus;
  uint8_t freezeStatus;
  uint8_t numExtensions;
  char unpairedSide;
  char significantImbalance;
  std::array<uint8_t, 1> reserved;

  static bool HasRType(uint8_t rtype) {
    return rtype == uint8_t(RType::Imbalance);
  }
};

/**
 * @brief A statistic published by the venue, e.g. a settlement price or open interest.
 */
struct DBN_PUBLIC StatMsg {
  RecordHeader hd;
  Timestamp tsRecv;
  Timestamp tsRef;
  int64_t price;
  int32_t quantity;
  uint32_t sequence;
  int32_t tsInDelta;
  uint16_t statType;
  uint16_t channelId;
  uint8_t updateAction;
  uint8_t statFlags;
  std::array<uint8_t, 6> reserved;

  static bool HasRType(uint8_t rtype) {
    return rtype == uint8_t(RType::Statistics);
  }
};

/**
 * @brief An error message from a live gateway.
 */
struct DBN_PUBLIC ErrorMsg {
  RecordHeader hd;
  std::array<char, 64> err;

  static bool HasRType(uint8_t rtype) {
    return rtype == uint8_t(RType::Error);
  }

  std::string_view errView() const {
    return CStrView(err);
  }
};

/**
 * @brief Resolution of an input symbol to an output symbol over a time range.
 */
struct DBN_PUBLIC SymbolMappingMsg {
  RecordHeader hd;
  std::array<char, SymbolCstrLen> stypeInSymbol;
  std::array<char, SymbolCstrLen> stypeOutSymbol;
  std::array<uint8_t, 4> reserved;
  Timestamp startTs;
  Timestamp endTs;

  static bool HasRType(uint8_t rtype) {
    return rtype == uint8_t(RType::SymbolMapping);
  }

  std::string_view stypeInSymbolView() const {
    return CStrView(stypeInSymbol);
  }
  std::string_view stypeOutSymbolView() const {
    return CStrView(stypeOutSymbol);
  }
};

/**
 * @brief A non-error message from a live gateway, e.g. a heartbeat.
 */
struct DBN_PUBLIC SystemMsg {
  RecordHeader hd;
  std::array<char, 64> msg;

  static bool HasRType(uint8_t rtype) {
    return rtype == uint8_t(RType::System);
  }

  std::string_view msgView() const {
    return CStrView(msg);
  }
};

/**
 * @brief Wraps a record of type `T` with a trailing `ts_out` timestamp appended by the sender.
 * Accepts the same discriminants as `T`.
 */
template <typename T>
struct WithTsOut {
  T rec;
  /**
   * @brief Nanosecond UNIX timestamp of when the record was sent.
   */
  Timestamp tsOut;

  static bool HasRType(uint8_t rtype) {
    return T::HasRType(rtype);
  }

  /**
   * @brief Wraps `rec`, updating its header length to cover the trailing timestamp.
   */
  static WithTsOut Create(T rec, Timestamp tsOut) {
    static_assert(sizeof(WithTsOut) == sizeof(T) + sizeof(Timestamp));
    rec.hd.length = uint8_t(sizeof(WithTsOut) / LengthMultiplier);
    return WithTsOut{rec, tsOut};
  }
};

static_assert(sizeof(RecordHeader) == 16);
static_assert(sizeof(MboMsg) == 56);
static_assert(sizeof(BidAskPair) == 32);
static_assert(sizeof(TradeMsg) == 48);
static_assert(sizeof(Mbp1Msg) == 80);
static_assert(sizeof(Mbp10Msg) == 368);
static_assert(sizeof(OhlcvMsg) == 56);
static_assert(sizeof(StatusMsg) == 48);
static_assert(sizeof(InstrumentDefMsg) == 360);
static_assert(sizeof(ImbalanceMsg) == 112);
static_assert(sizeof(StatMsg) == 64);
static_assert(sizeof(ErrorMsg) == 80);
static_assert(sizeof(SymbolMappingMsg) == 80);
static_assert(sizeof(SystemMsg) == 80);
static_assert(alignof(RecordHeader) == 8);
static_assert(std::is_trivially_copyable_v<InstrumentDefMsg> &&
              std::is_standard_layout_v<InstrumentDefMsg>);

/**
 * @brief An owned copy of any record in the catalog.
 */
using RecordVariant =
  std::variant<MboMsg, TradeMsg, Mbp1Msg, Mbp10Msg, OhlcvMsg, StatusMsg, InstrumentDefMsg,
               ImbalanceMsg, StatMsg, ErrorMsg, SymbolMappingMsg, SystemMsg>;

/**
 * @brief A typed, non-owning reference to any record in the catalog, for exhaustive dispatch
 * with `std::visit`.
 */
using RecordRefVariant =
  std::variant<const MboMsg*, const TradeMsg*, const Mbp1Msg*, const Mbp10Msg*, const OhlcvMsg*,
               const StatusMsg*, const InstrumentDefMsg*, const ImbalanceMsg*, const StatMsg*,
               const ErrorMsg*, const SymbolMappingMsg*, const SystemMsg*>;

/**
 * @brief Returns the compiled size in bytes of the record type a discriminant designates. A
 * record's `length * 4` must be at least this large.
 */
DBN_PUBLIC
size_t MinRecordSize(RType rtype);

/**
 * @brief Returns the lowest catalog discriminant accepted by `T`, or std::nullopt if there is
 * none.
 */
template <typename T>
std::optional<RType> RTypeOf() {
  for (unsigned raw = 0; raw <= 0xFF; ++raw) {
    const auto rtype = ParseRType(uint8_t(raw));
    if (rtype.has_value() && T::HasRType(uint8_t(raw))) {
      return rtype;
    }
  }
  return std::nullopt;
}

/**
 * @brief Returns the header of an owned record.
 */
inline const RecordHeader& HeaderOf(const RecordVariant& record) {
  return std::visit(
    [](const auto& rec) -> const RecordHeader& {
      return rec.hd;
    },
    record);
}

}  // namespace dbn

#ifdef DBN_IMPLEMENTATION
#  include "records.inl"
#endif
