#pragma once

#include "records.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <ctime>

namespace dbn {

/**
 * @brief Marks a fixed-precision price field, rendered as a decimal when prices are pretty
 * printed.
 */
struct PriceField {
  int64_t value;
};

/**
 * @brief Marks a nanosecond UNIX timestamp field, rendered as ISO 8601 when timestamps are pretty
 * printed.
 */
struct TsField {
  Timestamp value;
};

/**
 * @brief Marks a single-character field such as an action or side. NUL renders as empty.
 */
struct CharField {
  char value;
};

/**
 * @brief Marks a NUL-padded fixed-width string field.
 */
struct CStrField {
  std::string_view value;
};

/**
 * @brief Formats a fixed-precision price as a decimal with nine fractional digits.
 */
inline std::string FormatPrice(int64_t price) {
  const bool negative = price < 0;
  // Negate in unsigned space so INT64_MIN does not overflow
  const uint64_t magnitude = negative ? uint64_t(0) - uint64_t(price) : uint64_t(price);
  const uint64_t scale = uint64_t(FixedPriceScale);
  return fmt::format("{}{}.{:09}", negative ? "-" : "", magnitude / scale, magnitude % scale);
}

/**
 * @brief Formats a nanosecond UNIX timestamp as ISO 8601 in UTC with nanosecond precision, e.g.
 * `2022-07-21T23:17:31.000000000Z`.
 */
inline std::string FormatTimestamp(Timestamp timestamp) {
  const std::time_t seconds = std::time_t(timestamp / 1000000000);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:09}Z", fmt::gmtime(seconds), timestamp % 1000000000);
}

namespace internal {

constexpr size_t BookLevelFieldCount = 6;

/**
 * @brief Field names for each level of an aggregated book, e.g. `bid_px_00` through `ask_ct_09`.
 */
inline const std::vector<std::string>& BookLevelFieldNames() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> result;
    for (size_t i = 0; i < 10; ++i) {
      for (const char* field : {"bid_px", "ask_px", "bid_sz", "ask_sz", "bid_ct", "ask_ct"}) {
        result.push_back(fmt::format("{}_{:02}", field, i));
      }
    }
    return result;
  }();
  return names;
}

template <typename T, typename Visitor>
void ForEachMarketByPriceField(const T& rec, Visitor&& visit) {
  visit("price", PriceField{rec.price});
  visit("size", rec.size);
  visit("action", CharField{rec.action});
  visit("side", CharField{rec.side});
  visit("flags", rec.flags);
  visit("depth", rec.depth);
  visit("ts_recv", TsField{rec.tsRecv});
  visit("ts_in_delta", rec.tsInDelta);
  visit("sequence", rec.sequence);
}

template <size_t N, typename Visitor>
void ForEachBookLevelField(const std::array<BidAskPair, N>& levels, Visitor&& visit) {
  static_assert(N <= 10);
  const auto& names = BookLevelFieldNames();
  for (size_t i = 0; i < N; ++i) {
    const BidAskPair& level = levels[i];
    const std::string* name = &names[i * BookLevelFieldCount];
    visit(name[0], PriceField{level.bidPx});
    visit(name[1], PriceField{level.askPx});
    visit(name[2], level.bidSz);
    visit(name[3], level.askSz);
    visit(name[4], level.bidCt);
    visit(name[5], level.askCt);
  }
}

}  // namespace internal

/**
 * @brief Field visitors shared by the text encoders. Each overload calls
 * `visit(std::string_view name, value)` once per field in encoding order, where `value` is an
 * integer or one of PriceField, TsField, CharField or CStrField. Header rows and data rows are
 * driven by the same visitor, so they always have the same number of columns.
 */
template <typename Visitor>
void ForEachHeaderField(const RecordHeader& hd, Visitor&& visit) {
  visit("rtype", hd.rtype);
  visit("publisher_id", hd.publisherId);
  visit("product_id", hd.productId);
  visit("ts_event", TsField{hd.tsEvent});
}

template <typename Visitor>
void ForEachBodyField(const MboMsg& rec, Visitor&& visit) {
  visit("order_id", rec.orderId);
  visit("price", PriceField{rec.price});
  visit("size", rec.size);
  visit("flags", rec.flags);
  visit("channel_id", rec.channelId);
  visit("action", CharField{rec.action});
  visit("side", CharField{rec.side});
  visit("ts_recv", TsField{rec.tsRecv});
  visit("ts_in_delta", rec.tsInDelta);
  visit("sequence", rec.sequence);
}

template <typename Visitor>
void ForEachBodyField(const TradeMsg& rec, Visitor&& visit) {
  internal::ForEachMarketByPriceField(rec, visit);
}

template <typename Visitor>
void ForEachBodyField(const Mbp1Msg& rec, Visitor&& visit) {
  internal::ForEachMarketByPriceField(rec, visit);
  internal::ForEachBookLevelField(rec.booklevel, visit);
}

template <typename Visitor>
void ForEachBodyField(const Mbp10Msg& rec, Visitor&& visit) {
  internal::ForEachMarketByPriceField(rec, visit);
  internal::ForEachBookLevelField(rec.booklevel, visit);
}

template <typename Visitor>
void ForEachBodyField(const OhlcvMsg& rec, Visitor&& visit) {
  visit("open", PriceField{rec.open});
  visit("high", PriceField{rec.high});
  visit("low", PriceField{rec.low});
  visit("close", PriceField{rec.close});
  visit("volume", rec.volume);
}

template <typename Visitor>
void ForEachBodyField(const StatusMsg& rec, Visitor&& visit) {
  visit("ts_recv", TsField{rec.tsRecv});
  visit("group", CStrField{rec.groupView()});
  visit("trading_status", rec.tradingStatus);
  visit("halt_reason", rec.haltReason);
  visit("trading_event", rec.tradingEvent);
}

template <typename Visitor>
void ForEachBodyField(const InstrumentDefMsg& rec, Visitor&& visit) {
  visit("ts_recv", TsField{rec.tsRecv});
  visit("min_price_increment", PriceField{rec.minPriceIncrement});
  visit("display_factor", rec.displayFactor);
  visit("expiration", TsField{rec.expiration});
  visit("activation", TsField{rec.activation});
  visit("high_limit_price", PriceField{rec.highLimitPrice});
  visit("low_limit_price", PriceField{rec.lowLimitPrice});
  visit("max_price_variation", PriceField{rec.maxPriceVariation});
  visit("trading_reference_price", PriceField{rec.tradingReferencePrice});
  visit("unit_of_measure_qty", rec.unitOfMeasureQty);
  visit("min_price_increment_amount", PriceField{rec.minPriceIncrementAmount});
  visit("price_ratio", PriceField{rec.priceRatio});
  visit("inst_attrib_value", rec.instAttribValue);
  visit("underlying_id", rec.underlyingId);
  visit("cleared_volume", rec.clearedVolume);
  visit("market_depth_implied", rec.marketDepthImplied);
  visit("market_depth", rec.marketDepth);
  visit("market_segment_id", rec.marketSegmentId);
  visit("max_trade_vol", rec.maxTradeVol);
  visit("min_lot_size", rec.minLotSize);
  visit("min_lot_size_block", rec.minLotSizeBlock);
  visit("min_lot_size_round_lot", rec.minLotSizeRoundLot);
  visit("min_trade_vol", rec.minTradeVol);
  visit("open_interest_qty", rec.openInterestQty);
  visit("contract_multiplier", rec.contractMultiplier);
  visit("decay_quantity", rec.decayQuantity);
  visit("original_contract_size", rec.originalContractSize);
  visit("related_security_id", rec.relatedSecurityId);
  visit("trading_reference_date", rec.tradingReferenceDate);
  visit("appl_id", rec.applId);
  visit("maturity_year", rec.maturityYear);
  visit("decay_start_date", rec.decayStartDate);
  visit("channel_id", rec.channelId);
  visit("currency", CStrField{CStrView(rec.currency)});
  visit("settl_currency", CStrField{CStrView(rec.settlCurrency)});
  visit("secsubtype", CStrField{CStrView(rec.secsubtype)});
  visit("symbol", CStrField{CStrView(rec.symbol)});
  visit("group", CStrField{CStrView(rec.group)});
  visit("exchange", CStrField{CStrView(rec.exchange)});
  visit("asset", CStrField{CStrView(rec.asset)});
  visit("cfi", CStrField{CStrView(rec.cfi)});
  visit("security_type", CStrField{CStrView(rec.securityType)});
  visit("unit_of_measure", CStrField{CStrView(rec.unitOfMeasure)});
  visit("underlying", CStrField{CStrView(rec.underlying)});
  visit("related", CStrField{CStrView(rec.related)});
  visit("match_algorithm", CharField{rec.matchAlgorithm});
  visit("md_security_trading_status", rec.mdSecurityTradingStatus);
  visit("main_fraction", rec.mainFraction);
  visit("price_display_format", rec.priceDisplayFormat);
  visit("settl_price_type", rec.settlPriceType);
  visit("sub_fraction", rec.subFraction);
  visit("underlying_product", rec.underlyingProduct);
  visit("security_update_action", CharField{rec.securityUpdateAction});
  visit("maturity_month", rec.maturityMonth);
  visit("maturity_day", rec.maturityDay);
  visit("maturity_week", rec.maturityWeek);
  visit("user_defined_instrument", CharField{rec.userDefinedInstrument});
  visit("contract_multiplier_unit", rec.contractMultiplierUnit);
  visit("flow_schedule_type", rec.flowScheduleType);
  visit("tick_rule", rec.tickRule);
}

template <typename Visitor>
void ForEachBodyField(const ImbalanceMsg& rec, Visitor&& visit) {
  visit("ts_recv", TsField{rec.tsRecv});
  visit("ref_price", PriceField{rec.refPrice});
  visit("auction_time", TsField{rec.auctionTime});
  visit("cont_book_clr_price", PriceField{rec.contBookClrPrice});
  visit("auct_interest_clr_price", PriceField{rec.auctInterestClrPrice});
  visit("ssr_filling_price", PriceField{rec.ssrFillingPrice});
  visit("ind_match_price", PriceField{rec.indMatchPrice});
  visit("upper_collar", PriceField{rec.upperCollar});
  visit("lower_collar", PriceField{rec.lowerCollar});
  visit("paired_qty", rec.pairedQty);
  visit("total_imbalance_qty", rec.totalImbalanceQty);
  visit("market_imbalance_qty", rec.marketImbalanceQty);
  visit("unpaired_qty", rec.unpairedQty);
  visit("auction_type", CharField{rec.auctionType});
  visit("side", CharField{rec.side});
  visit("auction_status", rec.auctionStatus);
  visit("freeze_status", rec.freezeStatus);
  visit("num_extensions", rec.numExtensions);
  visit("unpaired_side", CharField{rec.unpairedSide});
  visit("significant_imbalance", CharField{rec.significantImbalance});
}

template <typename Visitor>
void ForEachBodyField(const StatMsg& rec, Visitor&& visit) {
  visit("ts_recv", TsField{rec.tsRecv});
  visit("ts_ref", TsField{rec.tsRef});
  visit("price", PriceField{rec.price});
  visit("quantity", rec.quantity);
  visit("sequence", rec.sequence);
  visit("ts_in_delta", rec.tsInDelta);
  visit("stat_type", rec.statType);
  visit("channel_id", rec.channelId);
  visit("update_action", rec.updateAction);
  visit("stat_flags", rec.statFlags);
}

template <typename Visitor>
void ForEachBodyField(const ErrorMsg& rec, Visitor&& visit) {
  visit("err", CStrField{rec.errView()});
}

template <typename Visitor>
void ForEachBodyField(const SymbolMappingMsg& rec, Visitor&& visit) {
  visit("stype_in_symbol", CStrField{rec.stypeInSymbolView()});
  visit("stype_out_symbol", CStrField{rec.stypeOutSymbolView()});
  visit("start_ts", TsField{rec.startTs});
  visit("end_ts", TsField{rec.endTs});
}

template <typename Visitor>
void ForEachBodyField(const SystemMsg& rec, Visitor&& visit) {
  visit("msg", CStrField{rec.msgView()});
}

template <typename T, typename Visitor>
void ForEachField(const T& rec, Visitor&& visit) {
  ForEachHeaderField(rec.hd, visit);
  ForEachBodyField(rec, visit);
}

template <typename T, typename Visitor>
void ForEachField(const WithTsOut<T>& rec, Visitor&& visit) {
  ForEachField(rec.rec, visit);
  visit("ts_out", TsField{rec.tsOut});
}

}  // namespace dbn
