#define DBN_IMPLEMENTATION
#include <dbn/dbn.hpp>

#include <fmt/core.h>

#include <iostream>
#include <string>

template <typename... T>
[[nodiscard]] inline std::string StrFormat(std::string_view msg, T&&... args) {
  return fmt::format(fmt::runtime(msg), std::forward<T>(args)...);
}

std::string ToString(const std::vector<std::string>& symbols) {
  if (symbols.size() > 8) {
    return StrFormat("<{} entries>", symbols.size());
  }
  std::string output = "[";
  for (const auto& symbol : symbols) {
    if (output.size() > 1) {
      output += ", ";
    }
    output += symbol;
  }
  output += "]";
  return output;
}

std::string ToString(const dbn::Metadata& metadata) {
  return StrFormat(
    "[Metadata] version={}, dataset={}, schema={}, start={}, end={}, limit={}, record_count={}, "
    "stype_in={}, stype_out={}, ts_out={}, symbols={}, partial={}, not_found={}, mappings=<{} "
    "entries>",
    metadata.version, metadata.dataset,
    metadata.schema ? dbn::SchemaString(*metadata.schema) : std::string_view("mixed"),
    metadata.start, metadata.end ? std::to_string(*metadata.end) : std::string("none"),
    metadata.limit ? std::to_string(*metadata.limit) : std::string("none"), metadata.recordCount,
    dbn::STypeString(metadata.stypeIn), dbn::STypeString(metadata.stypeOut), metadata.tsOut,
    ToString(metadata.symbols), ToString(metadata.partial), ToString(metadata.notFound),
    metadata.mappings.size());
}

std::string ToString(const dbn::RecordHeader& hd) {
  return StrFormat("publisher_id={}, product_id={}, ts_event={}", hd.publisherId, hd.productId,
                   hd.tsEvent);
}

std::string ToString(const dbn::MboMsg& mbo) {
  return StrFormat("[Mbo] {}, order_id={}, price={}, size={}, action={}, side={}",
                   ToString(mbo.hd), mbo.orderId, dbn::FormatPrice(mbo.price), mbo.size,
                   mbo.action, mbo.side);
}

std::string ToString(const dbn::TradeMsg& trade) {
  return StrFormat("[Trade] {}, price={}, size={}, side={}", ToString(trade.hd),
                   dbn::FormatPrice(trade.price), trade.size, trade.side);
}

template <typename T>
std::string ToStringMbp(std::string_view name, const T& mbp) {
  const auto& top = mbp.booklevel[0];
  return StrFormat("[{}] {}, price={}, size={}, action={}, bid={}x{}, ask={}x{}", name,
                   ToString(mbp.hd), dbn::FormatPrice(mbp.price), mbp.size, mbp.action,
                   dbn::FormatPrice(top.bidPx), top.bidSz, dbn::FormatPrice(top.askPx), top.askSz);
}

std::string ToString(const dbn::Mbp1Msg& mbp) {
  return ToStringMbp("Mbp1", mbp);
}

std::string ToString(const dbn::Mbp10Msg& mbp) {
  return ToStringMbp("Mbp10", mbp);
}

std::string ToString(const dbn::OhlcvMsg& ohlcv) {
  return StrFormat("[{}] {}, open={}, high={}, low={}, close={}, volume={}",
                   dbn::RTypeString(dbn::RType(ohlcv.hd.rtype)), ToString(ohlcv.hd),
                   dbn::FormatPrice(ohlcv.open), dbn::FormatPrice(ohlcv.high),
                   dbn::FormatPrice(ohlcv.low), dbn::FormatPrice(ohlcv.close), ohlcv.volume);
}

std::string ToString(const dbn::StatusMsg& status) {
  return StrFormat("[Status] {}, group={}, trading_status={}", ToString(status.hd),
                   status.groupView(), status.tradingStatus);
}

std::string ToString(const dbn::InstrumentDefMsg& def) {
  return StrFormat("[InstrumentDef] {}, symbol={}, exchange={}, expiration={}", ToString(def.hd),
                   def.symbolView(), def.exchangeView(), def.expiration);
}

std::string ToString(const dbn::ImbalanceMsg& imbalance) {
  return StrFormat("[Imbalance] {}, ref_price={}, paired_qty={}, total_imbalance_qty={}",
                   ToString(imbalance.hd), dbn::FormatPrice(imbalance.refPrice),
                   imbalance.pairedQty, imbalance.totalImbalanceQty);
}

std::string ToString(const dbn::StatMsg& stat) {
  return StrFormat("[Statistics] {}, stat_type={}, price={}, quantity={}", ToString(stat.hd),
                   stat.statType, dbn::FormatPrice(stat.price), stat.quantity);
}

std::string ToString(const dbn::ErrorMsg& error) {
  return StrFormat("[Error] {}, err={}", ToString(error.hd), error.errView());
}

std::string ToString(const dbn::SymbolMappingMsg& mapping) {
  return StrFormat("[SymbolMapping] {}, stype_in_symbol={}, stype_out_symbol={}",
                   ToString(mapping.hd), mapping.stypeInSymbolView(),
                   mapping.stypeOutSymbolView());
}

std::string ToString(const dbn::SystemMsg& system) {
  return StrFormat("[System] {}, msg={}", ToString(system.hd), system.msgView());
}

int main(int argc, char* argv[]) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <input.dbn>\n";
    return 1;
  }

  dbn::FileReader reader;
  if (auto status = reader.open(argv[1]); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  dbn::DecodingRecordStream records{reader, dbn::DecodingRecordStream::DefaultChunkSize,
                                    [](const dbn::Status& problem) {
                                      std::cerr << "! " << problem.message << "\n";
                                    }};
  if (auto status = records.readMetadata(); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }
  std::cout << ToString(*records.metadata()) << "\n";

  uint64_t count = 0;
  while (auto record = records.next()) {
    dbn::RecordRefVariant typed;
    if (auto status = record->asVariant(&typed); !status.ok()) {
      std::cerr << "! " << status.message << "\n";
      continue;
    }
    std::visit(
      [](const auto* rec) {
        std::cout << ToString(*rec) << "\n";
      },
      typed);
    ++count;
  }
  std::cout << "\n" << count << " records\n";
  if (!records.status().ok()) {
    std::cerr << "! " << records.status().message << "\n";
    return 1;
  }
  return 0;
}
