#include "internal.hpp"

namespace dbn {

Status RecordHeader::rtypeAsEnum(RType* output) const {
  const auto parsed = ParseRType(rtype);
  if (!parsed) {
    return Status{StatusCode::UnknownRecordType,
                  internal::StrCat("unknown rtype 0x", internal::ToHex(rtype))};
  }
  *output = *parsed;
  return StatusCode::Success;
}

size_t MinRecordSize(RType rtype) {
  switch (rtype) {
    case RType::Mbp0:
      return sizeof(TradeMsg);
    case RType::Mbp1:
      return sizeof(Mbp1Msg);
    case RType::Mbp10:
      return sizeof(Mbp10Msg);
    case RType::OhlcvDeprecated:
    case RType::Ohlcv1S:
    case RType::Ohlcv1M:
    case RType::Ohlcv1H:
    case RType::Ohlcv1D:
      return sizeof(OhlcvMsg);
    case RType::Status:
      return sizeof(StatusMsg);
    case RType::InstrumentDef:
      return sizeof(InstrumentDefMsg);
    case RType::Imbalance:
      return sizeof(ImbalanceMsg);
    case RType::Error:
      return sizeof(ErrorMsg);
    case RType::SymbolMapping:
      return sizeof(SymbolMappingMsg);
    case RType::System:
      return sizeof(SystemMsg);
    case RType::Statistics:
      return sizeof(StatMsg);
    case RType::Mbo:
      return sizeof(MboMsg);
    default:
      return sizeof(RecordHeader);
  }
}

}  // namespace dbn
