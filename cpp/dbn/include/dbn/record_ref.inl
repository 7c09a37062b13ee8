#include "internal.hpp"
#include <cstdio>
#include <cstdlib>

namespace dbn {

namespace internal {

void FailMalformedRecord(const RecordHeader& header, size_t expectedSize) {
  std::fprintf(stderr,
               "malformed DBN record: rtype 0x%s has length %zu bytes, expected at least %zu\n",
               ToHex(header.rtype).c_str(), header.recordSize(), expectedSize);
  std::abort();
}

template <typename T>
Status CheckedPointer(const RecordRef& ref, RecordRefVariant* output) {
  if (ref.recordSize() < sizeof(T)) {
    const auto msg = StrCat("rtype 0x", ToHex(ref.header().rtype), " record is ",
                            ref.recordSize(), " bytes, expected at least ", sizeof(T));
    return Status{StatusCode::TruncatedRecord, msg};
  }
  *output = ref.getUnchecked<T>();
  return StatusCode::Success;
}

}  // namespace internal

Status RecordRef::asVariant(RecordRefVariant* output) const {
  RType rtype;
  if (auto status = header().rtypeAsEnum(&rtype); !status.ok()) {
    return status;
  }
  switch (rtype) {
    case RType::Mbp0:
      return internal::CheckedPointer<TradeMsg>(*this, output);
    case RType::Mbp1:
      return internal::CheckedPointer<Mbp1Msg>(*this, output);
    case RType::Mbp10:
      return internal::CheckedPointer<Mbp10Msg>(*this, output);
    case RType::OhlcvDeprecated:
    case RType::Ohlcv1S:
    case RType::Ohlcv1M:
    case RType::Ohlcv1H:
    case RType::Ohlcv1D:
      return internal::CheckedPointer<OhlcvMsg>(*this, output);
    case RType::Status:
      return internal::CheckedPointer<StatusMsg>(*this, output);
    case RType::InstrumentDef:
      return internal::CheckedPointer<InstrumentDefMsg>(*this, output);
    case RType::Imbalance:
      return internal::CheckedPointer<ImbalanceMsg>(*this, output);
    case RType::Error:
      return internal::CheckedPointer<ErrorMsg>(*this, output);
    case RType::SymbolMapping:
      return internal::CheckedPointer<SymbolMappingMsg>(*this, output);
    case RType::System:
      return internal::CheckedPointer<SystemMsg>(*this, output);
    case RType::Statistics:
      return internal::CheckedPointer<StatMsg>(*this, output);
    case RType::Mbo:
      return internal::CheckedPointer<MboMsg>(*this, output);
  }
  return Status{StatusCode::UnknownRecordType,
                internal::StrCat("unknown rtype 0x", internal::ToHex(header().rtype))};
}

Status RecordRef::toOwned(RecordVariant* output) const {
  RecordRefVariant ptr;
  if (auto status = asVariant(&ptr); !status.ok()) {
    return status;
  }
  std::visit(
    [&](const auto* record) {
      *output = *record;
    },
    ptr);
  return StatusCode::Success;
}

}  // namespace dbn
