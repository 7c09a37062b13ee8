#define DBN_IMPLEMENTATION
#include <dbn/dbn.hpp>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <array>
#include <cstdio>
#include <cstring>
#include <numeric>

void requireOk(const dbn::Status& status) {
  CAPTURE(status.code);
  CAPTURE(status.message);
  REQUIRE(status.ok());
}

template <typename T>
static void AppendRecord(const T& record, dbn::ByteArray* output) {
  const auto* bytes = reinterpret_cast<const std::byte*>(&record);
  output->insert(output->end(), bytes, bytes + sizeof(T));
}

static dbn::MboMsg MakeMbo(uint64_t orderId, int64_t price, dbn::Timestamp tsEvent) {
  dbn::MboMsg mbo{};
  mbo.hd = dbn::RecordHeader::Create<dbn::MboMsg>(dbn::RType::Mbo, 1, 5482, tsEvent);
  mbo.orderId = orderId;
  mbo.price = price;
  mbo.size = 10;
  mbo.action = 'A';
  mbo.side = 'B';
  mbo.tsRecv = tsEvent + 100;
  mbo.sequence = uint32_t(orderId);
  return mbo;
}

static dbn::Metadata MakeMetadata() {
  dbn::Metadata metadata;
  metadata.dataset = "GLBX.MDP3";
  metadata.schema = dbn::Schema::Mbo;
  metadata.start = 1658441851000000000;
  metadata.end = 1658441891965254471;
  metadata.recordCount = 2;
  metadata.stypeIn = dbn::SType::Native;
  metadata.stypeOut = dbn::SType::ProductId;
  metadata.symbols = {"ESU2", "NQU2"};
  metadata.notFound = {"XYZ"};
  dbn::SymbolMapping mapping;
  mapping.nativeSymbol = "ESU2";
  mapping.intervals.push_back(dbn::MappingInterval{20220721, 20220722, "5482"});
  metadata.mappings.push_back(mapping);
  return metadata;
}

static dbn::ByteArray EncodeMetadata(const dbn::Metadata& metadata) {
  dbn::ByteArray output;
  requireOk(dbn::MetadataEncoder::EncodeMetadata(metadata, &output));
  return output;
}

// Metadata followed by two MBO records
static dbn::ByteArray MakeStream(const dbn::Metadata& metadata) {
  auto stream = EncodeMetadata(metadata);
  AppendRecord(MakeMbo(1, 372000000000000, 1658441851000000000), &stream);
  AppendRecord(MakeMbo(2, 372500000000000, 1658441852000000000), &stream);
  return stream;
}

static bool SameMbo(const dbn::MboMsg& a, const dbn::MboMsg& b) {
  return std::memcmp(&a, &b, sizeof(dbn::MboMsg)) == 0;
}

static std::vector<dbn::DecodedItem> DecodeInChunks(const dbn::ByteArray& stream,
                                                     size_t chunkSize) {
  dbn::StreamDecoder decoder;
  std::vector<dbn::DecodedItem> items;
  for (size_t offset = 0; offset < stream.size(); offset += chunkSize) {
    const size_t size = std::min(chunkSize, stream.size() - offset);
    decoder.write(stream.data() + offset, size);
    std::vector<dbn::DecodedItem> decoded;
    requireOk(decoder.decode(&decoded));
    items.insert(items.end(), decoded.begin(), decoded.end());
  }
  REQUIRE(decoder.buffer().readableSize() == 0);
  return items;
}

TEST_CASE("internal::Parse*()", "[reader]") {
  SECTION("uint64_t") {
    std::array<std::byte, 8> input;
    std::iota(reinterpret_cast<uint8_t*>(input.data()),
              reinterpret_cast<uint8_t*>(input.data()) + input.size(), uint8_t(1));
    REQUIRE(dbn::internal::ParseUint64(input.data()) == 0x0807060504030201);
  }

  SECTION("fixed string") {
    const char input[6] = {'E', 'S', 'U', '2', '\0', 'X'};
    const auto* data = reinterpret_cast<const std::byte*>(input);
    REQUIRE(dbn::internal::ParseFixedString(data, sizeof(input)) == "ESU2");
    std::string output;
    REQUIRE(dbn::internal::ParseFixedString(data, 3, sizeof(input), &output).code ==
            dbn::StatusCode::InvalidMetadata);
  }
}

TEST_CASE("RecordHeader", "[records]") {
  SECTION("Create() sets the length from the record size") {
    const auto hd = dbn::RecordHeader::Create<dbn::Mbp10Msg>(dbn::RType::Mbp10, 2, 3, 4);
    REQUIRE(hd.length == 92);
    REQUIRE(hd.recordSize() == sizeof(dbn::Mbp10Msg));
    REQUIRE(hd.rtype == 0x0A);
    REQUIRE(hd.publisherId == 2);
    REQUIRE(hd.productId == 3);
    REQUIRE(hd.tsEvent == 4);
  }

  SECTION("rtypeAsEnum()") {
    auto hd = dbn::RecordHeader::Create<dbn::OhlcvMsg>(dbn::RType::Ohlcv1H, 1, 1, 1);
    dbn::RType rtype;
    requireOk(hd.rtypeAsEnum(&rtype));
    REQUIRE(rtype == dbn::RType::Ohlcv1H);

    hd.rtype = 0x99;
    const auto status = hd.rtypeAsEnum(&rtype);
    REQUIRE(status.code == dbn::StatusCode::UnknownRecordType);
    REQUIRE(status.message.find("0x99") != std::string::npos);
  }

  SECTION("HasRType() accepts every OHLCV interval") {
    for (auto rtype : {dbn::RType::OhlcvDeprecated, dbn::RType::Ohlcv1S, dbn::RType::Ohlcv1M,
                       dbn::RType::Ohlcv1H, dbn::RType::Ohlcv1D}) {
      REQUIRE(dbn::OhlcvMsg::HasRType(uint8_t(rtype)));
      REQUIRE(dbn::WithTsOut<dbn::OhlcvMsg>::HasRType(uint8_t(rtype)));
      REQUIRE_FALSE(dbn::MboMsg::HasRType(uint8_t(rtype)));
    }
    REQUIRE(dbn::TradeMsg::HasRType(uint8_t(dbn::RType::Mbp0)));
    REQUIRE_FALSE(dbn::Mbp1Msg::HasRType(uint8_t(dbn::RType::Mbp0)));
  }

  SECTION("MinRecordSize()") {
    REQUIRE(dbn::MinRecordSize(dbn::RType::Mbo) == 56);
    REQUIRE(dbn::MinRecordSize(dbn::RType::Ohlcv1D) == 56);
    REQUIRE(dbn::MinRecordSize(dbn::RType::InstrumentDef) == 360);
    REQUIRE(dbn::MinRecordSize(dbn::RType::Imbalance) == 112);
  }

  SECTION("WithTsOut::Create() extends the length") {
    const auto rec = dbn::WithTsOut<dbn::MboMsg>::Create(MakeMbo(1, 2, 3), 42);
    REQUIRE(rec.rec.hd.recordSize() == 64);
    REQUIRE(rec.tsOut == 42);
  }
}

TEST_CASE("CStrView()", "[records]") {
  dbn::InstrumentDefMsg def{};
  std::memcpy(def.symbol.data(), "ESU2", 4);
  REQUIRE(def.symbolView() == "ESU2");
  REQUIRE(def.exchangeView().empty());

  std::array<char, 4> full = {'A', 'B', 'C', 'D'};
  REQUIRE(dbn::CStrView(full) == "ABCD");
}

TEST_CASE("RecordRef", "[records]") {
  const auto mbo = MakeMbo(7, 100, 1000);
  const auto ref = dbn::RecordRef::FromRecord(mbo);

  SECTION("header and raw bytes") {
    REQUIRE(ref.header() == mbo.hd);
    REQUIRE(ref.recordSize() == sizeof(dbn::MboMsg));
    REQUIRE(ref.data() == reinterpret_cast<const std::byte*>(&mbo));
    dbn::RType rtype;
    requireOk(ref.rtype(&rtype));
    REQUIRE(rtype == dbn::RType::Mbo);
  }

  SECTION("typed access") {
    REQUIRE(ref.has<dbn::MboMsg>());
    REQUIRE_FALSE(ref.has<dbn::TradeMsg>());
    REQUIRE(ref.get<dbn::TradeMsg>() == nullptr);
    const auto* typed = ref.get<dbn::MboMsg>();
    REQUIRE(typed == &mbo);
    REQUIRE(typed->orderId == 7);
    REQUIRE(ref.getUnchecked<dbn::MboMsg>()->price == 100);
  }

  SECTION("asVariant()") {
    dbn::RecordRefVariant variant;
    requireOk(ref.asVariant(&variant));
    REQUIRE(std::holds_alternative<const dbn::MboMsg*>(variant));
    REQUIRE(std::get<const dbn::MboMsg*>(variant) == &mbo);

    dbn::RecordVariant owned;
    requireOk(ref.toOwned(&owned));
    REQUIRE(SameMbo(std::get<dbn::MboMsg>(owned), mbo));
    REQUIRE(dbn::HeaderOf(owned) == mbo.hd);
  }

  SECTION("asVariant() with an unknown rtype") {
    auto unknown = mbo;
    unknown.hd.rtype = 0x99;
    dbn::RecordRefVariant variant;
    const auto status = dbn::RecordRef::FromRecord(unknown).asVariant(&variant);
    REQUIRE(status.code == dbn::StatusCode::UnknownRecordType);
  }

  SECTION("asVariant() with a short record") {
    auto shortened = mbo;
    shortened.hd.length = 12;
    dbn::RecordRefVariant variant;
    const auto status = dbn::RecordRef::FromRecord(shortened).asVariant(&variant);
    REQUIRE(status.code == dbn::StatusCode::TruncatedRecord);
    dbn::RecordVariant owned;
    REQUIRE(dbn::RecordRef::FromRecord(shortened).toOwned(&owned).code ==
            dbn::StatusCode::TruncatedRecord);
  }

  SECTION("every catalog type dispatches to itself") {
    dbn::InstrumentDefMsg def{};
    def.hd = dbn::RecordHeader::Create<dbn::InstrumentDefMsg>(dbn::RType::InstrumentDef, 1, 2, 3);
    dbn::ImbalanceMsg imbalance{};
    imbalance.hd = dbn::RecordHeader::Create<dbn::ImbalanceMsg>(dbn::RType::Imbalance, 1, 2, 3);
    dbn::SymbolMappingMsg mapping{};
    mapping.hd =
      dbn::RecordHeader::Create<dbn::SymbolMappingMsg>(dbn::RType::SymbolMapping, 1, 2, 3);

    dbn::RecordRefVariant variant;
    requireOk(dbn::RecordRef::FromRecord(def).asVariant(&variant));
    REQUIRE(std::holds_alternative<const dbn::InstrumentDefMsg*>(variant));
    requireOk(dbn::RecordRef::FromRecord(imbalance).asVariant(&variant));
    REQUIRE(std::holds_alternative<const dbn::ImbalanceMsg*>(variant));
    requireOk(dbn::RecordRef::FromRecord(mapping).asVariant(&variant));
    REQUIRE(std::holds_alternative<const dbn::SymbolMappingMsg*>(variant));
  }
}

TEST_CASE("Enum strings", "[types]") {
  for (uint16_t value = 0; value <= uint16_t(dbn::Schema::Imbalance); ++value) {
    const auto schema = dbn::Schema(value);
    const auto parsed = dbn::ParseSchema(dbn::SchemaString(schema));
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == schema);
  }
  REQUIRE(dbn::SchemaString(dbn::Schema::Mbp10) == "mbp-10");
  REQUIRE_FALSE(dbn::ParseSchema("mbp-5").has_value());
  REQUIRE(dbn::ParseSType("product_id") == dbn::SType::ProductId);
  REQUIRE(dbn::STypeString(dbn::SType::Smart) == "smart");
  REQUIRE(dbn::RTypeFromSchema(dbn::Schema::Tbbo) == dbn::RType::Mbp1);
  REQUIRE(dbn::RTypeFromSchema(dbn::Schema::Ohlcv1M) == dbn::RType::Ohlcv1M);
  REQUIRE(dbn::RTypeString(dbn::RType::Statistics) == "Statistics");
  REQUIRE_FALSE(dbn::ParseRType(0x99).has_value());
}

TEST_CASE("MetadataEncoder", "[writer]") {
  SECTION("empty metadata layout") {
    dbn::Metadata metadata;
    metadata.dataset = "XNAS.ITCH";
    const auto encoded = EncodeMetadata(metadata);
    REQUIRE(encoded.size() == 128);
    REQUIRE(encoded[0] == std::byte('D'));
    REQUIRE(encoded[1] == std::byte('B'));
    REQUIRE(encoded[2] == std::byte('N'));
    REQUIRE(encoded[3] == std::byte(1));
    REQUIRE(dbn::internal::ParseUint32(encoded.data() + 4) == 120);
    // Mixed schema and no end timestamp
    REQUIRE(dbn::internal::ParseUint16(encoded.data() + 24) == 0xFFFF);
    REQUIRE(dbn::internal::ParseUint64(encoded.data() + 34) == dbn::UndefTimestamp);
  }

  SECTION("round trip") {
    const auto metadata = MakeMetadata();
    const auto encoded = EncodeMetadata(metadata);
    REQUIRE(encoded.size() == 250);

    std::optional<uint64_t> length;
    requireOk(dbn::MetadataDecoder::PeekMetadataLength(encoded.data(), encoded.size(), &length));
    REQUIRE(length == encoded.size());

    dbn::Metadata decoded;
    requireOk(dbn::MetadataDecoder::ParseMetadata(encoded.data(), encoded.size(), &decoded));
    REQUIRE(decoded == metadata);
    REQUIRE(EncodeMetadata(decoded) == encoded);
  }

  SECTION("strings that do not fit") {
    auto metadata = MakeMetadata();
    metadata.dataset = "0123456789ABCDEF";
    dbn::ByteArray output;
    REQUIRE(dbn::MetadataEncoder::EncodeMetadata(metadata, &output).code ==
            dbn::StatusCode::InvalidArgument);

    metadata = MakeMetadata();
    metadata.symbols.push_back("THIS_SYMBOL_IS_TOO_LONG");
    REQUIRE(dbn::MetadataEncoder::EncodeMetadata(metadata, &output).code ==
            dbn::StatusCode::InvalidArgument);
    REQUIRE(output.empty());
  }

  SECTION("UpdateEncodedMetadata()") {
    auto encoded = EncodeMetadata(MakeMetadata());
    requireOk(dbn::MetadataEncoder::UpdateEncodedMetadata(encoded.data(), encoded.size(), 10,
                                                          std::nullopt, 500, 99));
    dbn::Metadata decoded;
    requireOk(dbn::MetadataDecoder::ParseMetadata(encoded.data(), encoded.size(), &decoded));
    REQUIRE(decoded.start == 10);
    REQUIRE_FALSE(decoded.end.has_value());
    REQUIRE(decoded.limit == 500);
    REQUIRE(decoded.recordCount == 99);
    REQUIRE(decoded.symbols == MakeMetadata().symbols);
  }
}

TEST_CASE("MetadataDecoder", "[reader]") {
  const auto encoded = EncodeMetadata(MakeMetadata());

  SECTION("incomplete prefix") {
    std::optional<uint64_t> length;
    requireOk(dbn::MetadataDecoder::PeekMetadataLength(encoded.data(), 7, &length));
    REQUIRE_FALSE(length.has_value());
  }

  SECTION("invalid magic is detected from the first byte") {
    const std::byte input[1] = {std::byte('X')};
    std::optional<uint64_t> length;
    const auto status = dbn::MetadataDecoder::PeekMetadataLength(input, 1, &length);
    REQUIRE(status.code == dbn::StatusCode::InvalidMetadata);
  }

  SECTION("unsupported version") {
    auto input = encoded;
    input[3] = std::byte(2);
    std::optional<uint64_t> length;
    const auto status = dbn::MetadataDecoder::PeekMetadataLength(input.data(), 4, &length);
    REQUIRE(status.code == dbn::StatusCode::UnsupportedVersion);
  }

  SECTION("schema definitions are rejected") {
    auto input = encoded;
    dbn::internal::WriteUint32(input.data() + 8 + 100, 1);
    dbn::Metadata decoded;
    const auto status =
      dbn::MetadataDecoder::ParseMetadata(input.data(), input.size(), &decoded);
    REQUIRE(status.code == dbn::StatusCode::InvalidMetadata);
  }

  SECTION("symbol count beyond the frame") {
    auto input = encoded;
    dbn::internal::WriteUint32(input.data() + 8 + 104, 1000);
    dbn::Metadata decoded;
    const auto status =
      dbn::MetadataDecoder::ParseMetadata(input.data(), input.size(), &decoded);
    REQUIRE(status.code == dbn::StatusCode::InvalidMetadata);
  }

  SECTION("invalid stype") {
    auto input = encoded;
    input[8 + 16 + 2 + 32] = std::byte(9);
    dbn::Metadata decoded;
    const auto status =
      dbn::MetadataDecoder::ParseMetadata(input.data(), input.size(), &decoded);
    REQUIRE(status.code == dbn::StatusCode::InvalidMetadata);
  }
}

TEST_CASE("RecordBuffer", "[reader]") {
  dbn::RecordBuffer buffer{4};
  const std::byte input[6] = {std::byte(1), std::byte(2), std::byte(3),
                              std::byte(4), std::byte(5), std::byte(6)};
  buffer.append(input, sizeof(input));
  REQUIRE(buffer.readableSize() == 6);
  buffer.consume(4);
  REQUIRE(buffer.readableSize() == 2);
  REQUIRE(buffer.readData()[0] == std::byte(5));
  buffer.compact();
  REQUIRE(buffer.readableSize() == 2);
  REQUIRE(buffer.readData()[1] == std::byte(6));
  buffer.clear();
  REQUIRE(buffer.readableSize() == 0);
}

TEST_CASE("StreamDecoder::decode()", "[reader]") {
  const auto metadata = MakeMetadata();
  const auto stream = MakeStream(metadata);

  SECTION("whole stream") {
    dbn::StreamDecoder decoder;
    REQUIRE(decoder.state() == dbn::DecoderState::AwaitingMetadata);
    decoder.write(stream.data(), stream.size());
    std::vector<dbn::DecodedItem> items;
    requireOk(decoder.decode(&items));
    REQUIRE(decoder.state() == dbn::DecoderState::StreamingRecords);
    REQUIRE(items.size() == 3);
    REQUIRE(std::get<dbn::Metadata>(items[0]) == metadata);
    const auto& first = std::get<dbn::DecodedRecord>(items[1]);
    REQUIRE(SameMbo(std::get<dbn::MboMsg>(first.record),
                    MakeMbo(1, 372000000000000, 1658441851000000000)));
    REQUIRE_FALSE(first.tsOut.has_value());
    const auto& second = std::get<dbn::DecodedRecord>(items[2]);
    REQUIRE(std::get<dbn::MboMsg>(second.record).orderId == 2);
    REQUIRE(decoder.consumedBytes() == stream.size());
    REQUIRE(decoder.metadata() == metadata);

    // Nothing left to decode
    requireOk(decoder.decode(&items));
    REQUIRE(items.empty());
  }

  SECTION("arbitrary chunk sizes") {
    for (size_t chunkSize : {size_t(1), size_t(2), size_t(3), size_t(7), size_t(16),
                             size_t(250), size_t(251), stream.size()}) {
      CAPTURE(chunkSize);
      const auto items = DecodeInChunks(stream, chunkSize);
      REQUIRE(items.size() == 3);
      REQUIRE(std::get<dbn::Metadata>(items[0]) == metadata);
      REQUIRE(std::get<dbn::MboMsg>(std::get<dbn::DecodedRecord>(items[1]).record).orderId == 1);
      REQUIRE(std::get<dbn::MboMsg>(std::get<dbn::DecodedRecord>(items[2]).record).orderId == 2);
    }
  }

  SECTION("record split across writes") {
    const size_t splitAt = stream.size() - 20;
    dbn::StreamDecoder decoder;
    decoder.write(stream.data(), splitAt);
    std::vector<dbn::DecodedItem> items;
    requireOk(decoder.decode(&items));
    REQUIRE(items.size() == 2);
    REQUIRE(decoder.buffer().readableSize() == sizeof(dbn::MboMsg) - 20);

    decoder.write(stream.data() + splitAt, 20);
    requireOk(decoder.decode(&items));
    REQUIRE(items.size() == 1);
    REQUIRE(std::get<dbn::MboMsg>(std::get<dbn::DecodedRecord>(items[0]).record).orderId == 2);
  }

  SECTION("incomplete metadata is left buffered") {
    dbn::StreamDecoder decoder;
    decoder.write(stream.data(), 100);
    std::vector<dbn::DecodedItem> items;
    requireOk(decoder.decode(&items));
    REQUIRE(items.empty());
    REQUIRE(decoder.buffer().readableSize() == 100);
    REQUIRE(decoder.state() == dbn::DecoderState::AwaitingMetadata);
  }

  SECTION("malformed metadata fails the same way on every call") {
    auto input = stream;
    input[3] = std::byte(7);
    dbn::StreamDecoder decoder;
    decoder.write(input.data(), input.size());
    std::vector<dbn::DecodedItem> items;
    const auto first = decoder.decode(&items);
    REQUIRE(first.code == dbn::StatusCode::UnsupportedVersion);
    REQUIRE(items.empty());
    const auto second = decoder.decode(&items);
    REQUIRE(second.code == first.code);
    REQUIRE(second.message == first.message);
    REQUIRE(decoder.state() == dbn::DecoderState::AwaitingMetadata);
    REQUIRE(decoder.buffer().readableSize() == input.size());
  }

  SECTION("unknown rtype is skipped") {
    auto input = EncodeMetadata(metadata);
    AppendRecord(MakeMbo(1, 10, 100), &input);
    // 24-byte record with a discriminant outside the catalog
    const dbn::RecordHeader unknown{6, 0x99, 1, 2, 3};
    AppendRecord(unknown, &input);
    AppendRecord(uint64_t(0xDEADBEEF), &input);
    AppendRecord(MakeMbo(2, 20, 200), &input);

    std::vector<dbn::Status> problems;
    dbn::StreamDecoder decoder([&](const dbn::Status& status) {
      problems.push_back(status);
    });
    decoder.write(input.data(), input.size());
    std::vector<dbn::DecodedItem> items;
    requireOk(decoder.decode(&items));
    REQUIRE(items.size() == 3);
    REQUIRE(std::get<dbn::MboMsg>(std::get<dbn::DecodedRecord>(items[1]).record).orderId == 1);
    REQUIRE(std::get<dbn::MboMsg>(std::get<dbn::DecodedRecord>(items[2]).record).orderId == 2);
    REQUIRE(problems.size() == 1);
    REQUIRE(problems[0].code == dbn::StatusCode::UnknownRecordType);
    REQUIRE(problems[0].message.find("0x99") != std::string::npos);
    REQUIRE(problems[0].message.find("offset 306") != std::string::npos);
  }

  SECTION("short known record is terminal") {
    auto input = EncodeMetadata(metadata);
    AppendRecord(MakeMbo(1, 10, 100), &input);
    auto bad = MakeMbo(2, 20, 200);
    bad.hd.length = 12;
    const auto* badBytes = reinterpret_cast<const std::byte*>(&bad);
    input.insert(input.end(), badBytes, badBytes + 48);
    AppendRecord(MakeMbo(3, 30, 300), &input);

    dbn::StreamDecoder decoder;
    decoder.write(input.data(), input.size());
    std::vector<dbn::DecodedItem> items;
    const auto status = decoder.decode(&items);
    REQUIRE(status.code == dbn::StatusCode::TruncatedRecord);
    REQUIRE(status.message.find("offset 306") != std::string::npos);
    // Items decoded before the error are still returned
    REQUIRE(items.size() == 2);
    REQUIRE(decoder.state() == dbn::DecoderState::Failed);

    const auto consumed = decoder.consumedBytes();
    const auto again = decoder.decode(&items);
    REQUIRE(again.code == dbn::StatusCode::TruncatedRecord);
    REQUIRE(again.message == status.message);
    REQUIRE(items.empty());
    REQUIRE(decoder.consumedBytes() == consumed);
  }

  SECTION("zero length header is terminal") {
    auto input = EncodeMetadata(metadata);
    const dbn::RecordHeader empty{0, 0x99, 1, 2, 3};
    AppendRecord(empty, &input);
    dbn::StreamDecoder decoder;
    decoder.write(input.data(), input.size());
    std::vector<dbn::DecodedItem> items;
    REQUIRE(decoder.decode(&items).code == dbn::StatusCode::TruncatedRecord);
    REQUIRE(items.size() == 1);
    REQUIRE(decoder.state() == dbn::DecoderState::Failed);
  }

  SECTION("ts_out") {
    auto tsOutMetadata = metadata;
    tsOutMetadata.tsOut = true;
    auto input = EncodeMetadata(tsOutMetadata);
    AppendRecord(dbn::WithTsOut<dbn::MboMsg>::Create(MakeMbo(1, 10, 100), 12345), &input);

    dbn::StreamDecoder decoder;
    decoder.write(input.data(), input.size());
    std::vector<dbn::DecodedItem> items;
    requireOk(decoder.decode(&items));
    REQUIRE(items.size() == 2);
    REQUIRE(std::get<dbn::Metadata>(items[0]).tsOut);
    const auto& record = std::get<dbn::DecodedRecord>(items[1]);
    REQUIRE(record.tsOut == dbn::Timestamp(12345));
    REQUIRE(std::get<dbn::MboMsg>(record.record).orderId == 1);
  }
}

TEST_CASE("StreamDecoder::decodeRecordRefs()", "[reader]") {
  const auto metadata = MakeMetadata();

  SECTION("views into the buffer") {
    const auto stream = MakeStream(metadata);
    dbn::StreamDecoder decoder;
    decoder.write(stream.data(), stream.size());
    std::vector<dbn::RecordRef> refs;
    requireOk(decoder.decodeRecordRefs(&refs));
    REQUIRE(decoder.metadata() == metadata);
    REQUIRE(refs.size() == 2);
    REQUIRE(refs[0].get<dbn::MboMsg>()->orderId == 1);
    REQUIRE(refs[1].get<dbn::MboMsg>()->orderId == 2);
    REQUIRE(dbn::internal::IsAligned(refs[0].data(), 8));

    requireOk(decoder.decodeRecordRefs(&refs));
    REQUIRE(refs.empty());
  }

  SECTION("record following a padded record is realigned") {
    auto input = EncodeMetadata(metadata);
    auto padded = MakeMbo(1, 10, 100);
    padded.hd.length = 15;
    AppendRecord(padded, &input);
    AppendRecord(uint32_t(0), &input);
    AppendRecord(MakeMbo(2, 20, 200), &input);

    dbn::StreamDecoder decoder;
    decoder.write(input.data(), input.size());
    std::vector<dbn::RecordRef> refs;
    requireOk(decoder.decodeRecordRefs(&refs));
    REQUIRE(refs.size() == 2);
    REQUIRE(refs[0].recordSize() == 60);
    REQUIRE(refs[0].get<dbn::MboMsg>()->orderId == 1);
    REQUIRE(refs[1].recordSize() == sizeof(dbn::MboMsg));
    REQUIRE(dbn::internal::IsAligned(refs[1].data(), 8));
    REQUIRE(refs[1].get<dbn::MboMsg>()->orderId == 2);
    REQUIRE(decoder.buffer().readableSize() == 0);

    requireOk(decoder.decodeRecordRefs(&refs));
    REQUIRE(refs.empty());

    dbn::StreamDecoder owning;
    owning.write(input.data(), input.size());
    std::vector<dbn::DecodedItem> items;
    requireOk(owning.decode(&items));
    REQUIRE(items.size() == 3);
  }

  SECTION("many padded records decode in a single pass") {
    constexpr uint64_t count = 20000;
    auto input = EncodeMetadata(metadata);
    for (uint64_t i = 0; i < count; ++i) {
      auto padded = MakeMbo(i, int64_t(i) * 10, 1000 + i);
      padded.hd.length = 15;
      AppendRecord(padded, &input);
      AppendRecord(uint32_t(0xFFFFFFFF), &input);
    }

    dbn::StreamDecoder decoder;
    decoder.write(input.data(), input.size());
    std::vector<dbn::RecordRef> refs;
    requireOk(decoder.decodeRecordRefs(&refs));
    REQUIRE(refs.size() == count);
    for (uint64_t i = 0; i < count; ++i) {
      REQUIRE(dbn::internal::IsAligned(refs[i].data(), 8));
      REQUIRE(refs[i].recordSize() == 60);
      REQUIRE(refs[i].get<dbn::MboMsg>()->orderId == i);
    }
    REQUIRE(decoder.consumedBytes() == input.size());

    dbn::StreamDecoder owning;
    owning.write(input.data(), input.size());
    std::vector<dbn::DecodedItem> items;
    requireOk(owning.decode(&items));
    REQUIRE(items.size() == count + 1);
    const auto& last = std::get<dbn::DecodedRecord>(items.back());
    REQUIRE(std::get<dbn::MboMsg>(last.record).orderId == count - 1);
    REQUIRE(owning.buffer().readableSize() == 0);
  }
}

TEST_CASE("DecodingRecordStream", "[reader]") {
  const auto metadata = MakeMetadata();
  const auto stream = MakeStream(metadata);

  SECTION("small chunks") {
    dbn::BufferReader reader{stream.data(), stream.size()};
    dbn::DecodingRecordStream records{reader, 5};
    requireOk(records.readMetadata());
    REQUIRE(records.metadata() == metadata);
    std::vector<uint64_t> orderIds;
    while (auto record = records.next()) {
      orderIds.push_back(record->get<dbn::MboMsg>()->orderId);
    }
    requireOk(records.status());
    REQUIRE(orderIds == std::vector<uint64_t>{1, 2});
  }

  SECTION("source ends mid-record") {
    dbn::BufferReader reader{stream.data(), stream.size() - 3};
    dbn::DecodingRecordStream records{reader};
    size_t count = 0;
    while (records.next()) {
      ++count;
    }
    REQUIRE(count == 1);
    REQUIRE(records.status().code == dbn::StatusCode::IncompleteStream);
  }

  SECTION("empty source") {
    dbn::BufferReader reader{nullptr, 0};
    dbn::DecodingRecordStream records{reader};
    REQUIRE(records.readMetadata().code == dbn::StatusCode::IncompleteStream);
    REQUIRE_FALSE(records.next().has_value());
  }

  SECTION("source stops short of its size") {
    // Reports the full stream size but delivers only the metadata
    struct ShortReader : dbn::IReadable {
      dbn::BufferReader inner;
      uint64_t fullSize;

      ShortReader(const dbn::ByteArray& data, uint64_t available)
          : inner(data.data(), available)
          , fullSize(data.size()) {}

      uint64_t size() const override {
        return fullSize;
      }
      uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override {
        return inner.read(output, offset, size);
      }
    };
    ShortReader reader{stream, 250};
    dbn::DecodingRecordStream records{reader};
    requireOk(records.readMetadata());
    REQUIRE_FALSE(records.next().has_value());
    REQUIRE(records.status().code == dbn::StatusCode::ReadFailed);
  }

  SECTION("FileReader") {
    std::FILE* file = std::tmpfile();
    REQUIRE(file != nullptr);
    REQUIRE(std::fwrite(stream.data(), 1, stream.size(), file) == stream.size());
    std::fflush(file);
    {
      dbn::FileReader reader{file};
      REQUIRE(reader.size() == stream.size());
      dbn::DecodingRecordStream records{reader, 64};
      size_t count = 0;
      while (records.next()) {
        ++count;
      }
      requireOk(records.status());
      REQUIRE(count == 2);
      REQUIRE(records.metadata() == metadata);
    }
    std::fclose(file);
  }
}

TEST_CASE("FileReader", "[reader]") {
  SECTION("missing file") {
    dbn::FileReader reader;
    const auto status = reader.open("/nonexistent/dir/input.dbn");
    REQUIRE(status.code == dbn::StatusCode::OpenFailed);
    REQUIRE(reader.size() == 0);
  }

  SECTION("reads past the end return nothing") {
    const auto stream = MakeStream(MakeMetadata());
    std::FILE* file = std::tmpfile();
    REQUIRE(file != nullptr);
    REQUIRE(std::fwrite(stream.data(), 1, stream.size(), file) == stream.size());
    std::fflush(file);
    {
      dbn::FileReader reader{file};
      std::byte* data = nullptr;
      REQUIRE(reader.read(&data, 3, 2) == 2);
      REQUIRE(uint8_t(data[0]) == dbn::DbnVersion);
      REQUIRE(reader.read(&data, stream.size() - 4, 64) == 4);
      REQUIRE(reader.read(&data, stream.size(), 64) == 0);
      requireOk(reader.status());
    }
    std::fclose(file);
  }
}

TEST_CASE("DbnEncoder", "[writer]") {
  const auto metadata = MakeMetadata();
  const auto mbo1 = MakeMbo(1, 372000000000000, 1658441851000000000);
  const auto mbo2 = MakeMbo(2, 372500000000000, 1658441852000000000);

  SECTION("re-encodes a decoded stream byte for byte") {
    const auto stream = MakeStream(metadata);
    dbn::BufferReader reader{stream.data(), stream.size()};
    dbn::DecodingRecordStream records{reader};
    requireOk(records.readMetadata());

    dbn::BufferWriter output;
    dbn::DbnEncoder encoder{output};
    requireOk(encoder.encodeMetadata(*records.metadata()));
    requireOk(encoder.encodeStream(records));
    REQUIRE(output.size() == stream.size());
    REQUIRE(std::memcmp(output.data(), stream.data(), stream.size()) == 0);
  }

  SECTION("typed records") {
    dbn::BufferWriter output;
    dbn::DbnEncoder encoder{output};
    REQUIRE(encoder.encodeRecord(dbn::RecordRef::FromRecord(mbo1)).code ==
            dbn::StatusCode::InvalidArgument);
    requireOk(encoder.encodeMetadata(metadata));
    requireOk(encoder.encodeRecords(std::vector<dbn::MboMsg>{mbo1, mbo2}));
    REQUIRE(output.size() == 250 + 2 * sizeof(dbn::MboMsg));
  }
}
