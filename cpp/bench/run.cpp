#define DBN_IMPLEMENTATION
#include <dbn/dbn.hpp>

#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstring>

constexpr size_t RecordCount = 100000;

// Builds a metadata frame followed by `RecordCount` MBO records
static dbn::ByteArray MakeMboStream() {
  dbn::Metadata metadata;
  metadata.dataset = "GLBX.MDP3";
  metadata.schema = dbn::Schema::Mbo;
  metadata.start = 1658441851000000000;
  metadata.symbols = {"ESU2"};

  dbn::ByteArray stream;
  const auto status = dbn::MetadataEncoder::EncodeMetadata(metadata, &stream);
  if (!status.ok()) {
    return stream;
  }

  dbn::MboMsg mbo{};
  for (size_t i = 0; i < RecordCount; i++) {
    const dbn::Timestamp tsEvent = metadata.start + i * 1000;
    mbo.hd = dbn::RecordHeader::Create<dbn::MboMsg>(dbn::RType::Mbo, 1, 5482, tsEvent);
    mbo.orderId = i;
    mbo.price = 372000000000000 + int64_t(i % 100) * 250000000;
    mbo.size = 1 + uint32_t(i % 50);
    mbo.action = 'A';
    mbo.side = i % 2 == 0 ? 'B' : 'A';
    mbo.tsRecv = tsEvent + 100;
    mbo.sequence = uint32_t(i);
    const auto* bytes = reinterpret_cast<const std::byte*>(&mbo);
    stream.insert(stream.end(), bytes, bytes + sizeof(mbo));
  }
  return stream;
}

static void BM_StreamDecoderDecode(benchmark::State& state) {
  const auto stream = MakeMboStream();
  const size_t chunkSize = size_t(state.range(0));

  std::vector<dbn::DecodedItem> items;
  for (auto _ : state) {
    dbn::StreamDecoder decoder;
    size_t count = 0;
    for (size_t offset = 0; offset < stream.size(); offset += chunkSize) {
      decoder.write(stream.data() + offset, std::min(chunkSize, stream.size() - offset));
      const auto status = decoder.decode(&items);
      if (!status.ok()) {
        state.SkipWithError(status.message.c_str());
        return;
      }
      count += items.size();
    }
    benchmark::DoNotOptimize(count);
  }
  state.SetBytesProcessed(int64_t(state.iterations()) * int64_t(stream.size()));
}

static void BM_StreamDecoderDecodeRecordRefs(benchmark::State& state) {
  const auto stream = MakeMboStream();
  const size_t chunkSize = size_t(state.range(0));

  std::vector<dbn::RecordRef> records;
  for (auto _ : state) {
    dbn::StreamDecoder decoder;
    uint64_t sum = 0;
    for (size_t offset = 0; offset < stream.size(); offset += chunkSize) {
      decoder.write(stream.data() + offset, std::min(chunkSize, stream.size() - offset));
      const auto status = decoder.decodeRecordRefs(&records);
      if (!status.ok()) {
        state.SkipWithError(status.message.c_str());
        return;
      }
      for (const auto& record : records) {
        sum += record.get<dbn::MboMsg>()->orderId;
      }
    }
    benchmark::DoNotOptimize(sum);
  }
  state.SetBytesProcessed(int64_t(state.iterations()) * int64_t(stream.size()));
}

static void BM_CsvEncoderBufferWriter(benchmark::State& state) {
  const auto stream = MakeMboStream();
  dbn::StreamDecoder decoder;
  decoder.write(stream.data(), stream.size());
  std::vector<dbn::RecordRef> records;
  if (const auto status = decoder.decodeRecordRefs(&records); !status.ok()) {
    state.SkipWithError(status.message.c_str());
    return;
  }

  dbn::EncoderOptions options;
  options.prettyPx = state.range(0) != 0;
  options.prettyTs = state.range(0) != 0;

  dbn::BufferWriter out;
  for (auto _ : state) {
    out.clear();
    dbn::CsvEncoder encoder{out, options};
    const auto status = encoder.encodeRecords(records);
    if (!status.ok()) {
      state.SkipWithError(status.message.c_str());
      return;
    }
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(records.size()));
}

static void BM_JsonEncoderBufferWriter(benchmark::State& state) {
  const auto stream = MakeMboStream();
  dbn::StreamDecoder decoder;
  decoder.write(stream.data(), stream.size());
  std::vector<dbn::RecordRef> records;
  if (const auto status = decoder.decodeRecordRefs(&records); !status.ok()) {
    state.SkipWithError(status.message.c_str());
    return;
  }

  dbn::BufferWriter out;
  for (auto _ : state) {
    out.clear();
    dbn::JsonEncoder encoder{out};
    const auto status = encoder.encodeRecords(records);
    if (!status.ok()) {
      state.SkipWithError(status.message.c_str());
      return;
    }
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(records.size()));
}

int main(int argc, char* argv[]) {
  benchmark::RegisterBenchmark("BM_StreamDecoderDecode", BM_StreamDecoderDecode)
    ->Arg(4096)
    ->Arg(64 * 1024)
    ->Arg(1024 * 1024);
  benchmark::RegisterBenchmark("BM_StreamDecoderDecodeRecordRefs",
                               BM_StreamDecoderDecodeRecordRefs)
    ->Arg(4096)
    ->Arg(64 * 1024)
    ->Arg(1024 * 1024);
  benchmark::RegisterBenchmark("BM_CsvEncoderBufferWriter", BM_CsvEncoderBufferWriter)
    ->Arg(0)
    ->Arg(1);
  benchmark::RegisterBenchmark("BM_JsonEncoderBufferWriter", BM_JsonEncoderBufferWriter);
  benchmark::Initialize(&argc, argv);
  benchmark::RunSpecifiedBenchmarks();

  return 0;
}
