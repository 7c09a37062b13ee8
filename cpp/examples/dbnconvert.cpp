#define DBN_IMPLEMENTATION
#include <dbn/dbn.hpp>

#include "dbnconvert_options.hpp"

#include <fmt/core.h>

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

static void PrintUsage(const char* program) {
  std::cerr << "Usage: " << program
            << " <input.dbn> [-o <output> | -c] [-e infer|csv|json] [-f] [--pretty-px] "
               "[--pretty-ts] [--metadata]\n"
            << "  -o, --output     path of the output file\n"
            << "  -c, --stdout     write to standard output\n"
            << "  -e, --encoding   output encoding, inferred from the output extension by default\n"
            << "  -f, --force      overwrite an existing output file\n"
            << "  --pretty-px      format prices as decimals\n"
            << "  --pretty-ts      format timestamps as ISO 8601\n"
            << "  --metadata       write the metadata as the first JSON line\n";
}

static dbn::Status OpenOutput(const ConvertOptions& options, Encoding encoding,
                              dbn::FileWriter* writer) {
  if (options.writeToStdout) {
    // A closed pipe surfaces as EPIPE from fwrite instead of terminating the process
    std::signal(SIGPIPE, SIG_IGN);
    writer->attach(stdout);
    return dbn::StatusCode::Success;
  }
  const std::string path = options.output.value_or(DefaultOutputPath(options.input, encoding));
  std::error_code ec;
  if (!options.force && fs::exists(path, ec)) {
    return dbn::Status{dbn::StatusCode::OpenFailed,
                       fmt::format("output file \"{}\" exists, pass --force to overwrite it", path)};
  }
  return writer->open(path);
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  ConvertOptions options;
  if (auto status = ParseArgs(argc, argv, &options); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    PrintUsage(argv[0]);
    return 1;
  }
  Encoding encoding = Encoding::Csv;
  if (auto status = InferEncoding(options, &encoding); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }
  if (options.jsonMetadata && encoding != Encoding::Json) {
    std::cerr << "! --metadata requires the json encoding\n";
    return 1;
  }

  dbn::FileReader reader;
  if (auto status = reader.open(options.input); !status.ok()) {
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

  dbn::FileWriter writer;
  if (auto status = OpenOutput(options, encoding, &writer); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  dbn::EncoderOptions encoderOptions;
  encoderOptions.prettyPx = options.prettyPx;
  encoderOptions.prettyTs = options.prettyTs;
  encoderOptions.tsOut = records.metadata()->tsOut;

  dbn::Status status;
  std::unique_ptr<dbn::IEncoder> encoder;
  if (encoding == Encoding::Json) {
    auto jsonEncoder = std::make_unique<dbn::JsonEncoder>(writer, encoderOptions);
    if (options.jsonMetadata) {
      status = jsonEncoder->encodeMetadata(*records.metadata());
    }
    encoder = std::move(jsonEncoder);
  } else {
    encoder = std::make_unique<dbn::CsvEncoder>(writer, encoderOptions);
  }
  if (status.ok()) {
    status = encoder->encodeStream(records, *records.metadata());
  }
  writer.end();
  // A reader closing the pipe early is not an error
  if (!status.ok() && status.code != dbn::StatusCode::SinkClosed) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }
  return 0;
}
