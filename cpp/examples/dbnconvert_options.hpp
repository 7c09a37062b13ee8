#pragma once

#include <dbn/errors.hpp>

#include <fmt/core.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

enum struct Encoding {
  Infer,
  Csv,
  Json,
};

struct ConvertOptions {
  std::string input;
  std::optional<std::string> output;
  bool writeToStdout = false;
  Encoding encoding = Encoding::Infer;
  bool force = false;
  bool prettyPx = false;
  bool prettyTs = false;
  bool jsonMetadata = false;
};

inline dbn::Status ParseArgs(int argc, const char* const* argv, ConvertOptions* options) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    const bool hasValue = i + 1 < argc;
    if (arg == "-o" || arg == "--output") {
      if (!hasValue) {
        return dbn::Status{dbn::StatusCode::InvalidArgument, "missing value for --output"};
      }
      options->output = argv[++i];
    } else if (arg == "-c" || arg == "--stdout") {
      options->writeToStdout = true;
    } else if (arg == "-e" || arg == "--encoding") {
      if (!hasValue) {
        return dbn::Status{dbn::StatusCode::InvalidArgument, "missing value for --encoding"};
      }
      const std::string_view value = argv[++i];
      if (value == "infer") {
        options->encoding = Encoding::Infer;
      } else if (value == "csv") {
        options->encoding = Encoding::Csv;
      } else if (value == "json") {
        options->encoding = Encoding::Json;
      } else {
        return dbn::Status{dbn::StatusCode::InvalidArgument,
                           fmt::format("unknown encoding \"{}\"", value)};
      }
    } else if (arg == "-f" || arg == "--force") {
      options->force = true;
    } else if (arg == "--pretty-px") {
      options->prettyPx = true;
    } else if (arg == "--pretty-ts") {
      options->prettyTs = true;
    } else if (arg == "--metadata") {
      options->jsonMetadata = true;
    } else if (!arg.empty() && arg[0] == '-') {
      return dbn::Status{dbn::StatusCode::InvalidArgument,
                         fmt::format("unknown option \"{}\"", arg)};
    } else if (options->input.empty()) {
      options->input = arg;
    } else {
      return dbn::Status{dbn::StatusCode::InvalidArgument,
                         fmt::format("unexpected argument \"{}\"", arg)};
    }
  }
  if (options->input.empty()) {
    return dbn::Status{dbn::StatusCode::InvalidArgument, "missing input file"};
  }
  if (options->output && options->writeToStdout) {
    return dbn::Status{dbn::StatusCode::InvalidArgument,
                       "--output and --stdout are mutually exclusive"};
  }
  return dbn::StatusCode::Success;
}

inline dbn::Status InferEncoding(const ConvertOptions& options, Encoding* encoding) {
  if (options.encoding != Encoding::Infer) {
    *encoding = options.encoding;
    return dbn::StatusCode::Success;
  }
  const auto extension =
    options.output ? std::filesystem::path(*options.output).extension().string() : std::string();
  if (extension == ".csv") {
    *encoding = Encoding::Csv;
  } else if (extension == ".json") {
    *encoding = Encoding::Json;
  } else if (extension.empty()) {
    return dbn::Status{
      dbn::StatusCode::InvalidArgument,
      "unable to infer output encoding from output file without an extension, pass --encoding"};
  } else {
    return dbn::Status{
      dbn::StatusCode::InvalidArgument,
      fmt::format("unable to infer output encoding from output file with extension \"{}\"",
                  extension)};
  }
  return dbn::StatusCode::Success;
}

inline std::string DefaultOutputPath(const std::string& input, Encoding encoding) {
  std::filesystem::path path{input};
  path.replace_extension(encoding == Encoding::Json ? ".json" : ".csv");
  return path.string();
}

