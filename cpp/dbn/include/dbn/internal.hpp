#pragma once

#include "types.hpp"
#include <cstring>
#include <utility>

// Do not compile on systems with non-8-bit bytes
static_assert(std::numeric_limits<unsigned char>::digits == 8);

namespace dbn {

namespace internal {

/**
 * @brief Size of the fixed portion of the metadata preamble: magic and version, frame length,
 * dataset through the reserved padding, and the schema definition length.
 */
constexpr uint64_t MetadataPrefixLength = /* magic */ sizeof(Magic) +
                                          /* version */ 1 +
                                          /* frame length */ 4;
constexpr uint64_t MetadataFixedLength = /* dataset */ DatasetCstrLen +
                                         /* schema */ 2 +
                                         /* start */ 8 +
                                         /* end */ 8 +
                                         /* limit */ 8 +
                                         /* record count */ 8 +
                                         /* stype in */ 1 +
                                         /* stype out */ 1 +
                                         /* ts out */ 1 +
                                         /* reserved */ MetadataReservedLen +
                                         /* schema definition length */ 4;
constexpr uint64_t MetadataStartOffset = MetadataPrefixLength + DatasetCstrLen + 2;

inline std::string ToHex(uint8_t byte) {
  std::string result{2, '\0'};
  result[0] = "0123456789ABCDEF"[(uint8_t(byte) >> 4) & 0x0F];
  result[1] = "0123456789ABCDEF"[uint8_t(byte) & 0x0F];
  return result;
}
inline std::string ToHex(std::byte byte) {
  return ToHex(uint8_t(byte));
}

inline std::string to_string(const std::string& arg) {
  return arg;
}
inline std::string to_string(std::string_view arg) {
  return std::string(arg);
}
inline std::string to_string(const char* arg) {
  return std::string(arg);
}
template <typename... T>
[[nodiscard]] inline std::string StrCat(T&&... args) {
  using dbn::internal::to_string;
  using std::to_string;
  return ("" + ... + to_string(std::forward<T>(args)));
}

inline uint16_t ParseUint16(const std::byte* data) {
  return uint16_t(data[0]) | (uint16_t(data[1]) << 8);
}

inline uint32_t ParseUint32(const std::byte* data) {
  return uint32_t(data[0]) | (uint32_t(data[1]) << 8) | (uint32_t(data[2]) << 16) |
         (uint32_t(data[3]) << 24);
}

inline Status ParseUint32(const std::byte* data, uint64_t maxSize, uint32_t* output) {
  if (maxSize < 4) {
    const auto msg = StrCat("cannot read uint32 from ", maxSize, " bytes");
    return Status{StatusCode::InvalidMetadata, msg};
  }
  *output = ParseUint32(data);
  return StatusCode::Success;
}

inline uint64_t ParseUint64(const std::byte* data) {
  return uint64_t(data[0]) | (uint64_t(data[1]) << 8) | (uint64_t(data[2]) << 16) |
         (uint64_t(data[3]) << 24) | (uint64_t(data[4]) << 32) | (uint64_t(data[5]) << 40) |
         (uint64_t(data[6]) << 48) | (uint64_t(data[7]) << 56);
}

/**
 * @brief Returns the characters of a NUL-padded fixed-width string up to the first NUL.
 */
inline std::string_view ParseFixedString(const std::byte* data, size_t width) {
  const char* chars = reinterpret_cast<const char*>(data);
  size_t len = 0;
  while (len < width && chars[len] != '\0') {
    ++len;
  }
  return std::string_view(chars, len);
}

inline Status ParseFixedString(const std::byte* data, uint64_t maxSize, size_t width,
                               std::string* output) {
  if (maxSize < width) {
    const auto msg =
      StrCat("cannot read ", width, "-byte string from ", maxSize, " remaining bytes");
    return Status{StatusCode::InvalidMetadata, msg};
  }
  *output = std::string(ParseFixedString(data, width));
  return StatusCode::Success;
}

inline Status ParseSymbolList(const std::byte* data, uint64_t maxSize,
                              std::vector<std::string>* output, uint64_t* bytesRead) {
  uint32_t count = 0;
  if (auto status = ParseUint32(data, maxSize, &count); !status.ok()) {
    return Status{StatusCode::InvalidMetadata,
                  StrCat("cannot read symbol count: ", status.message)};
  }
  if (uint64_t(count) * SymbolCstrLen > maxSize - 4) {
    const auto msg = StrCat("symbol count ", count, " exceeds remaining bytes ", (maxSize - 4));
    return Status{StatusCode::InvalidMetadata, msg};
  }
  output->clear();
  output->reserve(count);
  uint64_t pos = 4;
  for (uint32_t i = 0; i < count; ++i) {
    output->emplace_back(ParseFixedString(data + pos, SymbolCstrLen));
    pos += SymbolCstrLen;
  }
  *bytesRead = pos;
  return StatusCode::Success;
}

inline void WriteUint16(std::byte* output, uint16_t value) {
  output[0] = std::byte(value & 0xFF);
  output[1] = std::byte((value >> 8) & 0xFF);
}

inline void WriteUint32(std::byte* output, uint32_t value) {
  for (size_t i = 0; i < 4; ++i) {
    output[i] = std::byte((value >> (8 * i)) & 0xFF);
  }
}

inline void WriteUint64(std::byte* output, uint64_t value) {
  for (size_t i = 0; i < 8; ++i) {
    output[i] = std::byte((value >> (8 * i)) & 0xFF);
  }
}

inline bool IsAligned(const void* ptr, size_t alignment) {
  return reinterpret_cast<uintptr_t>(ptr) % alignment == 0;
}

}  // namespace internal

}  // namespace dbn
